#include "portbridge/builtins.hpp"

#include "portbridge/args.hpp"
#include "portbridge/errors.hpp"

namespace portbridge {

namespace {

DType dtype_arg(const Value* v, DType fallback) {
    if (!v || v->is_null()) return fallback;
    const std::string& tag = args::string(*v, "dtype");
    auto dtype = dtype_from_tag(tag);
    if (!dtype) throw value_error("data type '" + tag + "' not understood");
    return *dtype;
}

// Walks nested lists, recording the shape on the first descent and
// checking every other branch against it.
void flatten(const Value& v, std::size_t depth, Shape& shape, std::vector<double>& out, bool& integral) {
    if (auto* l = v.get_if<List>()) {
        if (depth == shape.size() && out.empty()) shape.push_back(l->size());
        if (depth >= shape.size() || shape[depth] != l->size()) {
            throw value_error("setting an array element with a sequence. "
                              "The requested array has an inhomogeneous shape");
        }
        for (const auto& item : *l) flatten(item, depth + 1, shape, out, integral);
        return;
    }
    if (depth != shape.size()) {
        throw value_error("setting an array element with a sequence. "
                          "The requested array has an inhomogeneous shape");
    }
    if (!v.is_integer() && !v.is_bool()) integral = false;
    out.push_back(args::number(v, "array"));
}

NdArray from_doubles(const std::vector<double>& xs, Shape shape, DType dtype) {
    NdArray arr = NdArray::zeros(dtype, std::move(shape));
    for (std::size_t i = 0; i < xs.size(); ++i) arr.set_from_double(i, xs[i]);
    return arr;
}

Value shape_value(const Shape& shape) {
    List out;
    for (auto d : shape) out.emplace_back(d);
    return Value(std::move(out));
}

void register_ndarray(Registry& registry) {
    Module& m = registry.add_module("ndarray");

    m.add("array", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, "array");
        Shape shape;
        std::vector<double> xs;
        bool integral = true;
        flatten(a[0], 0, shape, xs, integral);
        const DType dtype = dtype_arg(args::option(a, k, 1, "dtype"), integral ? DType::I64 : DType::F64);
        return Value(from_doubles(xs, std::move(shape), dtype));
    }, true);
    m.add("zeros", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, 2, "zeros");
        const DType dtype = dtype_arg(args::option(a, k, 1, "dtype"), DType::F64);
        return Value(NdArray::zeros(dtype, args::shape(a[0], "zeros")));
    }, true);
    m.add("arange", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, 3, "arange");
        double start = 0, stop = 0, step = 1;
        if (a.size() == 1) {
            stop = args::number(a[0], "arange");
        } else {
            start = args::number(a[0], "arange");
            stop = args::number(a[1], "arange");
            if (a.size() == 3) step = args::number(a[2], "arange");
        }
        if (step == 0) throw value_error("Maximum allowed size exceeded");
        bool integral = true;
        for (const auto& v : a) integral = integral && v.is_integer();
        std::vector<double> xs;
        for (double x = start; step > 0 ? x < stop : x > stop; x += step) xs.push_back(x);
        const DType dtype = dtype_arg(args::option(a, k, 3, "dtype"), integral ? DType::I64 : DType::F64);
        const std::size_t n = xs.size();
        return Value(from_doubles(xs, Shape{n}, dtype));
    }, true);
    m.add("sum", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "sum");
        const NdArray& arr = args::array(a[0], "sum");
        if (arr.dtype() == DType::U64) {
            std::uint64_t acc = 0;
            for (std::size_t i = 0; i < arr.size(); ++i) acc = args::checked_add(acc, arr.at<std::uint64_t>(i));
            return Value(acc);
        }
        if (is_integral(arr.dtype())) {
            std::int64_t acc = 0;
            for (std::size_t i = 0; i < arr.size(); ++i) {
                acc = args::checked_add(acc, args::integer(element_value(arr, i), "sum"));
            }
            return Value(acc);
        }
        double acc = 0.0;
        for (std::size_t i = 0; i < arr.size(); ++i) acc += arr.as_double(i);
        return Value(acc);
    });
    m.add("mean", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "mean");
        const NdArray& arr = args::array(a[0], "mean");
        if (arr.size() == 0) throw value_error("mean of empty array");
        double acc = 0.0;
        for (std::size_t i = 0; i < arr.size(); ++i) acc += arr.as_double(i);
        return Value(acc / static_cast<double>(arr.size()));
    });
    m.add("reshape", [](const List& a, const Dict&) {
        args::expect_count(a, 2, "reshape");
        return Value(args::array(a[0], "reshape").reshaped(args::shape(a[1], "reshape")));
    });
    m.add("transpose", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "transpose");
        return Value(args::array(a[0], "transpose").transposed());
    });
    m.add("astype", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, 2, "astype");
        const Value* tag = args::option(a, k, 1, "dtype");
        if (!tag) throw type_error("astype() missing required argument 'dtype'");
        return Value(args::array(a[0], "astype").astype(dtype_arg(tag, DType::F64)));
    }, true);
    m.add("shape", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "shape");
        return shape_value(args::array(a[0], "shape").shape());
    });
    m.add("tolist", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "tolist");
        return Value(to_nested_list(args::array(a[0], "tolist")));
    });
}

void register_frame(Registry& registry) {
    Module& m = registry.add_module("frame");

    m.add("from_array", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, 3, "from_array");
        const NdArray& values = args::array(a[0], "from_array");
        std::vector<std::string> columns;
        if (const Value* c = args::option(a, k, 1, "columns"); c && !c->is_null()) {
            for (const auto& name : args::list(*c, "from_array")) {
                columns.push_back(args::string(name, "from_array"));
            }
        } else if (values.ndim() == 2) {
            for (std::size_t i = 0; i < values.shape()[1]; ++i) columns.push_back(std::to_string(i));
        }
        std::optional<List> index;
        if (const Value* i = args::option(a, k, 2, "index"); i && !i->is_null()) {
            index = args::list(*i, "from_array");
        }
        return Value(DataFrame(values, std::move(columns), std::move(index)));
    }, true);
    m.add("columns", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "columns");
        List out;
        for (const auto& c : args::frame(a[0], "columns").columns()) out.emplace_back(c);
        return Value(std::move(out));
    });
    m.add("shape", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "shape");
        const DataFrame& f = args::frame(a[0], "shape");
        return shape_value(Shape{f.rows(), f.cols()});
    });
    m.add("column", [](const List& a, const Dict&) {
        args::expect_count(a, 2, "column");
        const std::string& name = args::string(a[1], "column");
        return Value(Series{args::frame(a[0], "column").column(name), name});
    });
    m.add("sum", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "sum");
        const DataFrame& f = args::frame(a[0], "sum");
        Dict out;
        for (const auto& name : f.columns()) {
            const NdArray col = f.column(name);
            double acc = 0.0;
            for (std::size_t i = 0; i < col.size(); ++i) acc += col.as_double(i);
            out.emplace(name, acc);
        }
        return Value(std::move(out));
    });
}

} // namespace

void register_array_modules(Registry& registry, const Capabilities& caps) {
    if (caps.arrays) register_ndarray(registry);
    if (caps.arrays && caps.frames) register_frame(registry);
}

} // namespace portbridge
