#include "portbridge/value.hpp"

#include <iomanip>
#include <sstream>

namespace portbridge {

List Object::items() const {
    throw type_error("'" + repr() + "' object is not iterable");
}

// ---------------------------------------------------------------------------
// DataFrame
// ---------------------------------------------------------------------------

DataFrame::DataFrame(NdArray values, std::vector<std::string> columns, std::optional<List> index)
    : values_(std::move(values)), columns_(std::move(columns)), index_(std::move(index)) {
    if (!columns_.empty()) {
        // a single column may arrive as a flat vector
        if (values_.ndim() == 1 && columns_.size() == 1) {
            values_ = values_.reshaped(Shape{values_.size(), 1});
        }
        if (values_.ndim() != 2) {
            throw value_error("Must pass 2-d input. shape=" + shape_to_string(values_.shape()));
        }
        if (values_.shape()[1] != columns_.size()) {
            throw value_error("Shape of passed values is " + shape_to_string(values_.shape()) +
                              ", indices imply (" + std::to_string(values_.shape()[0]) + ", " +
                              std::to_string(columns_.size()) + ")");
        }
    }
    if (index_ && index_->size() != rows()) {
        throw value_error("Length mismatch: Expected axis has " + std::to_string(rows()) +
                          " elements, new values have " + std::to_string(index_->size()) +
                          " elements");
    }
}

std::size_t DataFrame::rows() const noexcept {
    return values_.ndim() == 0 ? 0 : values_.shape()[0];
}

std::size_t DataFrame::cols() const noexcept {
    return values_.ndim() < 2 ? (values_.ndim() == 1 ? 1 : 0) : values_.shape()[1];
}

NdArray DataFrame::column(const std::string& name) const {
    for (std::size_t c = 0; c < columns_.size(); ++c) {
        if (columns_[c] != name) continue;
        const std::size_t n = rows();
        const std::size_t item = itemsize(values_.dtype());
        std::vector<std::uint8_t> out(n * item);
        for (std::size_t r = 0; r < n; ++r) {
            std::memcpy(out.data() + r * item,
                        values_.data().data() + (r * columns_.size() + c) * item, item);
        }
        return NdArray(values_.dtype(), Shape{n}, std::move(out));
    }
    throw value_error("column not found: '" + name + "'");
}

bool operator==(const DataFrame& a, const DataFrame& b) {
    return a.values_ == b.values_ && a.columns_ == b.columns_ && a.index_ == b.index_;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

const char* kind_name(Value::Kind kind) {
    switch (kind) {
    case Value::Kind::Null:   return "NoneType";
    case Value::Kind::Bool:   return "bool";
    case Value::Kind::Int:
    case Value::Kind::UInt:   return "int";
    case Value::Kind::Double: return "float";
    case Value::Kind::String: return "str";
    case Value::Kind::Bytes:  return "bytes";
    case Value::Kind::List:   return "list";
    case Value::Kind::Dict:   return "dict";
    case Value::Kind::Array:  return "ndarray";
    case Value::Kind::Frame:  return "DataFrame";
    case Value::Kind::Series: return "Series";
    case Value::Kind::Object: return "object";
    }
    return "object";
}

const char* kind_name(const Value& v) {
    return kind_name(v.kind());
}

void Value::throw_kind_mismatch() const {
    throw type_error(std::string("unexpected value of type '") + kind_name(*this) + "'");
}

Value element_value(const NdArray& array, std::size_t flat) {
    switch (array.dtype()) {
    case DType::I64: return array.at<std::int64_t>(flat);
    case DType::I32: return array.at<std::int32_t>(flat);
    case DType::I16: return array.at<std::int16_t>(flat);
    case DType::I8:  return array.at<std::int8_t>(flat);
    case DType::U64: return array.at<std::uint64_t>(flat);
    case DType::U32: return array.at<std::uint32_t>(flat);
    case DType::U16: return array.at<std::uint16_t>(flat);
    case DType::U8:  return array.at<std::uint8_t>(flat);
    case DType::F32: return array.at<float>(flat);
    case DType::F64: break;
    }
    return array.at<double>(flat);
}

namespace {

List nested(const NdArray& array, std::size_t axis, std::size_t& flat) {
    List out;
    const std::size_t n = array.shape()[axis];
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (axis + 1 == array.ndim()) {
            out.push_back(element_value(array, flat++));
        } else {
            out.push_back(nested(array, axis + 1, flat));
        }
    }
    return out;
}

void write_repr(std::ostringstream& oss, const Value& v);

void write_list(std::ostringstream& oss, const List& l) {
    oss << '[';
    for (std::size_t i = 0; i < l.size(); ++i) {
        if (i) oss << ", ";
        write_repr(oss, l[i]);
    }
    oss << ']';
}

void write_repr(std::ostringstream& oss, const Value& v) {
    switch (v.kind()) {
    case Value::Kind::Null:   oss << "None"; break;
    case Value::Kind::Bool:   oss << (*v.get_if<bool>() ? "True" : "False"); break;
    case Value::Kind::Int:    oss << *v.get_if<std::int64_t>(); break;
    case Value::Kind::UInt:   oss << *v.get_if<std::uint64_t>(); break;
    case Value::Kind::Double: oss << *v.get_if<double>(); break;
    case Value::Kind::String: oss << std::quoted(*v.get_if<std::string>(), '\''); break;
    case Value::Kind::Bytes:  oss << "<bytes len=" << v.get_if<Bytes>()->size() << '>'; break;
    case Value::Kind::List:   write_list(oss, *v.get_if<List>()); break;
    case Value::Kind::Dict: {
        oss << '{';
        bool first = true;
        for (const auto& [k, item] : *v.get_if<Dict>()) {
            if (!first) oss << ", ";
            first = false;
            oss << std::quoted(k, '\'') << ": ";
            write_repr(oss, item);
        }
        oss << '}';
        break;
    }
    case Value::Kind::Array: {
        const auto& a = *v.get_if<NdArray>();
        oss << "array(";
        write_list(oss, to_nested_list(a));
        oss << ", dtype=" << to_string(a.dtype()) << ')';
        break;
    }
    case Value::Kind::Frame: {
        const auto& f = *v.get_if<DataFrame>();
        oss << "<DataFrame " << f.rows() << "x" << f.cols() << '>';
        break;
    }
    case Value::Kind::Series:
        oss << "<Series len=" << v.get_if<Series>()->values.size() << '>';
        break;
    case Value::Kind::Object: {
        const auto& o = *v.get_if<ObjectPtr>();
        oss << (o ? o->repr() : std::string("None"));
        break;
    }
    }
}

} // namespace

List to_nested_list(const NdArray& array) {
    if (array.ndim() == 0) return {};
    std::size_t flat = 0;
    return nested(array, 0, flat);
}

std::string repr(const Value& v) {
    std::ostringstream oss;
    write_repr(oss, v);
    return oss.str();
}

} // namespace portbridge
