#include "portbridge/builtins.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

#include "portbridge/args.hpp"
#include "portbridge/errors.hpp"

namespace portbridge {

namespace {

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------

Value checked(double result) {
    if (std::isnan(result)) throw value_error("math domain error");
    if (std::isinf(result)) throw std::overflow_error("math range error");
    return result;
}

Value to_integer(double d) {
    if (!std::isfinite(d)) throw std::overflow_error("cannot convert float infinity or NaN to integer");
    if (d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
        throw std::overflow_error("integer result does not fit in 64 bits");
    }
    return static_cast<std::int64_t>(d);
}

using UnaryFn = double (*)(double);

Callable unary(const char* name, UnaryFn fn) {
    return [name, fn](const List& a, const Dict&) {
        args::expect_count(a, 1, name);
        const double x = args::number(a[0], name);
        const double r = fn(x);
        if (std::isnan(r) && !std::isnan(x)) throw value_error("math domain error");
        return Value(r);
    };
}

bool all_integers(const List& items) {
    return std::all_of(items.begin(), items.end(),
                       [](const Value& v) { return v.kind() == Value::Kind::Int || v.is_bool(); });
}

// strict weak ordering over numbers or strings; mixing them is an error
bool less_than(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int) {
            return *a.get_if<std::int64_t>() < *b.get_if<std::int64_t>();
        }
        return args::number(a, "<") < args::number(b, "<");
    }
    if (a.is_string() && b.is_string()) return *a.get_if<std::string>() < *b.get_if<std::string>();
    throw type_error(std::string("'<' not supported between instances of '") + kind_name(a) +
                     "' and '" + kind_name(b) + "'");
}

const List& items_of(const List& a, const char* fn) {
    args::expect_count(a, 1, std::numeric_limits<std::size_t>::max(), fn);
    return a.size() == 1 && a[0].get_if<List>() ? *a[0].get_if<List>() : a;
}

std::size_t utf8_length(const std::string& s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// ---------------------------------------------------------------------------
// opaque objects
// ---------------------------------------------------------------------------

class RangeObject : public Object {
public:
    RangeObject(std::int64_t start, std::int64_t stop, std::int64_t step)
        : start_(start), stop_(stop), step_(step) {}

    std::string repr() const override {
        std::ostringstream oss;
        oss << "range(" << start_ << ", " << stop_;
        if (step_ != 1) oss << ", " << step_;
        oss << ')';
        return oss.str();
    }

    bool iterable() const override { return true; }

    List items() const override {
        List out;
        for (std::int64_t i = start_; step_ > 0 ? i < stop_ : i > stop_;) {
            out.emplace_back(i);
            // the next value would be past any int64 stop
            if (__builtin_add_overflow(i, step_, &i)) break;
        }
        return out;
    }

private:
    std::int64_t start_, stop_, step_;
};

class PlainObject : public Object {
public:
    std::string repr() const override { return "<object object>"; }
};

// ---------------------------------------------------------------------------
// math
// ---------------------------------------------------------------------------

void register_math(Registry& registry) {
    Module& m = registry.add_module("math");

    m.add("sqrt", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "sqrt");
        const double x = args::number(a[0], "sqrt");
        if (x < 0) throw value_error("math domain error");
        return Value(std::sqrt(x));
    });
    m.add("pow", [](const List& a, const Dict&) {
        args::expect_count(a, 2, "pow");
        const double x = args::number(a[0], "pow");
        const double y = args::number(a[1], "pow");
        if (x == 0.0 && y < 0) throw value_error("math domain error");
        return checked(std::pow(x, y));
    });
    m.add("exp", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "exp");
        return checked(std::exp(args::number(a[0], "exp")));
    });
    m.add("log", [](const List& a, const Dict&) {
        args::expect_count(a, 1, 2, "log");
        const double x = args::number(a[0], "log");
        if (x <= 0) throw value_error("math domain error");
        if (a.size() == 1) return Value(std::log(x));
        const double base = args::number(a[1], "log");
        if (base <= 0 || base == 1.0) throw value_error("math domain error");
        return Value(std::log(x) / std::log(base));
    });
    m.add("log10", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "log10");
        const double x = args::number(a[0], "log10");
        if (x <= 0) throw value_error("math domain error");
        return Value(std::log10(x));
    });
    m.add("floor", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "floor");
        if (a[0].is_integer()) return a[0];
        return to_integer(std::floor(args::number(a[0], "floor")));
    });
    m.add("ceil", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "ceil");
        if (a[0].is_integer()) return a[0];
        return to_integer(std::ceil(args::number(a[0], "ceil")));
    });
    m.add("fabs", unary("fabs", static_cast<UnaryFn>(std::fabs)));
    m.add("sin", unary("sin", static_cast<UnaryFn>(std::sin)));
    m.add("cos", unary("cos", static_cast<UnaryFn>(std::cos)));
    m.add("tan", unary("tan", static_cast<UnaryFn>(std::tan)));
    m.add("hypot", [](const List& a, const Dict&) {
        double acc = 0.0;
        for (const auto& v : a) acc = std::hypot(acc, args::number(v, "hypot"));
        return Value(acc);
    });
    m.add("factorial", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "factorial");
        const std::int64_t n = args::integer(a[0], "factorial");
        if (n < 0) throw value_error("factorial() not defined for negative values");
        if (n > 20) throw std::overflow_error("factorial() result does not fit in 64 bits");
        std::int64_t r = 1;
        for (std::int64_t i = 2; i <= n; ++i) r *= i;
        return Value(r);
    });
    m.add("gcd", [](const List& a, const Dict&) {
        std::int64_t g = 0;
        for (const auto& v : a) g = std::gcd(g, args::integer(v, "gcd"));
        return Value(g);
    });
    m.add("isfinite", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "isfinite");
        return Value(static_cast<bool>(std::isfinite(args::number(a[0], "isfinite"))));
    });
}

// ---------------------------------------------------------------------------
// statistics
// ---------------------------------------------------------------------------

void register_statistics(Registry& registry) {
    Module& m = registry.add_module("statistics");

    m.add("mean", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "mean");
        const auto xs = args::numbers(a[0], "mean");
        if (xs.empty()) throw value_error("mean requires at least one data point");
        return Value(std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size()));
    });
    m.add("median", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "median");
        auto xs = args::numbers(a[0], "median");
        if (xs.empty()) throw value_error("no median for empty data");
        std::sort(xs.begin(), xs.end());
        const std::size_t n = xs.size();
        return Value(n % 2 ? xs[n / 2] : (xs[n / 2 - 1] + xs[n / 2]) / 2.0);
    });
    m.add("pvariance", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "pvariance");
        const auto xs = args::numbers(a[0], "pvariance");
        if (xs.empty()) throw value_error("pvariance requires at least one data point");
        const double mu = std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
        double ss = 0.0;
        for (double x : xs) ss += (x - mu) * (x - mu);
        return Value(ss / static_cast<double>(xs.size()));
    });
    m.add("stdev", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "stdev");
        const auto xs = args::numbers(a[0], "stdev");
        if (xs.size() < 2) throw value_error("stdev requires at least two data points");
        const double mu = std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
        double ss = 0.0;
        for (double x : xs) ss += (x - mu) * (x - mu);
        return Value(std::sqrt(ss / static_cast<double>(xs.size() - 1)));
    });
}

// ---------------------------------------------------------------------------
// builtins
// ---------------------------------------------------------------------------

void register_builtins_module(Registry& registry) {
    Module& m = registry.add_module("builtins");

    m.add("len", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "len");
        const Value& v = a[0];
        switch (v.kind()) {
        case Value::Kind::String: return Value(utf8_length(*v.get_if<std::string>()));
        case Value::Kind::Bytes:  return Value(v.get_if<Bytes>()->size());
        case Value::Kind::List:   return Value(v.get_if<List>()->size());
        case Value::Kind::Dict:   return Value(v.get_if<Dict>()->size());
        case Value::Kind::Array: {
            const auto& arr = *v.get_if<NdArray>();
            return Value(arr.ndim() ? arr.shape()[0] : std::size_t{0});
        }
        case Value::Kind::Frame:  return Value(v.get_if<DataFrame>()->rows());
        case Value::Kind::Series: return Value(v.get_if<Series>()->values.size());
        default: break;
        }
        throw type_error(std::string("object of type '") + kind_name(v) + "' has no len()");
    });
    m.add("sorted", [](const List& a, const Dict& k) {
        args::expect_count(a, 1, "sorted");
        List items = args::list(a[0], "sorted");
        std::stable_sort(items.begin(), items.end(), less_than);
        if (auto it = k.find("reverse"); it != k.end() && it->second.is_bool() && *it->second.get_if<bool>()) {
            std::reverse(items.begin(), items.end());
        }
        return Value(std::move(items));
    }, true);
    m.add("sum", [](const List& a, const Dict&) {
        args::expect_count(a, 1, 2, "sum");
        const List& items = args::list(a[0], "sum");
        const Value start = a.size() > 1 ? a[1] : Value(0);
        if (all_integers(items) && (start.kind() == Value::Kind::Int || start.is_bool())) {
            std::int64_t acc = args::integer(start, "sum");
            for (const auto& v : items) acc = args::checked_add(acc, args::integer(v, "sum"));
            return Value(acc);
        }
        double acc = args::number(start, "sum");
        for (const auto& v : items) acc += args::number(v, "sum");
        return Value(acc);
    });
    m.add("abs", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "abs");
        if (auto* i = a[0].get_if<std::int64_t>()) {
            if (*i == std::numeric_limits<std::int64_t>::min()) {
                return Value(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1);
            }
            return Value(*i < 0 ? -*i : *i);
        }
        return Value(std::fabs(args::number(a[0], "abs")));
    });
    m.add("min", [](const List& a, const Dict&) {
        const List& items = items_of(a, "min");
        if (items.empty()) throw value_error("min() arg is an empty sequence");
        return *std::min_element(items.begin(), items.end(), less_than);
    });
    m.add("max", [](const List& a, const Dict&) {
        const List& items = items_of(a, "max");
        if (items.empty()) throw value_error("max() arg is an empty sequence");
        return *std::max_element(items.begin(), items.end(), less_than);
    });
    m.add("repr", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "repr");
        return Value(repr(a[0]));
    });
    m.add("range", [](const List& a, const Dict&) {
        args::expect_count(a, 1, 3, "range");
        std::int64_t start = 0, stop = 0, step = 1;
        if (a.size() == 1) {
            stop = args::integer(a[0], "range");
        } else {
            start = args::integer(a[0], "range");
            stop = args::integer(a[1], "range");
            if (a.size() == 3) step = args::integer(a[2], "range");
        }
        if (step == 0) throw value_error("range() arg 3 must not be zero");
        return Value(ObjectPtr(std::make_shared<RangeObject>(start, stop, step)));
    });
    m.add("object", [](const List& a, const Dict&) {
        args::expect_count(a, 0, "object");
        return Value(ObjectPtr(std::make_shared<PlainObject>()));
    });
    m.add("echo", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "echo");
        return a[0];
    });
    m.add("describe_call", [](const List& a, const Dict& k) {
        return Value(Dict{{"args", Value(a)}, {"kwargs", Value(k)}});
    }, true);
    m.add("fail", [](const List& a, const Dict&) -> Value {
        args::expect_count(a, 1, "fail");
        throw std::runtime_error(args::string(a[0], "fail"));
    });
}

// ---------------------------------------------------------------------------
// binary
// ---------------------------------------------------------------------------

void register_binary(Registry& registry) {
    Module& m = registry.add_module("binary");

    m.add("len", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "len");
        return Value(args::bytes(a[0], "len").size());
    });
    m.add("reverse", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "reverse");
        const Bytes& b = args::bytes(a[0], "reverse");
        return Value(Bytes(b.rbegin(), b.rend()));
    });
    m.add("concat", [](const List& a, const Dict&) {
        Bytes out;
        for (const auto& v : a) {
            const Bytes& b = args::bytes(v, "concat");
            out.insert(out.end(), b.begin(), b.end());
        }
        return Value(std::move(out));
    });
    m.add("hex", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "hex");
        const Bytes& b = args::bytes(a[0], "hex");
        std::string hex(b.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), b.data(), b.size());
        hex.pop_back();
        return Value(std::move(hex));
    });
    m.add("from_hex", [](const List& a, const Dict&) {
        args::expect_count(a, 1, "from_hex");
        const std::string& hex = args::string(a[0], "from_hex");
        Bytes out(hex.size() / 2 + 1);
        std::size_t outlen = 0;
        const char* end = nullptr;
        if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(),
                           " ", &outlen, &end) != 0 || end != hex.c_str() + hex.size()) {
            throw value_error("non-hexadecimal number found in from_hex() arg");
        }
        out.resize(outlen);
        return Value(std::move(out));
    });
}

} // namespace

void register_core_modules(Registry& registry) {
    register_math(registry);
    register_statistics(registry);
    register_builtins_module(registry);
    register_binary(registry);
}

} // namespace portbridge
