#include "portbridge/args.hpp"

#include <stdexcept>

namespace portbridge {
namespace args {

namespace {

[[noreturn]] void wrong_kind(const Value& v, std::string_view fn, const char* expected) {
    throw type_error(std::string(fn) + "() argument must be " + expected + ", not '" +
                     kind_name(v) + "'");
}

} // namespace

void expect_count(const List& a, std::size_t min, std::size_t max, std::string_view fn) {
    if (a.size() >= min && a.size() <= max) return;
    std::string msg(fn);
    if (min == max) {
        msg += "() takes exactly " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    } else if (a.size() < min) {
        msg += "() takes at least " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    } else {
        msg += "() takes at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s");
    }
    msg += " (" + std::to_string(a.size()) + " given)";
    throw type_error(msg);
}

double number(const Value& v, std::string_view fn) {
    switch (v.kind()) {
    case Value::Kind::Int:    return static_cast<double>(*v.get_if<std::int64_t>());
    case Value::Kind::UInt:   return static_cast<double>(*v.get_if<std::uint64_t>());
    case Value::Kind::Double: return *v.get_if<double>();
    case Value::Kind::Bool:   return *v.get_if<bool>() ? 1.0 : 0.0;
    default: break;
    }
    wrong_kind(v, fn, "a real number");
}

std::int64_t integer(const Value& v, std::string_view fn) {
    switch (v.kind()) {
    case Value::Kind::Int:  return *v.get_if<std::int64_t>();
    case Value::Kind::Bool: return *v.get_if<bool>() ? 1 : 0;
    case Value::Kind::UInt:
        throw value_error(std::string(fn) + "() integer argument too large");
    case Value::Kind::Double:
        throw type_error(std::string(fn) + "() 'float' object cannot be interpreted as an integer");
    default: break;
    }
    wrong_kind(v, fn, "an integer");
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    std::int64_t out;
    if (__builtin_add_overflow(a, b, &out)) throw std::overflow_error("integer result does not fit in 64 bits");
    return out;
}

std::uint64_t checked_add(std::uint64_t a, std::uint64_t b) {
    std::uint64_t out;
    if (__builtin_add_overflow(a, b, &out)) throw std::overflow_error("integer result does not fit in 64 bits");
    return out;
}

const std::string& string(const Value& v, std::string_view fn) {
    if (auto* s = v.get_if<std::string>()) return *s;
    wrong_kind(v, fn, "str");
}

const Bytes& bytes(const Value& v, std::string_view fn) {
    if (auto* b = v.get_if<Bytes>()) return *b;
    wrong_kind(v, fn, "bytes");
}

const List& list(const Value& v, std::string_view fn) {
    if (auto* l = v.get_if<List>()) return *l;
    wrong_kind(v, fn, "a list");
}

const NdArray& array(const Value& v, std::string_view fn) {
    if (auto* a = v.get_if<NdArray>()) return *a;
    if (auto* s = v.get_if<Series>()) return s->values;
    wrong_kind(v, fn, "an ndarray");
}

const DataFrame& frame(const Value& v, std::string_view fn) {
    if (auto* f = v.get_if<DataFrame>()) return *f;
    wrong_kind(v, fn, "a DataFrame");
}

std::vector<double> numbers(const Value& v, std::string_view fn) {
    std::vector<double> out;
    if (auto* l = v.get_if<List>()) {
        out.reserve(l->size());
        for (const auto& item : *l) out.push_back(number(item, fn));
        return out;
    }
    if (v.get_if<NdArray>() || v.get_if<Series>()) {
        const NdArray& a = array(v, fn);
        out.reserve(a.size());
        for (std::size_t i = 0; i < a.size(); ++i) out.push_back(a.as_double(i));
        return out;
    }
    wrong_kind(v, fn, "a sequence of numbers");
}

Shape shape(const Value& v, std::string_view fn) {
    auto dim = [&](const Value& d) {
        const std::int64_t n = integer(d, fn);
        if (n < 0) throw value_error("negative dimensions are not allowed");
        return static_cast<std::size_t>(n);
    };
    if (v.is_integer()) return Shape{dim(v)};
    Shape out;
    for (const auto& d : list(v, fn)) out.push_back(dim(d));
    return out;
}

const Value* option(const List& a, const Dict& k, std::size_t pos, const std::string& name) {
    if (auto it = k.find(name); it != k.end()) return &it->second;
    if (pos < a.size()) return &a[pos];
    return nullptr;
}

} // namespace args
} // namespace portbridge
