#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "portbridge/ndarray.hpp"

namespace portbridge {

class Value;

using Bytes = std::vector<std::uint8_t>;
using List = std::vector<Value>;
using Dict = std::map<std::string, Value>;

// Anything a callable returns that is not one of the wire-known kinds.
// Encoded by iteration when iterable() is true, otherwise by repr().
class Object {
public:
    virtual ~Object() = default;

    virtual std::string repr() const = 0;
    virtual bool iterable() const { return false; }
    // Throws when the object cannot be iterated.
    virtual List items() const;
};

using ObjectPtr = std::shared_ptr<const Object>;

// Named-column table over one 2-D typed array.
class DataFrame {
public:
    DataFrame() = default;
    DataFrame(NdArray values, std::vector<std::string> columns,
              std::optional<List> index = std::nullopt);

    const NdArray& values() const noexcept { return values_; }
    const std::vector<std::string>& columns() const noexcept { return columns_; }
    // Empty when the index is the implicit 0..n-1 range.
    const std::optional<List>& index() const noexcept { return index_; }

    std::size_t rows() const noexcept;
    std::size_t cols() const noexcept;

    NdArray column(const std::string& name) const;

    friend bool operator==(const DataFrame& a, const DataFrame& b);
    friend bool operator!=(const DataFrame& a, const DataFrame& b) { return !(a == b); }

private:
    NdArray values_;
    std::vector<std::string> columns_;
    std::optional<List> index_;
};

// Single column; name is dropped on the wire.
struct Series {
    NdArray values;
    std::optional<std::string> name;

    friend bool operator==(const Series& a, const Series& b) {
        return a.values == b.values && a.name == b.name;
    }
    friend bool operator!=(const Series& a, const Series& b) { return !(a == b); }
};

class Value {
public:
    enum class Kind {
        Null, Bool, Int, UInt, Double, String, Bytes, List, Dict,
        Array, Frame, Series, Object
    };

    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double,
                                 std::string, portbridge::Bytes, portbridge::List,
                                 portbridge::Dict, NdArray, DataFrame, portbridge::Series,
                                 ObjectPtr>;

    Value() noexcept : v_(nullptr) {}
    Value(std::nullptr_t) noexcept : v_(nullptr) {}
    Value(bool b) noexcept : v_(b) {}

    template <class T,
              std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
    Value(T n) noexcept {
        if (std::is_signed<T>::value || static_cast<std::uint64_t>(n) <= INT64_MAX) {
            v_ = static_cast<std::int64_t>(n);
        } else {
            v_ = static_cast<std::uint64_t>(n);
        }
    }

    Value(double d) noexcept : v_(d) {}
    Value(float f) noexcept : v_(static_cast<double>(f)) {}
    Value(const char* s) : v_(std::string(s)) {}
    Value(std::string s) : v_(std::move(s)) {}
    Value(portbridge::Bytes b) : v_(std::move(b)) {}
    Value(portbridge::List l) : v_(std::move(l)) {}
    Value(portbridge::Dict d) : v_(std::move(d)) {}
    Value(NdArray a) : v_(std::move(a)) {}
    Value(DataFrame f) : v_(std::move(f)) {}
    Value(portbridge::Series s) : v_(std::move(s)) {}
    Value(ObjectPtr o) : v_(std::move(o)) {}

    Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }

    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_bool() const noexcept { return kind() == Kind::Bool; }
    bool is_integer() const noexcept { return kind() == Kind::Int || kind() == Kind::UInt; }
    bool is_number() const noexcept { return is_integer() || kind() == Kind::Double; }
    bool is_string() const noexcept { return kind() == Kind::String; }

    template <class T> const T* get_if() const noexcept { return std::get_if<T>(&v_); }
    template <class T> T* get_if() noexcept { return std::get_if<T>(&v_); }

    // Throws type_error naming the actual kind on mismatch.
    template <class T> const T& as() const {
        if (auto* p = std::get_if<T>(&v_)) return *p;
        throw_kind_mismatch();
    }

    const Storage& storage() const noexcept { return v_; }

    friend bool operator==(const Value& a, const Value& b) { return a.v_ == b.v_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    [[noreturn]] void throw_kind_mismatch() const;

    Storage v_;
};

// Short name of a value kind as it appears in error messages.
const char* kind_name(Value::Kind kind);
const char* kind_name(const Value& v);

// Element of a typed array as a scalar value (integer or float per dtype).
Value element_value(const NdArray& array, std::size_t flat);

// Nested lists mirroring the array shape.
List to_nested_list(const NdArray& array);

// Human-readable rendering used when nothing better is available.
std::string repr(const Value& v);

} // namespace portbridge
