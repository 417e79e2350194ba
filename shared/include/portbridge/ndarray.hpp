#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "portbridge/errors.hpp"

namespace portbridge {

// Closed set of element kinds a typed array may carry on the wire.
enum class DType { I64, I32, I16, I8, U64, U32, U16, U8, F32, F64 };

const char* to_string(DType dtype);
std::optional<DType> dtype_from_tag(std::string_view tag);
std::size_t itemsize(DType dtype);
bool is_integral(DType dtype);

template <class T> struct dtype_of;
template <> struct dtype_of<std::int64_t>  { static constexpr DType value = DType::I64; };
template <> struct dtype_of<std::int32_t>  { static constexpr DType value = DType::I32; };
template <> struct dtype_of<std::int16_t>  { static constexpr DType value = DType::I16; };
template <> struct dtype_of<std::int8_t>   { static constexpr DType value = DType::I8; };
template <> struct dtype_of<std::uint64_t> { static constexpr DType value = DType::U64; };
template <> struct dtype_of<std::uint32_t> { static constexpr DType value = DType::U32; };
template <> struct dtype_of<std::uint16_t> { static constexpr DType value = DType::U16; };
template <> struct dtype_of<std::uint8_t>  { static constexpr DType value = DType::U8; };
template <> struct dtype_of<float>         { static constexpr DType value = DType::F32; };
template <> struct dtype_of<double>        { static constexpr DType value = DType::F64; };

// Calls f with a value-initialized element of the C++ type behind dtype.
template <class F>
decltype(auto) visit_dtype(DType dtype, F&& f) {
    switch (dtype) {
    case DType::I64: return f(std::int64_t{});
    case DType::I32: return f(std::int32_t{});
    case DType::I16: return f(std::int16_t{});
    case DType::I8:  return f(std::int8_t{});
    case DType::U64: return f(std::uint64_t{});
    case DType::U32: return f(std::uint32_t{});
    case DType::U16: return f(std::uint16_t{});
    case DType::U8:  return f(std::uint8_t{});
    case DType::F32: return f(float{});
    case DType::F64: break;
    }
    return f(double{});
}

using Shape = std::vector<std::size_t>;

std::size_t element_count(const Shape& shape);
std::string shape_to_string(const Shape& shape);

// N-dimensional numeric buffer, row-major, elements stored in host byte order.
class NdArray {
public:
    NdArray();
    NdArray(DType dtype, Shape shape, std::vector<std::uint8_t> data);

    // Reinterprets a flat buffer; an empty shape keeps it one-dimensional.
    static NdArray from_buffer(DType dtype, std::vector<std::uint8_t> data, const Shape& shape);
    static NdArray zeros(DType dtype, Shape shape);

    template <class T>
    static NdArray from_values(const std::vector<T>& values, Shape shape = {}) {
        static_assert(std::is_arithmetic<T>::value, "element type must be numeric");
        std::vector<std::uint8_t> bytes(values.size() * sizeof(T));
        if (!values.empty()) std::memcpy(bytes.data(), values.data(), bytes.size());
        if (shape.empty()) shape.push_back(values.size());
        return NdArray(dtype_of<T>::value, std::move(shape), std::move(bytes));
    }

    DType dtype() const noexcept { return dtype_; }
    const Shape& shape() const noexcept { return shape_; }
    std::size_t ndim() const noexcept { return shape_.size(); }
    std::size_t size() const noexcept { return element_count(shape_); }
    std::size_t nbytes() const noexcept { return data_.size(); }
    const std::vector<std::uint8_t>& data() const noexcept { return data_; }

    template <class T>
    T at(std::size_t flat) const {
        if (dtype_of<T>::value != dtype_) {
            throw type_error(std::string("array has dtype ") + to_string(dtype_));
        }
        check_index(flat);
        T out;
        std::memcpy(&out, data_.data() + flat * sizeof(T), sizeof(T));
        return out;
    }

    template <class T>
    T at(const Shape& index) const { return at<T>(flat_index(index)); }

    // Element converted to double whatever the dtype.
    double as_double(std::size_t flat) const;
    void set_from_double(std::size_t flat, double v);

    std::size_t flat_index(const Shape& index) const;

    NdArray reshaped(Shape shape) const;
    NdArray transposed() const;
    NdArray astype(DType dtype) const;

    friend bool operator==(const NdArray& a, const NdArray& b) {
        return a.dtype_ == b.dtype_ && a.shape_ == b.shape_ && a.data_ == b.data_;
    }
    friend bool operator!=(const NdArray& a, const NdArray& b) { return !(a == b); }

private:
    void check_index(std::size_t flat) const;

    DType dtype_;
    Shape shape_;
    std::vector<std::uint8_t> data_;
};

} // namespace portbridge
