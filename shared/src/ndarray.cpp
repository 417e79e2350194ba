#include "portbridge/ndarray.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <sstream>

namespace portbridge {

namespace {

struct TagEntry {
    const char* tag;
    DType dtype;
};

constexpr TagEntry dtype_table[] = {
    {"f64", DType::F64}, {"f32", DType::F32},
    {"i64", DType::I64}, {"i32", DType::I32},
    {"i16", DType::I16}, {"i8",  DType::I8},
    {"u64", DType::U64}, {"u32", DType::U32},
    {"u16", DType::U16}, {"u8",  DType::U8},
};

Shape row_major_strides(const Shape& shape) {
    Shape strides(shape.size(), 1);
    for (std::size_t i = shape.size(); i-- > 1; ) {
        strides[i - 1] = strides[i] * shape[i];
    }
    return strides;
}

// Bytes needed for an array of this shape. Zero-length axes are skipped
// for the size check so that a (huge, 0) shape is still rejected.
std::size_t checked_nbytes(const Shape& shape, std::size_t item) {
    constexpr auto limit = static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
    std::size_t extent = item;
    bool empty = false;
    for (auto d : shape) {
        if (d == 0) {
            empty = true;
            continue;
        }
        if (__builtin_mul_overflow(extent, d, &extent) || extent > limit) {
            throw value_error("array is too big; `arr.size * arr.dtype.itemsize` "
                              "is larger than the maximum possible size.");
        }
    }
    return empty ? 0 : extent;
}

} // namespace

const char* to_string(DType dtype) {
    for (const auto& e : dtype_table) {
        if (e.dtype == dtype) return e.tag;
    }
    return "f64";
}

std::optional<DType> dtype_from_tag(std::string_view tag) {
    for (const auto& e : dtype_table) {
        if (tag == e.tag) return e.dtype;
    }
    return std::nullopt;
}

std::size_t itemsize(DType dtype) {
    return visit_dtype(dtype, [](auto v) { return sizeof(v); });
}

bool is_integral(DType dtype) {
    return dtype != DType::F32 && dtype != DType::F64;
}

std::size_t element_count(const Shape& shape) {
    std::size_t n = 1;
    for (auto d : shape) n *= d;
    return n;
}

std::string shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << '(';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1) oss << ',';
    oss << ')';
    return oss.str();
}

NdArray::NdArray() : dtype_(DType::F64), shape_{0} {}

NdArray::NdArray(DType dtype, Shape shape, std::vector<std::uint8_t> data)
    : dtype_(dtype), shape_(std::move(shape)), data_(std::move(data)) {
    const std::size_t item = itemsize(dtype_);
    if (data_.size() % item != 0) {
        throw value_error("buffer size must be a multiple of element size");
    }
    const std::size_t have = data_.size() / item;
    if (checked_nbytes(shape_, item) != data_.size()) {
        throw value_error("cannot reshape array of size " + std::to_string(have) +
                          " into shape " + shape_to_string(shape_));
    }
}

NdArray NdArray::from_buffer(DType dtype, std::vector<std::uint8_t> data, const Shape& shape) {
    if (!shape.empty()) return NdArray(dtype, shape, std::move(data));
    const std::size_t item = itemsize(dtype);
    if (data.size() % item != 0) {
        throw value_error("buffer size must be a multiple of element size");
    }
    const std::size_t n = data.size() / item;
    return NdArray(dtype, Shape{n}, std::move(data));
}

NdArray NdArray::zeros(DType dtype, Shape shape) {
    std::vector<std::uint8_t> bytes(checked_nbytes(shape, itemsize(dtype)), 0);
    return NdArray(dtype, std::move(shape), std::move(bytes));
}

void NdArray::check_index(std::size_t flat) const {
    if (flat >= size()) {
        throw value_error("index " + std::to_string(flat) + " is out of bounds for size " +
                          std::to_string(size()));
    }
}

std::size_t NdArray::flat_index(const Shape& index) const {
    if (index.size() != shape_.size()) {
        throw value_error("too many or too few indices for array: array is " +
                          std::to_string(shape_.size()) + "-dimensional, but " +
                          std::to_string(index.size()) + " were indexed");
    }
    const Shape strides = row_major_strides(shape_);
    std::size_t flat = 0;
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (index[i] >= shape_[i]) {
            throw value_error("index " + std::to_string(index[i]) + " is out of bounds for axis " +
                              std::to_string(i) + " with size " + std::to_string(shape_[i]));
        }
        flat += index[i] * strides[i];
    }
    return flat;
}

double NdArray::as_double(std::size_t flat) const {
    check_index(flat);
    return visit_dtype(dtype_, [&](auto tag) {
        decltype(tag) v;
        std::memcpy(&v, data_.data() + flat * sizeof(v), sizeof(v));
        return static_cast<double>(v);
    });
}

void NdArray::set_from_double(std::size_t flat, double value) {
    check_index(flat);
    visit_dtype(dtype_, [&](auto tag) {
        auto v = static_cast<decltype(tag)>(value);
        std::memcpy(data_.data() + flat * sizeof(v), &v, sizeof(v));
    });
}

NdArray NdArray::reshaped(Shape shape) const {
    return NdArray(dtype_, std::move(shape), data_);
}

NdArray NdArray::transposed() const {
    if (shape_.size() < 2) return *this;

    Shape out_shape(shape_.rbegin(), shape_.rend());
    const Shape in_strides = row_major_strides(shape_);
    const std::size_t item = itemsize(dtype_);
    const std::size_t n = size();
    std::vector<std::uint8_t> out(data_.size());

    // walk the output in row-major order, reading the input with reversed axes
    Shape counter(out_shape.size(), 0);
    for (std::size_t flat = 0; flat < n; ++flat) {
        std::size_t src = 0;
        for (std::size_t axis = 0; axis < counter.size(); ++axis) {
            src += counter[axis] * in_strides[counter.size() - 1 - axis];
        }
        std::memcpy(out.data() + flat * item, data_.data() + src * item, item);
        for (std::size_t axis = counter.size(); axis-- > 0; ) {
            if (++counter[axis] < out_shape[axis]) break;
            counter[axis] = 0;
        }
    }
    return NdArray(dtype_, std::move(out_shape), std::move(out));
}

NdArray NdArray::astype(DType dtype) const {
    if (dtype == dtype_) return *this;
    NdArray out = zeros(dtype, shape_);
    const std::size_t n = size();
    for (std::size_t i = 0; i < n; ++i) {
        out.set_from_double(i, as_double(i));
    }
    return out;
}

} // namespace portbridge
