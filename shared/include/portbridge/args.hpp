#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "portbridge/value.hpp"

namespace portbridge {

// Argument extraction for callables. Every helper throws type_error with
// the function name in the message when the argument has the wrong kind.
namespace args {

void expect_count(const List& a, std::size_t min, std::size_t max, std::string_view fn);
inline void expect_count(const List& a, std::size_t n, std::string_view fn) {
    expect_count(a, n, n, fn);
}

double number(const Value& v, std::string_view fn);
std::int64_t integer(const Value& v, std::string_view fn);
const std::string& string(const Value& v, std::string_view fn);
const Bytes& bytes(const Value& v, std::string_view fn);
const List& list(const Value& v, std::string_view fn);
const NdArray& array(const Value& v, std::string_view fn);
const DataFrame& frame(const Value& v, std::string_view fn);

// Numbers from a list, a typed array or a series.
std::vector<double> numbers(const Value& v, std::string_view fn);

// Shape from a non-negative integer or a list of them.
Shape shape(const Value& v, std::string_view fn);

// Integer accumulation; a result outside 64 bits throws std::overflow_error.
std::int64_t checked_add(std::int64_t a, std::int64_t b);
std::uint64_t checked_add(std::uint64_t a, std::uint64_t b);

// Keyword argument, falling back to the positional slot, else nullptr.
const Value* option(const List& a, const Dict& k, std::size_t pos, const std::string& name);

} // namespace args
} // namespace portbridge
