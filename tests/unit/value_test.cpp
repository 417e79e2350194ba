#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "portbridge/errors.hpp"
#include "portbridge/value.hpp"

using namespace portbridge;

template <class E, class F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: dtype tags
    assert(itemsize(DType::I64) == 8);
    assert(itemsize(DType::U16) == 2);
    assert(itemsize(DType::F32) == 4);
    assert(std::string(to_string(DType::U8)) == "u8");
    assert(dtype_from_tag("i32") == DType::I32);
    assert(!dtype_from_tag("c128"));
    assert(is_integral(DType::I8) && !is_integral(DType::F64));
    std::cout << "dtype table ok" << std::endl;

    // Test 2: row-major indexing
    auto m = NdArray::from_values<std::int32_t>({1, 2, 3, 4, 5, 6}, {2, 3});
    assert(m.ndim() == 2 && m.size() == 6 && m.nbytes() == 24);
    assert((m.at<std::int32_t>(Shape{0, 2}) == 3));
    assert((m.at<std::int32_t>(Shape{1, 0}) == 4));
    assert(m.as_double(5) == 6.0);
    assert(throws<type_error>([&] { m.at<double>(0); }));
    assert(throws<value_error>([&] { m.at<std::int32_t>(Shape{2, 0}); }));
    std::cout << "indexing ok" << std::endl;

    // Test 3: reshape / transpose / astype
    assert((m.reshaped({3, 2}).shape() == Shape{3, 2}));
    assert(throws<value_error>([&] { m.reshaped({4, 2}); }));
    auto t = m.transposed();
    assert((t.shape() == Shape{3, 2}));
    assert((t.at<std::int32_t>(Shape{0, 1}) == 4));
    assert((t.at<std::int32_t>(Shape{2, 0}) == 3));
    assert(t.transposed() == m);
    auto f = m.astype(DType::F32);
    assert(f.dtype() == DType::F32 && f.at<float>(4) == 5.0f);
    std::cout << "reshape/transpose/astype ok" << std::endl;

    // Test 4: buffer validation
    assert(throws<value_error>([] { (void)NdArray(DType::I32, Shape{2}, std::vector<std::uint8_t>(7)); }));
    assert(throws<value_error>([] { NdArray::from_buffer(DType::I64, std::vector<std::uint8_t>(12), {}); }));
    auto flat = NdArray::from_buffer(DType::U8, {1, 2, 3}, {});
    assert((flat.shape() == Shape{3}));
    std::cout << "buffer validation ok" << std::endl;

    // Test 5: frames
    auto values = NdArray::from_values<double>({1, 2, 3, 4, 5, 6}, {3, 2});
    DataFrame df(values, {"a", "b"});
    assert(df.rows() == 3 && df.cols() == 2);
    assert(!df.index());
    auto b = df.column("b");
    assert((b.shape() == Shape{3}) && b.at<double>(2) == 6.0);
    assert(throws<value_error>([&] { df.column("zz"); }));
    assert(throws<value_error>([&] { (void)DataFrame(values, {"a", "b", "c"}); }));
    assert(throws<value_error>([&] { (void)DataFrame(values, {"a", "b"}, List{1, 2}); }));
    DataFrame single(NdArray::from_values<double>({7, 8}), {"x"});
    assert((single.values().shape() == Shape{2, 1}));
    std::cout << "frames ok" << std::endl;

    // Test 6: value kinds and equality
    assert(Value().is_null());
    assert(Value(3).kind() == Value::Kind::Int);
    assert(Value(std::uint64_t{18446744073709551615ull}).kind() == Value::Kind::UInt);
    assert(Value(std::uint64_t{5}).kind() == Value::Kind::Int);
    assert(Value(2.5).kind() == Value::Kind::Double);
    assert(Value("s").is_string());
    assert(Value(List{1, "x"}) == Value(List{1, "x"}));
    assert(Value(1) != Value(1.0));
    assert(Value(Dict{{"k", 1}}) == Value(Dict{{"k", 1}}));
    assert(throws<type_error>([] { Value(1).as<std::string>(); }));
    std::cout << "value kinds ok" << std::endl;

    // Test 7: nested lists and repr
    auto nested = to_nested_list(m);
    assert(nested.size() == 2);
    assert(nested[1] == Value(List{4, 5, 6}));
    assert(repr(Value(List{1, "a", nullptr, true})) == "[1, 'a', None, True]");
    std::cout << "nested/repr ok" << std::endl;

    std::cout << "\nAll value tests passed!" << std::endl;
    return 0;
}
