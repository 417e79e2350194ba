#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "portbridge/base64.hpp"
#include "portbridge/codec.hpp"
#include "portbridge/errors.hpp"

using namespace portbridge;
using json = nlohmann::json;

template <class E, class F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static std::string le_i32(std::initializer_list<std::int32_t> xs) {
    std::vector<std::uint8_t> raw;
    for (std::int32_t x : xs) {
        auto u = static_cast<std::uint32_t>(x);
        for (int i = 0; i < 4; ++i) raw.push_back(static_cast<std::uint8_t>((u >> (8 * i)) & 0xFF));
    }
    return base64_encode(raw);
}

class Countdown : public Object {
public:
    std::string repr() const override { return "<countdown>"; }
    bool iterable() const override { return true; }
    List items() const override { return {3, 2, 1}; }
};

class BrokenIterable : public Object {
public:
    std::string repr() const override { return "<broken>"; }
    bool iterable() const override { return true; }
    List items() const override { throw std::runtime_error("iteration failed"); }
};

class Opaque : public Object {
public:
    std::string repr() const override { return "<opaque thing>"; }
};

int main() {
    Codec codec;

    // Test 1: base64 through libsodium
    assert(base64_encode(std::vector<std::uint8_t>{'h', 'i'}) == "aGk=");
    assert((base64_decode("aGk=") == std::vector<std::uint8_t>{'h', 'i'}));
    assert(base64_decode("").empty());
    assert(throws<codec_error>([] { base64_decode("aGk"); }));
    assert(throws<codec_error>([] { base64_decode("a*k="); }));
    std::cout << "base64 ok" << std::endl;

    // Test 2: scalars and containers pass through
    const json plain = json::parse(R"({"n": null, "b": true, "i": -3, "u": 7, "d": 2.5, "s": "x", "l": [1, [2]]})");
    Value v = codec.decode(plain);
    const Dict& d = v.as<Dict>();
    assert(d.at("n").is_null());
    assert(d.at("b") == Value(true));
    assert(d.at("i") == Value(-3));
    assert(d.at("u") == Value(7));
    assert(d.at("d") == Value(2.5));
    assert(d.at("l") == Value(List{1, List{2}}));
    assert(codec.encode(v) == plain);
    std::cout << "plain values ok" << std::endl;

    // Test 3: bytes marker
    Value blob = codec.decode(json{{"__bytes__", "AAEC/w=="}});
    assert((blob.as<Bytes>() == Bytes{0, 1, 2, 255}));
    assert(codec.encode(blob) == json({{"__bytes__", "AAEC/w=="}}));
    assert(throws<codec_error>([&] { codec.decode(json{{"__bytes__", 12}}); }));
    assert(throws<codec_error>([&] { codec.decode(json{{"__bytes__", "!!"}}); }));
    std::cout << "bytes ok" << std::endl;

    // Test 4: i32 2x2 matrix
    json wire = {{"__numpy_array__", {{"dtype", "i32"}, {"shape", {2, 2}}, {"data", le_i32({1, 2, 3, 4})}}}};
    Value mat = codec.decode(wire);
    const NdArray& arr = mat.as<NdArray>();
    assert(arr.dtype() == DType::I32);
    assert((arr.shape() == Shape{2, 2}));
    assert(to_nested_list(arr) == (List{List{1, 2}, List{3, 4}}));
    assert(codec.encode(mat) == wire);
    std::cout << "typed array ok" << std::endl;

    // Test 5: lenient dtype, empty shape, malformed payloads
    Value fallback = codec.decode({{"__numpy_array__", {{"dtype", "c128"}, {"shape", json::array()},
                                                        {"data", base64_encode(std::vector<std::uint8_t>(16))}}}});
    assert(fallback.as<NdArray>().dtype() == DType::F64);
    assert((fallback.as<NdArray>().shape() == Shape{2}));
    assert(throws<value_error>([&] {
        codec.decode({{"__numpy_array__", {{"dtype", "i32"}, {"shape", {3}}, {"data", le_i32({1, 2})}}}});
    }));
    assert(throws<codec_error>([&] {
        codec.decode({{"__numpy_array__", {{"dtype", "i32"}, {"shape", {-1}}, {"data", le_i32({1})}}}});
    }));
    assert(throws<codec_error>([&] { codec.decode({{"__numpy_array__", {{"dtype", "i32"}}}}); }));
    assert(throws<codec_error>([&] { codec.decode({{"__numpy_array__", "nope"}}); }));
    // shapes whose element count does not fit in 64 bits
    const json huge_shape = {9223372036854775810ull, 2};
    assert(throws<value_error>([&] {
        codec.decode({{"__numpy_array__", {{"dtype", "i16"}, {"shape", huge_shape}, {"data", "AAAAAAAAAAA="}}}});
    }));
    assert(throws<value_error>([&] {
        codec.decode(json::parse(R"({"__pandas_df__":{"columns":["a","b"],"data":{"dtype":"i16",)"
                                 R"("shape":[9223372036854775810,2],"data":"AAAAAAAAAAA="}}})"));
    }));
    assert(throws<value_error>([&] {
        codec.decode({{"__numpy_array__", {{"dtype", "i16"}, {"shape", {9223372036854775807ull, 0}}, {"data", ""}}}});
    }));
    assert(throws<value_error>([] { NdArray::zeros(DType::F64, Shape{std::size_t{1} << 62, 4}); }));
    std::cout << "array edge cases ok" << std::endl;

    // Test 6: frames
    auto values = NdArray::from_values<double>({1.5, 2.5, 3.5, 4.5}, {2, 2});
    DataFrame ranged(values, {"a", "b"});
    json fw = codec.encode(Value(ranged));
    assert(fw["__pandas_df__"]["index"].is_null());
    assert(fw["__pandas_df__"]["columns"] == json({"a", "b"}));
    assert(codec.decode(fw) == Value(ranged));

    DataFrame labelled(values, {"a", "b"}, List{"r1", "r2"});
    json lw = codec.encode(Value(labelled));
    assert(lw["__pandas_df__"]["index"] == json({"r1", "r2"}));
    assert(codec.decode(lw) == Value(labelled));

    // an empty index list is the implicit range
    lw["__pandas_df__"]["index"] = json::array();
    assert(!codec.decode(lw).as<DataFrame>().index());
    assert(throws<value_error>([&] {
        json bad = fw;
        bad["__pandas_df__"]["columns"] = {"only"};
        codec.decode(bad);
    }));
    std::cout << "frames ok" << std::endl;

    // Test 7: marker precedence, extra keys ignored
    Value tagged = codec.decode({{"__bytes__", "aGk="}, {"other", 1}});
    assert(tagged.kind() == Value::Kind::Bytes);
    Value both = codec.decode({{"__bytes__", "aGk="},
                               {"__numpy_array__", {{"dtype", "u8"}, {"shape", {1}}, {"data", "AA=="}}}});
    assert(both.kind() == Value::Kind::Array);
    Value frame_over_bytes = codec.decode({{"__bytes__", "aGk="}, {"__pandas_df__", fw["__pandas_df__"]}});
    assert(frame_over_bytes.kind() == Value::Kind::Frame);
    // a disabled capability is not skipped in favour of a later marker
    assert(throws<unsupported_type_error>([&] {
        Codec(Capabilities{false, false}).decode({{"__bytes__", "aGk="}, {"__numpy_array__", wire["__numpy_array__"]}});
    }));
    std::cout << "marker precedence ok" << std::endl;

    // Test 8: series, opaque objects and the string fallback
    Series s{NdArray::from_values<std::int64_t>({5, 6}), std::string("col")};
    json sw = codec.encode(Value(s));
    assert(sw.contains("__numpy_array__"));
    assert(codec.decode(sw) == Value(s.values));

    assert(codec.encode(Value(ObjectPtr(std::make_shared<Countdown>()))) == json({3, 2, 1}));
    assert(codec.encode(Value(ObjectPtr(std::make_shared<BrokenIterable>()))) == "<broken>");
    assert(codec.encode(Value(ObjectPtr(std::make_shared<Opaque>()))) == "<opaque thing>");
    assert(codec.encode(Value(ObjectPtr())).is_null());
    std::cout << "fallback encoding ok" << std::endl;

    // Test 9: capabilities off
    Codec bare(Capabilities{false, true});
    assert(!bare.capabilities().arrays && !bare.capabilities().frames);
    assert(throws<unsupported_type_error>([&] { bare.decode(wire); }));
    assert(throws<unsupported_type_error>([&] { bare.decode(fw); }));
    assert(bare.encode(mat) == json({{1, 2}, {3, 4}}));
    assert(bare.encode(Value(ranged)) == json({{1.5, 2.5}, {3.5, 4.5}}));
    assert(bare.encode(Value(s)) == json({5, 6}));
    assert(bare.decode(json{{"__bytes__", "aGk="}}).kind() == Value::Kind::Bytes);

    Codec no_frames(Capabilities{true, false});
    assert(no_frames.decode(wire).kind() == Value::Kind::Array);
    assert(throws<unsupported_type_error>([&] { no_frames.decode(fw); }));
    std::cout << "capabilities ok" << std::endl;

    // Test 10: round trip over every constructible kind
    const List samples = {
        Value(), Value(false), Value(-42), Value(std::uint64_t{18446744073709551615ull}),
        Value(0.1), Value("text"), Value(Bytes{}), Value(Bytes{9, 8, 7}),
        Value(List{}), Value(Dict{}),
        Value(NdArray::from_values<std::uint16_t>({1, 65535}, {2, 1})),
        Value(NdArray::from_values<float>({0.5f, -1.25f})),
        Value(NdArray::from_values<std::int8_t>({-128, 127})),
        Value(ranged), Value(labelled),
        Value(Dict{{"nested", List{Value(Bytes{1}), Value(Dict{{"x", 1.0}})}}}),
    };
    for (const auto& sample : samples) {
        assert(codec.decode(codec.encode(sample)) == sample);
    }
    std::cout << "round trip ok" << std::endl;

    std::cout << "\nAll codec tests passed!" << std::endl;
    return 0;
}
