#pragma once

#include <nlohmann/json.hpp>

#include "portbridge/value.hpp"

namespace portbridge {

namespace markers {
inline constexpr const char* bytes = "__bytes__";
inline constexpr const char* array = "__numpy_array__";
inline constexpr const char* frame = "__pandas_df__";
} // namespace markers

// Optional value kinds a running instance supports.
struct Capabilities {
    bool arrays{true};
    bool frames{true};

    friend bool operator==(const Capabilities& a, const Capabilities& b) {
        return a.arrays == b.arrays && a.frames == b.frames;
    }
};

// Bidirectional mapping between wire values (plain JSON) and Value.
//
// Tagged kinds travel as single-key mappings:
//   {"__bytes__": "<base64>"}
//   {"__numpy_array__": {"dtype": "i32", "shape": [2, 2], "data": "<base64>"}}
//   {"__pandas_df__": {"columns": [...], "data": <array payload>, "index": [...] | null}}
//
// A user mapping that carries one of these keys is indistinguishable from
// the tagged form; there is no escaping.
class Codec {
public:
    explicit Codec(Capabilities caps = {});

    const Capabilities& capabilities() const noexcept { return caps_; }

    // Throws codec_error on malformed marker payloads and
    // unsupported_type_error on markers for a disabled capability.
    Value decode(const nlohmann::json& wire) const;

    // Never throws for unrecognized values; the last resort is repr().
    nlohmann::json encode(const Value& value) const;

    NdArray decode_array(const nlohmann::json& payload) const;
    DataFrame decode_frame(const nlohmann::json& payload) const;

    nlohmann::json encode_array(const NdArray& array) const;
    nlohmann::json encode_frame(const DataFrame& frame) const;

private:
    nlohmann::json encode_iterable(const Value& value) const;

    Capabilities caps_;
};

} // namespace portbridge
