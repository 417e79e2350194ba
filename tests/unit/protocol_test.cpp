#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "portbridge/protocol.hpp"

using namespace portbridge;
using json = nlohmann::json;

int main() {
    Codec codec;

    // Test 1: framing
    assert(frame_json(json{{"ok", 4.0}}) == "{\"ok\":4.0}\n");
    const std::string framed = frame_json(json{{"ok", std::string("bad \xff utf8")}});
    assert(framed.back() == '\n');
    assert(framed.find('\n') == framed.size() - 1);
    std::cout << "frame_json ok" << std::endl;

    // Test 2: line extraction keeps partial input buffered
    std::string inbuf = "{\"a\":1}\r\n{\"b\"";
    std::string line;
    assert(try_extract_line(inbuf, line));
    assert(line == "{\"a\":1}");
    assert(!try_extract_line(inbuf, line));
    inbuf += ":2}\n\n";
    assert(try_extract_line(inbuf, line) && line == "{\"b\":2}");
    assert(try_extract_line(inbuf, line) && line.empty());
    assert(inbuf.empty());
    std::cout << "try_extract_line ok" << std::endl;

    // Test 3: trim
    assert(trim("  \t x y \r\n") == "x y");
    assert(trim(" \n ").empty());
    std::cout << "trim ok" << std::endl;

    // Test 4: envelopes
    assert(ok_envelope("pong") == json({{"ok", "pong"}}));
    assert(error_envelope("missing m or f") == json({{"error", "missing m or f"}}));
    json ready = ready_envelope(Capabilities{true, false});
    assert(ready == json({{"ready", true}, {"numpy", true}, {"pandas", false}}));
    Capabilities caps = capabilities_from_ready(ready);
    assert(caps.arrays && !caps.frames);
    std::cout << "envelopes ok" << std::endl;

    // Test 5: request encoding
    std::string req = encode_request(codec, "math", "sqrt", List{16});
    assert(req.back() == '\n');
    json r = json::parse(req);
    assert(r["m"] == "math" && r["f"] == "sqrt" && r["a"] == json({16}));
    assert(!r.contains("k"));
    r = json::parse(encode_request(codec, "binary", "len", List{Bytes{1, 2}}, Dict{{"flag", true}}));
    assert(r["a"][0] == json({{"__bytes__", "AQI="}}));
    assert(r["k"] == json({{"flag", true}}));
    std::cout << "encode_request ok" << std::endl;

    // Test 6: response decoding
    Response ok = decode_response(codec, "{\"ok\": 2.0}\n");
    assert(ok.ok() && ok.value == Value(2.0));
    Response err = decode_response(codec, "{\"error\": \"module not found\"}");
    assert(err.status == Response::Status::Error && err.error == "module not found");
    assert(decode_response(codec, "   \n").status == Response::Status::EmptyLine);
    assert(decode_response(codec, "{oops").status == Response::Status::DecodeFailed);
    assert(decode_response(codec, "{\"other\": 1}").status == Response::Status::InvalidResponse);
    Response blob = decode_response(codec, "{\"ok\": {\"__bytes__\": \"aGk=\"}}");
    assert(blob.ok() && (blob.value.as<Bytes>() == Bytes{'h', 'i'}));
    // a payload the codec rejects is a decode failure, not an exception
    Response bad_bytes = decode_response(codec, "{\"ok\": {\"__bytes__\": \"!!\"}}");
    assert(bad_bytes.status == Response::Status::DecodeFailed);
    assert(bad_bytes.error == "Value error: Invalid base64-encoded string");
    Response no_arrays = decode_response(Codec(Capabilities{false, false}),
        "{\"ok\": {\"__numpy_array__\": {\"dtype\": \"u8\", \"shape\": [1], \"data\": \"AA==\"}}}");
    assert(no_arrays.status == Response::Status::DecodeFailed);
    assert(no_arrays.error.rfind("Unsupported type: ", 0) == 0);
    std::cout << "decode_response ok" << std::endl;

    std::cout << "\nAll protocol tests passed!" << std::endl;
    return 0;
}
