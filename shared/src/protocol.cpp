#include "portbridge/protocol.hpp"

#include <exception>
#include <string>
#include <nlohmann/json.hpp>

#include "portbridge/errors.hpp"

namespace portbridge {

std::string frame_json(const nlohmann::json& j) {
    // invalid UTF-8 coming out of a callable must not break the line contract
    std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

bool try_extract_line(std::string& inbuf, std::string& line) {
    const auto nl = inbuf.find('\n');
    if (nl == std::string::npos) return false;

    line.assign(inbuf, 0, nl);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    inbuf.erase(0, nl + 1);
    return true;
}

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

nlohmann::json ok_envelope(nlohmann::json payload) {
    return {{"ok", std::move(payload)}};
}

nlohmann::json error_envelope(const std::string& message) {
    return {{"error", message}};
}

nlohmann::json ready_envelope(const Capabilities& caps) {
    return {{"ready", true}, {"numpy", caps.arrays}, {"pandas", caps.frames}};
}

Capabilities capabilities_from_ready(const nlohmann::json& ready) {
    Capabilities caps;
    caps.arrays = ready.value("numpy", false);
    caps.frames = ready.value("pandas", false);
    return caps;
}

std::string encode_request(const Codec& codec,
                           const std::string& module,
                           const std::string& function,
                           const List& args,
                           const Dict& kwargs) {
    nlohmann::json req;
    req["m"] = module;
    req["f"] = function;
    req["a"] = codec.encode(Value(args));
    if (!kwargs.empty()) req["k"] = codec.encode(Value(kwargs));
    return frame_json(req);
}

Response decode_response(const Codec& codec, std::string_view line) {
    Response r;
    line = trim(line);
    if (line.empty()) {
        r.status = Response::Status::EmptyLine;
        r.error = "empty line";
        return r;
    }

    nlohmann::json j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded()) {
        r.status = Response::Status::DecodeFailed;
        r.error = "response is not valid JSON";
        return r;
    }

    if (j.is_object()) {
        if (auto it = j.find("ok"); it != j.end()) {
            try {
                r.value = codec.decode(*it);
                r.status = Response::Status::Ok;
            } catch (const std::exception& e) {
                // codec_error, unsupported_type_error
                r.status = Response::Status::DecodeFailed;
                r.error = describe_exception(e);
            }
            return r;
        }
        if (auto it = j.find("error"); it != j.end()) {
            r.status = Response::Status::Error;
            r.error = it->is_string() ? it->get<std::string>() : it->dump();
            return r;
        }
    }
    r.status = Response::Status::InvalidResponse;
    r.error = "response carries neither ok nor error";
    return r;
}

} // namespace portbridge
