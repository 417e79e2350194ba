#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "portbridge/codec.hpp"

namespace portbridge {
    // One envelope per line: compact JSON followed by '\n'.
    std::string frame_json(const nlohmann::json& j);
    bool try_extract_line(std::string& inbuf, std::string& line);
    std::string_view trim(std::string_view s);

    nlohmann::json ok_envelope(nlohmann::json payload);
    nlohmann::json error_envelope(const std::string& message);
    nlohmann::json ready_envelope(const Capabilities& caps);
    Capabilities capabilities_from_ready(const nlohmann::json& ready);

    // --- caller side ---
    std::string encode_request(const Codec& codec,
                               const std::string& module,
                               const std::string& function,
                               const List& args,
                               const Dict& kwargs = {});

    struct Response {
        enum class Status { Ok, Error, EmptyLine, DecodeFailed, InvalidResponse };

        Status status{Status::InvalidResponse};
        Value value;
        std::string error;

        bool ok() const noexcept { return status == Status::Ok; }
    };

    Response decode_response(const Codec& codec, std::string_view line);
}
