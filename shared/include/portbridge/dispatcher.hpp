#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "portbridge/codec.hpp"
#include "portbridge/registry.hpp"

namespace portbridge {

// One request line in, at most one response envelope out.
//
// Requests:  {"m": module, "f": function, "a": [...], "k": {...}}
//            {"cmd": "ping" | "health"}
// Responses: {"ok": value} or {"error": "message"}, never both.
//
// Every failure is turned into an error envelope here; nothing but
// allocation failure escapes handle_line().
class Dispatcher {
public:
    enum class State { Idle, Processing };

    Dispatcher(Registry& registry, Codec codec);

    nlohmann::json ready_envelope() const;

    // Empty (whitespace-only) lines produce no response.
    std::optional<nlohmann::json> handle_line(std::string_view line);

    State state() const noexcept { return state_; }
    std::uint64_t requests_served() const noexcept { return served_; }
    const Codec& codec() const noexcept { return codec_; }

private:
    nlohmann::json handle_request(const nlohmann::json& req);
    nlohmann::json handle_control(const std::string& cmd) const;
    nlohmann::json invoke(const nlohmann::json& req);

    Registry& registry_;
    Codec codec_;
    State state_{State::Idle};
    std::uint64_t served_{0};
};

} // namespace portbridge
