#include "portbridge/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include "portbridge/errors.hpp"
#include "portbridge/protocol.hpp"
#include "portbridge/version.hpp"

using json = nlohmann::json;

namespace portbridge {

namespace {

class ProcessingGuard {
public:
    explicit ProcessingGuard(Dispatcher::State& state) : state_(state) {
        state_ = Dispatcher::State::Processing;
    }
    ~ProcessingGuard() { state_ = Dispatcher::State::Idle; }

    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    Dispatcher::State& state_;
};

const json* string_field(const json& req, const char* name) {
    auto it = req.find(name);
    return it == req.end() ? nullptr : &*it;
}

bool present(const json* field) {
    if (!field || field->is_null()) return false;
    return !(field->is_string() && field->get_ref<const std::string&>().empty());
}

} // namespace

Dispatcher::Dispatcher(Registry& registry, Codec codec)
    : registry_(registry), codec_(std::move(codec)) {}

json Dispatcher::ready_envelope() const {
    return portbridge::ready_envelope(codec_.capabilities());
}

std::optional<json> Dispatcher::handle_line(std::string_view line) {
    line = trim(line);
    if (line.empty()) return std::nullopt;

    ProcessingGuard guard(state_);
    ++served_;

    json out;
    try {
        const json req = json::parse(line.begin(), line.end());
        out = handle_request(req);
    } catch (const json::parse_error& e) {
        out = error_envelope(std::string("Invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        out = error_envelope(std::string("Bridge error: ") + e.what());
    } catch (...) {
        out = error_envelope("Bridge error: unknown exception");
    }

    if (auto it = out.find("error"); it != out.end()) {
        spdlog::warn("request #{} failed: {}", served_, it->get<std::string>());
    }
    return out;
}

json Dispatcher::handle_request(const json& req) {
    if (!req.is_object()) {
        return error_envelope("Bridge error: request must be a JSON object");
    }

    // control commands never reach module dispatch
    if (auto it = req.find("cmd"); it != req.end() && it->is_string()) {
        const auto& cmd = it->get_ref<const std::string&>();
        if (cmd == "ping" || cmd == "health") return handle_control(cmd);
    }

    const json* m = string_field(req, "m");
    const json* f = string_field(req, "f");
    if (!present(m) || !present(f)) {
        return error_envelope("missing m or f");
    }
    return invoke(req);
}

json Dispatcher::handle_control(const std::string& cmd) const {
    if (cmd == "ping") return ok_envelope("pong");

    const auto& caps = codec_.capabilities();
    return ok_envelope({
        {"ok", true},
        {"numpy", caps.arrays},
        {"pandas", caps.frames},
        {"runtime_version", resolved_version()},
        {"requests", served_},
    });
}

json Dispatcher::invoke(const json& req) {
    try {
        const json& m = req.at("m");
        const json& f = req.at("f");
        if (!m.is_string() || !f.is_string()) {
            throw type_error("m and f must be strings");
        }
        const auto& module = m.get_ref<const std::string&>();
        const auto& function = f.get_ref<const std::string&>();

        const json empty_args = json::array();
        const json empty_kwargs = json::object();
        auto a = req.find("a");
        auto k = req.find("k");
        const json& wire_args = a == req.end() ? empty_args : *a;
        const json& wire_kwargs = k == req.end() ? empty_kwargs : *k;
        if (!wire_args.is_array()) throw type_error("a must be a list");
        if (!wire_kwargs.is_object()) throw type_error("k must be a mapping");

        spdlog::debug("call {}.{} ({} args, {} kwargs)", module, function,
                      wire_args.size(), wire_kwargs.size());

        const Value args = codec_.decode(wire_args);
        const Value kwargs = codec_.decode(wire_kwargs);

        const Function& fn = registry_.resolve(module, function);
        const Value result = fn(args.as<List>(), kwargs.as<Dict>());
        return ok_envelope(codec_.encode(result));
    } catch (const std::exception& e) {
        return error_envelope(describe_exception(e));
    }
}

} // namespace portbridge
