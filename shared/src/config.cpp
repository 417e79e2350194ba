#include "portbridge/config.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/common.h>

namespace portbridge {

namespace {

std::string trim_quotes(std::string s) {
    auto q = [](char c) { return c == '\'' || c == '"'; };
    if (!s.empty() && q(s.front())) s.erase(s.begin());
    if (!s.empty() && q(s.back())) s.pop_back();
    return s;
}

bool parse_switch(const std::string& key, std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "on" || val == "true" || val == "1" || val == "yes") return true;
    if (val == "off" || val == "false" || val == "0" || val == "no") return false;
    throw config_error("Invalid --" + key + ": " + val + " (expected on|off)");
}

} // namespace

Config parse_args(int argc, const char* const argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) != 0) {
            throw config_error("Unexpected positional argument: " + arg);
        }

        // flags without a value
        if (arg == "--version") { cfg.show_version = true; ++i; continue; }
        if (arg == "--help")    { cfg.show_help = true; ++i; continue; }

        std::string key, val;
        if (auto eq = arg.find('='); eq != std::string::npos) {
            key = arg.substr(2, eq - 2);
            val = arg.substr(eq + 1);
            ++i;
        } else {
            key = arg.substr(2);
            if (i + 1 >= argc) {
                throw config_error("Missing value for --" + key);
            }
            val = argv[i + 1];
            i += 2;
        }

        val = trim_quotes(val);

        if (key == "arrays") {
            cfg.capabilities.arrays = parse_switch(key, val);
        } else if (key == "frames") {
            cfg.capabilities.frames = parse_switch(key, val);
        } else if (key == "module-path") {
            if (val.empty()) throw config_error("Invalid --module-path: empty path");
            cfg.module_paths.emplace_back(val);
        } else if (key == "log") {
            if (val.empty()) throw config_error("Invalid --log: empty file name");
            cfg.log_path = val;
        } else if (key == "log-level") {
            // from_str maps anything unknown to off
            if (spdlog::level::from_str(val) == spdlog::level::off && val != "off") {
                throw config_error("Invalid --log-level: " + val);
            }
            cfg.log_level = val;
        } else {
            throw config_error("Unknown option: --" + key);
        }
    }

    if (cfg.capabilities.frames && !cfg.capabilities.arrays) {
        cfg.capabilities.frames = false;
        cfg.warnings.push_back("--frames needs --arrays on; data frame support disabled");
    }
    return cfg;
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " [--arrays on|off] [--frames on|off] [--module-path <dir>]...\n"
           "      [--log <file>] [--log-level trace|debug|info|warn|error|critical|off]\n"
           "  " + program + " --version\n";
}

} // namespace portbridge
