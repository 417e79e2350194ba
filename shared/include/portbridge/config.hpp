#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "portbridge/codec.hpp"

namespace portbridge {

class config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Config {
    Capabilities capabilities;
    std::vector<std::filesystem::path> module_paths;
    std::string log_path;          // empty: stderr
    std::string log_level{"info"};
    bool show_version{false};
    bool show_help{false};

    // Adjustments made while resolving options, logged once logging is up.
    std::vector<std::string> warnings;
};

// Accepts --key value and --key=value. Throws config_error.
Config parse_args(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace portbridge
