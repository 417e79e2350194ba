#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace portbridge {

inline constexpr const char* logger_name = "portbridge";

// Installs the "portbridge" logger as spdlog's default. Standard output
// carries protocol lines only, so the console sink is stderr; a non-empty
// path switches to a file sink. Throws spdlog::spdlog_ex when the file
// cannot be opened.
std::shared_ptr<spdlog::logger> init_logging(const std::string& path, const std::string& level);

} // namespace portbridge
