#pragma once

#include <string_view>

namespace portbridge {

inline constexpr std::string_view version() noexcept {
    return "0.1.0";
}

// Version baked in by the build system; falls back to version().
const char* resolved_version();

} // namespace portbridge
