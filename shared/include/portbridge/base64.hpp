#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace portbridge {

// Standard alphabet with padding, as the wire format expects.
std::string base64_encode(const std::uint8_t* data, std::size_t len);
std::string base64_encode(const std::vector<std::uint8_t>& data);

// Throws codec_error on anything that is not valid padded base64.
// Embedded whitespace is skipped.
std::vector<std::uint8_t> base64_decode(std::string_view text);

} // namespace portbridge
