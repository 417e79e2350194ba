#include "portbridge/base64.hpp"

#include <sodium.h>

#include "portbridge/errors.hpp"

namespace portbridge {

namespace {
constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
}

std::string base64_encode(const std::uint8_t* data, std::size_t len) {
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, variant);
    std::string out(cap, '\0');
    sodium_bin2base64(out.data(), cap, data, len, variant);
    out.resize(cap - 1); // drop the terminating NUL
    return out;
}

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::vector<std::uint8_t> base64_decode(std::string_view text) {
    std::vector<std::uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t outlen = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(),
                          text.data(), text.size(),
                          " \t\r\n", &outlen, &end, variant) != 0
        || end != text.data() + text.size()) {
        throw codec_error("Invalid base64-encoded string");
    }
    out.resize(outlen);
    return out;
}

} // namespace portbridge
