#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace attachd::common {

// Standard (RFC 4648) base64 with '=' padding.
inline std::string base64Encode(std::string_view bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t len = bytes.size();
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += (i + 1 < len) ? kAlphabet[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? kAlphabet[n & 0x3F] : '=';
    }
    return out;
}

} // namespace attachd::common
