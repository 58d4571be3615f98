#pragma once

#include <string>
#include <string_view>

namespace attachd::common {

inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD"; // U+FFFD

namespace detail {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0 if malformed.
inline size_t validSequenceLength(const unsigned char* data, size_t i, size_t n) {
    const unsigned char c = data[i];
    if (c < 0x80)
        return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // allowed range for the first continuation byte
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0)
            lo = 0xA0; // overlong
        else if (c == 0xED)
            hi = 0x9F; // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0)
            lo = 0x90;
        else if (c == 0xF4)
            hi = 0x8F; // > U+10FFFF
    } else {
        return 0;
    }
    if (i + len > n)
        return 0;
    if (data[i + 1] < lo || data[i + 1] > hi)
        return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((data[i + k] & 0xC0) != 0x80)
            return 0;
    }
    return len;
}

} // namespace detail

// Replace each invalid UTF-8 byte with U+FFFD so the text can be embedded in JSON.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        const size_t len = detail::validSequenceLength(data, i, n);
        if (len == 0) {
            out.append(kReplacementChar);
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

// Fast path for the common case.
inline bool isValidUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    for (size_t i = 0; i < n;) {
        const size_t len = detail::validSequenceLength(data, i, n);
        if (len == 0)
            return false;
        i += len;
    }
    return true;
}

} // namespace attachd::common
