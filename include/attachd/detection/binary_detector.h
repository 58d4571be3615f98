#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include <attachd/core/types.h>

namespace attachd::detection {

/**
 * @brief Heuristic binary/text classification of a content prefix.
 *
 * Text requires: no NUL bytes, valid UTF-8 (a multi-byte sequence cut off by the end of
 * the prefix is accepted) and at most 10% control characters other than common
 * whitespace and ESC. Empty input is text.
 */
[[nodiscard]] bool isBinaryData(std::span<const std::byte> data) noexcept;

[[nodiscard]] inline bool isBinaryData(std::string_view data) noexcept {
    return isBinaryData(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data.data()), data.size()));
}

/**
 * @brief Read up to BINARY_SNIFF_SIZE bytes from the start of a file and classify them.
 */
[[nodiscard]] Result<bool> isBinaryFile(const std::filesystem::path& path);

/**
 * @brief Guess a MIME type from a filename extension; empty when unknown.
 */
[[nodiscard]] std::string guessMimeType(std::string_view filename);

} // namespace attachd::detection
