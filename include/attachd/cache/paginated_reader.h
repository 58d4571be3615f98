#pragma once

#include <attachd/cache/entry_store.h>
#include <attachd/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace attachd::cache {

struct ReadOptions {
    // Binary files above this size are refused rather than inlined as base64.
    std::uint64_t maxInlineBinaryBytes = 10ULL * 1024 * 1024;
};

struct TextPage {
    std::string content; // "<line number>\t<line>" joined with '\n'
    size_t linesReturned = 0;
    size_t totalLines = 0;
    bool hasMore = false;
};

struct BinaryPayload {
    std::string contentBase64;
    std::uint64_t size = 0;
    std::string contentType;
};

struct ReadResult {
    std::string path;
    std::variant<TextPage, BinaryPayload> payload;

    bool isBinary() const { return std::holds_alternative<BinaryPayload>(payload); }
    const TextPage& text() const { return std::get<TextPage>(payload); }
    const BinaryPayload& binary() const { return std::get<BinaryPayload>(payload); }
};

/**
 * @brief Returns a window of lines from one file of an entry's tree.
 *
 * Lines are numbered from 1 and split on '\n' with a trailing '\r' dropped; a final
 * line without terminator still counts. The file is streamed so only the requested
 * window is held in memory. Files that look binary are returned whole as base64.
 */
class PaginatedReader {
public:
    static constexpr std::int64_t kDefaultLimit = 2000;

    explicit PaginatedReader(const EntryStore& store, ReadOptions options = {})
        : store_(store), options_(options) {}

    Result<ReadResult> read(const AttachmentId& id, std::string_view path,
                            std::int64_t offset = 0, std::int64_t limit = kDefaultLimit) const;

private:
    const EntryStore& store_;
    ReadOptions options_;
};

} // namespace attachd::cache
