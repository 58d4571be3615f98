#pragma once

#include <attachd/cache/entry.h>
#include <attachd/cache/entry_store.h>
#include <attachd/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>

namespace attachd::cache {

enum class ArchiveFormat { Unknown, Tar, TarGzip, TarBzip2, Zip };

constexpr std::string_view formatToString(ArchiveFormat f) {
    switch (f) {
        case ArchiveFormat::Tar:
            return "tar";
        case ArchiveFormat::TarGzip:
            return "tar.gz";
        case ArchiveFormat::TarBzip2:
            return "tar.bz2";
        case ArchiveFormat::Zip:
            return "zip";
        case ArchiveFormat::Unknown:
            break;
    }
    return "unknown";
}

// Case-insensitive suffix match: .zip, .tar, .tar.gz, .tgz, .tar.bz2, .tbz2
ArchiveFormat formatFromFilename(std::string_view filename);

inline bool isArchive(std::string_view filename) {
    return formatFromFilename(filename) != ArchiveFormat::Unknown;
}

// Content-based detection from the first bytes of a file (at least 262 for ustar).
ArchiveFormat sniffFormat(std::span<const std::byte> prefix);

using CancelFn = std::function<bool()>;

struct ExtractOptions {
    std::uint64_t maxTotalBytes = 2ULL * 1024 * 1024 * 1024; // 0 = unlimited
    std::uint64_t maxEntries = 100'000;                      // 0 = unlimited
    std::chrono::milliseconds timeout{0};                    // 0 = unlimited
    CancelFn shouldCancel;
};

struct ExtractionResult {
    ExtractedTree tree;
    ArchiveFormat format = ArchiveFormat::Unknown;
    bool fromCache = false;
};

/**
 * @brief Unpacks a cached archive into the entry's extracted/ directory.
 *
 * Members are written into a staging directory which is renamed into place only when
 * every member was accepted; any failure leaves no extracted/ behind. Members with
 * absolute paths, paths escaping the destination, escaping symlinks, hardlinks or
 * device/FIFO nodes fail the whole extraction.
 *
 * Not internally synchronized: callers serialize per id.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(EntryStore& store, ExtractOptions options = {});

    /**
     * @brief Extract the original of `id`, or report the existing tree if already done.
     *
     * @return NotFound if the entry is absent, NotArchive if its filename has no archive
     *         suffix, ExtractionError for corrupt or disallowed content and exceeded
     *         size caps, Timeout or OperationCancelled when the deadline or cancel
     *         callback (the configured one or `cancel`) trips.
     */
    Result<ExtractionResult> extract(const AttachmentId& id, const CancelFn& cancel = {});

    // Enumerate an already extracted tree.
    Result<ExtractedTree> readTree(const AttachmentId& id) const;

    const ExtractOptions& options() const noexcept { return options_; }

private:
    Result<void> unpack(const std::filesystem::path& archivePath,
                        const std::filesystem::path& stagingDir, const CancelFn& cancel) const;

    EntryStore& store_;
    ExtractOptions options_;
};

} // namespace attachd::cache
