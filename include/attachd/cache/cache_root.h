#pragma once

#include <attachd/core/types.h>

#include <atomic>
#include <filesystem>
#include <string_view>

namespace attachd::cache {

/**
 * @brief The single directory under which every cache entry lives.
 *
 * Resolution is pure; the directory is created on the first call to ensure().
 */
class CacheRoot {
public:
    static constexpr std::string_view kDefaultFolderName = "zendesk-attachments";
    static constexpr std::string_view kTrashDirName = ".trash";

    // Explicit override wins; otherwise <system temp dir>/zendesk-attachments.
    static std::filesystem::path resolve(const std::filesystem::path& override = {});

    explicit CacheRoot(std::filesystem::path path);
    CacheRoot(const CacheRoot& other) : path_(other.path_), ensured_(other.ensured_.load()) {}

    const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path trashDir() const { return path_ / kTrashDirName; }

    /**
     * @brief Create the root (and its trash directory) if needed and verify it is writable.
     *
     * @return StorageError when the directory cannot be created or written.
     */
    Result<void> ensure() const;

private:
    std::filesystem::path path_;
    mutable std::atomic<bool> ensured_{false};
};

} // namespace attachd::cache
