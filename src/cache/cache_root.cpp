#include <attachd/cache/cache_root.h>
#include <attachd/cache/path_guard.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace attachd::cache {

fs::path CacheRoot::resolve(const fs::path& override) {
    if (!override.empty()) {
        return override;
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec || tmp.empty()) {
        tmp = "/tmp";
    }
    return tmp / kDefaultFolderName;
}

CacheRoot::CacheRoot(fs::path path) : path_(std::move(path)) {}

Result<void> CacheRoot::ensure() const {
    if (ensured_.load(std::memory_order_acquire)) {
        return Result<void>();
    }

    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to create cache root " + path_.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(path_, ec)) {
        return Error{ErrorCode::StorageError, "Cache root is not a directory: " + path_.string()};
    }
    fs::create_directories(trashDir(), ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to create trash directory under " + path_.string() + ": " +
                         ec.message()};
    }

    // Probe writability once.
    const fs::path probe = trashDir() / (".probe-" + uniqueSuffix());
    {
        std::ofstream os(probe, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::StorageError, "Cache root is not writable: " + path_.string()};
        }
    }
    fs::remove(probe, ec);

    spdlog::debug("Cache root ready at {}", path_.string());
    ensured_.store(true, std::memory_order_release);
    return Result<void>();
}

} // namespace attachd::cache
