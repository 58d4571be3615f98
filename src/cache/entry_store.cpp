#include <attachd/cache/entry_store.h>
#include <attachd/cache/path_guard.h>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace attachd::cache {

namespace {

Result<void> fsyncPath(const fs::path& p, bool directory) {
    int fd = ::open(p.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::StorageError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::StorageError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Result<void>();
}

// Write to a sibling temp file, sync, then rename over `target`.
Result<void> writeFileAtomic(const fs::path& target, std::string_view bytes) {
    const fs::path staging = target.parent_path() / (".partial-" + uniqueSuffix());
    {
        std::ofstream os(staging, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::StorageError, "Failed to create " + staging.string()};
        }
        os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        os.flush();
        if (!os.good()) {
            os.close();
            std::error_code ec;
            fs::remove(staging, ec);
            return Error{ErrorCode::StorageError, "Failed to write " + staging.string()};
        }
    }
    if (auto r = fsyncPath(staging, false); !r) {
        std::error_code ec;
        fs::remove(staging, ec);
        return r;
    }
    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(staging, rmEc);
        return Error{ErrorCode::StorageError,
                     "rename() failed (" + ec.message() + ") for " + target.string()};
    }
    return Result<void>();
}

} // namespace

EntryStore::EntryStore(CacheRoot root) : root_(std::move(root)) {}

std::string EntryStore::sanitizeFilename(std::string_view hint, const AttachmentId& id) {
    // Treat both separators as path breaks so "..\\x" cannot survive on any platform.
    std::string name(hint);
    if (auto pos = name.find_last_of("/\\"); pos != std::string::npos) {
        name = name.substr(pos + 1);
    }
    name.erase(std::remove(name.begin(), name.end(), '\0'), name.end());
    if (name.empty() || name == "." || name == "..") {
        return "attachment-" + id;
    }
    return name;
}

bool EntryStore::exists(const AttachmentId& id) const {
    if (!normalizeAttachmentId(id)) {
        return false;
    }
    return readMetadata(id).has_value();
}

bool EntryStore::isExtracted(const AttachmentId& id) const {
    if (!exists(id)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(extractedDir(id), ec);
}

Result<void> EntryStore::clearUncommitted(const AttachmentId& id) {
    std::error_code ec;
    const fs::path dir = entryDir(id);
    if (!fs::exists(dir, ec)) {
        return Result<void>();
    }
    spdlog::debug("Clearing uncommitted leftovers for attachment {}", id);
    fs::remove_all(dir, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to clear partial entry " + dir.string() + ": " + ec.message()};
    }
    return Result<void>();
}

Result<Entry> EntryStore::write(const AttachmentId& id, std::string_view bytes,
                                std::string_view filenameHint, std::string_view contentType,
                                std::string_view sourceLocator) {
    auto valid = normalizeAttachmentId(id);
    if (!valid) {
        return valid.error();
    }
    if (auto r = root_.ensure(); !r) {
        return r.error();
    }
    if (exists(id)) {
        return Error{ErrorCode::InvalidArgument, "Entry already exists: " + id};
    }
    if (auto r = clearUncommitted(id); !r) {
        return r.error();
    }

    Entry entry;
    entry.id = id;
    entry.filename = sanitizeFilename(filenameHint, id);
    entry.size = bytes.size();
    entry.contentType = std::string(contentType);
    entry.sourceLocator = std::string(sourceLocator);
    entry.storedAt = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    std::error_code ec;
    fs::create_directories(originalDir(id), ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to create " + originalDir(id).string() + ": " + ec.message()};
    }

    auto fail = [&](Error err) -> Result<Entry> {
        std::error_code rmEc;
        fs::remove_all(entryDir(id), rmEc);
        spdlog::warn("Store of attachment {} failed: {}", id, err.message);
        return err;
    };

    if (auto r = writeFileAtomic(originalPath(entry), bytes); !r) {
        return fail(r.error());
    }
    // Metadata is the commit marker.
    const auto metadata =
        entry.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (auto r = writeFileAtomic(metadataPath(id), metadata); !r) {
        return fail(r.error());
    }
    if (auto r = fsyncPath(entryDir(id), true); !r) {
        spdlog::debug("Directory sync skipped for {}: {}", id, r.error().message);
    }

    spdlog::info("Stored attachment {} ({} bytes) as {}", id, entry.size, entry.filename);
    return entry;
}

Result<Entry> EntryStore::readMetadata(const AttachmentId& id) const {
    auto valid = normalizeAttachmentId(id);
    if (!valid) {
        return valid.error();
    }
    std::ifstream in(metadataPath(id), std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Attachment " + id + " is not cached"};
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto parsed = nlohmann::json::parse(ss.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::NotFound, "Corrupt metadata for attachment " + id};
    }
    auto entry = Entry::fromJson(parsed);
    if (!entry || entry.value().id != id) {
        // Treated as uncommitted.
        return Error{ErrorCode::NotFound, "Incomplete metadata for attachment " + id};
    }
    return entry;
}

Result<bool> EntryStore::remove(const AttachmentId& id) {
    auto valid = normalizeAttachmentId(id);
    if (!valid) {
        return valid.error();
    }
    std::error_code ec;
    const fs::path dir = entryDir(id);
    if (!fs::exists(dir, ec)) {
        return false;
    }
    const bool committed = exists(id);

    if (auto r = root_.ensure(); !r) {
        return r.error();
    }
    const fs::path graveyard = root_.trashDir() / (id + "." + uniqueSuffix());
    fs::rename(dir, graveyard, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to remove " + dir.string() + ": " + ec.message()};
    }
    fs::remove_all(graveyard, ec);
    if (ec) {
        // Already invisible; sweepTrash() finishes the job on next startup.
        spdlog::warn("Leftover trash at {}: {}", graveyard.string(), ec.message());
    }
    if (committed) {
        spdlog::info("Deleted cached attachment {}", id);
    }
    return committed;
}

size_t EntryStore::sweepTrash() {
    std::error_code ec;
    const fs::path trash = root_.trashDir();
    if (!fs::is_directory(trash, ec)) {
        return 0;
    }
    size_t swept = 0;
    fs::directory_iterator it(trash, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code rmEc;
        fs::remove_all(it->path(), rmEc);
        if (rmEc) {
            spdlog::warn("Failed to sweep {}: {}", it->path().string(), rmEc.message());
            continue;
        }
        ++swept;
    }
    if (swept > 0) {
        spdlog::debug("Swept {} trashed entries under {}", swept, trash.string());
    }
    return swept;
}

Result<fs::path> EntryStore::listingRoot(const AttachmentId& id) const {
    auto valid = normalizeAttachmentId(id);
    if (!valid) {
        return valid.error();
    }
    if (!exists(id)) {
        return Error{ErrorCode::NotFound, "Attachment " + id + " is not cached"};
    }
    std::error_code ec;
    if (fs::is_directory(extractedDir(id), ec)) {
        return extractedDir(id);
    }
    return originalDir(id);
}

Result<std::vector<EntryUsage>> EntryStore::listEntries() const {
    std::vector<EntryUsage> out;
    std::error_code ec;
    if (!fs::is_directory(root_.path(), ec)) {
        return out;
    }
    fs::directory_iterator it(root_.path(), ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Cannot enumerate cache root " + root_.path().string() + ": " + ec.message()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!normalizeAttachmentId(name) || !it->is_directory(ec)) {
            continue;
        }
        auto meta = readMetadata(name);
        if (!meta) {
            continue;
        }
        out.push_back(EntryUsage{name, meta.value().storedAt, directorySize(it->path())});
    }
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Enumeration of cache root failed: " + ec.message()};
    }
    return out;
}

} // namespace attachd::cache
