#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/path_guard.h>
#include <attachd/common/pattern_utils.h>

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace attachd::cache {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a)
            archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a)
            archive_write_free(a);
    }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

constexpr std::string_view kStagingPrefix = ".extracting-";
constexpr size_t kSniffBytes = 512;

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

Error disallowed(const std::string& member, std::string_view why) {
    return Error{ErrorCode::ExtractionError,
                 "Disallowed archive member '" + member + "': " + std::string(why)};
}

void clearStaleStaging(const fs::path& entryDir) {
    std::error_code ec;
    fs::directory_iterator it(entryDir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.starts_with(kStagingPrefix)) {
            std::error_code rmEc;
            fs::remove_all(it->path(), rmEc);
        }
    }
}

class LimitGuard {
public:
    LimitGuard(const ExtractOptions& opts, const CancelFn& cancel) : opts_(opts), cancel_(cancel) {
        if (opts_.timeout.count() > 0) {
            deadline_ = std::chrono::steady_clock::now() + opts_.timeout;
        }
    }

    Result<void> check() const {
        if ((opts_.shouldCancel && opts_.shouldCancel()) || (cancel_ && cancel_())) {
            return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
        }
        if (deadline_ && std::chrono::steady_clock::now() > *deadline_) {
            return Error{ErrorCode::Timeout, "Extraction exceeded its time limit"};
        }
        return Result<void>();
    }

    Result<void> addEntry() {
        ++entries_;
        if (opts_.maxEntries > 0 && entries_ > opts_.maxEntries) {
            return Error{ErrorCode::ExtractionError,
                         "Archive has more than " + std::to_string(opts_.maxEntries) + " members"};
        }
        return Result<void>();
    }

    Result<void> addBytes(std::uint64_t n) {
        bytes_ += n;
        if (opts_.maxTotalBytes > 0 && bytes_ > opts_.maxTotalBytes) {
            return Error{ErrorCode::ExtractionError,
                         "Archive expands beyond " + std::to_string(opts_.maxTotalBytes) +
                             " bytes"};
        }
        return Result<void>();
    }

    std::uint64_t bytes() const { return bytes_; }

private:
    const ExtractOptions& opts_;
    const CancelFn& cancel_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::uint64_t entries_ = 0;
    std::uint64_t bytes_ = 0;
};

// Validate a member's type and link target; returns the confined destination path.
Result<fs::path> vetMember(struct archive_entry* entry, const fs::path& destination,
                           std::string& name) {
    const char* raw = archive_entry_pathname(entry);
    if (!raw) {
        raw = archive_entry_pathname_utf8(entry);
    }
    if (!raw || !*raw) {
        return Error{ErrorCode::ExtractionError, "Archive member without a name"};
    }
    name = raw;

    if (name.front() == '/' || name.front() == '\\') {
        return disallowed(name, "absolute path");
    }
    while (name.starts_with("./")) {
        name.erase(0, 2);
    }

    if (archive_entry_hardlink(entry) != nullptr) {
        return disallowed(name, "hardlinks are not supported");
    }
    const auto type = archive_entry_filetype(entry);
    if (type != AE_IFREG && type != AE_IFDIR && type != AE_IFLNK) {
        return disallowed(name, "special files are not supported");
    }

    auto target = resolveConfined(destination, name);
    if (!target) {
        return disallowed(name, target.error().message);
    }

    if (type == AE_IFLNK) {
        const char* link = archive_entry_symlink(entry);
        if (!link || !*link) {
            return disallowed(name, "symlink without target");
        }
        const fs::path linkPath(link);
        if (linkPath.is_absolute()) {
            return disallowed(name, "absolute symlink target");
        }
        const fs::path linkSource = target.value().parent_path() / linkPath;
        if (!isStrictDescendant(destination, linkSource.lexically_normal())) {
            return disallowed(name, "symlink target escapes the archive");
        }
        // Follow links extracted so far; x -> .. then y -> x/../.. passes the lexical check.
        std::error_code ec;
        const fs::path resolved = fs::weakly_canonical(linkSource, ec);
        if (ec || !isStrictDescendant(destination, resolved)) {
            return disallowed(name, "symlink target resolves outside the archive");
        }
    }
    return target;
}

// A link accepted early can be redirected by a later member, so every symlink is
// re-resolved once the whole tree is on disk.
Result<void> verifySymlinks(const fs::path& destination) {
    std::error_code ec;
    fs::recursive_directory_iterator it(destination, ec);
    if (ec) {
        return Error{ErrorCode::ExtractionError,
                     "Cannot verify extracted tree: " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::ExtractionError,
                         "Cannot verify extracted tree: " + ec.message()};
        }
        std::error_code sec;
        if (!it->is_symlink(sec)) {
            continue;
        }
        const auto rel = it->path().lexically_relative(destination).generic_string();
        const fs::path resolved = fs::weakly_canonical(it->path(), sec);
        if (sec || !isStrictDescendant(destination, resolved)) {
            return disallowed(rel, "symlink target resolves outside the archive");
        }
    }
    if (ec) {
        return Error{ErrorCode::ExtractionError, "Cannot verify extracted tree: " + ec.message()};
    }
    return Result<void>();
}

} // namespace

ArchiveFormat formatFromFilename(std::string_view filename) {
    using common::iends_with;
    if (iends_with(filename, ".tar.gz") || iends_with(filename, ".tgz"))
        return ArchiveFormat::TarGzip;
    if (iends_with(filename, ".tar.bz2") || iends_with(filename, ".tbz2"))
        return ArchiveFormat::TarBzip2;
    if (iends_with(filename, ".tar"))
        return ArchiveFormat::Tar;
    if (iends_with(filename, ".zip"))
        return ArchiveFormat::Zip;
    return ArchiveFormat::Unknown;
}

ArchiveFormat sniffFormat(std::span<const std::byte> prefix) {
    auto at = [&](size_t i) { return std::to_integer<unsigned char>(prefix[i]); };
    if (prefix.size() >= 4 && at(0) == 'P' && at(1) == 'K' &&
        ((at(2) == 0x03 && at(3) == 0x04) || (at(2) == 0x05 && at(3) == 0x06))) {
        return ArchiveFormat::Zip;
    }
    if (prefix.size() >= 2 && at(0) == 0x1F && at(1) == 0x8B) {
        return ArchiveFormat::TarGzip;
    }
    if (prefix.size() >= 3 && at(0) == 'B' && at(1) == 'Z' && at(2) == 'h') {
        return ArchiveFormat::TarBzip2;
    }
    if (prefix.size() >= 262 && std::memcmp(prefix.data() + 257, "ustar", 5) == 0) {
        return ArchiveFormat::Tar;
    }
    return ArchiveFormat::Unknown;
}

ArchiveExtractor::ArchiveExtractor(EntryStore& store, ExtractOptions options)
    : store_(store), options_(std::move(options)) {}

Result<ExtractedTree> ArchiveExtractor::readTree(const AttachmentId& id) const {
    if (!store_.isExtracted(id)) {
        return Error{ErrorCode::NotFound, "Attachment " + id + " has not been extracted"};
    }
    auto files = collectTree(store_.extractedDir(id));
    if (!files) {
        return files.error();
    }
    return ExtractedTree{std::move(files).value()};
}

Result<ExtractionResult> ArchiveExtractor::extract(const AttachmentId& id, const CancelFn& cancel) {
    auto meta = store_.readMetadata(id);
    if (!meta) {
        return meta.error();
    }
    const Entry& entry = meta.value();
    const ArchiveFormat byName = formatFromFilename(entry.filename);
    if (byName == ArchiveFormat::Unknown) {
        return Error{ErrorCode::NotArchive,
                     "File '" + entry.filename + "' is not a supported archive type"};
    }

    const fs::path original = store_.originalPath(entry);
    ExtractionResult result;
    result.format = byName;
    {
        std::array<std::byte, kSniffBytes> head{};
        std::ifstream in(original, std::ios::binary);
        if (in) {
            in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
            const auto sniffed = sniffFormat(std::span(head.data(), static_cast<size_t>(in.gcount())));
            if (sniffed != ArchiveFormat::Unknown && sniffed != byName) {
                spdlog::debug("Attachment {} named as {} but looks like {}", id,
                              formatToString(byName), formatToString(sniffed));
                result.format = sniffed;
            }
        }
    }

    if (store_.isExtracted(id)) {
        auto tree = readTree(id);
        if (!tree) {
            return tree.error();
        }
        result.tree = std::move(tree).value();
        result.fromCache = true;
        return result;
    }

    const fs::path entryDir = store_.entryDir(id);
    clearStaleStaging(entryDir);

    const fs::path staging = entryDir / (std::string(kStagingPrefix) + uniqueSuffix());
    std::error_code ec;
    fs::create_directories(staging, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Failed to create staging directory " + staging.string() + ": " + ec.message()};
    }

    const auto started = std::chrono::steady_clock::now();
    if (auto r = unpack(original, staging, cancel); !r) {
        fs::remove_all(staging, ec);
        spdlog::warn("Extraction of attachment {} failed: {}", id, r.error().message);
        return r.error();
    }

    fs::rename(staging, store_.extractedDir(id), ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove_all(staging, rmEc);
        return Error{ErrorCode::StorageError,
                     "Failed to publish extracted tree for " + id + ": " + ec.message()};
    }

    auto tree = readTree(id);
    if (!tree) {
        return tree.error();
    }
    result.tree = std::move(tree).value();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Extracted attachment {} ({} files) in {}ms", id, result.tree.fileCount(),
                 elapsed.count());
    return result;
}

Result<void> ArchiveExtractor::unpack(const fs::path& archivePath, const fs::path& stagingDir,
                                      const CancelFn& cancel) const {
    std::error_code cec;
    const fs::path destination = fs::canonical(stagingDir, cec);
    if (cec) {
        return Error{ErrorCode::StorageError,
                     "Cannot resolve staging directory " + stagingDir.string() + ": " +
                         cec.message()};
    }

    ArchiveReader reader(archive_read_new());
    ArchiveWriter writer(archive_write_disk_new());
    if (!reader || !writer) {
        return Error{ErrorCode::InternalError, "Failed to allocate libarchive handles"};
    }

    archive_read_support_format_tar(reader.get());
    archive_read_support_format_zip(reader.get());
    archive_read_support_filter_gzip(reader.get());
    archive_read_support_filter_bzip2(reader.get());

    // Pathnames handed to the writer are the absolute, already confined staging targets,
    // so NOABSOLUTEPATHS cannot be set; member names were vetted for absolute paths.
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME |
                                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        return Error{ErrorCode::ExtractionError,
                     "Failed to open archive: " + archiveError(reader.get())};
    }

    LimitGuard limits(options_, cancel);
    struct archive_entry* entry = nullptr;
    for (;;) {
        if (auto r = limits.check(); !r) {
            return r;
        }
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return Error{ErrorCode::ExtractionError,
                         "Corrupt archive: " + archiveError(reader.get())};
        }
        if (auto lr = limits.addEntry(); !lr) {
            return lr;
        }

        std::string name;
        auto target = vetMember(entry, destination, name);
        if (!target) {
            // Entries that normalize to the root itself ("./") carry nothing to write.
            if (name.empty() || name == "." || name == "/") {
                if (archive_entry_filetype(entry) == AE_IFDIR)
                    continue;
            }
            return target.error();
        }

        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0 &&
            options_.maxTotalBytes > 0 &&
            limits.bytes() + static_cast<std::uint64_t>(archive_entry_size(entry)) >
                options_.maxTotalBytes) {
            return Error{ErrorCode::ExtractionError,
                         "Archive expands beyond " + std::to_string(options_.maxTotalBytes) +
                             " bytes"};
        }

        const auto type = archive_entry_filetype(entry);
        archive_entry_set_pathname(entry, target.value().c_str());
        if (type == AE_IFDIR) {
            archive_entry_set_perm(entry, 0755);
        } else if (type == AE_IFREG) {
            archive_entry_set_perm(entry, 0644);
        }

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            return Error{ErrorCode::ExtractionError,
                         "Failed to write '" + name + "': " + archiveError(writer.get())};
        }
        if (r == ARCHIVE_WARN) {
            spdlog::debug("libarchive warning on '{}': {}", name, archiveError(writer.get()));
        }

        if (type == AE_IFREG) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            for (;;) {
                r = archive_read_data_block(reader.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) {
                    break;
                }
                if (r < ARCHIVE_WARN) {
                    return Error{ErrorCode::ExtractionError,
                                 "Corrupt data in '" + name + "': " + archiveError(reader.get())};
                }
                if (auto lr = limits.addBytes(size); !lr) {
                    return lr;
                }
                if (auto lr = limits.check(); !lr) {
                    return lr;
                }
                if (archive_write_data_block(writer.get(), buff, size, offset) < ARCHIVE_WARN) {
                    return Error{ErrorCode::ExtractionError,
                                 "Failed to write '" + name + "': " + archiveError(writer.get())};
                }
            }
        }

        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            return Error{ErrorCode::ExtractionError,
                         "Failed to finalize '" + name + "': " + archiveError(writer.get())};
        }
    }

    if (archive_write_close(writer.get()) < ARCHIVE_WARN) {
        return Error{ErrorCode::ExtractionError,
                     "Failed to finalize extraction: " + archiveError(writer.get())};
    }
    return verifySymlinks(destination);
}

} // namespace attachd::cache
