#include <attachd/cache/path_guard.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace fs = std::filesystem;

namespace attachd::cache {

namespace {

fs::path stripTrailingSeparator(fs::path p) {
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

std::string toGenericRelative(const fs::path& root, const fs::path& p) {
    return p.lexically_relative(root).generic_string();
}

} // namespace

bool isStrictDescendant(const fs::path& base, const fs::path& candidate) {
    const fs::path b = stripTrailingSeparator(base);
    const fs::path c = stripTrailingSeparator(candidate);

    auto bi = b.begin();
    auto ci = c.begin();
    for (; bi != b.end(); ++bi, ++ci) {
        if (ci == c.end() || *bi != *ci) {
            return false;
        }
    }
    // Must have at least one more component, and it must not climb back out.
    if (ci == c.end()) {
        return false;
    }
    for (; ci != c.end(); ++ci) {
        if (*ci == "..") {
            return false;
        }
    }
    return true;
}

Result<fs::path> resolveConfined(const fs::path& root, std::string_view relative) {
    if (relative.empty()) {
        return Error{ErrorCode::InvalidPath, "Path must not be empty"};
    }
    if (relative.find('\0') != std::string_view::npos) {
        return Error{ErrorCode::InvalidPath, "Path contains a NUL byte"};
    }

    const fs::path rel{std::string(relative)};
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return Error{ErrorCode::InvalidPath, "Absolute paths are not allowed: " + std::string(relative)};
    }

    const fs::path base = stripTrailingSeparator(root);
    const fs::path candidate = stripTrailingSeparator(base / rel);
    if (!isStrictDescendant(base, candidate)) {
        return Error{ErrorCode::InvalidPath, "Path escapes its root: " + std::string(relative)};
    }

    // Follow any symlinks already on disk.
    std::error_code ec;
    const fs::path realBase = fs::canonical(base, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Cannot resolve root " + base.string() + ": " + ec.message()};
    }
    const fs::path realCandidate = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return Error{ErrorCode::InvalidPath,
                     "Cannot resolve path " + std::string(relative) + ": " + ec.message()};
    }
    if (!isStrictDescendant(realBase, realCandidate)) {
        return Error{ErrorCode::InvalidPath,
                     "Path resolves outside its root: " + std::string(relative)};
    }
    return candidate;
}

std::string uniqueSuffix() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";
    std::uint64_t v = rng();
    std::string out(16, '0');
    for (auto& ch : out) {
        ch = kHex[v & 0xF];
        v >>= 4;
    }
    return out;
}

Result<std::vector<FileInfo>> collectTree(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::NotFound, "Directory not found: " + root.string()};
    }
    const fs::path realRoot = fs::canonical(root, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Cannot resolve " + root.string() + ": " + ec.message()};
    }

    std::vector<FileInfo> out;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Cannot enumerate " + root.string() + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::StorageError,
                         "Enumeration failed under " + root.string() + ": " + ec.message()};
        }
        const auto& de = *it;
        std::error_code sec;
        const auto linkStatus = de.symlink_status(sec);
        if (sec) {
            continue;
        }

        FileInfo info;
        info.path = toGenericRelative(root, de.path());

        if (fs::is_symlink(linkStatus)) {
            const fs::path target = fs::weakly_canonical(de.path(), sec);
            if (sec || !isStrictDescendant(realRoot, target)) {
                spdlog::debug("Skipping symlink escaping its root: {}", info.path);
                continue;
            }
            const auto st = fs::status(target, sec);
            if (sec)
                continue;
            if (fs::is_regular_file(st)) {
                info.size = fs::file_size(target, sec);
                if (sec)
                    continue;
            } else if (fs::is_directory(st)) {
                info.isDirectory = true;
            } else {
                continue;
            }
            out.push_back(std::move(info));
            continue;
        }

        if (fs::is_directory(linkStatus)) {
            info.isDirectory = true;
        } else if (fs::is_regular_file(linkStatus)) {
            info.size = de.file_size(sec);
            if (sec)
                continue;
        } else {
            continue;
        }
        out.push_back(std::move(info));
    }
    if (ec) {
        return Error{ErrorCode::StorageError,
                     "Enumeration failed under " + root.string() + ": " + ec.message()};
    }

    std::sort(out.begin(), out.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
    return out;
}

std::uint64_t directorySize(const fs::path& dir) {
    std::uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        std::error_code sec;
        if (it->is_regular_file(sec) && !it->is_symlink(sec)) {
            auto sz = it->file_size(sec);
            if (!sec)
                total += sz;
        }
    }
    return total;
}

} // namespace attachd::cache
