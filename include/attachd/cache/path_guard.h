#pragma once

#include <attachd/cache/entry.h>
#include <attachd/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace attachd::cache {

/**
 * @brief True when `candidate` lies strictly below `base`.
 *
 * Both paths are compared component-wise after lexical normalization; no filesystem
 * access happens here.
 */
bool isStrictDescendant(const std::filesystem::path& base, const std::filesystem::path& candidate);

/**
 * @brief Resolve a caller- or archive-supplied relative path under `root`.
 *
 * Rejects empty, absolute and NUL-containing paths, and anything whose lexical or
 * symlink-resolved form escapes `root`. The returned path is `root / relative`,
 * lexically normalized. `root` must exist.
 */
Result<std::filesystem::path> resolveConfined(const std::filesystem::path& root,
                                              std::string_view relative);

// Random hex token for temp and staging names.
std::string uniqueSuffix();

/**
 * @brief Enumerate `root` recursively into relative, '/'-separated FileInfo records.
 *
 * Output is sorted by path. Symlinks are reported only when their target is a regular
 * file or directory that stays inside `root`.
 */
Result<std::vector<FileInfo>> collectTree(const std::filesystem::path& root);

// Sum of regular file sizes below `dir`; unreadable nodes count as zero.
std::uint64_t directorySize(const std::filesystem::path& dir);

} // namespace attachd::cache
