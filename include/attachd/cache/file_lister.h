#pragma once

#include <attachd/cache/entry.h>
#include <attachd/cache/entry_store.h>
#include <attachd/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace attachd::cache {

inline constexpr std::string_view kDefaultListPattern = "**/*";

/**
 * @brief Lists an entry's tree (extracted contents when present, else the original).
 *
 * `pattern` is a path glob: '*' and '?' stay within one segment, "**" spans any number
 * of segments. Results are sorted by path.
 */
class FileLister {
public:
    explicit FileLister(const EntryStore& store) : store_(store) {}

    Result<std::vector<FileInfo>> list(const AttachmentId& id,
                                       std::string_view pattern = kDefaultListPattern) const;

private:
    const EntryStore& store_;
};

} // namespace attachd::cache
