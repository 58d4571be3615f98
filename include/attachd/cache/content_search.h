#pragma once

#include <attachd/cache/entry_store.h>
#include <attachd/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace attachd::cache {

struct SearchRequest {
    std::string pattern;          // ECMAScript regex (Boost.Regex), matched per line
    std::string glob = "*";       // without '/': file name; with '/': relative path
    std::size_t contextLines = 2;
    std::size_t maxResults = 100;
};

struct SearchMatch {
    std::string path;
    std::size_t line = 0; // 1-indexed
    std::string content;
    std::vector<std::string> contextBefore;
    std::vector<std::string> contextAfter;

    nlohmann::json toJson() const;
};

struct SearchResponse {
    std::vector<SearchMatch> matches;
    std::size_t totalMatches = 0;
    std::size_t filesSearched = 0;
    bool truncated = false;
};

/**
 * @brief Regex search over the text files of an entry's listable tree.
 *
 * Files are streamed line by line; memory is bounded by the collected matches plus a
 * ring of `contextLines` preceding lines. Binary and unreadable files are skipped
 * silently and do not count toward filesSearched. A line on which the matcher exceeds
 * its complexity budget counts as not matching.
 */
class ContentSearchEngine {
public:
    explicit ContentSearchEngine(const EntryStore& store) : store_(store) {}

    Result<SearchResponse> search(const AttachmentId& id, const SearchRequest& request) const;

    // Glob selection rule shared with tests.
    static bool globSelects(std::string_view glob, std::string_view relativePath);

private:
    const EntryStore& store_;
};

} // namespace attachd::cache
