#include <attachd/cache/content_search.h>
#include <attachd/cache/path_guard.h>
#include <attachd/common/pattern_utils.h>
#include <attachd/common/utf8_utils.h>
#include <attachd/detection/binary_detector.h>

#include <spdlog/spdlog.h>
#include <boost/regex.hpp>

#include <deque>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace attachd::cache {

namespace {

struct PendingContext {
    std::size_t matchIndex;
    std::size_t remaining;
};

std::string cleanLine(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return common::isValidUtf8(line) ? line : common::sanitizeUtf8(line);
}

// Boost.Regex matches on a heap stack and throws once its state budget is spent, so a
// pathological pattern on a huge line costs one undecided line instead of the process.
bool lineMatches(const std::string& line, const boost::regex& re, bool& undecided) {
    try {
        return boost::regex_search(line, re);
    } catch (const std::runtime_error&) {
        undecided = true;
        return false;
    }
}

// Returns false if the file could not be opened.
bool searchFile(const fs::path& file, const std::string& relPath, const boost::regex& re,
                const SearchRequest& req, SearchResponse& out) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return false;
    }

    std::deque<std::string> before;
    std::vector<PendingContext> pending;
    std::string raw;
    std::size_t lineNo = 0;
    std::size_t undecidedLines = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = cleanLine(std::move(raw));

        for (auto& p : pending) {
            out.matches[p.matchIndex].contextAfter.push_back(line);
            --p.remaining;
        }
        std::erase_if(pending, [](const PendingContext& p) { return p.remaining == 0; });

        bool undecided = false;
        const bool matched = lineMatches(line, re, undecided);
        if (undecided) {
            ++undecidedLines;
        }
        if (matched) {
            ++out.totalMatches;
            if (out.matches.size() < req.maxResults) {
                SearchMatch m;
                m.path = relPath;
                m.line = lineNo;
                m.content = line;
                m.contextBefore.assign(before.begin(), before.end());
                out.matches.push_back(std::move(m));
                if (req.contextLines > 0) {
                    pending.push_back({out.matches.size() - 1, req.contextLines});
                }
            }
        }

        if (req.contextLines > 0) {
            before.push_back(std::move(line));
            if (before.size() > req.contextLines) {
                before.pop_front();
            }
        }
    }
    if (undecidedLines > 0) {
        spdlog::warn("Search in {}: pattern too complex for {} line(s), treated as no match",
                     relPath, undecidedLines);
    }
    return true;
}

} // namespace

nlohmann::json SearchMatch::toJson() const {
    return nlohmann::json{{"path", path},
                          {"line", line},
                          {"content", content},
                          {"context_before", contextBefore},
                          {"context_after", contextAfter}};
}

bool ContentSearchEngine::globSelects(std::string_view glob, std::string_view relativePath) {
    if (glob.empty()) {
        glob = "*";
    }
    if (glob.find('/') == std::string_view::npos) {
        return common::match_segment(common::basename_of(relativePath), glob);
    }
    return common::glob_match_path(relativePath, glob);
}

Result<SearchResponse> ContentSearchEngine::search(const AttachmentId& id,
                                                   const SearchRequest& request) const {
    boost::regex re;
    try {
        re = boost::regex(request.pattern, boost::regex::ECMAScript);
    } catch (const boost::regex_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid regex '" + request.pattern + "': " + e.what()};
    }

    auto root = store_.listingRoot(id);
    if (!root) {
        return root.error();
    }
    auto tree = collectTree(root.value());
    if (!tree) {
        return tree.error();
    }

    SearchResponse response;
    for (const auto& info : tree.value()) {
        if (info.isDirectory || !globSelects(request.glob, info.path)) {
            continue;
        }
        const fs::path file = root.value() / info.path;
        auto binary = detection::isBinaryFile(file);
        if (!binary || binary.value()) {
            continue;
        }
        if (searchFile(file, info.path, re, request, response)) {
            ++response.filesSearched;
        }
    }
    response.truncated = response.totalMatches > response.matches.size();
    return response;
}

} // namespace attachd::cache
