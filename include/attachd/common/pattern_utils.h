#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace attachd::common {

/**
 * Match a single path segment against a glob segment:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty)
 *  - '[abc]', '[a-z]' and '[!a]' / '[^a]' character classes
 *
 * Case-sensitive. Iterative star backtracking (no recursion).
 */
[[nodiscard]] inline bool match_segment(std::string_view text, std::string_view pattern) noexcept {
    // Returns the length of the class expression starting at pattern[p] ('['), or 0 if the
    // bracket is not terminated (treated as a literal '[').
    auto classLength = [&](size_t p) -> size_t {
        size_t q = p + 1;
        if (q < pattern.size() && (pattern[q] == '!' || pattern[q] == '^'))
            ++q;
        if (q < pattern.size() && pattern[q] == ']')
            ++q;
        while (q < pattern.size() && pattern[q] != ']')
            ++q;
        return q < pattern.size() ? q - p + 1 : 0;
    };

    auto classMatches = [&](size_t p, size_t len, char c) {
        size_t q = p + 1;
        const size_t end = p + len - 1;
        bool negate = false;
        if (pattern[q] == '!' || pattern[q] == '^') {
            negate = true;
            ++q;
        }
        bool found = false;
        bool first = true;
        while (q < end) {
            if (pattern[q] == ']' && !first)
                break;
            first = false;
            if (q + 2 < end && pattern[q + 1] == '-') {
                if (c >= pattern[q] && c <= pattern[q + 2])
                    found = true;
                q += 3;
            } else {
                if (c == pattern[q])
                    found = true;
                ++q;
            }
        }
        return found != negate;
    };

    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
            continue;
        }
        if (p < pattern.size()) {
            if (pattern[p] == '[') {
                if (size_t len = classLength(p); len > 0) {
                    if (classMatches(p, len, text[t])) {
                        ++t;
                        p += len;
                        continue;
                    }
                } else if (text[t] == '[') {
                    ++t;
                    ++p;
                    continue;
                }
            } else if (pattern[p] == '?' || pattern[p] == text[t]) {
                ++t;
                ++p;
                continue;
            }
        }
        if (starPos == std::string_view::npos)
            return false;
        p = starPos + 1;
        t = ++matchPos;
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

/**
 * Returns true if the pattern contains any wildcard metacharacters.
 */
[[nodiscard]] inline constexpr bool has_wildcards(std::string_view pattern) noexcept {
    for (char c : pattern) {
        if (c == '*' || c == '?' || c == '[')
            return true;
    }
    return false;
}

/**
 * Normalize separators to '/', collapse repeated slashes, drop "./" segments and a
 * trailing slash. "/" is preserved.
 */
[[nodiscard]] inline std::string normalize_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '\\')
            c = '/';
        if (c == '/' && !out.empty() && out.back() == '/')
            continue;
        out.push_back(c);
    }
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/')
        out.erase(0, 2);
    std::string::size_type pos;
    while ((pos = out.find("/./")) != std::string::npos)
        out.erase(pos, 2);
    if (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

/**
 * Split a normalized path into its non-empty '/' separated segments.
 */
[[nodiscard]] inline std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        auto token = pos == std::string_view::npos ? path.substr(start)
                                                   : path.substr(start, pos - start);
        if (!token.empty())
            out.push_back(token);
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

/**
 * Path glob match. Segments are matched with match_segment(); a segment that is exactly
 * "**" matches zero or more whole path segments, so "**\/*.log" matches both "a.log" and
 * "logs/debug.log" while "*.log" only matches top-level names.
 */
[[nodiscard]] inline bool glob_match_path(std::string_view path, std::string_view pattern) {
    const std::string normPath = normalize_path(path);
    const std::string normPattern = normalize_path(pattern);
    const auto text = split_segments(normPath);
    const auto pat = split_segments(normPattern);

    // dp[i][j]: pat[i..] matches text[j..]
    const size_t n = pat.size();
    const size_t m = text.size();
    std::vector<std::vector<char>> dp(n + 1, std::vector<char>(m + 1, 0));
    dp[n][m] = 1;
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m + 1; j-- > 0;) {
            if (pat[i] == "**") {
                dp[i][j] = dp[i + 1][j] || (j < m && dp[i][j + 1]);
            } else {
                dp[i][j] = j < m && dp[i + 1][j + 1] && match_segment(text[j], pat[i]);
            }
        }
    }
    return dp[0][0] != 0;
}

/**
 * Last path segment of a '/' separated path.
 */
[[nodiscard]] inline std::string_view basename_of(std::string_view path) noexcept {
    auto pos = path.find_last_of('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

/**
 * Case-insensitive suffix test.
 */
[[nodiscard]] inline bool iends_with(std::string_view s, std::string_view suffix) noexcept {
    if (s.size() < suffix.size())
        return false;
    return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace attachd::common
