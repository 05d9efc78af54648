#pragma once

#include <string>

namespace genko {

/// Search parameters
struct SearchOptions {
    bool forward = true;
    bool regex = false;            // ECMAScript grammar, multiline anchors
    bool caseSensitive = false;
};

enum class SearchStatus {
    Found,
    NotFound,
    InvalidPattern,     // Regex failed to compile; see SearchResult::error
};

/// Outcome of a search. On Found, [start, end) is the match.
struct SearchResult {
    SearchStatus status = SearchStatus::NotFound;
    int start = -1;
    int end = -1;
    std::string error;      // Regex engine message for InvalidPattern

    bool found() const { return status == SearchStatus::Found; }
};

/// Find `pattern` in `text` relative to the selection [selLo, selHi).
///
/// Forward searches start at the selection's upper edge, backward ones at its
/// lower edge. When nothing matches before the buffer boundary the search
/// wraps around once over the remaining part of the buffer. An empty pattern
/// or empty text never matches.
///
/// Regex matches are confined to a single line. Lines longer than 4096
/// characters are not regex-searched; when nothing else matches the result
/// is NotFound with `error` naming the skipped lines.
SearchResult findInText(const std::u32string& text,
                        const std::u32string& pattern,
                        int selLo, int selHi,
                        const SearchOptions& options);

} // namespace genko
