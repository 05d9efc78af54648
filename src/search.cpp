#include "genko/search.h"
#include "genko/unicode.h"
#include "genko/log.h"
#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace genko {

namespace {

static_assert(sizeof(wchar_t) == sizeof(char32_t),
              "regex search requires wchar_t to hold a full scalar value");

SearchResult matchAt(int start, int end) {
    SearchResult result;
    result.status = SearchStatus::Found;
    result.start = start;
    result.end = end;
    return result;
}

// ---------------------------------------------------------------------------
// Literal search
// ---------------------------------------------------------------------------

SearchResult findLiteral(const std::u32string& text,
                         const std::u32string& pattern,
                         size_t start,
                         const SearchOptions& options) {
    const std::u32string source = options.caseSensitive ? text : foldCase(text);
    const std::u32string needle = options.caseSensitive ? pattern : foldCase(pattern);
    const size_t n = needle.size();
    size_t idx = std::u32string::npos;

    if (options.forward) {
        idx = source.find(needle, start);
        if (idx == std::u32string::npos) {
            // Wrap: a match entirely before the start edge
            size_t first = source.find(needle);
            if (first != std::u32string::npos && first + n <= start) {
                idx = first;
            }
        }
    } else {
        if (start >= n) {
            idx = source.rfind(needle, start - n);
        }
        if (idx == std::u32string::npos) {
            // Wrap: the last match at or after the start edge
            size_t last = source.rfind(needle);
            if (last != std::u32string::npos && last >= start) {
                idx = last;
            }
        }
    }

    if (idx == std::u32string::npos) return {};
    return matchAt(static_cast<int>(idx), static_cast<int>(idx + n));
}

// ---------------------------------------------------------------------------
// Regex search
// ---------------------------------------------------------------------------

// libstdc++ matches recursively, one frame per consumed character, so the
// span handed to the matcher must stay short. Longer lines are skipped.
constexpr size_t kMaxRegexLineLength = 4096;

/// Case-insensitive matching through the same folding table as literal search
struct FoldingRegexTraits : std::regex_traits<wchar_t> {
    wchar_t translate_nocase(wchar_t c) const {
        return static_cast<wchar_t>(foldCase(static_cast<char32_t>(c)));
    }
};

using FoldingRegex = std::basic_regex<wchar_t, FoldingRegexTraits>;
using WIter = std::wstring::const_iterator;
using FoldingIterator = std::regex_iterator<WIter, wchar_t, FoldingRegexTraits>;

/// [begin, end) of one line, without its '\n'
struct LineRange {
    size_t begin = 0;
    size_t end = 0;

    size_t length() const { return end - begin; }
};

/// Part of a line handed to the matcher
struct Segment {
    LineRange line;
    size_t begin = 0;
    size_t end = 0;
};

std::vector<LineRange> splitLines(const std::u32string& text) {
    std::vector<LineRange> lines;
    size_t begin = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == U'\n') {
            lines.push_back({begin, i});
            begin = i + 1;
        }
    }
    lines.push_back({begin, text.size()});
    return lines;
}

/// Segments in search order. The line holding `start` is split at it; the
/// part on the far side of `start` is visited last (the wraparound).
std::vector<Segment> scanOrder(const std::vector<LineRange>& lines, size_t start, bool forward) {
    size_t home = 0;
    while (home + 1 < lines.size() && lines[home].end < start) {
        ++home;
    }
    const LineRange& homeLine = lines[home];
    Segment after{homeLine, start, homeLine.end};
    Segment before{homeLine, homeLine.begin, start};

    std::vector<Segment> order;
    order.reserve(lines.size() + 1);
    if (forward) {
        order.push_back(after);
        for (size_t i = home + 1; i < lines.size(); ++i) order.push_back({lines[i], lines[i].begin, lines[i].end});
        for (size_t i = 0; i < home; ++i) order.push_back({lines[i], lines[i].begin, lines[i].end});
        order.push_back(before);
    } else {
        order.push_back(before);
        for (size_t i = home; i-- > 0;) order.push_back({lines[i], lines[i].begin, lines[i].end});
        for (size_t i = lines.size(); i-- > home + 1;) order.push_back({lines[i], lines[i].begin, lines[i].end});
        order.push_back(after);
    }
    return order;
}

/// `^` and `$` only match at real line edges, not at a split point
std::regex_constants::match_flag_type segmentFlags(const Segment& segment) {
    auto flags = std::regex_constants::match_default;
    if (segment.begin > segment.line.begin) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (segment.end < segment.line.end) {
        flags |= std::regex_constants::match_not_eol;
    }
    return flags;
}

bool firstMatchIn(const std::wstring& wtext, const FoldingRegex& re, const Segment& segment,
                  int& outStart, int& outEnd) {
    const WIter origin = wtext.cbegin();
    std::match_results<WIter> m;
    if (!std::regex_search(origin + segment.begin, origin + segment.end, m, re,
                           segmentFlags(segment))) {
        return false;
    }
    outStart = static_cast<int>(std::distance(origin, m[0].first));
    outEnd = static_cast<int>(std::distance(origin, m[0].second));
    return true;
}

bool lastMatchIn(const std::wstring& wtext, const FoldingRegex& re, const Segment& segment,
                 int& outStart, int& outEnd) {
    const WIter origin = wtext.cbegin();
    bool found = false;
    for (FoldingIterator it(origin + segment.begin, origin + segment.end, re,
                            segmentFlags(segment)), end;
         it != end; ++it) {
        outStart = static_cast<int>(std::distance(origin, (*it)[0].first));
        outEnd = static_cast<int>(std::distance(origin, (*it)[0].second));
        found = true;
    }
    return found;
}

SearchResult findRegex(const std::u32string& text,
                       const std::u32string& pattern,
                       size_t start,
                       const SearchOptions& options) {
    const std::wstring wtext(text.begin(), text.end());
    const std::wstring wpattern(pattern.begin(), pattern.end());

    auto syntax = std::regex_constants::ECMAScript | std::regex_constants::multiline;
    if (!options.caseSensitive) {
        syntax |= std::regex_constants::icase;
    }

    FoldingRegex re;
    try {
        re.assign(wpattern, syntax);
    } catch (const std::regex_error& e) {
        GK_LOGW("search: invalid pattern '%s': %s", encodeUtf8(pattern).c_str(), e.what());
        SearchResult result;
        result.status = SearchStatus::InvalidPattern;
        result.error = e.what();
        return result;
    }

    const std::vector<LineRange> lines = splitLines(text);
    int lo = -1;
    int hi = -1;

    try {
        for (const auto& segment : scanOrder(lines, start, options.forward)) {
            if (segment.line.length() > kMaxRegexLineLength) continue;
            bool found = options.forward ? firstMatchIn(wtext, re, segment, lo, hi)
                                         : lastMatchIn(wtext, re, segment, lo, hi);
            if (found) return matchAt(lo, hi);
        }
    } catch (const std::regex_error& e) {
        // error_complexity / error_stack raised while matching
        GK_LOGW("search: matching aborted for '%s': %s", encodeUtf8(pattern).c_str(), e.what());
        SearchResult result;
        result.error = e.what();
        return result;
    }

    auto skippedLines = std::count_if(lines.begin(), lines.end(), [](const LineRange& line) {
        return line.length() > kMaxRegexLineLength;
    });

    SearchResult result;
    if (skippedLines > 0) {
        result.error = "regex search skipped " + std::to_string(skippedLines) +
                       " line(s) longer than " + std::to_string(kMaxRegexLineLength) +
                       " characters";
        GK_LOGW("search: %s", result.error.c_str());
    }
    return result;
}

} // anonymous namespace

SearchResult findInText(const std::u32string& text,
                        const std::u32string& pattern,
                        int selLo, int selHi,
                        const SearchOptions& options) {
    if (pattern.empty() || text.empty()) return {};

    const int length = static_cast<int>(text.size());
    int lo = std::clamp(std::min(selLo, selHi), 0, length);
    int hi = std::clamp(std::max(selLo, selHi), 0, length);
    size_t start = static_cast<size_t>(options.forward ? hi : lo);

    if (options.regex) {
        return findRegex(text, pattern, start, options);
    }
    return findLiteral(text, pattern, start, options);
}

} // namespace genko
