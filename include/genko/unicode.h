#pragma once

#include <string>

namespace genko {

/// Decode UTF-8 into Unicode scalar values.
/// Invalid, overlong or truncated sequences decode to U+FFFD (one per bad
/// lead byte).
std::u32string decodeUtf8(const std::string& utf8);

/// Encode Unicode scalar values as UTF-8.
std::string encodeUtf8(const std::u32string& text);

/// Replace "\r\n" and lone "\r" with "\n".
std::u32string normalizeNewlines(const std::u32string& text);

/// Number of scalar values that are not line terminators ('\n' or '\r').
int countCharacters(const std::u32string& text);

inline bool isAsciiDigit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

inline bool isAsciiAlnum(char32_t c) {
    return isAsciiDigit(c) || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

/// Simple one-to-one lower-casing (ASCII, Latin-1, Greek, Cyrillic,
/// full-width Latin). Never changes the length of a string.
char32_t foldCase(char32_t c);
std::u32string foldCase(const std::u32string& text);

} // namespace genko
