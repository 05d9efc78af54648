#include "genko/unicode.h"

namespace genko {
namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// Smallest scalar value each sequence length may encode; anything lower is overlong
constexpr char32_t kMinScalarForLength[] = {0, 0, 0x80, 0x800, 0x10000};

// ---------------------------------------------------------------------------
// UTF-8 helpers
// ---------------------------------------------------------------------------

int utf8CharLen(unsigned char c) {
    if (c < 0x80) { return 1; }
    if (c == 0xC0 || c == 0xC1 || c >= 0xF5) { return 0; } // never valid leads
    if ((c & 0xE0) == 0xC0) { return 2; }
    if ((c & 0xF0) == 0xE0) { return 3; }
    if ((c & 0xF8) == 0xF0) { return 4; }
    return 0; // continuation byte or invalid lead
}

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // anonymous namespace

std::u32string decodeUtf8(const std::string& utf8) {
    std::u32string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        int len = utf8CharLen(c);
        if (len == 0 || i + len > utf8.size()) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        bool valid = true;
        for (int k = 1; k < len; ++k) {
            if (!isContinuation(static_cast<unsigned char>(utf8[i + k]))) {
                valid = false;
                break;
            }
        }
        if (!valid) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        char32_t cp = 0;
        if (len == 1) {
            cp = c;
        } else if (len == 2) {
            cp = ((c & 0x1F) << 6) | (utf8[i + 1] & 0x3F);
        } else if (len == 3) {
            cp = ((c & 0x0F) << 12) | ((utf8[i + 1] & 0x3F) << 6) | (utf8[i + 2] & 0x3F);
        } else {
            cp = ((c & 0x07) << 18) | ((utf8[i + 1] & 0x3F) << 12) |
                 ((utf8[i + 2] & 0x3F) << 6) | (utf8[i + 3] & 0x3F);
        }

        if (cp < kMinScalarForLength[len]) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        // Surrogates and out-of-range values are not scalar values
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = kReplacementChar;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encodeUtf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = kReplacementChar;
        }
        appendUtf8(out, cp);
    }
    return out;
}

std::u32string normalizeNewlines(const std::u32string& text) {
    std::u32string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == U'\r') {
            out.push_back(U'\n');
            if (i + 1 < text.size() && text[i + 1] == U'\n') {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

int countCharacters(const std::u32string& text) {
    int count = 0;
    for (char32_t c : text) {
        if (c != U'\n' && c != U'\r') {
            ++count;
        }
    }
    return count;
}

char32_t foldCase(char32_t c) {
    if (c < 0x80) {
        return (c >= U'A' && c <= U'Z') ? c + 0x20 : c;
    }
    // Latin-1 capitals (skipping U+00D7 MULTIPLICATION SIGN)
    if (c >= 0xC0 && c <= 0xDE && c != 0xD7) { return c + 0x20; }
    // Greek capitals (U+03A2 is unassigned)
    if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) { return c + 0x20; }
    // Cyrillic
    if (c >= 0x400 && c <= 0x40F) { return c + 0x50; }
    if (c >= 0x410 && c <= 0x42F) { return c + 0x20; }
    // Full-width Latin
    if (c >= 0xFF21 && c <= 0xFF3A) { return c + 0x20; }
    return c;
}

std::u32string foldCase(const std::u32string& text) {
    std::u32string out(text);
    for (auto& c : out) {
        c = foldCase(c);
    }
    return out;
}

} // namespace genko
