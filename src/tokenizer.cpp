#include "genko/token.h"
#include "genko/unicode.h"

namespace genko {

namespace {

/// True when text[i], text[i+1] are digits and neither neighbour is.
bool isIsolatedDigitPair(const std::u32string& text, size_t i) {
    size_t length = text.size();
    if (i + 1 >= length) return false;
    if (!isAsciiDigit(text[i]) || !isAsciiDigit(text[i + 1])) return false;
    if (i > 0 && isAsciiDigit(text[i - 1])) return false;
    if (i + 2 < length && isAsciiDigit(text[i + 2])) return false;
    return true;
}

} // anonymous namespace

std::vector<Token> tokenize(const std::u32string& text) {
    std::vector<Token> tokens;
    tokens.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        int start = static_cast<int>(i);

        if (text[i] == U'\n') {
            tokens.push_back({start, start + 1, text.substr(i, 1), TokenKind::Newline});
            i += 1;
            continue;
        }

        if (isIsolatedDigitPair(text, i)) {
            tokens.push_back({start, start + 2, text.substr(i, 2), TokenKind::TCY});
            i += 2;
            continue;
        }

        tokens.push_back({start, start + 1, text.substr(i, 1), TokenKind::Char});
        i += 1;
    }

    return tokens;
}

} // namespace genko
