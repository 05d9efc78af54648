#pragma once

#include <string>
#include <vector>

namespace genko {

/// Token kinds produced by the tokenizer
enum class TokenKind {
    Char,       // A single scalar value occupying one cell
    Newline,    // '\n', ends the current column
    TCY,        // Two-digit tate-chu-yoko pair sharing one cell
};

/// A slice of the buffer. Tokens partition [0, len) with no gaps.
struct Token {
    int start = 0;          // Offset of the first scalar value
    int end = 0;            // One past the last scalar value
    std::u32string text;
    TokenKind kind = TokenKind::Char;

    int length() const { return end - start; }
};

/// Split text into Char / Newline / TCY tokens.
/// Only an isolated run of exactly two ASCII digits becomes a TCY token;
/// longer digit runs are emitted one Char per digit.
std::vector<Token> tokenize(const std::u32string& text);

} // namespace genko
