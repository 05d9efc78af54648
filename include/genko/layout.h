#pragma once

#include "genko/token.h"
#include "genko/style.h"
#include <string>
#include <vector>

namespace genko {

/// A grid coordinate: global manuscript column and row within it
struct CursorSlot {
    int gcol = 0;
    int row = 0;
};

inline bool operator==(const CursorSlot& a, const CursorSlot& b) {
    return a.gcol == b.gcol && a.row == b.row;
}

inline bool operator!=(const CursorSlot& a, const CursorSlot& b) {
    return !(a == b);
}

/// A non-newline token placed on the grid
struct LayoutUnit {
    int start = 0;
    int end = 0;
    std::u32string text;
    TokenKind kind = TokenKind::Char;
    int gcol = 0;           // Global column across all pages
    int row = 0;            // Cell within the column, [0, rows)

    int page(int cols) const { return gcol / cols; }
    int columnInPage(int cols) const { return gcol % cols; }
};

inline bool operator==(const LayoutUnit& a, const LayoutUnit& b) {
    return a.start == b.start && a.end == b.end && a.text == b.text &&
           a.kind == b.kind && a.gcol == b.gcol && a.row == b.row;
}

/// Result of laying out a whole buffer
struct LayoutResult {
    GridSize grid;
    std::vector<LayoutUnit> units;
    std::vector<CursorSlot> slots;  // One per offset in [0, len]
    int totalPages = 1;             // Pages spanned by units and slots

    /// Pages that hold at least one unit (never less than 1)
    int contentPages() const;

    /// Slot for an offset, clamped into the table
    CursorSlot slotAt(int offset) const;
};

namespace kinsoku {

/// Closing punctuation that must not open a column
bool isLineHeadProhibited(const std::u32string& text);

/// Opening brackets and quotes that must not end a column
bool isLineEndProhibited(const std::u32string& text);

} // namespace kinsoku

/// Lay out tokens of a buffer of the given length onto the grid.
/// Pure: identical inputs always produce identical results. rows and cols
/// below 1 are treated as 1; range validation belongs to GridSize::clamped.
LayoutResult layoutTokens(const std::vector<Token>& tokens,
                          int textLength,
                          const GridSize& grid);

/// Tokenize and lay out text in one step
LayoutResult layoutText(const std::u32string& text, const GridSize& grid);

} // namespace genko
