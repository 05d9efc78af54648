#include "genko/layout.h"
#include <algorithm>

namespace genko {

// ---------------------------------------------------------------------------
// LayoutResult
// ---------------------------------------------------------------------------

int LayoutResult::contentPages() const {
    int maxCol = 0;
    for (const auto& unit : units) {
        maxCol = std::max(maxCol, unit.gcol);
    }
    return std::max(1, maxCol / std::max(1, grid.cols) + 1);
}

CursorSlot LayoutResult::slotAt(int offset) const {
    if (slots.empty()) { return {}; }
    int idx = std::clamp(offset, 0, static_cast<int>(slots.size()) - 1);
    return slots[idx];
}

// ---------------------------------------------------------------------------
// layoutTokens: single forward pass with one-unit lookbehind
// ---------------------------------------------------------------------------

LayoutResult layoutTokens(const std::vector<Token>& tokens,
                          int textLength,
                          const GridSize& grid) {
    const int rows = std::max(1, grid.rows);
    const int cols = std::max(1, grid.cols);

    LayoutResult result;
    result.grid = {rows, cols};
    result.slots.assign(static_cast<size_t>(std::max(0, textLength)) + 1, CursorSlot{});
    result.units.reserve(tokens.size());

    int gcol = 0;
    int row = 0;

    for (const auto& token : tokens) {
        result.slots[token.start] = {gcol, row};

        if (token.kind == TokenKind::Newline) {
            gcol += 1;
            row = 0;
            result.slots[token.end] = {gcol, row};
            continue;
        }

        // Opening bracket on the last row: move it to the next column
        if (row == rows - 1 && kinsoku::isLineEndProhibited(token.text)) {
            gcol += 1;
            row = 0;
        }

        // Closing punctuation at a column head: pull the previous unit along.
        // A one-row column has no room for the pair.
        if (rows > 1 && row == 0 && kinsoku::isLineHeadProhibited(token.text) &&
            !result.units.empty()) {
            auto& prev = result.units.back();
            if (prev.gcol == gcol - 1 && prev.row == rows - 1) {
                prev.gcol = gcol;
                prev.row = 0;
                row = 1;
            }
        }

        for (int mid = token.start + 1; mid < token.end; ++mid) {
            result.slots[mid] = {gcol, row};
        }

        result.units.push_back({token.start, token.end, token.text, token.kind, gcol, row});

        row += 1;
        if (row >= rows) {
            row = 0;
            gcol += 1;
        }

        result.slots[token.end] = {gcol, row};
    }

    int maxCol = 0;
    for (const auto& unit : result.units) {
        maxCol = std::max(maxCol, unit.gcol);
    }
    for (const auto& slot : result.slots) {
        maxCol = std::max(maxCol, slot.gcol);
    }
    result.totalPages = std::max(1, maxCol / cols + 1);

    return result;
}

LayoutResult layoutText(const std::u32string& text, const GridSize& grid) {
    return layoutTokens(tokenize(text), static_cast<int>(text.size()), grid);
}

} // namespace genko
