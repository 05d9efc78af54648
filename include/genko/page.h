#pragma once

#include "genko/layout.h"
#include <string>
#include <vector>

namespace genko {

/// A rectangle in pixel coordinates (origin = top-left)
struct TextRect {
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + width; }
    float bottom() const { return y + height; }
    bool contains(float px, float py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }
};

inline bool operator==(const TextRect& a, const TextRect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

/// How a glyph sits inside its cell
enum class GlyphOrientation {
    Upright,        // Drawn as-is (CJK, vertical presentation forms)
    Rotated,        // Rotated 90 degrees clockwise (single Latin letter/digit)
    Horizontal,     // Set horizontally at reduced size (tate-chu-yoko)
};

/// Rendering instruction for one cell
struct CellGlyph {
    std::u32string text;            // Text to draw, after vertical substitution
    GlyphOrientation orientation = GlyphOrientation::Upright;
    float boxScale = 1.0f;          // Fraction of the cell used as draw box
};

/// Resolve the glyph drawn for a unit. Shared by the live view and export,
/// so both paths draw identical cells.
CellGlyph resolveGlyph(const std::u32string& text, TokenKind kind);

inline CellGlyph resolveGlyph(const LayoutUnit& unit) {
    return resolveGlyph(unit.text, unit.kind);
}

/// Vertical presentation form for a scalar value, or the value itself
char32_t verticalForm(char32_t c);

/// A unit positioned in pixel space for the live renderer
struct RenderCell {
    LayoutUnit unit;
    TextRect rect;
    CellGlyph glyph;
    bool selected = false;
};

/// One scalar value of an uncommitted input-method composition
struct PreeditCell {
    char32_t ch = 0;
    CursorSlot slot;
    TextRect rect;
    CellGlyph glyph;
};

/// Units of one page of a paginated layout
struct PageUnits {
    int pageIndex = 0;
    std::vector<LayoutUnit> units;
};

} // namespace genko
