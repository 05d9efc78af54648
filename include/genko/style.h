#pragma once

#include "genko/platform.h"
#include <algorithm>

namespace genko {

/// Manuscript grid dimensions (cells per column, columns per page).
struct GridSize {
    static constexpr int kMin = 8;
    static constexpr int kMax = 80;

    int rows = 40;
    int cols = 40;

    /// Copy with both dimensions clamped to [kMin, kMax]
    GridSize clamped() const {
        return {std::clamp(rows, kMin, kMax), std::clamp(cols, kMin, kMax)};
    }
};

inline bool operator==(const GridSize& a, const GridSize& b) {
    return a.rows == b.rows && a.cols == b.cols;
}

inline bool operator!=(const GridSize& a, const GridSize& b) {
    return !(a == b);
}

/// Pixel metrics of the interactive page strip.
struct ViewMetrics {
    int cellSize = 36;      // Square cell edge
    int pageGap = 12;       // Horizontal gap between adjacent pages
    int outerMargin = 6;    // Margin around the whole strip

    /// Cell edge for a font: line height plus padding, never below 16px
    static int cellSizeFor(const FontMetrics& metrics) {
        return std::max(16, static_cast<int>(metrics.lineHeight()) + 8);
    }
};

/// Font sizes accepted by the editor, in points
constexpr float kMinFontSize = 8.0f;
constexpr float kMaxFontSize = 64.0f;

inline float clampFontSize(float size) {
    return std::clamp(size, kMinFontSize, kMaxFontSize);
}

/// Base glyph size relative to the cell (live view)
constexpr float kViewGlyphScale = 0.72f;
/// TCY glyph size relative to the cell (live view)
constexpr float kViewTcyScale = 0.58f;

} // namespace genko
