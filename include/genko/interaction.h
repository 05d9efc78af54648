#pragma once

#include "genko/layout.h"
#include "genko/page.h"
#include "genko/platform.h"
#include "genko/style.h"
#include <string>
#include <vector>

namespace genko {

/// Maximum scroll offsets for a viewport over the page strip
struct ScrollRange {
    float maxX = 0;
    float maxY = 0;
};

// ---------------------------------------------------------------------------
// InteractionManager: read-only geometry layer over a cached LayoutResult
// ---------------------------------------------------------------------------

/// Maps between buffer offsets, grid coordinates and pixels.
///
/// Pages are laid out as a horizontal strip with page 0 on the right;
/// within a page, column 0 is the rightmost column. All rectangles are in
/// world coordinates (the unscrolled strip) unless a method takes a
/// ScrollOffset, in which case results are relative to the viewport.
class InteractionManager {
public:
    InteractionManager() = default;

    /// Replace the cached layout (after every re-layout)
    void setLayoutResult(LayoutResult result);

    /// Update pixel metrics (after font or cell size changes)
    void setMetrics(const ViewMetrics& metrics);

    const LayoutResult& layout() const { return result_; }
    const ViewMetrics& metrics() const { return metrics_; }
    int totalPages() const { return result_.totalPages; }

    // -- Strip geometry -------------------------------------------------------

    float pageWidth() const;
    float pageHeight() const;

    /// Left edge of a page; page 0 is the rightmost page
    float pageOriginX(int page) const;

    /// Full rect of a page
    TextRect pageRect(int page) const;

    /// Size of the whole strip including outer margins
    float contentWidth() const;
    float contentHeight() const;

    ScrollRange scrollRange(const ViewportSize& viewport) const;

    // -- Offset → pixels ------------------------------------------------------

    /// Rect of a grid cell
    TextRect cellRect(int gcol, int row) const;

    /// Rect of the cell holding the cursor slot of an offset
    TextRect cursorRect(int offset) const;

    /// Cell rects of every unit overlapping [lo, hi)
    std::vector<TextRect> getRectsForRange(int lo, int hi) const;

    /// 1-based page / column / cell of an offset
    PagePosition positionAt(int offset) const;

    // -- Pixels → offset ------------------------------------------------------

    /// World point → grid coordinate (nearest page, right-to-left columns)
    CursorSlot pointToGrid(float worldX, float worldY) const;

    /// Offset whose slot is closest to (gcol, row). A column step weighs
    /// `rows` row steps; ties go to the lowest offset.
    int nearestOffset(int gcol, int row) const;

    /// Viewport point → nearest offset
    int hitTest(float x, float y, const ScrollOffset& scroll) const;

    // -- Rendering queries ----------------------------------------------------

    /// Units intersecting the viewport, in viewport coordinates, with
    /// selection state for [selLo, selHi)
    std::vector<RenderCell> visibleCells(const ScrollOffset& scroll,
                                         const ViewportSize& viewport,
                                         int selLo, int selHi) const;

    /// Cells for an uncommitted composition starting at an offset's slot
    std::vector<PreeditCell> preeditCells(int offset, const std::u32string& preedit) const;

    /// Scroll offset keeping the cursor cell of `offset` visible
    ScrollOffset scrollToReveal(int offset,
                                const ScrollOffset& current,
                                const ViewportSize& viewport) const;

private:
    LayoutResult result_;
    ViewMetrics metrics_;

    int rows() const { return result_.grid.rows; }
    int cols() const { return result_.grid.cols; }
};

} // namespace genko
