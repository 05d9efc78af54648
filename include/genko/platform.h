#pragma once

#include <string>

namespace genko {

/// Font descriptor for the manuscript body font
struct FontDescriptor {
    std::string family = "Serif";
    float size = 16.0f;     // Point size, clamped to [8, 64] by the document
};

/// Metrics for a resolved font
struct FontMetrics {
    float ascent = 0;       // Distance from baseline to top
    float descent = 0;      // Distance from baseline to bottom (positive)
    float leading = 0;      // Inter-line spacing recommended by font

    float lineHeight() const { return ascent + descent + leading; }
};

/// Visible area of the host's drawing surface, in pixels
struct ViewportSize {
    float width = 1;
    float height = 1;
};

/// Scroll position of the viewport over the page strip, in pixels
struct ScrollOffset {
    float x = 0;
    float y = 0;
};

/// 1-based cursor position reported to the status bar
struct PagePosition {
    int page = 1;
    int column = 1;
    int cell = 1;
};

inline bool operator==(const PagePosition& a, const PagePosition& b) {
    return a.page == b.page && a.column == b.column && a.cell == b.cell;
}

/// Abstract interface to the application hosting a document.
/// The host resolves fonts, reports its viewport and receives events;
/// event callbacks default to no-ops.
class HostAdapter {
public:
    virtual ~HostAdapter() = default;

    /// Resolve a font descriptor to metrics (drives the cell size)
    virtual FontMetrics resolveFontMetrics(const FontDescriptor& desc) = 0;

    /// Current viewport size of the editor surface
    virtual ViewportSize viewportSize() = 0;

    /// Non-newline character count changed
    virtual void characterCountChanged(int count) {}

    /// Dirty flag (text differs from last saved snapshot) changed or re-evaluated
    virtual void modificationChanged(bool modified) {}

    /// Cursor moved to a new page/column/cell
    virtual void cursorPositionChanged(const PagePosition& position) {}

    /// The viewport should scroll to the given offset to keep the cursor visible
    virtual void scrollRequested(const ScrollOffset& offset) {}

    /// Visible state changed; the surface should be repainted
    virtual void repaintRequested() {}
};

} // namespace genko
