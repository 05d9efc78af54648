#pragma once

#include "genko/layout.h"
#include "genko/page.h"
#include "genko/style.h"
#include <string>
#include <vector>

namespace genko {

/// Fixed-grid export configuration, independent of the live view
struct ExportOptions {
    GridSize grid{40, 40};
    float pageWidth = 3508.0f;     // A4 landscape at 300 dpi
    float pageHeight = 2480.0f;
    bool drawGrid = true;
    std::string title;
};

/// Warning types that may occur during export
enum class ExportWarning {
    None,
    EmptyContent,
};

/// Result of paginating a manuscript for print
struct ExportResult {
    GridSize grid;
    std::vector<PageUnits> pages;
    int totalPages = 1;
    int characterCount = 0;
    std::vector<ExportWarning> warnings;
};

/// Abstract print surface (e.g. a PDF writer) driven by renderExport().
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    /// Start the output; returning false aborts the export
    virtual bool beginDocument(const std::string& title, float pageWidth, float pageHeight) = 0;

    /// Start a page; the page background is the renderer's choice
    virtual void beginPage(int pageIndex) = 0;

    virtual void drawLine(float x1, float y1, float x2, float y2) = 0;

    /// Draw a glyph centred in `rect` with the given font pixel size
    virtual void drawGlyph(const TextRect& rect, const CellGlyph& glyph, float fontPixelSize) = 0;

    virtual void endPage(int pageIndex) = 0;
    virtual void endDocument() = 0;
};

/// Lay out text on the export grid and split units into pages.
/// Uses the same layout function as the live view.
ExportResult paginateForExport(const std::u32string& text, const ExportOptions& options);

/// Cell rect of a unit on an export page of the given size
TextRect exportCellRect(const LayoutUnit& unit, const ExportOptions& options);

/// Base and TCY font pixel sizes for an export page
float exportFontPixelSize(const ExportOptions& options);
float exportTcyFontPixelSize(const ExportOptions& options);

/// Draw every page of `result` through `renderer`.
/// Returns false when the renderer refuses to begin the document.
bool renderExport(const ExportResult& result,
                  const ExportOptions& options,
                  PageRenderer& renderer);

} // namespace genko
