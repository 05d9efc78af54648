#include "genko/export.h"
#include "genko/unicode.h"
#include "genko/log.h"
#include <algorithm>

namespace genko {

namespace {

constexpr float kExportGlyphScale = 0.88f;
constexpr float kExportTcyScale = 0.80f;
constexpr float kMinExportFontPx = 16.0f;
constexpr float kMinExportTcyFontPx = 8.0f;

float cellWidth(const ExportOptions& options) {
    return options.pageWidth / static_cast<float>(options.grid.clamped().cols);
}

float cellHeight(const ExportOptions& options) {
    return options.pageHeight / static_cast<float>(options.grid.clamped().rows);
}

void drawGridLines(const ExportOptions& options, PageRenderer& renderer) {
    GridSize grid = options.grid.clamped();
    float cw = cellWidth(options);
    float ch = cellHeight(options);
    float width = grid.cols * cw;
    float height = grid.rows * ch;

    for (int r = 0; r <= grid.rows; ++r) {
        float y = r * ch;
        renderer.drawLine(0, y, width, y);
    }
    for (int c = 0; c <= grid.cols; ++c) {
        float x = c * cw;
        renderer.drawLine(x, 0, x, height);
    }
}

} // anonymous namespace

ExportResult paginateForExport(const std::u32string& text, const ExportOptions& options) {
    std::u32string normalized = normalizeNewlines(text);
    GridSize grid = options.grid.clamped();
    LayoutResult layout = layoutText(normalized, grid);

    ExportResult result;
    result.grid = grid;
    result.totalPages = layout.contentPages();
    result.characterCount = countCharacters(normalized);
    if (normalized.empty()) {
        result.warnings.push_back(ExportWarning::EmptyContent);
    }

    result.pages.resize(result.totalPages);
    for (int i = 0; i < result.totalPages; ++i) {
        result.pages[i].pageIndex = i;
    }
    for (auto& unit : layout.units) {
        int pageIndex = std::clamp(unit.page(grid.cols), 0, result.totalPages - 1);
        result.pages[pageIndex].units.push_back(std::move(unit));
    }

    GK_LOGD("export: grid=%dx%d pages=%d chars=%d",
            grid.rows, grid.cols, result.totalPages, result.characterCount);
    return result;
}

TextRect exportCellRect(const LayoutUnit& unit, const ExportOptions& options) {
    GridSize grid = options.grid.clamped();
    float cw = cellWidth(options);
    float ch = cellHeight(options);
    int colInPage = unit.columnInPage(grid.cols);
    return {(grid.cols - 1 - colInPage) * cw, unit.row * ch, cw, ch};
}

float exportFontPixelSize(const ExportOptions& options) {
    float cell = std::min(cellWidth(options), cellHeight(options));
    return std::max(kMinExportFontPx, static_cast<float>(static_cast<int>(cell * kExportGlyphScale)));
}

float exportTcyFontPixelSize(const ExportOptions& options) {
    float base = exportFontPixelSize(options);
    return std::max(kMinExportTcyFontPx, static_cast<float>(static_cast<int>(base * kExportTcyScale)));
}

bool renderExport(const ExportResult& result,
                  const ExportOptions& options,
                  PageRenderer& renderer) {
    if (!renderer.beginDocument(options.title, options.pageWidth, options.pageHeight)) {
        GK_LOGW("export: renderer refused document '%s'", options.title.c_str());
        return false;
    }

    float basePx = exportFontPixelSize(options);
    float tcyPx = exportTcyFontPixelSize(options);

    for (const auto& page : result.pages) {
        renderer.beginPage(page.pageIndex);
        if (options.drawGrid) {
            drawGridLines(options, renderer);
        }
        for (const auto& unit : page.units) {
            CellGlyph glyph = resolveGlyph(unit);
            float px = (glyph.orientation == GlyphOrientation::Horizontal) ? tcyPx : basePx;
            renderer.drawGlyph(exportCellRect(unit, options), glyph, px);
        }
        renderer.endPage(page.pageIndex);
    }

    renderer.endDocument();
    return true;
}

} // namespace genko
