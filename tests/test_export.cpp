#include <gtest/gtest.h>
#include "genko/document.h"
#include "genko/export.h"
#include <memory>
#include <string>
#include <vector>

using namespace genko;

namespace {

/// Host with fixed metrics; export never consults it
class StubHost : public HostAdapter {
public:
    FontMetrics resolveFontMetrics(const FontDescriptor& desc) override {
        return {desc.size, 0, 0};
    }
    ViewportSize viewportSize() override { return {640, 480}; }
};

struct DrawnGlyph {
    int page = 0;
    TextRect rect;
    CellGlyph glyph;
    float fontPx = 0;
};

/// Renderer that records every call
class RecordingRenderer : public PageRenderer {
public:
    bool accept = true;
    std::string title;
    int documents = 0;
    int finished = 0;
    std::vector<int> pages;
    std::vector<int> endedPages;
    int lines = 0;
    std::vector<DrawnGlyph> glyphs;

    bool beginDocument(const std::string& docTitle, float, float) override {
        title = docTitle;
        ++documents;
        return accept;
    }
    void beginPage(int pageIndex) override { pages.push_back(pageIndex); }
    void drawLine(float, float, float, float) override { ++lines; }
    void drawGlyph(const TextRect& rect, const CellGlyph& glyph, float fontPx) override {
        glyphs.push_back({pages.empty() ? -1 : pages.back(), rect, glyph, fontPx});
    }
    void endPage(int pageIndex) override { endedPages.push_back(pageIndex); }
    void endDocument() override { ++finished; }
};

} // anonymous namespace

// MARK: - Pagination

TEST(ExportTest, MatchesLiveLayoutAtSameGrid) {
    auto host = std::make_shared<StubHost>();
    Document doc(host);
    doc.setGrid(GridSize{20, 24});
    doc.setPlainText("「吾輩は猫である。」\n名前はまだ無い。12月" + std::string(2000, 'x'));

    ExportOptions options;
    ExportResult result = paginateForExport(doc.text(), options);
    LayoutResult live = layoutText(doc.text(), GridSize{40, 40});

    std::vector<LayoutUnit> exported;
    for (const auto& page : result.pages) {
        for (const auto& unit : page.units) {
            EXPECT_EQ(unit.page(40), page.pageIndex);
            exported.push_back(unit);
        }
    }
    EXPECT_EQ(exported, live.units);
    EXPECT_EQ(result.totalPages, live.contentPages());
    EXPECT_NE(doc.layout().units, live.units);
}

TEST(ExportTest, SplitsUnitsByPage) {
    ExportOptions options;
    ExportResult result = paginateForExport(std::u32string(1700, U'あ'), options);
    ASSERT_EQ(result.totalPages, 2);
    ASSERT_EQ(result.pages.size(), 2u);
    EXPECT_EQ(result.pages[0].units.size(), 1600u);
    EXPECT_EQ(result.pages[1].units.size(), 100u);
    EXPECT_EQ(result.characterCount, 1700);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(ExportTest, TrailingNewlineAddsNoPage) {
    ExportOptions options;
    ExportResult result = paginateForExport(std::u32string(1600, U'あ') + U"\n\n", options);
    EXPECT_EQ(result.totalPages, 1);
    EXPECT_EQ(result.pages.size(), 1u);
}

TEST(ExportTest, EmptyTextWarns) {
    ExportResult result = paginateForExport(U"", ExportOptions{});
    EXPECT_EQ(result.totalPages, 1);
    ASSERT_EQ(result.pages.size(), 1u);
    EXPECT_TRUE(result.pages[0].units.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], ExportWarning::EmptyContent);
}

TEST(ExportTest, GridIsClamped) {
    ExportOptions options;
    options.grid = GridSize{2, 200};
    ExportResult result = paginateForExport(U"あ\r\nい", options);
    EXPECT_EQ(result.grid, (GridSize{8, 80}));
    EXPECT_EQ(result.characterCount, 2);
}

// MARK: - Page geometry

TEST(ExportTest, CellRectsRunRightToLeft) {
    ExportOptions options;
    float cellW = 3508.0f / 40;
    float cellH = 2480.0f / 40;

    LayoutUnit first;
    TextRect rect = exportCellRect(first, options);
    EXPECT_FLOAT_EQ(rect.x, 39 * cellW);
    EXPECT_FLOAT_EQ(rect.y, 0.0f);
    EXPECT_FLOAT_EQ(rect.width, cellW);
    EXPECT_FLOAT_EQ(rect.height, cellH);

    LayoutUnit later;
    later.gcol = 41;        // page 1, second column
    later.row = 3;
    rect = exportCellRect(later, options);
    EXPECT_FLOAT_EQ(rect.x, 38 * cellW);
    EXPECT_FLOAT_EQ(rect.y, 3 * cellH);
}

TEST(ExportTest, FontSizes) {
    ExportOptions options;
    // Cell 87.7 x 62: 62 * 0.88 = 54.56
    EXPECT_FLOAT_EQ(exportFontPixelSize(options), 54.0f);
    EXPECT_FLOAT_EQ(exportTcyFontPixelSize(options), 43.0f);

    options.pageWidth = 100;
    options.pageHeight = 100;
    EXPECT_FLOAT_EQ(exportFontPixelSize(options), 16.0f);
    EXPECT_FLOAT_EQ(exportTcyFontPixelSize(options), 12.0f);
}

// MARK: - Rendering

TEST(ExportTest, RendersEveryPage) {
    ExportOptions options;
    options.title = "原稿";
    ExportResult result = paginateForExport(std::u32string(1600, U'あ') + U"12", options);
    ASSERT_EQ(result.totalPages, 2);

    RecordingRenderer renderer;
    EXPECT_TRUE(renderExport(result, options, renderer));

    EXPECT_EQ(renderer.title, "原稿");
    EXPECT_EQ(renderer.pages, (std::vector<int>{0, 1}));
    EXPECT_EQ(renderer.endedPages, (std::vector<int>{0, 1}));
    EXPECT_EQ(renderer.finished, 1);
    EXPECT_EQ(renderer.lines, 2 * (41 + 41));
    ASSERT_EQ(renderer.glyphs.size(), 1601u);

    const auto& tcy = renderer.glyphs.back();
    EXPECT_EQ(tcy.page, 1);
    EXPECT_EQ(tcy.glyph.orientation, GlyphOrientation::Horizontal);
    EXPECT_FLOAT_EQ(tcy.fontPx, 43.0f);
    EXPECT_FLOAT_EQ(renderer.glyphs.front().fontPx, 54.0f);
}

TEST(ExportTest, GridLinesOptional) {
    ExportOptions options;
    options.drawGrid = false;
    RecordingRenderer renderer;
    EXPECT_TRUE(renderExport(paginateForExport(U"あ", options), options, renderer));
    EXPECT_EQ(renderer.lines, 0);
    EXPECT_EQ(renderer.glyphs.size(), 1u);
}

TEST(ExportTest, RefusedDocumentFails) {
    ExportOptions options;
    RecordingRenderer renderer;
    renderer.accept = false;
    EXPECT_FALSE(renderExport(paginateForExport(U"あ", options), options, renderer));
    EXPECT_TRUE(renderer.pages.empty());
    EXPECT_EQ(renderer.finished, 0);
}
