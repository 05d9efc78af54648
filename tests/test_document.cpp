#include <gtest/gtest.h>
#include "genko/document.h"
#include <memory>
#include <vector>

using namespace genko;

/// Mock host that records every event
class MockHost : public HostAdapter {
public:
    ViewportSize viewport{800, 600};
    std::vector<int> counts;
    std::vector<bool> modifications;
    std::vector<PagePosition> positions;
    std::vector<ScrollOffset> scrolls;
    int repaints = 0;

    FontMetrics resolveFontMetrics(const FontDescriptor& desc) override {
        FontMetrics m;
        m.ascent = desc.size * 0.8f;
        m.descent = desc.size * 0.2f;
        m.leading = desc.size * 0.1f;
        return m;
    }

    ViewportSize viewportSize() override { return viewport; }

    void characterCountChanged(int count) override { counts.push_back(count); }
    void modificationChanged(bool modified) override { modifications.push_back(modified); }
    void cursorPositionChanged(const PagePosition& position) override { positions.push_back(position); }
    void scrollRequested(const ScrollOffset& offset) override { scrolls.push_back(offset); }
    void repaintRequested() override { ++repaints; }

    void clear() {
        counts.clear();
        modifications.clear();
        positions.clear();
        scrolls.clear();
        repaints = 0;
    }
};

class DocumentTest : public ::testing::Test {
protected:
    std::shared_ptr<MockHost> host = std::make_shared<MockHost>();
    Document doc{host};
};

// MARK: - Content

TEST_F(DocumentTest, LoadResetsState) {
    doc.setPlainText("あい\r\nう");
    EXPECT_EQ(doc.text(), U"あい\nう");
    EXPECT_EQ(doc.length(), 4);
    EXPECT_EQ(doc.characterCount(), 3);
    EXPECT_FALSE(doc.isModified());
    EXPECT_FALSE(doc.canUndo());
    ASSERT_FALSE(host->counts.empty());
    EXPECT_EQ(host->counts.back(), 3);
    EXPECT_FALSE(host->modifications.back());
    EXPECT_EQ(doc.plainText(), "あい\nう");
}

TEST_F(DocumentTest, CellSizeFollowsFont) {
    // 16pt: line height 17.6 -> 17 + 8
    EXPECT_EQ(doc.interaction().metrics().cellSize, 25);

    FontDescriptor font;
    font.size = 200;
    doc.setFont(font);
    EXPECT_FLOAT_EQ(doc.font().size, 64.0f);
    EXPECT_EQ(doc.interaction().metrics().cellSize, 78);
}

// MARK: - Editing and history

TEST_F(DocumentTest, ReplaceRangeThenUndoRestoresState) {
    doc.setPlainText("あいう");
    ASSERT_TRUE(doc.replaceRange(0, 1, U"X"));
    std::u32string text = doc.text();
    int cursor = doc.cursor();
    int anchor = doc.anchor();

    ASSERT_TRUE(doc.replaceRange(1, 2, U"YZ\r\n"));
    EXPECT_EQ(doc.text(), U"XYZ\nう");
    EXPECT_EQ(doc.cursor(), 4);
    EXPECT_EQ(doc.anchor(), 4);

    ASSERT_TRUE(doc.undo());
    EXPECT_EQ(doc.text(), text);
    EXPECT_EQ(doc.cursor(), cursor);
    EXPECT_EQ(doc.anchor(), anchor);

    ASSERT_TRUE(doc.redo());
    EXPECT_EQ(doc.text(), U"XYZ\nう");
}

TEST_F(DocumentTest, ReplaceRangeOrdersAndClampsBounds) {
    doc.setPlainText("abc");
    ASSERT_TRUE(doc.replaceRange(99, 1, U"!"));
    EXPECT_EQ(doc.text(), U"a!");
    EXPECT_EQ(doc.cursor(), 2);
}

TEST_F(DocumentTest, NoOpEditIsNotRecorded) {
    doc.setPlainText("abc");
    doc.replaceRange(0, 0, U"");
    EXPECT_FALSE(doc.canUndo());
}

TEST_F(DocumentTest, EditAfterUndoDropsRedo) {
    doc.setPlainText("");
    doc.insertText(U"a");
    doc.insertText(U"b");
    doc.undo();
    EXPECT_TRUE(doc.canRedo());
    doc.insertText(U"c");
    EXPECT_FALSE(doc.canRedo());
    EXPECT_EQ(doc.text(), U"ac");
}

TEST_F(DocumentTest, DirtyFlagComparesWithSavedText) {
    doc.setPlainText("a");
    doc.setCursor(1);
    doc.insertText(U"b");
    EXPECT_TRUE(doc.isModified());

    doc.undo();
    EXPECT_EQ(doc.text(), U"a");
    EXPECT_FALSE(doc.isModified());

    doc.redo();
    doc.markSaved();
    EXPECT_FALSE(doc.isModified());
    doc.undo();
    EXPECT_TRUE(doc.isModified());

    doc.setModified(true);
    EXPECT_TRUE(doc.isModified());
}

TEST_F(DocumentTest, DeleteAtBoundariesIsRefused) {
    doc.setPlainText("ab");
    EXPECT_FALSE(doc.deleteBackward());
    doc.setCursor(2);
    EXPECT_FALSE(doc.deleteForward());

    EXPECT_TRUE(doc.deleteBackward());
    EXPECT_EQ(doc.text(), U"a");
    doc.setCursor(0);
    EXPECT_TRUE(doc.deleteForward());
    EXPECT_EQ(doc.text(), U"");
}

TEST_F(DocumentTest, DeleteRemovesSelection) {
    doc.setPlainText("abcd");
    doc.setCursor(1);
    doc.setCursor(3, true);
    EXPECT_TRUE(doc.deleteForward());
    EXPECT_EQ(doc.text(), U"ad");
    EXPECT_EQ(doc.cursor(), 1);
}

TEST_F(DocumentTest, IndentAndNewline) {
    doc.setPlainText("あ");
    host->clear();
    doc.setCursor(0);
    ASSERT_TRUE(doc.insertIndent());
    EXPECT_EQ(doc.text()[0], char32_t(0x3000));
    EXPECT_EQ(host->counts, (std::vector<int>{2}));

    // Newlines do not change the character count
    ASSERT_TRUE(doc.insertNewline());
    EXPECT_EQ(host->counts.size(), 1u);
    EXPECT_EQ(doc.text(), U"　\nあ");
}

TEST_F(DocumentTest, CutSelection) {
    doc.setPlainText("原稿用紙");
    doc.selectAll();
    EXPECT_EQ(doc.selectedText(), U"原稿用紙");
    EXPECT_EQ(doc.cutSelection(), U"原稿用紙");
    EXPECT_EQ(doc.text(), U"");
    EXPECT_EQ(doc.cutSelection(), U"");
}

TEST_F(DocumentTest, ReadOnlyRefusesEdits) {
    doc.setPlainText("abc");
    doc.setReadOnly(true);
    EXPECT_FALSE(doc.insertText(U"x"));
    EXPECT_FALSE(doc.deleteBackward());
    doc.selectAll();
    EXPECT_EQ(doc.cutSelection(), U"");
    doc.inputMethodEvent(U"か", U"かな");
    EXPECT_EQ(doc.text(), U"abc");
    EXPECT_TRUE(doc.preeditText().empty());
    EXPECT_FALSE(doc.canUndo());
}

// MARK: - Events

TEST_F(DocumentTest, EditEmitsEvents) {
    doc.setPlainText("あ");
    host->clear();

    doc.setCursor(1);
    EXPECT_TRUE(host->counts.empty());
    ASSERT_EQ(host->positions.size(), 1u);
    EXPECT_EQ(host->positions.back(), (PagePosition{1, 1, 2}));

    doc.insertText(std::string("い"));
    EXPECT_EQ(host->counts, (std::vector<int>{2}));
    EXPECT_TRUE(host->modifications.back());
    EXPECT_EQ(host->positions.back(), (PagePosition{1, 1, 3}));
    EXPECT_GT(host->repaints, 0);
}

TEST_F(DocumentTest, CursorMoveScrollsIntoView) {
    // Initial load reveals offset 0 on the rightmost page edge
    EXPECT_GT(doc.scrollOffset().x, 0.0f);
    host->clear();

    std::u32string text(1700, U'あ');
    doc.setText(text);
    doc.setCursor(1650);
    ASSERT_FALSE(host->scrolls.empty());
    EXPECT_FLOAT_EQ(host->scrolls.back().x, doc.scrollOffset().x);

    TextRect rect = doc.inputMethodCursorRect();
    EXPECT_GE(rect.x, 0.0f);
    EXPECT_LE(rect.right(), host->viewport.width);
}

// MARK: - Navigation

TEST_F(DocumentTest, NavigationKeys) {
    doc.setPlainText("あ\nい");

    doc.navigate(NavigationKey::Left, false);
    EXPECT_EQ(doc.cursor(), 2);
    doc.navigate(NavigationKey::Down, false);
    EXPECT_EQ(doc.cursor(), 3);
    doc.navigate(NavigationKey::Right, false);
    EXPECT_EQ(doc.cursor(), 1);
    doc.navigate(NavigationKey::Up, false);
    EXPECT_EQ(doc.cursor(), 0);
    doc.navigate(NavigationKey::Up, false);
    EXPECT_EQ(doc.cursor(), 0);

    doc.navigate(NavigationKey::End, true);
    EXPECT_EQ(doc.cursor(), 3);
    EXPECT_EQ(doc.anchor(), 0);
    EXPECT_TRUE(doc.hasSelection());

    doc.navigate(NavigationKey::Home, false);
    EXPECT_EQ(doc.cursor(), 0);
    EXPECT_FALSE(doc.hasSelection());
}

TEST_F(DocumentTest, ClickPlacesCursor) {
    doc.setPlainText("あいうえ");
    ScrollOffset scroll = doc.scrollOffset();
    TextRect cell = doc.interaction().cellRect(0, 2);

    doc.clickAt(cell.x - scroll.x + 2, cell.y - scroll.y + 2, false);
    EXPECT_EQ(doc.cursor(), 2);

    cell = doc.interaction().cellRect(0, 4);
    scroll = doc.scrollOffset();
    doc.clickAt(cell.x - scroll.x + 2, cell.y - scroll.y + 2, true);
    EXPECT_EQ(doc.cursor(), 4);
    EXPECT_EQ(doc.anchor(), 2);
    EXPECT_EQ(doc.selectionRects().size(), 2u);
}

TEST_F(DocumentTest, SetCursorClamps) {
    doc.setPlainText("ab");
    doc.setCursor(50);
    EXPECT_EQ(doc.cursor(), 2);
    doc.setCursor(-4);
    EXPECT_EQ(doc.cursor(), 0);
}

// MARK: - Grid configuration

TEST_F(DocumentTest, GridIsClamped) {
    doc.setGrid(GridSize{4, 100});
    EXPECT_EQ(doc.grid(), (GridSize{8, 80}));
    EXPECT_EQ(doc.layout().grid, (GridSize{8, 80}));
}

TEST_F(DocumentTest, GridChangeRelaysOut) {
    doc.setPlainText(std::string(30 * 3, 'a'));
    EXPECT_EQ(doc.totalPages(), 1);
    doc.setGrid(GridSize{8, 8});
    // 90 cells at 64 per page
    EXPECT_EQ(doc.totalPages(), 2);
}

// MARK: - Search

TEST_F(DocumentTest, FindSelectsAndWraps) {
    doc.setPlainText("foo bar foo");
    auto result = doc.find(U"foo", SearchOptions{});
    ASSERT_TRUE(result.found());
    EXPECT_EQ(doc.selectedRange().start, 0);
    EXPECT_EQ(doc.selectedRange().end, 3);

    doc.find(U"foo", SearchOptions{});
    EXPECT_EQ(doc.selectedRange().start, 8);

    doc.find(U"foo", SearchOptions{});
    EXPECT_EQ(doc.selectedRange().start, 0);
    EXPECT_FALSE(doc.isModified());
}

TEST_F(DocumentTest, FindInvalidRegexKeepsSelection) {
    doc.setPlainText("abc");
    doc.setCursor(1);
    SearchOptions options;
    options.regex = true;
    auto result = doc.find(U"[", options);
    EXPECT_EQ(result.status, SearchStatus::InvalidPattern);
    EXPECT_EQ(doc.cursor(), 1);
    EXPECT_FALSE(doc.hasSelection());
}

// MARK: - Input method

TEST_F(DocumentTest, PreeditThenCommit) {
    doc.setPlainText("あ");
    doc.setCursor(1);

    doc.inputMethodEvent(U"か", U"");
    EXPECT_EQ(doc.preeditText(), U"か");
    EXPECT_EQ(doc.text(), U"あ");
    ASSERT_EQ(doc.preeditCells().size(), 1u);
    EXPECT_EQ(doc.preeditCells()[0].slot, (CursorSlot{0, 1}));

    doc.inputMethodEvent(U"", U"かな");
    EXPECT_TRUE(doc.preeditText().empty());
    EXPECT_EQ(doc.text(), U"あかな");
    EXPECT_EQ(doc.cursor(), 3);
}

TEST_F(DocumentTest, EditClearsPreedit) {
    doc.inputMethodEvent(U"か", U"");
    doc.insertText(U"x");
    EXPECT_TRUE(doc.preeditText().empty());
}

// MARK: - Rendering

TEST_F(DocumentTest, VisibleCellsCarrySelection) {
    doc.setPlainText("あい");
    doc.selectAll();
    auto cells = doc.visibleCells();
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_TRUE(cells[0].selected);
    EXPECT_TRUE(cells[1].selected);

    doc.clearSelection();
    cells = doc.visibleCells();
    EXPECT_FALSE(cells[0].selected);
}
