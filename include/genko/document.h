#pragma once

#include "genko/history.h"
#include "genko/interaction.h"
#include "genko/layout.h"
#include "genko/page.h"
#include "genko/platform.h"
#include "genko/search.h"
#include "genko/style.h"
#include <memory>
#include <string>
#include <vector>

namespace genko {

/// Half-open range of buffer offsets
struct TextRange {
    int start = 0;
    int end = 0;

    bool empty() const { return start == end; }
    int length() const { return end - start; }
};

/// Cursor navigation keys. Columns run right to left, so Left moves to the
/// next column and Right to the previous one.
enum class NavigationKey {
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
};

/// One open manuscript: buffer, cursor/anchor, undo history and the derived
/// layout. Every mutation re-tokenizes and re-lays-out the whole buffer and
/// reports count / dirty / position changes to the host.
class Document {
public:
    explicit Document(std::shared_ptr<HostAdapter> host);
    ~Document();

    // -- Content ---------------------------------------------------------------

    /// Load text (UTF-8), resetting history and the saved snapshot
    void setPlainText(const std::string& utf8);
    void setText(const std::u32string& text);

    const std::u32string& text() const { return text_; }
    std::string plainText() const;
    int length() const { return static_cast<int>(text_.size()); }

    /// Non-newline character count
    int characterCount() const;

    // -- Modification state ------------------------------------------------------

    bool isModified() const { return modified_; }

    /// false: record the current text as saved. true: force the dirty flag.
    void setModified(bool modified);

    /// Record the current text as the saved snapshot
    void markSaved();

    bool isReadOnly() const { return readOnly_; }
    void setReadOnly(bool readOnly) { readOnly_ = readOnly; }

    // -- Editing -----------------------------------------------------------------
    // Editing operations return false when refused (read-only document)
    // or when there is nothing to do (empty insert, delete at a boundary).

    /// Replace [lo, hi) with `insert` (newlines normalized); collapses the
    /// selection after the inserted text
    bool replaceRange(int lo, int hi, const std::u32string& insert);

    bool replaceSelection(const std::u32string& insert);
    bool insertText(const std::u32string& insert);
    bool insertText(const std::string& utf8);
    bool insertNewline();

    /// Insert an ideographic space (U+3000)
    bool insertIndent();

    bool deleteBackward();
    bool deleteForward();

    /// Remove and return the selected text (empty if none)
    std::u32string cutSelection();

    // -- History -----------------------------------------------------------------

    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }
    const History& history() const { return history_; }

    // -- Cursor & selection ----------------------------------------------------

    int cursor() const { return cursor_; }
    int anchor() const { return anchor_; }

    /// Move the cursor to an offset (clamped); anchor follows unless kept
    void setCursor(int offset, bool keepAnchor = false);

    /// Move by whole columns / rows on the grid
    void moveVisual(int deltaCol, int deltaRow, bool keepAnchor);

    void navigate(NavigationKey key, bool keepAnchor);

    /// Mouse press at a viewport point; `extend` keeps the anchor (Shift)
    void clickAt(float x, float y, bool extend);

    void selectAll();
    void clearSelection();
    bool hasSelection() const { return cursor_ != anchor_; }
    TextRange selectedRange() const;
    std::u32string selectedText() const;

    /// 1-based page / column / cell of the cursor
    PagePosition currentPosition() const;

    // -- Search ------------------------------------------------------------------

    /// Search from the selection edge; selects the match on success
    SearchResult find(const std::u32string& pattern, const SearchOptions& options);

    // -- Input method ----------------------------------------------------------

    /// Update the composition overlay and insert any committed text
    void inputMethodEvent(const std::u32string& preedit, const std::u32string& commit);
    const std::u32string& preeditText() const { return preedit_; }
    std::vector<PreeditCell> preeditCells() const;

    /// Cursor rect in viewport coordinates (input-method candidate window)
    TextRect inputMethodCursorRect() const;

    // -- View configuration ------------------------------------------------------

    /// Change the grid (clamped to [8, 80]) and re-lay-out
    void setGrid(const GridSize& grid);
    const GridSize& grid() const { return grid_; }

    /// Change the body font (size clamped to [8, 64]); recomputes the cell size
    void setFont(const FontDescriptor& font);
    const FontDescriptor& font() const { return font_; }

    /// The host's viewport changed size
    void viewportResized();

    const ScrollOffset& scrollOffset() const { return scroll_; }
    void setScrollOffset(const ScrollOffset& offset);

    // -- Layout queries ----------------------------------------------------------

    const LayoutResult& layout() const { return interaction_.layout(); }
    const InteractionManager& interaction() const { return interaction_; }
    int totalPages() const { return interaction_.totalPages(); }

    /// Units visible in the current viewport, with selection flags
    std::vector<RenderCell> visibleCells() const;

    /// Selection rects in world coordinates
    std::vector<TextRect> selectionRects() const;

private:
    std::shared_ptr<HostAdapter> host_;
    std::u32string text_;
    int cursor_ = 0;
    int anchor_ = 0;
    bool modified_ = false;
    bool readOnly_ = false;
    std::u32string savedSnapshot_;
    std::u32string preedit_;
    History history_;

    GridSize grid_;
    FontDescriptor font_;
    ScrollOffset scroll_;
    InteractionManager interaction_;

    /// Set text/cursor/anchor, refresh dirty flag, push history, re-lay-out
    void applyEdit(std::u32string newText, int newCursor, int newAnchor);

    /// Restore a history snapshot
    void applyHistoryState(const HistoryEntry& entry);

    /// Full re-tokenize + re-layout, then reveal the cursor
    void rebuildLayout();

    void updateCellSize();
    ViewportSize viewport() const;

    /// Scroll to the cursor and report its position
    void cursorMoved();
    void ensureCursorVisible();
    void requestRepaint();
};

} // namespace genko
