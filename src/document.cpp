#include "genko/document.h"
#include "genko/unicode.h"
#include "genko/log.h"
#include <algorithm>

namespace genko {

namespace {

constexpr char32_t kIdeographicSpace = 0x3000;

} // anonymous namespace

Document::Document(std::shared_ptr<HostAdapter> host)
    : host_(std::move(host)) {
    updateCellSize();
    rebuildLayout();
}

Document::~Document() = default;

// ---------------------------------------------------------------------------
// Content
// ---------------------------------------------------------------------------

void Document::setPlainText(const std::string& utf8) {
    setText(decodeUtf8(utf8));
}

void Document::setText(const std::u32string& text) {
    text_ = normalizeNewlines(text);
    cursor_ = std::min(cursor_, length());
    anchor_ = cursor_;
    modified_ = false;
    savedSnapshot_ = text_;
    history_.reset({text_, cursor_, anchor_});
    preedit_.clear();

    GK_LOGI("setText: %d scalars, %d characters", length(), characterCount());

    rebuildLayout();
    if (host_) {
        host_->modificationChanged(false);
        host_->characterCountChanged(characterCount());
    }
}

std::string Document::plainText() const {
    return encodeUtf8(text_);
}

int Document::characterCount() const {
    return countCharacters(text_);
}

// ---------------------------------------------------------------------------
// Modification state
// ---------------------------------------------------------------------------

void Document::setModified(bool modified) {
    modified_ = modified;
    if (!modified_) {
        savedSnapshot_ = text_;
    }
    if (host_) host_->modificationChanged(modified_);
}

void Document::markSaved() {
    setModified(false);
}

// ---------------------------------------------------------------------------
// Editing
// ---------------------------------------------------------------------------

bool Document::replaceRange(int lo, int hi, const std::u32string& insert) {
    if (readOnly_) return false;

    lo = std::clamp(lo, 0, length());
    hi = std::clamp(hi, 0, length());
    if (lo > hi) std::swap(lo, hi);

    std::u32string normalized = normalizeNewlines(insert);
    std::u32string newText = text_.substr(0, lo) + normalized + text_.substr(hi);
    int cursor = lo + static_cast<int>(normalized.size());
    applyEdit(std::move(newText), cursor, cursor);
    return true;
}

bool Document::replaceSelection(const std::u32string& insert) {
    TextRange range = selectedRange();
    return replaceRange(range.start, range.end, insert);
}

bool Document::insertText(const std::u32string& insert) {
    if (insert.empty()) return false;
    return replaceSelection(insert);
}

bool Document::insertText(const std::string& utf8) {
    return insertText(decodeUtf8(utf8));
}

bool Document::insertNewline() {
    return insertText(std::u32string(1, U'\n'));
}

bool Document::insertIndent() {
    return insertText(std::u32string(1, kIdeographicSpace));
}

bool Document::deleteBackward() {
    if (hasSelection()) return replaceSelection({});
    if (cursor_ <= 0) return false;
    return replaceRange(cursor_ - 1, cursor_, {});
}

bool Document::deleteForward() {
    if (hasSelection()) return replaceSelection({});
    if (cursor_ >= length()) return false;
    return replaceRange(cursor_, cursor_ + 1, {});
}

std::u32string Document::cutSelection() {
    if (readOnly_ || !hasSelection()) return {};
    std::u32string cut = selectedText();
    replaceSelection({});
    return cut;
}

void Document::applyEdit(std::u32string newText, int newCursor, int newAnchor) {
    int oldCount = characterCount();

    preedit_.clear();
    text_ = std::move(newText);
    cursor_ = std::clamp(newCursor, 0, length());
    anchor_ = std::clamp(newAnchor, 0, length());
    modified_ = text_ != savedSnapshot_;

    history_.push({text_, cursor_, anchor_});
    rebuildLayout();

    if (host_) {
        host_->modificationChanged(modified_);
        int newCount = characterCount();
        if (newCount != oldCount) {
            host_->characterCountChanged(newCount);
        }
    }
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

bool Document::undo() {
    if (!history_.undo()) return false;
    applyHistoryState(history_.current());
    return true;
}

bool Document::redo() {
    if (!history_.redo()) return false;
    applyHistoryState(history_.current());
    return true;
}

void Document::applyHistoryState(const HistoryEntry& entry) {
    text_ = entry.text;
    cursor_ = std::clamp(entry.cursor, 0, length());
    anchor_ = std::clamp(entry.anchor, 0, length());
    modified_ = text_ != savedSnapshot_;
    preedit_.clear();

    rebuildLayout();
    if (host_) {
        host_->modificationChanged(modified_);
        host_->characterCountChanged(characterCount());
    }
}

// ---------------------------------------------------------------------------
// Cursor & selection
// ---------------------------------------------------------------------------

void Document::setCursor(int offset, bool keepAnchor) {
    cursor_ = std::clamp(offset, 0, length());
    if (!keepAnchor) {
        anchor_ = cursor_;
    }
    cursorMoved();
}

void Document::moveVisual(int deltaCol, int deltaRow, bool keepAnchor) {
    CursorSlot slot = layout().slotAt(cursor_);
    int targetCol = std::max(0, slot.gcol + deltaCol);
    int targetRow = std::clamp(slot.row + deltaRow, 0, layout().grid.rows - 1);
    setCursor(interaction_.nearestOffset(targetCol, targetRow), keepAnchor);
}

void Document::navigate(NavigationKey key, bool keepAnchor) {
    switch (key) {
    case NavigationKey::Left:  moveVisual(+1, 0, keepAnchor); break;
    case NavigationKey::Right: moveVisual(-1, 0, keepAnchor); break;
    case NavigationKey::Up:    moveVisual(0, -1, keepAnchor); break;
    case NavigationKey::Down:  moveVisual(0, +1, keepAnchor); break;
    case NavigationKey::Home:  setCursor(0, keepAnchor); break;
    case NavigationKey::End:   setCursor(length(), keepAnchor); break;
    }
}

void Document::clickAt(float x, float y, bool extend) {
    setCursor(interaction_.hitTest(x, y, scroll_), extend);
}

void Document::selectAll() {
    anchor_ = 0;
    cursor_ = length();
    cursorMoved();
}

void Document::clearSelection() {
    anchor_ = cursor_;
    requestRepaint();
}

TextRange Document::selectedRange() const {
    return {std::min(cursor_, anchor_), std::max(cursor_, anchor_)};
}

std::u32string Document::selectedText() const {
    TextRange range = selectedRange();
    if (range.empty()) return {};
    return text_.substr(range.start, range.length());
}

PagePosition Document::currentPosition() const {
    return interaction_.positionAt(cursor_);
}

// ---------------------------------------------------------------------------
// Search
// ---------------------------------------------------------------------------

SearchResult Document::find(const std::u32string& pattern, const SearchOptions& options) {
    TextRange range = selectedRange();
    SearchResult result = findInText(text_, pattern, range.start, range.end, options);
    if (result.found()) {
        anchor_ = result.start;
        cursor_ = result.end;
        cursorMoved();
    }
    return result;
}

// ---------------------------------------------------------------------------
// Input method
// ---------------------------------------------------------------------------

void Document::inputMethodEvent(const std::u32string& preedit, const std::u32string& commit) {
    if (readOnly_) return;

    if (!commit.empty()) {
        insertText(commit);
    }
    preedit_ = preedit;
    requestRepaint();
}

std::vector<PreeditCell> Document::preeditCells() const {
    auto cells = interaction_.preeditCells(cursor_, preedit_);
    for (auto& cell : cells) {
        cell.rect.x -= scroll_.x;
        cell.rect.y -= scroll_.y;
    }
    return cells;
}

TextRect Document::inputMethodCursorRect() const {
    TextRect rect = interaction_.cursorRect(cursor_);
    rect.x -= scroll_.x;
    rect.y -= scroll_.y;
    return rect;
}

// ---------------------------------------------------------------------------
// View configuration
// ---------------------------------------------------------------------------

void Document::setGrid(const GridSize& grid) {
    grid_ = grid.clamped();
    GK_LOGI("setGrid: %dx%d", grid_.rows, grid_.cols);
    updateCellSize();
    rebuildLayout();
}

void Document::setFont(const FontDescriptor& font) {
    font_ = font;
    font_.size = clampFontSize(font_.size);
    updateCellSize();
    rebuildLayout();
}

void Document::viewportResized() {
    updateCellSize();
    ensureCursorVisible();
    requestRepaint();
}

void Document::setScrollOffset(const ScrollOffset& offset) {
    ScrollRange range = interaction_.scrollRange(viewport());
    scroll_.x = std::clamp(offset.x, 0.0f, range.maxX);
    scroll_.y = std::clamp(offset.y, 0.0f, range.maxY);
    requestRepaint();
}

// ---------------------------------------------------------------------------
// Layout queries
// ---------------------------------------------------------------------------

std::vector<RenderCell> Document::visibleCells() const {
    TextRange range = selectedRange();
    return interaction_.visibleCells(scroll_, viewport(), range.start, range.end);
}

std::vector<TextRect> Document::selectionRects() const {
    TextRange range = selectedRange();
    return interaction_.getRectsForRange(range.start, range.end);
}

// ---------------------------------------------------------------------------
// Internal
// ---------------------------------------------------------------------------

void Document::rebuildLayout() {
    interaction_.setLayoutResult(layoutText(text_, grid_));
    cursorMoved();
}

void Document::updateCellSize() {
    ViewMetrics metrics = interaction_.metrics();
    if (host_) {
        metrics.cellSize = ViewMetrics::cellSizeFor(host_->resolveFontMetrics(font_));
    }
    interaction_.setMetrics(metrics);
}

ViewportSize Document::viewport() const {
    if (!host_) return {};
    return host_->viewportSize();
}

void Document::cursorMoved() {
    ensureCursorVisible();
    if (host_) host_->cursorPositionChanged(currentPosition());
    requestRepaint();
}

void Document::ensureCursorVisible() {
    ScrollOffset next = interaction_.scrollToReveal(cursor_, scroll_, viewport());
    if (next.x == scroll_.x && next.y == scroll_.y) return;
    scroll_ = next;
    if (host_) host_->scrollRequested(scroll_);
}

void Document::requestRepaint() {
    if (host_) host_->repaintRequested();
}

} // namespace genko
