#include "genko/interaction.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace genko {

namespace {

// Slack kept between the cursor cell and the viewport edge when scrolling
constexpr float kRevealInset = 4.0f;
constexpr float kRevealLeadBefore = 8.0f;
constexpr float kRevealLeadAfter = 12.0f;

bool intersects(const TextRect& rect, float width, float height) {
    return rect.right() >= 0 && rect.left() <= width &&
           rect.bottom() >= 0 && rect.top() <= height;
}

TextRect translated(TextRect rect, const ScrollOffset& scroll) {
    rect.x -= scroll.x;
    rect.y -= scroll.y;
    return rect;
}

} // anonymous namespace

void InteractionManager::setLayoutResult(LayoutResult result) {
    result_ = std::move(result);
}

void InteractionManager::setMetrics(const ViewMetrics& metrics) {
    metrics_ = metrics;
}

// ---------------------------------------------------------------------------
// Strip geometry
// ---------------------------------------------------------------------------

float InteractionManager::pageWidth() const {
    return static_cast<float>(cols() * metrics_.cellSize);
}

float InteractionManager::pageHeight() const {
    return static_cast<float>(rows() * metrics_.cellSize);
}

float InteractionManager::pageOriginX(int page) const {
    return static_cast<float>(metrics_.outerMargin) +
           static_cast<float>(result_.totalPages - 1 - page) * (pageWidth() + metrics_.pageGap);
}

TextRect InteractionManager::pageRect(int page) const {
    return {pageOriginX(page), static_cast<float>(metrics_.outerMargin), pageWidth(), pageHeight()};
}

float InteractionManager::contentWidth() const {
    int pages = result_.totalPages;
    return static_cast<float>(metrics_.outerMargin * 2) + pages * pageWidth() +
           static_cast<float>(std::max(0, pages - 1) * metrics_.pageGap);
}

float InteractionManager::contentHeight() const {
    return static_cast<float>(metrics_.outerMargin * 2) + pageHeight();
}

ScrollRange InteractionManager::scrollRange(const ViewportSize& viewport) const {
    float width = std::max(1.0f, viewport.width);
    float height = std::max(1.0f, viewport.height);
    return {std::max(0.0f, contentWidth() - width), std::max(0.0f, contentHeight() - height)};
}

// ---------------------------------------------------------------------------
// Offset → pixels
// ---------------------------------------------------------------------------

TextRect InteractionManager::cellRect(int gcol, int row) const {
    int page = gcol / cols();
    int colInPage = gcol % cols();
    float cell = static_cast<float>(metrics_.cellSize);
    float x = pageOriginX(page) + static_cast<float>(cols() - 1 - colInPage) * cell;
    float y = static_cast<float>(metrics_.outerMargin) + static_cast<float>(row) * cell;
    return {x, y, cell, cell};
}

TextRect InteractionManager::cursorRect(int offset) const {
    CursorSlot slot = result_.slotAt(offset);
    return cellRect(slot.gcol, slot.row);
}

std::vector<TextRect> InteractionManager::getRectsForRange(int lo, int hi) const {
    if (lo > hi) std::swap(lo, hi);
    std::vector<TextRect> rects;
    if (lo == hi) return rects;

    for (const auto& unit : result_.units) {
        if (unit.start < hi && unit.end > lo) {
            rects.push_back(cellRect(unit.gcol, unit.row));
        }
    }
    return rects;
}

PagePosition InteractionManager::positionAt(int offset) const {
    CursorSlot slot = result_.slotAt(offset);
    return {slot.gcol / cols() + 1, slot.gcol % cols() + 1, slot.row + 1};
}

// ---------------------------------------------------------------------------
// Pixels → offset
// ---------------------------------------------------------------------------

CursorSlot InteractionManager::pointToGrid(float worldX, float worldY) const {
    float cell = static_cast<float>(metrics_.cellSize);
    float pageW = pageWidth();
    float pageH = pageHeight();

    float y = worldY - static_cast<float>(metrics_.outerMargin);
    int row = 0;
    if (y >= 0) {
        row = static_cast<int>(std::floor(std::clamp(y, 0.0f, pageH - 1) / cell));
    }

    // Nearest page by horizontal distance to its bounds
    int bestPage = 0;
    float bestDist = std::numeric_limits<float>::infinity();
    for (int page = 0; page < result_.totalPages; ++page) {
        float left = pageOriginX(page);
        float right = left + pageW;
        float dist = 0;
        if (worldX < left) {
            dist = left - worldX;
        } else if (worldX > right) {
            dist = worldX - right;
        }
        if (dist < bestDist) {
            bestDist = dist;
            bestPage = page;
        }
    }

    float withinX = std::clamp(worldX - pageOriginX(bestPage), 0.0f, pageW - 1);
    int colFromLeft = static_cast<int>(std::floor(withinX / cell));
    int colInPage = std::clamp(cols() - 1 - colFromLeft, 0, cols() - 1);

    return {bestPage * cols() + colInPage, row};
}

int InteractionManager::nearestOffset(int gcol, int row) const {
    int bestIdx = 0;
    long long bestDist = std::numeric_limits<long long>::max();
    for (int idx = 0; idx < static_cast<int>(result_.slots.size()); ++idx) {
        const auto& slot = result_.slots[idx];
        long long dist = static_cast<long long>(std::abs(slot.gcol - gcol)) * rows() +
                         std::abs(slot.row - row);
        if (dist < bestDist) {
            bestDist = dist;
            bestIdx = idx;
        }
    }
    return bestIdx;
}

int InteractionManager::hitTest(float x, float y, const ScrollOffset& scroll) const {
    CursorSlot target = pointToGrid(x + scroll.x, y + scroll.y);
    return nearestOffset(target.gcol, target.row);
}

// ---------------------------------------------------------------------------
// Rendering queries
// ---------------------------------------------------------------------------

std::vector<RenderCell> InteractionManager::visibleCells(const ScrollOffset& scroll,
                                                         const ViewportSize& viewport,
                                                         int selLo, int selHi) const {
    if (selLo > selHi) std::swap(selLo, selHi);
    bool hasSelection = selLo != selHi;

    std::vector<RenderCell> cells;
    for (const auto& unit : result_.units) {
        TextRect rect = translated(cellRect(unit.gcol, unit.row), scroll);
        if (!intersects(rect, viewport.width, viewport.height)) continue;

        RenderCell cell;
        cell.unit = unit;
        cell.rect = rect;
        cell.glyph = resolveGlyph(unit);
        cell.selected = hasSelection && unit.start < selHi && unit.end > selLo;
        cells.push_back(std::move(cell));
    }
    return cells;
}

std::vector<PreeditCell> InteractionManager::preeditCells(int offset,
                                                          const std::u32string& preedit) const {
    std::vector<PreeditCell> cells;
    if (preedit.empty()) return cells;

    CursorSlot slot = result_.slotAt(offset);
    for (char32_t ch : preedit) {
        PreeditCell cell;
        cell.ch = ch;
        cell.slot = slot;
        cell.rect = cellRect(slot.gcol, slot.row);
        cell.glyph = resolveGlyph(std::u32string(1, ch), TokenKind::Char);
        cells.push_back(cell);

        slot.row += 1;
        if (slot.row >= rows()) {
            slot.row = 0;
            slot.gcol += 1;
        }
    }
    return cells;
}

ScrollOffset InteractionManager::scrollToReveal(int offset,
                                                const ScrollOffset& current,
                                                const ViewportSize& viewport) const {
    TextRect rect = cursorRect(offset);
    ScrollRange range = scrollRange(viewport);
    ScrollOffset next = current;

    float viewLeft = current.x + kRevealInset;
    float viewRight = current.x + viewport.width - kRevealInset;
    if (rect.left() < viewLeft) {
        next.x = std::trunc(rect.left()) - kRevealLeadBefore;
    } else if (rect.right() > viewRight) {
        next.x = std::trunc(rect.right() - viewport.width + kRevealLeadAfter);
    }

    float viewTop = current.y + kRevealInset;
    float viewBottom = current.y + viewport.height - kRevealInset;
    if (rect.top() < viewTop) {
        next.y = std::trunc(rect.top()) - kRevealLeadBefore;
    } else if (rect.bottom() > viewBottom) {
        next.y = std::trunc(rect.bottom() - viewport.height + kRevealLeadAfter);
    }

    next.x = std::clamp(next.x, 0.0f, range.maxX);
    next.y = std::clamp(next.y, 0.0f, range.maxY);
    return next;
}

} // namespace genko
