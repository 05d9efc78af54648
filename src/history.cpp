#include "genko/history.h"

namespace genko {

History::History(HistoryEntry initial) {
    entries_.push_back(std::move(initial));
}

void History::reset(HistoryEntry initial) {
    entries_.clear();
    entries_.push_back(std::move(initial));
    index_ = 0;
}

bool History::push(HistoryEntry entry) {
    if (entries_[index_] == entry) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index_) + 1, entries_.end());
    entries_.push_back(std::move(entry));
    index_ = entries_.size() - 1;
    return true;
}

bool History::undo() {
    if (!canUndo()) return false;
    --index_;
    return true;
}

bool History::redo() {
    if (!canRedo()) return false;
    ++index_;
    return true;
}

} // namespace genko
