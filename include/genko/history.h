#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace genko {

/// Immutable snapshot of the editable state
struct HistoryEntry {
    std::u32string text;
    int cursor = 0;
    int anchor = 0;
};

inline bool operator==(const HistoryEntry& a, const HistoryEntry& b) {
    return a.cursor == b.cursor && a.anchor == b.anchor && a.text == b.text;
}

inline bool operator!=(const HistoryEntry& a, const HistoryEntry& b) {
    return !(a == b);
}

/// Linear undo history: an arena of snapshots plus a current index.
/// Pushing while not at the newest entry discards every later entry.
class History {
public:
    explicit History(HistoryEntry initial = {});

    /// Drop all entries and start over from a single state (document load)
    void reset(HistoryEntry initial);

    /// Append a snapshot after the current index.
    /// Returns false (and records nothing) when it equals the current entry.
    bool push(HistoryEntry entry);

    bool canUndo() const noexcept { return index_ > 0; }
    bool canRedo() const noexcept { return index_ + 1 < entries_.size(); }

    /// Step back; returns false at the oldest entry
    bool undo();

    /// Step forward; returns false at the newest entry
    bool redo();

    const HistoryEntry& current() const { return entries_[index_]; }
    std::size_t index() const noexcept { return index_; }
    std::size_t size() const noexcept { return entries_.size(); }

private:
    std::vector<HistoryEntry> entries_;
    std::size_t index_ = 0;
};

} // namespace genko
