#include "paint/history/history_buffer.h"
#include "paint/core/logging.h"

#include <algorithm>

HistoryBuffer::HistoryBuffer(std::size_t maxHistorySize) {
    HistorySnapshot initial;
    initial.maxHistorySize = std::max<std::size_t>(1, maxHistorySize);
    snapshot_ = std::make_shared<const HistorySnapshot>(std::move(initial));
}

bool HistoryBuffer::canUndo() const noexcept {
    return snapshot_->historyIndex > 0;
}

bool HistoryBuffer::canRedo() const noexcept {
    return snapshot_->historyIndex < snapshot_->strokes.size();
}

void HistoryBuffer::publish(HistorySnapshot&& next) {
    next.generation = snapshot_->generation + 1;
    snapshot_ = std::make_shared<const HistorySnapshot>(std::move(next));
}

void HistoryBuffer::commit(StrokeHandle stroke) {
    if (!stroke) {
        PAINT_LOG_WARN("HistoryBuffer::commit: null stroke ignored");
        return;
    }

    const HistorySnapshot& cur = *snapshot_;
    HistorySnapshot next;
    next.maxHistorySize = cur.maxHistorySize;

    // Redo tail is discarded: only the visible prefix survives a new commit.
    std::size_t first = 0;
    if (cur.historyIndex >= cur.maxHistorySize) {
        first = cur.historyIndex - cur.maxHistorySize + 1;
        PAINT_LOG_DEBUG("HistoryBuffer::commit: evicting %zu oldest stroke(s)", first);
    }
    next.strokes.reserve(cur.historyIndex - first + 1);
    next.strokes.insert(
        next.strokes.end(),
        cur.strokes.begin() + static_cast<std::ptrdiff_t>(first),
        cur.strokes.begin() + static_cast<std::ptrdiff_t>(cur.historyIndex));
    next.strokes.push_back(std::move(stroke));
    next.historyIndex = next.strokes.size();

    publish(std::move(next));
}

bool HistoryBuffer::undo() {
    if (!canUndo()) return false;
    HistorySnapshot next = *snapshot_;
    next.historyIndex--;
    publish(std::move(next));
    return true;
}

bool HistoryBuffer::redo() {
    if (!canRedo()) return false;
    HistorySnapshot next = *snapshot_;
    next.historyIndex++;
    publish(std::move(next));
    return true;
}

void HistoryBuffer::clear() {
    HistorySnapshot next;
    next.maxHistorySize = snapshot_->maxHistorySize;
    publish(std::move(next));
}

StrokeRange HistoryBuffer::visibleStrokes() const {
    return StrokeRange(snapshot_, 0, snapshot_->historyIndex);
}

StrokeRange HistoryBuffer::redoStrokes() const {
    return StrokeRange(snapshot_, snapshot_->historyIndex, snapshot_->strokes.size());
}

void HistoryBuffer::setMaxHistorySize(std::size_t maxHistorySize) {
    const std::size_t cap = std::max<std::size_t>(1, maxHistorySize);
    const HistorySnapshot& cur = *snapshot_;
    if (cap == cur.maxHistorySize) return;

    HistorySnapshot next;
    next.maxHistorySize = cap;
    const std::size_t evict = cur.strokes.size() > cap ? cur.strokes.size() - cap : 0;
    next.strokes.assign(cur.strokes.begin() + static_cast<std::ptrdiff_t>(evict), cur.strokes.end());
    next.historyIndex = cur.historyIndex > evict ? cur.historyIndex - evict : 0;
    publish(std::move(next));
}
