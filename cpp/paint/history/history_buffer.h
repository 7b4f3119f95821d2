#pragma once

#include "paint/core/types.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Immutable view of the whole history at one point in time.
// strokes[0, historyIndex) are visible; strokes[historyIndex, size) are redo-able.
struct HistorySnapshot {
    std::vector<StrokeHandle> strokes;
    std::size_t historyIndex = 0;
    std::size_t maxHistorySize = kDefaultMaxHistorySize;
    std::uint32_t generation = 0;
};

using HistorySnapshotPtr = std::shared_ptr<const HistorySnapshot>;

// Restartable, read-only sequence over a slice of one snapshot. Holding the
// range keeps its snapshot alive, so later commits never change what it yields.
class StrokeRange {
public:
    using const_iterator = std::vector<StrokeHandle>::const_iterator;

    StrokeRange(HistorySnapshotPtr snapshot, std::size_t first, std::size_t last)
        : snapshot_(std::move(snapshot)), first_(first), last_(last) {}

    const_iterator begin() const noexcept { return snapshot_->strokes.begin() + static_cast<std::ptrdiff_t>(first_); }
    const_iterator end() const noexcept { return snapshot_->strokes.begin() + static_cast<std::ptrdiff_t>(last_); }
    std::size_t size() const noexcept { return last_ - first_; }
    bool empty() const noexcept { return first_ == last_; }
    const StrokeHandle& operator[](std::size_t i) const { return snapshot_->strokes[first_ + i]; }

    std::vector<StrokeHandle> toVector() const { return std::vector<StrokeHandle>(begin(), end()); }

private:
    HistorySnapshotPtr snapshot_;
    std::size_t first_;
    std::size_t last_;
};

// Bounded, branch-on-write undo/redo history of committed strokes.
//
// Every mutation computes the next snapshot from the current one and then
// publishes it with a single pointer swap; readers holding an older snapshot
// (or a StrokeRange) never observe a partially truncated buffer.
class HistoryBuffer {
public:
    explicit HistoryBuffer(std::size_t maxHistorySize = kDefaultMaxHistorySize);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Drops the redo tail, evicts the oldest stroke when at capacity, appends.
    void commit(StrokeHandle stroke);
    bool undo();
    bool redo();
    void clear();

    StrokeRange visibleStrokes() const;
    StrokeRange redoStrokes() const;
    HistorySnapshotPtr snapshot() const noexcept { return snapshot_; }

    std::size_t getHistorySize() const noexcept { return snapshot_->strokes.size(); }
    std::size_t getCursor() const noexcept { return snapshot_->historyIndex; }
    std::size_t getMaxHistorySize() const noexcept { return snapshot_->maxHistorySize; }
    std::uint32_t getGeneration() const noexcept { return snapshot_->generation; }

    // Clamped to at least one entry; shrinking evicts the oldest strokes.
    void setMaxHistorySize(std::size_t maxHistorySize);

private:
    void publish(HistorySnapshot&& next);

    HistorySnapshotPtr snapshot_;
};
