// PaintEngine event system methods

#include "paint/engine.h"
#include "paint/internal/engine_state.h"
#include "paint/core/logging.h"

#include <algorithm>

namespace {

void clearPending(EngineState& s) {
    s.pendingEngineReset_ = false;
    s.pendingSessionChanged_ = false;
    s.pendingStrokeCommitted_ = false;
    s.pendingCommittedPoints_ = 0;
    s.pendingHistoryChanged_ = false;
    s.pendingSymmetryChanged_ = false;
    s.pendingViewChanged_ = false;
    s.pendingBrushChanged_ = false;
}

// Empties the poll ring. Overflow state is left to the caller.
void dropQueuedEvents(EngineState& s) {
    s.eventHead_ = 0;
    s.eventTail_ = 0;
    s.eventCount_ = 0;
}

bool hasPending(const EngineState& s) {
    return s.pendingEngineReset_
        || s.pendingSessionChanged_
        || s.pendingStrokeCommitted_
        || s.pendingHistoryChanged_
        || s.pendingSymmetryChanged_
        || s.pendingViewChanged_
        || s.pendingBrushChanged_;
}

} // namespace

void PaintEngine::clearEventState() {
    EngineState& s = state();
    dropQueuedEvents(s);
    s.eventOverflowed_ = false;
    s.eventOverflowGeneration_ = 0;
    clearPending(s);
}

void PaintEngine::recordHistoryChanged() { state_->pendingHistoryChanged_ = true; }
void PaintEngine::recordSessionChanged() { state_->pendingSessionChanged_ = true; }
void PaintEngine::recordSymmetryChanged() { state_->pendingSymmetryChanged_ = true; }
void PaintEngine::recordViewChanged() { state_->pendingViewChanged_ = true; }
void PaintEngine::recordBrushChanged() { state_->pendingBrushChanged_ = true; }
void PaintEngine::recordEngineReset() { state_->pendingEngineReset_ = true; }

void PaintEngine::recordStrokeCommitted(const StrokeData& stroke) {
    state_->pendingStrokeCommitted_ = true;
    state_->pendingCommittedPoints_ = stroke.metadata.totalPoints;
    recordHistoryChanged();
}

bool PaintEngine::pushEvent(const EngineEvent& ev) {
    EngineState& s = state();
    if (s.eventOverflowed_) return false;
    if (s.eventCount_ == EngineState::kMaxEvents) {
        // The host missed events; it must resync from state at this generation.
        PAINT_LOG_WARN("event queue overflow at generation %u", s.generation);
        dropQueuedEvents(s);
        s.eventOverflowed_ = true;
        s.eventOverflowGeneration_ = s.generation;
        return false;
    }
    s.eventQueue_[s.eventTail_] = ev;
    s.eventTail_ = (s.eventTail_ + 1) % EngineState::kMaxEvents;
    s.eventCount_++;
    return true;
}

void PaintEngine::flushPendingEvents() {
    EngineState& s = state();
    if (!hasPending(s)) return;

    // Every published change can alter what is drawn.
    markRenderDirty();

    std::vector<EngineEvent> batch;
    batch.reserve(7);

    if (s.pendingEngineReset_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::EngineReset),
            0,
            s.generation,
            0,
            0,
            0,
        });
    }

    if (s.pendingSessionChanged_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::SessionChanged),
            0,
            static_cast<std::uint32_t>(s.session_.state()),
            static_cast<std::uint32_t>(s.session_.currentPoints().size()),
            0,
            0,
        });
    }

    if (s.pendingStrokeCommitted_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::StrokeCommitted),
            0,
            s.historyBuffer_.getGeneration(),
            s.pendingCommittedPoints_,
            0,
            0,
        });
    }

    if (s.pendingHistoryChanged_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::HistoryChanged),
            0,
            s.historyBuffer_.getGeneration(),
            static_cast<std::uint32_t>(s.historyBuffer_.getCursor()),
            static_cast<std::uint32_t>(s.historyBuffer_.getHistorySize()),
            0,
        });
    }

    if (s.pendingSymmetryChanged_) {
        const SymmetryConfig& cfg = s.symmetryManager_.config();
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::SymmetryChanged),
            0,
            s.symmetryManager_.getGeneration(),
            cfg.enabled ? 1u : 0u,
            static_cast<std::uint32_t>(cfg.axisCount),
            0,
        });
    }

    if (s.pendingViewChanged_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::ViewChanged),
            0,
            s.viewTransform_.getGeneration(),
            0,
            0,
            0,
        });
    }

    if (s.pendingBrushChanged_) {
        batch.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::BrushChanged),
            0,
            s.generation,
            0,
            0,
            0,
        });
    }

    clearPending(s);

    // The poll queue stops accepting events on overflow until ackResync;
    // synchronous listeners are still notified.
    for (const EngineEvent& ev : batch) {
        if (!pushEvent(ev)) break;
    }

    notifyListeners(batch);
}

void PaintEngine::notifyListeners(const std::vector<EngineEvent>& batch) {
    if (batch.empty() || state_->listeners_.empty()) return;
    // A listener may add or remove listeners while being notified.
    const std::vector<PaintEngineListener*> listeners = state_->listeners_;
    for (PaintEngineListener* l : listeners) {
        const auto& current = state_->listeners_;
        if (std::find(current.begin(), current.end(), l) == current.end()) continue;
        l->onEngineEvents(batch.data(), batch.size());
    }
}

void PaintEngine::addListener(PaintEngineListener* listener) {
    if (!listener) return;
    auto& ls = state_->listeners_;
    if (std::find(ls.begin(), ls.end(), listener) != ls.end()) return;
    ls.push_back(listener);
}

void PaintEngine::removeListener(PaintEngineListener* listener) {
    auto& ls = state_->listeners_;
    ls.erase(std::remove(ls.begin(), ls.end(), listener), ls.end());
}

PaintEngine::EventBufferMeta PaintEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    EngineState& s = state();
    s.eventBuffer_.clear();
    if (s.eventOverflowed_) {
        s.eventBuffer_.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            s.eventOverflowGeneration_,
            0,
            0,
            0,
        });
        return EventBufferMeta{
            s.generation,
            static_cast<std::uint32_t>(s.eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
        };
    }

    if (s.eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{s.generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, s.eventCount_);
    s.eventBuffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        s.eventBuffer_.push_back(s.eventQueue_[s.eventHead_]);
        s.eventHead_ = (s.eventHead_ + 1) % EngineState::kMaxEvents;
        s.eventCount_--;
    }

    return EventBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
    };
}

void PaintEngine::ackResync(std::uint32_t resyncGeneration) {
    EngineState& s = state();
    if (!s.eventOverflowed_ || resyncGeneration < s.eventOverflowGeneration_) return;
    clearEventState();
}
