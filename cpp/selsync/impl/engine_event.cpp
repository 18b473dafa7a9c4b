// SelectionEngine event system methods
// Part of the engine.h class split

#include "selsync/engine.h"
#include "selsync/core/logging.h"

#include <algorithm>

namespace selsync {

void SelectionEngine::clearPendingEvents() {
    pendingSelectionChanged_ = false;
    pendingSelectionFlags_ = 0;
    pendingConflictsChanged_ = false;
    pendingOwnershipChanged_ = false;
    pendingOwnershipFlags_ = 0;
    pendingViewportChanged_ = false;
}

void SelectionEngine::clearEventState() {
    eventHead_ = 0;
    eventTail_ = 0;
    eventCount_ = 0;
    eventOverflowed_ = false;
    eventOverflowGeneration_ = 0;
    clearPendingEvents();
}

void SelectionEngine::recordSelectionChanged(ChangeMask reason) {
    if (eventOverflowed_) return;
    pendingSelectionChanged_ = true;
    pendingSelectionFlags_ |= static_cast<std::uint16_t>(reason);
}

void SelectionEngine::recordConflictsChanged() {
    if (eventOverflowed_) return;
    pendingConflictsChanged_ = true;
}

void SelectionEngine::recordOwnershipChanged(ChangeMask reason) {
    if (eventOverflowed_) return;
    pendingOwnershipChanged_ = true;
    pendingOwnershipFlags_ |= static_cast<std::uint16_t>(reason);
}

void SelectionEngine::recordViewportChanged() {
    if (eventOverflowed_) return;
    pendingViewportChanged_ = true;
}

bool SelectionEngine::pushEvent(const EngineEvent& ev) {
    if (eventOverflowed_) return false;
    if (eventCount_ >= kMaxEvents) {
        eventOverflowed_ = true;
        eventOverflowGeneration_ = generation_;
        eventHead_ = 0;
        eventTail_ = 0;
        eventCount_ = 0;
        SELSYNC_LOG_WARN("event queue overflow at generation %u", generation_);
        return false;
    }
    eventQueue_[eventTail_] = ev;
    eventTail_ = (eventTail_ + 1) % kMaxEvents;
    eventCount_++;
    return true;
}

void SelectionEngine::flushPendingEvents() {
    if (eventOverflowed_) {
        clearPendingEvents();
        return;
    }

    auto pushOrOverflow = [&](const EngineEvent& ev) -> bool {
        if (!pushEvent(ev)) {
            clearPendingEvents();
            return false;
        }
        return true;
    };

    if (pendingSelectionChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::SelectionChanged),
                pendingSelectionFlags_,
                store_.generation(),
                static_cast<std::uint32_t>(store_.size(whiteboardId_)),
                0,
                0,
            })) {
            return;
        }
    }

    if (pendingConflictsChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ConflictsChanged),
                0,
                static_cast<std::uint32_t>(conflicts_.size()),
                0,
                0,
                0,
            })) {
            return;
        }
    }

    if (pendingOwnershipChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::OwnershipChanged),
                pendingOwnershipFlags_,
                ownershipManager_.generation(),
                static_cast<std::uint32_t>(ownershipManager_.size()),
                0,
                0,
            })) {
            return;
        }
    }

    if (pendingViewportChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ViewportChanged),
                0,
                generation_,
                0,
                0,
                0,
            })) {
            return;
        }
    }

    clearPendingEvents();
}

SelectionEngine::EventBufferMeta SelectionEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    eventBuffer_.clear();
    if (eventOverflowed_) {
        eventBuffer_.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            eventOverflowGeneration_,
            0,
            0,
            0,
        });
        return EventBufferMeta{
            generation_,
            static_cast<std::uint32_t>(eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(eventBuffer_.data()),
        };
    }

    if (eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{generation_, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, eventCount_);
    for (std::size_t i = 0; i < count; ++i) {
        eventBuffer_.push_back(eventQueue_[eventHead_]);
        eventHead_ = (eventHead_ + 1) % kMaxEvents;
        eventCount_--;
    }

    return EventBufferMeta{
        generation_,
        static_cast<std::uint32_t>(eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(eventBuffer_.data()),
    };
}

void SelectionEngine::ackResync(std::uint32_t resyncGeneration) {
    if (!eventOverflowed_) return;
    if (resyncGeneration < eventOverflowGeneration_) return;
    clearEventState();
}

} // namespace selsync
