#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#endif

#include "selsync/core/types.h"
#include "selsync/command/commands.h"
#include "selsync/ownership/ownership_manager.h"
#include "selsync/protocol/protocol_types.h"
#include "selsync/render/viewport_culler.h"
#include "selsync/selection/conflict_resolver.h"
#include "selsync/selection/selection_store.h"
#include "selsync/spatial/bounds_cache.h"

#include <array>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace selsync {

// Forward declarations
class SelectionEngineTestAccessor;

/**
 * Selection state for one whiteboard session.
 *
 * Owns the store, conflict resolver, ownership manager, bounds cache and
 * viewport culler of the session. Not thread-safe: the host serializes every
 * call (network events, render queries, ticks) on one sequence.
 *
 * Mutating calls return an EngineError and record it as the last error.
 * Changes are coalesced and published on pollEvents().
 */
class SelectionEngine {
    friend class SelectionEngineTestAccessor;
public:
    using EngineConfig = protocol::EngineConfig;
    using EngineEvent = protocol::EngineEvent;
    using EngineStats = protocol::EngineStats;
    using EventBufferMeta = protocol::EventBufferMeta;
    using EventType = protocol::EventType;
    using ChangeMask = protocol::ChangeMask;
    using QueryResult = protocol::QueryResult;
    using SelectionUpdateEvent = protocol::SelectionUpdateEvent;
    using ConflictResolutionCommand = protocol::ConflictResolutionCommand;
    using ResolutionOutcome = protocol::ResolutionOutcome;

    static constexpr std::size_t kMaxEvents = 2048;

    SelectionEngine(std::string whiteboardId, std::string currentUserId, EngineConfig config = EngineConfig{});

    SelectionEngine(const SelectionEngine&) = delete;
    SelectionEngine& operator=(const SelectionEngine&) = delete;

    // Geometry source for element bounds; required before queries that need
    // element bounds.
    void setBoundsResolver(BoundsResolver resolver);

    // ---------------------------------------------------------------------
    // Inbound events
    // ---------------------------------------------------------------------

    EngineError applySelectionUpdate(const SelectionUpdateEvent& event, TimeMs now);
    // Disconnect: drops the user's selection and releases their ownerships.
    EngineError removeUser(const std::string& userId, TimeMs now);

    AcquireResult requestOwnership(const OwnershipRequest& request, TimeMs now);
    EngineError renewOwnership(const std::string& elementId, const std::string& userId, TimeMs ttlMs, TimeMs now);
    EngineError releaseOwnership(const std::string& elementId, const std::string& userId, TimeMs now);

    ResolutionOutcome resolveConflict(const ConflictResolutionCommand& command, TimeMs now);

    void invalidateBounds(const std::string& elementId);
    void invalidateAllBounds();

    EngineError setViewport(const Viewport& viewport);
    const Viewport& viewport() const { return viewport_; }

    // Scratch memory for hosts that stage command buffers in engine memory.
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    // Batch entry point. Validates framing and every payload first; a
    // malformed buffer applies nothing.
    EngineError applyCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount);
    EngineError applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount);

    // ---------------------------------------------------------------------
    // Maintenance
    // ---------------------------------------------------------------------

    // Runs the sweeps when maintenanceIntervalMs has elapsed since the last
    // one. Returns true when a sweep ran.
    bool tick(TimeMs now);
    void forceMaintenance(TimeMs now);

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    std::vector<SelectionRecord> activeSelections() const;
    const std::vector<ConflictRecord>& conflicts() const { return conflicts_; }
    std::optional<ConflictRecord> conflict(const std::string& conflictId) const;
    std::optional<OwnershipRecord> ownership(const std::string& elementId, TimeMs now) const;
    std::vector<OwnershipRecord> ownerships(TimeMs now) const;
    TimeMs ownershipRemainingMs(const std::string& elementId, TimeMs now) const;

    // Viewport-filtered highlights, conflicts and ownerships for rendering.
    QueryResult query(TimeMs now);

    // ---------------------------------------------------------------------
    // Events
    // ---------------------------------------------------------------------

    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    // ---------------------------------------------------------------------
    // Diagnostics
    // ---------------------------------------------------------------------

    EngineStats getStats() const;
    EngineError getLastError() const { return lastError_; }
    void clearError() { lastError_ = EngineError::Ok; }
    std::uint32_t getGeneration() const { return generation_; }
    // FNV-1a over selections, conflicts and live ownerships, host-independent.
    std::uint64_t getStateDigest(TimeMs now) const;

    const EngineConfig& config() const { return config_; }
    const std::string& whiteboardId() const { return whiteboardId_; }
    const std::string& currentUserId() const { return currentUserId_; }

private:
    EngineConfig config_;
    std::string whiteboardId_;
    std::string currentUserId_;

    BoundsCache boundsCache_;
    SelectionStore store_;
    ConflictResolver conflictResolver_;
    OwnershipManager ownershipManager_;
    ViewportCuller culler_;
    Viewport viewport_{};
    bool hasViewport_ = false;

    std::vector<ConflictRecord> conflicts_;
    // elementId -> time the conflict was first observed
    std::unordered_map<std::string, TimeMs> conflictSince_;
    std::unordered_set<std::string> sharedElements_;

    // Per-user admission times inside the rate-limit window
    std::unordered_map<std::string, std::deque<TimeMs>> updateWindows_;

    bool hasSwept_ = false;
    TimeMs lastSweepAt_ = 0;

    std::uint32_t generation_ = 0;
    EngineError lastError_ = EngineError::Ok;

    std::uint32_t rateLimitedUpdates_ = 0;
    std::uint32_t autoResolvedConflicts_ = 0;
    std::uint32_t sweepCount_ = 0;
    float lastSweepMs_ = 0.0f;
    float lastQueryMs_ = 0.0f;

    // Event ring
    std::array<EngineEvent, kMaxEvents> eventQueue_{};
    std::size_t eventHead_ = 0;
    std::size_t eventTail_ = 0;
    std::size_t eventCount_ = 0;
    bool eventOverflowed_ = false;
    std::uint32_t eventOverflowGeneration_ = 0;
    std::vector<EngineEvent> eventBuffer_;

    bool pendingSelectionChanged_ = false;
    std::uint16_t pendingSelectionFlags_ = 0;
    bool pendingConflictsChanged_ = false;
    bool pendingOwnershipChanged_ = false;
    std::uint16_t pendingOwnershipFlags_ = 0;
    bool pendingViewportChanged_ = false;

    void setError(EngineError err);
    EngineError finish(EngineError err);

    bool allowUpdate(const std::string& userId, TimeMs now);
    void pruneRateWindows(TimeMs now);
    void refreshConflicts(TimeMs now);
    void runMaintenance(TimeMs now);
    void autoResolveConflicts(TimeMs now);
    EngineError resolveWithOwnership(const ConflictRecord& conflict, TimeMs now, std::optional<OwnershipRecord>& granted);

    protocol::HighlightHint makeHighlight(const SelectionRecord& record, const Box& bounds, bool hasConflict) const;

    // Event stream
    void clearEventState();
    void clearPendingEvents();
    void recordSelectionChanged(ChangeMask reason);
    void recordConflictsChanged();
    void recordOwnershipChanged(ChangeMask reason);
    void recordViewportChanged();
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();
};

} // namespace selsync
