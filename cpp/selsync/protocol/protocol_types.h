/**
 * @file protocol_types.h
 * @brief Protocol types for SelectionEngine host communication
 *
 * Enums and structs exchanged between the engine and its host: inbound
 * events and commands, the outbound query result, the event stream and the
 * engine configuration.
 *
 * IMPORTANT: EngineEvent and EventBufferMeta are read by the host as raw
 * memory. Keep them POD and keep field order stable.
 */

#ifndef SELSYNC_PROTOCOL_TYPES_H
#define SELSYNC_PROTOCOL_TYPES_H

#include "selsync/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace selsync {
namespace protocol {

// =============================================================================
// Event Stream
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    SelectionChanged = 2,
    ConflictsChanged = 3,
    OwnershipChanged = 4,
    ViewportChanged = 5,
};

// Reasons carried in EngineEvent::flags
enum class ChangeMask : std::uint16_t {
    Admitted = 1 << 0,
    Removed = 1 << 1,
    Expired = 1 << 2,
    Resolved = 1 << 3,
    Acquired = 1 << 4,
    Released = 1 << 5,
};

// SelectionChanged:  a = store generation, b = active record count
// ConflictsChanged:  a = conflict count
// OwnershipChanged:  a = ownership generation, b = live record count
// ViewportChanged:   a = engine generation
// Overflow:          a = generation at overflow
struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

// =============================================================================
// Inbound Records
// =============================================================================

struct SelectionUpdateEvent {
    std::string userId;
    std::string userName;
    std::string userColor;
    std::string whiteboardId;
    std::string sessionId;
    std::vector<std::string> elementIds;
    std::optional<Box> selectionBounds;
    TimeMs timestamp{0};
    bool isMultiSelect{false};
    std::int32_t priority{0};
    bool isActive{true};
    // 0 means "use the apply time"
    TimeMs lastSeen{0};
};

struct ConflictResolutionCommand {
    std::string conflictId;
    ResolutionAction resolution{ResolutionAction::Cancel};
    std::string resolverId;
};

struct ResolutionOutcome {
    EngineError error;
    std::optional<OwnershipRecord> ownership;
};

// =============================================================================
// Outbound Query Result
// =============================================================================

struct HighlightHint {
    std::string userId;
    std::string userName;
    std::string userColor;
    std::vector<std::string> elementIds;
    Box bounds;
    float opacity;
    HighlightStyle style;
    HighlightAnimation animation;
    bool isCurrentUser;
    bool hasConflict;
};

struct QueryStats {
    std::uint32_t totalSelections;
    std::uint32_t visibleSelections;
    std::uint32_t culledSelections;
    std::uint32_t truncatedSelections;
    std::uint32_t totalConflicts;
    std::uint32_t visibleConflicts;
    std::uint32_t totalOwnerships;
    std::uint32_t visibleOwnerships;
    float queryMs;
};

struct QueryResult {
    std::vector<HighlightHint> highlights;
    std::vector<ConflictRecord> conflicts;
    std::vector<OwnershipRecord> ownerships;
    QueryStats stats;
};

struct EngineStats {
    std::uint32_t generation;
    std::uint32_t selectionCount;
    std::uint32_t conflictCount;
    std::uint32_t ownershipCount;
    std::uint32_t indexedSelections;
    std::uint32_t indexedElements;
    std::uint32_t gridCells;
    std::uint32_t boundsCacheEntries;
    std::uint64_t boundsCacheHits;
    std::uint64_t boundsCacheMisses;
    std::uint32_t rateLimitedUpdates;
    std::uint32_t autoResolvedConflicts;
    std::uint32_t sweepCount;
    float lastSweepMs;
    float lastQueryMs;
};

// =============================================================================
// Configuration
// =============================================================================

struct PerformancePreset {
    std::uint32_t maxVisible;
    bool animations;         // conflict pulse allowed
    bool simplifiedStyles;   // conflict highlights drawn solid
};

inline PerformancePreset presetFor(PerformanceMode mode) {
    switch (mode) {
        case PerformanceMode::Low:
            return PerformancePreset{kMaxVisibleLow, false, true};
        case PerformanceMode::High:
            return PerformancePreset{kMaxVisibleHigh, true, false};
        case PerformanceMode::Balanced:
        default:
            return PerformancePreset{kMaxVisibleBalanced, false, false};
    }
}

struct EngineConfig {
    float gridCellSize{kDefaultGridCellSize};
    float viewportPadding{kDefaultViewportPadding};
    TimeMs defaultOwnershipTtlMs{kDefaultOwnershipTtlMs};
    TimeMs selectionTimeoutMs{kDefaultSelectionTimeoutMs};
    TimeMs conflictResolutionTimeoutMs{kDefaultConflictResolutionTimeoutMs};
    TimeMs maintenanceIntervalMs{kDefaultMaintenanceIntervalMs};
    std::size_t maxElementsPerSelection{kDefaultMaxElementsPerSelection};
    std::uint32_t maxUpdatesPerSecond{kDefaultMaxUpdatesPerSecond};
    std::size_t boundsCacheCapacity{kDefaultBoundsCacheCapacity};
    bool enableAutomaticConflictResolution{true};
    bool allowSharedSelection{false};
    PerformanceMode performanceMode{PerformanceMode::Balanced};
    // 0 uses the performance preset
    std::uint32_t maxVisibleOverride{0};

    PerformancePreset preset() const { return presetFor(performanceMode); }
    std::uint32_t maxVisible() const {
        return maxVisibleOverride != 0 ? maxVisibleOverride : preset().maxVisible;
    }

    static EngineConfig forPerformanceMode(PerformanceMode mode) {
        EngineConfig config;
        config.performanceMode = mode;
        return config;
    }
};

} // namespace protocol
} // namespace selsync

#endif // SELSYNC_PROTOCOL_TYPES_H
