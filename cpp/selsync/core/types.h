#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Value types and tuning constants shared by the selection engine.

namespace selsync {

using TimeMs = std::int64_t;

// Spatial index / culling defaults
static constexpr float kDefaultGridCellSize = 256.0f;
static constexpr float kDefaultViewportPadding = 100.0f; // screen px
static constexpr std::size_t kMaxCellsPerEntry = 4096;
static constexpr std::size_t kDefaultBoundsCacheCapacity = 1000;
static constexpr std::int32_t kMaxCellCoord = 1 << 30;

// Timing defaults (ms)
static constexpr TimeMs kDefaultOwnershipTtlMs = 60 * 1000;
static constexpr TimeMs kDefaultSelectionTimeoutMs = 30 * 1000;
static constexpr TimeMs kDefaultConflictResolutionTimeoutMs = 5 * 1000;
static constexpr TimeMs kDefaultMaintenanceIntervalMs = 1000;
static constexpr TimeMs kRateLimitWindowMs = 1000;
// Upper bound for timestamps and TTLs, same limit as msToTime
static constexpr TimeMs kMaxTimeMs = 9000000000000000LL;

// Admission limits
static constexpr std::size_t kDefaultMaxElementsPerSelection = 100;
static constexpr std::uint32_t kDefaultMaxUpdatesPerSecond = 20;
static constexpr std::size_t kMaxIdBytes = 255;

// Visible highlight caps per performance preset
static constexpr std::uint32_t kMaxVisibleLow = 10;
static constexpr std::uint32_t kMaxVisibleBalanced = 15;
static constexpr std::uint32_t kMaxVisibleHigh = 25;

// Highlight opacity hints
static constexpr float kOpacityDefault = 0.3f;
static constexpr float kOpacityCurrentUser = 0.4f;
static constexpr float kOpacityConflict = 0.5f;

// Command buffer format constants
static constexpr std::uint32_t commandMagicSscb = 0x42435353; // "SSCB"
static constexpr std::uint32_t commandVersionSscb = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4 + 8; // magic, version, count, reserved, nowMs
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

struct Box {
    float x;
    float y;
    float width;
    float height;
};

struct AABB {
    float minX, minY, maxX, maxY;
};

inline bool operator==(const Box& a, const Box& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Box& a, const Box& b) { return !(a == b); }

inline bool isValidBox(const Box& b) {
    return std::isfinite(b.x) && std::isfinite(b.y)
        && std::isfinite(b.width) && std::isfinite(b.height)
        && b.width >= 0.0f && b.height >= 0.0f;
}

inline AABB toAabb(const Box& b) {
    return AABB{b.x, b.y, b.x + b.width, b.y + b.height};
}

inline Box toBox(const AABB& a) {
    return Box{a.minX, a.minY, a.maxX - a.minX, a.maxY - a.minY};
}

// Open-interval overlap: boxes that only share an edge do not intersect.
inline bool intersects(const AABB& a, const AABB& b) {
    return a.minX < b.maxX && a.maxX > b.minX && a.minY < b.maxY && a.maxY > b.minY;
}

inline AABB unionOf(const AABB& a, const AABB& b) {
    return AABB{
        std::fmin(a.minX, b.minX),
        std::fmin(a.minY, b.minY),
        std::fmax(a.maxX, b.maxX),
        std::fmax(a.maxY, b.maxY),
    };
}

// Caller-supplied geometry source. Returns nullopt for ids that no longer exist.
using BoundsResolver = std::function<std::optional<Box>(const std::string&)>;

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownCommand = 5,
    InvalidOperation = 6,
    InvalidArgument = 7,
    RateLimited = 8,
    NotFound = 9,
    Rejected = 10,
};

enum class LockReason : std::uint8_t {
    Editing = 0,
    Moving = 1,
    Styling = 2,
    Manual = 3,
};

enum class ResolutionMode : std::uint8_t {
    Ownership = 0,
    Shared = 1,
    Timeout = 2,
    Manual = 3,
};

enum class ResolutionAction : std::uint8_t {
    Ownership = 0,
    Shared = 1,
    Cancel = 2,
};

enum class PerformanceMode : std::uint8_t {
    Low = 0,
    Balanced = 1,
    High = 2,
};

enum class HighlightStyle : std::uint8_t {
    Solid = 0,
    Dashed = 1,
};

enum class HighlightAnimation : std::uint8_t {
    None = 0,
    Pulse = 1,
};

// One user's current selection on one whiteboard.
// elementIds is kept sorted and deduplicated by SelectionStore.
struct SelectionRecord {
    std::string userId;
    std::string displayName;
    std::string color;
    std::string whiteboardId;
    std::string sessionId;
    std::vector<std::string> elementIds;
    std::optional<Box> explicitBounds;
    TimeMs timestamp{0};
    std::int32_t priority{0};
    bool isActive{true};
    bool isMultiSelect{false};
    TimeMs lastSeen{0};
};

struct Contender {
    std::string userId;
    std::string displayName;
    std::int32_t priority;
    TimeMs timestamp;

    // Sort order:
    // 1. Priority: higher first
    // 2. Timestamp: earlier claim first
    // 3. User id: lexicographic, so full ties stay deterministic
    bool operator<(const Contender& other) const {
        if (priority != other.priority) return priority > other.priority;
        if (timestamp != other.timestamp) return timestamp < other.timestamp;
        return userId < other.userId;
    }
};

struct ConflictRecord {
    std::string conflictId;
    std::string elementId;
    std::vector<Contender> contenders;
    ResolutionMode resolutionMode{ResolutionMode::Timeout};
};

struct OwnershipRecord {
    std::string elementId;
    std::string ownerId;
    TimeMs acquiredAt{0};
    TimeMs expiresAt{0};
    bool isLocked{false};
    LockReason lockReason{LockReason::Manual};
    std::int32_t priority{0};
};

} // namespace selsync
