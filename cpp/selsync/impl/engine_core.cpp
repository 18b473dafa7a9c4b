// SelectionEngine construction, error state, command buffers and stats
// Part of the engine.h class split

#include "selsync/engine.h"
#include "selsync/command/command_dispatch.h"
#include "selsync/core/logging.h"
#include "selsync/core/string_utils.h"
#include "selsync/core/util.h"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace selsync {

SelectionEngine::SelectionEngine(std::string whiteboardId, std::string currentUserId, EngineConfig config)
    : config_(std::move(config)),
      whiteboardId_(std::move(whiteboardId)),
      currentUserId_(std::move(currentUserId)),
      boundsCache_(config_.boundsCacheCapacity),
      store_(config_.maxElementsPerSelection),
      culler_(boundsCache_, config_.gridCellSize, config_.viewportPadding) {
    if (!isValidId(whiteboardId_)) {
        throw std::invalid_argument("SelectionEngine requires a whiteboard id");
    }
    if (config_.defaultOwnershipTtlMs <= 0 || config_.selectionTimeoutMs <= 0
        || config_.conflictResolutionTimeoutMs < 0 || config_.maintenanceIntervalMs < 0) {
        throw std::invalid_argument("SelectionEngine timing configuration out of range");
    }
    eventBuffer_.reserve(kMaxEvents);
}

void SelectionEngine::setBoundsResolver(BoundsResolver resolver) {
    culler_.setBoundsResolver(std::move(resolver));
    boundsCache_.invalidateAll();
}

void SelectionEngine::setError(EngineError err) {
    lastError_ = err;
    if (err != EngineError::Ok) {
        SELSYNC_LOG_WARN("engine error %u", static_cast<unsigned>(err));
    }
}

EngineError SelectionEngine::finish(EngineError err) {
    setError(err);
    return err;
}

std::uintptr_t SelectionEngine::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void SelectionEngine::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

EngineError SelectionEngine::applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
    return applyCommandBuffer(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}

EngineError SelectionEngine::applyCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount) {
    clearError();

    CommandBufferHeader header{};
    EngineError err = readCommandBufferHeader(src, byteCount, header);
    if (err != EngineError::Ok) return finish(err);

    // Pass 1: framing and payloads, no side effects.
    auto validateCallback = [](void*, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        return validateCommand(op, payload, payloadByteCount);
    };
    err = parseCommandBuffer(src, byteCount, validateCallback, nullptr);
    if (err != EngineError::Ok) {
        SELSYNC_LOG_WARN("command buffer rejected (%u)", static_cast<unsigned>(err));
        return finish(err);
    }

    // Pass 2: apply in order. Semantic failures do not stop the batch.
    struct ApplyContext {
        SelectionEngine* engine;
        TimeMs now;
    };
    ApplyContext ctx{this, msToTime(header.nowMs)};
    auto applyCallback = [](void* raw, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        auto* c = static_cast<ApplyContext*>(raw);
        return dispatchCommand(c->engine, c->now, op, payload, payloadByteCount);
    };
    err = parseCommandBuffer(src, byteCount, applyCallback, &ctx);
    return finish(err);
}

std::vector<SelectionRecord> SelectionEngine::activeSelections() const {
    return store_.activeFor(whiteboardId_, currentUserId_);
}

std::optional<ConflictRecord> SelectionEngine::conflict(const std::string& conflictId) const {
    for (const auto& c : conflicts_) {
        if (c.conflictId == conflictId) return c;
    }
    return std::nullopt;
}

SelectionEngine::EngineStats SelectionEngine::getStats() const {
    const BoundsCacheStats cache = boundsCache_.stats();
    const IndexStats selections = culler_.selectionIndexStats();
    const IndexStats elements = culler_.elementIndexStats();
    return EngineStats{
        generation_,
        static_cast<std::uint32_t>(store_.size(whiteboardId_)),
        static_cast<std::uint32_t>(conflicts_.size()),
        static_cast<std::uint32_t>(ownershipManager_.size()),
        selections.entryCount,
        elements.entryCount,
        selections.cellCount + elements.cellCount,
        cache.entries,
        cache.hits,
        cache.misses,
        rateLimitedUpdates_,
        autoResolvedConflicts_,
        sweepCount_,
        lastSweepMs_,
        lastQueryMs_,
    };
}

} // namespace selsync
