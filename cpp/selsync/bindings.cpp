#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "selsync/engine.h"
#include "selsync/core/util.h"

#ifdef EMSCRIPTEN
using selsync::SelectionEngine;
using selsync::msToTime;

namespace {

// Host-side geometry callback: fn(elementId) -> {x, y, width, height} | null
selsync::BoundsResolver makeJsResolver(emscripten::val fn) {
    return [fn](const std::string& elementId) -> std::optional<selsync::Box> {
        emscripten::val b = fn(elementId);
        if (b.isNull() || b.isUndefined()) return std::nullopt;
        return selsync::Box{
            b["x"].as<float>(),
            b["y"].as<float>(),
            b["width"].as<float>(),
            b["height"].as<float>(),
        };
    };
}

struct OwnershipGrant {
    bool granted;
    std::uint32_t status;
    double expiresAt;
};

} // namespace

EMSCRIPTEN_BINDINGS(selsync_module) {
    emscripten::enum_<selsync::EngineError>("EngineError")
        .value("Ok", selsync::EngineError::Ok)
        .value("InvalidMagic", selsync::EngineError::InvalidMagic)
        .value("UnsupportedVersion", selsync::EngineError::UnsupportedVersion)
        .value("BufferTruncated", selsync::EngineError::BufferTruncated)
        .value("InvalidPayloadSize", selsync::EngineError::InvalidPayloadSize)
        .value("UnknownCommand", selsync::EngineError::UnknownCommand)
        .value("InvalidOperation", selsync::EngineError::InvalidOperation)
        .value("InvalidArgument", selsync::EngineError::InvalidArgument)
        .value("RateLimited", selsync::EngineError::RateLimited)
        .value("NotFound", selsync::EngineError::NotFound)
        .value("Rejected", selsync::EngineError::Rejected);

    emscripten::enum_<selsync::PerformanceMode>("PerformanceMode")
        .value("Low", selsync::PerformanceMode::Low)
        .value("Balanced", selsync::PerformanceMode::Balanced)
        .value("High", selsync::PerformanceMode::High);

    emscripten::enum_<selsync::LockReason>("LockReason")
        .value("Editing", selsync::LockReason::Editing)
        .value("Moving", selsync::LockReason::Moving)
        .value("Styling", selsync::LockReason::Styling)
        .value("Manual", selsync::LockReason::Manual);

    emscripten::enum_<selsync::ResolutionMode>("ResolutionMode")
        .value("Ownership", selsync::ResolutionMode::Ownership)
        .value("Shared", selsync::ResolutionMode::Shared)
        .value("Timeout", selsync::ResolutionMode::Timeout)
        .value("Manual", selsync::ResolutionMode::Manual);

    emscripten::enum_<selsync::HighlightStyle>("HighlightStyle")
        .value("Solid", selsync::HighlightStyle::Solid)
        .value("Dashed", selsync::HighlightStyle::Dashed);

    emscripten::enum_<selsync::HighlightAnimation>("HighlightAnimation")
        .value("None", selsync::HighlightAnimation::None)
        .value("Pulse", selsync::HighlightAnimation::Pulse);

    emscripten::class_<SelectionEngine>("SelectionEngine")
        .constructor(emscripten::optional_override([](std::string whiteboardId, std::string currentUserId, selsync::PerformanceMode mode) {
            return new SelectionEngine(std::move(whiteboardId), std::move(currentUserId),
                                       SelectionEngine::EngineConfig::forPerformanceMode(mode));
        }), emscripten::allow_raw_pointers())
        .function("setBoundsResolver", emscripten::optional_override([](SelectionEngine& self, emscripten::val fn) {
            self.setBoundsResolver(makeJsResolver(fn));
        }))
        .function("allocBytes", &SelectionEngine::allocBytes)
        .function("freeBytes", &SelectionEngine::freeBytes)
        .function("applyCommandBuffer", emscripten::select_overload<selsync::EngineError(std::uintptr_t, std::uint32_t)>(&SelectionEngine::applyCommandBuffer))
        .function("requestOwnership", emscripten::optional_override([](SelectionEngine& self, std::string elementId, std::string userId, double ttlMs, selsync::LockReason reason, double now) {
            selsync::OwnershipRequest request;
            request.elementId = std::move(elementId);
            request.userId = std::move(userId);
            request.ttlMs = msToTime(ttlMs);
            request.reason = reason;
            const selsync::AcquireResult r = self.requestOwnership(request, msToTime(now));
            return OwnershipGrant{
                r.granted,
                static_cast<std::uint32_t>(r.status),
                r.record ? static_cast<double>(r.record->expiresAt) : 0.0,
            };
        }))
        .function("releaseOwnership", emscripten::optional_override([](SelectionEngine& self, std::string elementId, std::string userId, double now) {
            return self.releaseOwnership(elementId, userId, msToTime(now));
        }))
        .function("removeUser", emscripten::optional_override([](SelectionEngine& self, std::string userId, double now) {
            return self.removeUser(userId, msToTime(now));
        }))
        .function("setViewport", emscripten::optional_override([](SelectionEngine& self, float x, float y, float width, float height, float tx, float ty, float zoom) {
            return self.setViewport(selsync::Viewport{x, y, width, height, selsync::CanvasTransform{tx, ty, zoom}});
        }))
        .function("invalidateBounds", &SelectionEngine::invalidateBounds)
        .function("invalidateAllBounds", &SelectionEngine::invalidateAllBounds)
        .function("tick", emscripten::optional_override([](SelectionEngine& self, double now) {
            return self.tick(msToTime(now));
        }))
        .function("forceMaintenance", emscripten::optional_override([](SelectionEngine& self, double now) {
            self.forceMaintenance(msToTime(now));
        }))
        .function("ownershipRemainingMs", emscripten::optional_override([](const SelectionEngine& self, std::string elementId, double now) {
            return static_cast<double>(self.ownershipRemainingMs(elementId, msToTime(now)));
        }))
        .function("query", emscripten::optional_override([](SelectionEngine& self, double now) {
            return self.query(msToTime(now));
        }))
        .function("getStateDigest", emscripten::optional_override([](const SelectionEngine& self, double now) {
            return static_cast<double>(self.getStateDigest(msToTime(now)));
        }))
        .function("pollEvents", &SelectionEngine::pollEvents)
        .function("ackResync", &SelectionEngine::ackResync)
        .function("getStats", &SelectionEngine::getStats)
        .function("getLastError", &SelectionEngine::getLastError)
        .function("clearError", &SelectionEngine::clearError)
        .function("getGeneration", &SelectionEngine::getGeneration);

    emscripten::value_object<OwnershipGrant>("OwnershipGrant")
        .field("granted", &OwnershipGrant::granted)
        .field("status", &OwnershipGrant::status)
        .field("expiresAt", &OwnershipGrant::expiresAt);

    emscripten::value_object<selsync::Box>("Box")
        .field("x", &selsync::Box::x)
        .field("y", &selsync::Box::y)
        .field("width", &selsync::Box::width)
        .field("height", &selsync::Box::height);

    emscripten::value_object<selsync::Contender>("Contender")
        .field("userId", &selsync::Contender::userId)
        .field("displayName", &selsync::Contender::displayName)
        .field("priority", &selsync::Contender::priority)
        .field("timestamp", &selsync::Contender::timestamp);

    emscripten::value_object<selsync::ConflictRecord>("ConflictRecord")
        .field("conflictId", &selsync::ConflictRecord::conflictId)
        .field("elementId", &selsync::ConflictRecord::elementId)
        .field("contenders", &selsync::ConflictRecord::contenders)
        .field("resolutionMode", &selsync::ConflictRecord::resolutionMode);

    emscripten::value_object<selsync::OwnershipRecord>("OwnershipRecord")
        .field("elementId", &selsync::OwnershipRecord::elementId)
        .field("ownerId", &selsync::OwnershipRecord::ownerId)
        .field("acquiredAt", &selsync::OwnershipRecord::acquiredAt)
        .field("expiresAt", &selsync::OwnershipRecord::expiresAt)
        .field("isLocked", &selsync::OwnershipRecord::isLocked)
        .field("lockReason", &selsync::OwnershipRecord::lockReason)
        .field("priority", &selsync::OwnershipRecord::priority);

    emscripten::value_object<selsync::protocol::HighlightHint>("HighlightHint")
        .field("userId", &selsync::protocol::HighlightHint::userId)
        .field("userName", &selsync::protocol::HighlightHint::userName)
        .field("userColor", &selsync::protocol::HighlightHint::userColor)
        .field("elementIds", &selsync::protocol::HighlightHint::elementIds)
        .field("bounds", &selsync::protocol::HighlightHint::bounds)
        .field("opacity", &selsync::protocol::HighlightHint::opacity)
        .field("style", &selsync::protocol::HighlightHint::style)
        .field("animation", &selsync::protocol::HighlightHint::animation)
        .field("isCurrentUser", &selsync::protocol::HighlightHint::isCurrentUser)
        .field("hasConflict", &selsync::protocol::HighlightHint::hasConflict);

    emscripten::value_object<selsync::protocol::QueryStats>("QueryStats")
        .field("totalSelections", &selsync::protocol::QueryStats::totalSelections)
        .field("visibleSelections", &selsync::protocol::QueryStats::visibleSelections)
        .field("culledSelections", &selsync::protocol::QueryStats::culledSelections)
        .field("truncatedSelections", &selsync::protocol::QueryStats::truncatedSelections)
        .field("totalConflicts", &selsync::protocol::QueryStats::totalConflicts)
        .field("visibleConflicts", &selsync::protocol::QueryStats::visibleConflicts)
        .field("totalOwnerships", &selsync::protocol::QueryStats::totalOwnerships)
        .field("visibleOwnerships", &selsync::protocol::QueryStats::visibleOwnerships)
        .field("queryMs", &selsync::protocol::QueryStats::queryMs);

    emscripten::value_object<SelectionEngine::QueryResult>("QueryResult")
        .field("highlights", &SelectionEngine::QueryResult::highlights)
        .field("conflicts", &SelectionEngine::QueryResult::conflicts)
        .field("ownerships", &SelectionEngine::QueryResult::ownerships)
        .field("stats", &SelectionEngine::QueryResult::stats);

    emscripten::value_object<SelectionEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &SelectionEngine::EventBufferMeta::generation)
        .field("count", &SelectionEngine::EventBufferMeta::count)
        .field("ptr", &SelectionEngine::EventBufferMeta::ptr);

    emscripten::value_object<SelectionEngine::EngineStats>("EngineStats")
        .field("generation", &SelectionEngine::EngineStats::generation)
        .field("selectionCount", &SelectionEngine::EngineStats::selectionCount)
        .field("conflictCount", &SelectionEngine::EngineStats::conflictCount)
        .field("ownershipCount", &SelectionEngine::EngineStats::ownershipCount)
        .field("indexedSelections", &SelectionEngine::EngineStats::indexedSelections)
        .field("indexedElements", &SelectionEngine::EngineStats::indexedElements)
        .field("gridCells", &SelectionEngine::EngineStats::gridCells)
        .field("boundsCacheEntries", &SelectionEngine::EngineStats::boundsCacheEntries)
        .field("boundsCacheHits", &SelectionEngine::EngineStats::boundsCacheHits)
        .field("boundsCacheMisses", &SelectionEngine::EngineStats::boundsCacheMisses)
        .field("rateLimitedUpdates", &SelectionEngine::EngineStats::rateLimitedUpdates)
        .field("autoResolvedConflicts", &SelectionEngine::EngineStats::autoResolvedConflicts)
        .field("sweepCount", &SelectionEngine::EngineStats::sweepCount)
        .field("lastSweepMs", &SelectionEngine::EngineStats::lastSweepMs)
        .field("lastQueryMs", &SelectionEngine::EngineStats::lastQueryMs);

    emscripten::register_vector<std::string>("VectorString");
    emscripten::register_vector<selsync::Contender>("VectorContender");
    emscripten::register_vector<selsync::ConflictRecord>("VectorConflictRecord");
    emscripten::register_vector<selsync::OwnershipRecord>("VectorOwnershipRecord");
    emscripten::register_vector<selsync::protocol::HighlightHint>("VectorHighlightHint");
}
#endif
