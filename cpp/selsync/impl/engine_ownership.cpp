// SelectionEngine ownership requests
// Part of the engine.h class split

#include "selsync/engine.h"
#include "selsync/core/logging.h"

namespace selsync {

AcquireResult SelectionEngine::requestOwnership(const OwnershipRequest& request, TimeMs now) {
    AcquireResult result = ownershipManager_.acquire(request, now);
    if (!result.granted) {
        setError(result.status == AcquireStatus::RejectedInvalid ? EngineError::InvalidArgument : EngineError::Rejected);
        return result;
    }

    generation_++;
    recordOwnershipChanged(ChangeMask::Acquired);
    refreshConflicts(now);
    setError(EngineError::Ok);
    return result;
}

EngineError SelectionEngine::renewOwnership(const std::string& elementId, const std::string& userId, TimeMs ttlMs, TimeMs now) {
    if (!ownershipManager_.renew(elementId, userId, ttlMs, now)) {
        return finish(EngineError::Rejected);
    }
    generation_++;
    recordOwnershipChanged(ChangeMask::Acquired);
    return finish(EngineError::Ok);
}

EngineError SelectionEngine::releaseOwnership(const std::string& elementId, const std::string& userId, TimeMs now) {
    if (!ownershipManager_.release(elementId, userId)) {
        return finish(EngineError::Rejected);
    }
    SELSYNC_LOG_DEBUG("ownership released element=%s owner=%s", elementId.c_str(), userId.c_str());
    generation_++;
    recordOwnershipChanged(ChangeMask::Released);
    refreshConflicts(now);
    return finish(EngineError::Ok);
}

std::optional<OwnershipRecord> SelectionEngine::ownership(const std::string& elementId, TimeMs now) const {
    return ownershipManager_.get(elementId, now);
}

std::vector<OwnershipRecord> SelectionEngine::ownerships(TimeMs now) const {
    return ownershipManager_.snapshot(now);
}

TimeMs SelectionEngine::ownershipRemainingMs(const std::string& elementId, TimeMs now) const {
    return ownershipManager_.remainingMs(elementId, now);
}

} // namespace selsync
