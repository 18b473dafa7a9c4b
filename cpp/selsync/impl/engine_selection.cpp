// SelectionEngine selection admission, conflicts and maintenance sweeps
// Part of the engine.h class split

#include "selsync/engine.h"
#include "selsync/core/logging.h"
#include "selsync/core/string_utils.h"
#include "selsync/core/util.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace selsync {

namespace {

bool sameContenders(const std::vector<Contender>& a, const std::vector<Contender>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].userId != b[i].userId || a[i].displayName != b[i].displayName
            || a[i].priority != b[i].priority || a[i].timestamp != b[i].timestamp) {
            return false;
        }
    }
    return true;
}

bool sameConflicts(const std::vector<ConflictRecord>& a, const std::vector<ConflictRecord>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].conflictId != b[i].conflictId || a[i].resolutionMode != b[i].resolutionMode) return false;
        if (!sameContenders(a[i].contenders, b[i].contenders)) return false;
    }
    return true;
}

} // namespace

bool SelectionEngine::allowUpdate(const std::string& userId, TimeMs now) {
    if (config_.maxUpdatesPerSecond == 0) return true;
    auto& window = updateWindows_[userId];
    while (!window.empty() && window.front() <= now - kRateLimitWindowMs) {
        window.pop_front();
    }
    if (window.size() >= config_.maxUpdatesPerSecond) return false;
    window.push_back(now);
    return true;
}

void SelectionEngine::pruneRateWindows(TimeMs now) {
    for (auto it = updateWindows_.begin(); it != updateWindows_.end();) {
        auto& window = it->second;
        while (!window.empty() && window.front() <= now - kRateLimitWindowMs) {
            window.pop_front();
        }
        if (window.empty()) {
            it = updateWindows_.erase(it);
        } else {
            ++it;
        }
    }
}

EngineError SelectionEngine::applySelectionUpdate(const SelectionUpdateEvent& event, TimeMs now) {
    if (!isValidId(event.userId) || !isValidId(event.whiteboardId)) {
        return finish(EngineError::InvalidArgument);
    }
    if (event.whiteboardId != whiteboardId_) {
        SELSYNC_LOG_WARN("selection update for board %s ignored by %s", event.whiteboardId.c_str(), whiteboardId_.c_str());
        return finish(EngineError::InvalidArgument);
    }
    if (!allowUpdate(event.userId, now)) {
        rateLimitedUpdates_++;
        SELSYNC_LOG_WARN("selection update rate limited for user %s", event.userId.c_str());
        return finish(EngineError::RateLimited);
    }

    SelectionRecord record;
    record.userId = event.userId;
    record.displayName = event.userName;
    record.color = event.userColor;
    record.whiteboardId = event.whiteboardId;
    record.sessionId = event.sessionId;
    record.elementIds = event.elementIds;
    record.explicitBounds = event.selectionBounds;
    record.timestamp = event.timestamp != 0 ? event.timestamp : now;
    record.priority = event.priority;
    record.isActive = event.isActive;
    record.lastSeen = event.lastSeen != 0 ? event.lastSeen : now;

    const std::uint32_t before = store_.generation();
    const AdmitResult result = store_.admit(std::move(record));
    if (result == AdmitResult::Rejected) {
        return finish(EngineError::InvalidArgument);
    }
    if (store_.generation() != before) {
        generation_++;
        recordSelectionChanged(result == AdmitResult::Removed ? ChangeMask::Removed : ChangeMask::Admitted);
        refreshConflicts(now);
    }
    return finish(EngineError::Ok);
}

EngineError SelectionEngine::removeUser(const std::string& userId, TimeMs now) {
    if (!isValidId(userId)) return finish(EngineError::InvalidArgument);

    const bool removed = store_.remove(whiteboardId_, userId);
    const std::vector<std::string> released = ownershipManager_.releaseAllFor(userId);
    updateWindows_.erase(userId);
    if (!removed && released.empty()) {
        return finish(EngineError::NotFound);
    }

    SELSYNC_LOG_DEBUG("removeUser %s selection=%d released=%zu", userId.c_str(), removed ? 1 : 0, released.size());
    generation_++;
    if (removed) recordSelectionChanged(ChangeMask::Removed);
    if (!released.empty()) recordOwnershipChanged(ChangeMask::Released);
    refreshConflicts(now);
    return finish(EngineError::Ok);
}

void SelectionEngine::refreshConflicts(TimeMs now) {
    ResolveContext context;
    for (const auto& record : ownershipManager_.snapshot(now)) {
        context.owners.emplace(record.elementId, record.ownerId);
    }
    context.sharedElements = sharedElements_;
    if (config_.allowSharedSelection) {
        context.defaultMode = ResolutionMode::Shared;
    } else if (config_.enableAutomaticConflictResolution) {
        context.defaultMode = ResolutionMode::Timeout;
    } else {
        context.defaultMode = ResolutionMode::Manual;
    }

    std::vector<ConflictRecord> next = conflictResolver_.recompute(store_.activeFor(whiteboardId_), context);

    std::unordered_set<std::string> present;
    present.reserve(next.size());
    for (const auto& c : next) {
        present.insert(c.elementId);
        conflictSince_.emplace(c.elementId, now);
    }
    for (auto it = conflictSince_.begin(); it != conflictSince_.end();) {
        it = present.count(it->first) ? std::next(it) : conflictSince_.erase(it);
    }
    // A shared resolution lasts as long as the conflict it resolved.
    for (auto it = sharedElements_.begin(); it != sharedElements_.end();) {
        it = present.count(*it) ? std::next(it) : sharedElements_.erase(it);
    }

    if (!sameConflicts(next, conflicts_)) {
        conflicts_ = std::move(next);
        recordConflictsChanged();
    }
}

SelectionEngine::ResolutionOutcome SelectionEngine::resolveConflict(const ConflictResolutionCommand& command, TimeMs now) {
    std::optional<ConflictRecord> target = conflict(command.conflictId);
    if (!target) {
        return ResolutionOutcome{finish(EngineError::NotFound), std::nullopt};
    }

    SELSYNC_LOG_DEBUG("resolveConflict %s action=%u by %s", command.conflictId.c_str(),
                      static_cast<unsigned>(command.resolution), command.resolverId.c_str());

    switch (command.resolution) {
        case ResolutionAction::Cancel:
            return ResolutionOutcome{finish(EngineError::Ok), std::nullopt};
        case ResolutionAction::Shared:
            sharedElements_.insert(target->elementId);
            generation_++;
            refreshConflicts(now);
            return ResolutionOutcome{finish(EngineError::Ok), std::nullopt};
        case ResolutionAction::Ownership: {
            std::optional<OwnershipRecord> granted;
            const EngineError err = resolveWithOwnership(*target, now, granted);
            return ResolutionOutcome{finish(err), std::move(granted)};
        }
    }
    return ResolutionOutcome{finish(EngineError::InvalidArgument), std::nullopt};
}

EngineError SelectionEngine::resolveWithOwnership(const ConflictRecord& conflict, TimeMs now, std::optional<OwnershipRecord>& granted) {
    if (conflict.contenders.empty()) return EngineError::InvalidOperation;

    // A contender that already holds the element wins; otherwise the top-ranked one.
    const std::optional<OwnershipRecord> held = ownershipManager_.get(conflict.elementId, now);
    std::size_t winnerIndex = 0;
    if (held) {
        for (std::size_t i = 0; i < conflict.contenders.size(); ++i) {
            if (conflict.contenders[i].userId == held->ownerId) {
                winnerIndex = i;
                break;
            }
        }
    }
    const Contender& winner = conflict.contenders[winnerIndex];

    // Resolution grants a soft hold: a later higher-priority request may still take it.
    OwnershipRequest request;
    request.elementId = conflict.elementId;
    request.userId = winner.userId;
    request.ttlMs = config_.defaultOwnershipTtlMs;
    request.reason = LockReason::Manual;
    request.priority = winner.priority;
    request.hardLock = false;
    if (held && held->ownerId == winner.userId) {
        request.hardLock = held->isLocked;
        request.reason = held->lockReason;
        request.priority = std::max(winner.priority, held->priority);
    }

    const AcquireResult result = ownershipManager_.acquire(request, now);
    if (!result.granted) {
        SELSYNC_LOG_DEBUG("conflict %s not resolved, element held by another owner", conflict.conflictId.c_str());
        return EngineError::Rejected;
    }
    granted = result.record;
    recordOwnershipChanged(ChangeMask::Acquired);

    for (std::size_t i = 0; i < conflict.contenders.size(); ++i) {
        if (i == winnerIndex) continue;
        store_.dropElement(whiteboardId_, conflict.contenders[i].userId, conflict.elementId);
    }
    recordSelectionChanged(ChangeMask::Resolved);
    sharedElements_.erase(conflict.elementId);
    generation_++;
    refreshConflicts(now);
    return EngineError::Ok;
}

void SelectionEngine::autoResolveConflicts(TimeMs now) {
    if (!config_.enableAutomaticConflictResolution || config_.allowSharedSelection) return;

    std::vector<ConflictRecord> due;
    for (const auto& c : conflicts_) {
        if (c.resolutionMode != ResolutionMode::Timeout) continue;
        auto since = conflictSince_.find(c.elementId);
        if (since == conflictSince_.end()) continue;
        if (now - since->second >= config_.conflictResolutionTimeoutMs) due.push_back(c);
    }

    for (const auto& c : due) {
        std::optional<OwnershipRecord> granted;
        if (resolveWithOwnership(c, now, granted) == EngineError::Ok) {
            autoResolvedConflicts_++;
            SELSYNC_LOG_DEBUG("conflict %s auto-resolved", c.conflictId.c_str());
        }
    }
}

bool SelectionEngine::tick(TimeMs now) {
    if (hasSwept_ && now - lastSweepAt_ < config_.maintenanceIntervalMs) return false;
    runMaintenance(now);
    return true;
}

void SelectionEngine::forceMaintenance(TimeMs now) {
    runMaintenance(now);
}

void SelectionEngine::runMaintenance(TimeMs now) {
    const double t0 = getNowMs();

    const std::vector<std::string> expiredUsers = store_.expireStale(whiteboardId_, now, config_.selectionTimeoutMs);
    if (!expiredUsers.empty()) {
        generation_++;
        recordSelectionChanged(ChangeMask::Expired);
    }

    const std::vector<OwnershipRecord> expiredLocks = ownershipManager_.expireAll(now);
    if (!expiredLocks.empty()) {
        generation_++;
        recordOwnershipChanged(ChangeMask::Expired);
    }

    refreshConflicts(now);
    autoResolveConflicts(now);
    pruneRateWindows(now);

    hasSwept_ = true;
    lastSweepAt_ = now;
    sweepCount_++;
    lastSweepMs_ = static_cast<float>(getNowMs() - t0);
    SELSYNC_LOG_DEBUG("sweep now=%lld selections=%zu locks=%zu", static_cast<long long>(now),
                      expiredUsers.size(), expiredLocks.size());
}

} // namespace selsync
