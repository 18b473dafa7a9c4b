#include "selsync/ownership/ownership_manager.h"

#include "selsync/core/logging.h"
#include "selsync/core/string_utils.h"

#include <algorithm>

namespace selsync {

namespace {

TimeMs expiryFor(TimeMs now, TimeMs ttlMs) {
    const TimeMs ttl = std::min(ttlMs, kMaxTimeMs);
    if (now > kMaxTimeMs - ttl) return kMaxTimeMs;
    return now + ttl;
}

} // namespace

void OwnershipManager::insertRecord(OwnershipRecord record) {
    schedule_.insert({record.expiresAt, record.elementId});
    byOwner_[record.ownerId].insert(record.elementId);
    const std::string elementId = record.elementId;
    records_[elementId] = std::move(record);
    generation_++;
}

void OwnershipManager::eraseRecord(const std::string& elementId) {
    auto it = records_.find(elementId);
    if (it == records_.end()) return;
    schedule_.erase({it->second.expiresAt, elementId});
    auto owner = byOwner_.find(it->second.ownerId);
    if (owner != byOwner_.end()) {
        owner->second.erase(elementId);
        if (owner->second.empty()) byOwner_.erase(owner);
    }
    records_.erase(it);
    generation_++;
}

AcquireResult OwnershipManager::acquire(const OwnershipRequest& request, TimeMs now) {
    if (!isValidId(request.elementId) || !isValidId(request.userId) || request.ttlMs <= 0) {
        return AcquireResult{false, AcquireStatus::RejectedInvalid, std::nullopt, std::nullopt};
    }

    OwnershipRecord next{
        request.elementId,
        request.userId,
        now,
        expiryFor(now, request.ttlMs),
        request.hardLock,
        request.reason,
        request.priority,
    };

    auto it = records_.find(request.elementId);
    if (it != records_.end() && it->second.expiresAt <= now) {
        eraseRecord(request.elementId);
        it = records_.end();
    }

    if (it == records_.end()) {
        insertRecord(next);
        SELSYNC_LOG_DEBUG("ownership granted element=%s owner=%s", request.elementId.c_str(), request.userId.c_str());
        return AcquireResult{true, AcquireStatus::Granted, std::move(next), std::nullopt};
    }

    const OwnershipRecord current = it->second;
    if (current.ownerId == request.userId) {
        next.acquiredAt = std::min(current.acquiredAt, now);
        eraseRecord(request.elementId);
        insertRecord(next);
        return AcquireResult{true, AcquireStatus::Refreshed, std::move(next), std::nullopt};
    }

    if (current.isLocked) {
        SELSYNC_LOG_DEBUG("ownership rejected element=%s held by %s", request.elementId.c_str(), current.ownerId.c_str());
        return AcquireResult{false, AcquireStatus::RejectedLocked, current, std::nullopt};
    }
    if (request.priority <= current.priority) {
        return AcquireResult{false, AcquireStatus::RejectedPriority, current, std::nullopt};
    }

    eraseRecord(request.elementId);
    insertRecord(next);
    SELSYNC_LOG_DEBUG("ownership preempted element=%s from %s to %s", request.elementId.c_str(),
                      current.ownerId.c_str(), request.userId.c_str());
    return AcquireResult{true, AcquireStatus::Preempted, std::move(next), current};
}

AcquireResult OwnershipManager::acquire(const std::string& elementId, const std::string& userId, TimeMs ttlMs, LockReason reason, TimeMs now) {
    OwnershipRequest request;
    request.elementId = elementId;
    request.userId = userId;
    request.ttlMs = ttlMs;
    request.reason = reason;
    return acquire(request, now);
}

bool OwnershipManager::renew(const std::string& elementId, const std::string& userId, TimeMs ttlMs, TimeMs now) {
    if (ttlMs <= 0) return false;
    auto it = records_.find(elementId);
    if (it == records_.end()) return false;
    if (it->second.ownerId != userId) return false;
    if (it->second.expiresAt <= now) return false;

    OwnershipRecord renewed = it->second;
    renewed.expiresAt = expiryFor(now, ttlMs);
    eraseRecord(elementId);
    insertRecord(std::move(renewed));
    return true;
}

bool OwnershipManager::release(const std::string& elementId, const std::string& userId) {
    auto it = records_.find(elementId);
    if (it == records_.end()) return false;
    if (it->second.ownerId != userId) return false;
    eraseRecord(elementId);
    return true;
}

std::vector<std::string> OwnershipManager::releaseAllFor(const std::string& userId) {
    std::vector<std::string> released;
    auto owner = byOwner_.find(userId);
    if (owner == byOwner_.end()) return released;
    released.assign(owner->second.begin(), owner->second.end());
    for (const auto& elementId : released) {
        eraseRecord(elementId);
    }
    return released;
}

std::vector<OwnershipRecord> OwnershipManager::expireAll(TimeMs now) {
    std::vector<OwnershipRecord> expired;
    while (!schedule_.empty() && schedule_.begin()->first <= now) {
        const std::string elementId = schedule_.begin()->second;
        auto it = records_.find(elementId);
        if (it == records_.end()) {
            schedule_.erase(schedule_.begin());
            continue;
        }
        expired.push_back(it->second);
        eraseRecord(elementId);
    }
    if (!expired.empty()) {
        SELSYNC_LOG_DEBUG("expireAll now=%lld expired=%zu", static_cast<long long>(now), expired.size());
    }
    return expired;
}

std::optional<OwnershipRecord> OwnershipManager::get(const std::string& elementId, TimeMs now) const {
    auto it = records_.find(elementId);
    if (it == records_.end() || it->second.expiresAt <= now) return std::nullopt;
    return it->second;
}

TimeMs OwnershipManager::remainingMs(const std::string& elementId, TimeMs now) const {
    auto it = records_.find(elementId);
    if (it == records_.end() || it->second.expiresAt <= now) return 0;
    return it->second.expiresAt - now;
}

std::vector<OwnershipRecord> OwnershipManager::snapshot(TimeMs now) const {
    std::vector<OwnershipRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        if (kv.second.expiresAt > now) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const OwnershipRecord& a, const OwnershipRecord& b) {
        return a.elementId < b.elementId;
    });
    return out;
}

} // namespace selsync
