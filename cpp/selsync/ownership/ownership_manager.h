#pragma once

#include "selsync/core/types.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace selsync {

struct OwnershipRequest {
    std::string elementId;
    std::string userId;
    TimeMs ttlMs{kDefaultOwnershipTtlMs};
    LockReason reason{LockReason::Manual};
    std::int32_t priority{0};
    bool hardLock{true};
};

enum class AcquireStatus : std::uint8_t {
    Granted = 0,
    Refreshed = 1,        // caller already owned the element
    Preempted = 2,        // displaced a lower-priority soft hold
    RejectedLocked = 3,   // another owner holds a hard lock
    RejectedPriority = 4, // soft hold of equal or higher priority
    RejectedInvalid = 5,  // bad ids or non-positive ttl
};

struct AcquireResult {
    bool granted;
    AcquireStatus status;
    std::optional<OwnershipRecord> record;
    std::optional<OwnershipRecord> displaced;
};

/**
 * Exclusive, time-limited element locks.
 *
 * Expiry is driven by one schedule ordered by expiresAt and drained by
 * expireAll(now); there are no per-record timers. Lookups take the query time
 * and treat records with expiresAt <= now as absent even before a sweep.
 */
class OwnershipManager {
public:
    AcquireResult acquire(const OwnershipRequest& request, TimeMs now);
    AcquireResult acquire(const std::string& elementId, const std::string& userId, TimeMs ttlMs, LockReason reason, TimeMs now);

    bool renew(const std::string& elementId, const std::string& userId, TimeMs ttlMs, TimeMs now);
    bool release(const std::string& elementId, const std::string& userId);
    // Returns the released element ids, sorted.
    std::vector<std::string> releaseAllFor(const std::string& userId);

    // Removes every record with expiresAt <= now, in expiry order.
    std::vector<OwnershipRecord> expireAll(TimeMs now);

    std::optional<OwnershipRecord> get(const std::string& elementId, TimeMs now) const;
    TimeMs remainingMs(const std::string& elementId, TimeMs now) const;
    // Live records sorted by elementId.
    std::vector<OwnershipRecord> snapshot(TimeMs now) const;

    std::size_t size() const noexcept { return records_.size(); }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    std::unordered_map<std::string, OwnershipRecord> records_;
    std::set<std::pair<TimeMs, std::string>> schedule_;
    // Owner id -> element ids
    std::unordered_map<std::string, std::set<std::string>> byOwner_;
    std::uint32_t generation_ = 0;

    void insertRecord(OwnershipRecord record);
    void eraseRecord(const std::string& elementId);
};

} // namespace selsync
