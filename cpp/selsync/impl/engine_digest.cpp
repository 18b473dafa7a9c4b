// engine_digest.cpp - Session state digest for SelectionEngine
// Two hosts that applied the same events must produce the same digest, so
// host-local values (current user, viewport, lastSeen, stats) are excluded.

#include "selsync/engine.h"
#include "selsync/core/string_utils.h"

namespace selsync {

std::uint64_t SelectionEngine::getStateDigest(TimeMs now) const {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x434E5953u); // "SYNC" marker
    h = hashU32(h, commandVersionSscb);
    h = hashString(h, whiteboardId_);

    const std::vector<SelectionRecord> selections = store_.activeFor(whiteboardId_);
    h = hashU32(h, static_cast<std::uint32_t>(selections.size()));
    for (const auto& record : selections) {
        h = hashString(h, record.userId);
        h = hashString(h, record.displayName);
        h = hashString(h, record.color);
        h = hashString(h, record.sessionId);
        h = hashU64(h, static_cast<std::uint64_t>(record.timestamp));
        h = hashU32(h, static_cast<std::uint32_t>(record.priority));
        h = hashU32(h, static_cast<std::uint32_t>(record.elementIds.size()));
        for (const auto& id : record.elementIds) {
            h = hashString(h, id);
        }
        h = hashU32(h, record.explicitBounds ? 1u : 0u);
        if (record.explicitBounds) {
            h = hashF32(h, record.explicitBounds->x);
            h = hashF32(h, record.explicitBounds->y);
            h = hashF32(h, record.explicitBounds->width);
            h = hashF32(h, record.explicitBounds->height);
        }
    }

    h = hashU32(h, static_cast<std::uint32_t>(conflicts_.size()));
    for (const auto& c : conflicts_) {
        h = hashString(h, c.conflictId);
        h = hashU32(h, static_cast<std::uint32_t>(c.resolutionMode));
        h = hashU32(h, static_cast<std::uint32_t>(c.contenders.size()));
        for (const auto& contender : c.contenders) {
            h = hashString(h, contender.userId);
        }
    }

    const std::vector<OwnershipRecord> owned = ownershipManager_.snapshot(now);
    h = hashU32(h, static_cast<std::uint32_t>(owned.size()));
    for (const auto& record : owned) {
        h = hashString(h, record.elementId);
        h = hashString(h, record.ownerId);
        h = hashU64(h, static_cast<std::uint64_t>(record.acquiredAt));
        h = hashU64(h, static_cast<std::uint64_t>(record.expiresAt));
        h = hashU32(h, record.isLocked ? 1u : 0u);
        h = hashU32(h, static_cast<std::uint32_t>(record.lockReason));
        h = hashU32(h, static_cast<std::uint32_t>(record.priority));
    }

    return h;
}

} // namespace selsync
