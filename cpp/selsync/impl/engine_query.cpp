// SelectionEngine viewport, bounds invalidation and render queries
// Part of the engine.h class split

#include "selsync/engine.h"
#include "selsync/core/util.h"

#include <algorithm>
#include <unordered_set>

namespace selsync {

EngineError SelectionEngine::setViewport(const Viewport& viewport) {
    if (!ViewportCuller::worldRegion(viewport, 0.0f)) {
        return finish(EngineError::InvalidArgument);
    }
    viewport_ = viewport;
    hasViewport_ = true;
    generation_++;
    recordViewportChanged();
    return finish(EngineError::Ok);
}

void SelectionEngine::invalidateBounds(const std::string& elementId) {
    boundsCache_.invalidate(elementId);
}

void SelectionEngine::invalidateAllBounds() {
    boundsCache_.invalidateAll();
}

protocol::HighlightHint SelectionEngine::makeHighlight(const SelectionRecord& record, const Box& bounds, bool hasConflict) const {
    const protocol::PerformancePreset preset = config_.preset();
    const bool isCurrentUser = !currentUserId_.empty() && record.userId == currentUserId_;

    float opacity = isCurrentUser ? kOpacityCurrentUser : kOpacityDefault;
    HighlightStyle style = HighlightStyle::Solid;
    HighlightAnimation animation = HighlightAnimation::None;
    if (hasConflict) {
        opacity = kOpacityConflict;
        style = preset.simplifiedStyles ? HighlightStyle::Solid : HighlightStyle::Dashed;
        if (preset.animations) animation = HighlightAnimation::Pulse;
    }

    return protocol::HighlightHint{
        record.userId,
        record.displayName,
        record.color,
        record.elementIds,
        bounds,
        opacity,
        style,
        animation,
        isCurrentUser,
        hasConflict,
    };
}

SelectionEngine::QueryResult SelectionEngine::query(TimeMs now) {
    const double t0 = getNowMs();

    // Ownership-mode conflicts whose lock lapsed since the last sweep.
    const bool lapsed = std::any_of(conflicts_.begin(), conflicts_.end(), [&](const ConflictRecord& c) {
        return c.resolutionMode == ResolutionMode::Ownership && !ownershipManager_.get(c.elementId, now);
    });
    if (lapsed) refreshConflicts(now);

    QueryResult result{};
    const std::vector<SelectionRecord> selections = store_.activeFor(whiteboardId_, currentUserId_);
    const std::vector<OwnershipRecord> owned = ownershipManager_.snapshot(now);
    result.stats.totalSelections = static_cast<std::uint32_t>(selections.size());
    result.stats.totalConflicts = static_cast<std::uint32_t>(conflicts_.size());
    result.stats.totalOwnerships = static_cast<std::uint32_t>(owned.size());

    if (hasViewport_) {
        const std::size_t maxVisible = config_.maxVisible();

        const std::vector<SelectionRecord> visible = culler_.visibleSelections(selections, viewport_, maxVisible);
        const CullStats selectionStats = culler_.lastStats();

        std::unordered_set<std::string> conflicted;
        for (const auto& c : conflicts_) conflicted.insert(c.elementId);

        result.highlights.reserve(visible.size());
        for (const auto& record : visible) {
            const std::optional<Box> bounds = culler_.selectionBounds(record);
            if (!bounds) continue;
            bool hasConflict = false;
            for (const auto& id : record.elementIds) {
                if (conflicted.count(id)) {
                    hasConflict = true;
                    break;
                }
            }
            result.highlights.push_back(makeHighlight(record, *bounds, hasConflict));
        }

        result.conflicts = culler_.visibleConflicts(conflicts_, viewport_, maxVisible);
        result.ownerships = culler_.visibleOwnerships(owned, viewport_, maxVisible);

        result.stats.visibleSelections = static_cast<std::uint32_t>(result.highlights.size());
        result.stats.culledSelections = selectionStats.inputCount - selectionStats.visible - selectionStats.truncated;
        result.stats.truncatedSelections = selectionStats.truncated;
        result.stats.visibleConflicts = static_cast<std::uint32_t>(result.conflicts.size());
        result.stats.visibleOwnerships = static_cast<std::uint32_t>(result.ownerships.size());
    }

    lastQueryMs_ = static_cast<float>(getNowMs() - t0);
    result.stats.queryMs = lastQueryMs_;
    return result;
}

} // namespace selsync
