#include "selsync/render/viewport_culler.h"

#include <cmath>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace selsync {

ViewportCuller::ViewportCuller(BoundsCache& cache, float cellSize, float padding)
    : cache_(cache),
      padding_(0.0f),
      selectionIndex_(cellSize),
      conflictGrid_(cellSize),
      ownershipGrid_(cellSize) {
    setPadding(padding);
}

void ViewportCuller::setBoundsResolver(BoundsResolver resolver) {
    resolver_ = std::move(resolver);
}

void ViewportCuller::setPadding(float padding) {
    if (!std::isfinite(padding) || padding < 0.0f) {
        throw std::invalid_argument("ViewportCuller padding must be finite and non-negative");
    }
    padding_ = padding;
}

const BoundsResolver& ViewportCuller::requireResolver() const {
    if (!resolver_) {
        throw std::invalid_argument("ViewportCuller has no bounds resolver");
    }
    return resolver_;
}

std::optional<AABB> ViewportCuller::worldRegion(const Viewport& viewport, float padding) {
    const CanvasTransform& t = viewport.transform;
    if (!std::isfinite(viewport.x) || !std::isfinite(viewport.y)
        || !std::isfinite(viewport.width) || !std::isfinite(viewport.height)
        || viewport.width < 0.0f || viewport.height < 0.0f) {
        return std::nullopt;
    }
    if (!std::isfinite(t.x) || !std::isfinite(t.y) || !std::isfinite(t.zoom) || t.zoom <= 0.0f) {
        return std::nullopt;
    }
    if (!std::isfinite(padding) || padding < 0.0f) return std::nullopt;

    const float sx0 = viewport.x - padding;
    const float sy0 = viewport.y - padding;
    const float sx1 = viewport.x + viewport.width + padding;
    const float sy1 = viewport.y + viewport.height + padding;
    return AABB{
        sx0 / t.zoom - t.x,
        sy0 / t.zoom - t.y,
        sx1 / t.zoom - t.x,
        sy1 / t.zoom - t.y,
    };
}

std::optional<Box> ViewportCuller::selectionBounds(const SelectionRecord& record) {
    if (record.explicitBounds && isValidBox(*record.explicitBounds)) {
        return record.explicitBounds;
    }
    if (record.elementIds.empty()) return std::nullopt;
    return cache_.getCombined(record.elementIds, requireResolver());
}

bool ViewportCuller::upsertSelection(const SelectionRecord& record) {
    const std::optional<Box> bounds = selectionBounds(record);
    auto it = indexedSelections_.find(record.userId);
    if (bounds && it != indexedSelections_.end() && it->second == *bounds) {
        return true;
    }
    if (!bounds || !selectionIndex_.insert(record.userId, *bounds)) {
        if (it != indexedSelections_.end()) {
            selectionIndex_.remove(record.userId);
            indexedSelections_.erase(it);
        }
        return false;
    }
    indexedSelections_[record.userId] = *bounds;
    return true;
}

bool ViewportCuller::upsertElement(ElementGrid& grid, const std::string& elementId) {
    const std::optional<Box> bounds = cache_.get(elementId, requireResolver());
    auto it = grid.boxes.find(elementId);
    if (bounds && it != grid.boxes.end() && it->second == *bounds) {
        return true;
    }
    if (!bounds || !grid.index.insert(elementId, *bounds)) {
        if (it != grid.boxes.end()) {
            grid.index.remove(elementId);
            grid.boxes.erase(it);
        }
        return false;
    }
    grid.boxes[elementId] = *bounds;
    return true;
}

void ViewportCuller::syncSelections(const std::vector<SelectionRecord>& selections) {
    std::unordered_set<std::string> present;
    present.reserve(selections.size());
    for (const auto& record : selections) {
        upsertSelection(record);
        present.insert(record.userId);
    }
    for (auto it = indexedSelections_.begin(); it != indexedSelections_.end();) {
        if (present.count(it->first) == 0) {
            selectionIndex_.remove(it->first);
            it = indexedSelections_.erase(it);
        } else {
            ++it;
        }
    }
}

void ViewportCuller::syncElements(ElementGrid& grid, const std::vector<std::string>& elementIds) {
    std::unordered_set<std::string> present;
    present.reserve(elementIds.size());
    for (const auto& elementId : elementIds) {
        if (!present.insert(elementId).second) continue;
        upsertElement(grid, elementId);
    }
    for (auto it = grid.boxes.begin(); it != grid.boxes.end();) {
        if (present.count(it->first) == 0) {
            grid.index.remove(it->first);
            it = grid.boxes.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> ViewportCuller::queryIndex(const SpatialIndex& index, const Viewport& viewport) const {
    std::vector<std::string> hits;
    const std::optional<AABB> region = worldRegion(viewport, padding_);
    if (!region) return hits;
    index.queryRegion(*region, hits);
    return hits;
}

std::vector<SelectionRecord> ViewportCuller::visibleSelections(
    const std::vector<SelectionRecord>& selections,
    const Viewport& viewport,
    std::size_t maxVisible) {
    syncSelections(selections);

    const std::vector<std::string> hits = queryIndex(selectionIndex_, viewport);
    const std::unordered_set<std::string> hitSet(hits.begin(), hits.end());

    lastStats_ = CullStats{static_cast<std::uint32_t>(selections.size()), static_cast<std::uint32_t>(hits.size()), 0, 0, 0};
    std::vector<SelectionRecord> out;
    for (const auto& record : selections) {
        if (indexedSelections_.find(record.userId) == indexedSelections_.end()) {
            lastStats_.unresolved++;
            continue;
        }
        if (hitSet.count(record.userId) == 0) continue;
        if (out.size() >= maxVisible) {
            lastStats_.truncated++;
            continue;
        }
        out.push_back(record);
    }
    lastStats_.visible = static_cast<std::uint32_t>(out.size());
    return out;
}

std::vector<std::size_t> ViewportCuller::cullElements(
    ElementGrid& grid,
    const std::vector<std::string>& elementIds,
    const Viewport& viewport,
    std::size_t maxVisible) {
    syncElements(grid, elementIds);

    const std::vector<std::string> hits = queryIndex(grid.index, viewport);
    const std::unordered_set<std::string> hitSet(hits.begin(), hits.end());

    lastStats_ = CullStats{static_cast<std::uint32_t>(elementIds.size()), static_cast<std::uint32_t>(hits.size()), 0, 0, 0};
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < elementIds.size(); ++i) {
        if (grid.boxes.find(elementIds[i]) == grid.boxes.end()) {
            lastStats_.unresolved++;
            continue;
        }
        if (hitSet.count(elementIds[i]) == 0) continue;
        if (out.size() >= maxVisible) {
            lastStats_.truncated++;
            continue;
        }
        out.push_back(i);
    }
    lastStats_.visible = static_cast<std::uint32_t>(out.size());
    return out;
}

std::vector<ConflictRecord> ViewportCuller::visibleConflicts(
    const std::vector<ConflictRecord>& conflicts,
    const Viewport& viewport,
    std::size_t maxVisible) {
    std::vector<std::string> ids;
    ids.reserve(conflicts.size());
    for (const auto& conflict : conflicts) ids.push_back(conflict.elementId);

    std::vector<ConflictRecord> out;
    for (const std::size_t i : cullElements(conflictGrid_, ids, viewport, maxVisible)) {
        out.push_back(conflicts[i]);
    }
    return out;
}

std::vector<OwnershipRecord> ViewportCuller::visibleOwnerships(
    const std::vector<OwnershipRecord>& ownerships,
    const Viewport& viewport,
    std::size_t maxVisible) {
    std::vector<std::string> ids;
    ids.reserve(ownerships.size());
    for (const auto& record : ownerships) ids.push_back(record.elementId);

    std::vector<OwnershipRecord> out;
    for (const std::size_t i : cullElements(ownershipGrid_, ids, viewport, maxVisible)) {
        out.push_back(ownerships[i]);
    }
    return out;
}

IndexStats ViewportCuller::elementIndexStats() const noexcept {
    const IndexStats a = conflictGrid_.index.stats();
    const IndexStats b = ownershipGrid_.index.stats();
    return IndexStats{a.entryCount + b.entryCount, a.cellCount + b.cellCount, a.oversizedCount + b.oversizedCount};
}

} // namespace selsync
