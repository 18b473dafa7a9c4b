#include "selsync/spatial/spatial_index.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace selsync {

SpatialIndex::SpatialIndex(float cellSize) : cellSize_(cellSize) {
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        throw std::invalid_argument("SpatialIndex cell size must be positive and finite");
    }
}

std::uint64_t SpatialIndex::cellKey(std::int32_t x, std::int32_t y) {
    // Exact packing of both coordinates, no hash collisions between cells.
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32)
         | static_cast<std::uint64_t>(static_cast<std::uint32_t>(y));
}

std::pair<std::int32_t, std::int32_t> SpatialIndex::cellCoords(std::uint64_t key) {
    return {
        static_cast<std::int32_t>(static_cast<std::uint32_t>(key >> 32)),
        static_cast<std::int32_t>(static_cast<std::uint32_t>(key & 0xFFFFFFFFu)),
    };
}

std::int32_t SpatialIndex::toCell(float v) const {
    const double q = std::floor(static_cast<double>(v) / static_cast<double>(cellSize_));
    if (q < -static_cast<double>(kMaxCellCoord)) return -kMaxCellCoord;
    if (q > static_cast<double>(kMaxCellCoord)) return kMaxCellCoord;
    return static_cast<std::int32_t>(q);
}

std::uint64_t SpatialIndex::CellRange::cellCount() const {
    const std::int64_t w = static_cast<std::int64_t>(maxX) - minX + 1;
    const std::int64_t h = static_cast<std::int64_t>(maxY) - minY + 1;
    return static_cast<std::uint64_t>(w) * static_cast<std::uint64_t>(h);
}

SpatialIndex::CellRange SpatialIndex::rangeFor(const AABB& bounds) const {
    return CellRange{toCell(bounds.minX), toCell(bounds.minY), toCell(bounds.maxX), toCell(bounds.maxY)};
}

bool SpatialIndex::insert(const std::string& id, const Box& box) {
    if (!isValidBox(box)) return false;
    const AABB bounds = toAabb(box);
    if (!std::isfinite(bounds.maxX) || !std::isfinite(bounds.maxY)) return false;

    remove(id); // re-insert strategy, clears the cells of the last-known box

    std::uint32_t handle;
    if (!freeHandles_.empty()) {
        handle = freeHandles_.back();
        freeHandles_.pop_back();
    } else {
        handle = static_cast<std::uint32_t>(entries_.size());
        entries_.push_back(Entry{});
    }

    Entry& entry = entries_[handle];
    entry.id = id;
    entry.bounds = bounds;
    entry.cellKeys.clear();
    entry.oversized = false;
    entry.live = true;

    const CellRange range = rangeFor(bounds);
    if (range.cellCount() > kMaxCellsPerEntry) {
        entry.oversized = true;
        oversized_.push_back(handle);
    } else {
        entry.cellKeys.reserve(static_cast<std::size_t>(range.cellCount()));
        for (std::int32_t x = range.minX; x <= range.maxX; ++x) {
            for (std::int32_t y = range.minY; y <= range.maxY; ++y) {
                const std::uint64_t key = cellKey(x, y);
                cells_[key].push_back(handle);
                entry.cellKeys.push_back(key);
            }
        }
    }

    handles_[id] = handle;
    return true;
}

void SpatialIndex::eraseFromCell(std::uint64_t key, std::uint32_t handle) {
    auto it = cells_.find(key);
    if (it == cells_.end()) return;
    auto& list = it->second;
    // Swap-remove
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (list[i] == handle) {
            list[i] = list.back();
            list.pop_back();
            break;
        }
    }
    if (list.empty()) {
        cells_.erase(it);
    }
}

bool SpatialIndex::remove(const std::string& id) {
    auto it = handles_.find(id);
    if (it == handles_.end()) return false;

    const std::uint32_t handle = it->second;
    Entry& entry = entries_[handle];
    for (const std::uint64_t key : entry.cellKeys) {
        eraseFromCell(key, handle);
    }
    if (entry.oversized) {
        oversized_.erase(std::remove(oversized_.begin(), oversized_.end(), handle), oversized_.end());
    }

    entry.cellKeys.clear();
    entry.id.clear();
    entry.oversized = false;
    entry.live = false;
    freeHandles_.push_back(handle);
    handles_.erase(it);
    return true;
}

void SpatialIndex::clear() {
    cells_.clear();
    entries_.clear();
    freeHandles_.clear();
    handles_.clear();
    oversized_.clear();
    seenStamp_.clear();
    stamp_ = 0;
    lastQueryStats_ = {0, 0, 0};
}

std::uint32_t SpatialIndex::nextStamp() const {
    if (seenStamp_.size() < entries_.size()) {
        seenStamp_.resize(entries_.size(), 0);
    }
    ++stamp_;
    if (stamp_ == 0) {
        std::fill(seenStamp_.begin(), seenStamp_.end(), 0);
        stamp_ = 1;
    }
    return stamp_;
}

std::vector<std::string> SpatialIndex::queryRegion(const Box& region) const {
    std::vector<std::string> results;
    if (!isValidBox(region)) {
        lastQueryStats_ = {0, 0, 0};
        return results;
    }
    queryRegion(toAabb(region), results);
    return results;
}

void SpatialIndex::queryRegion(const AABB& region, std::vector<std::string>& results) const {
    lastQueryStats_ = {0, 0, 0};
    if (std::isnan(region.minX) || std::isnan(region.minY) || std::isnan(region.maxX) || std::isnan(region.maxY)) {
        return;
    }
    if (handles_.empty()) return;

    const std::size_t firstResult = results.size();
    const std::uint32_t stamp = nextStamp();

    auto consider = [&](std::uint32_t handle) {
        if (seenStamp_[handle] == stamp) return;
        seenStamp_[handle] = stamp;
        lastQueryStats_.candidatesChecked++;
        const Entry& entry = entries_[handle];
        if (intersects(entry.bounds, region)) {
            results.push_back(entry.id);
        }
    };

    const CellRange range = rangeFor(region);
    if (range.cellCount() <= cells_.size()) {
        for (std::int32_t x = range.minX; x <= range.maxX; ++x) {
            for (std::int32_t y = range.minY; y <= range.maxY; ++y) {
                lastQueryStats_.cellsQueried++;
                auto it = cells_.find(cellKey(x, y));
                if (it == cells_.end()) continue;
                for (const std::uint32_t handle : it->second) consider(handle);
            }
        }
    } else {
        // Region covers more cells than are occupied: walk the occupied ones.
        for (const auto& kv : cells_) {
            const auto xy = cellCoords(kv.first);
            if (xy.first < range.minX || xy.first > range.maxX) continue;
            if (xy.second < range.minY || xy.second > range.maxY) continue;
            lastQueryStats_.cellsQueried++;
            for (const std::uint32_t handle : kv.second) consider(handle);
        }
    }

    for (const std::uint32_t handle : oversized_) consider(handle);

    std::sort(results.begin() + static_cast<std::ptrdiff_t>(firstResult), results.end());
    lastQueryStats_.matches = static_cast<std::uint32_t>(results.size() - firstResult);
}

bool SpatialIndex::contains(const std::string& id) const {
    return handles_.find(id) != handles_.end();
}

std::optional<Box> SpatialIndex::boundsOf(const std::string& id) const {
    auto it = handles_.find(id);
    if (it == handles_.end()) return std::nullopt;
    return toBox(entries_[it->second].bounds);
}

IndexStats SpatialIndex::stats() const noexcept {
    return IndexStats{
        static_cast<std::uint32_t>(handles_.size()),
        static_cast<std::uint32_t>(cells_.size()),
        static_cast<std::uint32_t>(oversized_.size()),
    };
}

std::map<std::pair<std::int32_t, std::int32_t>, std::vector<std::string>> SpatialIndex::cellMembership() const {
    std::map<std::pair<std::int32_t, std::int32_t>, std::vector<std::string>> out;
    for (const auto& kv : cells_) {
        auto& ids = out[cellCoords(kv.first)];
        ids.reserve(kv.second.size());
        for (const std::uint32_t handle : kv.second) {
            ids.push_back(entries_[handle].id);
        }
        std::sort(ids.begin(), ids.end());
    }
    return out;
}

} // namespace selsync
