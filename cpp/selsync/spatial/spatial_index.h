#pragma once

#include "selsync/core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace selsync {

struct IndexStats {
    std::uint32_t entryCount;
    std::uint32_t cellCount;
    std::uint32_t oversizedCount;
};

struct QueryStats {
    std::uint32_t cellsQueried;
    std::uint32_t candidatesChecked;
    std::uint32_t matches;
};

// Uniform grid over axis-aligned boxes. Cells are keyed by their integer
// coordinates (floor(x / cellSize), floor(y / cellSize)); an entry is listed in
// every cell its box overlaps. Entries spanning more than kMaxCellsPerEntry
// cells are kept in a separate list scanned by every query.
class SpatialIndex {
public:
    explicit SpatialIndex(float cellSize = kDefaultGridCellSize);

    // Re-inserting an id moves it (remove + insert). Returns false and leaves the
    // index unchanged when the box is not finite or has negative size.
    bool insert(const std::string& id, const Box& box);
    bool remove(const std::string& id);
    void clear();

    // Ids whose box truly intersects region, sorted. Grid lookup is only a
    // prefilter, every candidate is tested against the region.
    std::vector<std::string> queryRegion(const Box& region) const;
    void queryRegion(const AABB& region, std::vector<std::string>& results) const;

    bool contains(const std::string& id) const;
    std::optional<Box> boundsOf(const std::string& id) const;

    IndexStats stats() const noexcept;
    QueryStats getLastQueryStats() const noexcept { return lastQueryStats_; }
    float cellSize() const noexcept { return cellSize_; }

    // Full (cell -> sorted ids) membership, for verification.
    std::map<std::pair<std::int32_t, std::int32_t>, std::vector<std::string>> cellMembership() const;

private:
    struct CellRange {
        std::int32_t minX, minY, maxX, maxY;
        std::uint64_t cellCount() const;
    };

    struct Entry {
        std::string id;
        AABB bounds;
        std::vector<std::uint64_t> cellKeys;
        bool oversized;
        bool live;
    };

    float cellSize_;
    // Cell key -> entry handles occupying the cell
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> cells_;
    // Entry storage, addressed by handle
    std::vector<Entry> entries_;
    std::vector<std::uint32_t> freeHandles_;
    std::unordered_map<std::string, std::uint32_t> handles_;
    std::vector<std::uint32_t> oversized_;

    // Per-query dedup stamps, one per handle
    mutable std::vector<std::uint32_t> seenStamp_;
    mutable std::uint32_t stamp_{0};
    mutable QueryStats lastQueryStats_{0, 0, 0};

    static std::uint64_t cellKey(std::int32_t x, std::int32_t y);
    static std::pair<std::int32_t, std::int32_t> cellCoords(std::uint64_t key);
    std::int32_t toCell(float v) const;
    CellRange rangeFor(const AABB& bounds) const;
    void eraseFromCell(std::uint64_t key, std::uint32_t handle);
    std::uint32_t nextStamp() const;
};

} // namespace selsync
