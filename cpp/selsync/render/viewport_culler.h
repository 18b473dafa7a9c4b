#pragma once

#include "selsync/core/types.h"
#include "selsync/spatial/bounds_cache.h"
#include "selsync/spatial/spatial_index.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace selsync {

// Canvas pan/zoom: screen = (world + (x, y)) * zoom
struct CanvasTransform {
    float x{0.0f};
    float y{0.0f};
    float zoom{1.0f};
};

// Visible area in screen pixels.
struct Viewport {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    CanvasTransform transform{};
};

struct CullStats {
    std::uint32_t inputCount;
    std::uint32_t candidates; // grid hits
    std::uint32_t visible;
    std::uint32_t truncated;  // in view but past maxVisible
    std::uint32_t unresolved; // no bounds, excluded
};

/**
 * Viewport filtering for highlights.
 *
 * Keeps two grids in world space: one over selection bounds (explicitBounds, or
 * the combined bounds of the elements), one over single-element bounds used by
 * conflicts and ownerships. Each visible* call brings the grid up to date with
 * its input, reinserting only entries whose bounds changed, then queries the
 * padded viewport. Results keep the input order and are truncated to
 * maxVisible.
 */
class ViewportCuller {
public:
    explicit ViewportCuller(
        BoundsCache& cache,
        float cellSize = kDefaultGridCellSize,
        float padding = kDefaultViewportPadding);

    void setBoundsResolver(BoundsResolver resolver);

    float padding() const noexcept { return padding_; }
    void setPadding(float padding);

    // Padded screen viewport mapped to world space. nullopt for a degenerate
    // viewport (non-finite values, negative size, zoom <= 0).
    static std::optional<AABB> worldRegion(const Viewport& viewport, float padding);

    std::optional<Box> selectionBounds(const SelectionRecord& record);

    // Full resync: entries absent from the input are dropped from the grid.
    void syncSelections(const std::vector<SelectionRecord>& selections);

    std::vector<SelectionRecord> visibleSelections(
        const std::vector<SelectionRecord>& selections,
        const Viewport& viewport,
        std::size_t maxVisible);
    std::vector<ConflictRecord> visibleConflicts(
        const std::vector<ConflictRecord>& conflicts,
        const Viewport& viewport,
        std::size_t maxVisible);
    std::vector<OwnershipRecord> visibleOwnerships(
        const std::vector<OwnershipRecord>& ownerships,
        const Viewport& viewport,
        std::size_t maxVisible);

    const CullStats& lastStats() const noexcept { return lastStats_; }
    IndexStats selectionIndexStats() const noexcept { return selectionIndex_.stats(); }
    // Conflict and ownership grids combined.
    IndexStats elementIndexStats() const noexcept;

private:
    BoundsCache& cache_;
    BoundsResolver resolver_;
    float padding_;

    // Element grid keyed by elementId, resynced to its input on every cull.
    struct ElementGrid {
        explicit ElementGrid(float cellSize) : index(cellSize) {}
        SpatialIndex index;
        std::unordered_map<std::string, Box> boxes;
    };

    SpatialIndex selectionIndex_; // keyed by userId
    std::unordered_map<std::string, Box> indexedSelections_;
    ElementGrid conflictGrid_;
    ElementGrid ownershipGrid_;

    CullStats lastStats_{0, 0, 0, 0, 0};

    const BoundsResolver& requireResolver() const;
    bool upsertSelection(const SelectionRecord& record);
    bool upsertElement(ElementGrid& grid, const std::string& elementId);
    void syncElements(ElementGrid& grid, const std::vector<std::string>& elementIds);
    // Indices into elementIds of the visible entries, in input order.
    std::vector<std::size_t> cullElements(
        ElementGrid& grid,
        const std::vector<std::string>& elementIds,
        const Viewport& viewport,
        std::size_t maxVisible);
    std::vector<std::string> queryIndex(const SpatialIndex& index, const Viewport& viewport) const;
};

} // namespace selsync
