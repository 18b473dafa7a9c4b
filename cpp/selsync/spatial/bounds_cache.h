#pragma once

#include "selsync/core/types.h"

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace selsync {

struct BoundsCacheStats {
    std::uint64_t hits;
    std::uint64_t misses;
    std::uint64_t evictions;
    std::uint32_t entries;
};

/**
 * Memoized element and element-set bounds.
 *
 * Element entries are keyed by element id, combined entries by the sorted,
 * deduplicated member ids joined with a separator, so permutations of one set
 * share an entry. Both kinds live in one LRU order bounded by capacity.
 * Invalidating an element marks its entry and every combined entry that
 * includes it stale; stale entries are recomputed on the next read-through.
 */
class BoundsCache {
public:
    explicit BoundsCache(std::size_t capacity = kDefaultBoundsCacheCapacity);

    // Fresh cached value only, never calls a resolver.
    std::optional<Box> get(const std::string& id);
    // Read-through. Unresolvable ids are not cached.
    std::optional<Box> get(const std::string& id, const BoundsResolver& resolver);

    // Union of every resolvable member's box, nullopt when none resolves.
    // forceRefresh re-resolves every member and repopulates the cache.
    std::optional<Box> getCombined(
        const std::vector<std::string>& ids,
        const BoundsResolver& resolver,
        bool forceRefresh = false);

    void invalidate(const std::string& id);
    void invalidateAll();

    BoundsCacheStats stats() const noexcept;
    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t size() const noexcept { return elements_.size() + combined_.size(); }

    static std::string combinedKey(const std::vector<std::string>& ids);

private:
    struct LruNode {
        std::string key;
        bool combined;
    };
    using LruList = std::list<LruNode>;

    struct Slot {
        Box box;
        bool fresh;
        LruList::iterator lru;
        std::vector<std::string> members; // combined entries only
    };

    std::size_t capacity_;
    std::unordered_map<std::string, Slot> elements_;
    std::unordered_map<std::string, Slot> combined_;
    // Element id -> combined keys that include it
    std::unordered_map<std::string, std::unordered_set<std::string>> dependents_;
    LruList lru_;

    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};

    std::optional<Box> resolveElement(const std::string& id, const BoundsResolver& resolver);
    const Slot* freshElement(const std::string& id);
    void storeElement(const std::string& id, const Box& box);
    void storeCombined(const std::string& key, std::vector<std::string> members, const Box& box);
    void eraseElement(const std::string& id);
    void eraseCombined(const std::string& key);
    void touch(LruList::iterator it);
    void enforceCapacity();
};

} // namespace selsync
