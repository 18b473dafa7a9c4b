#include "selsync/spatial/bounds_cache.h"

#include "selsync/core/string_utils.h"

#include <limits>
#include <stdexcept>
#include <utility>

namespace selsync {

BoundsCache::BoundsCache(std::size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("BoundsCache capacity must be positive");
    }
}

std::string BoundsCache::combinedKey(const std::vector<std::string>& ids) {
    return joinIds(normalizeIds(ids, std::numeric_limits<std::size_t>::max()));
}

void BoundsCache::touch(LruList::iterator it) {
    if (it != lru_.begin()) {
        lru_.splice(lru_.begin(), lru_, it);
    }
}

const BoundsCache::Slot* BoundsCache::freshElement(const std::string& id) {
    auto it = elements_.find(id);
    if (it == elements_.end() || !it->second.fresh) return nullptr;
    touch(it->second.lru);
    return &it->second;
}

std::optional<Box> BoundsCache::get(const std::string& id) {
    if (const Slot* slot = freshElement(id)) {
        hits_++;
        return slot->box;
    }
    misses_++;
    return std::nullopt;
}

std::optional<Box> BoundsCache::get(const std::string& id, const BoundsResolver& resolver) {
    if (!resolver) {
        throw std::invalid_argument("BoundsCache::get requires a bounds resolver");
    }
    if (const Slot* slot = freshElement(id)) {
        hits_++;
        return slot->box;
    }
    misses_++;
    return resolveElement(id, resolver);
}

std::optional<Box> BoundsCache::resolveElement(const std::string& id, const BoundsResolver& resolver) {
    std::optional<Box> box = resolver(id);
    if (!box || !isValidBox(*box)) {
        // Deleted or degenerate geometry: excluded, and anything cached is dropped.
        eraseElement(id);
        return std::nullopt;
    }
    storeElement(id, *box);
    return box;
}

std::optional<Box> BoundsCache::getCombined(
    const std::vector<std::string>& ids,
    const BoundsResolver& resolver,
    bool forceRefresh) {
    if (!resolver) {
        throw std::invalid_argument("BoundsCache::getCombined requires a bounds resolver");
    }

    std::vector<std::string> members = normalizeIds(ids, std::numeric_limits<std::size_t>::max());
    if (members.empty()) return std::nullopt;
    const std::string key = joinIds(members);

    if (!forceRefresh) {
        auto it = combined_.find(key);
        if (it != combined_.end() && it->second.fresh) {
            hits_++;
            touch(it->second.lru);
            return it->second.box;
        }
    }
    misses_++;

    std::optional<AABB> acc;
    for (const auto& id : members) {
        std::optional<Box> box;
        if (!forceRefresh) {
            if (const Slot* slot = freshElement(id)) box = slot->box;
        }
        if (!box) box = resolveElement(id, resolver);
        if (!box) continue;
        const AABB a = toAabb(*box);
        acc = acc ? unionOf(*acc, a) : a;
    }

    if (!acc) {
        eraseCombined(key);
        return std::nullopt;
    }

    const Box result = toBox(*acc);
    storeCombined(key, std::move(members), result);
    return result;
}

void BoundsCache::storeElement(const std::string& id, const Box& box) {
    auto it = elements_.find(id);
    if (it != elements_.end()) {
        it->second.box = box;
        it->second.fresh = true;
        touch(it->second.lru);
        return;
    }
    lru_.push_front(LruNode{id, false});
    elements_.emplace(id, Slot{box, true, lru_.begin(), {}});
    enforceCapacity();
}

void BoundsCache::storeCombined(const std::string& key, std::vector<std::string> members, const Box& box) {
    auto it = combined_.find(key);
    if (it != combined_.end()) {
        it->second.box = box;
        it->second.fresh = true;
        touch(it->second.lru);
        return;
    }
    for (const auto& id : members) {
        dependents_[id].insert(key);
    }
    lru_.push_front(LruNode{key, true});
    combined_.emplace(key, Slot{box, true, lru_.begin(), std::move(members)});
    enforceCapacity();
}

void BoundsCache::eraseElement(const std::string& id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) return;
    lru_.erase(it->second.lru);
    elements_.erase(it);
}

void BoundsCache::eraseCombined(const std::string& key) {
    auto it = combined_.find(key);
    if (it == combined_.end()) return;
    for (const auto& id : it->second.members) {
        auto dep = dependents_.find(id);
        if (dep == dependents_.end()) continue;
        dep->second.erase(key);
        if (dep->second.empty()) dependents_.erase(dep);
    }
    lru_.erase(it->second.lru);
    combined_.erase(it);
}

void BoundsCache::enforceCapacity() {
    while (size() > capacity_ && !lru_.empty()) {
        const LruNode victim = lru_.back();
        if (victim.combined) {
            eraseCombined(victim.key);
        } else {
            eraseElement(victim.key);
        }
        evictions_++;
    }
}

void BoundsCache::invalidate(const std::string& id) {
    auto it = elements_.find(id);
    if (it != elements_.end()) it->second.fresh = false;

    auto dep = dependents_.find(id);
    if (dep == dependents_.end()) return;
    for (const auto& key : dep->second) {
        auto c = combined_.find(key);
        if (c != combined_.end()) c->second.fresh = false;
    }
}

void BoundsCache::invalidateAll() {
    elements_.clear();
    combined_.clear();
    dependents_.clear();
    lru_.clear();
}

BoundsCacheStats BoundsCache::stats() const noexcept {
    return BoundsCacheStats{hits_, misses_, evictions_, static_cast<std::uint32_t>(size())};
}

} // namespace selsync
