#pragma once

#include "selsync/engine.h"

#include <cstddef>
#include <optional>
#include <string>

namespace selsync {

class SelectionEngineTestAccessor {
public:
    static const SelectionStore& store(const SelectionEngine& engine) {
        return engine.store_;
    }

    static const OwnershipManager& ownershipManager(const SelectionEngine& engine) {
        return engine.ownershipManager_;
    }

    static const BoundsCache& boundsCache(const SelectionEngine& engine) {
        return engine.boundsCache_;
    }

    static std::optional<TimeMs> conflictSince(const SelectionEngine& engine, const std::string& elementId) {
        auto it = engine.conflictSince_.find(elementId);
        if (it == engine.conflictSince_.end()) return std::nullopt;
        return it->second;
    }

    static bool isShared(const SelectionEngine& engine, const std::string& elementId) {
        return engine.sharedElements_.count(elementId) > 0;
    }

    static std::size_t rateWindowCount(const SelectionEngine& engine) {
        return engine.updateWindows_.size();
    }

    static std::size_t queuedEvents(const SelectionEngine& engine) {
        return engine.eventCount_;
    }

    static bool overflowed(const SelectionEngine& engine) {
        return engine.eventOverflowed_;
    }
};

} // namespace selsync
