#pragma once

#include "selsync/core/types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace selsync {

// Inputs that only decide a conflict's resolutionMode.
struct ResolveContext {
    // elementId -> current owner
    std::unordered_map<std::string, std::string> owners;
    // Elements resolved as shared
    std::unordered_set<std::string> sharedElements;
    ResolutionMode defaultMode{ResolutionMode::Timeout};
};

/**
 * Derives conflicts from a selection snapshot. Stateless: the same input
 * always yields the same output, so callers recompute instead of patching.
 *
 * An element becomes a conflict when two or more active records include it.
 * Contenders are ordered by Contender::operator< and the result is sorted by
 * elementId.
 */
class ConflictResolver {
public:
    std::vector<ConflictRecord> recompute(const std::vector<SelectionRecord>& activeSelections) const;
    std::vector<ConflictRecord> recompute(
        const std::vector<SelectionRecord>& activeSelections,
        const ResolveContext& context) const;

    static std::string conflictIdFor(const std::string& elementId);
    static std::optional<std::string> elementIdFor(const std::string& conflictId);
};

} // namespace selsync
