#include "selsync/selection/conflict_resolver.h"

#include <algorithm>
#include <map>

namespace selsync {

namespace {

constexpr const char* kConflictIdPrefix = "conflict:";
constexpr std::size_t kConflictIdPrefixLen = 9;

} // namespace

std::string ConflictResolver::conflictIdFor(const std::string& elementId) {
    return std::string(kConflictIdPrefix) + elementId;
}

std::optional<std::string> ConflictResolver::elementIdFor(const std::string& conflictId) {
    if (conflictId.size() <= kConflictIdPrefixLen) return std::nullopt;
    if (conflictId.compare(0, kConflictIdPrefixLen, kConflictIdPrefix) != 0) return std::nullopt;
    return conflictId.substr(kConflictIdPrefixLen);
}

std::vector<ConflictRecord> ConflictResolver::recompute(const std::vector<SelectionRecord>& activeSelections) const {
    return recompute(activeSelections, ResolveContext{});
}

std::vector<ConflictRecord> ConflictResolver::recompute(
    const std::vector<SelectionRecord>& activeSelections,
    const ResolveContext& context) const {
    // Ordered map keeps output sorted by elementId.
    std::map<std::string, std::vector<Contender>> byElement;
    for (const auto& record : activeSelections) {
        if (!record.isActive) continue;
        for (const auto& elementId : record.elementIds) {
            byElement[elementId].push_back(Contender{
                record.userId,
                record.displayName,
                record.priority,
                record.timestamp,
            });
        }
    }

    std::vector<ConflictRecord> conflicts;
    for (auto& kv : byElement) {
        auto& contenders = kv.second;
        if (contenders.size() < 2) continue;

        std::sort(contenders.begin(), contenders.end());
        // One entry per user; the best-ranked claim wins if a user appears twice.
        std::vector<Contender> unique;
        unique.reserve(contenders.size());
        for (auto& c : contenders) {
            const bool seen = std::any_of(unique.begin(), unique.end(),
                [&](const Contender& u) { return u.userId == c.userId; });
            if (!seen) unique.push_back(std::move(c));
        }
        if (unique.size() < 2) continue;

        ResolutionMode mode = context.defaultMode;
        auto owner = context.owners.find(kv.first);
        const bool ownedByContender = owner != context.owners.end()
            && std::any_of(unique.begin(), unique.end(),
                [&](const Contender& c) { return c.userId == owner->second; });
        if (ownedByContender) {
            mode = ResolutionMode::Ownership;
        } else if (context.sharedElements.count(kv.first) > 0) {
            mode = ResolutionMode::Shared;
        }

        conflicts.push_back(ConflictRecord{
            conflictIdFor(kv.first),
            kv.first,
            std::move(unique),
            mode,
        });
    }
    return conflicts;
}

} // namespace selsync
