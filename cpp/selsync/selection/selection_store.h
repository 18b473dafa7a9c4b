#pragma once

#include "selsync/core/types.h"

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace selsync {

enum class AdmitResult : std::uint8_t {
    Admitted = 0, // new record
    Replaced = 1, // prior record for the user replaced
    Removed = 2,  // empty selection, treated as remove
    Rejected = 3, // missing user or whiteboard id
};

// Current selection per (whiteboard, user). Each whiteboard keeps its own
// liveness index ordered by lastSeen so expiry never scans other boards.
class SelectionStore {
public:
    explicit SelectionStore(std::size_t maxElementsPerSelection = kDefaultMaxElementsPerSelection);

    AdmitResult admit(SelectionRecord record);

    bool remove(const std::string& userId);
    bool remove(const std::string& whiteboardId, const std::string& userId);
    bool dropElement(const std::string& whiteboardId, const std::string& userId, const std::string& elementId);

    // Removes records with lastSeen older than timeoutMs, plus inactive ones.
    // Returns the removed user ids, sorted.
    std::vector<std::string> expireStale(const std::string& whiteboardId, TimeMs now, TimeMs timeoutMs);
    std::size_t expireStale(TimeMs now, TimeMs timeoutMs);

    // Active records: currentUserId first, then priority desc, timestamp desc,
    // userId asc.
    std::vector<SelectionRecord> activeFor(const std::string& whiteboardId, const std::string& currentUserId = {}) const;

    const SelectionRecord* find(const std::string& whiteboardId, const std::string& userId) const;

    std::size_t size() const noexcept { return recordCount_; }
    std::size_t size(const std::string& whiteboardId) const;
    std::uint32_t generation() const noexcept { return generation_; }
    std::size_t maxElementsPerSelection() const noexcept { return maxElements_; }

    void clear();

private:
    struct Board {
        std::unordered_map<std::string, SelectionRecord> records;
        std::set<std::pair<TimeMs, std::string>> liveness;
        std::set<std::string> inactive;
    };

    std::size_t maxElements_;
    std::unordered_map<std::string, Board> boards_;
    // User id -> whiteboards holding a record for that user
    std::unordered_map<std::string, std::set<std::string>> boardsByUser_;
    std::size_t recordCount_ = 0;
    std::uint32_t generation_ = 0;

    void eraseRecord(Board& board, const std::string& whiteboardId, const std::string& userId);
};

} // namespace selsync
