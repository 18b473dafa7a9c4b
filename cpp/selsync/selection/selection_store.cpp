#include "selsync/selection/selection_store.h"

#include "selsync/core/logging.h"
#include "selsync/core/string_utils.h"

#include <algorithm>
#include <stdexcept>

namespace selsync {

SelectionStore::SelectionStore(std::size_t maxElementsPerSelection)
    : maxElements_(maxElementsPerSelection) {
    if (maxElementsPerSelection == 0) {
        throw std::invalid_argument("SelectionStore element cap must be positive");
    }
}

AdmitResult SelectionStore::admit(SelectionRecord record) {
    if (!isValidId(record.userId) || !isValidId(record.whiteboardId)) {
        return AdmitResult::Rejected;
    }

    record.elementIds = normalizeIds(record.elementIds, maxElements_);
    if (record.elementIds.empty()) {
        remove(record.whiteboardId, record.userId);
        return AdmitResult::Removed;
    }
    record.isMultiSelect = record.elementIds.size() > 1;
    if (record.explicitBounds && !isValidBox(*record.explicitBounds)) {
        record.explicitBounds.reset();
    }

    const std::string whiteboardId = record.whiteboardId;
    const std::string userId = record.userId;
    Board& board = boards_[whiteboardId];

    AdmitResult result = AdmitResult::Admitted;
    auto it = board.records.find(userId);
    if (it != board.records.end()) {
        board.liveness.erase({it->second.lastSeen, userId});
        result = AdmitResult::Replaced;
    } else {
        boardsByUser_[userId].insert(whiteboardId);
        recordCount_++;
    }

    board.liveness.insert({record.lastSeen, userId});
    if (record.isActive) {
        board.inactive.erase(userId);
    } else {
        board.inactive.insert(userId);
    }
    board.records[userId] = std::move(record);
    generation_++;

    SELSYNC_LOG_DEBUG("admit board=%s user=%s result=%u", whiteboardId.c_str(), userId.c_str(),
                      static_cast<unsigned>(result));
    return result;
}

void SelectionStore::eraseRecord(Board& board, const std::string& whiteboardId, const std::string& userId) {
    auto it = board.records.find(userId);
    if (it == board.records.end()) return;
    board.liveness.erase({it->second.lastSeen, userId});
    board.inactive.erase(userId);
    board.records.erase(it);
    recordCount_--;

    auto byUser = boardsByUser_.find(userId);
    if (byUser != boardsByUser_.end()) {
        byUser->second.erase(whiteboardId);
        if (byUser->second.empty()) boardsByUser_.erase(byUser);
    }
    generation_++;
}

bool SelectionStore::remove(const std::string& whiteboardId, const std::string& userId) {
    auto boardIt = boards_.find(whiteboardId);
    if (boardIt == boards_.end()) return false;
    if (boardIt->second.records.find(userId) == boardIt->second.records.end()) return false;
    eraseRecord(boardIt->second, whiteboardId, userId);
    if (boardIt->second.records.empty()) boards_.erase(boardIt);
    return true;
}

bool SelectionStore::remove(const std::string& userId) {
    auto byUser = boardsByUser_.find(userId);
    if (byUser == boardsByUser_.end()) return false;
    // Copy: eraseRecord mutates the index being iterated.
    const std::set<std::string> whiteboardIds = byUser->second;
    bool removed = false;
    for (const auto& whiteboardId : whiteboardIds) {
        removed = remove(whiteboardId, userId) || removed;
    }
    return removed;
}

bool SelectionStore::dropElement(const std::string& whiteboardId, const std::string& userId, const std::string& elementId) {
    auto boardIt = boards_.find(whiteboardId);
    if (boardIt == boards_.end()) return false;
    auto it = boardIt->second.records.find(userId);
    if (it == boardIt->second.records.end()) return false;

    auto& ids = it->second.elementIds;
    auto pos = std::lower_bound(ids.begin(), ids.end(), elementId);
    if (pos == ids.end() || *pos != elementId) return false;
    ids.erase(pos);

    if (ids.empty()) {
        remove(whiteboardId, userId);
        return true;
    }
    it->second.isMultiSelect = ids.size() > 1;
    generation_++;
    return true;
}

std::vector<std::string> SelectionStore::expireStale(const std::string& whiteboardId, TimeMs now, TimeMs timeoutMs) {
    std::vector<std::string> expired;
    auto boardIt = boards_.find(whiteboardId);
    if (boardIt == boards_.end()) return expired;
    Board& board = boardIt->second;

    const TimeMs cutoff = now - timeoutMs;
    for (auto it = board.liveness.begin(); it != board.liveness.end() && it->first < cutoff; ++it) {
        expired.push_back(it->second);
    }
    for (const auto& userId : board.inactive) {
        expired.push_back(userId);
    }
    std::sort(expired.begin(), expired.end());
    expired.erase(std::unique(expired.begin(), expired.end()), expired.end());

    for (const auto& userId : expired) {
        eraseRecord(board, whiteboardId, userId);
    }
    if (board.records.empty()) boards_.erase(boardIt);

    if (!expired.empty()) {
        SELSYNC_LOG_DEBUG("expireStale board=%s removed=%zu", whiteboardId.c_str(), expired.size());
    }
    return expired;
}

std::size_t SelectionStore::expireStale(TimeMs now, TimeMs timeoutMs) {
    std::vector<std::string> whiteboardIds;
    whiteboardIds.reserve(boards_.size());
    for (const auto& kv : boards_) whiteboardIds.push_back(kv.first);

    std::size_t removed = 0;
    for (const auto& whiteboardId : whiteboardIds) {
        removed += expireStale(whiteboardId, now, timeoutMs).size();
    }
    return removed;
}

std::vector<SelectionRecord> SelectionStore::activeFor(const std::string& whiteboardId, const std::string& currentUserId) const {
    std::vector<SelectionRecord> out;
    auto boardIt = boards_.find(whiteboardId);
    if (boardIt == boards_.end()) return out;

    out.reserve(boardIt->second.records.size());
    for (const auto& kv : boardIt->second.records) {
        if (!kv.second.isActive) continue;
        out.push_back(kv.second);
    }

    std::sort(out.begin(), out.end(), [&](const SelectionRecord& a, const SelectionRecord& b) {
        const bool aCurrent = !currentUserId.empty() && a.userId == currentUserId;
        const bool bCurrent = !currentUserId.empty() && b.userId == currentUserId;
        if (aCurrent != bCurrent) return aCurrent;
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.userId < b.userId;
    });
    return out;
}

const SelectionRecord* SelectionStore::find(const std::string& whiteboardId, const std::string& userId) const {
    auto boardIt = boards_.find(whiteboardId);
    if (boardIt == boards_.end()) return nullptr;
    auto it = boardIt->second.records.find(userId);
    if (it == boardIt->second.records.end()) return nullptr;
    return &it->second;
}

std::size_t SelectionStore::size(const std::string& whiteboardId) const {
    auto boardIt = boards_.find(whiteboardId);
    return boardIt == boards_.end() ? 0 : boardIt->second.records.size();
}

void SelectionStore::clear() {
    if (recordCount_ > 0) generation_++;
    boards_.clear();
    boardsByUser_.clear();
    recordCount_ = 0;
}

} // namespace selsync
