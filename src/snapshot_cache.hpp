#pragma once

// Internal header — not installed.
// LRU cache of materialized page sequences keyed by snapshot hash.

#include <score-history/commit.hpp>
#include <score-history/types.hpp>

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace score_history::detail {

class SnapshotCache {
public:
    explicit SnapshotCache(std::size_t capacity) : capacity_{capacity} {}

    SnapshotCache(const SnapshotCache&) = delete;
    auto operator=(const SnapshotCache&) -> SnapshotCache& = delete;

    auto get(const ObjectHash& snapshot) -> std::optional<PageSequence> {
        if (capacity_ == 0) return std::nullopt;
        auto lock = std::scoped_lock{mutex_};
        auto it = index_.find(snapshot);
        if (it == index_.end()) return std::nullopt;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    void put(const ObjectHash& snapshot, PageSequence pages) {
        if (capacity_ == 0) return;
        auto lock = std::scoped_lock{mutex_};
        if (auto it = index_.find(snapshot); it != index_.end()) {
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(snapshot, std::move(pages));
        index_[snapshot] = entries_.begin();
        if (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

private:
    using Entry = std::pair<ObjectHash, PageSequence>;

    std::size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<ObjectHash, std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

}  // namespace score_history::detail
