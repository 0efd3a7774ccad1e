#include <score-history/head_store.hpp>

#include <mutex>

namespace score_history {

auto MemoryHeadStore::create(const ScoreId& id, const ScoreHead& head) -> bool {
    auto lock = std::unique_lock{mutex_};
    return heads_.try_emplace(id, head).second;
}

auto MemoryHeadStore::get(const ScoreId& id) const -> std::optional<ScoreHead> {
    auto lock = std::shared_lock{mutex_};
    auto it = heads_.find(id);
    if (it == heads_.end()) return std::nullopt;
    return it->second;
}

auto MemoryHeadStore::compare_and_set(const ScoreId& id, const ScoreHead& expected,
                                      const ScoreHead& desired) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto it = heads_.find(id);
    if (it == heads_.end() || it->second != expected) return false;
    it->second = desired;
    return true;
}

auto MemoryHeadStore::remove(const ScoreId& id) -> bool {
    auto lock = std::unique_lock{mutex_};
    return heads_.erase(id) > 0;
}

auto MemoryHeadStore::list(std::string_view owner) const -> std::vector<ScoreId> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<ScoreId>{};
    // Keys sort by owner first, so one owner's scores are contiguous
    for (auto it = heads_.lower_bound(ScoreId{std::string{owner}, {}});
         it != heads_.end() && it->first.owner == owner; ++it) {
        result.push_back(it->first);
    }
    return result;
}

}  // namespace score_history
