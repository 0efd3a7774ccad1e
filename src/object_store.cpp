#include <score-history/object_store.hpp>

#include <score-history/error.hpp>
#include <score-history/hash.hpp>

#include <mutex>
#include <vector>

namespace score_history {

auto ObjectStore::get(const ObjectHash& hash) const -> Object {
    auto objects = get_batch({hash});
    return std::move(objects.at(hash));
}

auto MemoryObjectStore::put(const Object& obj) -> ObjectHash {
    auto hash = hash_object(obj);
    auto lock = std::unique_lock{mutex_};
    objects_.try_emplace(hash, obj);
    return hash;
}

auto MemoryObjectStore::get_batch(const std::set<ObjectHash>& hashes) const
    -> std::map<ObjectHash, Object> {
    auto result = std::map<ObjectHash, Object>{};
    auto missing = std::vector<ObjectHash>{};
    {
        auto lock = std::shared_lock{mutex_};
        for (const auto& h : hashes) {
            auto it = objects_.find(h);
            if (it == objects_.end()) {
                missing.push_back(h);
            } else {
                result.emplace(h, it->second);
            }
        }
    }
    if (!missing.empty()) throw ObjectsMissing{std::move(missing)};
    return result;
}

auto MemoryObjectStore::contains(const ObjectHash& hash) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return objects_.contains(hash);
}

auto MemoryObjectStore::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return objects_.size();
}

}  // namespace score_history
