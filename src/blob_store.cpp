#include <score-history/blob_store.hpp>

#include "crypto/sha256.hpp"

#include <mutex>

namespace score_history {

auto MemoryBlobStore::put(std::span<const std::byte> data) -> std::string {
    auto reference = "sha256:" + crypto::to_hex(crypto::sha256(data));
    auto lock = std::unique_lock{mutex_};
    blobs_.try_emplace(reference, data.begin(), data.end());
    return reference;
}

auto MemoryBlobStore::get(std::string_view reference) const
    -> std::optional<std::vector<std::byte>> {
    auto lock = std::shared_lock{mutex_};
    auto it = blobs_.find(std::string{reference});
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

auto MemoryBlobStore::contains(std::string_view reference) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return blobs_.contains(std::string{reference});
}

}  // namespace score_history
