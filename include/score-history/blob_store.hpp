/// @file blob_store.hpp
/// @brief Blob store: binary content -> stable reference string.

#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace score_history {

/// Stores page images and thumbnails.
///
/// The engine only stores and compares the returned references; it never
/// reads the bytes back.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /// Store content and return its reference. Idempotent.
    virtual auto put(std::span<const std::byte> data) -> std::string = 0;

    /// Fetch content, or nullopt if the reference is unknown.
    virtual auto get(std::string_view reference) const
        -> std::optional<std::vector<std::byte>> = 0;

    virtual auto contains(std::string_view reference) const -> bool = 0;
};

/// In-process blob store; references are "sha256:<hex digest>".
class MemoryBlobStore final : public BlobStore {
public:
    auto put(std::span<const std::byte> data) -> std::string override;
    auto get(std::string_view reference) const
        -> std::optional<std::vector<std::byte>> override;
    auto contains(std::string_view reference) const -> bool override;

private:
    std::unordered_map<std::string, std::vector<std::byte>> blobs_;
    mutable std::shared_mutex mutex_;
};

}  // namespace score_history
