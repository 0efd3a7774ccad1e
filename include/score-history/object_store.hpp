/// @file object_store.hpp
/// @brief Content object store: hash -> immutable object.

#pragma once

#include <score-history/objects.hpp>
#include <score-history/types.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace score_history {

/// Append-only mapping from content hash to object.
///
/// The store is the only component that performs hash lookups. Objects
/// are never mutated or deleted once written. Implementations must be
/// safe for concurrent calls.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Hash the object and store it if absent. Idempotent.
    /// @return The object's content hash.
    virtual auto put(const Object& obj) -> ObjectHash = 0;

    /// Resolve every hash in one round.
    /// @throws ObjectsMissing listing the absent subset if any hash is absent.
    virtual auto get_batch(const std::set<ObjectHash>& hashes) const
        -> std::map<ObjectHash, Object> = 0;

    /// Check whether an object is stored.
    virtual auto contains(const ObjectHash& hash) const -> bool = 0;

    /// Number of distinct objects stored.
    virtual auto size() const -> std::size_t = 0;

    /// Resolve a single hash.
    /// @throws ObjectsMissing if the hash is absent.
    auto get(const ObjectHash& hash) const -> Object;
};

/// In-process object store.
class MemoryObjectStore final : public ObjectStore {
public:
    auto put(const Object& obj) -> ObjectHash override;
    auto get_batch(const std::set<ObjectHash>& hashes) const
        -> std::map<ObjectHash, Object> override;
    auto contains(const ObjectHash& hash) const -> bool override;
    auto size() const -> std::size_t override;

private:
    std::unordered_map<ObjectHash, Object> objects_;
    mutable std::shared_mutex mutex_;
};

/// Object store persisted as one compressed file per object.
///
/// Layout: `<root>/objects/<first two hex chars>/<remaining hex chars>`.
/// Each file holds the canonical form compressed with raw DEFLATE.
/// Writes go to a temporary file and are renamed into place, so a
/// reader never observes a partial object. Reads re-hash the decoded
/// object and report a mismatch as storage_error.
class FileObjectStore final : public ObjectStore {
public:
    /// Open (and create if needed) a store rooted at `root`.
    /// @throws ScoreError storage_error if the directory cannot be created.
    explicit FileObjectStore(std::filesystem::path root);

    auto put(const Object& obj) -> ObjectHash override;
    auto get_batch(const std::set<ObjectHash>& hashes) const
        -> std::map<ObjectHash, Object> override;
    auto contains(const ObjectHash& hash) const -> bool override;
    auto size() const -> std::size_t override;

    /// Path of the file that holds (or would hold) an object.
    auto path_for(const ObjectHash& hash) const -> std::filesystem::path;

    /// Batches at least this large are decoded in parallel.
    static constexpr std::size_t parallel_threshold = 16;

private:
    auto read_object(const ObjectHash& hash) const -> Object;

    std::filesystem::path root_;
};

}  // namespace score_history
