/// @file score_engine.hpp
/// @brief The ScoreEngine class -- the primary API for score-history.

#pragma once

#include <score-history/annotation_engine.hpp>
#include <score-history/commit.hpp>
#include <score-history/config.hpp>
#include <score-history/head_store.hpp>
#include <score-history/object_store.hpp>
#include <score-history/objects.hpp>
#include <score-history/property_engine.hpp>
#include <score-history/types.hpp>
#include <score-history/version_index.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace score_history {

namespace detail {
class SnapshotCache;
}  // namespace detail

/// Outcome of a successful page commit.
struct CommitResult {
    ObjectHash snapshot;       ///< Hash of the new snapshot (the new head).
    std::uint64_t version{0};  ///< Version number recorded for it.
    std::vector<Page> pages;   ///< The final page sequence.

    auto operator==(const CommitResult&) const -> bool = default;
};

/// A score and its current property, as shown in a score listing.
struct ScoreSummary {
    ScoreId id;
    Property property;

    auto operator==(const ScoreSummary&) const -> bool = default;
};

/// Everything a client needs to open a score.
struct ScoreDetail {
    ScoreId id;
    ScoreHead head;
    Property property;
    std::vector<Annotation> annotations;
    std::vector<VersionEntry> versions;

    auto operator==(const ScoreDetail&) const -> bool = default;
};

/// Versioned storage of scores with optimistic concurrency.
///
/// Reads never take the per-score write lock: they read the head pointer
/// once and then only immutable objects; version listings stop at the
/// version the head names. Writes to one score are
/// serialized by a per-score lock acquired with a bounded wait, and the
/// head is advanced by compare-and-set so that writers in other
/// processes sharing the head store are also detected. The engine never
/// retries a failed write; on concurrency_conflict the caller re-reads
/// the head and recomputes its edits.
///
/// @code
/// auto engine = ScoreEngine{};
/// auto head = engine.create_score({"u1", "s1"}, UpdateProperty{.title = "Sonata"});
/// auto result = engine.commit({"u1", "s1"}, CommitRequest{
///     .parent = head.snapshot,
///     .commits = {AddPage{.image = "img", .thumbnail = "th", .number = "1"}},
/// });
/// @endcode
class ScoreEngine {
public:
    /// Construct with in-memory backends.
    explicit ScoreEngine(EngineConfig config = {});

    /// Construct over explicit backends.
    ScoreEngine(std::shared_ptr<ObjectStore> objects,
                std::shared_ptr<HeadStore> heads,
                std::shared_ptr<VersionIndex> versions,
                EngineConfig config = {});

    ~ScoreEngine();

    ScoreEngine(const ScoreEngine&) = delete;
    auto operator=(const ScoreEngine&) -> ScoreEngine& = delete;

    // -- Scores ---------------------------------------------------------------

    /// Create an empty score with a root property and an empty annotation
    /// set. No version is recorded.
    /// @throws ScoreError already_exists, invalid_operation for an empty id.
    auto create_score(const ScoreId& id, const UpdateProperty& property) -> ScoreHead;

    /// Summary, head and version list of a score.
    /// @throws ScoreError score_not_found.
    auto get_score(const ScoreId& id) const -> ScoreDetail;

    /// All scores of an owner, ordered by name.
    auto list_scores(std::string_view owner) const -> std::vector<ScoreSummary>;

    /// Remove a score's head and versions. Stored objects are kept.
    /// @throws ScoreError score_not_found.
    void delete_score(const ScoreId& id);

    /// Current head pointers.
    /// @throws ScoreError score_not_found.
    auto head(const ScoreId& id) const -> ScoreHead;

    // -- Pages and versions ---------------------------------------------------

    /// Apply a batch of page operations against the declared parent.
    ///
    /// Either every operation lands in one new snapshot and one new version,
    /// or the head is left untouched.
    /// @throws ScoreError score_not_found, concurrency_conflict,
    ///   invalid_operation, object_not_found.
    auto commit(const ScoreId& id, const CommitRequest& request) -> CommitResult;

    /// Pages of a named version.
    /// @throws ScoreError score_not_found, version_not_found.
    auto get_pages(const ScoreId& id, std::string_view version) const -> std::vector<Page>;

    /// Pages of the current head snapshot.
    auto get_latest_pages(const ScoreId& id) const -> std::vector<Page>;

    /// All published versions of a score in ascending order.
    auto list_versions(const ScoreId& id) const -> std::vector<VersionEntry>;

    /// Snapshot hashes from the head back to the root, newest first.
    auto snapshot_history(const ScoreId& id) const -> std::vector<ObjectHash>;

    // -- Property -------------------------------------------------------------

    /// Current property of a score.
    auto get_property(const ScoreId& id) const -> Property;

    /// Apply a property update against the declared parent.
    /// @throws ScoreError score_not_found, concurrency_conflict, no_change.
    auto update_property(const ScoreId& id, const PropertyRequest& request) -> PropertyResult;

    /// Property chain from the head back to the root, newest first.
    auto property_history(const ScoreId& id) const -> std::vector<PropertyResult>;

    // -- Annotations ----------------------------------------------------------

    /// Current annotations of a score, in insertion order.
    auto get_annotations(const ScoreId& id) const -> AnnotationSet;

    /// Apply annotation operations against the declared parent set.
    /// @throws ScoreError score_not_found, concurrency_conflict,
    ///   invalid_operation, no_change.
    auto update_annotations(const ScoreId& id, const AnnotationRequest& request)
        -> AnnotationResult;

    /// Annotation chain from the head back to the root, newest first.
    auto annotation_history(const ScoreId& id) const -> std::vector<AnnotationResult>;

    // -- Diagnostics ----------------------------------------------------------

    /// Number of scores with a writer holding or waiting for the write lock.
    auto active_writers() const -> std::size_t;

    // -- Backends -------------------------------------------------------------

    auto config() const -> const EngineConfig& { return config_; }
    auto object_store() const -> ObjectStore& { return *objects_; }

private:
    auto load_head(const ScoreId& id) const -> ScoreHead;
    auto materialize(const ObjectHash& snapshot) const -> PageSequence;
    auto published_versions(const ScoreId& id, const ScoreHead& head) const
        -> std::vector<VersionEntry>;
    void withdraw_version(const ScoreId& id, std::uint64_t version, const ObjectHash& snapshot);

    class WriteLock;

    struct WriteSlot {
        std::timed_mutex mutex;
        std::size_t users{0};
    };

    std::shared_ptr<ObjectStore> objects_;
    std::shared_ptr<HeadStore> heads_;
    std::shared_ptr<VersionIndex> versions_;
    EngineConfig config_;
    PropertyEngine properties_;
    AnnotationEngine annotations_;
    std::unique_ptr<detail::SnapshotCache> cache_;

    // Slots exist only while a writer holds or waits for them
    std::map<ScoreId, std::unique_ptr<WriteSlot>> write_slots_;
    mutable std::mutex write_slots_mutex_;
};

}  // namespace score_history
