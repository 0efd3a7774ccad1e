/// @file property_engine.hpp
/// @brief Optimistic-concurrency updates of the property chain.

#pragma once

#include <score-history/commit.hpp>
#include <score-history/object_store.hpp>
#include <score-history/objects.hpp>
#include <score-history/types.hpp>

#include <utility>
#include <vector>

namespace score_history {

/// A stored property and its hash.
struct PropertyResult {
    ObjectHash hash;
    Property property;

    auto operator==(const PropertyResult&) const -> bool = default;
};

/// Maintains the singly-linked property history of a score.
///
/// The property chain is independent from the snapshot chain: it has its
/// own parent hashes and its own head pointer. PropertyEngine computes and
/// stores new Property objects; advancing the head is the caller's job
/// (ScoreEngine does it under the per-score write lock).
class PropertyEngine {
public:
    explicit PropertyEngine(ObjectStore& objects);

    /// Store the root property of a new score.
    auto create(const UpdateProperty& initial) -> PropertyResult;

    /// Load a property by hash.
    /// @throws ObjectsMissing if absent, ScoreError object_not_found if the
    ///   hash names another kind of object.
    auto load(const ObjectHash& hash) const -> Property;

    /// Validate the declared parent, merge and store the new property.
    ///
    /// Only fields present in the request override; omitted fields keep
    /// their prior value.
    /// @param current The property hash the head currently points to.
    /// @throws ScoreError concurrency_conflict if `request.parent != current`,
    ///   no_change if the merged property equals the current one.
    auto update(const ObjectHash& current, const PropertyRequest& request) -> PropertyResult;

    /// Walk the chain from `head` back to the root, newest first.
    auto history(const ObjectHash& head) const -> std::vector<PropertyResult>;

private:
    ObjectStore& objects_;
};

}  // namespace score_history
