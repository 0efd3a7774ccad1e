/// @file annotation_engine.hpp
/// @brief Annotation operations and the annotation chain of a score.

#pragma once

#include <score-history/object_store.hpp>
#include <score-history/objects.hpp>
#include <score-history/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace score_history {

// -- Operations ---------------------------------------------------------------

/// Append an annotation; it receives the set's next id.
struct AddAnnotation {
    std::string content;

    auto operator==(const AddAnnotation&) const -> bool = default;
};

/// Remove the annotation with the given id.
struct RemoveAnnotation {
    std::uint64_t id{0};

    auto operator==(const RemoveAnnotation&) const -> bool = default;
};

/// Replace the content of the annotation with the given id, in place.
struct ReplaceAnnotation {
    std::uint64_t id{0};
    std::string content;

    auto operator==(const ReplaceAnnotation&) const -> bool = default;
};

using AnnotationOperation = std::variant<AddAnnotation, RemoveAnnotation, ReplaceAnnotation>;

enum class AnnotationOpType : std::uint8_t {
    add_annotation,
    remove_annotation,
    replace_annotation,
};

constexpr auto to_string_view(AnnotationOpType type) noexcept -> std::string_view {
    switch (type) {
        case AnnotationOpType::add_annotation:     return "add_annotation";
        case AnnotationOpType::remove_annotation:  return "remove_annotation";
        case AnnotationOpType::replace_annotation: return "replace_annotation";
    }
    return "unknown";
}

inline auto annotation_op_type_from_string(std::string_view tag)
    -> std::optional<AnnotationOpType> {
    if (tag == "add_annotation") return AnnotationOpType::add_annotation;
    if (tag == "remove_annotation") return AnnotationOpType::remove_annotation;
    if (tag == "replace_annotation") return AnnotationOpType::replace_annotation;
    return std::nullopt;
}

inline auto annotation_op_type_of(const AnnotationOperation& op) -> AnnotationOpType {
    return static_cast<AnnotationOpType>(op.index());
}

/// A batch of annotation operations against a declared parent set.
struct AnnotationRequest {
    ObjectHash parent;                            ///< Set hash the caller believes is current.
    std::vector<AnnotationOperation> operations;  ///< Applied strictly in this order.

    auto operator==(const AnnotationRequest&) const -> bool = default;
};

/// A stored annotation set and its hash.
struct AnnotationResult {
    ObjectHash hash;
    AnnotationSet annotations;

    auto operator==(const AnnotationResult&) const -> bool = default;
};

/// Apply one operation in place.
/// @throws ScoreError invalid_operation if the target id does not exist.
void apply_annotation_operation(AnnotationSet& set, const AnnotationOperation& op);

// -- Engine -------------------------------------------------------------------

/// Maintains the annotation history of a score.
///
/// Like the property chain, annotations have their own parent hashes and
/// their own head pointer, independent of the page snapshots.
class AnnotationEngine {
public:
    explicit AnnotationEngine(ObjectStore& objects);

    /// Store the empty root set of a new score.
    auto create() -> AnnotationResult;

    auto load(const ObjectHash& hash) const -> AnnotationSet;

    /// Validate the declared parent, apply every operation and store the
    /// new set. The batch is all-or-nothing.
    /// @throws ScoreError concurrency_conflict on a stale parent,
    ///   invalid_operation for an empty batch or an unknown id,
    ///   no_change if the annotations end up as they were.
    auto update(const ObjectHash& current, const AnnotationRequest& request) -> AnnotationResult;

    /// Walk the chain from `head` back to the root, newest first.
    auto history(const ObjectHash& head) const -> std::vector<AnnotationResult>;

private:
    ObjectStore& objects_;
};

}  // namespace score_history
