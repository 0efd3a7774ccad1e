/// @file json.hpp
/// @brief nlohmann/json interoperability for score-history.
///
/// Provides ADL serialization (to_json/from_json) for the object model
/// and the wire format of commit and property requests:
///
/// @code
/// {
///   "parent": "<64 hex>",
///   "commits": [
///     {"type": "add_page", "add_page": {"image": "...", "thumbnail": "...", "number": "1"}},
///     {"type": "insert_page", "insert_page": {"index": 0, "image": "...", ...}},
///     {"type": "delete_page", "delete_page": {"index": 2}}
///   ]
/// }
/// @endcode

#pragma once

#include <score-history/annotation_engine.hpp>
#include <score-history/commit.hpp>
#include <score-history/head_store.hpp>
#include <score-history/objects.hpp>
#include <score-history/score_engine.hpp>
#include <score-history/types.hpp>
#include <score-history/version_index.hpp>

#include <nlohmann/json.hpp>

namespace score_history {

// -- Identity types (hex string) ----------------------------------------------

void to_json(nlohmann::json& j, const ObjectHash& h);
void from_json(const nlohmann::json& j, ObjectHash& h);

void to_json(nlohmann::json& j, const ScoreId& id);

// -- Objects ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Page& p);
void from_json(const nlohmann::json& j, Page& p);

void to_json(nlohmann::json& j, const Snapshot& s);
void from_json(const nlohmann::json& j, Snapshot& s);

void to_json(nlohmann::json& j, const Property& p);
void from_json(const nlohmann::json& j, Property& p);

void to_json(nlohmann::json& j, const Annotation& a);
void from_json(const nlohmann::json& j, Annotation& a);

void to_json(nlohmann::json& j, const AnnotationSet& s);
void from_json(const nlohmann::json& j, AnnotationSet& s);

/// Tagged with a "kind" member; this is the canonical form.
void to_json(nlohmann::json& j, const Object& obj);
void from_json(const nlohmann::json& j, Object& obj);

// -- Commits ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Commit& c);
void to_json(nlohmann::json& j, const CommitRequest& r);
void to_json(nlohmann::json& j, const UpdateProperty& u);
void to_json(nlohmann::json& j, const PropertyRequest& r);
void to_json(nlohmann::json& j, const AnnotationOperation& op);
void to_json(nlohmann::json& j, const AnnotationRequest& r);

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const ScoreHead& h);
void to_json(nlohmann::json& j, const VersionEntry& v);
void to_json(nlohmann::json& j, const CommitResult& r);
void to_json(nlohmann::json& j, const ScoreDetail& d);

// =============================================================================
// Request decoding
// =============================================================================

/// Decode one commit element.
/// @param strict Raise unsupported_operation for an unknown "type" tag.
/// @return The commit, or nullopt for an unknown tag in permissive mode.
/// @throws ScoreError invalid_operation for a malformed payload.
auto commit_from_json(const nlohmann::json& j, bool strict) -> std::optional<Commit>;

/// Decode a commit request. Unknown tags are skipped when not strict.
/// @throws ScoreError invalid_operation, unsupported_operation.
auto commit_request_from_json(const nlohmann::json& j, bool strict) -> CommitRequest;

/// Decode a property update request.
/// @throws ScoreError invalid_operation.
auto property_request_from_json(const nlohmann::json& j) -> PropertyRequest;

/// Decode an annotation request:
/// {"parent": hex, "operations": [{"type": "add_annotation", "add_annotation": {"content": ".."}}, ...]}.
/// Unknown tags are skipped when not strict.
/// @throws ScoreError invalid_operation, unsupported_operation.
auto annotation_request_from_json(const nlohmann::json& j, bool strict) -> AnnotationRequest;

}  // namespace score_history
