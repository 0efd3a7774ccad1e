/// @file hash.hpp
/// @brief Canonical encoding and content hashing of stored objects.

#pragma once

#include <score-history/objects.hpp>
#include <score-history/types.hpp>

#include <string>

namespace score_history {

/// Render an object in its canonical form.
///
/// The canonical form is compact JSON with sorted keys, a "kind"
/// discriminator, and absent optional fields omitted, so that two
/// logically identical objects always produce the same bytes
/// regardless of how they were constructed.
auto canonical_form(const Object& obj) -> std::string;

/// SHA-256 of the canonical form.
auto hash_object(const Object& obj) -> ObjectHash;

/// Parse a canonical form back into an object.
/// @throws ScoreError (storage_error) if the text is not a valid object.
auto parse_canonical(const std::string& text) -> Object;

}  // namespace score_history
