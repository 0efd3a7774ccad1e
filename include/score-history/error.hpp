/// @file error.hpp
/// @brief Error types for the score-history library.

#pragma once

#include <score-history/types.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace score_history {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    score_not_found,        ///< No score exists for (owner, name).
    version_not_found,      ///< The version label does not name a recorded version.
    object_not_found,       ///< A referenced object is missing from the store.
    concurrency_conflict,   ///< The declared parent is not the current head.
    invalid_operation,      ///< Out-of-range index or malformed payload.
    no_change,              ///< The update would not change anything.
    unsupported_operation,  ///< Unknown operation tag under strict decoding.
    already_exists,         ///< A score with this (owner, name) already exists.
    storage_error,          ///< The backing store failed or returned corrupt data.
    invalid_config,         ///< Configuration could not be parsed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::score_not_found:       return "score_not_found";
        case ErrorKind::version_not_found:     return "version_not_found";
        case ErrorKind::object_not_found:      return "object_not_found";
        case ErrorKind::concurrency_conflict:  return "concurrency_conflict";
        case ErrorKind::invalid_operation:     return "invalid_operation";
        case ErrorKind::no_change:             return "no_change";
        case ErrorKind::unsupported_operation: return "unsupported_operation";
        case ErrorKind::already_exists:        return "already_exists";
        case ErrorKind::storage_error:         return "storage_error";
        case ErrorKind::invalid_config:        return "invalid_config";
    }
    return "unknown";
}

/// User-facing grouping of error kinds.
///
/// A UI only needs to tell "refresh and retry" apart from "the request is
/// malformed"; each category has one stable message.
enum class ErrorCategory : std::uint8_t {
    not_found,
    conflict,
    client_error,
    no_change,
    internal,
};

constexpr auto category_of(ErrorKind kind) noexcept -> ErrorCategory {
    switch (kind) {
        case ErrorKind::score_not_found:
        case ErrorKind::version_not_found:
        case ErrorKind::object_not_found:
            return ErrorCategory::not_found;
        case ErrorKind::concurrency_conflict:
            return ErrorCategory::conflict;
        case ErrorKind::invalid_operation:
        case ErrorKind::unsupported_operation:
        case ErrorKind::already_exists:
            return ErrorCategory::client_error;
        case ErrorKind::no_change:
            return ErrorCategory::no_change;
        case ErrorKind::storage_error:
        case ErrorKind::invalid_config:
            return ErrorCategory::internal;
    }
    return ErrorCategory::internal;
}

constexpr auto to_string_view(ErrorCategory category) noexcept -> std::string_view {
    switch (category) {
        case ErrorCategory::not_found:    return "not_found";
        case ErrorCategory::conflict:     return "conflict";
        case ErrorCategory::client_error: return "client_error";
        case ErrorCategory::no_change:    return "no_change";
        case ErrorCategory::internal:     return "internal";
    }
    return "unknown";
}

/// Stable message shown to end users for a category.
constexpr auto user_message(ErrorCategory category) noexcept -> std::string_view {
    switch (category) {
        case ErrorCategory::not_found:
            return "The requested score or version does not exist.";
        case ErrorCategory::conflict:
            return "The score was changed by someone else. Refresh and try again.";
        case ErrorCategory::client_error:
            return "The request is malformed.";
        case ErrorCategory::no_change:
            return "There are no changes to apply.";
        case ErrorCategory::internal:
            return "An internal storage error occurred.";
    }
    return "An unknown error occurred.";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every failing engine and store operation.
class ScoreError : public std::runtime_error {
public:
    explicit ScoreError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    ScoreError(ErrorKind kind, std::string message)
        : ScoreError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto category() const noexcept -> ErrorCategory { return category_of(error_.kind); }

private:
    Error error_;
};

/// Raised by ObjectStore::get_batch when any requested hash is absent.
class ObjectsMissing : public ScoreError {
public:
    explicit ObjectsMissing(std::vector<ObjectHash> missing)
        : ScoreError{ErrorKind::object_not_found, describe(missing)},
          missing_{std::move(missing)} {}

    /// The subset of the requested hashes that could not be resolved.
    auto missing() const noexcept -> const std::vector<ObjectHash>& { return missing_; }

private:
    static auto describe(const std::vector<ObjectHash>& missing) -> std::string {
        auto msg = std::to_string(missing.size()) + " object(s) missing:";
        for (const auto& h : missing) {
            msg += ' ';
            msg += h.to_hex();
        }
        return msg;
    }

    std::vector<ObjectHash> missing_;
};

}  // namespace score_history
