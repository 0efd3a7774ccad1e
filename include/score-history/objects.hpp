/// @file objects.hpp
/// @brief Immutable content-addressed objects: Page, Snapshot, Property,
///   AnnotationSet.

#pragma once

#include <score-history/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace score_history {

/// One page of a score.
///
/// `image` and `thumbnail` are blob references produced by a BlobStore;
/// they are stored and compared, never interpreted.
struct Page {
    std::string image;      ///< Blob reference of the full-size image.
    std::string thumbnail;  ///< Blob reference of the thumbnail.
    std::string number;     ///< Display label ("1", "iv", "A-2", ...).

    auto operator==(const Page&) const -> bool = default;
};

/// The ordered page list of a score at one point in history.
///
/// The same page hash may appear more than once. Order is part of the
/// object's hash.
struct Snapshot {
    std::vector<ObjectHash> pages;     ///< Page hashes in display order.
    std::optional<ObjectHash> parent;  ///< Previous snapshot, nullopt for the root.

    auto operator==(const Snapshot&) const -> bool = default;
};

/// Title and description of a score, chained through `parent`.
struct Property {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<ObjectHash> parent;  ///< Previous property, nullopt for the root.

    /// Compare title and description only.
    auto same_content(const Property& other) const -> bool {
        return title == other.title && description == other.description;
    }

    auto operator==(const Property&) const -> bool = default;
};

/// A comment attached to a score.
struct Annotation {
    std::uint64_t id{0};  ///< Unique within the score, never reused.
    std::string content;

    auto operator==(const Annotation&) const -> bool = default;
};

/// The annotations of a score, chained through `parent`.
struct AnnotationSet {
    std::vector<Annotation> items;     ///< In the order they were added.
    std::uint64_t next_id{0};          ///< Id for the next added annotation.
    std::optional<ObjectHash> parent;  ///< Previous set, nullopt for the root.

    auto operator==(const AnnotationSet&) const -> bool = default;
};

/// Any object that can live in the object store.
using Object = std::variant<Page, Snapshot, Property, AnnotationSet>;

/// Discriminator for Object alternatives.
enum class ObjectKind : std::uint8_t {
    page,
    snapshot,
    property,
    annotations,
};

/// Convert an ObjectKind to its string representation.
constexpr auto to_string_view(ObjectKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ObjectKind::page:     return "page";
        case ObjectKind::snapshot: return "snapshot";
        case ObjectKind::property: return "property";
        case ObjectKind::annotations: return "annotations";
    }
    return "unknown";
}

/// Parse an ObjectKind name, or nullopt if unknown.
inline auto object_kind_from_string(std::string_view name) -> std::optional<ObjectKind> {
    if (name == "page") return ObjectKind::page;
    if (name == "snapshot") return ObjectKind::snapshot;
    if (name == "property") return ObjectKind::property;
    if (name == "annotations") return ObjectKind::annotations;
    return std::nullopt;
}

inline auto kind_of(const Object& obj) -> ObjectKind {
    return static_cast<ObjectKind>(obj.index());
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Page& p) { ... },
///     [](const Snapshot& s) { ... },
///     [](const Property& p) { ... },
///     [](const AnnotationSet& a) { ... },
/// }, object);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Extract a typed object, or nullopt on kind mismatch.
template <typename T>
auto get_object(const Object& obj) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&obj)) {
        return *t;
    }
    return std::nullopt;
}

}  // namespace score_history
