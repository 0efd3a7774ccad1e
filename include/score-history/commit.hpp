/// @file commit.hpp
/// @brief Commit operations and their effect on a page sequence.

#pragma once

#include <score-history/objects.hpp>
#include <score-history/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace score_history {

/// Append a page to the end of the sequence.
struct AddPage {
    std::string image;
    std::string thumbnail;
    std::string number;

    auto operator==(const AddPage&) const -> bool = default;
};

/// Insert a page at a 0-based position; `index == length` appends.
struct InsertPage {
    std::size_t index{0};
    std::string image;
    std::string thumbnail;
    std::string number;

    auto operator==(const InsertPage&) const -> bool = default;
};

/// Remove the page at a 0-based position.
struct DeletePage {
    std::size_t index{0};

    auto operator==(const DeletePage&) const -> bool = default;
};

/// Override title and/or description; omitted fields keep their value.
struct UpdateProperty {
    std::optional<std::string> title;
    std::optional<std::string> description;

    auto operator==(const UpdateProperty&) const -> bool = default;
};

/// One operation of a commit request.
using Commit = std::variant<AddPage, InsertPage, DeletePage, UpdateProperty>;

/// The kind of mutation a Commit represents.
enum class OpType : std::uint8_t {
    add_page,
    insert_page,
    delete_page,
    update_property,
};

/// Convert an OpType to its wire tag.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add_page:        return "add_page";
        case OpType::insert_page:     return "insert_page";
        case OpType::delete_page:     return "delete_page";
        case OpType::update_property: return "update_property";
    }
    return "unknown";
}

/// Parse a wire tag, or nullopt for an unknown tag.
inline auto op_type_from_string(std::string_view tag) -> std::optional<OpType> {
    if (tag == "add_page") return OpType::add_page;
    if (tag == "insert_page") return OpType::insert_page;
    if (tag == "delete_page") return OpType::delete_page;
    if (tag == "update_property") return OpType::update_property;
    return std::nullopt;
}

inline auto op_type_of(const Commit& commit) -> OpType {
    return static_cast<OpType>(commit.index());
}

/// A batch of page operations against a declared parent snapshot.
struct CommitRequest {
    ObjectHash parent;             ///< Snapshot hash the caller believes is current.
    std::vector<Commit> commits;   ///< Applied strictly in this order.

    auto operator==(const CommitRequest&) const -> bool = default;
};

/// A property update against a declared parent property.
struct PropertyRequest {
    ObjectHash parent;        ///< Property hash the caller believes is current.
    UpdateProperty property;  ///< Fields to override.

    auto operator==(const PropertyRequest&) const -> bool = default;
};

/// An element of an in-memory page sequence.
///
/// Pages loaded from a snapshot carry their hash; pages created by
/// add/insert do not until they are persisted.
struct PageEntry {
    Page page;
    std::optional<ObjectHash> hash;

    auto operator==(const PageEntry&) const -> bool = default;
};

using PageSequence = std::vector<PageEntry>;

/// Apply a single page operation to a sequence in place.
/// @throws ScoreError invalid_operation for an out-of-range index or
///   an update_property operation (which belongs to the property chain).
void apply_operation(PageSequence& pages, const Commit& commit);

/// Apply operations in order, each against the result of the previous one.
///
/// The input is not modified; on failure nothing is returned.
/// @throws ScoreError as apply_operation, with the failing position.
auto apply_operations(const PageSequence& pages, const std::vector<Commit>& commits)
    -> PageSequence;

}  // namespace score_history
