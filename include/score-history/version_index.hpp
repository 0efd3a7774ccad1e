/// @file version_index.hpp
/// @brief Append-only version log: version number -> snapshot hash.

#pragma once

#include <score-history/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace score_history {

/// A durable, numbered alias for a historical snapshot.
struct VersionEntry {
    std::uint64_t version{0};
    ObjectHash snapshot;

    auto operator==(const VersionEntry&) const -> bool = default;
};

/// A lazy, restartable view over the versions of one score.
///
/// The view covers the versions that existed when it was created, in
/// ascending order. Entries are fetched from the index one at a time
/// as the iterator advances; iterating again starts from the first
/// entry.
class VersionSequence {
public:
    using Fetch = std::function<VersionEntry(std::size_t)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = VersionEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = VersionEntry;

        iterator() = default;
        iterator(const VersionSequence* seq, std::size_t pos) : seq_{seq}, pos_{pos} {}

        auto operator*() const -> VersionEntry { return seq_->fetch_(pos_); }
        auto operator++() -> iterator& { ++pos_; return *this; }
        auto operator++(int) -> iterator { auto tmp = *this; ++pos_; return tmp; }
        auto operator==(const iterator& other) const -> bool { return pos_ == other.pos_; }

    private:
        const VersionSequence* seq_{nullptr};
        std::size_t pos_{0};
    };

    VersionSequence() = default;
    VersionSequence(std::size_t count, Fetch fetch)
        : count_{count}, fetch_{std::move(fetch)} {}

    auto begin() const -> iterator { return iterator{this, 0}; }
    auto end() const -> iterator { return iterator{this, count_}; }
    auto size() const -> std::size_t { return count_; }
    auto empty() const -> bool { return count_ == 0; }

    /// Materialize the whole view.
    auto to_vector() const -> std::vector<VersionEntry> {
        auto result = std::vector<VersionEntry>{};
        result.reserve(count_);
        for (auto entry : *this) result.push_back(entry);
        return result;
    }

private:
    std::size_t count_{0};
    Fetch fetch_;
};

/// Parse a decimal version label ("1", "42"), or nullopt.
auto parse_version_label(std::string_view label) -> std::optional<std::uint64_t>;

/// Maps version labels to snapshot hashes, per score.
///
/// A writer records a version before the score head names it, so an
/// entry newer than `ScoreHead::latest_version` is not yet published.
/// Readers filter on the head (ScoreEngine does).
class VersionIndex {
public:
    virtual ~VersionIndex() = default;

    /// Allocate the next version number (max + 1, or the base when
    /// empty) and append the mapping. Serialized per score.
    virtual auto record_version(const ScoreId& id, const ObjectHash& snapshot)
        -> std::uint64_t = 0;

    /// Resolve a decimal version label.
    /// @throws ScoreError version_not_found if the label is absent or not a number.
    virtual auto resolve(const ScoreId& id, std::string_view label) const -> ObjectHash = 0;

    /// Ascending view over all versions of a score (empty if none).
    virtual auto list_versions(const ScoreId& id) const -> VersionSequence = 0;

    /// The highest version, or nullopt if none was recorded.
    virtual auto latest(const ScoreId& id) const -> std::optional<VersionEntry> = 0;

    /// Withdraw the newest entry if it is exactly (version, snapshot).
    /// @return false if the newest entry is something else.
    virtual auto discard_version(const ScoreId& id, std::uint64_t version,
                                 const ObjectHash& snapshot) -> bool = 0;

    /// Drop every version of a score.
    virtual void remove_score(const ScoreId& id) = 0;
};

/// In-process version index.
class MemoryVersionIndex final : public VersionIndex {
public:
    /// @param base The first version number allocated for a score.
    explicit MemoryVersionIndex(std::uint64_t base = 1);

    auto record_version(const ScoreId& id, const ObjectHash& snapshot)
        -> std::uint64_t override;
    auto resolve(const ScoreId& id, std::string_view label) const -> ObjectHash override;
    auto list_versions(const ScoreId& id) const -> VersionSequence override;
    auto latest(const ScoreId& id) const -> std::optional<VersionEntry> override;
    auto discard_version(const ScoreId& id, std::uint64_t version,
                         const ObjectHash& snapshot) -> bool override;
    void remove_score(const ScoreId& id) override;

private:
    struct VersionLog {
        std::deque<VersionEntry> entries;
        mutable std::shared_mutex mutex;
    };

    auto find_log(const ScoreId& id) const -> std::shared_ptr<VersionLog>;

    std::uint64_t base_;
    std::map<ScoreId, std::shared_ptr<VersionLog>> logs_;
    mutable std::shared_mutex mutex_;
};

}  // namespace score_history
