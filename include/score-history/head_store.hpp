/// @file head_store.hpp
/// @brief Per-score mutable head pointer with compare-and-set.

#pragma once

#include <score-history/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace score_history {

/// The current pointers of a score.
///
/// This is the only mutable entity; everything it names is immutable
/// and content-addressed.
struct ScoreHead {
    ObjectHash snapshot;              ///< Current snapshot hash.
    ObjectHash property;              ///< Current property hash.
    ObjectHash annotations;           ///< Current annotation set hash.
    std::uint64_t latest_version{0};  ///< 0 until the first version is recorded.

    auto operator==(const ScoreHead&) const -> bool = default;
};

/// Durable mapping ScoreId -> ScoreHead with atomic conditional update.
///
/// Storage backends are swappable behind this interface. All methods
/// must be safe for concurrent calls.
class HeadStore {
public:
    virtual ~HeadStore() = default;

    /// Insert a head for a new score.
    /// @return false if the score already exists (nothing is written).
    virtual auto create(const ScoreId& id, const ScoreHead& head) -> bool = 0;

    /// Read the current head, or nullopt if the score does not exist.
    virtual auto get(const ScoreId& id) const -> std::optional<ScoreHead> = 0;

    /// Replace the head only if it still equals `expected`.
    /// @return false if the score is missing or the head differs.
    virtual auto compare_and_set(const ScoreId& id, const ScoreHead& expected,
                                 const ScoreHead& desired) -> bool = 0;

    /// Remove a score's head.
    /// @return false if the score did not exist.
    virtual auto remove(const ScoreId& id) -> bool = 0;

    /// All scores of an owner, ordered by name.
    virtual auto list(std::string_view owner) const -> std::vector<ScoreId> = 0;
};

/// In-process head store.
class MemoryHeadStore final : public HeadStore {
public:
    auto create(const ScoreId& id, const ScoreHead& head) -> bool override;
    auto get(const ScoreId& id) const -> std::optional<ScoreHead> override;
    auto compare_and_set(const ScoreId& id, const ScoreHead& expected,
                         const ScoreHead& desired) -> bool override;
    auto remove(const ScoreId& id) -> bool override;
    auto list(std::string_view owner) const -> std::vector<ScoreId> override;

private:
    std::map<ScoreId, ScoreHead> heads_;
    mutable std::shared_mutex mutex_;
};

}  // namespace score_history
