/// @file config.hpp
/// @brief Engine configuration.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace score_history {

/// Policy knobs of a ScoreEngine.
///
/// @code
/// {
///   "version_base": 1,
///   "strict_operations": true,
///   "lock_timeout_ms": 200,
///   "cache_capacity": 64,
///   "log_level": "info"
/// }
/// @endcode
struct EngineConfig {
    std::uint64_t version_base{1};                      ///< First version number of a score (>= 1).
    bool strict_operations{true};                       ///< Reject unknown operation tags.
    std::chrono::milliseconds lock_timeout{200};        ///< Bounded wait for the per-score lock.
    std::size_t cache_capacity{64};                     ///< Materialized snapshots kept; 0 disables.
    std::string log_level{"info"};                      ///< spdlog level name.

    auto operator==(const EngineConfig&) const -> bool = default;
};

void to_json(nlohmann::json& j, const EngineConfig& config);

/// Missing keys keep their defaults.
/// @throws ScoreError invalid_config on a wrongly typed or invalid value.
void from_json(const nlohmann::json& j, EngineConfig& config);

/// Load a configuration file.
/// @throws ScoreError invalid_config if the file cannot be read or parsed.
auto load_config(const std::filesystem::path& path) -> EngineConfig;

}  // namespace score_history
