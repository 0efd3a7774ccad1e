#include <score-history/config.hpp>

#include <score-history/error.hpp>

#include <spdlog/common.h>

#include <fstream>
#include <string>

namespace score_history {

void to_json(nlohmann::json& j, const EngineConfig& config) {
    j = nlohmann::json{
        {"version_base", config.version_base},
        {"strict_operations", config.strict_operations},
        {"lock_timeout_ms", config.lock_timeout.count()},
        {"cache_capacity", config.cache_capacity},
        {"log_level", config.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& config) {
    if (!j.is_object()) {
        throw ScoreError{ErrorKind::invalid_config, "configuration must be a JSON object"};
    }
    try {
        if (auto it = j.find("version_base"); it != j.end()) {
            config.version_base = it->get<std::uint64_t>();
            // 0 marks a head with no recorded version
            if (config.version_base == 0) {
                throw ScoreError{ErrorKind::invalid_config, "version_base must be at least 1"};
            }
        }
        if (auto it = j.find("strict_operations"); it != j.end()) {
            config.strict_operations = it->get<bool>();
        }
        if (auto it = j.find("lock_timeout_ms"); it != j.end()) {
            auto ms = it->get<std::int64_t>();
            if (ms < 0) {
                throw ScoreError{ErrorKind::invalid_config, "lock_timeout_ms must not be negative"};
            }
            config.lock_timeout = std::chrono::milliseconds{ms};
        }
        if (auto it = j.find("cache_capacity"); it != j.end()) {
            config.cache_capacity = it->get<std::size_t>();
        }
        if (auto it = j.find("log_level"); it != j.end()) {
            config.log_level = it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ScoreError{ErrorKind::invalid_config, e.what()};
    }

    // spdlog maps unknown names to "off"; only accept real level names
    if (config.log_level != "off" &&
        spdlog::level::from_str(config.log_level) == spdlog::level::off) {
        throw ScoreError{ErrorKind::invalid_config, "unknown log_level '" + config.log_level + "'"};
    }
}

auto load_config(const std::filesystem::path& path) -> EngineConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw ScoreError{ErrorKind::invalid_config, "cannot open " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw ScoreError{ErrorKind::invalid_config, path.string() + " is not valid JSON"};
    }
    auto config = EngineConfig{};
    from_json(j, config);
    return config;
}

}  // namespace score_history
