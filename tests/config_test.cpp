#include <score-history/config.hpp>
#include <score-history/error.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

using namespace score_history;
namespace fs = std::filesystem;

namespace {

void expect_invalid_config(const nlohmann::json& j) {
    try {
        (void)j.get<EngineConfig>();
        FAIL() << "expected invalid_config for " << j.dump();
    } catch (const ScoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
}

auto temp_file(std::string_view content) -> fs::path {
    auto rng = std::random_device{};
    auto path = fs::temp_directory_path() / ("score-history-config-" + std::to_string(rng()) + ".json");
    auto out = std::ofstream{path};
    out << content;
    return path;
}

}  // namespace

TEST(EngineConfig, defaults) {
    auto config = EngineConfig{};
    EXPECT_EQ(config.version_base, 1u);
    EXPECT_TRUE(config.strict_operations);
    EXPECT_EQ(config.lock_timeout, std::chrono::milliseconds{200});
    EXPECT_EQ(config.cache_capacity, 64u);
    EXPECT_EQ(config.log_level, "info");
}

TEST(EngineConfig, empty_object_keeps_defaults) {
    EXPECT_EQ(nlohmann::json::object().get<EngineConfig>(), EngineConfig{});
}

TEST(EngineConfig, partial_override) {
    auto config = nlohmann::json{{"lock_timeout_ms", 50}, {"strict_operations", false}}
                      .get<EngineConfig>();
    EXPECT_EQ(config.lock_timeout, std::chrono::milliseconds{50});
    EXPECT_FALSE(config.strict_operations);
    EXPECT_EQ(config.version_base, 1u);
    EXPECT_EQ(config.log_level, "info");
}

TEST(EngineConfig, json_round_trip) {
    auto config = EngineConfig{
        .version_base = 10,
        .strict_operations = false,
        .lock_timeout = std::chrono::milliseconds{5},
        .cache_capacity = 0,
        .log_level = "debug",
    };
    EXPECT_EQ(nlohmann::json(config).get<EngineConfig>(), config);
}

TEST(EngineConfig, rejects_bad_values) {
    expect_invalid_config(nlohmann::json::array());
    expect_invalid_config({{"version_base", "one"}});
    expect_invalid_config({{"strict_operations", 3}});
    expect_invalid_config({{"lock_timeout_ms", -1}});
    expect_invalid_config({{"version_base", 0}});
    expect_invalid_config({{"log_level", "chatty"}});
}

TEST(EngineConfig, accepts_spdlog_level_names) {
    for (const auto* level : {"trace", "debug", "info", "warning", "error", "critical", "off"}) {
        EXPECT_EQ(nlohmann::json({{"log_level", level}}).get<EngineConfig>().log_level, level);
    }
}

TEST(EngineConfig, load_config_from_file) {
    auto path = temp_file(R"({"version_base": 5, "cache_capacity": 8})");
    auto config = load_config(path);
    fs::remove(path);
    EXPECT_EQ(config.version_base, 5u);
    EXPECT_EQ(config.cache_capacity, 8u);
}

TEST(EngineConfig, load_config_errors) {
    EXPECT_THROW((void)load_config(fs::temp_directory_path() / "score-history-no-such-file.json"),
                 ScoreError);

    auto path = temp_file("{ not json");
    try {
        (void)load_config(path);
        FAIL() << "expected invalid_config";
    } catch (const ScoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
    fs::remove(path);
}
