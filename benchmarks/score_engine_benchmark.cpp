// score-history benchmarks - measures throughput of the commit and read paths.

#include <score-history/score_history.hpp>

#include "crypto/sha256.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace score_history;

static auto quiet_engine(std::size_t cache_capacity = 64) -> std::unique_ptr<ScoreEngine> {
    auto config = EngineConfig{};
    config.log_level = "off";
    config.cache_capacity = cache_capacity;
    return std::make_unique<ScoreEngine>(config);
}

static auto add(std::int64_t n) -> Commit {
    const auto s = std::to_string(n);
    return AddPage{.image = "img-" + s, .thumbnail = "th-" + s, .number = s};
}

static auto seeded(ScoreEngine& engine, const ScoreId& id, std::int64_t pages) -> ObjectHash {
    engine.create_score(id, UpdateProperty{});
    auto commits = std::vector<Commit>{};
    for (std::int64_t i = 0; i < pages; ++i) commits.push_back(add(i));
    return engine.commit(id, CommitRequest{.parent = engine.head(id).snapshot,
                                           .commits = std::move(commits)}).snapshot;
}

// =============================================================================
// Hashing
// =============================================================================

static void bm_sha256(benchmark::State& state) {
    const auto data = std::string(static_cast<std::size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        benchmark::DoNotOptimize(crypto::sha256(std::string_view{data}));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_sha256)->Range(64, 1 << 16);

static void bm_hash_snapshot(benchmark::State& state) {
    auto snapshot = Snapshot{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        snapshot.pages.push_back(hash_object(Page{.image = "i", .thumbnail = "t",
                                                  .number = std::to_string(i)}));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(hash_object(snapshot));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_hash_snapshot)->Range(8, 1024);

// =============================================================================
// Commit path
// =============================================================================

static void bm_commit_append(benchmark::State& state) {
    auto engine = quiet_engine();
    const auto id = ScoreId{"bench", "append"};
    auto head = seeded(*engine, id, state.range(0));
    std::int64_t n = state.range(0);
    for (auto _ : state) {
        head = engine->commit(id, CommitRequest{.parent = head, .commits = {add(n++)}}).snapshot;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_commit_append)->Range(8, 512);

static void bm_commit_without_cache(benchmark::State& state) {
    auto engine = quiet_engine(0);
    const auto id = ScoreId{"bench", "nocache"};
    auto head = seeded(*engine, id, state.range(0));
    std::int64_t n = state.range(0);
    for (auto _ : state) {
        head = engine->commit(id, CommitRequest{.parent = head, .commits = {add(n++)}}).snapshot;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_commit_without_cache)->Range(8, 512);

// =============================================================================
// Read path
// =============================================================================

static void bm_get_pages_by_version(benchmark::State& state) {
    auto engine = quiet_engine(0);
    const auto id = ScoreId{"bench", "read"};
    seeded(*engine, id, state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->get_pages(id, "1"));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_get_pages_by_version)->Range(8, 512);

static void bm_parse_commit_request(benchmark::State& state) {
    auto commits = nlohmann::json::array();
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        commits.push_back({{"type", "add_page"},
                           {"add_page", {{"image", "i"}, {"thumbnail", "t"},
                                         {"number", std::to_string(i)}}}});
    }
    const auto text = nlohmann::json{{"parent", ObjectHash{}.to_hex()}, {"commits", commits}}.dump();
    for (auto _ : state) {
        benchmark::DoNotOptimize(commit_request_from_json(nlohmann::json::parse(text), true));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_parse_commit_request)->Range(1, 256);
