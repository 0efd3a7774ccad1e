// Fuzz target for commit_request_from_json() and the commit path.
// Any request that decodes is applied to a fresh score; only ScoreError may escape.

#include <score-history/score_history.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace sh = score_history;

    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    const bool strict = size % 2 == 0;
    try {
        auto request = sh::commit_request_from_json(j, strict);

        auto config = sh::EngineConfig{};
        config.log_level = "off";
        config.cache_capacity = 0;
        auto engine = sh::ScoreEngine{config};
        const auto id = sh::ScoreId{"fuzz", "score"};
        engine.create_score(id, sh::UpdateProperty{});

        // Point the request at the real head so operations actually run
        request.parent = engine.head(id).snapshot;
        auto result = engine.commit(id, request);
        (void)result;
    } catch (const sh::ScoreError&) {
    }
    return 0;
}
