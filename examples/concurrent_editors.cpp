// concurrent_editors - several editors racing on one score
//
// Each editor reads the head, commits against it, and retries on
// concurrency_conflict. Every successful commit gets its own version.
//
// Build: cmake --build build
// Run:   ./build/examples/concurrent_editors [editors] [edits-per-editor]

#include <score-history/score_history.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace sh = score_history;

int main(int argc, char** argv) {
    const auto editors = argc > 1 ? std::atoi(argv[1]) : 4;
    const auto edits = argc > 2 ? std::atoi(argv[2]) : 25;

    auto config = sh::EngineConfig{};
    config.lock_timeout = std::chrono::milliseconds{1000};
    config.log_level = "warning";
    auto engine = sh::ScoreEngine{config};
    const auto id = sh::ScoreId{"orchestra", "symphony"};
    engine.create_score(id, sh::UpdateProperty{.title = "Symphony", .description = std::nullopt});

    auto conflicts = std::atomic<int>{0};
    auto threads = std::vector<std::thread>{};
    for (int e = 0; e < editors; ++e) {
        threads.emplace_back([&, e] {
            for (int i = 0; i < edits; ++i) {
                const auto number = std::to_string(e) + "." + std::to_string(i);
                for (;;) {
                    auto parent = engine.head(id).snapshot;
                    try {
                        engine.commit(id, sh::CommitRequest{
                            .parent = parent,
                            .commits = {sh::AddPage{.image = "img-" + number,
                                                    .thumbnail = "th-" + number,
                                                    .number = number}},
                        });
                        break;
                    } catch (const sh::ScoreError& err) {
                        if (err.kind() != sh::ErrorKind::concurrency_conflict) {
                            std::fprintf(stderr, "editor %d: %s\n", e, err.what());
                            return;
                        }
                        ++conflicts;
                    }
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    auto versions = engine.list_versions(id);
    std::printf("%d editors, %zu versions, %zu pages, %d conflicts retried\n",
                editors, versions.size(), engine.get_latest_pages(id).size(), conflicts.load());
    return versions.size() == static_cast<std::size_t>(editors * edits) ? 0 : 1;
}
