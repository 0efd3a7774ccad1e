// basic_usage - walks one score through its life
//
// Creates a score, commits pages, reads them back by version, updates the
// title, and prints the JSON a client would receive.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <score-history/score_history.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace sh = score_history;

int main() {
    auto engine = sh::ScoreEngine{};
    const auto id = sh::ScoreId{"u1", "s1"};

    engine.create_score(id, sh::UpdateProperty{.title = "Sonata", .description = std::nullopt});

    // -- First version: two pages ---------------------------------------------
    auto v1 = engine.commit(id, sh::CommitRequest{
        .parent = engine.head(id).snapshot,
        .commits = {
            sh::AddPage{.image = "sha256:aa01", .thumbnail = "sha256:bb01", .number = "1"},
            sh::AddPage{.image = "sha256:aa02", .thumbnail = "sha256:bb02", .number = "2"},
        },
    });
    std::printf("version %llu -> %s\n",
                static_cast<unsigned long long>(v1.version), v1.snapshot.to_hex().c_str());

    // -- Second version: a request decoded from the wire ----------------------
    auto wire = nlohmann::json{
        {"parent", v1.snapshot.to_hex()},
        {"commits", nlohmann::json::array({
            {{"type", "insert_page"},
             {"insert_page", {{"index", 1}, {"image", "sha256:aa03"},
                              {"thumbnail", "sha256:bb03"}, {"number", "1a"}}}},
        })},
    };
    auto v2 = engine.commit(id, sh::commit_request_from_json(wire, engine.config().strict_operations));
    std::printf("version %llu has %zu pages\n",
                static_cast<unsigned long long>(v2.version), v2.pages.size());

    // -- Stale parent ---------------------------------------------------------
    try {
        engine.commit(id, sh::CommitRequest{
            .parent = v1.snapshot,
            .commits = {sh::DeletePage{.index = 0}},
        });
    } catch (const sh::ScoreError& e) {
        std::printf("rejected: %s (%s)\n", e.what(),
                    std::string{sh::user_message(e.category())}.c_str());
    }

    // -- Reading an older version ---------------------------------------------
    for (const auto& page : engine.get_pages(id, "1")) {
        std::printf("  v1 page %s\n", page.number.c_str());
    }

    // -- Property chain -------------------------------------------------------
    engine.update_property(id, sh::PropertyRequest{
        .parent = engine.head(id).property,
        .property = sh::UpdateProperty{.title = std::nullopt, .description = "for piano"},
    });

    // -- Annotations ----------------------------------------------------------
    auto notes = engine.update_annotations(id, sh::AnnotationRequest{
        .parent = engine.head(id).annotations,
        .operations = {sh::AddAnnotation{.content = "bar 12: slower"}},
    });
    engine.update_annotations(id, sh::AnnotationRequest{
        .parent = notes.hash,
        .operations = {sh::ReplaceAnnotation{.id = 0, .content = "bar 12: rit."}},
    });

    std::printf("%s\n", nlohmann::json(engine.get_score(id)).dump(2).c_str());
    return 0;
}
