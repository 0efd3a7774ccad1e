// json_test.cpp - Tests for nlohmann/json request decoding and result encoding

#include <score-history/error.hpp>
#include <score-history/hash.hpp>
#include <score-history/json.hpp>
#include <score-history/score_engine.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace score_history;
using json = nlohmann::json;

namespace {

const auto some_hash = hash_object(Snapshot{});

void expect_kind(ErrorKind kind, auto&& fn) {
    try {
        fn();
        FAIL() << "expected " << to_string_view(kind);
    } catch (const ScoreError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

}  // namespace

// =============================================================================
// Objects
// =============================================================================

TEST(JsonObjects, object_hash_is_hex_string) {
    auto j = json(some_hash);
    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), some_hash.to_hex());
    EXPECT_EQ(j.get<ObjectHash>(), some_hash);
}

TEST(JsonObjects, bad_hash_string) {
    expect_kind(ErrorKind::invalid_operation, [] { (void)json("xyz").get<ObjectHash>(); });
}

TEST(JsonObjects, object_carries_kind_tag) {
    auto j = json(Object{Page{.image = "i", .thumbnail = "t", .number = "1"}});
    EXPECT_EQ(j["kind"], "page");
    EXPECT_EQ(j["image"], "i");
    EXPECT_EQ(j.get<Object>(), Object{(Page{.image = "i", .thumbnail = "t", .number = "1"})});
}

TEST(JsonObjects, absent_optionals_are_omitted) {
    auto j = json(Object{Property{.title = "T", .description = {}, .parent = {}}});
    EXPECT_TRUE(j.contains("title"));
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("parent"));
}

TEST(JsonObjects, snapshot_with_parent) {
    auto snapshot = Snapshot{.pages = {some_hash, some_hash}, .parent = some_hash};
    auto j = json(Object{snapshot});
    EXPECT_EQ(j["pages"].size(), 2u);
    EXPECT_EQ(j["parent"], some_hash.to_hex());
    EXPECT_EQ(get_object<Snapshot>(j.get<Object>()), snapshot);
}

// =============================================================================
// Commit decoding
// =============================================================================

TEST(JsonCommit, decodes_each_operation) {
    auto add = commit_from_json(
        json::parse(R"({"type":"add_page","add_page":{"image":"i","thumbnail":"t","number":"1"}})"),
        true);
    ASSERT_TRUE(add.has_value());
    EXPECT_EQ(*add, Commit{(AddPage{.image = "i", .thumbnail = "t", .number = "1"})});

    auto insert = commit_from_json(json::parse(
        R"({"type":"insert_page","insert_page":{"index":2,"image":"i","thumbnail":"t","number":"1"}})"),
        true);
    ASSERT_TRUE(insert.has_value());
    EXPECT_EQ(std::get<InsertPage>(*insert).index, 2u);

    auto del = commit_from_json(json::parse(R"({"type":"delete_page","delete_page":{"index":0}})"),
                                true);
    ASSERT_TRUE(del.has_value());
    EXPECT_EQ(*del, Commit{DeletePage{.index = 0}});

    auto prop = commit_from_json(
        json::parse(R"({"type":"update_property","update_property":{"title":"T"}})"), true);
    ASSERT_TRUE(prop.has_value());
    EXPECT_EQ(std::get<UpdateProperty>(*prop).title, "T");
    EXPECT_FALSE(std::get<UpdateProperty>(*prop).description.has_value());
}

TEST(JsonCommit, unknown_tag_in_strict_mode) {
    expect_kind(ErrorKind::unsupported_operation, [] {
        (void)commit_from_json(json::parse(R"({"type":"transpose","transpose":{}})"), true);
    });
}

TEST(JsonCommit, unknown_tag_in_permissive_mode_is_skipped) {
    EXPECT_FALSE(commit_from_json(json::parse(R"({"type":"transpose"})"), false).has_value());
}

TEST(JsonCommit, malformed_payloads) {
    const auto cases = std::vector<std::string>{
        R"([])",
        R"({})",
        R"({"type":7})",
        R"({"type":"add_page"})",
        R"({"type":"add_page","add_page":[]})",
        R"({"type":"add_page","add_page":{"image":"i","thumbnail":"t"}})",
        R"({"type":"insert_page","insert_page":{"image":"i","thumbnail":"t","number":"1"}})",
        R"({"type":"insert_page","insert_page":{"index":-1,"image":"i","thumbnail":"t","number":"1"}})",
        R"({"type":"delete_page","delete_page":{"index":"0"}})",
        R"({"type":"delete_page","delete_page":{"index":1.5}})",
        R"({"type":"update_property","update_property":{"title":3}})",
    };
    for (const auto& text : cases) {
        SCOPED_TRACE(text);
        expect_kind(ErrorKind::invalid_operation,
                    [&] { (void)commit_from_json(json::parse(text), true); });
    }
}

TEST(JsonCommit, request_decodes_parent_and_commits) {
    auto j = json{
        {"parent", some_hash.to_hex()},
        {"commits", json::array({
            json{{"type", "add_page"}, {"add_page", {{"image", "i"}, {"thumbnail", "t"}, {"number", "1"}}}},
            json{{"type", "rotate"}, {"rotate", json::object()}},
            json{{"type", "delete_page"}, {"delete_page", {{"index", 0}}}},
        })},
    };

    auto permissive = commit_request_from_json(j, false);
    EXPECT_EQ(permissive.parent, some_hash);
    ASSERT_EQ(permissive.commits.size(), 2u);
    EXPECT_EQ(op_type_of(permissive.commits[0]), OpType::add_page);
    EXPECT_EQ(op_type_of(permissive.commits[1]), OpType::delete_page);

    expect_kind(ErrorKind::unsupported_operation, [&] { (void)commit_request_from_json(j, true); });
}

TEST(JsonCommit, request_requires_parent_and_commit_array) {
    expect_kind(ErrorKind::invalid_operation,
                [] { (void)commit_request_from_json(json{{"commits", json::array()}}, true); });
    expect_kind(ErrorKind::invalid_operation, [] {
        (void)commit_request_from_json(json{{"parent", "nothex"}, {"commits", json::array()}}, true);
    });
    expect_kind(ErrorKind::invalid_operation, [] {
        (void)commit_request_from_json(json{{"parent", some_hash.to_hex()}, {"commits", 1}}, true);
    });
}

TEST(JsonCommit, encoding_matches_wire_shape) {
    auto request = CommitRequest{
        .parent = some_hash,
        .commits = {InsertPage{.index = 1, .image = "i", .thumbnail = "t", .number = "2"}},
    };
    auto j = json(request);
    EXPECT_EQ(j["parent"], some_hash.to_hex());
    EXPECT_EQ(j["commits"][0]["type"], "insert_page");
    EXPECT_EQ(j["commits"][0]["insert_page"]["index"], 1);
    EXPECT_EQ(commit_request_from_json(j, true), request);
}

TEST(JsonCommit, property_request) {
    auto request = property_request_from_json(json::parse(
        R"({"parent":")" + some_hash.to_hex() + R"(","property":{"description":"D"}})"));
    EXPECT_EQ(request.parent, some_hash);
    EXPECT_FALSE(request.property.title.has_value());
    EXPECT_EQ(request.property.description, "D");

    expect_kind(ErrorKind::invalid_operation, [] {
        (void)property_request_from_json(json{{"parent", some_hash.to_hex()}});
    });
}

TEST(JsonAnnotations, request_decodes_each_operation) {
    auto request = annotation_request_from_json(json{
        {"parent", some_hash.to_hex()},
        {"operations", json::array({
            json{{"type", "add_annotation"}, {"add_annotation", {{"content", "dolce"}}}},
            json{{"type", "replace_annotation"}, {"replace_annotation", {{"id", 0}, {"content", "p"}}}},
            json{{"type", "remove_annotation"}, {"remove_annotation", {{"id", 0}}}},
        })},
    }, true);

    EXPECT_EQ(request.parent, some_hash);
    ASSERT_EQ(request.operations.size(), 3u);
    EXPECT_EQ(request.operations[0], AnnotationOperation{AddAnnotation{.content = "dolce"}});
    EXPECT_EQ(request.operations[1],
              (AnnotationOperation{ReplaceAnnotation{.id = 0, .content = "p"}}));
    EXPECT_EQ(request.operations[2], AnnotationOperation{RemoveAnnotation{.id = 0}});

    // Encoding produces the same wire shape
    auto round = annotation_request_from_json(json(request), true);
    EXPECT_EQ(round, request);
}

TEST(JsonAnnotations, unknown_tags_and_bad_payloads) {
    auto with = [](json op) {
        return json{{"parent", some_hash.to_hex()}, {"operations", json::array({std::move(op)})}};
    };
    const auto unknown = with(json{{"type", "add_page"}, {"add_page", json::object()}});
    expect_kind(ErrorKind::unsupported_operation,
                [&] { (void)annotation_request_from_json(unknown, true); });
    EXPECT_TRUE(annotation_request_from_json(unknown, false).operations.empty());

    for (const auto& bad : {
             with(json{{"type", "add_annotation"}}),
             with(json{{"type", "add_annotation"}, {"add_annotation", {{"content", 3}}}}),
             with(json{{"type", "remove_annotation"}, {"remove_annotation", {{"id", -1}}}}),
             with(json{{"type", "replace_annotation"}, {"replace_annotation", {{"id", 1}}}}),
             json{{"operations", json::array()}},
             json{{"parent", some_hash.to_hex()}},
         }) {
        expect_kind(ErrorKind::invalid_operation,
                    [&] { (void)annotation_request_from_json(bad, true); });
    }
}

// =============================================================================
// Results
// =============================================================================

TEST(JsonResults, score_detail_keys_versions_by_label) {
    auto config = EngineConfig{};
    config.log_level = "off";
    auto engine = ScoreEngine{config};
    auto id = ScoreId{"u1", "s1"};
    engine.create_score(id, UpdateProperty{.title = "Sonata", .description = {}});
    auto result = engine.commit(id, CommitRequest{
        .parent = engine.head(id).snapshot,
        .commits = {AddPage{.image = "i", .thumbnail = "t", .number = "1"}},
    });

    auto j = json(engine.get_score(id));
    EXPECT_EQ(j["owner"], "u1");
    EXPECT_EQ(j["score_name"], "s1");
    EXPECT_EQ(j["property"]["title"], "Sonata");
    EXPECT_FALSE(j["property"].contains("parent"));
    EXPECT_EQ(j["versions"]["1"], result.snapshot.to_hex());
    EXPECT_EQ(j["head"]["head_hash"], result.snapshot.to_hex());
    EXPECT_EQ(j["head"]["latest_version"], 1);
    EXPECT_EQ(j["head"]["annotations_hash"], engine.head(id).annotations.to_hex());
    EXPECT_EQ(j["annotations"], json::array());

    auto r = json(result);
    EXPECT_EQ(r["version"], 1);
    ASSERT_EQ(r["pages"].size(), 1u);
    EXPECT_EQ(r["pages"][0]["number"], "1");
}
