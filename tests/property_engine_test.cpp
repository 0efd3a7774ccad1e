// property_engine_test.cpp - Tests for the title/description chain

#include <score-history/error.hpp>
#include <score-history/object_store.hpp>
#include <score-history/property_engine.hpp>

#include <gtest/gtest.h>

using namespace score_history;

namespace {

void expect_kind(ErrorKind kind, auto&& fn) {
    try {
        fn();
        FAIL() << "expected " << to_string_view(kind);
    } catch (const ScoreError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

auto request(const ObjectHash& parent, std::optional<std::string> title,
             std::optional<std::string> description = std::nullopt) -> PropertyRequest {
    return PropertyRequest{
        .parent = parent,
        .property = UpdateProperty{.title = std::move(title), .description = std::move(description)},
    };
}

}  // namespace

TEST(PropertyEngine, create_stores_root_property) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "Sonata", .description = "in C"});

    EXPECT_FALSE(root.property.parent.has_value());
    EXPECT_EQ(engine.load(root.hash), root.property);
    EXPECT_EQ(store.size(), 1u);
}

TEST(PropertyEngine, update_links_to_parent) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "Sonata", .description = {}});

    auto next = engine.update(root.hash, request(root.hash, "Sonata No. 2"));
    EXPECT_EQ(next.property.title, "Sonata No. 2");
    EXPECT_EQ(next.property.parent, root.hash);
    EXPECT_EQ(engine.load(next.hash), next.property);
}

TEST(PropertyEngine, omitted_fields_are_kept) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "Sonata", .description = "in C"});

    auto next = engine.update(root.hash, request(root.hash, std::nullopt, "in D"));
    EXPECT_EQ(next.property.title, "Sonata");
    EXPECT_EQ(next.property.description, "in D");
}

TEST(PropertyEngine, identical_update_is_no_change) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "Sonata", .description = "in C"});
    const auto before = store.size();

    expect_kind(ErrorKind::no_change, [&] { engine.update(root.hash, request(root.hash, "Sonata")); });
    expect_kind(ErrorKind::no_change, [&] { engine.update(root.hash, request(root.hash, std::nullopt)); });
    EXPECT_EQ(store.size(), before);
}

TEST(PropertyEngine, stale_parent_is_a_conflict) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "A", .description = {}});
    auto next = engine.update(root.hash, request(root.hash, "B"));

    expect_kind(ErrorKind::concurrency_conflict,
                [&] { engine.update(next.hash, request(root.hash, "C")); });
}

TEST(PropertyEngine, conflict_wins_over_no_change) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "A", .description = {}});
    auto next = engine.update(root.hash, request(root.hash, "B"));

    expect_kind(ErrorKind::concurrency_conflict,
                [&] { engine.update(next.hash, request(root.hash, "B")); });
}

TEST(PropertyEngine, history_is_newest_first) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "A", .description = {}});
    auto b = engine.update(root.hash, request(root.hash, "B"));
    auto c = engine.update(b.hash, request(b.hash, "C"));

    auto history = engine.history(c.hash);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0], c);
    EXPECT_EQ(history[1], b);
    EXPECT_EQ(history[2], root);
}

TEST(PropertyEngine, reverting_content_still_creates_a_new_object) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto root = engine.create(UpdateProperty{.title = "A", .description = {}});
    auto b = engine.update(root.hash, request(root.hash, "B"));
    auto back = engine.update(b.hash, request(b.hash, "A"));

    // Same title as root but a different parent, so a different hash
    EXPECT_NE(back.hash, root.hash);
    EXPECT_EQ(engine.history(back.hash).size(), 3u);
}

TEST(PropertyEngine, load_of_non_property_fails) {
    auto store = MemoryObjectStore{};
    auto engine = PropertyEngine{store};
    auto page = store.put(Page{.image = "i", .thumbnail = "t", .number = "1"});
    expect_kind(ErrorKind::object_not_found, [&] { (void)engine.load(page); });
}
