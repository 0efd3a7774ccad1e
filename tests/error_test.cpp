#include <score-history/error.hpp>

#include <gtest/gtest.h>

using namespace score_history;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::score_not_found),       "score_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::version_not_found),     "version_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::object_not_found),      "object_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::concurrency_conflict),  "concurrency_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),     "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::no_change),             "no_change");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_operation), "unsupported_operation");
    EXPECT_EQ(to_string_view(ErrorKind::already_exists),        "already_exists");
    EXPECT_EQ(to_string_view(ErrorKind::storage_error),         "storage_error");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_config),        "invalid_config");
}

TEST(ErrorCategory, not_found_kinds_share_a_category) {
    EXPECT_EQ(category_of(ErrorKind::score_not_found), ErrorCategory::not_found);
    EXPECT_EQ(category_of(ErrorKind::version_not_found), ErrorCategory::not_found);
    EXPECT_EQ(category_of(ErrorKind::object_not_found), ErrorCategory::not_found);
}

TEST(ErrorCategory, conflict_is_distinct_from_client_error) {
    EXPECT_EQ(category_of(ErrorKind::concurrency_conflict), ErrorCategory::conflict);
    EXPECT_EQ(category_of(ErrorKind::invalid_operation), ErrorCategory::client_error);
    EXPECT_EQ(category_of(ErrorKind::unsupported_operation), ErrorCategory::client_error);
    EXPECT_NE(user_message(ErrorCategory::conflict), user_message(ErrorCategory::client_error));
}

TEST(ErrorCategory, every_category_has_a_distinct_message) {
    const ErrorCategory all[] = {
        ErrorCategory::not_found, ErrorCategory::conflict, ErrorCategory::client_error,
        ErrorCategory::no_change, ErrorCategory::internal,
    };
    for (auto a : all) {
        EXPECT_FALSE(user_message(a).empty());
        for (auto b : all) {
            if (a != b) EXPECT_NE(user_message(a), user_message(b));
        }
    }
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::no_change, "same"};
    const auto e2 = Error{ErrorKind::no_change, "same"};
    const auto e3 = Error{ErrorKind::invalid_operation, "same"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(ScoreError, carries_kind_and_message) {
    const auto e = ScoreError{ErrorKind::concurrency_conflict, "stale parent"};

    EXPECT_EQ(e.kind(), ErrorKind::concurrency_conflict);
    EXPECT_EQ(e.category(), ErrorCategory::conflict);
    EXPECT_EQ(e.error().message, "stale parent");
    EXPECT_STREQ(e.what(), "concurrency_conflict: stale parent");
}

TEST(ObjectsMissing, lists_missing_hashes) {
    const std::uint8_t raw[32] = {0xab};
    const auto h = ObjectHash{raw};
    const auto e = ObjectsMissing{{h}};

    EXPECT_EQ(e.kind(), ErrorKind::object_not_found);
    ASSERT_EQ(e.missing().size(), 1u);
    EXPECT_EQ(e.missing()[0], h);
    EXPECT_NE(std::string{e.what()}.find(h.to_hex()), std::string::npos);
}
