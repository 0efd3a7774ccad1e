#include "crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace score_history::crypto;

// Helper: hash a string and render it as hex
static auto sha256_hex(std::string_view s) -> std::string {
    return to_hex(sha256(s));
}

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    EXPECT_EQ(sha256_hex(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"),
        "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_zero_byte) {
    auto input = std::vector<std::byte>{std::byte{0x00}};
    EXPECT_EQ(to_hex(sha256(std::span<const std::byte>{input})),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, million_a) {
    EXPECT_EQ(sha256_hex(std::string(1000000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(Sha256, incremental_updates_match_one_shot) {
    const auto text = std::string{
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"};
    // Split at every position, including block boundaries
    for (std::size_t split = 0; split <= text.size(); ++split) {
        auto hasher = Sha256{};
        hasher.update(std::string_view{text}.substr(0, split));
        hasher.update(std::string_view{text}.substr(split));
        EXPECT_EQ(to_hex(hasher.finish()), sha256_hex(text)) << "split at " << split;
    }
}

TEST(Sha256, padding_boundary_lengths) {
    // 55, 56 and 64 bytes straddle the length-field boundary
    for (auto n : {55u, 56u, 63u, 64u, 65u, 119u, 120u}) {
        auto hasher = Sha256{};
        const auto text = std::string(n, 'x');
        for (auto c : text) hasher.update(std::string_view{&c, 1});
        EXPECT_EQ(to_hex(hasher.finish()), sha256_hex(text)) << n << " bytes";
    }
}
