/// @file types.hpp
/// @brief Core identity types: ObjectHash, ScoreId.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace score_history {

/// A 32-byte SHA-256 content hash identifying a stored object.
///
/// Objects are content-addressed: the hash is computed over the
/// canonical form of the object. Other objects refer to it by this
/// hash, rendered as 64 lowercase hex characters.
struct ObjectHash {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw hash bytes.

    constexpr ObjectHash() = default;

    /// Construct from a byte array.
    explicit constexpr ObjectHash(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ObjectHash(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ObjectHash&) const = default;
    auto operator==(const ObjectHash&) const -> bool = default;

    /// Lowercase hex rendering used as storage key and wire reference.
    auto to_hex() const -> std::string {
        static constexpr char hex_chars[] = "0123456789abcdef";
        auto result = std::string{};
        result.reserve(size * 2);
        for (auto b : bytes) {
            auto v = static_cast<unsigned char>(b);
            result.push_back(hex_chars[v >> 4]);
            result.push_back(hex_chars[v & 0x0F]);
        }
        return result;
    }

    /// Parse a 64-character hex string (either case).
    /// @return The hash, or nullopt if the input is malformed.
    static auto from_hex(std::string_view hex) -> std::optional<ObjectHash> {
        if (hex.size() != size * 2) return std::nullopt;
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        auto result = ObjectHash{};
        for (std::size_t i = 0; i < size; ++i) {
            auto hi = nibble(hex[i * 2]);
            auto lo = nibble(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            result.bytes[i] = static_cast<std::byte>((hi << 4) | lo);
        }
        return result;
    }
};

/// Identifies a score: (owner, name), unique together.
///
/// The owner is an opaque id resolved by the caller's identity layer
/// and trusted as given.
struct ScoreId {
    std::string owner;  ///< Opaque owner id.
    std::string name;   ///< Score name, unique per owner.

    auto operator<=>(const ScoreId&) const = default;
    auto operator==(const ScoreId&) const -> bool = default;

    /// "owner/name", the key form used by the original score listing.
    auto to_string() const -> std::string { return owner + "/" + name; }
};

}  // namespace score_history

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<score_history::ObjectHash> {
    auto operator()(const score_history::ObjectHash& h) const noexcept -> std::size_t {
        // First 8 bytes of the SHA-256 hash are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(h.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

template <>
struct std::hash<score_history::ScoreId> {
    auto operator()(const score_history::ScoreId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::string>{}(id.owner);
        auto h2 = std::hash<std::string>{}(id.name);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
