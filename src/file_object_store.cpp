#include <score-history/object_store.hpp>

#include <score-history/error.hpp>
#include <score-history/hash.hpp>
#include <score-history/log.hpp>

#include "crypto/sha256.hpp"
#include "executor.hpp"
#include "storage/compression.hpp"

#include <atomic>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace score_history {

namespace fs = std::filesystem;

namespace {

auto read_file(const fs::path& path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

// Unique per writer so concurrent puts of the same object never share a
// temporary file.
auto temp_suffix() -> std::string {
    static std::atomic<std::uint64_t> counter{0};
    auto id = std::hash<std::thread::id>{}(std::this_thread::get_id());
    auto n = counter.fetch_add(1, std::memory_order_relaxed);
    return ".tmp-" + std::to_string(id) + "-" + std::to_string(n);
}

}  // anonymous namespace

FileObjectStore::FileObjectStore(fs::path root)
    : root_{std::move(root)} {
    auto ec = std::error_code{};
    fs::create_directories(root_ / "objects", ec);
    if (ec) {
        throw ScoreError{ErrorKind::storage_error,
                         "cannot create object directory under " + root_.string() +
                         ": " + ec.message()};
    }
}

auto FileObjectStore::path_for(const ObjectHash& hash) const -> fs::path {
    auto hex = hash.to_hex();
    return root_ / "objects" / hex.substr(0, 2) / hex.substr(2);
}

auto FileObjectStore::put(const Object& obj) -> ObjectHash {
    auto canonical = canonical_form(obj);
    auto hash = ObjectHash{crypto::sha256(canonical)};
    auto path = path_for(hash);

    if (fs::exists(path)) return hash;

    auto compressed = storage::deflate_compress(canonical);
    if (!compressed) {
        throw ScoreError{ErrorKind::storage_error, "failed to compress object " + hash.to_hex()};
    }

    auto ec = std::error_code{};
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw ScoreError{ErrorKind::storage_error,
                         "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    auto tmp = path;
    tmp += temp_suffix();
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        out.write(compressed->data(), static_cast<std::streamsize>(compressed->size()));
        if (!out) {
            fs::remove(tmp, ec);
            throw ScoreError{ErrorKind::storage_error, "failed to write " + tmp.string()};
        }
    }
    // rename() replaces atomically; a concurrent writer of the same hash
    // wrote identical bytes
    fs::rename(tmp, path, ec);
    if (ec) {
        auto remove_ec = std::error_code{};
        fs::remove(tmp, remove_ec);
        throw ScoreError{ErrorKind::storage_error,
                         "failed to publish object " + hash.to_hex() + ": " + ec.message()};
    }
    logger()->debug("stored object {} ({} -> {} bytes)", hash.to_hex(),
                    canonical.size(), compressed->size());
    return hash;
}

auto FileObjectStore::read_object(const ObjectHash& hash) const -> Object {
    auto path = path_for(hash);
    auto raw = read_file(path);
    if (!raw) throw ObjectsMissing{{hash}};

    auto text = storage::deflate_decompress(*raw);
    if (!text) {
        throw ScoreError{ErrorKind::storage_error, "corrupt object file " + path.string()};
    }
    auto obj = parse_canonical(*text);
    if (hash_object(obj) != hash) {
        throw ScoreError{ErrorKind::storage_error,
                         "object " + hash.to_hex() + " does not match its content"};
    }
    return obj;
}

auto FileObjectStore::get_batch(const std::set<ObjectHash>& hashes) const
    -> std::map<ObjectHash, Object> {
    auto ordered = std::vector<ObjectHash>(hashes.begin(), hashes.end());
    auto decoded = std::vector<std::optional<Object>>(ordered.size());
    // Exceptions cross the executor as exception_ptr so ObjectsMissing
    // keeps its dynamic type
    auto errors = std::vector<std::exception_ptr>(ordered.size());

    auto decode_one = [&](std::size_t i) {
        try {
            decoded[i] = read_object(ordered[i]);
        } catch (const ScoreError&) {
            errors[i] = std::current_exception();
        }
    };

    detail::for_each_index(ordered.size(), parallel_threshold, decode_one);

    // Corruption is rethrown as is; absences are merged into one report
    auto missing = std::vector<ObjectHash>{};
    for (const auto& e : errors) {
        if (!e) continue;
        try {
            std::rethrow_exception(e);
        } catch (const ObjectsMissing& m) {
            missing.insert(missing.end(), m.missing().begin(), m.missing().end());
        }
    }
    if (!missing.empty()) throw ObjectsMissing{std::move(missing)};

    auto result = std::map<ObjectHash, Object>{};
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        result.emplace(ordered[i], std::move(*decoded[i]));
    }
    return result;
}

auto FileObjectStore::contains(const ObjectHash& hash) const -> bool {
    return fs::exists(path_for(hash));
}

auto FileObjectStore::size() const -> std::size_t {
    auto count = std::size_t{0};
    auto ec = std::error_code{};
    for (auto it = fs::recursive_directory_iterator{root_ / "objects", ec};
         !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        if (it->is_regular_file() && it->path().filename().string().find(".tmp-") == std::string::npos) {
            ++count;
        }
    }
    return count;
}

}  // namespace score_history
