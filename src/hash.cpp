#include <score-history/hash.hpp>

#include <score-history/error.hpp>
#include <score-history/json.hpp>

#include "crypto/sha256.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace score_history {

auto canonical_form(const Object& obj) -> std::string {
    auto j = nlohmann::json{};
    to_json(j, obj);
    // nlohmann::json objects are key-sorted maps, so dump() fixes field order
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{"object contains text that is not valid UTF-8: "} + e.what()};
    }
}

auto hash_object(const Object& obj) -> ObjectHash {
    return ObjectHash{crypto::sha256(canonical_form(obj))};
}

auto parse_canonical(const std::string& text) -> Object {
    try {
        auto obj = Object{};
        from_json(nlohmann::json::parse(text), obj);
        return obj;
    } catch (const nlohmann::json::exception& e) {
        throw ScoreError{ErrorKind::storage_error,
                         std::string{"malformed stored object: "} + e.what()};
    } catch (const ScoreError& e) {
        throw ScoreError{ErrorKind::storage_error,
                         std::string{"malformed stored object: "} + e.error().message};
    }
}

}  // namespace score_history
