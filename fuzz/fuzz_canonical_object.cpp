// Fuzz target for parse_canonical(): stored object decoding.
// Anything that parses must re-encode to a form that hashes consistently.

#include <score-history/error.hpp>
#include <score-history/hash.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace sh = score_history;

    const auto text = std::string{reinterpret_cast<const char*>(data), size};
    try {
        auto object = sh::parse_canonical(text);
        auto canonical = sh::canonical_form(object);
        if (sh::hash_object(sh::parse_canonical(canonical)) != sh::hash_object(object)) {
            std::abort();
        }
    } catch (const sh::ScoreError&) {
    }
    return 0;
}
