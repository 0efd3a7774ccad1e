#include <score-history/property_engine.hpp>

#include <score-history/error.hpp>
#include <score-history/log.hpp>

#include <set>

namespace score_history {

PropertyEngine::PropertyEngine(ObjectStore& objects)
    : objects_{objects} {}

auto PropertyEngine::create(const UpdateProperty& initial) -> PropertyResult {
    auto property = Property{
        .title = initial.title,
        .description = initial.description,
        .parent = std::nullopt,
    };
    auto hash = objects_.put(property);
    return PropertyResult{.hash = hash, .property = std::move(property)};
}

auto PropertyEngine::load(const ObjectHash& hash) const -> Property {
    auto property = get_object<Property>(objects_.get(hash));
    if (!property) {
        logger()->critical("object {} is referenced as a property but is not one", hash.to_hex());
        throw ScoreError{ErrorKind::object_not_found,
                         "object " + hash.to_hex() + " is not a property"};
    }
    return *property;
}

auto PropertyEngine::update(const ObjectHash& current, const PropertyRequest& request)
    -> PropertyResult {
    if (request.parent != current) {
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "property parent " + request.parent.to_hex() +
                         " is not the current property " + current.to_hex()};
    }

    const auto prior = load(current);
    auto merged = Property{
        .title = request.property.title ? request.property.title : prior.title,
        .description = request.property.description ? request.property.description
                                                    : prior.description,
        .parent = current,
    };
    if (merged.same_content(prior)) {
        throw ScoreError{ErrorKind::no_change, "property update changes nothing"};
    }

    auto hash = objects_.put(merged);
    return PropertyResult{.hash = hash, .property = std::move(merged)};
}

auto PropertyEngine::history(const ObjectHash& head) const -> std::vector<PropertyResult> {
    auto result = std::vector<PropertyResult>{};
    auto seen = std::set<ObjectHash>{};
    auto next = std::optional<ObjectHash>{head};
    while (next) {
        // Content addressing makes a cycle impossible unless the store is corrupt
        if (!seen.insert(*next).second) {
            throw ScoreError{ErrorKind::storage_error,
                             "property chain loops at " + next->to_hex()};
        }
        auto property = load(*next);
        auto parent = property.parent;
        result.push_back(PropertyResult{.hash = *next, .property = std::move(property)});
        next = parent;
    }
    return result;
}

}  // namespace score_history
