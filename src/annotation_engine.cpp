#include <score-history/annotation_engine.hpp>

#include <score-history/error.hpp>
#include <score-history/log.hpp>

#include <algorithm>
#include <set>
#include <string>

namespace score_history {

namespace {

auto find_annotation(AnnotationSet& set, std::uint64_t id, std::string_view op)
    -> std::vector<Annotation>::iterator {
    auto it = std::ranges::find(set.items, id, &Annotation::id);
    if (it == set.items.end()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{op} + ": annotation " + std::to_string(id) + " does not exist"};
    }
    return it;
}

}  // anonymous namespace

void apply_annotation_operation(AnnotationSet& set, const AnnotationOperation& op) {
    std::visit(overload{
        [&](const AddAnnotation& add) {
            set.items.push_back(Annotation{.id = set.next_id++, .content = add.content});
        },
        [&](const RemoveAnnotation& remove) {
            set.items.erase(find_annotation(set, remove.id, "remove_annotation"));
        },
        [&](const ReplaceAnnotation& replace) {
            find_annotation(set, replace.id, "replace_annotation")->content = replace.content;
        },
    }, op);
}

AnnotationEngine::AnnotationEngine(ObjectStore& objects)
    : objects_{objects} {}

auto AnnotationEngine::create() -> AnnotationResult {
    auto root = AnnotationSet{};
    auto hash = objects_.put(root);
    return AnnotationResult{.hash = hash, .annotations = std::move(root)};
}

auto AnnotationEngine::load(const ObjectHash& hash) const -> AnnotationSet {
    auto set = get_object<AnnotationSet>(objects_.get(hash));
    if (!set) {
        logger()->critical("object {} is referenced as annotations but is not", hash.to_hex());
        throw ScoreError{ErrorKind::object_not_found,
                         "object " + hash.to_hex() + " is not an annotation set"};
    }
    return *set;
}

auto AnnotationEngine::update(const ObjectHash& current, const AnnotationRequest& request)
    -> AnnotationResult {
    if (request.parent != current) {
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "annotation parent " + request.parent.to_hex() +
                         " is not the current annotation set " + current.to_hex()};
    }
    if (request.operations.empty()) {
        throw ScoreError{ErrorKind::invalid_operation, "annotation request has no operations"};
    }

    const auto prior = load(current);
    auto next = prior;
    next.parent = current;
    for (std::size_t i = 0; i < request.operations.size(); ++i) {
        try {
            apply_annotation_operation(next, request.operations[i]);
        } catch (const ScoreError& e) {
            throw ScoreError{e.kind(),
                             "operation " + std::to_string(i) + ": " + e.error().message};
        }
    }
    // An add followed by its removal leaves the visible annotations alone
    if (next.items == prior.items) {
        throw ScoreError{ErrorKind::no_change, "annotation update changes nothing"};
    }

    auto hash = objects_.put(next);
    return AnnotationResult{.hash = hash, .annotations = std::move(next)};
}

auto AnnotationEngine::history(const ObjectHash& head) const -> std::vector<AnnotationResult> {
    auto result = std::vector<AnnotationResult>{};
    auto seen = std::set<ObjectHash>{};
    auto next = std::optional<ObjectHash>{head};
    while (next) {
        if (!seen.insert(*next).second) {
            throw ScoreError{ErrorKind::storage_error,
                             "annotation chain loops at " + next->to_hex()};
        }
        auto set = load(*next);
        auto parent = set.parent;
        result.push_back(AnnotationResult{.hash = *next, .annotations = std::move(set)});
        next = parent;
    }
    return result;
}

}  // namespace score_history
