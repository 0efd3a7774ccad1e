#include <score-history/json.hpp>

#include <score-history/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace score_history {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

void put_optional(nlohmann::json& j, const char* key, const std::optional<ObjectHash>& v) {
    if (v) j[key] = v->to_hex();
}

auto read_optional_string(const nlohmann::json& j, const char* key)
    -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

auto read_optional_hash(const nlohmann::json& j, const char* key)
    -> std::optional<ObjectHash> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<ObjectHash>();
}

// Request payloads come from clients, so every shape error is reported
// as invalid_operation rather than as a nlohmann exception.
auto require_object(const nlohmann::json& j, std::string_view what) -> const nlohmann::json& {
    if (!j.is_object()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + " must be a JSON object"};
    }
    return j;
}

auto require_string(const nlohmann::json& j, const char* key, std::string_view what)
    -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": '" + key + "' must be a string"};
    }
    return it->get<std::string>();
}

auto require_index(const nlohmann::json& j, std::string_view what) -> std::size_t {
    auto it = j.find("index");
    if (it == j.end() || !it->is_number_integer()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": 'index' must be an integer"};
    }
    if (it->is_number_unsigned()) {
        return static_cast<std::size_t>(it->get<std::uint64_t>());
    }
    auto value = it->get<std::int64_t>();
    if (value < 0) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": 'index' must not be negative"};
    }
    return static_cast<std::size_t>(value);
}

auto require_hash(const nlohmann::json& j, const char* key, std::string_view what)
    -> ObjectHash {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": '" + key + "' must be a hash string"};
    }
    auto hash = ObjectHash::from_hex(it->get<std::string>());
    if (!hash) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": '" + key + "' is not a valid hash"};
    }
    return *hash;
}

auto optional_string_field(const nlohmann::json& j, const char* key, std::string_view what)
    -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": '" + key + "' must be a string"};
    }
    return it->get<std::string>();
}

auto require_annotation_id(const nlohmann::json& j, std::string_view what) -> std::uint64_t {
    auto it = j.find("id");
    if (it == j.end() || !it->is_number_unsigned()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         std::string{what} + ": 'id' must be a non-negative integer"};
    }
    return it->get<std::uint64_t>();
}

auto update_property_from_json(const nlohmann::json& j) -> UpdateProperty {
    require_object(j, "update_property");
    return UpdateProperty{
        .title = optional_string_field(j, "title", "update_property"),
        .description = optional_string_field(j, "description", "update_property"),
    };
}

}  // anonymous namespace

// =============================================================================
// Identity types
// =============================================================================

void to_json(nlohmann::json& j, const ObjectHash& h) {
    j = h.to_hex();
}

void from_json(const nlohmann::json& j, ObjectHash& h) {
    auto parsed = ObjectHash::from_hex(j.get<std::string>());
    if (!parsed) {
        throw ScoreError{ErrorKind::invalid_operation, "invalid object hash"};
    }
    h = *parsed;
}

void to_json(nlohmann::json& j, const ScoreId& id) {
    j = nlohmann::json{{"owner", id.owner}, {"score_name", id.name}};
}

// =============================================================================
// Objects
// =============================================================================

void to_json(nlohmann::json& j, const Page& p) {
    j = nlohmann::json{
        {"image", p.image},
        {"thumbnail", p.thumbnail},
        {"number", p.number},
    };
}

void from_json(const nlohmann::json& j, Page& p) {
    p.image = j.at("image").get<std::string>();
    p.thumbnail = j.at("thumbnail").get<std::string>();
    p.number = j.at("number").get<std::string>();
}

void to_json(nlohmann::json& j, const Snapshot& s) {
    auto pages = nlohmann::json::array();
    for (const auto& h : s.pages) pages.push_back(h.to_hex());
    j = nlohmann::json{{"pages", std::move(pages)}};
    put_optional(j, "parent", s.parent);
}

void from_json(const nlohmann::json& j, Snapshot& s) {
    s.pages.clear();
    for (const auto& h : j.at("pages")) {
        s.pages.push_back(h.get<ObjectHash>());
    }
    s.parent = read_optional_hash(j, "parent");
}

void to_json(nlohmann::json& j, const Property& p) {
    j = nlohmann::json::object();
    put_optional(j, "title", p.title);
    put_optional(j, "description", p.description);
    put_optional(j, "parent", p.parent);
}

void from_json(const nlohmann::json& j, Property& p) {
    p.title = read_optional_string(j, "title");
    p.description = read_optional_string(j, "description");
    p.parent = read_optional_hash(j, "parent");
}

void to_json(nlohmann::json& j, const Annotation& a) {
    j = nlohmann::json{{"id", a.id}, {"content", a.content}};
}

void from_json(const nlohmann::json& j, Annotation& a) {
    a.id = j.at("id").get<std::uint64_t>();
    a.content = j.at("content").get<std::string>();
}

void to_json(nlohmann::json& j, const AnnotationSet& s) {
    j = nlohmann::json{{"items", s.items}, {"next_id", s.next_id}};
    put_optional(j, "parent", s.parent);
}

void from_json(const nlohmann::json& j, AnnotationSet& s) {
    s.items = j.at("items").get<std::vector<Annotation>>();
    s.next_id = j.at("next_id").get<std::uint64_t>();
    s.parent = read_optional_hash(j, "parent");
}

void to_json(nlohmann::json& j, const Object& obj) {
    std::visit([&](const auto& o) { to_json(j, o); }, obj);
    j["kind"] = std::string{to_string_view(kind_of(obj))};
}

void from_json(const nlohmann::json& j, Object& obj) {
    auto kind = object_kind_from_string(j.at("kind").get<std::string>());
    if (!kind) {
        throw ScoreError{ErrorKind::storage_error, "unknown object kind"};
    }
    switch (*kind) {
        case ObjectKind::page:     obj = j.get<Page>(); return;
        case ObjectKind::snapshot: obj = j.get<Snapshot>(); return;
        case ObjectKind::property: obj = j.get<Property>(); return;
        case ObjectKind::annotations: obj = j.get<AnnotationSet>(); return;
    }
}

// =============================================================================
// Commits
// =============================================================================

void to_json(nlohmann::json& j, const UpdateProperty& u) {
    j = nlohmann::json::object();
    put_optional(j, "title", u.title);
    put_optional(j, "description", u.description);
}

void to_json(nlohmann::json& j, const Commit& c) {
    const auto tag = std::string{to_string_view(op_type_of(c))};
    auto payload = std::visit(overload{
        [](const AddPage& op) {
            return nlohmann::json{
                {"image", op.image}, {"thumbnail", op.thumbnail}, {"number", op.number}};
        },
        [](const InsertPage& op) {
            return nlohmann::json{
                {"index", op.index}, {"image", op.image},
                {"thumbnail", op.thumbnail}, {"number", op.number}};
        },
        [](const DeletePage& op) {
            return nlohmann::json{{"index", op.index}};
        },
        [](const UpdateProperty& op) {
            auto p = nlohmann::json{};
            to_json(p, op);
            return p;
        },
    }, c);
    j = nlohmann::json{{"type", tag}, {tag, std::move(payload)}};
}

void to_json(nlohmann::json& j, const CommitRequest& r) {
    auto commits = nlohmann::json::array();
    for (const auto& c : r.commits) {
        auto cj = nlohmann::json{};
        to_json(cj, c);
        commits.push_back(std::move(cj));
    }
    j = nlohmann::json{{"parent", r.parent.to_hex()}, {"commits", std::move(commits)}};
}

void to_json(nlohmann::json& j, const AnnotationOperation& op) {
    const auto tag = std::string{to_string_view(annotation_op_type_of(op))};
    auto payload = std::visit(overload{
        [](const AddAnnotation& a) { return nlohmann::json{{"content", a.content}}; },
        [](const RemoveAnnotation& r) { return nlohmann::json{{"id", r.id}}; },
        [](const ReplaceAnnotation& r) {
            return nlohmann::json{{"id", r.id}, {"content", r.content}};
        },
    }, op);
    j = nlohmann::json{{"type", tag}, {tag, std::move(payload)}};
}

void to_json(nlohmann::json& j, const AnnotationRequest& r) {
    auto operations = nlohmann::json::array();
    for (const auto& op : r.operations) {
        auto oj = nlohmann::json{};
        to_json(oj, op);
        operations.push_back(std::move(oj));
    }
    j = nlohmann::json{{"parent", r.parent.to_hex()}, {"operations", std::move(operations)}};
}

void to_json(nlohmann::json& j, const PropertyRequest& r) {
    auto property = nlohmann::json{};
    to_json(property, r.property);
    j = nlohmann::json{{"parent", r.parent.to_hex()}, {"property", std::move(property)}};
}

// =============================================================================
// Results
// =============================================================================

void to_json(nlohmann::json& j, const ScoreHead& h) {
    j = nlohmann::json{
        {"head_hash", h.snapshot.to_hex()},
        {"property_hash", h.property.to_hex()},
        {"annotations_hash", h.annotations.to_hex()},
        {"latest_version", h.latest_version},
    };
}

void to_json(nlohmann::json& j, const VersionEntry& v) {
    j = nlohmann::json{{"version", v.version}, {"hash", v.snapshot.to_hex()}};
}

void to_json(nlohmann::json& j, const CommitResult& r) {
    j = nlohmann::json{
        {"hash", r.snapshot.to_hex()},
        {"version", r.version},
        {"pages", r.pages},
    };
}

void to_json(nlohmann::json& j, const ScoreDetail& d) {
    // Versions keyed by their label, as the original version set was
    auto versions = nlohmann::json::object();
    for (const auto& v : d.versions) {
        versions[std::to_string(v.version)] = v.snapshot.to_hex();
    }
    auto head = nlohmann::json{};
    to_json(head, d.head);
    auto property = nlohmann::json{};
    to_json(property, d.property);
    property.erase("parent");
    j = nlohmann::json{
        {"owner", d.id.owner},
        {"score_name", d.id.name},
        {"head", std::move(head)},
        {"property", std::move(property)},
        {"annotations", d.annotations},
        {"versions", std::move(versions)},
    };
}

// =============================================================================
// Request decoding
// =============================================================================

auto commit_from_json(const nlohmann::json& j, bool strict) -> std::optional<Commit> {
    require_object(j, "commit");
    const auto tag = require_string(j, "type", "commit");
    const auto type = op_type_from_string(tag);
    if (!type) {
        if (strict) {
            throw ScoreError{ErrorKind::unsupported_operation,
                             "unsupported operation type '" + tag + "'"};
        }
        return std::nullopt;
    }

    auto it = j.find(tag);
    if (it == j.end()) {
        throw ScoreError{ErrorKind::invalid_operation, tag + ": missing payload"};
    }
    const auto& payload = require_object(*it, tag);

    switch (*type) {
        case OpType::add_page:
            return AddPage{
                .image = require_string(payload, "image", tag),
                .thumbnail = require_string(payload, "thumbnail", tag),
                .number = require_string(payload, "number", tag),
            };
        case OpType::insert_page:
            return InsertPage{
                .index = require_index(payload, tag),
                .image = require_string(payload, "image", tag),
                .thumbnail = require_string(payload, "thumbnail", tag),
                .number = require_string(payload, "number", tag),
            };
        case OpType::delete_page:
            return DeletePage{.index = require_index(payload, tag)};
        case OpType::update_property:
            return update_property_from_json(payload);
    }
    return std::nullopt;
}

auto commit_request_from_json(const nlohmann::json& j, bool strict) -> CommitRequest {
    require_object(j, "commit request");
    auto request = CommitRequest{.parent = require_hash(j, "parent", "commit request"), .commits = {}};

    auto it = j.find("commits");
    if (it == j.end() || !it->is_array()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         "commit request: 'commits' must be an array"};
    }
    for (const auto& element : *it) {
        if (auto commit = commit_from_json(element, strict)) {
            request.commits.push_back(std::move(*commit));
        }
    }
    return request;
}

auto property_request_from_json(const nlohmann::json& j) -> PropertyRequest {
    require_object(j, "property request");
    auto it = j.find("property");
    if (it == j.end()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         "property request: missing 'property'"};
    }
    return PropertyRequest{
        .parent = require_hash(j, "parent", "property request"),
        .property = update_property_from_json(*it),
    };
}

auto annotation_request_from_json(const nlohmann::json& j, bool strict) -> AnnotationRequest {
    require_object(j, "annotation request");
    auto request = AnnotationRequest{
        .parent = require_hash(j, "parent", "annotation request"), .operations = {}};

    auto it = j.find("operations");
    if (it == j.end() || !it->is_array()) {
        throw ScoreError{ErrorKind::invalid_operation,
                         "annotation request: 'operations' must be an array"};
    }
    for (const auto& element : *it) {
        require_object(element, "annotation operation");
        const auto tag = require_string(element, "type", "annotation operation");
        const auto type = annotation_op_type_from_string(tag);
        if (!type) {
            if (strict) {
                throw ScoreError{ErrorKind::unsupported_operation,
                                 "unsupported annotation operation '" + tag + "'"};
            }
            continue;
        }
        auto payload_it = element.find(tag);
        if (payload_it == element.end()) {
            throw ScoreError{ErrorKind::invalid_operation, tag + ": missing payload"};
        }
        const auto& payload = require_object(*payload_it, tag);
        switch (*type) {
            case AnnotationOpType::add_annotation:
                request.operations.push_back(
                    AddAnnotation{.content = require_string(payload, "content", tag)});
                break;
            case AnnotationOpType::remove_annotation:
                request.operations.push_back(
                    RemoveAnnotation{.id = require_annotation_id(payload, tag)});
                break;
            case AnnotationOpType::replace_annotation:
                request.operations.push_back(ReplaceAnnotation{
                    .id = require_annotation_id(payload, tag),
                    .content = require_string(payload, "content", tag),
                });
                break;
        }
    }
    return request;
}

}  // namespace score_history
