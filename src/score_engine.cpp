#include <score-history/score_engine.hpp>

#include <score-history/error.hpp>
#include <score-history/log.hpp>

#include "snapshot_cache.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace score_history {

namespace {

void validate_id(const ScoreId& id) {
    if (id.owner.empty() || id.name.empty()) {
        throw ScoreError{ErrorKind::invalid_operation, "owner and score name must not be empty"};
    }
}

auto require_store(const std::shared_ptr<ObjectStore>& objects) -> ObjectStore& {
    if (!objects) {
        throw ScoreError{ErrorKind::invalid_config, "score engine requires an object store"};
    }
    return *objects;
}

auto to_pages(const PageSequence& sequence) -> std::vector<Page> {
    auto pages = std::vector<Page>{};
    pages.reserve(sequence.size());
    for (const auto& entry : sequence) pages.push_back(entry.page);
    return pages;
}

}  // anonymous namespace

ScoreEngine::ScoreEngine(EngineConfig config)
    : ScoreEngine{std::make_shared<MemoryObjectStore>(),
                  std::make_shared<MemoryHeadStore>(),
                  std::make_shared<MemoryVersionIndex>(config.version_base),
                  config} {}

ScoreEngine::ScoreEngine(std::shared_ptr<ObjectStore> objects,
                         std::shared_ptr<HeadStore> heads,
                         std::shared_ptr<VersionIndex> versions,
                         EngineConfig config)
    : objects_{std::move(objects)},
      heads_{std::move(heads)},
      versions_{std::move(versions)},
      config_{std::move(config)},
      properties_{require_store(objects_)},
      annotations_{*objects_},
      cache_{std::make_unique<detail::SnapshotCache>(config_.cache_capacity)} {
    if (config_.version_base == 0) {
        throw ScoreError{ErrorKind::invalid_config, "version_base must be at least 1"};
    }
    if (!heads_ || !versions_) {
        throw ScoreError{ErrorKind::invalid_config, "score engine requires a head store and a version index"};
    }
    if (!set_log_level(config_.log_level)) {
        throw ScoreError{ErrorKind::invalid_config, "unknown log_level '" + config_.log_level + "'"};
    }
}

ScoreEngine::~ScoreEngine() = default;

// -- Internals ----------------------------------------------------------------

auto ScoreEngine::load_head(const ScoreId& id) const -> ScoreHead {
    auto head = heads_->get(id);
    if (!head) {
        throw ScoreError{ErrorKind::score_not_found, "score " + id.to_string() + " does not exist"};
    }
    return *head;
}

/// Per-score writer lock acquired with a bounded wait. The slot is
/// reference-counted and erased by the last writer leaving it.
class ScoreEngine::WriteLock {
public:
    WriteLock(ScoreEngine& engine, const ScoreId& id)
        : engine_{engine}, id_{id} {
        {
            auto guard = std::scoped_lock{engine_.write_slots_mutex_};
            auto& slot = engine_.write_slots_[id_];
            if (!slot) slot = std::make_unique<WriteSlot>();
            ++slot->users;
            slot_ = slot.get();
        }
        if (!slot_->mutex.try_lock_for(engine_.config_.lock_timeout)) {
            release();
            logger()->info("write to {} timed out waiting for another writer", id_.to_string());
            throw ScoreError{ErrorKind::concurrency_conflict,
                             "score " + id_.to_string() + " is being modified by another writer"};
        }
    }

    ~WriteLock() {
        slot_->mutex.unlock();
        release();
    }

    WriteLock(const WriteLock&) = delete;
    auto operator=(const WriteLock&) -> WriteLock& = delete;

private:
    void release() noexcept {
        auto guard = std::scoped_lock{engine_.write_slots_mutex_};
        if (--slot_->users == 0) engine_.write_slots_.erase(id_);
    }

    ScoreEngine& engine_;
    ScoreId id_;
    WriteSlot* slot_{nullptr};
};

auto ScoreEngine::active_writers() const -> std::size_t {
    auto guard = std::scoped_lock{write_slots_mutex_};
    return write_slots_.size();
}

auto ScoreEngine::published_versions(const ScoreId& id, const ScoreHead& head) const
    -> std::vector<VersionEntry> {
    auto result = std::vector<VersionEntry>{};
    if (head.latest_version == 0) return result;
    // Entries past the head belong to a commit that has not published yet
    for (const auto& entry : versions_->list_versions(id)) {
        result.push_back(entry);
        if (entry.version >= head.latest_version) break;
    }
    return result;
}

void ScoreEngine::withdraw_version(const ScoreId& id, std::uint64_t version,
                                   const ObjectHash& snapshot) {
    if (!versions_->discard_version(id, version, snapshot)) {
        logger()->warn("version {} of {} is no longer the newest index entry; left in place",
                       version, id.to_string());
    }
}

auto ScoreEngine::materialize(const ObjectHash& snapshot_hash) const -> PageSequence {
    if (auto cached = cache_->get(snapshot_hash)) return std::move(*cached);

    try {
        auto snapshot = get_object<Snapshot>(objects_->get(snapshot_hash));
        if (!snapshot) {
            throw ScoreError{ErrorKind::object_not_found,
                             "object " + snapshot_hash.to_hex() + " is not a snapshot"};
        }

        auto wanted = std::set<ObjectHash>(snapshot->pages.begin(), snapshot->pages.end());
        auto resolved = objects_->get_batch(wanted);

        auto sequence = PageSequence{};
        sequence.reserve(snapshot->pages.size());
        for (const auto& h : snapshot->pages) {
            auto page = get_object<Page>(resolved.at(h));
            if (!page) {
                throw ScoreError{ErrorKind::object_not_found,
                                 "object " + h.to_hex() + " is not a page"};
            }
            sequence.push_back(PageEntry{.page = std::move(*page), .hash = h});
        }
        cache_->put(snapshot_hash, sequence);
        return sequence;
    } catch (const ScoreError& e) {
        if (e.kind() == ErrorKind::object_not_found) {
            logger()->critical("object store is missing data for snapshot {}: {}",
                               snapshot_hash.to_hex(), e.what());
        }
        throw;
    }
}

// -- Scores -------------------------------------------------------------------

auto ScoreEngine::create_score(const ScoreId& id, const UpdateProperty& property) -> ScoreHead {
    validate_id(id);
    auto lock = WriteLock{*this, id};

    auto root_property = properties_.create(property);
    auto root_annotations = annotations_.create();
    auto root_snapshot = objects_->put(Snapshot{.pages = {}, .parent = std::nullopt});
    auto head = ScoreHead{
        .snapshot = root_snapshot,
        .property = root_property.hash,
        .annotations = root_annotations.hash,
        .latest_version = 0,
    };
    if (!heads_->create(id, head)) {
        throw ScoreError{ErrorKind::already_exists, "score " + id.to_string() + " already exists"};
    }
    logger()->info("created score {}", id.to_string());
    return head;
}

auto ScoreEngine::get_score(const ScoreId& id) const -> ScoreDetail {
    auto head = load_head(id);
    return ScoreDetail{
        .id = id,
        .head = head,
        .property = properties_.load(head.property),
        .annotations = annotations_.load(head.annotations).items,
        .versions = published_versions(id, head),
    };
}

auto ScoreEngine::list_scores(std::string_view owner) const -> std::vector<ScoreSummary> {
    auto result = std::vector<ScoreSummary>{};
    for (const auto& id : heads_->list(owner)) {
        // A score deleted after list() is simply left out
        auto head = heads_->get(id);
        if (!head) continue;
        result.push_back(ScoreSummary{.id = id, .property = properties_.load(head->property)});
    }
    return result;
}

void ScoreEngine::delete_score(const ScoreId& id) {
    auto lock = WriteLock{*this, id};
    if (!heads_->remove(id)) {
        throw ScoreError{ErrorKind::score_not_found, "score " + id.to_string() + " does not exist"};
    }
    versions_->remove_score(id);
    logger()->info("deleted score {}", id.to_string());
}

auto ScoreEngine::head(const ScoreId& id) const -> ScoreHead {
    return load_head(id);
}

// -- Pages and versions -------------------------------------------------------

auto ScoreEngine::commit(const ScoreId& id, const CommitRequest& request) -> CommitResult {
    if (request.commits.empty()) {
        throw ScoreError{ErrorKind::invalid_operation, "commit request has no operations"};
    }

    auto lock = WriteLock{*this, id};

    const auto head = load_head(id);
    if (request.parent != head.snapshot) {
        logger()->info("rejected commit to {}: parent {} is not head {}", id.to_string(),
                       request.parent.to_hex(), head.snapshot.to_hex());
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "parent " + request.parent.to_hex() + " is not the current head of " +
                         id.to_string()};
    }

    auto pages = apply_operations(materialize(head.snapshot), request.commits);

    // Pages carried over from the parent keep their hash; only new ones are written
    auto snapshot = Snapshot{.pages = {}, .parent = head.snapshot};
    snapshot.pages.reserve(pages.size());
    for (auto& entry : pages) {
        if (!entry.hash) entry.hash = objects_->put(entry.page);
        snapshot.pages.push_back(*entry.hash);
    }
    const auto snapshot_hash = objects_->put(snapshot);

    const auto expected_version =
        head.latest_version == 0 ? config_.version_base : head.latest_version + 1;

    // The version is recorded before the head moves, so a reader that sees
    // latest_version N always finds N in the index
    const auto version = versions_->record_version(id, snapshot_hash);
    if (version != expected_version) {
        withdraw_version(id, version, snapshot_hash);
        logger()->warn("version index of {} allocated {} but head expected {}",
                       id.to_string(), version, expected_version);
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "version index of " + id.to_string() + " is ahead of its head"};
    }

    auto desired = head;
    desired.snapshot = snapshot_hash;
    desired.latest_version = version;
    if (!heads_->compare_and_set(id, head, desired)) {
        withdraw_version(id, version, snapshot_hash);
        logger()->info("rejected commit to {}: head moved during write", id.to_string());
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "head of " + id.to_string() + " changed during the commit"};
    }

    cache_->put(snapshot_hash, pages);
    logger()->debug("committed {} operation(s) to {}: {} -> {} (version {})",
                    request.commits.size(), id.to_string(), head.snapshot.to_hex(),
                    snapshot_hash.to_hex(), version);

    return CommitResult{
        .snapshot = snapshot_hash,
        .version = version,
        .pages = to_pages(pages),
    };
}

auto ScoreEngine::get_pages(const ScoreId& id, std::string_view version) const
    -> std::vector<Page> {
    const auto head = load_head(id);
    const auto number = parse_version_label(version);
    if (!number || head.latest_version == 0 || *number > head.latest_version) {
        throw ScoreError{ErrorKind::version_not_found,
                         "version '" + std::string{version} + "' of " + id.to_string() +
                         " does not exist"};
    }
    return to_pages(materialize(versions_->resolve(id, version)));
}

auto ScoreEngine::get_latest_pages(const ScoreId& id) const -> std::vector<Page> {
    return to_pages(materialize(load_head(id).snapshot));
}

auto ScoreEngine::list_versions(const ScoreId& id) const -> std::vector<VersionEntry> {
    return published_versions(id, load_head(id));
}

auto ScoreEngine::snapshot_history(const ScoreId& id) const -> std::vector<ObjectHash> {
    auto result = std::vector<ObjectHash>{};
    auto seen = std::set<ObjectHash>{};
    auto next = std::optional<ObjectHash>{load_head(id).snapshot};
    while (next) {
        if (!seen.insert(*next).second) {
            throw ScoreError{ErrorKind::storage_error,
                             "snapshot chain loops at " + next->to_hex()};
        }
        auto snapshot = get_object<Snapshot>(objects_->get(*next));
        if (!snapshot) {
            logger()->critical("object {} is referenced as a snapshot but is not one",
                               next->to_hex());
            throw ScoreError{ErrorKind::object_not_found,
                             "object " + next->to_hex() + " is not a snapshot"};
        }
        result.push_back(*next);
        next = snapshot->parent;
    }
    return result;
}

// -- Property -----------------------------------------------------------------

auto ScoreEngine::get_property(const ScoreId& id) const -> Property {
    return properties_.load(load_head(id).property);
}

auto ScoreEngine::update_property(const ScoreId& id, const PropertyRequest& request)
    -> PropertyResult {
    auto lock = WriteLock{*this, id};

    const auto head = load_head(id);
    auto result = properties_.update(head.property, request);

    auto desired = head;
    desired.property = result.hash;
    if (!heads_->compare_and_set(id, head, desired)) {
        logger()->info("rejected property update of {}: head moved during write", id.to_string());
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "head of " + id.to_string() + " changed during the property update"};
    }
    logger()->debug("updated property of {} -> {}", id.to_string(), result.hash.to_hex());
    return result;
}

auto ScoreEngine::property_history(const ScoreId& id) const -> std::vector<PropertyResult> {
    return properties_.history(load_head(id).property);
}

// -- Annotations --------------------------------------------------------------

auto ScoreEngine::get_annotations(const ScoreId& id) const -> AnnotationSet {
    return annotations_.load(load_head(id).annotations);
}

auto ScoreEngine::update_annotations(const ScoreId& id, const AnnotationRequest& request)
    -> AnnotationResult {
    auto lock = WriteLock{*this, id};

    const auto head = load_head(id);
    auto result = annotations_.update(head.annotations, request);

    auto desired = head;
    desired.annotations = result.hash;
    if (!heads_->compare_and_set(id, head, desired)) {
        logger()->info("rejected annotation update of {}: head moved during write",
                       id.to_string());
        throw ScoreError{ErrorKind::concurrency_conflict,
                         "head of " + id.to_string() + " changed during the annotation update"};
    }
    logger()->debug("updated annotations of {} -> {}", id.to_string(), result.hash.to_hex());
    return result;
}

auto ScoreEngine::annotation_history(const ScoreId& id) const -> std::vector<AnnotationResult> {
    return annotations_.history(load_head(id).annotations);
}

}  // namespace score_history
