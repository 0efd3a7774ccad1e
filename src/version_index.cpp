#include <score-history/version_index.hpp>

#include <score-history/error.hpp>

#include <charconv>
#include <string>

namespace score_history {

auto parse_version_label(std::string_view label) -> std::optional<std::uint64_t> {
    auto value = std::uint64_t{0};
    const auto* first = label.data();
    const auto* last = label.data() + label.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || label.empty()) return std::nullopt;
    return value;
}

MemoryVersionIndex::MemoryVersionIndex(std::uint64_t base)
    : base_{base} {
    if (base_ == 0) {
        throw ScoreError{ErrorKind::invalid_config, "version numbering must start at 1 or above"};
    }
}

auto MemoryVersionIndex::find_log(const ScoreId& id) const -> std::shared_ptr<VersionLog> {
    auto lock = std::shared_lock{mutex_};
    auto it = logs_.find(id);
    if (it == logs_.end()) return nullptr;
    return it->second;
}

auto MemoryVersionIndex::record_version(const ScoreId& id, const ObjectHash& snapshot)
    -> std::uint64_t {
    auto log = std::shared_ptr<VersionLog>{};
    {
        auto lock = std::unique_lock{mutex_};
        auto& slot = logs_[id];
        if (!slot) slot = std::make_shared<VersionLog>();
        log = slot;
    }
    auto lock = std::unique_lock{log->mutex};
    auto next = log->entries.empty() ? base_ : log->entries.back().version + 1;
    log->entries.push_back(VersionEntry{.version = next, .snapshot = snapshot});
    return next;
}

auto MemoryVersionIndex::resolve(const ScoreId& id, std::string_view label) const
    -> ObjectHash {
    auto not_found = [&] {
        return ScoreError{ErrorKind::version_not_found,
                          "version '" + std::string{label} + "' of " + id.to_string() +
                          " does not exist"};
    };

    auto version = parse_version_label(label);
    if (!version) throw not_found();

    auto log = find_log(id);
    if (!log) throw not_found();

    auto lock = std::shared_lock{log->mutex};
    if (log->entries.empty()) throw not_found();
    // Versions are contiguous from the first entry
    auto first = log->entries.front().version;
    if (*version < first || *version - first >= log->entries.size()) throw not_found();
    return log->entries[static_cast<std::size_t>(*version - first)].snapshot;
}

auto MemoryVersionIndex::list_versions(const ScoreId& id) const -> VersionSequence {
    auto log = find_log(id);
    if (!log) return VersionSequence{};

    auto count = std::size_t{0};
    {
        auto lock = std::shared_lock{log->mutex};
        count = log->entries.size();
    }
    return VersionSequence{count, [log, id](std::size_t i) {
        auto lock = std::shared_lock{log->mutex};
        // A withdrawn entry can shrink the log under an open sequence
        if (i >= log->entries.size()) {
            throw ScoreError{ErrorKind::version_not_found,
                             "version list of " + id.to_string() + " changed while listing"};
        }
        return log->entries[i];
    }};
}

auto MemoryVersionIndex::latest(const ScoreId& id) const -> std::optional<VersionEntry> {
    auto log = find_log(id);
    if (!log) return std::nullopt;
    auto lock = std::shared_lock{log->mutex};
    if (log->entries.empty()) return std::nullopt;
    return log->entries.back();
}

auto MemoryVersionIndex::discard_version(const ScoreId& id, std::uint64_t version,
                                         const ObjectHash& snapshot) -> bool {
    auto log = find_log(id);
    if (!log) return false;
    auto lock = std::unique_lock{log->mutex};
    if (log->entries.empty() || log->entries.back() != VersionEntry{.version = version, .snapshot = snapshot}) {
        return false;
    }
    log->entries.pop_back();
    return true;
}

void MemoryVersionIndex::remove_score(const ScoreId& id) {
    auto lock = std::unique_lock{mutex_};
    logs_.erase(id);
}

}  // namespace score_history
