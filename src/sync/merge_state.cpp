#include "dvc/sync/merge_state.hpp"

#include "dvc/sync/serialization.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace dvc::sync {
namespace {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void refresh_status(MergeState& state) {
    if (state.conflicts.empty()) {
        return;
    }
    state.status = all_conflicts_resolved(state) ? MergeStatus::Resolved : MergeStatus::Conflicted;
}

} // namespace

const char* to_string(MergeStatus status) noexcept {
    switch (status) {
        case MergeStatus::InProgress: return "in_progress";
        case MergeStatus::Conflicted: return "conflicted";
        case MergeStatus::Resolved: return "resolved";
        default: return "unknown";
    }
}

std::optional<MergeStatus> merge_status_from_string(const std::string& text) {
    if (text == "in_progress") return MergeStatus::InProgress;
    if (text == "conflicted") return MergeStatus::Conflicted;
    if (text == "resolved") return MergeStatus::Resolved;
    return std::nullopt;
}

MergeState create_merge_state(const MergeStateOptions& options) {
    MergeState state;
    state.source = options.source;
    state.target = options.target;
    state.base_commit = options.base_commit;
    state.source_commit = options.source_commit;
    state.target_commit = options.target_commit;
    state.strategy = options.strategy;
    state.status = MergeStatus::InProgress;
    state.started_at = options.started_at.value_or(now_ms());
    return state;
}

dvc::Result<MergeState> start_merge(storage::StorageBackend& storage, const MergeStateOptions& options) {
    auto existing = load_merge_state(storage);
    if (existing.is_error()) {
        return dvc::Err<MergeState>(existing.error());
    }
    if (existing.value().has_value()) {
        const auto& active = *existing.value();
        return dvc::Err<MergeState>(errors::merge_in_progress(active.source, active.target));
    }
    auto state = create_merge_state(options);
    if (auto res = save_merge_state(storage, state); res.is_error()) {
        return dvc::Err<MergeState>(res.error());
    }
    spdlog::info("Started merge of {} into {}", state.source, state.target);
    return dvc::Ok(std::move(state));
}

dvc::Result<void> save_merge_state(storage::StorageBackend& storage, const MergeState& state) {
    Value document = state;
    spdlog::debug("Saving merge state {} -> {} ({})", state.source, state.target, to_string(state.status));
    return storage.write(kMergeStateKey, document.dump(2));
}

dvc::Result<std::optional<MergeState>> load_merge_state(const storage::StorageBackend& storage) {
    if (!storage.exists(kMergeStateKey)) {
        return dvc::Ok(std::optional<MergeState>{});
    }

    auto bytes = storage.read(kMergeStateKey);
    if (bytes.is_error()) {
        return dvc::Err<std::optional<MergeState>>(bytes.error());
    }

    try {
        return dvc::Ok(std::optional<MergeState>{Value::parse(bytes.value()).get<MergeState>()});
    } catch (const std::exception& e) {
        spdlog::warn("Unreadable merge state: {}", e.what());
        return dvc::Err<std::optional<MergeState>>(errors::corrupt_object(kMergeStateKey, e.what()));
    }
}

dvc::Result<void> clear_merge_state(storage::StorageBackend& storage) {
    if (!storage.exists(kMergeStateKey)) {
        return dvc::Ok();
    }
    spdlog::debug("Clearing merge state");
    return storage.remove(kMergeStateKey);
}

bool has_merge_in_progress(const storage::StorageBackend& storage) {
    return storage.exists(kMergeStateKey);
}

MergeState add_conflict(MergeState state, MergeConflict conflict) {
    state.conflicts.push_back(std::move(conflict));
    refresh_status(state);
    return state;
}

MergeState resolve_merge_conflict(MergeState state, const std::string& entity_id, const std::string& resolution) {
    for (auto& conflict : state.conflicts) {
        if (conflict.entity_id == entity_id) {
            conflict.resolved = true;
            conflict.resolution = resolution;
        }
    }
    refresh_status(state);
    return state;
}

std::vector<MergeConflict> unresolved_conflicts(const MergeState& state) {
    std::vector<MergeConflict> pending;
    std::copy_if(state.conflicts.begin(), state.conflicts.end(), std::back_inserter(pending),
                 [](const MergeConflict& c) { return !c.resolved; });
    return pending;
}

bool all_conflicts_resolved(const MergeState& state) {
    return std::all_of(state.conflicts.begin(), state.conflicts.end(),
                       [](const MergeConflict& c) { return c.resolved; });
}

MergeConflict merge_conflict_from(const ConflictInfo& conflict) {
    MergeConflict entry;
    entry.entity_id = conflict.target;
    entry.collection = target_namespace(conflict.target);
    if (conflict.field.has_value()) {
        entry.fields.push_back(*conflict.field);
    }
    entry.resolved = conflict.resolved.value_or(false);
    entry.our_value = conflict.our_value;
    entry.their_value = conflict.their_value;
    entry.base_value = conflict.base_value;
    return entry;
}

} // namespace dvc::sync
