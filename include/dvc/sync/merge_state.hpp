#pragma once

/**
 * @file merge_state.hpp
 * @brief Persisted record of an in-progress branch merge
 *
 * Stored at "MERGE_STATE" so an interrupted merge can be resumed or aborted.
 * Only one merge may be in progress per repository.
 *
 * STATUS TRANSITIONS:
 * InProgress --add_conflict--> Conflicted --last conflict resolved--> Resolved
 *
 * The value-returning helpers (add_conflict, resolve_merge_conflict) take
 * the state by value and return the updated copy; nothing is written until
 * save_merge_state.
 */

#include "dvc/core/result.hpp"
#include "dvc/core/value.hpp"
#include "dvc/storage/backend.hpp"
#include "dvc/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dvc::sync {

inline constexpr const char* kMergeStateKey = "MERGE_STATE";

enum class MergeStatus {
    InProgress,
    Conflicted,
    Resolved
};

struct MergeConflict {
    std::string entity_id;
    std::string collection;
    std::vector<std::string> fields;
    bool resolved = false;
    std::optional<std::string> resolution;   ///< Strategy label once resolved
    OptionalValue our_value;
    OptionalValue their_value;
    OptionalValue base_value;
};

struct MergeStateOptions {
    std::string source;
    std::string target;
    std::string base_commit;
    std::string source_commit;
    std::string target_commit;
    std::string strategy = "manual";
    std::optional<std::int64_t> started_at;   ///< Defaults to now
};

struct MergeState {
    std::string source;
    std::string target;
    std::string base_commit;
    std::string source_commit;
    std::string target_commit;
    std::string strategy;
    MergeStatus status = MergeStatus::InProgress;
    std::int64_t started_at = 0;
    std::vector<MergeConflict> conflicts;
};

const char* to_string(MergeStatus status) noexcept;
std::optional<MergeStatus> merge_status_from_string(const std::string& text);

MergeState create_merge_state(const MergeStateOptions& options);

/// Create and save a new merge state; MergeInProgress when one is already stored
dvc::Result<MergeState> start_merge(storage::StorageBackend& storage, const MergeStateOptions& options);

dvc::Result<void> save_merge_state(storage::StorageBackend& storage, const MergeState& state);

/// Empty when no merge is in progress, CorruptObject when the record is unreadable
dvc::Result<std::optional<MergeState>> load_merge_state(const storage::StorageBackend& storage);

/// Abort: drop the record. A no-op when nothing is stored.
dvc::Result<void> clear_merge_state(storage::StorageBackend& storage);

bool has_merge_in_progress(const storage::StorageBackend& storage);

MergeState add_conflict(MergeState state, MergeConflict conflict);

/// Mark every conflict on entity_id resolved with the given strategy label
MergeState resolve_merge_conflict(MergeState state, const std::string& entity_id, const std::string& resolution);

std::vector<MergeConflict> unresolved_conflicts(const MergeState& state);

bool all_conflicts_resolved(const MergeState& state);

/// Entity-level record of a detected conflict (collection = target namespace)
MergeConflict merge_conflict_from(const ConflictInfo& conflict);

} // namespace dvc::sync
