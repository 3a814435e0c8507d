#pragma once

#include "dvc/sync/resolution.hpp"
#include "dvc/sync/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dvc::sync {

struct MergeOptions {
    std::optional<ResolutionStrategy> resolution_strategy;
    bool auto_merge_commutative = false;
};

struct MergeStats {
    std::size_t from_ours = 0;                 ///< Input size of our stream, before dedup
    std::size_t from_theirs = 0;               ///< Input size of their stream, before dedup
    std::size_t entities_processed = 0;        ///< Distinct targets across both streams
    std::size_t entities_with_conflicts = 0;   ///< Distinct targets with at least one conflict
    std::size_t auto_merged = 0;               ///< Fields combined as commutative (auto_merge_commutative only)
};

struct EventMergeResult {
    bool success = false;
    std::vector<Event> merged_events;
    std::vector<ConflictInfo> conflicts;
    std::vector<Resolution> resolved;          ///< One per conflict, same order, when a strategy was given
    MergeStats stats;
    std::map<std::string, UpdateOps> combined_operations;   ///< target -> combined commutative ops
};

/**
 * @brief Merge two divergent event streams into one ordered stream
 *
 * Identical CREATEs (same target, deep-equal after-state) and events carrying
 * the same id on both sides are emitted once. Conflicts are reported as data;
 * with a resolution strategy each conflict gets a Resolution and its
 * `resolved` flag. success is true iff no conflict is left unresolved.
 * merged_events is stably sorted by ts.
 */
EventMergeResult merge_event_streams(const std::vector<Event>& ours,
                                     const std::vector<Event>& theirs,
                                     const MergeOptions& options = {});

/// Stable ascending sort by ts
std::vector<Event> sort_events(std::vector<Event> events);

} // namespace dvc::sync
