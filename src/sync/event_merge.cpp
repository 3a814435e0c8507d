#include "dvc/sync/event_merge.hpp"

#include "dvc/sync/commutative.hpp"
#include "dvc/sync/conflict_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <unordered_set>

namespace dvc::sync {
namespace {

bool same_create(const Event& a, const Event& b) {
    return is_create_event(a) && is_create_event(b) &&
           a.op == b.op &&
           a.target == b.target &&
           values_equal(strip_operations(a.after), strip_operations(b.after));
}

std::vector<Event> deduplicate(const std::vector<Event>& ours, const std::vector<Event>& theirs) {
    std::vector<Event> merged = ours;
    merged.reserve(ours.size() + theirs.size());

    std::unordered_set<std::string> our_ids;
    for (const auto& event : ours) {
        if (!event.id.empty()) {
            our_ids.insert(event.id);
        }
    }

    for (const auto& event : theirs) {
        if (!event.id.empty() && our_ids.count(event.id) > 0) {
            continue;
        }
        const bool duplicate_create = std::any_of(ours.begin(), ours.end(), [&event](const Event& mine) {
            return same_create(mine, event);
        });
        if (duplicate_create) {
            continue;
        }
        merged.push_back(event);
    }
    return merged;
}

std::size_t count_targets(const std::vector<Event>& ours, const std::vector<Event>& theirs) {
    std::set<std::string> targets;
    for (const auto& event : ours) {
        targets.insert(event.target);
    }
    for (const auto& event : theirs) {
        targets.insert(event.target);
    }
    return targets.size();
}

} // namespace

EventMergeResult merge_event_streams(const std::vector<Event>& ours,
                                     const std::vector<Event>& theirs,
                                     const MergeOptions& options) {
    EventMergeResult result;
    result.stats.from_ours = ours.size();
    result.stats.from_theirs = theirs.size();
    result.stats.entities_processed = count_targets(ours, theirs);

    auto analysis = analyze_conflicts(ours, theirs);
    result.conflicts = std::move(analysis.conflicts);

    if (options.auto_merge_commutative) {
        for (const auto& field : analysis.commutative_fields) {
            auto& combined = result.combined_operations[field.target];
            if (combined.empty()) {
                combined = combine_operations(field.our_ops, field.their_ops);
            }
            ++result.stats.auto_merged;
        }
    }

    if (options.resolution_strategy.has_value()) {
        result.resolved = resolve_all_conflicts(result.conflicts, *options.resolution_strategy);
        for (std::size_t i = 0; i < result.conflicts.size(); ++i) {
            result.conflicts[i].resolved = !result.resolved[i].requires_manual_resolution;
        }
    }

    std::set<std::string> conflicted_targets;
    for (const auto& conflict : result.conflicts) {
        conflicted_targets.insert(conflict.target);
    }
    result.stats.entities_with_conflicts = conflicted_targets.size();

    result.success = std::all_of(result.conflicts.begin(), result.conflicts.end(),
                                 [](const ConflictInfo& c) { return c.resolved.value_or(false); });

    result.merged_events = sort_events(deduplicate(ours, theirs));

    spdlog::debug("Merged {} + {} events into {} ({} entities, {} conflicts, {} auto-merged)",
                  result.stats.from_ours, result.stats.from_theirs, result.merged_events.size(),
                  result.stats.entities_processed, result.conflicts.size(), result.stats.auto_merged);
    return result;
}

std::vector<Event> sort_events(std::vector<Event> events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return a.ts < b.ts; });
    return events;
}

} // namespace dvc::sync
