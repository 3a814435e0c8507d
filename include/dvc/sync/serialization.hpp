#pragma once

/**
 * @file serialization.hpp
 * @brief JSON wire format for events, conflicts, resolutions, commits and merge state
 *
 * Hooks for nlohmann::json (found by ADL), so `Value v = commit;` and
 * `v.get<Event>()` work directly.
 *
 * FORMAT NOTES:
 * - Keys are camelCase to match the event log that produces the events
 *   ("ourValue", "requiresManualResolution", "baseCommit", ...)
 * - Absent optional values are omitted; an explicit null round-trips as null
 * - Event "after._ops" is lifted into Event::ops on read and left in place
 * - Malformed documents throw nlohmann::json::exception; unknown enum
 *   tokens throw std::invalid_argument
 */

#include "dvc/core/value.hpp"
#include "dvc/sync/commit.hpp"
#include "dvc/sync/merge_state.hpp"
#include "dvc/sync/resolution.hpp"
#include "dvc/sync/types.hpp"

namespace dvc::sync {

void to_json(Value& j, const Event& event);
void from_json(const Value& j, Event& event);

void to_json(Value& j, const ConflictInfo& conflict);
void from_json(const Value& j, ConflictInfo& conflict);

void to_json(Value& j, const Resolution& resolution);
void from_json(const Value& j, Resolution& resolution);

void to_json(Value& j, const Commit& commit);
void from_json(const Value& j, Commit& commit);

void to_json(Value& j, const MergeConflict& conflict);
void from_json(const Value& j, MergeConflict& conflict);

void to_json(Value& j, const MergeState& state);
void from_json(const Value& j, MergeState& state);

} // namespace dvc::sync
