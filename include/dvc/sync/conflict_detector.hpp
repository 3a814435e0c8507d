#pragma once

#include "dvc/sync/types.hpp"

#include <string>
#include <vector>

namespace dvc::sync {

/**
 * @brief A field both sides changed where the change was suppressed as commutative
 */
struct CommutativeField {
    std::string target;
    std::string field;
    UpdateOps our_ops;
    UpdateOps their_ops;
};

struct ConflictAnalysis {
    std::vector<ConflictInfo> conflicts;
    std::vector<CommutativeField> commutative_fields;
};

/**
 * @brief Compare the latest event per target from two divergent streams
 *
 * Per shared target:
 * - DELETE vs DELETE: idempotent, no conflict
 * - DELETE vs anything else: one delete_update conflict
 * - CREATE vs CREATE: create_create unless the after-states are deep-equal
 * - otherwise: one concurrent_update per differing field, unless both sides'
 *   operators on that field are commutative
 *
 * Conflicts are ordered by the target's first appearance in `ours`, then by field name.
 */
std::vector<ConflictInfo> detect_conflicts(const std::vector<Event>& ours,
                                           const std::vector<Event>& theirs);

/// detect_conflicts plus the fields that were suppressed as commutative
ConflictAnalysis analyze_conflicts(const std::vector<Event>& ours,
                                   const std::vector<Event>& theirs);

/// An after-state with its `_ops` provenance removed
OptionalValue strip_operations(const OptionalValue& state);

} // namespace dvc::sync
