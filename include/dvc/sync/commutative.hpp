#pragma once

#include "dvc/sync/types.hpp"

#include <set>
#include <string>

namespace dvc::sync {

/**
 * @brief True when applying a then b gives the same state as b then a
 *
 * Fields touched by only one side never interfere. A field touched by both
 * sides is commutative only when both use the same accumulating operator
 * ($inc, $min, $max or $addToSet). $set, $unset and $push on a shared
 * field never commute.
 */
bool is_commutative(const UpdateOps& a, const UpdateOps& b);

/**
 * @brief is_commutative restricted to a single field
 *
 * False when either side's operators do not mention the field: a differing
 * value with no operator provenance cannot be proven safe to combine.
 */
bool is_commutative_for_field(const UpdateOps& a, const UpdateOps& b, const std::string& field);

/// Merge two commutative operator sets into one ($inc sums, $min/$max pointwise, $addToSet union)
UpdateOps combine_operations(const UpdateOps& a, const UpdateOps& b);

std::set<std::string> get_affected_fields(const UpdateOps& ops);

/// The `_ops` descriptor embedded in an after-state, or an empty set
UpdateOps extract_operations(const OptionalValue& after_state);

/// Operator provenance of an event: side-channel ops, else after._ops, else metadata.update
UpdateOps event_operations(const Event& event);

UpdateOps update_ops_from_value(const Value& value);
Value update_ops_to_value(const UpdateOps& ops);

} // namespace dvc::sync
