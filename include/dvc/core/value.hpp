#pragma once

/**
 * @file value.hpp
 * @brief Structured payload type shared by events, conflicts and commits
 *
 * Entity states travel as JSON-like trees (null/bool/number/string/array/object).
 * nlohmann::json already is that tagged recursive type, with structural equality,
 * so it is used directly.
 *
 * ABSENT VS NULL:
 * An event without an after-state (e.g. a DELETE) and an after-state that is
 * literally null are different things. Absence is modelled with std::optional.
 */

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace dvc {

using Value = nlohmann::json;
using OptionalValue = std::optional<Value>;

/// Structural equality where two absent values are equal and absent != null
bool values_equal(const OptionalValue& lhs, const OptionalValue& rhs);

/// True for absent values and explicit null
bool is_nullish(const OptionalValue& value) noexcept;

/// Member lookup on an object value; absent when value is not an object or lacks the key
OptionalValue member_of(const OptionalValue& value, const std::string& key);

/// Short single-line rendering used in log messages and explanations
std::string describe(const OptionalValue& value);

} // namespace dvc
