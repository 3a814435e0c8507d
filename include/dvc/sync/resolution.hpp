#pragma once

#include "dvc/core/result.hpp"
#include "dvc/sync/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dvc::sync {

enum class BuiltinStrategy {
    Ours,       ///< keep our value
    Theirs,     ///< take their value
    Latest,     ///< value of the newer event; ties keep ours
    Manual      ///< leave for a human decision
};

/**
 * @brief Outcome of applying a strategy to one conflict
 *
 * requires_manual_resolution == true implies resolved_value is empty.
 */
struct Resolution {
    OptionalValue resolved_value;
    std::string strategy;
    bool requires_manual_resolution = false;
    std::optional<ConflictInfo> conflict;
    std::string explanation;
};

using ResolverFn = std::function<Resolution(const ConflictInfo&)>;

/**
 * @brief Either a built-in strategy or a custom resolver function
 *
 * Custom resolvers that leave Resolution::strategy empty are labelled "custom".
 */
class ResolutionStrategy {
public:
    ResolutionStrategy(BuiltinStrategy builtin) : impl_(builtin) {}
    ResolutionStrategy(ResolverFn resolver) : impl_(std::move(resolver)) {}

    /// Parse "ours" | "theirs" | "latest" | "manual"
    static dvc::Result<ResolutionStrategy> parse(const std::string& token);

    [[nodiscard]] bool is_builtin() const noexcept { return impl_.index() == 0; }

    [[nodiscard]] Resolution apply(const ConflictInfo& conflict) const;

private:
    std::variant<BuiltinStrategy, ResolverFn> impl_;
};

const char* to_string(BuiltinStrategy strategy) noexcept;

Resolution resolve_conflict(const ConflictInfo& conflict, const ResolutionStrategy& strategy);

/// Token form; UnknownStrategy error "Unknown resolution strategy: <token>" for unrecognised tokens
dvc::Result<Resolution> resolve_conflict(const ConflictInfo& conflict, const std::string& token);

std::vector<Resolution> resolve_all_conflicts(const std::vector<ConflictInfo>& conflicts,
                                              const ResolutionStrategy& strategy);

std::vector<Resolution> resolve_conflicts_by_type(const std::vector<ConflictInfo>& conflicts,
                                                  const std::map<ConflictType, ResolutionStrategy>& strategies,
                                                  const ResolutionStrategy& default_strategy = BuiltinStrategy::Manual);

bool all_resolutions_complete(const std::vector<Resolution>& resolutions);

std::vector<Resolution> get_unresolved_conflicts(const std::vector<Resolution>& resolutions);

/// Feed a human decision back into a pending resolution ("manual-resolved")
Resolution apply_manual_resolution(const Resolution& resolution, OptionalValue value);

// ════════════════════════════════════════════════════════
// Composable strategies
// ════════════════════════════════════════════════════════

/// First result that does not require manual resolution; the last result otherwise
ResolutionStrategy fallback_strategy(std::vector<ResolutionStrategy> strategies);

/// Dispatch on ConflictInfo::field; conflicts without a mapped field use default_strategy
ResolutionStrategy field_based_strategy(std::map<std::string, ResolutionStrategy> by_field,
                                        ResolutionStrategy default_strategy = BuiltinStrategy::Manual);

using PreferenceFn = std::function<bool(const OptionalValue& ours, const OptionalValue& theirs)>;

/// Predicate true picks ours, false picks theirs
ResolutionStrategy preference_strategy(PreferenceFn prefer_ours);

/// The non-null side when exactly one side is null or absent, ours otherwise
ResolutionStrategy non_null_strategy();

/// "ours<separator>theirs" for two strings, manual otherwise
ResolutionStrategy concatenate_strategy(std::string separator = " ");

/// Ours followed by their elements not already present, manual for non-arrays
ResolutionStrategy array_merge_strategy();

} // namespace dvc::sync
