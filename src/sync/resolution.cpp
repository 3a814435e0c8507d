#include "dvc/sync/resolution.hpp"

#include <algorithm>

namespace dvc::sync {
namespace {

constexpr const char* kCustomLabel = "custom";
constexpr const char* kManualResolvedLabel = "manual-resolved";

std::string location_of(const ConflictInfo& conflict) {
    if (conflict.field.has_value()) {
        return conflict.target + "." + *conflict.field;
    }
    return conflict.target;
}

Resolution picked(const ConflictInfo& conflict, OptionalValue value, std::string strategy, std::string explanation) {
    Resolution resolution;
    resolution.resolved_value = std::move(value);
    resolution.strategy = std::move(strategy);
    resolution.requires_manual_resolution = false;
    resolution.conflict = conflict;
    resolution.explanation = std::move(explanation);
    return resolution;
}

Resolution needs_manual(const ConflictInfo& conflict, std::string strategy, std::string reason) {
    Resolution resolution;
    resolution.strategy = std::move(strategy);
    resolution.requires_manual_resolution = true;
    resolution.conflict = conflict;
    resolution.explanation = std::move(reason);
    return resolution;
}

Resolution apply_builtin(BuiltinStrategy strategy, const ConflictInfo& conflict) {
    const std::string where = location_of(conflict);
    switch (strategy) {
        case BuiltinStrategy::Ours:
            return picked(conflict, conflict.our_value, "ours", "Kept our value for " + where);
        case BuiltinStrategy::Theirs:
            return picked(conflict, conflict.their_value, "theirs", "Took their value for " + where);
        case BuiltinStrategy::Latest: {
            const bool ours_newer = conflict.our_event.ts >= conflict.their_event.ts;
            return picked(conflict,
                          ours_newer ? conflict.our_value : conflict.their_value,
                          "latest",
                          std::string(ours_newer ? "Our" : "Their") + " change to " + where + " is the most recent (ours ts=" +
                              std::to_string(conflict.our_event.ts) + ", theirs ts=" +
                              std::to_string(conflict.their_event.ts) + ")");
        }
        case BuiltinStrategy::Manual:
        default:
            return needs_manual(conflict, "manual", "Conflict on " + where + " requires manual resolution");
    }
}

} // namespace

const char* to_string(BuiltinStrategy strategy) noexcept {
    switch (strategy) {
        case BuiltinStrategy::Ours: return "ours";
        case BuiltinStrategy::Theirs: return "theirs";
        case BuiltinStrategy::Latest: return "latest";
        case BuiltinStrategy::Manual: return "manual";
        default: return "unknown";
    }
}

dvc::Result<ResolutionStrategy> ResolutionStrategy::parse(const std::string& token) {
    for (auto builtin : {BuiltinStrategy::Ours, BuiltinStrategy::Theirs,
                         BuiltinStrategy::Latest, BuiltinStrategy::Manual}) {
        if (token == to_string(builtin)) {
            return dvc::Ok(ResolutionStrategy(builtin));
        }
    }
    return dvc::Err<ResolutionStrategy>(errors::unknown_strategy(token));
}

Resolution ResolutionStrategy::apply(const ConflictInfo& conflict) const {
    if (const auto* builtin = std::get_if<BuiltinStrategy>(&impl_)) {
        return apply_builtin(*builtin, conflict);
    }

    Resolution resolution = std::get<ResolverFn>(impl_)(conflict);
    if (resolution.strategy.empty()) {
        resolution.strategy = kCustomLabel;
    }
    if (resolution.requires_manual_resolution) {
        resolution.resolved_value.reset();
    }
    if (!resolution.conflict.has_value()) {
        resolution.conflict = conflict;
    }
    return resolution;
}

Resolution resolve_conflict(const ConflictInfo& conflict, const ResolutionStrategy& strategy) {
    return strategy.apply(conflict);
}

dvc::Result<Resolution> resolve_conflict(const ConflictInfo& conflict, const std::string& token) {
    auto strategy = ResolutionStrategy::parse(token);
    if (strategy.is_error()) {
        return dvc::Err<Resolution>(strategy.error());
    }
    return dvc::Ok(strategy.value().apply(conflict));
}

std::vector<Resolution> resolve_all_conflicts(const std::vector<ConflictInfo>& conflicts,
                                              const ResolutionStrategy& strategy) {
    std::vector<Resolution> resolutions;
    resolutions.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        resolutions.push_back(strategy.apply(conflict));
    }
    return resolutions;
}

std::vector<Resolution> resolve_conflicts_by_type(const std::vector<ConflictInfo>& conflicts,
                                                  const std::map<ConflictType, ResolutionStrategy>& strategies,
                                                  const ResolutionStrategy& default_strategy) {
    std::vector<Resolution> resolutions;
    resolutions.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        auto it = strategies.find(conflict.type);
        const auto& strategy = it != strategies.end() ? it->second : default_strategy;
        resolutions.push_back(strategy.apply(conflict));
    }
    return resolutions;
}

bool all_resolutions_complete(const std::vector<Resolution>& resolutions) {
    return std::none_of(resolutions.begin(), resolutions.end(),
                        [](const Resolution& r) { return r.requires_manual_resolution; });
}

std::vector<Resolution> get_unresolved_conflicts(const std::vector<Resolution>& resolutions) {
    std::vector<Resolution> unresolved;
    std::copy_if(resolutions.begin(), resolutions.end(), std::back_inserter(unresolved),
                 [](const Resolution& r) { return r.requires_manual_resolution; });
    return unresolved;
}

Resolution apply_manual_resolution(const Resolution& resolution, OptionalValue value) {
    Resolution updated = resolution;
    updated.resolved_value = std::move(value);
    updated.strategy = kManualResolvedLabel;
    updated.requires_manual_resolution = false;
    updated.explanation = "Manually resolved";
    if (resolution.conflict.has_value()) {
        updated.explanation += " " + location_of(*resolution.conflict);
    }
    return updated;
}

ResolutionStrategy fallback_strategy(std::vector<ResolutionStrategy> strategies) {
    return ResolverFn([strategies = std::move(strategies)](const ConflictInfo& conflict) {
        std::optional<Resolution> last;
        for (const auto& strategy : strategies) {
            last = strategy.apply(conflict);
            if (!last->requires_manual_resolution) {
                return *last;
            }
        }
        if (last.has_value()) {
            return *last;
        }
        return needs_manual(conflict, "manual", "No fallback strategy resolved " + location_of(conflict));
    });
}

ResolutionStrategy field_based_strategy(std::map<std::string, ResolutionStrategy> by_field,
                                        ResolutionStrategy default_strategy) {
    return ResolverFn([by_field = std::move(by_field),
                       default_strategy = std::move(default_strategy)](const ConflictInfo& conflict) {
        if (conflict.field.has_value()) {
            auto it = by_field.find(*conflict.field);
            if (it != by_field.end()) {
                return it->second.apply(conflict);
            }
        }
        return default_strategy.apply(conflict);
    });
}

ResolutionStrategy preference_strategy(PreferenceFn prefer_ours) {
    return ResolverFn([prefer_ours = std::move(prefer_ours)](const ConflictInfo& conflict) {
        const bool ours = prefer_ours(conflict.our_value, conflict.their_value);
        return picked(conflict,
                      ours ? conflict.our_value : conflict.their_value,
                      "preference",
                      std::string("Preferred ") + (ours ? "our" : "their") + " value for " + location_of(conflict));
    });
}

ResolutionStrategy non_null_strategy() {
    return ResolverFn([](const ConflictInfo& conflict) {
        const bool ours_nullish = is_nullish(conflict.our_value);
        const bool theirs_nullish = is_nullish(conflict.their_value);
        const bool take_theirs = ours_nullish && !theirs_nullish;
        return picked(conflict,
                      take_theirs ? conflict.their_value : conflict.our_value,
                      "non-null",
                      std::string("Chose ") + (take_theirs ? "their" : "our") + " value for " + location_of(conflict));
    });
}

ResolutionStrategy concatenate_strategy(std::string separator) {
    return ResolverFn([separator = std::move(separator)](const ConflictInfo& conflict) {
        const auto& ours = conflict.our_value;
        const auto& theirs = conflict.their_value;
        if (!ours.has_value() || !theirs.has_value() || !ours->is_string() || !theirs->is_string()) {
            return needs_manual(conflict, "concatenate",
                                "Cannot concatenate non-string values for " + location_of(conflict));
        }
        return picked(conflict,
                      Value(ours->get<std::string>() + separator + theirs->get<std::string>()),
                      "concatenate",
                      "Concatenated both values for " + location_of(conflict));
    });
}

ResolutionStrategy array_merge_strategy() {
    return ResolverFn([](const ConflictInfo& conflict) {
        const auto& ours = conflict.our_value;
        const auto& theirs = conflict.their_value;
        if (!ours.has_value() || !theirs.has_value() || !ours->is_array() || !theirs->is_array()) {
            return needs_manual(conflict, "array-merge",
                                "Cannot merge non-array values for " + location_of(conflict));
        }

        Value merged = *ours;
        for (const auto& item : *theirs) {
            if (std::find(merged.begin(), merged.end(), item) == merged.end()) {
                merged.push_back(item);
            }
        }
        return picked(conflict, std::move(merged), "array-merge",
                      "Merged array elements for " + location_of(conflict));
    });
}

} // namespace dvc::sync
