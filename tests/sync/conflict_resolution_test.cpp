#include "dvc/sync/resolution.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using dvc::ErrorCode;
using dvc::OptionalValue;
using dvc::Value;
using dvc::sync::BuiltinStrategy;
using dvc::sync::ConflictInfo;
using dvc::sync::ConflictType;
using dvc::sync::Resolution;
using dvc::sync::ResolutionStrategy;
using dvc::sync::ResolverFn;

namespace {

ConflictInfo make_conflict(OptionalValue ours, OptionalValue theirs,
                           std::int64_t our_ts = 1000, std::int64_t their_ts = 1100,
                           std::optional<std::string> field = std::string("title"),
                           ConflictType type = ConflictType::ConcurrentUpdate) {
    ConflictInfo conflict;
    conflict.type = type;
    conflict.target = "posts:p1";
    conflict.field = std::move(field);
    conflict.our_value = std::move(ours);
    conflict.their_value = std::move(theirs);
    conflict.base_value = Value("Original");
    conflict.our_event.id = "ours";
    conflict.our_event.ts = our_ts;
    conflict.their_event.id = "theirs";
    conflict.their_event.ts = their_ts;
    return conflict;
}

ConflictInfo title_conflict() {
    return make_conflict(Value("Our Title"), Value("Their Title"));
}

} // namespace

TEST(ConflictResolutionTest, BuiltinStrategies) {
    auto conflict = title_conflict();

    auto ours = dvc::sync::resolve_conflict(conflict, BuiltinStrategy::Ours);
    EXPECT_EQ(ours.resolved_value, OptionalValue(Value("Our Title")));
    EXPECT_EQ(ours.strategy, "ours");
    EXPECT_FALSE(ours.requires_manual_resolution);

    auto theirs = dvc::sync::resolve_conflict(conflict, BuiltinStrategy::Theirs);
    EXPECT_EQ(theirs.resolved_value, OptionalValue(Value("Their Title")));
    EXPECT_EQ(theirs.strategy, "theirs");

    auto latest = dvc::sync::resolve_conflict(conflict, BuiltinStrategy::Latest);
    EXPECT_EQ(latest.resolved_value, OptionalValue(Value("Their Title")));
    EXPECT_EQ(latest.strategy, "latest");
}

TEST(ConflictResolutionTest, LatestTieKeepsOurs) {
    auto conflict = make_conflict(Value("A"), Value("B"), 500, 500);
    auto resolution = dvc::sync::resolve_conflict(conflict, BuiltinStrategy::Latest);
    EXPECT_EQ(resolution.resolved_value, OptionalValue(Value("A")));

    auto newer_ours = make_conflict(Value("A"), Value("B"), 600, 500);
    EXPECT_EQ(dvc::sync::resolve_conflict(newer_ours, BuiltinStrategy::Latest).resolved_value,
              OptionalValue(Value("A")));
}

TEST(ConflictResolutionTest, LatestExplanationNamesBothTimestamps) {
    auto resolution = dvc::sync::resolve_conflict(title_conflict(), BuiltinStrategy::Latest);
    EXPECT_NE(resolution.explanation.find("1000"), std::string::npos) << resolution.explanation;
    EXPECT_NE(resolution.explanation.find("1100"), std::string::npos) << resolution.explanation;
}

TEST(ConflictResolutionTest, ManualLeavesValueUnset) {
    auto resolution = dvc::sync::resolve_conflict(title_conflict(), BuiltinStrategy::Manual);
    EXPECT_TRUE(resolution.requires_manual_resolution);
    EXPECT_FALSE(resolution.resolved_value.has_value());
    EXPECT_EQ(resolution.strategy, "manual");
    ASSERT_TRUE(resolution.conflict.has_value());
    EXPECT_EQ(resolution.conflict->target, "posts:p1");
    EXPECT_NE(resolution.explanation.find("manual resolution"), std::string::npos);
    EXPECT_NE(resolution.explanation.find("title"), std::string::npos);

    auto whole = make_conflict(std::nullopt, Value{{"title", "x"}}, 1, 2, std::nullopt, ConflictType::DeleteUpdate);
    auto whole_resolution = dvc::sync::resolve_conflict(whole, BuiltinStrategy::Manual);
    EXPECT_NE(whole_resolution.explanation.find("posts:p1"), std::string::npos);
}

TEST(ConflictResolutionTest, TokenForm) {
    auto resolved = dvc::sync::resolve_conflict(title_conflict(), std::string("latest"));
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().resolved_value, OptionalValue(Value("Their Title")));

    auto ours = dvc::sync::resolve_conflict(title_conflict(), std::string("ours"));
    ASSERT_TRUE(ours.is_ok());
    EXPECT_EQ(ours.value().resolved_value, OptionalValue(Value("Our Title")));

    auto unknown = dvc::sync::resolve_conflict(title_conflict(), std::string("newest"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownStrategy);
    EXPECT_EQ(unknown.error().message, "Unknown resolution strategy: newest");
}

TEST(ConflictResolutionTest, ParseStrategyTokens) {
    EXPECT_TRUE(ResolutionStrategy::parse("manual").is_ok());
    EXPECT_TRUE(ResolutionStrategy::parse("manual").value().is_builtin());
    EXPECT_TRUE(ResolutionStrategy::parse("Ours").is_error());
    EXPECT_TRUE(ResolutionStrategy::parse("").is_error());
}

TEST(ConflictResolutionTest, CustomResolverDefaultsToCustomLabel) {
    ResolutionStrategy custom = ResolverFn([](const ConflictInfo&) {
        Resolution resolution;
        resolution.resolved_value = Value("merged");
        return resolution;
    });
    EXPECT_FALSE(custom.is_builtin());

    auto resolution = dvc::sync::resolve_conflict(title_conflict(), custom);
    EXPECT_EQ(resolution.strategy, "custom");
    EXPECT_EQ(resolution.resolved_value, OptionalValue(Value("merged")));
    ASSERT_TRUE(resolution.conflict.has_value());

    ResolutionStrategy labelled = ResolverFn([](const ConflictInfo& c) {
        Resolution resolution;
        resolution.resolved_value = c.our_value;
        resolution.strategy = "mine";
        return resolution;
    });
    EXPECT_EQ(dvc::sync::resolve_conflict(title_conflict(), labelled).strategy, "mine");
}

TEST(ConflictResolutionTest, ResolveAllPreservesOrder) {
    std::vector<ConflictInfo> conflicts{
        make_conflict(Value("A"), Value("B")),
        make_conflict(Value("draft"), Value("published"))
    };

    auto resolutions = dvc::sync::resolve_all_conflicts(conflicts, BuiltinStrategy::Theirs);
    ASSERT_EQ(resolutions.size(), 2u);
    EXPECT_EQ(resolutions[0].resolved_value, OptionalValue(Value("B")));
    EXPECT_EQ(resolutions[1].resolved_value, OptionalValue(Value("published")));
    EXPECT_TRUE(dvc::sync::all_resolutions_complete(resolutions));
}

TEST(ConflictResolutionTest, ResolveByType) {
    std::vector<ConflictInfo> conflicts{
        make_conflict(Value("Our Title"), Value("Their Title")),
        make_conflict(std::nullopt, Value{{"title", "x"}}, 1000, 1100, std::nullopt, ConflictType::DeleteUpdate),
        make_conflict(Value{{"name", "a"}}, Value{{"name", "b"}}, 1000, 1100, std::nullopt, ConflictType::CreateCreate)
    };
    std::map<ConflictType, ResolutionStrategy> strategies{
        {ConflictType::ConcurrentUpdate, BuiltinStrategy::Latest},
        {ConflictType::DeleteUpdate, BuiltinStrategy::Ours}
    };

    auto resolutions = dvc::sync::resolve_conflicts_by_type(conflicts, strategies);
    ASSERT_EQ(resolutions.size(), 3u);
    EXPECT_EQ(resolutions[0].resolved_value, OptionalValue(Value("Their Title")));
    EXPECT_EQ(resolutions[1].strategy, "ours");
    EXPECT_FALSE(resolutions[1].resolved_value.has_value());
    EXPECT_FALSE(resolutions[1].requires_manual_resolution);
    EXPECT_TRUE(resolutions[2].requires_manual_resolution);

    EXPECT_FALSE(dvc::sync::all_resolutions_complete(resolutions));
    auto pending = dvc::sync::get_unresolved_conflicts(resolutions);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].conflict->type, ConflictType::CreateCreate);
}

TEST(ConflictResolutionTest, ApplyManualResolution) {
    auto pending = dvc::sync::resolve_conflict(title_conflict(), BuiltinStrategy::Manual);
    auto resolved = dvc::sync::apply_manual_resolution(pending, Value("Hand Picked"));

    EXPECT_EQ(resolved.resolved_value, OptionalValue(Value("Hand Picked")));
    EXPECT_EQ(resolved.strategy, "manual-resolved");
    EXPECT_FALSE(resolved.requires_manual_resolution);
    EXPECT_NE(resolved.explanation.find("Manually resolved"), std::string::npos);
    ASSERT_TRUE(resolved.conflict.has_value());
    EXPECT_TRUE(dvc::sync::all_resolutions_complete({resolved}));
}

TEST(ConflictResolutionTest, FallbackReturnsFirstDecisive) {
    auto strategy = dvc::sync::fallback_strategy({
        BuiltinStrategy::Manual,
        dvc::sync::concatenate_strategy(" / "),
        BuiltinStrategy::Theirs
    });

    auto text = dvc::sync::resolve_conflict(title_conflict(), strategy);
    EXPECT_EQ(text.resolved_value, OptionalValue(Value("Our Title / Their Title")));
    EXPECT_EQ(text.strategy, "concatenate");

    auto numbers = dvc::sync::resolve_conflict(make_conflict(Value(1), Value(2)), strategy);
    EXPECT_EQ(numbers.resolved_value, OptionalValue(Value(2)));
    EXPECT_EQ(numbers.strategy, "theirs");
}

TEST(ConflictResolutionTest, FallbackReturnsLastWhenAllManual) {
    auto strategy = dvc::sync::fallback_strategy({
        dvc::sync::concatenate_strategy(),
        dvc::sync::array_merge_strategy()
    });
    auto resolution = dvc::sync::resolve_conflict(make_conflict(Value(1), Value(2)), strategy);
    EXPECT_TRUE(resolution.requires_manual_resolution);
    EXPECT_EQ(resolution.strategy, "array-merge");

    auto empty = dvc::sync::resolve_conflict(title_conflict(), dvc::sync::fallback_strategy({}));
    EXPECT_TRUE(empty.requires_manual_resolution);
}

TEST(ConflictResolutionTest, FieldBasedDispatch) {
    auto strategy = dvc::sync::field_based_strategy({
        {"title", BuiltinStrategy::Latest},
        {"status", BuiltinStrategy::Ours}
    });

    auto title = dvc::sync::resolve_conflict(title_conflict(), strategy);
    EXPECT_EQ(title.resolved_value, OptionalValue(Value("Their Title")));

    auto status = dvc::sync::resolve_conflict(
        make_conflict(Value("published"), Value("draft"), 1000, 1100, std::string("status")), strategy);
    EXPECT_EQ(status.resolved_value, OptionalValue(Value("published")));

    auto body = dvc::sync::resolve_conflict(
        make_conflict(Value("x"), Value("y"), 1000, 1100, std::string("body")), strategy);
    EXPECT_TRUE(body.requires_manual_resolution);

    auto with_default = dvc::sync::field_based_strategy({}, BuiltinStrategy::Theirs);
    EXPECT_EQ(dvc::sync::resolve_conflict(title_conflict(), with_default).resolved_value,
              OptionalValue(Value("Their Title")));
}

TEST(ConflictResolutionTest, PreferenceStrategy) {
    auto longer = dvc::sync::preference_strategy([](const OptionalValue& ours, const OptionalValue& theirs) {
        return ours->get<std::string>().size() >= theirs->get<std::string>().size();
    });

    auto resolution = dvc::sync::resolve_conflict(make_conflict(Value("short"), Value("much longer")), longer);
    EXPECT_EQ(resolution.resolved_value, OptionalValue(Value("much longer")));
    EXPECT_EQ(resolution.strategy, "preference");
}

TEST(ConflictResolutionTest, NonNullStrategy) {
    auto strategy = dvc::sync::non_null_strategy();

    EXPECT_EQ(dvc::sync::resolve_conflict(make_conflict(Value(nullptr), Value("x")), strategy).resolved_value,
              OptionalValue(Value("x")));
    EXPECT_EQ(dvc::sync::resolve_conflict(make_conflict(std::nullopt, Value("x")), strategy).resolved_value,
              OptionalValue(Value("x")));
    EXPECT_EQ(dvc::sync::resolve_conflict(make_conflict(Value("y"), Value(nullptr)), strategy).resolved_value,
              OptionalValue(Value("y")));
    EXPECT_EQ(dvc::sync::resolve_conflict(make_conflict(Value("y"), Value("x")), strategy).resolved_value,
              OptionalValue(Value("y")));

    auto both_null = dvc::sync::resolve_conflict(make_conflict(Value(nullptr), std::nullopt), strategy);
    EXPECT_FALSE(both_null.requires_manual_resolution);
    EXPECT_EQ(both_null.resolved_value, OptionalValue(Value(nullptr)));
}

TEST(ConflictResolutionTest, ConcatenateStrategy) {
    auto resolution = dvc::sync::resolve_conflict(title_conflict(), dvc::sync::concatenate_strategy());
    EXPECT_EQ(resolution.resolved_value, OptionalValue(Value("Our Title Their Title")));
    EXPECT_EQ(resolution.strategy, "concatenate");

    auto mixed = dvc::sync::resolve_conflict(make_conflict(Value("a"), Value(2)), dvc::sync::concatenate_strategy("-"));
    EXPECT_TRUE(mixed.requires_manual_resolution);
    EXPECT_FALSE(mixed.resolved_value.has_value());
}

TEST(ConflictResolutionTest, ArrayMergeStrategy) {
    auto conflict = make_conflict(Value{"tech", "nodejs"}, Value{"tech", "typescript", "web"});
    auto resolution = dvc::sync::resolve_conflict(conflict, dvc::sync::array_merge_strategy());

    EXPECT_EQ(resolution.resolved_value, OptionalValue(Value{"tech", "nodejs", "typescript", "web"}));
    EXPECT_EQ(resolution.strategy, "array-merge");

    auto scalar = dvc::sync::resolve_conflict(make_conflict(Value("a"), Value::array({"b"})), dvc::sync::array_merge_strategy());
    EXPECT_TRUE(scalar.requires_manual_resolution);
}
