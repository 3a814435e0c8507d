#include "dvc/sync/merge_state.hpp"

#include "dvc/storage/memory_backend.hpp"

#include <gtest/gtest.h>

#include <string>

using dvc::ErrorCode;
using dvc::OptionalValue;
using dvc::Value;
using dvc::storage::MemoryBackend;
using dvc::sync::ConflictInfo;
using dvc::sync::ConflictType;
using dvc::sync::MergeConflict;
using dvc::sync::MergeState;
using dvc::sync::MergeStateOptions;
using dvc::sync::MergeStatus;

namespace {

MergeStateOptions feature_into_main() {
    MergeStateOptions options;
    options.source = "feature";
    options.target = "main";
    options.base_commit = "base-hash";
    options.source_commit = "source-hash";
    options.target_commit = "target-hash";
    options.started_at = 42;
    return options;
}

MergeConflict name_conflict(const std::string& entity) {
    MergeConflict conflict;
    conflict.entity_id = entity;
    conflict.collection = "users";
    conflict.fields = {"name"};
    conflict.our_value = Value("Our Name");
    conflict.their_value = Value("Their Name");
    conflict.base_value = Value("Original");
    return conflict;
}

} // namespace

TEST(MergeStateTest, CreateStartsInProgress) {
    auto state = dvc::sync::create_merge_state(feature_into_main());
    EXPECT_EQ(state.source, "feature");
    EXPECT_EQ(state.target, "main");
    EXPECT_EQ(state.strategy, "manual");
    EXPECT_EQ(state.status, MergeStatus::InProgress);
    EXPECT_EQ(state.started_at, 42);
    EXPECT_TRUE(state.conflicts.empty());
    EXPECT_TRUE(dvc::sync::all_conflicts_resolved(state));
}

TEST(MergeStateTest, SaveAndLoad) {
    MemoryBackend storage;
    auto state = dvc::sync::add_conflict(dvc::sync::create_merge_state(feature_into_main()), name_conflict("users:u1"));
    ASSERT_TRUE(dvc::sync::save_merge_state(storage, state).is_ok());
    EXPECT_TRUE(storage.exists("MERGE_STATE"));

    auto loaded = dvc::sync::load_merge_state(storage);
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());

    const auto& restored = *loaded.value();
    EXPECT_EQ(restored.source, "feature");
    EXPECT_EQ(restored.base_commit, "base-hash");
    EXPECT_EQ(restored.status, MergeStatus::Conflicted);
    ASSERT_EQ(restored.conflicts.size(), 1u);
    EXPECT_EQ(restored.conflicts[0].their_value, OptionalValue(Value("Their Name")));
    EXPECT_EQ(restored.conflicts[0].fields, std::vector<std::string>{"name"});
}

TEST(MergeStateTest, LoadWithoutMerge) {
    MemoryBackend storage;
    auto loaded = dvc::sync::load_merge_state(storage);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value().has_value());
    EXPECT_FALSE(dvc::sync::has_merge_in_progress(storage));
}

TEST(MergeStateTest, UnreadableRecordIsCorrupt) {
    MemoryBackend storage;
    ASSERT_TRUE(storage.write("MERGE_STATE", "{\"source\": 1").is_ok());

    auto loaded = dvc::sync::load_merge_state(storage);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::CorruptObject);
}

TEST(MergeStateTest, ConflictTracking) {
    auto state = dvc::sync::create_merge_state(feature_into_main());
    state = dvc::sync::add_conflict(state, name_conflict("users:u1"));
    state = dvc::sync::add_conflict(state, name_conflict("users:u2"));

    EXPECT_EQ(state.status, MergeStatus::Conflicted);
    EXPECT_EQ(dvc::sync::unresolved_conflicts(state).size(), 2u);

    state = dvc::sync::resolve_merge_conflict(state, "users:u1", "ours");
    EXPECT_EQ(state.status, MergeStatus::Conflicted);
    EXPECT_EQ(dvc::sync::unresolved_conflicts(state).size(), 1u);
    EXPECT_EQ(state.conflicts[0].resolution, std::optional<std::string>("ours"));

    state = dvc::sync::resolve_merge_conflict(state, "users:u2", "theirs");
    EXPECT_TRUE(dvc::sync::all_conflicts_resolved(state));
    EXPECT_EQ(state.status, MergeStatus::Resolved);
}

TEST(MergeStateTest, ClearAbortsMerge) {
    MemoryBackend storage;
    ASSERT_TRUE(dvc::sync::save_merge_state(storage, dvc::sync::create_merge_state(feature_into_main())).is_ok());
    EXPECT_TRUE(dvc::sync::has_merge_in_progress(storage));

    ASSERT_TRUE(dvc::sync::clear_merge_state(storage).is_ok());
    EXPECT_FALSE(dvc::sync::has_merge_in_progress(storage));
    EXPECT_TRUE(dvc::sync::clear_merge_state(storage).is_ok());
}

TEST(MergeStateTest, OnlyOneMergeAtATime) {
    MemoryBackend storage;
    auto started = dvc::sync::start_merge(storage, feature_into_main());
    ASSERT_TRUE(started.is_ok());
    EXPECT_TRUE(dvc::sync::has_merge_in_progress(storage));

    auto second = dvc::sync::start_merge(storage, feature_into_main());
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::MergeInProgress);
}

TEST(MergeStateTest, ConflictFromDetection) {
    ConflictInfo detected;
    detected.type = ConflictType::ConcurrentUpdate;
    detected.target = "posts:p1";
    detected.field = "title";
    detected.our_value = Value("A");
    detected.their_value = Value("B");

    auto entry = dvc::sync::merge_conflict_from(detected);
    EXPECT_EQ(entry.entity_id, "posts:p1");
    EXPECT_EQ(entry.collection, "posts");
    EXPECT_EQ(entry.fields, std::vector<std::string>{"title"});
    EXPECT_FALSE(entry.resolved);
    EXPECT_EQ(entry.our_value, OptionalValue(Value("A")));
    EXPECT_FALSE(entry.base_value.has_value());
}

TEST(MergeStateTest, StatusNames) {
    EXPECT_STREQ(dvc::sync::to_string(MergeStatus::InProgress), "in_progress");
    EXPECT_EQ(dvc::sync::merge_status_from_string("conflicted"), MergeStatus::Conflicted);
    EXPECT_FALSE(dvc::sync::merge_status_from_string("done").has_value());
}
