#include "dvc/sync/serialization.hpp"

#include "dvc/sync/commutative.hpp"

#include <stdexcept>

namespace dvc::sync {
namespace {

constexpr const char* kOpsKey = "_ops";

void put_optional(Value& j, const char* key, const OptionalValue& value) {
    if (value.has_value()) {
        j[key] = *value;
    }
}

OptionalValue get_optional(const Value& j, const char* key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    return j.at(key);
}

template<typename T>
T get_or(const Value& j, const char* key, T fallback) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return fallback;
    }
    return j.at(key).get<T>();
}

} // namespace

// ════════════════════════════════════════════════════════
// Event
// ════════════════════════════════════════════════════════

void to_json(Value& j, const Event& event) {
    j = Value{
        {"id", event.id},
        {"ts", event.ts},
        {"op", to_string(event.op)},
        {"target", event.target},
        {"actor", event.actor}
    };
    put_optional(j, "before", event.before);
    put_optional(j, "after", event.after);
    put_optional(j, "metadata", event.metadata);

    const bool ops_embedded = event.after.has_value() && event.after->is_object() &&
                              event.after->contains(kOpsKey);
    if (event.ops.has_value() && !ops_embedded) {
        j["ops"] = update_ops_to_value(*event.ops);
    }
}

void from_json(const Value& j, Event& event) {
    event.id = get_or<std::string>(j, "id", "");
    event.ts = j.at("ts").get<std::int64_t>();

    const auto op_text = j.at("op").get<std::string>();
    auto op = event_op_from_string(op_text);
    if (!op) {
        throw std::invalid_argument("Unknown event op: " + op_text);
    }
    event.op = *op;

    event.target = j.at("target").get<std::string>();
    event.actor = get_or<std::string>(j, "actor", "");
    event.before = get_optional(j, "before");
    event.after = get_optional(j, "after");
    event.metadata = get_optional(j, "metadata");

    event.ops.reset();
    if (j.contains("ops")) {
        event.ops = update_ops_from_value(j.at("ops"));
    } else if (event.after.has_value() && event.after->is_object() && event.after->contains(kOpsKey)) {
        event.ops = extract_operations(event.after);
    }
}

// ════════════════════════════════════════════════════════
// Conflicts and resolutions
// ════════════════════════════════════════════════════════

void to_json(Value& j, const ConflictInfo& conflict) {
    j = Value{
        {"type", to_string(conflict.type)},
        {"target", conflict.target},
        {"ourEvent", conflict.our_event},
        {"theirEvent", conflict.their_event}
    };
    if (conflict.field.has_value()) {
        j["field"] = *conflict.field;
    }
    put_optional(j, "ourValue", conflict.our_value);
    put_optional(j, "theirValue", conflict.their_value);
    put_optional(j, "baseValue", conflict.base_value);
    if (conflict.resolved.has_value()) {
        j["resolved"] = *conflict.resolved;
    }
}

void from_json(const Value& j, ConflictInfo& conflict) {
    const auto type_text = j.at("type").get<std::string>();
    auto type = conflict_type_from_string(type_text);
    if (!type) {
        throw std::invalid_argument("Unknown conflict type: " + type_text);
    }
    conflict.type = *type;
    conflict.target = j.at("target").get<std::string>();
    conflict.field.reset();
    if (j.contains("field")) {
        conflict.field = j.at("field").get<std::string>();
    }
    conflict.our_value = get_optional(j, "ourValue");
    conflict.their_value = get_optional(j, "theirValue");
    conflict.base_value = get_optional(j, "baseValue");
    conflict.our_event = j.at("ourEvent").get<Event>();
    conflict.their_event = j.at("theirEvent").get<Event>();
    conflict.resolved.reset();
    if (j.contains("resolved")) {
        conflict.resolved = j.at("resolved").get<bool>();
    }
}

void to_json(Value& j, const Resolution& resolution) {
    j = Value{
        {"strategy", resolution.strategy},
        {"requiresManualResolution", resolution.requires_manual_resolution},
        {"explanation", resolution.explanation}
    };
    put_optional(j, "resolvedValue", resolution.resolved_value);
    if (resolution.conflict.has_value()) {
        j["conflict"] = *resolution.conflict;
    }
}

void from_json(const Value& j, Resolution& resolution) {
    resolution.strategy = j.at("strategy").get<std::string>();
    resolution.requires_manual_resolution = get_or<bool>(j, "requiresManualResolution", false);
    resolution.explanation = get_or<std::string>(j, "explanation", "");
    resolution.resolved_value = get_optional(j, "resolvedValue");
    resolution.conflict.reset();
    if (j.contains("conflict")) {
        resolution.conflict = j.at("conflict").get<ConflictInfo>();
    }
}

// ════════════════════════════════════════════════════════
// Commits
// ════════════════════════════════════════════════════════

void to_json(Value& j, const Commit& commit) {
    j = Value{
        {"hash", commit.hash},
        {"parents", commit.parents},
        {"message", commit.message},
        {"author", commit.author},
        {"timestamp", commit.timestamp},
        {"state", commit.state}
    };
}

void from_json(const Value& j, Commit& commit) {
    commit.hash = j.at("hash").get<std::string>();
    commit.parents = j.at("parents").get<std::vector<std::string>>();
    commit.message = j.at("message").get<std::string>();
    commit.author = j.at("author").get<std::string>();
    commit.timestamp = get_or<std::int64_t>(j, "timestamp", 0);
    commit.state = j.contains("state") ? j.at("state") : Value();
}

// ════════════════════════════════════════════════════════
// Merge state
// ════════════════════════════════════════════════════════

void to_json(Value& j, const MergeConflict& conflict) {
    j = Value{
        {"entityId", conflict.entity_id},
        {"collection", conflict.collection},
        {"fields", conflict.fields},
        {"resolved", conflict.resolved}
    };
    if (conflict.resolution.has_value()) {
        j["resolution"] = *conflict.resolution;
    }
    put_optional(j, "ourValue", conflict.our_value);
    put_optional(j, "theirValue", conflict.their_value);
    put_optional(j, "baseValue", conflict.base_value);
}

void from_json(const Value& j, MergeConflict& conflict) {
    conflict.entity_id = j.at("entityId").get<std::string>();
    conflict.collection = get_or<std::string>(j, "collection", "");
    conflict.fields = get_or<std::vector<std::string>>(j, "fields", {});
    conflict.resolved = get_or<bool>(j, "resolved", false);
    conflict.resolution.reset();
    if (j.contains("resolution")) {
        conflict.resolution = j.at("resolution").get<std::string>();
    }
    conflict.our_value = get_optional(j, "ourValue");
    conflict.their_value = get_optional(j, "theirValue");
    conflict.base_value = get_optional(j, "baseValue");
}

void to_json(Value& j, const MergeState& state) {
    j = Value{
        {"source", state.source},
        {"target", state.target},
        {"baseCommit", state.base_commit},
        {"sourceCommit", state.source_commit},
        {"targetCommit", state.target_commit},
        {"strategy", state.strategy},
        {"status", to_string(state.status)},
        {"startedAt", state.started_at},
        {"conflicts", state.conflicts}
    };
}

void from_json(const Value& j, MergeState& state) {
    state.source = j.at("source").get<std::string>();
    state.target = j.at("target").get<std::string>();
    state.base_commit = get_or<std::string>(j, "baseCommit", "");
    state.source_commit = get_or<std::string>(j, "sourceCommit", "");
    state.target_commit = get_or<std::string>(j, "targetCommit", "");
    state.strategy = get_or<std::string>(j, "strategy", "manual");

    const auto status_text = j.at("status").get<std::string>();
    auto status = merge_status_from_string(status_text);
    if (!status) {
        throw std::invalid_argument("Unknown merge status: " + status_text);
    }
    state.status = *status;
    state.started_at = get_or<std::int64_t>(j, "startedAt", 0);
    state.conflicts = get_or<std::vector<MergeConflict>>(j, "conflicts", {});
}

} // namespace dvc::sync
