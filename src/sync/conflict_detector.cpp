#include "dvc/sync/conflict_detector.hpp"

#include "dvc/sync/commutative.hpp"

#include <set>
#include <unordered_map>

namespace dvc::sync {
namespace {

constexpr const char* kOpsKey = "_ops";

struct LatestEvents {
    std::vector<std::string> order;
    std::unordered_map<std::string, const Event*> by_target;
};

// Latest event per target; on equal timestamps the later one in the stream wins
LatestEvents latest_by_target(const std::vector<Event>& events) {
    LatestEvents latest;
    for (const auto& event : events) {
        auto it = latest.by_target.find(event.target);
        if (it == latest.by_target.end()) {
            latest.order.push_back(event.target);
            latest.by_target.emplace(event.target, &event);
        } else if (event.ts >= it->second->ts) {
            it->second = &event;
        }
    }
    return latest;
}

OptionalValue first_present(const OptionalValue& a, const OptionalValue& b) {
    return a.has_value() ? a : b;
}

ConflictInfo make_conflict(ConflictType type, const Event& ours, const Event& theirs) {
    ConflictInfo conflict;
    conflict.type = type;
    conflict.target = ours.target;
    conflict.our_event = ours;
    conflict.their_event = theirs;
    return conflict;
}

void compare_fields(const Event& ours, const Event& theirs, ConflictAnalysis& analysis) {
    const auto our_state = strip_operations(ours.after);
    const auto their_state = strip_operations(theirs.after);

    const bool both_objects = our_state.has_value() && our_state->is_object() &&
                              their_state.has_value() && their_state->is_object();
    if (!both_objects) {
        if (!values_equal(our_state, their_state)) {
            auto conflict = make_conflict(ConflictType::ConcurrentUpdate, ours, theirs);
            conflict.our_value = our_state;
            conflict.their_value = their_state;
            conflict.base_value = first_present(ours.before, theirs.before);
            analysis.conflicts.push_back(std::move(conflict));
        }
        return;
    }

    std::set<std::string> fields;
    for (auto it = our_state->begin(); it != our_state->end(); ++it) {
        fields.insert(it.key());
    }
    for (auto it = their_state->begin(); it != their_state->end(); ++it) {
        fields.insert(it.key());
    }

    const auto our_ops = event_operations(ours);
    const auto their_ops = event_operations(theirs);

    for (const auto& field : fields) {
        auto our_value = member_of(our_state, field);
        auto their_value = member_of(their_state, field);
        if (values_equal(our_value, their_value)) {
            continue;
        }

        if (!our_ops.empty() && !their_ops.empty() &&
            is_commutative_for_field(our_ops, their_ops, field)) {
            analysis.commutative_fields.push_back({ours.target, field, our_ops, their_ops});
            continue;
        }

        auto conflict = make_conflict(ConflictType::ConcurrentUpdate, ours, theirs);
        conflict.field = field;
        conflict.our_value = std::move(our_value);
        conflict.their_value = std::move(their_value);
        conflict.base_value = first_present(member_of(ours.before, field), member_of(theirs.before, field));
        analysis.conflicts.push_back(std::move(conflict));
    }
}

void classify(const Event& ours, const Event& theirs, ConflictAnalysis& analysis) {
    const bool our_delete = is_delete_event(ours);
    const bool their_delete = is_delete_event(theirs);

    if (our_delete && their_delete) {
        return;
    }

    if (our_delete || their_delete) {
        auto conflict = make_conflict(ConflictType::DeleteUpdate, ours, theirs);
        conflict.our_value = our_delete ? OptionalValue{} : strip_operations(ours.after);
        conflict.their_value = their_delete ? OptionalValue{} : strip_operations(theirs.after);
        conflict.base_value = first_present(ours.before, theirs.before);
        analysis.conflicts.push_back(std::move(conflict));
        return;
    }

    if (is_create_event(ours) && is_create_event(theirs)) {
        auto our_state = strip_operations(ours.after);
        auto their_state = strip_operations(theirs.after);
        if (values_equal(our_state, their_state)) {
            return;
        }
        auto conflict = make_conflict(ConflictType::CreateCreate, ours, theirs);
        conflict.our_value = std::move(our_state);
        conflict.their_value = std::move(their_state);
        conflict.base_value = first_present(ours.before, theirs.before);
        analysis.conflicts.push_back(std::move(conflict));
        return;
    }

    compare_fields(ours, theirs, analysis);
}

} // namespace

std::vector<ConflictInfo> detect_conflicts(const std::vector<Event>& ours,
                                           const std::vector<Event>& theirs) {
    return analyze_conflicts(ours, theirs).conflicts;
}

ConflictAnalysis analyze_conflicts(const std::vector<Event>& ours,
                                   const std::vector<Event>& theirs) {
    ConflictAnalysis analysis;
    if (ours.empty() || theirs.empty()) {
        return analysis;
    }

    const auto our_latest = latest_by_target(ours);
    const auto their_latest = latest_by_target(theirs);

    for (const auto& target : our_latest.order) {
        auto theirs_it = their_latest.by_target.find(target);
        if (theirs_it == their_latest.by_target.end()) {
            continue;
        }
        classify(*our_latest.by_target.at(target), *theirs_it->second, analysis);
    }
    return analysis;
}

OptionalValue strip_operations(const OptionalValue& state) {
    if (!state.has_value() || !state->is_object() || !state->contains(kOpsKey)) {
        return state;
    }
    Value copy = *state;
    copy.erase(kOpsKey);
    return copy;
}

} // namespace dvc::sync
