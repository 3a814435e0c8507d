#include "dvc/sync/commutative.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace dvc::sync {
namespace {

constexpr const char* kOpsKey = "_ops";

bool is_accumulative(const std::string& op) {
    return op == "$inc" || op == "$min" || op == "$max" || op == "$addToSet";
}

std::map<std::string, std::set<std::string>> operators_by_field(const UpdateOps& ops) {
    std::map<std::string, std::set<std::string>> result;
    for (const auto& [op, fields] : ops) {
        for (const auto& [field, _] : fields) {
            result[field].insert(op);
        }
    }
    return result;
}

UpdateOps restrict_to_field(const UpdateOps& ops, const std::string& field) {
    UpdateOps result;
    for (const auto& [op, fields] : ops) {
        auto it = fields.find(field);
        if (it != fields.end()) {
            result[op].emplace(field, it->second);
        }
    }
    return result;
}

Value add_numbers(const Value& lhs, const Value& rhs) {
    if (!lhs.is_number() || !rhs.is_number()) {
        return rhs.is_number() ? rhs : lhs;
    }
    if (lhs.is_number_integer() && rhs.is_number_integer()) {
        return lhs.get<std::int64_t>() + rhs.get<std::int64_t>();
    }
    return lhs.get<double>() + rhs.get<double>();
}

std::vector<Value> set_members(const Value& payload) {
    if (payload.is_object() && payload.contains("$each") && payload["$each"].is_array()) {
        return payload["$each"].get<std::vector<Value>>();
    }
    return {payload};
}

Value union_each(const Value& lhs, const Value& rhs) {
    Value merged = Value::array();
    auto append_unique = [&merged](const Value& item) {
        if (std::find(merged.begin(), merged.end(), item) == merged.end()) {
            merged.push_back(item);
        }
    };
    for (const auto& item : set_members(lhs)) {
        append_unique(item);
    }
    for (const auto& item : set_members(rhs)) {
        append_unique(item);
    }
    return Value{{"$each", merged}};
}

FieldPayloads combine_fields(const std::string& op, const FieldPayloads& lhs, const FieldPayloads& rhs) {
    FieldPayloads combined = lhs;
    for (const auto& [field, payload] : rhs) {
        auto it = combined.find(field);
        if (it == combined.end()) {
            combined.emplace(field, payload);
            continue;
        }

        if (op == "$inc") {
            it->second = add_numbers(it->second, payload);
        } else if (op == "$min") {
            if (payload < it->second) {
                it->second = payload;
            }
        } else if (op == "$max") {
            if (it->second < payload) {
                it->second = payload;
            }
        } else if (op == "$addToSet") {
            it->second = union_each(it->second, payload);
        }
        // $set/$unset and anything else: fields are expected to be disjoint, first side kept
    }
    return combined;
}

} // namespace

bool is_commutative(const UpdateOps& a, const UpdateOps& b) {
    const auto lhs = operators_by_field(a);
    const auto rhs = operators_by_field(b);

    for (const auto& [field, ops] : lhs) {
        auto it = rhs.find(field);
        if (it == rhs.end()) {
            continue;
        }

        std::set<std::string> kinds = ops;
        kinds.insert(it->second.begin(), it->second.end());
        if (kinds.size() != 1 || !is_accumulative(*kinds.begin())) {
            return false;
        }
    }
    return true;
}

bool is_commutative_for_field(const UpdateOps& a, const UpdateOps& b, const std::string& field) {
    const auto lhs = restrict_to_field(a, field);
    const auto rhs = restrict_to_field(b, field);
    if (lhs.empty() || rhs.empty()) {
        return false;
    }
    return is_commutative(lhs, rhs);
}

UpdateOps combine_operations(const UpdateOps& a, const UpdateOps& b) {
    UpdateOps combined = a;
    for (const auto& [op, fields] : b) {
        auto it = combined.find(op);
        if (it == combined.end()) {
            combined.emplace(op, fields);
        } else {
            it->second = combine_fields(op, it->second, fields);
        }
    }
    return combined;
}

std::set<std::string> get_affected_fields(const UpdateOps& ops) {
    std::set<std::string> fields;
    for (const auto& [op, payloads] : ops) {
        for (const auto& [field, _] : payloads) {
            fields.insert(field);
        }
    }
    return fields;
}

UpdateOps extract_operations(const OptionalValue& after_state) {
    auto ops = member_of(after_state, kOpsKey);
    if (!ops.has_value()) {
        return {};
    }
    return update_ops_from_value(*ops);
}

UpdateOps event_operations(const Event& event) {
    if (event.ops.has_value()) {
        return *event.ops;
    }
    auto ops = extract_operations(event.after);
    if (!ops.empty()) {
        return ops;
    }
    auto update = member_of(event.metadata, "update");
    return update.has_value() ? update_ops_from_value(*update) : UpdateOps{};
}

UpdateOps update_ops_from_value(const Value& value) {
    UpdateOps ops;
    if (!value.is_object()) {
        return ops;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it.value().is_object()) {
            continue;
        }
        auto& fields = ops[it.key()];
        for (auto field = it.value().begin(); field != it.value().end(); ++field) {
            fields.emplace(field.key(), field.value());
        }
    }
    return ops;
}

Value update_ops_to_value(const UpdateOps& ops) {
    Value out = Value::object();
    for (const auto& [op, fields] : ops) {
        Value payloads = Value::object();
        for (const auto& [field, payload] : fields) {
            payloads[field] = payload;
        }
        out[op] = std::move(payloads);
    }
    return out;
}

} // namespace dvc::sync
