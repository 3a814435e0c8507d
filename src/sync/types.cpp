#include "dvc/sync/types.hpp"

namespace dvc::sync {

const char* to_string(EventOp op) noexcept {
    switch (op) {
        case EventOp::Create: return "CREATE";
        case EventOp::Update: return "UPDATE";
        case EventOp::Delete: return "DELETE";
        case EventOp::RelCreate: return "REL_CREATE";
        case EventOp::RelDelete: return "REL_DELETE";
        default: return "UNKNOWN";
    }
}

std::optional<EventOp> event_op_from_string(const std::string& text) {
    if (text == "CREATE") return EventOp::Create;
    if (text == "UPDATE") return EventOp::Update;
    if (text == "DELETE") return EventOp::Delete;
    if (text == "REL_CREATE") return EventOp::RelCreate;
    if (text == "REL_DELETE") return EventOp::RelDelete;
    return std::nullopt;
}

const char* to_string(ConflictType type) noexcept {
    switch (type) {
        case ConflictType::ConcurrentUpdate: return "concurrent_update";
        case ConflictType::DeleteUpdate: return "delete_update";
        case ConflictType::CreateCreate: return "create_create";
        default: return "unknown";
    }
}

std::optional<ConflictType> conflict_type_from_string(const std::string& text) {
    if (text == "concurrent_update") return ConflictType::ConcurrentUpdate;
    if (text == "delete_update") return ConflictType::DeleteUpdate;
    if (text == "create_create") return ConflictType::CreateCreate;
    return std::nullopt;
}

bool is_create_event(const Event& event) noexcept {
    return event.op == EventOp::Create || event.op == EventOp::RelCreate;
}

bool is_update_event(const Event& event) noexcept {
    return event.op == EventOp::Update;
}

bool is_delete_event(const Event& event) noexcept {
    return event.op == EventOp::Delete || event.op == EventOp::RelDelete;
}

std::string target_namespace(const std::string& target) {
    const auto colon = target.find(':');
    return colon == std::string::npos ? target : target.substr(0, colon);
}

} // namespace dvc::sync
