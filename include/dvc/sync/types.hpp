#pragma once

#include "dvc/core/value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dvc::sync {

enum class EventOp {
    Create,
    Update,
    Delete,
    RelCreate,
    RelDelete
};

/**
 * @brief Update operators that produced an after-state
 *
 * operator name ("$inc", "$set", ...) -> field -> payload
 */
using FieldPayloads = std::map<std::string, Value>;
using UpdateOps = std::map<std::string, FieldPayloads>;

/**
 * @brief Immutable record of one entity change, produced by the event log
 */
struct Event {
    std::string id;                  ///< Sortable unique id (ULID-like)
    std::int64_t ts = 0;             ///< Milliseconds since epoch
    EventOp op = EventOp::Create;
    std::string target;              ///< "<namespace>:<localId>", e.g. "posts:p1"
    OptionalValue before;
    OptionalValue after;
    std::string actor;
    OptionalValue metadata;
    std::optional<UpdateOps> ops;    ///< Operator provenance for commutativity analysis
};

enum class ConflictType {
    ConcurrentUpdate,
    DeleteUpdate,
    CreateCreate
};

/**
 * @brief A genuine divergence between the two sides' latest state of one target
 *
 * field is only set for ConcurrentUpdate; the other types compare whole entities.
 */
struct ConflictInfo {
    ConflictType type = ConflictType::ConcurrentUpdate;
    std::string target;
    std::optional<std::string> field;
    OptionalValue our_value;
    OptionalValue their_value;
    OptionalValue base_value;
    Event our_event;
    Event their_event;
    std::optional<bool> resolved;    ///< Set by merge_event_streams when a strategy ran
};

const char* to_string(EventOp op) noexcept;
std::optional<EventOp> event_op_from_string(const std::string& text);

const char* to_string(ConflictType type) noexcept;
std::optional<ConflictType> conflict_type_from_string(const std::string& text);

bool is_create_event(const Event& event) noexcept;
bool is_update_event(const Event& event) noexcept;
bool is_delete_event(const Event& event) noexcept;

/// Namespace part of a target ("posts" for "posts:p1"); whole target when there is no ':'
std::string target_namespace(const std::string& target);

} // namespace dvc::sync
