/**
 * @file events.hpp
 * @brief Repository event types
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: BranchCreatedEvent, BranchDeletedEvent.
 * They are emitted after the storage write succeeded.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace dvc::events {

// ════════════════════════════════════════════════════════
// Branch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a new branch ref is written
 *
 * WHO EMITS: BranchManager::create, BranchManager::checkout with create
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct BranchCreatedEvent {
    std::string name;
    std::string commit;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BranchDeletedEvent {
    std::string name;
    std::string commit;     ///< Commit the branch pointed at, for recovery
    bool forced = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BranchRenamedEvent {
    std::string old_name;
    std::string new_name;
    bool was_current = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when HEAD is pointed at a branch
 *
 * previous is empty when HEAD was unset or detached.
 */
struct BranchCheckedOutEvent {
    std::string name;
    std::optional<std::string> previous;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace dvc::events
