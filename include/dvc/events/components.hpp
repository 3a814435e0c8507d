/**
 * @file components.hpp
 * @brief Ready-made subscribers for repository events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * BranchManager branches(storage, &bus);
 *
 * Components must not outlive the bus they subscribed to.
 */

#pragma once

#include "dvc/events/event_bus.hpp"
#include "dvc/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dvc::events {

/**
 * @brief Logs every branch event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        created_id_ = bus_.subscribe<BranchCreatedEvent>([](const BranchCreatedEvent& e) {
            spdlog::info("[BranchCreated] name={} commit={}", e.name, e.commit);
        });

        deleted_id_ = bus_.subscribe<BranchDeletedEvent>([](const BranchDeletedEvent& e) {
            spdlog::info("[BranchDeleted] name={} commit={} forced={}", e.name, e.commit, e.forced);
        });

        renamed_id_ = bus_.subscribe<BranchRenamedEvent>([](const BranchRenamedEvent& e) {
            spdlog::info("[BranchRenamed] {} -> {} current={}", e.old_name, e.new_name, e.was_current);
        });

        checkout_id_ = bus_.subscribe<BranchCheckedOutEvent>([](const BranchCheckedOutEvent& e) {
            spdlog::info("[CheckedOut] name={} previous={}", e.name, e.previous.value_or("(none)"));
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<BranchCreatedEvent>(created_id_);
        bus_.unsubscribe<BranchDeletedEvent>(deleted_id_);
        bus_.unsubscribe<BranchRenamedEvent>(renamed_id_);
        bus_.unsubscribe<BranchCheckedOutEvent>(checkout_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    size_t created_id_ = 0;
    size_t deleted_id_ = 0;
    size_t renamed_id_ = 0;
    size_t checkout_id_ = 0;
};

/**
 * @brief Counts branch lifecycle operations
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().branches_created.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> branches_created{0};
        std::atomic<uint64_t> branches_deleted{0};
        std::atomic<uint64_t> forced_deletes{0};
        std::atomic<uint64_t> branches_renamed{0};
        std::atomic<uint64_t> checkouts{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        created_id_ = bus_.subscribe<BranchCreatedEvent>([this](const BranchCreatedEvent&) {
            stats_.branches_created++;
        });

        deleted_id_ = bus_.subscribe<BranchDeletedEvent>([this](const BranchDeletedEvent& e) {
            stats_.branches_deleted++;
            if (e.forced) {
                stats_.forced_deletes++;
            }
        });

        renamed_id_ = bus_.subscribe<BranchRenamedEvent>([this](const BranchRenamedEvent&) {
            stats_.branches_renamed++;
        });

        checkout_id_ = bus_.subscribe<BranchCheckedOutEvent>([this](const BranchCheckedOutEvent&) {
            stats_.checkouts++;
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<BranchCreatedEvent>(created_id_);
        bus_.unsubscribe<BranchDeletedEvent>(deleted_id_);
        bus_.unsubscribe<BranchRenamedEvent>(renamed_id_);
        bus_.unsubscribe<BranchCheckedOutEvent>(checkout_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Branch Statistics:");
        spdlog::info("  Created:   {}", stats_.branches_created.load());
        spdlog::info("  Deleted:   {} ({} forced)", stats_.branches_deleted.load(), stats_.forced_deletes.load());
        spdlog::info("  Renamed:   {}", stats_.branches_renamed.load());
        spdlog::info("  Checkouts: {}", stats_.checkouts.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    size_t created_id_ = 0;
    size_t deleted_id_ = 0;
    size_t renamed_id_ = 0;
    size_t checkout_id_ = 0;
};

} // namespace dvc::events
