#pragma once

/**
 * @file branch_manager.hpp
 * @brief User-facing branch lifecycle over RefManager
 *
 * A branch is a ref under refs/heads/ presented with its "current" status.
 * Branch names are one or more '/'-separated segments of [A-Za-z0-9._-];
 * "HEAD" and "."/".." segments are reserved.
 *
 * EVENTS:
 * When constructed with an EventBus, every successful create, delete,
 * rename and checkout is published after the storage write.
 */

#include "dvc/core/result.hpp"
#include "dvc/events/event_bus.hpp"
#include "dvc/storage/backend.hpp"
#include "dvc/sync/refs.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dvc::sync {

struct Branch {
    std::string name;
    std::string commit;
    bool is_current = false;
};

struct CreateBranchOptions {
    std::optional<std::string> from;    ///< Base commit; HEAD's commit when empty
};

struct CheckoutOptions {
    bool create = false;
};

struct DeleteBranchOptions {
    bool force = false;
};

class BranchManager {
public:
    explicit BranchManager(storage::StorageBackend& storage, events::EventBus* bus = nullptr);

    dvc::Result<void> create(const std::string& name, const CreateBranchOptions& options = {});

    /// BranchNotFound unless the branch exists or options.create is set
    dvc::Result<void> checkout(const std::string& name, const CheckoutOptions& options = {});

    /// CannotDeleteCurrentBranch for the checked-out branch unless forced
    dvc::Result<void> remove(const std::string& name, const DeleteBranchOptions& options = {});

    dvc::Result<void> rename(const std::string& old_name, const std::string& new_name);

    /// Every branch, sorted by name
    dvc::Result<std::vector<Branch>> list() const;

    /// Branch HEAD points at; empty when HEAD is detached or unset
    dvc::Result<std::optional<std::string>> current() const;

    [[nodiscard]] bool exists(const std::string& name) const;

    static bool is_valid_name(const std::string& name);

    RefManager& refs() noexcept { return refs_; }
    const RefManager& refs() const noexcept { return refs_; }

private:
    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    RefManager refs_;
    events::EventBus* bus_;
};

} // namespace dvc::sync
