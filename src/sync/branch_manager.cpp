#include "dvc/sync/branch_manager.hpp"

#include "dvc/events/events.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

namespace dvc::sync {
namespace {

const std::regex& branch_name_pattern() {
    static const std::regex pattern("^[A-Za-z0-9._-]+(/[A-Za-z0-9._-]+)*$");
    return pattern;
}

bool has_reserved_segment(const std::string& name) {
    std::istringstream segments(name);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "." || segment == "..") {
            return true;
        }
    }
    return false;
}

} // namespace

BranchManager::BranchManager(storage::StorageBackend& storage, events::EventBus* bus)
    : refs_(storage), bus_(bus) {}

bool BranchManager::is_valid_name(const std::string& name) {
    if (name.empty() || name == kHeadRef) {
        return false;
    }
    return std::regex_match(name, branch_name_pattern()) && !has_reserved_segment(name);
}

dvc::Result<void> BranchManager::create(const std::string& name, const CreateBranchOptions& options) {
    if (!is_valid_name(name)) {
        return dvc::Err<void>(errors::invalid_branch_name());
    }
    if (exists(name)) {
        return dvc::Err<void>(errors::branch_already_exists());
    }

    std::string base;
    if (options.from.has_value() && (*options.from == kHeadRef || refs_.ref_exists(*options.from))) {
        auto from = refs_.resolve_ref(*options.from);
        if (from.is_error()) {
            return dvc::Err<void>(from.error());
        }
        base = from.value();
    } else if (options.from.has_value()) {
        base = *options.from;
    } else {
        auto head = refs_.resolve_ref(kHeadRef);
        if (head.is_error()) {
            return dvc::Err<void>(head.error());
        }
        base = head.value();
    }

    if (auto res = refs_.update_ref(name, base); res.is_error()) {
        return res;
    }

    spdlog::info("Created branch {} at {}", name, base);
    publish(events::BranchCreatedEvent{name, base});
    return dvc::Ok();
}

dvc::Result<void> BranchManager::checkout(const std::string& name, const CheckoutOptions& options) {
    if (!exists(name)) {
        if (!options.create) {
            return dvc::Err<void>(errors::branch_not_found());
        }
        if (auto res = create(name); res.is_error()) {
            return res;
        }
    }

    auto previous = current();
    if (previous.is_error()) {
        return dvc::Err<void>(previous.error());
    }

    if (auto res = refs_.set_head(name); res.is_error()) {
        return res;
    }

    spdlog::info("Switched to branch {}", name);
    publish(events::BranchCheckedOutEvent{name, previous.value()});
    return dvc::Ok();
}

dvc::Result<void> BranchManager::remove(const std::string& name, const DeleteBranchOptions& options) {
    if (!exists(name)) {
        return dvc::Err<void>(errors::branch_not_found());
    }

    auto active = current();
    if (active.is_error()) {
        return dvc::Err<void>(active.error());
    }
    const bool is_current = active.value() == name;
    if (is_current && !options.force) {
        return dvc::Err<void>(errors::cannot_delete_current_branch());
    }

    auto commit = refs_.resolve_ref(name);
    if (commit.is_error()) {
        return dvc::Err<void>(commit.error());
    }

    if (auto res = refs_.delete_ref(name); res.is_error()) {
        return res;
    }

    if (is_current) {
        spdlog::warn("Deleted current branch {}; HEAD now points at a missing branch", name);
    } else {
        spdlog::info("Deleted branch {} (was {})", name, commit.value());
    }
    publish(events::BranchDeletedEvent{name, commit.value(), options.force});
    return dvc::Ok();
}

dvc::Result<void> BranchManager::rename(const std::string& old_name, const std::string& new_name) {
    if (!is_valid_name(new_name)) {
        return dvc::Err<void>(errors::invalid_branch_name());
    }
    if (!exists(old_name)) {
        return dvc::Err<void>(errors::branch_not_found());
    }
    if (exists(new_name)) {
        return dvc::Err<void>(errors::branch_already_exists());
    }

    auto commit = refs_.resolve_ref(old_name);
    if (commit.is_error()) {
        return dvc::Err<void>(commit.error());
    }
    auto active = current();
    if (active.is_error()) {
        return dvc::Err<void>(active.error());
    }
    const bool was_current = active.value() == old_name;

    if (auto res = refs_.update_ref(new_name, commit.value()); res.is_error()) {
        return res;
    }
    if (auto res = refs_.delete_ref(old_name); res.is_error()) {
        return res;
    }
    if (was_current) {
        if (auto res = refs_.set_head(new_name); res.is_error()) {
            return res;
        }
    }

    spdlog::info("Renamed branch {} to {}", old_name, new_name);
    publish(events::BranchRenamedEvent{old_name, new_name, was_current});
    return dvc::Ok();
}

dvc::Result<std::vector<Branch>> BranchManager::list() const {
    auto names = refs_.list_refs();
    if (names.is_error()) {
        return dvc::Err<std::vector<Branch>>(names.error());
    }
    auto active = current();
    if (active.is_error()) {
        return dvc::Err<std::vector<Branch>>(active.error());
    }

    std::vector<Branch> branches;
    branches.reserve(names.value().size());
    for (const auto& name : names.value()) {
        auto commit = refs_.resolve_ref(name);
        if (commit.is_error()) {
            return dvc::Err<std::vector<Branch>>(commit.error());
        }
        branches.push_back({name, commit.value(), active.value() == name});
    }
    return dvc::Ok(std::move(branches));
}

dvc::Result<std::optional<std::string>> BranchManager::current() const {
    if (!refs_.ref_exists(kHeadRef)) {
        return dvc::Ok(std::optional<std::string>{});
    }
    auto head = refs_.get_head();
    if (head.is_error()) {
        return dvc::Err<std::optional<std::string>>(head.error());
    }
    if (head.value().is_detached()) {
        return dvc::Ok(std::optional<std::string>{});
    }
    return dvc::Ok(std::optional<std::string>{head.value().ref});
}

bool BranchManager::exists(const std::string& name) const {
    return is_valid_name(name) && refs_.ref_exists(name);
}

} // namespace dvc::sync
