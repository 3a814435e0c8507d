#include "dvc/events/components.hpp"
#include "dvc/events/event_bus.hpp"
#include "dvc/storage/fs_backend.hpp"
#include "dvc/storage/memory_backend.hpp"
#include "dvc/sync/branch_manager.hpp"
#include "dvc/sync/commit.hpp"
#include "dvc/sync/event_merge.hpp"
#include "dvc/sync/merge_state.hpp"
#include "dvc/sync/serialization.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using dvc::sync::BranchManager;
using dvc::sync::Event;
using dvc::sync::MergeOptions;
using dvc::sync::ResolutionStrategy;

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kMainBranch = "main";
constexpr const char* kIncomingBranch = "incoming";

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--data-dir DIR] [--strategy ours|theirs|latest|manual] [--auto-merge] [--verbose]"
              << " <our-events.json> <their-events.json>\n";
}

std::optional<std::vector<Event>> load_events(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open {}", path.string());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return json::parse(buffer.str()).get<std::vector<Event>>();
    } catch (const std::exception& e) {
        spdlog::error("Invalid event file {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

// Root commit on main with HEAD attached, the first time a repository is used
dvc::Result<void> ensure_initialized(dvc::storage::StorageBackend& storage, BranchManager& branches) {
    if (branches.exists(kMainBranch)) {
        return dvc::Ok();
    }

    auto root = dvc::sync::create_commit(json{{"events", 0}}, {"Initial commit", "dvc", {}, std::nullopt});
    if (root.is_error()) {
        return dvc::Err<void>(root.error());
    }
    if (auto res = dvc::sync::save_commit(storage, root.value()); res.is_error()) {
        return res;
    }
    if (auto res = branches.refs().update_ref(kMainBranch, root.value().hash); res.is_error()) {
        return res;
    }
    return branches.checkout(kMainBranch);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> data_dir;
    std::optional<ResolutionStrategy> strategy;
    bool auto_merge = false;
    std::vector<fs::path> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
            data_dir = fs::path(argv[++i]);
        } else if ((arg == "-s" || arg == "--strategy") && i + 1 < argc) {
            auto parsed = ResolutionStrategy::parse(argv[++i]);
            if (parsed.is_error()) {
                spdlog::error("{}", parsed.error().message);
                return 1;
            }
            strategy = parsed.value();
        } else if (arg == "--auto-merge") {
            auto_merge = true;
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            inputs.emplace_back(arg);
        }
    }

    if (inputs.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto ours = load_events(inputs[0]);
    auto theirs = load_events(inputs[1]);
    if (!ours || !theirs) {
        return 1;
    }

    std::unique_ptr<dvc::storage::StorageBackend> storage;
    if (data_dir) {
        storage = std::make_unique<dvc::storage::FileSystemBackend>(*data_dir);
    } else {
        storage = std::make_unique<dvc::storage::MemoryBackend>();
    }

    dvc::events::EventBus event_bus;
    dvc::events::LoggerComponent logger(event_bus);
    dvc::events::MetricsComponent metrics(event_bus);
    BranchManager branches(*storage, &event_bus);

    if (auto res = ensure_initialized(*storage, branches); res.is_error()) {
        spdlog::error("Cannot initialize repository: {}", res.error().message);
        return 1;
    }
    if (!branches.exists(kIncomingBranch)) {
        if (auto res = branches.create(kIncomingBranch); res.is_error()) {
            spdlog::error("{}", res.error().message);
            return 1;
        }
    }

    auto target_commit = branches.refs().resolve_ref(kMainBranch);
    auto source_commit = branches.refs().resolve_ref(kIncomingBranch);
    if (target_commit.is_error() || source_commit.is_error()) {
        spdlog::error("Cannot resolve branches");
        return 1;
    }
    auto base = dvc::sync::find_merge_base(*storage, target_commit.value(), source_commit.value());
    if (base.is_error()) {
        spdlog::error("{}", base.error().message);
        return 1;
    }

    dvc::sync::MergeStateOptions state_options;
    state_options.source = kIncomingBranch;
    state_options.target = kMainBranch;
    state_options.base_commit = base.value().value_or("");
    state_options.source_commit = source_commit.value();
    state_options.target_commit = target_commit.value();
    state_options.strategy = strategy ? "auto" : "manual";

    auto merge_state = dvc::sync::start_merge(*storage, state_options);
    if (merge_state.is_error()) {
        spdlog::error("{}", merge_state.error().message);
        return 1;
    }

    MergeOptions options;
    options.resolution_strategy = strategy;
    options.auto_merge_commutative = auto_merge;
    auto result = dvc::sync::merge_event_streams(*ours, *theirs, options);

    auto state = merge_state.value();
    for (std::size_t i = 0; i < result.conflicts.size(); ++i) {
        state = dvc::sync::add_conflict(state, dvc::sync::merge_conflict_from(result.conflicts[i]));
        if (i < result.resolved.size() && !result.resolved[i].requires_manual_resolution) {
            state = dvc::sync::resolve_merge_conflict(state, result.conflicts[i].target, result.resolved[i].strategy);
        }
    }

    json output;
    output["success"] = result.success;
    output["stats"] = {
        {"fromOurs", result.stats.from_ours},
        {"fromTheirs", result.stats.from_theirs},
        {"entitiesProcessed", result.stats.entities_processed},
        {"entitiesWithConflicts", result.stats.entities_with_conflicts},
        {"autoMerged", result.stats.auto_merged}
    };
    output["conflicts"] = result.conflicts;
    output["resolved"] = result.resolved;
    output["mergedEvents"] = result.merged_events;

    if (!result.success) {
        if (auto res = dvc::sync::save_merge_state(*storage, state); res.is_error()) {
            spdlog::error("{}", res.error().message);
            return 1;
        }
        spdlog::warn("{} conflict(s) need manual resolution; merge state saved",
                     dvc::sync::unresolved_conflicts(state).size());
        std::cout << output.dump(2) << std::endl;
        return 2;
    }

    std::vector<std::string> parents{target_commit.value()};
    if (source_commit.value() != target_commit.value()) {
        parents.push_back(source_commit.value());
    }
    auto merge_commit = dvc::sync::create_commit(
        json{{"events", result.merged_events.size()}},
        {"Merge incoming into main", "dvc", parents, std::nullopt});
    if (merge_commit.is_error()) {
        spdlog::error("{}", merge_commit.error().message);
        return 1;
    }
    if (auto res = dvc::sync::save_commit(*storage, merge_commit.value()); res.is_error()) {
        spdlog::error("{}", res.error().message);
        return 1;
    }
    if (auto res = branches.refs().update_ref(kMainBranch, merge_commit.value().hash); res.is_error()) {
        spdlog::error("{}", res.error().message);
        return 1;
    }
    if (auto res = dvc::sync::clear_merge_state(*storage); res.is_error()) {
        spdlog::error("{}", res.error().message);
        return 1;
    }

    output["commit"] = merge_commit.value();
    std::cout << output.dump(2) << std::endl;
    metrics.print_stats();
    return 0;
}
