#include "dvc/sync/refs.hpp"

#include <spdlog/spdlog.h>

namespace dvc::sync {
namespace {

constexpr const char* kRefsPrefix = "refs/heads/";
constexpr const char* kSymbolicPrefix = "ref: ";

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

RefManager::RefManager(storage::StorageBackend& storage)
    : storage_(storage) {}

std::string RefManager::ref_key(const std::string& name) {
    return kRefsPrefix + name;
}

dvc::Result<void> RefManager::set_head(const std::string& branch) {
    spdlog::debug("HEAD -> {}", branch);
    return storage_.write(kHeadRef, kSymbolicPrefix + branch + "\n");
}

dvc::Result<void> RefManager::detach_head(const std::string& hash) {
    spdlog::debug("HEAD detached at {}", hash);
    return storage_.write(kHeadRef, hash + "\n");
}

dvc::Result<HeadState> RefManager::get_head() const {
    auto content = read_pointer(kHeadRef, kHeadRef);
    if (content.is_error()) {
        return dvc::Err<HeadState>(content.error());
    }

    HeadState head;
    if (starts_with(content.value(), kSymbolicPrefix)) {
        head.kind = HeadState::Kind::Symbolic;
        head.ref = content.value().substr(std::string(kSymbolicPrefix).size());
    } else {
        head.kind = HeadState::Kind::Detached;
        head.ref = content.value();
    }
    return dvc::Ok(std::move(head));
}

dvc::Result<void> RefManager::update_ref(const std::string& name, const std::string& hash) {
    if (name == kHeadRef) {
        return detach_head(hash);
    }
    spdlog::debug("{} -> {}", name, hash);
    return storage_.write(ref_key(name), hash + "\n");
}

dvc::Result<std::string> RefManager::resolve_ref(const std::string& name) const {
    if (name != kHeadRef) {
        return read_pointer(ref_key(name), name);
    }

    auto head = get_head();
    if (head.is_error()) {
        return dvc::Err<std::string>(head.error());
    }
    if (head.value().is_detached()) {
        return dvc::Ok(head.value().ref);
    }
    return read_pointer(ref_key(head.value().ref), head.value().ref);
}

dvc::Result<void> RefManager::delete_ref(const std::string& name) {
    const auto key = ref_key(name);
    if (!storage_.exists(key)) {
        return dvc::Err<void>(errors::ref_not_found(name));
    }
    spdlog::debug("Deleting ref {}", name);
    return storage_.remove(key);
}

dvc::Result<std::vector<std::string>> RefManager::list_refs() const {
    auto keys = storage_.list(kRefsPrefix);
    if (keys.is_error()) {
        return keys;
    }

    std::vector<std::string> names;
    names.reserve(keys.value().size());
    const auto prefix_len = std::string(kRefsPrefix).size();
    for (const auto& key : keys.value()) {
        names.push_back(key.substr(prefix_len));
    }
    return dvc::Ok(std::move(names));
}

bool RefManager::ref_exists(const std::string& name) const {
    if (name == kHeadRef) {
        return storage_.exists(kHeadRef);
    }
    return storage_.exists(ref_key(name));
}

dvc::Result<std::string> RefManager::read_pointer(const std::string& key, const std::string& name) const {
    if (!storage_.exists(key)) {
        return dvc::Err<std::string>(errors::ref_not_found(name));
    }
    auto content = storage_.read(key);
    if (content.is_error()) {
        return content;
    }
    auto value = trim(std::move(content.value()));
    if (value.empty()) {
        return dvc::Err<std::string>(errors::ref_not_found(name));
    }
    return dvc::Ok(std::move(value));
}

} // namespace dvc::sync
