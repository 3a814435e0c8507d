#include "dvc/storage/memory_backend.hpp"

#include <mutex>

namespace dvc::storage {

dvc::Result<std::string> MemoryBackend::read(const std::string& key) const {
    std::shared_lock lock(mutex_);

    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return dvc::Err<std::string>(errors::storage("Key not found: " + key));
    }
    return dvc::Ok(it->second);
}

dvc::Result<void> MemoryBackend::write(const std::string& key, const std::string& data) {
    if (key.empty()) {
        return dvc::Err<void>(errors::storage("Empty storage key"));
    }

    std::unique_lock lock(mutex_);
    objects_[key] = data;
    return dvc::Ok();
}

bool MemoryBackend::exists(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return objects_.find(key) != objects_.end();
}

dvc::Result<void> MemoryBackend::remove(const std::string& key) {
    std::unique_lock lock(mutex_);

    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return dvc::Err<void>(errors::storage("Key not found: " + key));
    }
    objects_.erase(it);
    return dvc::Ok();
}

dvc::Result<std::vector<std::string>> MemoryBackend::list(const std::string& prefix) const {
    std::shared_lock lock(mutex_);

    std::vector<std::string> keys;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return dvc::Ok(std::move(keys));
}

std::size_t MemoryBackend::size() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

void MemoryBackend::clear() {
    std::unique_lock lock(mutex_);
    objects_.clear();
}

} // namespace dvc::storage
