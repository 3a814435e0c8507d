#pragma once

/**
 * @file memory_backend.hpp
 * @brief Thread-safe in-memory StorageBackend
 *
 * Used by tests and by embedders that keep repository state in process.
 *
 * CONCURRENCY MODEL:
 * Reader-writer lock (std::shared_mutex):
 * - read/exists/list take a shared_lock (concurrent readers)
 * - write/remove/clear take a unique_lock (exclusive access)
 *
 * Ordered map so list() returns keys sorted without an extra pass.
 */

#include "dvc/storage/backend.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dvc::storage {

class MemoryBackend : public StorageBackend {
public:
    MemoryBackend() = default;

    std::string type() const override { return "memory"; }

    dvc::Result<std::string> read(const std::string& key) const override;
    dvc::Result<void> write(const std::string& key, const std::string& data) override;
    bool exists(const std::string& key) const override;
    dvc::Result<void> remove(const std::string& key) override;
    dvc::Result<std::vector<std::string>> list(const std::string& prefix) const override;

    /// Number of stored objects
    std::size_t size() const;

    /**
     * Remove every object
     *
     * WARNING: wipes commits and refs alike. Meant for tests.
     */
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string> objects_;
};

} // namespace dvc::storage
