#pragma once

/**
 * @file backend.hpp
 * @brief Byte-level key/value storage contract consumed by the version-control core
 *
 * The core persists two kinds of objects through this interface:
 * - content-addressed commit blobs (key derived from the commit hash)
 * - small mutable pointers (branch refs, HEAD, merge state)
 *
 * Implementations decide where bytes live (memory, local disk, object store).
 * The core never retries; errors are propagated to the caller unchanged.
 */

#include "dvc/core/result.hpp"

#include <string>
#include <vector>

namespace dvc::storage {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /// Backend type identifier ("memory", "fs", ...)
    virtual std::string type() const = 0;

    /// Read entire object. StorageError "Key not found: <key>" when absent.
    virtual dvc::Result<std::string> read(const std::string& key) const = 0;

    /// Create or overwrite an object
    virtual dvc::Result<void> write(const std::string& key, const std::string& data) = 0;

    virtual bool exists(const std::string& key) const = 0;

    /// Remove an object. StorageError when absent.
    virtual dvc::Result<void> remove(const std::string& key) = 0;

    /// All keys starting with prefix, sorted ascending
    virtual dvc::Result<std::vector<std::string>> list(const std::string& prefix) const = 0;
};

} // namespace dvc::storage
