#pragma once

#include "dvc/storage/backend.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dvc::storage {

/**
 * @brief StorageBackend over a local directory tree
 *
 * Keys map to relative POSIX-style paths under the root ("refs/heads/main").
 * Writes land in a sibling temp file first and are renamed into place, so a
 * reader never sees a half-written ref.
 */
class FileSystemBackend : public StorageBackend {
public:
    explicit FileSystemBackend(std::filesystem::path root);

    std::string type() const override { return "fs"; }

    dvc::Result<std::string> read(const std::string& key) const override;
    dvc::Result<void> write(const std::string& key, const std::string& data) override;
    bool exists(const std::string& key) const override;
    dvc::Result<void> remove(const std::string& key) override;
    dvc::Result<std::vector<std::string>> list(const std::string& prefix) const override;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    dvc::Result<std::filesystem::path> resolve(const std::string& key) const;

    static bool is_safe_key(const std::string& key);

    static dvc::Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path root_;
};

} // namespace dvc::storage
