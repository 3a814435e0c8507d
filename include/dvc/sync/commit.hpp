#pragma once

/**
 * @file commit.hpp
 * @brief Immutable, content-addressed snapshot descriptors
 *
 * A commit records an opaque `state` value (collection/relationship hashes,
 * event-log position, ...) plus its parents. The core never interprets state,
 * it only hashes and stores it.
 *
 * CONTENT ADDRESSING:
 * hash = SHA-256 over the canonical JSON of {author, message, parents, state}
 * (object keys sorted). The timestamp is NOT hashed, so re-creating the same
 * content yields the same hash and saving it again is a no-op.
 *
 * STORAGE:
 * Commits live at "commits/<hash>". A commit is only accepted when every
 * parent is already stored, so the persisted graph never has dangling edges.
 */

#include "dvc/core/result.hpp"
#include "dvc/core/value.hpp"
#include "dvc/storage/backend.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dvc::sync {

struct Commit {
    std::string hash;
    std::vector<std::string> parents;
    std::string message;
    std::string author;
    std::int64_t timestamp = 0;      ///< Milliseconds since epoch
    Value state;
};

struct CommitOptions {
    std::string message;
    std::string author;
    std::vector<std::string> parents;
    std::optional<std::int64_t> timestamp;   ///< Defaults to now
};

/// Storage key of a commit object
std::string commit_key(const std::string& hash);

/// Hex SHA-256 of the canonical {author, message, parents, state} document
dvc::Result<std::string> compute_commit_hash(const std::vector<std::string>& parents,
                                             const std::string& message,
                                             const std::string& author,
                                             const Value& state);

dvc::Result<Commit> create_commit(Value state, const CommitOptions& options);

/**
 * @brief Persist a commit
 *
 * Idempotent: an already stored hash is left untouched.
 * CommitNotFound when a parent is not stored yet.
 */
dvc::Result<void> save_commit(storage::StorageBackend& storage, const Commit& commit);

/**
 * @brief Load a commit by hash
 *
 * CommitNotFound when absent, CorruptObject when the stored bytes do not
 * parse or do not hash back to the key they are stored under.
 */
dvc::Result<Commit> load_commit(const storage::StorageBackend& storage, const std::string& hash);

bool commit_exists(const storage::StorageBackend& storage, const std::string& hash);

/// First-parent history starting at hash, newest first; limit 0 means unlimited
dvc::Result<std::vector<Commit>> commit_log(const storage::StorageBackend& storage,
                                            const std::string& hash,
                                            std::size_t limit = 0);

/// True when ancestor is reachable from descendant (a commit is its own ancestor)
dvc::Result<bool> is_ancestor(const storage::StorageBackend& storage,
                              const std::string& ancestor,
                              const std::string& descendant);

/// Nearest common ancestor of a and b, empty when the histories are unrelated
dvc::Result<std::optional<std::string>> find_merge_base(const storage::StorageBackend& storage,
                                                        const std::string& a,
                                                        const std::string& b);

} // namespace dvc::sync
