#pragma once

/**
 * @file refs.hpp
 * @brief Named pointers to commits plus the symbolic HEAD
 *
 * LAYOUT IN STORAGE:
 * - "refs/heads/<name>" holds a commit hash
 * - "HEAD" holds either "ref: <branch>" (symbolic) or a bare hash (detached)
 *
 * CONSISTENCY:
 * Resolution either yields a hash or RefNotFound; a missing hop is never
 * reported as an empty hash. Writes are last-writer-wins: there is no
 * locking across a read-then-write, callers keep one writer per ref.
 */

#include "dvc/core/result.hpp"
#include "dvc/storage/backend.hpp"

#include <string>
#include <vector>

namespace dvc::sync {

inline constexpr const char* kHeadRef = "HEAD";

struct HeadState {
    enum class Kind { Symbolic, Detached };

    Kind kind = Kind::Symbolic;
    std::string ref;    ///< Branch name when symbolic, commit hash when detached

    bool is_detached() const noexcept { return kind == Kind::Detached; }
};

class RefManager {
public:
    explicit RefManager(storage::StorageBackend& storage);

    /// Point HEAD at a branch; the branch does not have to exist yet
    dvc::Result<void> set_head(const std::string& branch);

    /// Point HEAD directly at a commit
    dvc::Result<void> detach_head(const std::string& hash);

    /// RefNotFound when HEAD was never written
    dvc::Result<HeadState> get_head() const;

    /**
     * Create or overwrite a branch ref
     *
     * The hash is not checked against stored commits here.
     * update_ref("HEAD", hash) detaches HEAD.
     */
    dvc::Result<void> update_ref(const std::string& name, const std::string& hash);

    /// Commit hash for a ref name or "HEAD", following a symbolic HEAD
    dvc::Result<std::string> resolve_ref(const std::string& name) const;

    /// RefNotFound when the ref does not exist
    dvc::Result<void> delete_ref(const std::string& name);

    /// Branch names, sorted
    dvc::Result<std::vector<std::string>> list_refs() const;

    [[nodiscard]] bool ref_exists(const std::string& name) const;

    /// Storage key of a branch ref
    static std::string ref_key(const std::string& name);

private:
    dvc::Result<std::string> read_pointer(const std::string& key, const std::string& name) const;

    storage::StorageBackend& storage_;
};

} // namespace dvc::sync
