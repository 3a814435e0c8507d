#pragma once

#include <string>
#include <utility>

namespace dvc {

/**
 * @brief Failure categories surfaced by the version-control core
 *
 * Validation: InvalidBranchName, UnknownStrategy
 * Not found:  BranchNotFound, RefNotFound, CommitNotFound
 * State:      BranchAlreadyExists, CannotDeleteCurrentBranch, MergeInProgress
 * Collaborator failures: StorageError, CorruptObject
 */
enum class ErrorCode {
    InvalidBranchName,
    BranchAlreadyExists,
    BranchNotFound,
    CannotDeleteCurrentBranch,
    RefNotFound,
    CommitNotFound,
    UnknownStrategy,
    StorageError,
    CorruptObject,
    MergeInProgress
};

struct Error {
    ErrorCode code = ErrorCode::StorageError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool is(ErrorCode c) const noexcept { return code == c; }
};

const char* to_string(ErrorCode code) noexcept;

namespace errors {

Error invalid_branch_name();
Error branch_already_exists();
Error branch_not_found();
Error cannot_delete_current_branch();
Error ref_not_found(const std::string& name);
Error commit_not_found(const std::string& hash);
Error unknown_strategy(const std::string& token);
Error storage(std::string message);
Error corrupt_object(const std::string& key, const std::string& detail);
Error merge_in_progress(const std::string& source, const std::string& target);

} // namespace errors

} // namespace dvc
