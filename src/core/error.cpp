#include "dvc/core/error.hpp"

namespace dvc {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidBranchName: return "InvalidBranchName";
        case ErrorCode::BranchAlreadyExists: return "BranchAlreadyExists";
        case ErrorCode::BranchNotFound: return "BranchNotFound";
        case ErrorCode::CannotDeleteCurrentBranch: return "CannotDeleteCurrentBranch";
        case ErrorCode::RefNotFound: return "RefNotFound";
        case ErrorCode::CommitNotFound: return "CommitNotFound";
        case ErrorCode::UnknownStrategy: return "UnknownStrategy";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::CorruptObject: return "CorruptObject";
        case ErrorCode::MergeInProgress: return "MergeInProgress";
        default: return "Unknown";
    }
}

namespace errors {

Error invalid_branch_name() {
    return {ErrorCode::InvalidBranchName, "Invalid branch name"};
}

Error branch_already_exists() {
    return {ErrorCode::BranchAlreadyExists, "Branch already exists"};
}

Error branch_not_found() {
    return {ErrorCode::BranchNotFound, "Branch not found"};
}

Error cannot_delete_current_branch() {
    return {ErrorCode::CannotDeleteCurrentBranch, "Cannot delete current branch"};
}

Error ref_not_found(const std::string& name) {
    return {ErrorCode::RefNotFound, "Ref not found: " + name};
}

Error commit_not_found(const std::string& hash) {
    return {ErrorCode::CommitNotFound, "Commit not found: " + hash};
}

Error unknown_strategy(const std::string& token) {
    return {ErrorCode::UnknownStrategy, "Unknown resolution strategy: " + token};
}

Error storage(std::string message) {
    return {ErrorCode::StorageError, std::move(message)};
}

Error corrupt_object(const std::string& key, const std::string& detail) {
    return {ErrorCode::CorruptObject, "Corrupt object " + key + ": " + detail};
}

Error merge_in_progress(const std::string& source, const std::string& target) {
    return {ErrorCode::MergeInProgress, "Merge already in progress: " + source + " into " + target};
}

} // namespace errors

} // namespace dvc
