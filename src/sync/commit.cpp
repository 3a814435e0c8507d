#include "dvc/sync/commit.hpp"

#include "dvc/sync/serialization.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <deque>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>

namespace dvc::sync {
namespace {

constexpr const char* kCommitPrefix = "commits/";

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

dvc::Result<std::string> sha256_hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return dvc::Err<std::string>(errors::storage("EVP_MD_CTX_new failed"));
    }
    const bool ok = EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) == 1;
    if (!ok) {
        return dvc::Err<std::string>(errors::storage("SHA-256 digest failed"));
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return dvc::Ok(oss.str());
}

// Breadth-first walk over all parents; visit returns false to stop early
template<typename Visit>
dvc::Result<void> walk_ancestors(const storage::StorageBackend& storage, const std::string& start, Visit visit) {
    std::deque<std::string> queue{start};
    std::set<std::string> seen{start};

    while (!queue.empty()) {
        auto hash = queue.front();
        queue.pop_front();

        auto commit = load_commit(storage, hash);
        if (commit.is_error()) {
            return dvc::Err<void>(commit.error());
        }
        if (!visit(commit.value())) {
            break;
        }
        for (const auto& parent : commit.value().parents) {
            if (seen.insert(parent).second) {
                queue.push_back(parent);
            }
        }
    }
    return dvc::Ok();
}

} // namespace

std::string commit_key(const std::string& hash) {
    return kCommitPrefix + hash;
}

dvc::Result<std::string> compute_commit_hash(const std::vector<std::string>& parents,
                                             const std::string& message,
                                             const std::string& author,
                                             const Value& state) {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    Value canonical = {
        {"author", author},
        {"message", message},
        {"parents", parents},
        {"state", state}
    };
    return sha256_hex(canonical.dump());
}

dvc::Result<Commit> create_commit(Value state, const CommitOptions& options) {
    auto hash = compute_commit_hash(options.parents, options.message, options.author, state);
    if (hash.is_error()) {
        return dvc::Err<Commit>(hash.error());
    }

    Commit commit;
    commit.hash = std::move(hash.value());
    commit.parents = options.parents;
    commit.message = options.message;
    commit.author = options.author;
    commit.timestamp = options.timestamp.value_or(now_ms());
    commit.state = std::move(state);
    return dvc::Ok(std::move(commit));
}

dvc::Result<void> save_commit(storage::StorageBackend& storage, const Commit& commit) {
    const auto key = commit_key(commit.hash);
    if (storage.exists(key)) {
        spdlog::debug("Commit {} already stored", commit.hash);
        return dvc::Ok();
    }

    for (const auto& parent : commit.parents) {
        if (!commit_exists(storage, parent)) {
            return dvc::Err<void>(errors::commit_not_found(parent));
        }
    }

    Value document = commit;
    if (auto res = storage.write(key, document.dump()); res.is_error()) {
        return res;
    }
    spdlog::debug("Stored commit {} ({} parents)", commit.hash, commit.parents.size());
    return dvc::Ok();
}

dvc::Result<Commit> load_commit(const storage::StorageBackend& storage, const std::string& hash) {
    const auto key = commit_key(hash);
    if (hash.empty() || !storage.exists(key)) {
        return dvc::Err<Commit>(errors::commit_not_found(hash));
    }

    auto bytes = storage.read(key);
    if (bytes.is_error()) {
        return dvc::Err<Commit>(bytes.error());
    }

    Commit commit;
    try {
        commit = Value::parse(bytes.value()).get<Commit>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable commit object {}: {}", key, e.what());
        return dvc::Err<Commit>(errors::corrupt_object(key, e.what()));
    }

    auto expected = compute_commit_hash(commit.parents, commit.message, commit.author, commit.state);
    if (expected.is_error()) {
        return dvc::Err<Commit>(expected.error());
    }
    if (expected.value() != hash || commit.hash != hash) {
        spdlog::warn("Commit object {} hashes to {}", key, expected.value());
        return dvc::Err<Commit>(errors::corrupt_object(key, "hash mismatch"));
    }
    return dvc::Ok(std::move(commit));
}

bool commit_exists(const storage::StorageBackend& storage, const std::string& hash) {
    return !hash.empty() && storage.exists(commit_key(hash));
}

dvc::Result<std::vector<Commit>> commit_log(const storage::StorageBackend& storage,
                                            const std::string& hash,
                                            std::size_t limit) {
    std::vector<Commit> history;
    std::string cursor = hash;

    while (!cursor.empty() && (limit == 0 || history.size() < limit)) {
        auto commit = load_commit(storage, cursor);
        if (commit.is_error()) {
            return dvc::Err<std::vector<Commit>>(commit.error());
        }
        cursor = commit.value().parents.empty() ? std::string{} : commit.value().parents.front();
        history.push_back(std::move(commit.value()));
    }
    return dvc::Ok(std::move(history));
}

dvc::Result<bool> is_ancestor(const storage::StorageBackend& storage,
                              const std::string& ancestor,
                              const std::string& descendant) {
    bool found = false;
    auto res = walk_ancestors(storage, descendant, [&](const Commit& commit) {
        found = commit.hash == ancestor;
        return !found;
    });
    if (res.is_error()) {
        return dvc::Err<bool>(res.error());
    }
    return dvc::Ok(found);
}

dvc::Result<std::optional<std::string>> find_merge_base(const storage::StorageBackend& storage,
                                                        const std::string& a,
                                                        const std::string& b) {
    std::set<std::string> ancestors_of_a;
    auto res = walk_ancestors(storage, a, [&](const Commit& commit) {
        ancestors_of_a.insert(commit.hash);
        return true;
    });
    if (res.is_error()) {
        return dvc::Err<std::optional<std::string>>(res.error());
    }

    std::optional<std::string> base;
    res = walk_ancestors(storage, b, [&](const Commit& commit) {
        if (ancestors_of_a.count(commit.hash) > 0) {
            base = commit.hash;
            return false;
        }
        return true;
    });
    if (res.is_error()) {
        return dvc::Err<std::optional<std::string>>(res.error());
    }
    return dvc::Ok(std::move(base));
}

} // namespace dvc::sync
