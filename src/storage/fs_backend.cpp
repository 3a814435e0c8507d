#include "dvc/storage/fs_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>

namespace dvc::storage {
namespace fs = std::filesystem;

namespace {

// Staging files end with '~', which is_safe_key never accepts in a key segment
constexpr char kStagingMarker = '~';

std::string temp_name(const fs::path& target) {
    static std::atomic<std::uint64_t> counter{0};
    return target.filename().string() + "." + std::to_string(counter.fetch_add(1)) + ".tmp" + kStagingMarker;
}

bool is_staging_file(const fs::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name.back() == kStagingMarker;
}

} // namespace

FileSystemBackend::FileSystemBackend(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        spdlog::warn("Failed to create storage root {}: {}", root_.string(), ec.message());
    }
}

dvc::Result<std::string> FileSystemBackend::read(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return dvc::Err<std::string>(path.error());
    }

    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return dvc::Err<std::string>(errors::storage("Key not found: " + key));
    }

    std::ostringstream oss;
    oss << input.rdbuf();
    if (input.bad()) {
        return dvc::Err<std::string>(errors::storage("Failed to read " + key));
    }
    return dvc::Ok(oss.str());
}

dvc::Result<void> FileSystemBackend::write(const std::string& key, const std::string& data) {
    auto path = resolve(key);
    if (path.is_error()) {
        return dvc::Err<void>(path.error());
    }
    const auto& destination = path.value();

    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return res;
    }

    const fs::path staging = destination.parent_path() / temp_name(destination);
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return dvc::Err<void>(errors::storage("Failed to open " + staging.string()));
        }
        output.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!output) {
            return dvc::Err<void>(errors::storage("Failed to write " + key));
        }
    }

    std::error_code ec;
    fs::rename(staging, destination, ec);
    if (ec) {
        fs::remove(staging, ec);
        return dvc::Err<void>(errors::storage("Failed to move staged object into " + key));
    }
    return dvc::Ok();
}

bool FileSystemBackend::exists(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

dvc::Result<void> FileSystemBackend::remove(const std::string& key) {
    auto path = resolve(key);
    if (path.is_error()) {
        return dvc::Err<void>(path.error());
    }

    std::error_code ec;
    if (!fs::remove(path.value(), ec)) {
        if (ec) {
            return dvc::Err<void>(errors::storage("Failed to remove " + key + ": " + ec.message()));
        }
        return dvc::Err<void>(errors::storage("Key not found: " + key));
    }

    // Prune empty directories left behind by nested keys (refs/heads/feature/x)
    for (auto dir = path.value().parent_path(); dir != root_ && dir.string().size() > root_.string().size();
         dir = dir.parent_path()) {
        if (!fs::is_empty(dir, ec) || ec) {
            break;
        }
        fs::remove(dir, ec);
    }
    return dvc::Ok();
}

dvc::Result<std::vector<std::string>> FileSystemBackend::list(const std::string& prefix) const {
    std::vector<std::string> keys;

    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return dvc::Ok(std::move(keys));
    }

    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto relative = fs::relative(it->path(), root_, ec);
        if (ec || relative.empty()) {
            continue;
        }
        if (is_staging_file(relative)) {
            continue;
        }
        std::string key = relative.generic_string();
        if (key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(std::move(key));
        }
    }
    if (ec) {
        return dvc::Err<std::vector<std::string>>(errors::storage("Failed to list " + prefix + ": " + ec.message()));
    }

    std::sort(keys.begin(), keys.end());
    return dvc::Ok(std::move(keys));
}

dvc::Result<fs::path> FileSystemBackend::resolve(const std::string& key) const {
    if (!is_safe_key(key)) {
        spdlog::warn("Rejected unsafe storage key '{}'", key);
        return dvc::Err<fs::path>(errors::storage("Invalid storage key: " + key));
    }
    return dvc::Ok(root_ / fs::path(key));
}

bool FileSystemBackend::is_safe_key(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.back() == '/' || key.find('\\') != std::string::npos) {
        return false;
    }

    std::istringstream segments(key);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == "." || segment == ".." || segment.back() == kStagingMarker) {
            return false;
        }
    }
    return true;
}

dvc::Result<void> FileSystemBackend::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return dvc::Err<void>(errors::storage("Failed to create directory: " + parent.string()));
    }
    return dvc::Ok();
}

} // namespace dvc::storage
