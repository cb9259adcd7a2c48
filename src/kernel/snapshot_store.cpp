#include "kernel/snapshot_store.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace royaos::kernel {

// ============================================================================
// FileSnapshotStore Implementation
// ============================================================================

FileSnapshotStore::FileSnapshotStore(fs::path directory)
    : directory_(std::move(directory)) {}

std::optional<fs::path> FileSnapshotStore::path_for(const std::string& name) const {
    if (name.empty() || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name == "." || name == "..") {
        return std::nullopt;
    }
    return directory_ / name;
}

bool FileSnapshotStore::write(const std::string& name, const std::string& blob) {
    auto path = path_for(name);
    if (!path) {
        spdlog::error("Refusing snapshot name '{}'", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("Failed to create snapshot directory {}: {}", directory_.string(), ec.message());
        return false;
    }

    // Write to a temp file and rename so readers never see a partial blob
    fs::path tmp = *path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open {} for writing", tmp.string());
            return false;
        }
        out << blob;
        if (!out.good()) {
            spdlog::error("Failed to write snapshot {}", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, *path, ec);
    if (ec) {
        spdlog::error("Failed to move snapshot into place at {}: {}", path->string(), ec.message());
        return false;
    }

    spdlog::debug("Wrote snapshot {} ({} bytes)", path->string(), blob.size());
    return true;
}

std::optional<std::string> FileSnapshotStore::read(const std::string& name) const {
    auto path = path_for(name);
    if (!path) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// ============================================================================
// MemorySnapshotStore Implementation
// ============================================================================

bool MemorySnapshotStore::write(const std::string& name, const std::string& blob) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[name] = blob;
    return true;
}

std::optional<std::string> MemorySnapshotStore::read(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(name);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace royaos::kernel
