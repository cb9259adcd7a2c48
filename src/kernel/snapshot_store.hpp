/**
 * RoyaOS Snapshot Store
 *
 * Where the kernel puts opaque blobs (policy snapshots, audit exports).
 * The kernel only talks to the interface; FileSnapshotStore keeps one
 * file per blob under a data directory.
 */
#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace royaos::kernel {

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    // Replace the blob stored under name. Returns false on I/O failure.
    virtual bool write(const std::string& name, const std::string& blob) = 0;

    // nullopt when nothing is stored under name
    virtual std::optional<std::string> read(const std::string& name) const = 0;
};

class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::filesystem::path directory);

    bool write(const std::string& name, const std::string& blob) override;
    std::optional<std::string> read(const std::string& name) const override;

private:
    std::filesystem::path directory_;
    mutable std::mutex mutex_;

    // Rejects names that would escape the directory
    std::optional<std::filesystem::path> path_for(const std::string& name) const;
};

class MemorySnapshotStore : public SnapshotStore {
public:
    bool write(const std::string& name, const std::string& blob) override;
    std::optional<std::string> read(const std::string& name) const override;

private:
    std::map<std::string, std::string> blobs_;
    mutable std::mutex mutex_;
};

} // namespace royaos::kernel
