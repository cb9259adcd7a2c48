/**
 * RoyaOS Memory Registry
 *
 * Arena-style registry of memory allocation records keyed by handle id.
 * Tracks per-category and global usage against configured quotas and
 * reclaims idle handles on request. Ownership by sessions is recorded
 * by the kernel in the SessionTable, not here.
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace royaos::kernel {

enum class MemoryCategory {
    SYSTEM,         // Never reclaimed by optimization
    SHORT_TERM,
    WORKING,
    LONG_TERM,
    BACKGROUND
};

constexpr size_t MEMORY_CATEGORY_COUNT = 5;

constexpr std::array<MemoryCategory, MEMORY_CATEGORY_COUNT> ALL_MEMORY_CATEGORIES = {
    MemoryCategory::SYSTEM,
    MemoryCategory::SHORT_TERM,
    MemoryCategory::WORKING,
    MemoryCategory::LONG_TERM,
    MemoryCategory::BACKGROUND
};

inline const char* memory_category_to_string(MemoryCategory category) {
    switch (category) {
        case MemoryCategory::SYSTEM:     return "system";
        case MemoryCategory::SHORT_TERM: return "short_term";
        case MemoryCategory::WORKING:    return "working";
        case MemoryCategory::LONG_TERM:  return "long_term";
        case MemoryCategory::BACKGROUND: return "background";
        default: return "unknown";
    }
}

// Accepts "Working", "working", "ShortTerm", "short_term", "short-term", ...
std::optional<MemoryCategory> memory_category_from_string(const std::string& str);

enum class OptimizationStrategy {
    AGGRESSIVE,
    BALANCED,
    CONSERVATIVE
};

inline const char* optimization_strategy_to_string(OptimizationStrategy strategy) {
    switch (strategy) {
        case OptimizationStrategy::AGGRESSIVE:   return "aggressive";
        case OptimizationStrategy::BALANCED:     return "balanced";
        case OptimizationStrategy::CONSERVATIVE: return "conservative";
        default: return "unknown";
    }
}

std::optional<OptimizationStrategy> optimization_strategy_from_string(const std::string& str);

// Idle time after which a handle becomes reclaimable
constexpr std::chrono::seconds AGGRESSIVE_IDLE_THRESHOLD{60};
constexpr std::chrono::seconds BALANCED_IDLE_THRESHOLD{300};
constexpr std::chrono::seconds CONSERVATIVE_IDLE_THRESHOLD{900};

// CONSERVATIVE only acts on a category (or the global pool) whose usage is
// at or above this fraction of its quota
constexpr double CONSERVATIVE_PRESSURE_RATIO = 0.95;

struct MemoryConfig {
    uint64_t max_allocation_bytes = 1024ull * 1024 * 1024;         // Global quota
    std::unordered_map<MemoryCategory, uint64_t> category_quotas;  // Missing = global quota
    OptimizationStrategy optimization_strategy = OptimizationStrategy::BALANCED;

    uint64_t quota(MemoryCategory category) const;
};

struct MemoryHandle {
    std::string id;
    std::string session_id;
    MemoryCategory category = MemoryCategory::WORKING;
    uint64_t size_bytes = 0;
    std::string purpose;                    // Advisory only
    std::chrono::system_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_accessed;
    uint64_t access_count = 0;

    nlohmann::json to_json() const;
};

struct CategoryUsage {
    MemoryCategory category = MemoryCategory::WORKING;
    uint64_t used_bytes = 0;
    uint64_t quota_bytes = 0;
    size_t handle_count = 0;
};

struct MemoryStatus {
    std::vector<CategoryUsage> categories;  // In ALL_MEMORY_CATEGORIES order
    uint64_t used_bytes = 0;
    uint64_t quota_bytes = 0;
    size_t handle_count = 0;

    uint64_t used(MemoryCategory category) const;
    double usage_percentage() const;
    nlohmann::json to_json() const;
};

struct OptimizationResult {
    OptimizationStrategy strategy = OptimizationStrategy::BALANCED;
    std::vector<MemoryHandle> reclaimed;
    uint64_t bytes_freed = 0;

    std::vector<std::string> reclaimed_ids() const;
    nlohmann::json to_json() const;
};

class MemoryRegistry {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // An empty clock means std::chrono::steady_clock::now
    explicit MemoryRegistry(const MemoryConfig& config, Clock clock = {});

    // Non-copyable
    MemoryRegistry(const MemoryRegistry&) = delete;
    MemoryRegistry& operator=(const MemoryRegistry&) = delete;

    // Throws INVALID_ARGUMENT for size 0, QUOTA_EXCEEDED when the category
    // or global total would go over its quota. State is untouched on failure.
    MemoryHandle allocate(const std::string& session_id,
                          MemoryCategory category,
                          uint64_t size_bytes,
                          const std::string& purpose);

    // Throws HANDLE_NOT_FOUND if unknown or already released. Returns the
    // record that was released.
    MemoryHandle release(const std::string& handle_id);

    // Touch a handle (resets its idle time). Throws HANDLE_NOT_FOUND.
    MemoryHandle access(const std::string& handle_id);

    std::optional<MemoryHandle> find(const std::string& handle_id) const;
    bool contains(const std::string& handle_id) const;
    std::vector<MemoryHandle> handles_for_session(const std::string& session_id) const;

    // Reclaim idle handles; never touches SYSTEM. An empty result is fine.
    OptimizationResult optimize(OptimizationStrategy strategy);

    MemoryStatus status() const;

    const MemoryConfig& config() const { return config_; }

private:
    MemoryConfig config_;
    Clock clock_;
    std::unordered_map<std::string, MemoryHandle> handles_;
    std::array<uint64_t, MEMORY_CATEGORY_COUNT> category_used_{};
    std::array<size_t, MEMORY_CATEGORY_COUNT> category_count_{};
    uint64_t total_used_ = 0;
    mutable std::mutex mutex_;

    // Caller must hold the mutex
    MemoryHandle erase_locked(std::unordered_map<std::string, MemoryHandle>::iterator it);
    bool under_pressure_locked(MemoryCategory category) const;
};

} // namespace royaos::kernel
