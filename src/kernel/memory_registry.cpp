#include "kernel/memory_registry.hpp"
#include "kernel/errors.hpp"
#include "util/ids.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>

namespace royaos::kernel {

using json = nlohmann::json;

namespace {

size_t index_of(MemoryCategory category) {
    return static_cast<size_t>(category);
}

// Lowercase with '_', '-' and ' ' removed
std::string normalize_name(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (c == '_' || c == '-' || c == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

// Reclaim order; SYSTEM is never reclaimed
constexpr std::array<MemoryCategory, 4> RECLAIM_ORDER = {
    MemoryCategory::BACKGROUND,
    MemoryCategory::SHORT_TERM,
    MemoryCategory::WORKING,
    MemoryCategory::LONG_TERM
};

std::chrono::seconds idle_threshold(OptimizationStrategy strategy) {
    switch (strategy) {
        case OptimizationStrategy::AGGRESSIVE:   return AGGRESSIVE_IDLE_THRESHOLD;
        case OptimizationStrategy::BALANCED:     return BALANCED_IDLE_THRESHOLD;
        case OptimizationStrategy::CONSERVATIVE: return CONSERVATIVE_IDLE_THRESHOLD;
    }
    return BALANCED_IDLE_THRESHOLD;
}

bool at_pressure(uint64_t used, uint64_t quota) {
    if (quota == 0) return used > 0;
    return static_cast<double>(used) >= static_cast<double>(quota) * CONSERVATIVE_PRESSURE_RATIO;
}

} // namespace

std::optional<MemoryCategory> memory_category_from_string(const std::string& str) {
    std::string s = normalize_name(str);
    if (s == "system")     return MemoryCategory::SYSTEM;
    if (s == "shortterm")  return MemoryCategory::SHORT_TERM;
    if (s == "working")    return MemoryCategory::WORKING;
    if (s == "longterm")   return MemoryCategory::LONG_TERM;
    if (s == "background") return MemoryCategory::BACKGROUND;
    return std::nullopt;
}

std::optional<OptimizationStrategy> optimization_strategy_from_string(const std::string& str) {
    std::string s = normalize_name(str);
    if (s == "aggressive")   return OptimizationStrategy::AGGRESSIVE;
    if (s == "balanced")     return OptimizationStrategy::BALANCED;
    if (s == "conservative") return OptimizationStrategy::CONSERVATIVE;
    return std::nullopt;
}

// ============================================================================
// Value types
// ============================================================================

uint64_t MemoryConfig::quota(MemoryCategory category) const {
    auto it = category_quotas.find(category);
    return it == category_quotas.end() ? max_allocation_bytes : it->second;
}

json MemoryHandle::to_json() const {
    json j;
    j["handle_id"] = id;
    j["session_id"] = session_id;
    j["category"] = memory_category_to_string(category);
    j["size_bytes"] = size_bytes;
    j["purpose"] = purpose;
    j["created_at"] = util::format_iso8601(created_at);
    j["access_count"] = access_count;
    return j;
}

uint64_t MemoryStatus::used(MemoryCategory category) const {
    for (const auto& usage : categories) {
        if (usage.category == category) {
            return usage.used_bytes;
        }
    }
    return 0;
}

double MemoryStatus::usage_percentage() const {
    if (quota_bytes == 0) return 0.0;
    return static_cast<double>(used_bytes) / static_cast<double>(quota_bytes) * 100.0;
}

json MemoryStatus::to_json() const {
    json j;
    j["categories"] = json::object();
    for (const auto& usage : categories) {
        json c;
        c["used_bytes"] = usage.used_bytes;
        c["quota_bytes"] = usage.quota_bytes;
        c["handle_count"] = usage.handle_count;
        j["categories"][memory_category_to_string(usage.category)] = c;
    }
    j["used_bytes"] = used_bytes;
    j["quota_bytes"] = quota_bytes;
    j["handle_count"] = handle_count;
    j["usage_percentage"] = usage_percentage();
    return j;
}

std::vector<std::string> OptimizationResult::reclaimed_ids() const {
    std::vector<std::string> ids;
    ids.reserve(reclaimed.size());
    for (const auto& handle : reclaimed) {
        ids.push_back(handle.id);
    }
    return ids;
}

json OptimizationResult::to_json() const {
    json j;
    j["strategy"] = optimization_strategy_to_string(strategy);
    j["reclaimed"] = reclaimed_ids();
    j["bytes_freed"] = bytes_freed;
    return j;
}

// ============================================================================
// MemoryRegistry Implementation
// ============================================================================

MemoryRegistry::MemoryRegistry(const MemoryConfig& config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    spdlog::info("Memory registry initialized ({} bytes global quota, '{}' strategy)",
        config_.max_allocation_bytes,
        optimization_strategy_to_string(config_.optimization_strategy));
}

MemoryHandle MemoryRegistry::allocate(const std::string& session_id,
                                      MemoryCategory category,
                                      uint64_t size_bytes,
                                      const std::string& purpose) {
    if (size_bytes == 0) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "allocation size must be greater than zero");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    size_t idx = index_of(category);
    uint64_t category_quota = config_.quota(category);
    uint64_t category_used = category_used_[idx];

    // Compare against remaining headroom so large sizes cannot overflow
    if (category_used > category_quota || size_bytes > category_quota - category_used) {
        spdlog::warn("Allocation of {} bytes rejected: {} category at {}/{} bytes",
            size_bytes, memory_category_to_string(category), category_used, category_quota);
        throw KernelError(ErrorKind::QUOTA_EXCEEDED,
            fmt::format("allocation of {} bytes would exceed the {} quota of {} bytes",
                size_bytes, memory_category_to_string(category), category_quota));
    }
    if (total_used_ > config_.max_allocation_bytes ||
        size_bytes > config_.max_allocation_bytes - total_used_) {
        spdlog::warn("Allocation of {} bytes rejected: global usage at {}/{} bytes",
            size_bytes, total_used_, config_.max_allocation_bytes);
        throw KernelError(ErrorKind::QUOTA_EXCEEDED,
            fmt::format("allocation of {} bytes would exceed the global quota of {} bytes",
                size_bytes, config_.max_allocation_bytes));
    }

    MemoryHandle handle;
    handle.id = util::generate_token("mem");
    handle.session_id = session_id;
    handle.category = category;
    handle.size_bytes = size_bytes;
    handle.purpose = purpose;
    handle.created_at = std::chrono::system_clock::now();
    handle.last_accessed = clock_();

    if (!handles_.emplace(handle.id, handle).second) {
        throw InvariantViolation(fmt::format("duplicate memory handle id {}", handle.id));
    }
    category_used_[idx] += size_bytes;
    category_count_[idx]++;
    total_used_ += size_bytes;

    spdlog::debug("Allocated {} bytes for '{}' in {} ({})",
        size_bytes, purpose, memory_category_to_string(category), handle.id);
    return handle;
}

MemoryHandle MemoryRegistry::release(const std::string& handle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle_id);
    if (it == handles_.end()) {
        throw KernelError(ErrorKind::HANDLE_NOT_FOUND,
            fmt::format("no memory allocation found for handle {}", handle_id));
    }

    MemoryHandle released = erase_locked(it);
    spdlog::debug("Released {} bytes from {} ({})",
        released.size_bytes, memory_category_to_string(released.category), handle_id);
    return released;
}

MemoryHandle MemoryRegistry::access(const std::string& handle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle_id);
    if (it == handles_.end()) {
        throw KernelError(ErrorKind::HANDLE_NOT_FOUND,
            fmt::format("no memory allocation found for handle {}", handle_id));
    }
    it->second.last_accessed = clock_();
    it->second.access_count++;
    return it->second;
}

std::optional<MemoryHandle> MemoryRegistry::find(const std::string& handle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle_id);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryRegistry::contains(const std::string& handle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.count(handle_id) > 0;
}

std::vector<MemoryHandle> MemoryRegistry::handles_for_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryHandle> result;
    for (const auto& [id, handle] : handles_) {
        if (handle.session_id == session_id) {
            result.push_back(handle);
        }
    }
    return result;
}

OptimizationResult MemoryRegistry::optimize(OptimizationStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);

    OptimizationResult result;
    result.strategy = strategy;

    auto now = clock_();
    auto threshold = idle_threshold(strategy);

    for (MemoryCategory category : RECLAIM_ORDER) {
        if (strategy == OptimizationStrategy::CONSERVATIVE && !under_pressure_locked(category)) {
            continue;
        }

        // Oldest-idle first, so CONSERVATIVE stops after the stalest handles
        std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>> candidates;
        for (const auto& [id, handle] : handles_) {
            if (handle.category == category && now - handle.last_accessed > threshold) {
                candidates.emplace_back(handle.last_accessed, id);
            }
        }
        std::sort(candidates.begin(), candidates.end());

        for (const auto& candidate : candidates) {
            if (strategy == OptimizationStrategy::CONSERVATIVE && !under_pressure_locked(category)) {
                break;
            }
            auto it = handles_.find(candidate.second);
            if (it == handles_.end()) {
                throw InvariantViolation(
                    fmt::format("optimization candidate {} vanished mid-scan", candidate.second));
            }
            MemoryHandle reclaimed = erase_locked(it);
            result.bytes_freed += reclaimed.size_bytes;
            result.reclaimed.push_back(std::move(reclaimed));
        }
    }

    spdlog::info("Memory optimization ({}) reclaimed {} handle(s), freed {} bytes",
        optimization_strategy_to_string(strategy), result.reclaimed.size(), result.bytes_freed);
    return result;
}

MemoryStatus MemoryRegistry::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryStatus status;
    for (MemoryCategory category : ALL_MEMORY_CATEGORIES) {
        CategoryUsage usage;
        usage.category = category;
        usage.used_bytes = category_used_[index_of(category)];
        usage.quota_bytes = config_.quota(category);
        usage.handle_count = category_count_[index_of(category)];
        status.categories.push_back(usage);
    }
    status.used_bytes = total_used_;
    status.quota_bytes = config_.max_allocation_bytes;
    status.handle_count = handles_.size();
    return status;
}

MemoryHandle MemoryRegistry::erase_locked(std::unordered_map<std::string, MemoryHandle>::iterator it) {
    MemoryHandle handle = std::move(it->second);
    handles_.erase(it);

    size_t idx = index_of(handle.category);
    if (category_used_[idx] < handle.size_bytes || total_used_ < handle.size_bytes ||
        category_count_[idx] == 0) {
        throw InvariantViolation(fmt::format(
            "memory accounting underflow releasing {} ({} bytes, {} used in {})",
            handle.id, handle.size_bytes, category_used_[idx],
            memory_category_to_string(handle.category)));
    }
    category_used_[idx] -= handle.size_bytes;
    category_count_[idx]--;
    total_used_ -= handle.size_bytes;
    return handle;
}

bool MemoryRegistry::under_pressure_locked(MemoryCategory category) const {
    return at_pressure(category_used_[index_of(category)], config_.quota(category)) ||
           at_pressure(total_used_, config_.max_allocation_bytes);
}

} // namespace royaos::kernel
