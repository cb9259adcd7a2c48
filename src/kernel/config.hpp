/**
 * RoyaOS Kernel Configuration
 *
 * Loaded once at startup from a JSON file:
 * {
 *   "system":   {"name", "version", "log_level", "data_dir", "socket_path", "drain_timeout_ms"},
 *   "memory":   {"max_allocation" (MB), "optimization_strategy", "category_quotas" (MB per category)},
 *   "security": {"security_level", "allowed_operations", "rules"},
 *   "audit":    {"max_entries", "log_session", "log_memory", "log_tool", "log_system"}
 * }
 * Every section and key is optional.
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/audit_log.hpp"
#include "kernel/memory_registry.hpp"
#include "kernel/permissions.hpp"

namespace royaos::kernel {

struct KernelConfig {
    std::string system_name = "RoyaOS";
    std::string system_version = "0.1.0";
    std::string log_level = "info";
    std::string data_dir = "data";
    std::string socket_path = "/tmp/royaos.sock";
    std::chrono::milliseconds drain_timeout{5000};

    MemoryConfig memory;

    SecurityLevel security_level = SecurityLevel::STANDARD;
    std::vector<std::string> allowed_operations;    // Named grants, see PermissionPolicy
    std::vector<PermissionRule> permission_rules;

    AuditConfig audit;

    // Throws std::runtime_error naming the offending key
    static KernelConfig from_json(const nlohmann::json& j);
};

// Throws std::runtime_error if the file is missing or invalid
KernelConfig load_config(const std::string& path);

} // namespace royaos::kernel
