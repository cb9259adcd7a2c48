/**
 * RoyaOS Syscalls
 *
 * Every request kind the kernel understands, as one closed variant.
 * parse_syscall turns a request envelope into the matching alternative;
 * the kernel visits it, so adding a kind without a handler fails to
 * compile.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "kernel/memory_registry.hpp"
#include "kernel/permissions.hpp"

namespace royaos::kernel {

namespace syscalls {

struct SessionsCreate {
    static constexpr const char* NAME = "sessions_create";
    std::map<std::string, std::string> metadata;
};

struct SessionsClose {
    static constexpr const char* NAME = "sessions_close";
    std::string target;                     // Empty = the calling session
};

struct SessionsList {
    static constexpr const char* NAME = "sessions_list";
};

struct MemoryAllocate {
    static constexpr const char* NAME = "memory_allocate";
    uint64_t size_bytes = 0;
    std::string purpose;
    MemoryCategory category = MemoryCategory::WORKING;
};

struct MemoryRelease {
    static constexpr const char* NAME = "memory_release";
    std::string handle_id;
};

struct MemoryAccess {
    static constexpr const char* NAME = "memory_access";
    std::string handle_id;
};

struct MemoryOptimize {
    static constexpr const char* NAME = "memory_optimize";
    std::optional<OptimizationStrategy> strategy;   // nullopt = configured default, filled in by the kernel
};

struct MemoryStatusQuery {
    static constexpr const char* NAME = "memory_status";
};

struct SecuritySetLevel {
    static constexpr const char* NAME = "security_set_level";
    SecurityLevel level = SecurityLevel::STANDARD;
};

struct SecurityAddPermission {
    static constexpr const char* NAME = "security_add_permission";
    PermissionRule rule;
};

struct SecurityRemovePermission {
    static constexpr const char* NAME = "security_remove_permission";
    std::string resource_type;
    std::string operation;
    std::string resource;
    std::optional<Effect> effect;           // nullopt = any effect
};

struct SecurityAudit {
    static constexpr const char* NAME = "security_audit";
    size_t limit = 100;
};

struct ToolsList {
    static constexpr const char* NAME = "tools_list";
};

struct ToolsExecute {
    static constexpr const char* NAME = "tools_execute";
    std::string tool_id;
    std::string capability;
    nlohmann::json parameters = nlohmann::json::object();
};

struct SystemInfo {
    static constexpr const char* NAME = "system_info";
};

struct SystemEcho {
    static constexpr const char* NAME = "system_echo";
    nlohmann::json payload;
};

struct SystemBackup {
    static constexpr const char* NAME = "system_backup";
};

struct SystemRestore {
    static constexpr const char* NAME = "system_restore";
};

struct SystemShutdown {
    static constexpr const char* NAME = "system_shutdown";
    std::optional<std::chrono::milliseconds> drain_timeout;   // nullopt = configured
};

} // namespace syscalls

using Syscall = std::variant<
    syscalls::SessionsCreate,
    syscalls::SessionsClose,
    syscalls::SessionsList,
    syscalls::MemoryAllocate,
    syscalls::MemoryRelease,
    syscalls::MemoryAccess,
    syscalls::MemoryOptimize,
    syscalls::MemoryStatusQuery,
    syscalls::SecuritySetLevel,
    syscalls::SecurityAddPermission,
    syscalls::SecurityRemovePermission,
    syscalls::SecurityAudit,
    syscalls::ToolsList,
    syscalls::ToolsExecute,
    syscalls::SystemInfo,
    syscalls::SystemEcho,
    syscalls::SystemBackup,
    syscalls::SystemRestore,
    syscalls::SystemShutdown
>;

// "memory/allocate" -> "memory_allocate", lowercased
std::string normalize_request_type(const std::string& type);

// Throws KernelError(INVALID_ARGUMENT) for unknown types or bad parameters
Syscall parse_syscall(const ipc::Request& request);

// Static (resource_type, operation, resource) mapping per request kind
PermissionTriple permission_triple(const Syscall& syscall, const std::string& session_id);

const char* syscall_name(const Syscall& syscall);

} // namespace royaos::kernel
