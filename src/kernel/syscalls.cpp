#include "kernel/syscalls.hpp"
#include "kernel/errors.hpp"
#include "kernel/session_table.hpp"
#include "util/overloaded.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <unordered_map>

namespace royaos::kernel {

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw KernelError(ErrorKind::INVALID_ARGUMENT, message);
}

std::optional<std::string> optional_string(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) {
        return std::nullopt;
    }
    if (!params[key].is_string()) {
        invalid(fmt::format("parameter '{}' must be a string", key));
    }
    return params[key].get<std::string>();
}

std::string required_string(const json& params, const char* key) {
    auto value = optional_string(params, key);
    if (!value || value->empty()) {
        invalid(fmt::format("parameter '{}' is required", key));
    }
    return *value;
}

std::optional<uint64_t> optional_unsigned(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = params[key];
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v >= 0) return static_cast<uint64_t>(v);
    }
    invalid(fmt::format("parameter '{}' must be a non-negative integer", key));
}

syscalls::SessionsCreate parse_sessions_create(const json& params) {
    syscalls::SessionsCreate sc;
    if (params.contains("metadata") && !params["metadata"].is_null()) {
        const auto& metadata = params["metadata"];
        if (!metadata.is_object()) {
            invalid("parameter 'metadata' must be an object");
        }
        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            // Non-string values are kept in their JSON text form
            sc.metadata[it.key()] = it.value().is_string()
                ? it.value().get<std::string>() : it.value().dump();
        }
    }
    return sc;
}

syscalls::SessionsClose parse_sessions_close(const json& params) {
    syscalls::SessionsClose sc;
    sc.target = optional_string(params, "session_id").value_or("");
    return sc;
}

syscalls::MemoryAllocate parse_memory_allocate(const json& params) {
    syscalls::MemoryAllocate sc;
    auto size = optional_unsigned(params, "size_bytes");
    if (!size) {
        invalid("parameter 'size_bytes' is required");
    }
    sc.size_bytes = *size;
    sc.purpose = optional_string(params, "purpose").value_or("");

    if (auto category = optional_string(params, "category")) {
        auto parsed = memory_category_from_string(*category);
        if (!parsed) {
            invalid(fmt::format("unknown memory category: {}", *category));
        }
        sc.category = *parsed;
    }
    return sc;
}

syscalls::MemoryRelease parse_memory_release(const json& params) {
    return syscalls::MemoryRelease{required_string(params, "handle_id")};
}

syscalls::MemoryAccess parse_memory_access(const json& params) {
    return syscalls::MemoryAccess{required_string(params, "handle_id")};
}

syscalls::MemoryOptimize parse_memory_optimize(const json& params) {
    syscalls::MemoryOptimize sc;
    if (auto strategy = optional_string(params, "strategy")) {
        sc.strategy = optimization_strategy_from_string(*strategy);
        if (!sc.strategy) {
            invalid(fmt::format("unknown optimization strategy: {}", *strategy));
        }
    }
    return sc;
}

syscalls::SecuritySetLevel parse_security_set_level(const json& params) {
    std::string level_str = required_string(params, "level");
    auto level = security_level_from_string(level_str);
    if (!level) {
        invalid(fmt::format("invalid security level: {}", level_str));
    }
    return syscalls::SecuritySetLevel{*level};
}

syscalls::SecurityAddPermission parse_security_add_permission(const json& params) {
    return syscalls::SecurityAddPermission{PermissionRule::from_json(params)};
}

syscalls::SecurityRemovePermission parse_security_remove_permission(const json& params) {
    syscalls::SecurityRemovePermission sc;
    sc.resource_type = required_string(params, "resource_type");
    sc.operation = required_string(params, "operation");
    sc.resource = required_string(params, "resource");
    if (auto effect = optional_string(params, "effect")) {
        sc.effect = effect_from_string(*effect);
        if (!sc.effect) {
            invalid(fmt::format("invalid permission effect: {}", *effect));
        }
    }
    return sc;
}

syscalls::SecurityAudit parse_security_audit(const json& params) {
    syscalls::SecurityAudit sc;
    if (auto limit = optional_unsigned(params, "limit")) {
        sc.limit = static_cast<size_t>(*limit);
    }
    return sc;
}

syscalls::ToolsExecute parse_tools_execute(const json& params) {
    syscalls::ToolsExecute sc;
    sc.tool_id = required_string(params, "tool_id");
    sc.capability = required_string(params, "capability");
    if (params.contains("parameters") && !params["parameters"].is_null()) {
        if (!params["parameters"].is_object()) {
            invalid("parameter 'parameters' must be an object");
        }
        sc.parameters = params["parameters"];
    }
    return sc;
}

syscalls::SystemShutdown parse_system_shutdown(const json& params) {
    syscalls::SystemShutdown sc;
    if (auto timeout = optional_unsigned(params, "drain_timeout_ms")) {
        if (*timeout > static_cast<uint64_t>(MAX_DRAIN_TIMEOUT.count())) {
            invalid(fmt::format("parameter 'drain_timeout_ms' exceeds {} ms",
                MAX_DRAIN_TIMEOUT.count()));
        }
        sc.drain_timeout = std::chrono::milliseconds(*timeout);
    }
    return sc;
}

using Parser = std::function<Syscall(const json&)>;

const std::unordered_map<std::string, Parser>& parsers() {
    static const std::unordered_map<std::string, Parser> table = {
        {syscalls::SessionsCreate::NAME,           parse_sessions_create},
        {syscalls::SessionsClose::NAME,            parse_sessions_close},
        {syscalls::SessionsList::NAME,             [](const json&) -> Syscall { return syscalls::SessionsList{}; }},
        {syscalls::MemoryAllocate::NAME,           parse_memory_allocate},
        {syscalls::MemoryRelease::NAME,            parse_memory_release},
        {syscalls::MemoryAccess::NAME,             parse_memory_access},
        {syscalls::MemoryOptimize::NAME,           parse_memory_optimize},
        {syscalls::MemoryStatusQuery::NAME,        [](const json&) -> Syscall { return syscalls::MemoryStatusQuery{}; }},
        {syscalls::SecuritySetLevel::NAME,         parse_security_set_level},
        {syscalls::SecurityAddPermission::NAME,    parse_security_add_permission},
        {syscalls::SecurityRemovePermission::NAME, parse_security_remove_permission},
        {syscalls::SecurityAudit::NAME,            parse_security_audit},
        {syscalls::ToolsList::NAME,                [](const json&) -> Syscall { return syscalls::ToolsList{}; }},
        {syscalls::ToolsExecute::NAME,             parse_tools_execute},
        {syscalls::SystemInfo::NAME,               [](const json&) -> Syscall { return syscalls::SystemInfo{}; }},
        {syscalls::SystemEcho::NAME,               [](const json& p) -> Syscall { return syscalls::SystemEcho{p}; }},
        {syscalls::SystemBackup::NAME,             [](const json&) -> Syscall { return syscalls::SystemBackup{}; }},
        {syscalls::SystemRestore::NAME,            [](const json&) -> Syscall { return syscalls::SystemRestore{}; }},
        {syscalls::SystemShutdown::NAME,           parse_system_shutdown},
    };
    return table;
}

} // namespace

std::string normalize_request_type(const std::string& type) {
    std::string out = type;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c == '/' ? '_' : static_cast<char>(std::tolower(c));
    });
    return out;
}

Syscall parse_syscall(const ipc::Request& request) {
    std::string type = normalize_request_type(request.type);
    auto it = parsers().find(type);
    if (it == parsers().end()) {
        invalid(fmt::format("unknown request type: {}", request.type));
    }

    const json& params = request.parameters.is_null() ? json::object() : request.parameters;
    try {
        return it->second(params);
    } catch (const json::exception& e) {
        invalid(fmt::format("malformed parameters for {}: {}", type, e.what()));
    }
}

PermissionTriple permission_triple(const Syscall& syscall, const std::string& session_id) {
    using namespace syscalls;
    return std::visit(util::overloaded{
        [](const SessionsCreate&) { return PermissionTriple{"session", "create", "*"}; },
        [&](const SessionsClose& sc) {
            return PermissionTriple{"session", "close", sc.target.empty() ? session_id : sc.target};
        },
        [](const SessionsList&) { return PermissionTriple{"session", "list", "*"}; },
        [](const MemoryAllocate& sc) {
            return PermissionTriple{"memory", "allocate", memory_category_to_string(sc.category)};
        },
        [](const MemoryRelease& sc) { return PermissionTriple{"memory", "release", sc.handle_id}; },
        [](const MemoryAccess& sc) { return PermissionTriple{"memory", "access", sc.handle_id}; },
        [](const MemoryOptimize& sc) {
            return PermissionTriple{"memory", "optimize",
                sc.strategy ? optimization_strategy_to_string(*sc.strategy) : "default"};
        },
        [](const MemoryStatusQuery&) { return PermissionTriple{"memory", "status", "*"}; },
        [](const SecuritySetLevel& sc) {
            return PermissionTriple{"security", "set_level", security_level_to_string(sc.level)};
        },
        [](const SecurityAddPermission& sc) {
            return PermissionTriple{"security", "add_permission", sc.rule.resource_type};
        },
        [](const SecurityRemovePermission& sc) {
            return PermissionTriple{"security", "remove_permission", sc.resource_type};
        },
        [](const SecurityAudit&) { return PermissionTriple{"security", "audit", "*"}; },
        [](const ToolsList&) { return PermissionTriple{"tool", "list", "*"}; },
        [](const ToolsExecute& sc) { return PermissionTriple{"tool", "execute", sc.tool_id}; },
        [](const SystemInfo&) { return PermissionTriple{"system", "info", "*"}; },
        [](const SystemEcho&) { return PermissionTriple{"system", "echo", "*"}; },
        [](const SystemBackup&) { return PermissionTriple{"system", "backup", "*"}; },
        [](const SystemRestore&) { return PermissionTriple{"system", "restore", "*"}; },
        [](const SystemShutdown&) { return PermissionTriple{"system", "shutdown", "*"}; },
    }, syscall);
}

const char* syscall_name(const Syscall& syscall) {
    return std::visit([](const auto& sc) -> const char* {
        return std::decay_t<decltype(sc)>::NAME;
    }, syscall);
}

} // namespace royaos::kernel
