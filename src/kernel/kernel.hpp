/**
 * RoyaOS Kernel
 *
 * Request dispatch core. Owns every subsystem:
 * - SessionTable (live sessions and the handles they own)
 * - MemoryRegistry (allocation records and quotas)
 * - PermissionPolicy (allow/deny rules over a SecurityState)
 * - ToolRegistry (tool capabilities)
 * - AuditLogger (permission decisions and failures)
 * - SocketServer (Unix domain socket IPC)
 *
 * process() is safe to call from many threads at once; there is no
 * kernel-wide lock.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "ipc/socket_server.hpp"
#include "kernel/audit_log.hpp"
#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "kernel/memory_registry.hpp"
#include "kernel/permissions.hpp"
#include "kernel/session_table.hpp"
#include "kernel/snapshot_store.hpp"
#include "kernel/syscalls.hpp"
#include "kernel/tool_registry.hpp"

namespace royaos::kernel {

constexpr const char* API_VERSION = "v1";

// Snapshot blob names
constexpr const char* POLICY_SNAPSHOT = "policy.json";
constexpr const char* AUDIT_SNAPSHOT = "audit.jsonl";

// A handle that could not be released while closing a session
struct CloseFailure {
    std::string handle_id;
    ErrorKind kind;
    std::string message;
};

struct CloseReport {
    std::string session_id;
    std::vector<std::string> released;
    uint64_t bytes_freed = 0;
    std::vector<CloseFailure> errors;

    nlohmann::json to_json() const;
};

class Kernel {
public:
    using Config = KernelConfig;

    Kernel();

    // An empty clock means steady_clock::now; a null store means a
    // FileSnapshotStore under config.data_dir
    explicit Kernel(const Config& config,
                    MemoryRegistry::Clock clock = {},
                    std::unique_ptr<SnapshotStore> snapshots = nullptr);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Bind the socket and install signal handlers
    bool init();

    // Serve clients (blocks until shutdown)
    void run();

    // Request the run loop to stop
    void shutdown();

    bool is_running() const { return running_; }
    bool is_shutting_down() const { return shutting_down_; }

    // Dispatch one request on behalf of session_id. Recoverable failures
    // come back as the failure branch; InvariantViolation propagates.
    ipc::Response process(const std::string& session_id, const ipc::Request& request);

    // Throws PERMISSION_DENIED once shutdown has begun
    Session create_session(const std::map<std::string, std::string>& metadata);

    // Active -> Closing -> Closed, releasing every owned handle best-effort.
    // Throws SESSION_NOT_FOUND unless the session is Active.
    CloseReport close_session(const std::string& session_id);

    // Close every live session and wait for the table to drain. Throws
    // SHUTDOWN_INCOMPLETE listing the sessions still present at timeout.
    nlohmann::json shutdown_sessions(std::chrono::milliseconds timeout);

    // Write the policy snapshot and the audit log to the snapshot store
    nlohmann::json backup();

    // Reload the policy snapshot; INVALID_ARGUMENT if none or malformed
    nlohmann::json restore();

    MemoryRegistry& memory() { return memory_; }
    SessionTable& sessions() { return sessions_; }
    PermissionPolicy& policy() { return policy_; }
    ToolRegistry& tools() { return tools_; }
    AuditLogger& audit() { return audit_; }
    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};
    std::chrono::steady_clock::time_point started_at_;

    SecurityState security_state_;
    PermissionPolicy policy_;
    MemoryRegistry memory_;
    SessionTable sessions_;
    ToolRegistry tools_;
    AuditLogger audit_;
    std::unique_ptr<SnapshotStore> snapshots_;
    std::unique_ptr<ipc::SocketServer> socket_server_;

    // Transport entry point: {"session_id", "request"} in, Response out
    ipc::Message handle_message(const ipc::Message& msg);

    void require_active(const std::string& session_id) const;

    // Session handlers
    nlohmann::json handle(const std::string& sid, const syscalls::SessionsCreate& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SessionsClose& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SessionsList& sc);

    // Memory handlers
    nlohmann::json handle(const std::string& sid, const syscalls::MemoryAllocate& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::MemoryRelease& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::MemoryAccess& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::MemoryOptimize& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::MemoryStatusQuery& sc);

    // Security handlers
    nlohmann::json handle(const std::string& sid, const syscalls::SecuritySetLevel& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SecurityAddPermission& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SecurityRemovePermission& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SecurityAudit& sc);

    // Tool handlers
    nlohmann::json handle(const std::string& sid, const syscalls::ToolsList& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::ToolsExecute& sc);

    // System handlers
    nlohmann::json handle(const std::string& sid, const syscalls::SystemInfo& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SystemEcho& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SystemBackup& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SystemRestore& sc);
    nlohmann::json handle(const std::string& sid, const syscalls::SystemShutdown& sc);
};

} // namespace royaos::kernel
