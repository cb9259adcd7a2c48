#include "kernel/kernel.hpp"
#include "kernel/builtin_tools.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <csignal>

using json = nlohmann::json;

namespace royaos::kernel {

// Global kernel pointer for signal handling
static Kernel* g_kernel = nullptr;

static void signal_handler(int signum) {
    (void)signum;
    if (g_kernel) {
        g_kernel->shutdown();
    }
}

json CloseReport::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["status"] = session_status_to_string(SessionStatus::CLOSED);
    j["released"] = released;
    j["bytes_freed"] = bytes_freed;
    j["errors"] = json::array();
    for (const auto& failure : errors) {
        j["errors"].push_back({
            {"handle_id", failure.handle_id},
            {"kind", error_kind_to_string(failure.kind)},
            {"message", failure.message}
        });
    }
    return j;
}

Kernel::Kernel()
    : Kernel(Config{}) {}

Kernel::Kernel(const Config& config, MemoryRegistry::Clock clock,
               std::unique_ptr<SnapshotStore> snapshots)
    : config_(config)
    , started_at_(std::chrono::steady_clock::now())
    , policy_(security_state_)
    , memory_(config.memory, std::move(clock))
    , audit_(config.audit)
    , snapshots_(std::move(snapshots))
    , socket_server_(std::make_unique<ipc::SocketServer>(config.socket_path))
{
    if (!snapshots_) {
        snapshots_ = std::make_unique<FileSnapshotStore>(config_.data_dir);
    }

    policy_.set_level(config_.security_level);
    policy_.grant_operations(config_.allowed_operations);
    for (const auto& rule : config_.permission_rules) {
        policy_.add_rule(rule.resource_type, rule.operation, rule.resource_pattern, rule.effect);
    }

    register_builtin_tools(tools_);
}

Kernel::~Kernel() {
    if (g_kernel == this) {
        g_kernel = nullptr;
    }
}

bool Kernel::init() {
    spdlog::info("Initializing {} kernel...", config_.system_name);

    // Set up message handler
    socket_server_->set_handler([this](const ipc::Message& msg) {
        return handle_message(msg);
    });

    // Initialize socket server
    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    // Set up signal handlers
    g_kernel = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    spdlog::info("Kernel initialized successfully");
    spdlog::info("Security level: {} ({} rules)",
        security_level_to_string(policy_.level()), policy_.rule_count());
    spdlog::info("Memory quota: {} bytes, strategy {}",
        config_.memory.max_allocation_bytes,
        optimization_strategy_to_string(config_.memory.optimization_strategy));
    spdlog::info("Tools: {}", tools_.size());
    return true;
}

void Kernel::run() {
    running_ = true;
    spdlog::info("{} kernel v{} running", config_.system_name, config_.system_version);
    spdlog::info("Listening on: {}", config_.socket_path);

    while (running_) {
        if (!socket_server_->accept_pending(100)) {
            spdlog::error("Socket server error, exiting");
            break;
        }
    }

    spdlog::info("Kernel shutting down...");
    if (!sessions_.live_ids().empty()) {
        try {
            shutdown_sessions(config_.drain_timeout);
        } catch (const KernelError& e) {
            spdlog::warn("{}", e.what());
        }
    }
    socket_server_->stop();

    if (!snapshots_->write(AUDIT_SNAPSHOT, audit_.export_jsonl())) {
        spdlog::error("Failed to flush audit log to snapshot store");
    }
    running_ = false;
    spdlog::info("Kernel stopped");
}

void Kernel::shutdown() {
    running_ = false;
}

// ============================================================================
// Dispatch
// ============================================================================

ipc::Message Kernel::handle_message(const ipc::Message& msg) {
    json j = json::parse(msg.payload_str(), nullptr, false);
    ipc::Response response;

    if (j.is_discarded() || !j.is_object()) {
        response = ipc::Response::failure("", ErrorKind::INVALID_ARGUMENT, "payload is not a JSON object");
    } else if (!j.contains("session_id") || !j["session_id"].is_string()) {
        response = ipc::Response::failure("", ErrorKind::INVALID_ARGUMENT,
            "payload requires a session_id string");
    } else {
        try {
            ipc::Request request = ipc::Request::from_json(j.value("request", json()));
            response = process(j["session_id"].get<std::string>(), request);
        } catch (const KernelError& e) {
            response = ipc::Response::failure("", e.kind(), e.what());
        }
    }

    return ipc::Message(response.to_json().dump());
}

void Kernel::require_active(const std::string& session_id) const {
    auto session = sessions_.get(session_id);
    if (!session || session->status != SessionStatus::ACTIVE) {
        throw KernelError(ErrorKind::SESSION_NOT_FOUND,
            fmt::format("session {} not found", session_id.empty() ? "<none>" : session_id));
    }
}

ipc::Response Kernel::process(const std::string& session_id, const ipc::Request& request) {
    std::string request_type = normalize_request_type(request.type);

    try {
        Syscall syscall = parse_syscall(request);
        request_type = syscall_name(syscall);

        if (!std::holds_alternative<syscalls::SessionsCreate>(syscall)) {
            require_active(session_id);
        }

        // Authorize the strategy that will actually run
        if (auto* optimize = std::get_if<syscalls::MemoryOptimize>(&syscall)) {
            if (!optimize->strategy) {
                optimize->strategy = config_.memory.optimization_strategy;
            }
        }

        PermissionTriple triple = permission_triple(syscall, session_id);
        PermissionDecision decision = policy_.evaluate(triple);

        json details;
        details["request_id"] = request.id;
        details["request_type"] = request_type;
        details["decision"] = decision.to_json();
        audit_.log_decision(session_id, triple.to_json(), decision.allowed(), details);

        if (!decision.allowed()) {
            throw KernelError(ErrorKind::PERMISSION_DENIED,
                fmt::format("{} denied on {}:{}:{}", request_type,
                    triple.resource_type, triple.operation, triple.resource));
        }

        spdlog::debug("Session {} -> {}", session_id, request_type);
        json data = std::visit([&](const auto& sc) { return handle(session_id, sc); }, syscall);
        return ipc::Response::ok(request.id, std::move(data));

    } catch (const KernelError& e) {
        spdlog::warn("Request {} ({}) from session {} failed: {} ({})",
            request.id, request_type, session_id, e.what(), error_kind_to_string(e.kind()));
        audit_.log_failure(session_id, request_type, error_kind_to_string(e.kind()), e.what());
        return ipc::Response::failure(request.id, e.kind(), e.what());
    }
}

// ============================================================================
// Session lifecycle
// ============================================================================

Session Kernel::create_session(const std::map<std::string, std::string>& metadata) {
    if (shutting_down_) {
        throw KernelError(ErrorKind::PERMISSION_DENIED, "kernel is shutting down");
    }
    Session session = sessions_.create(metadata);
    audit_.log(AuditCategory::SESSION, "SESSION_CREATED", session.id,
        {{"metadata", session.metadata}});
    return session;
}

CloseReport Kernel::close_session(const std::string& session_id) {
    CloseReport report;
    report.session_id = session_id;

    std::vector<std::string> handles = sessions_.begin_close(session_id);

    for (const auto& handle_id : handles) {
        auto txn = sessions_.begin();
        auto owner = txn.owner_of(handle_id);
        if (!owner || *owner != session_id) {
            continue;  // Reclaimed by optimization after the snapshot
        }
        try {
            MemoryHandle released = memory_.release(handle_id);
            report.released.push_back(handle_id);
            report.bytes_freed += released.size_bytes;
        } catch (const KernelError& e) {
            report.errors.push_back(CloseFailure{handle_id, e.kind(), e.what()});
            spdlog::warn("Session {}: failed to release {}: {}", session_id, handle_id, e.what());
        }
        txn.disown(handle_id);
    }

    sessions_.finish_close(session_id);

    json details = report.to_json();
    audit_.log(AuditCategory::SESSION, "SESSION_CLOSED", session_id, details, report.errors.empty());
    for (const auto& failure : report.errors) {
        audit_.log(AuditCategory::MEMORY, "RELEASE_FAILED", session_id,
            {{"handle_id", failure.handle_id},
             {"kind", error_kind_to_string(failure.kind)},
             {"message", failure.message}}, false);
    }
    return report;
}

json Kernel::shutdown_sessions(std::chrono::milliseconds timeout) {
    shutting_down_ = true;
    spdlog::info("Shutdown requested, closing {} session(s)", sessions_.size());

    json closed = json::array();
    for (const auto& id : sessions_.active_ids()) {
        try {
            closed.push_back(close_session(id).to_json());
        } catch (const KernelError& e) {
            // Closed concurrently by its own client
            spdlog::debug("Session {} already closing: {}", id, e.what());
        }
    }

    bool drained = sessions_.wait_until_empty(timeout);

    if (!snapshots_->write(AUDIT_SNAPSHOT, audit_.export_jsonl())) {
        spdlog::error("Failed to flush audit log to snapshot store");
    }

    if (!drained) {
        std::vector<std::string> stragglers = sessions_.live_ids();
        audit_.log(AuditCategory::SYSTEM, "SHUTDOWN_INCOMPLETE", "",
            {{"stragglers", stragglers}, {"timeout_ms", timeout.count()}}, false);
        throw KernelError(ErrorKind::SHUTDOWN_INCOMPLETE,
            fmt::format("sessions still live after {}ms: {}", timeout.count(),
                fmt::join(stragglers, ", ")));
    }

    audit_.log(AuditCategory::SYSTEM, "SHUTDOWN", "", {{"closed_sessions", closed.size()}});

    json result;
    result["closed"] = closed;
    result["drained"] = true;
    return result;
}

json Kernel::backup() {
    json policy = policy_.snapshot();
    std::string audit_blob = audit_.export_jsonl();

    bool policy_ok = snapshots_->write(POLICY_SNAPSHOT, policy.dump(2));
    bool audit_ok = snapshots_->write(AUDIT_SNAPSHOT, audit_blob);

    json result;
    result["policy"] = {{"name", POLICY_SNAPSHOT}, {"stored", policy_ok},
                        {"rules", policy["rules"].size()}};
    result["audit"] = {{"name", AUDIT_SNAPSHOT}, {"stored", audit_ok},
                       {"entries", audit_.entry_count()}};

    audit_.log(AuditCategory::SYSTEM, "BACKUP", "", result, policy_ok && audit_ok);
    if (!policy_ok || !audit_ok) {
        spdlog::error("Backup incomplete (policy={}, audit={})", policy_ok, audit_ok);
    }
    return result;
}

json Kernel::restore() {
    auto blob = snapshots_->read(POLICY_SNAPSHOT);
    if (!blob) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "no policy snapshot stored");
    }

    json snapshot = json::parse(*blob, nullptr, false);
    if (snapshot.is_discarded() || !snapshot.is_object()) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT, "stored policy snapshot is malformed");
    }
    try {
        policy_.restore(snapshot);
    } catch (const json::exception& e) {
        throw KernelError(ErrorKind::INVALID_ARGUMENT,
            fmt::format("stored policy snapshot is malformed: {}", e.what()));
    }

    json result;
    result["level"] = security_level_to_string(policy_.level());
    result["rules"] = policy_.rule_count();
    audit_.log(AuditCategory::SECURITY, "POLICY_RESTORED", "", result);
    return result;
}

// ============================================================================
// Session handlers
// ============================================================================

json Kernel::handle(const std::string&, const syscalls::SessionsCreate& sc) {
    return create_session(sc.metadata).to_json();
}

json Kernel::handle(const std::string& sid, const syscalls::SessionsClose& sc) {
    return close_session(sc.target.empty() ? sid : sc.target).to_json();
}

json Kernel::handle(const std::string&, const syscalls::SessionsList&) {
    json sessions = json::array();
    for (const auto& session : sessions_.list()) {
        sessions.push_back(session.to_json());
    }
    json result;
    result["sessions"] = sessions;
    result["count"] = sessions.size();
    return result;
}

// ============================================================================
// Memory handlers
// ============================================================================

json Kernel::handle(const std::string& sid, const syscalls::MemoryAllocate& sc) {
    // Table lock first, then the registry lock inside allocate()
    auto txn = sessions_.begin();
    Session& session = txn.active(sid);

    MemoryHandle handle = memory_.allocate(sid, sc.category, sc.size_bytes, sc.purpose);
    try {
        txn.own(session, handle.id);
    } catch (...) {
        memory_.release(handle.id);
        throw;
    }

    spdlog::debug("Session {} allocated {} ({} bytes, {})",
        sid, handle.id, handle.size_bytes, memory_category_to_string(handle.category));
    return handle.to_json();
}

json Kernel::handle(const std::string& sid, const syscalls::MemoryRelease& sc) {
    auto txn = sessions_.begin();
    txn.active(sid);

    auto owner = txn.owner_of(sc.handle_id);
    if (!owner || *owner != sid) {
        throw KernelError(ErrorKind::HANDLE_NOT_FOUND,
            fmt::format("handle {} not found", sc.handle_id));
    }

    MemoryHandle released = memory_.release(sc.handle_id);
    txn.disown(sc.handle_id);

    json result;
    result["handle_id"] = released.id;
    result["bytes_freed"] = released.size_bytes;
    result["category"] = memory_category_to_string(released.category);
    return result;
}

json Kernel::handle(const std::string& sid, const syscalls::MemoryAccess& sc) {
    auto txn = sessions_.begin();
    txn.active(sid);

    auto owner = txn.owner_of(sc.handle_id);
    if (!owner || *owner != sid) {
        throw KernelError(ErrorKind::HANDLE_NOT_FOUND,
            fmt::format("handle {} not found", sc.handle_id));
    }
    return memory_.access(sc.handle_id).to_json();
}

json Kernel::handle(const std::string& sid, const syscalls::MemoryOptimize& sc) {
    OptimizationStrategy strategy = sc.strategy.value_or(config_.memory.optimization_strategy);

    OptimizationResult result;
    {
        // Reclaim and disown under one table transaction
        auto txn = sessions_.begin();
        result = memory_.optimize(strategy);
        for (const auto& handle : result.reclaimed) {
            txn.disown(handle.id);
        }
    }

    json data = result.to_json();
    audit_.log(AuditCategory::MEMORY, "MEMORY_OPTIMIZED", sid, data);
    return data;
}

json Kernel::handle(const std::string&, const syscalls::MemoryStatusQuery&) {
    return memory_.status().to_json();
}

// ============================================================================
// Security handlers
// ============================================================================

json Kernel::handle(const std::string& sid, const syscalls::SecuritySetLevel& sc) {
    SecurityLevel previous = policy_.level();
    policy_.set_level(sc.level);

    json result;
    result["previous_level"] = security_level_to_string(previous);
    result["level"] = security_level_to_string(sc.level);
    audit_.log(AuditCategory::SECURITY, "LEVEL_CHANGED", sid, result);
    return result;
}

json Kernel::handle(const std::string& sid, const syscalls::SecurityAddPermission& sc) {
    policy_.add_rule(sc.rule.resource_type, sc.rule.operation,
                     sc.rule.resource_pattern, sc.rule.effect);

    json result;
    result["rule"] = sc.rule.to_json();
    result["rule_count"] = policy_.rule_count();
    audit_.log(AuditCategory::SECURITY, "RULE_ADDED", sid, result);
    return result;
}

json Kernel::handle(const std::string& sid, const syscalls::SecurityRemovePermission& sc) {
    size_t removed = policy_.remove_rule(sc.resource_type, sc.operation, sc.resource, sc.effect);

    json result;
    result["removed"] = removed;
    result["rule_count"] = policy_.rule_count();
    audit_.log(AuditCategory::SECURITY, "RULE_REMOVED", sid,
        {{"resource_type", sc.resource_type}, {"operation", sc.operation},
         {"resource", sc.resource}, {"removed", removed}});
    return result;
}

json Kernel::handle(const std::string&, const syscalls::SecurityAudit& sc) {
    json entries = json::array();
    for (const auto& entry : audit_.recent(sc.limit)) {
        entries.push_back(entry.to_json());
    }
    json result;
    result["entries"] = entries;
    result["count"] = entries.size();
    result["total"] = audit_.entry_count();
    return result;
}

// ============================================================================
// Tool handlers
// ============================================================================

json Kernel::handle(const std::string&, const syscalls::ToolsList&) {
    json tools = json::array();
    for (const auto& desc : tools_.list()) {
        tools.push_back(tools_.describe(desc.id));
    }
    json result;
    result["tools"] = tools;
    result["count"] = tools.size();
    return result;
}

json Kernel::handle(const std::string& sid, const syscalls::ToolsExecute& sc) {
    json details;
    details["tool_id"] = sc.tool_id;
    details["capability"] = sc.capability;

    try {
        ToolResult result = tools_.invoke(sc.tool_id, sc.capability, sc.parameters);
        details["execution_time_us"] = result.duration.count();
        audit_.log(AuditCategory::TOOL, "TOOL_EXECUTED", sid, details);
        return result.to_json();
    } catch (const KernelError& e) {
        details["error"] = e.what();
        audit_.log(AuditCategory::TOOL, "TOOL_EXECUTED", sid, details, false);
        throw;
    }
}

// ============================================================================
// System handlers
// ============================================================================

json Kernel::handle(const std::string&, const syscalls::SystemInfo&) {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    json result;
    result["name"] = config_.system_name;
    result["version"] = config_.system_version;
    result["api_version"] = API_VERSION;
    result["uptime_seconds"] = uptime.count();
    result["security_level"] = security_level_to_string(policy_.level());
    result["sessions"] = sessions_.size();
    result["connections"] = socket_server_->client_count();
    result["tools"] = tools_.size();
    result["shutting_down"] = shutting_down_.load();
    return result;
}

json Kernel::handle(const std::string&, const syscalls::SystemEcho& sc) {
    return sc.payload;
}

json Kernel::handle(const std::string&, const syscalls::SystemBackup&) {
    return backup();
}

json Kernel::handle(const std::string&, const syscalls::SystemRestore&) {
    return restore();
}

json Kernel::handle(const std::string&, const syscalls::SystemShutdown& sc) {
    json result = shutdown_sessions(sc.drain_timeout.value_or(config_.drain_timeout));
    shutdown();
    return result;
}

} // namespace royaos::kernel
