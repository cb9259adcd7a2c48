/**
 * RoyaOS Audit Log
 *
 * Bounded, append-only record of permission decisions, failed requests
 * and lifecycle events. Security entries are always recorded; the other
 * categories can be switched off. Can be exported as JSONL for the
 * snapshot store.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace royaos::kernel {

// Audit event categories
enum class AuditCategory {
    SECURITY,   // Permission decisions, policy changes, refused requests
    SESSION,    // Create, close
    MEMORY,     // Optimization, release failures during close
    TOOL,       // Tool executions
    SYSTEM      // Backup, restore, shutdown
};

// Convert AuditCategory to string
inline std::string audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SECURITY: return "SECURITY";
        case AuditCategory::SESSION:  return "SESSION";
        case AuditCategory::MEMORY:   return "MEMORY";
        case AuditCategory::TOOL:     return "TOOL";
        case AuditCategory::SYSTEM:   return "SYSTEM";
        default: return "UNKNOWN";
    }
}

// Audit log entry
struct AuditLogEntry {
    uint64_t id;                              // Unique, increasing
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category;
    std::string event_type;                   // e.g., "PERMISSION_DENIED", "REQUEST_FAILED"
    std::string session_id;                   // Empty for kernel-originated events
    nlohmann::json details;                   // Event-specific details
    bool success;

    nlohmann::json to_json() const;
};

// Audit logger configuration
struct AuditConfig {
    size_t max_entries = 10000;               // Max entries in memory
    bool log_session = true;
    bool log_memory = true;
    bool log_tool = true;
    bool log_system = true;

    // SECURITY is always enabled
    bool is_enabled(AuditCategory cat) const;
};

class AuditLogger {
public:
    explicit AuditLogger(const AuditConfig& config = {});

    // Log an event
    void log(AuditCategory category,
             const std::string& event_type,
             const std::string& session_id,
             const nlohmann::json& details,
             bool success = true);

    // Permission decision for a request triple
    void log_decision(const std::string& session_id,
                      const nlohmann::json& triple,
                      bool allowed,
                      const nlohmann::json& details);

    // Request that failed with the given error kind
    void log_failure(const std::string& session_id,
                     const std::string& request_type,
                     const std::string& error_kind,
                     const std::string& message);

    // Most recent first
    std::vector<AuditLogEntry> get_entries(
        const AuditCategory* category = nullptr,   // nullptr = all
        const std::string* session_id = nullptr,   // nullptr = all
        uint64_t since_id = 0,                     // Only entries after this ID
        size_t limit = 100
    ) const;

    std::vector<AuditLogEntry> recent(size_t limit) const;

    // Oldest first, 0 = all entries
    std::string export_jsonl(size_t limit = 0) const;

    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    // Trim entries to max size
    void trim_entries();
};

} // namespace royaos::kernel
