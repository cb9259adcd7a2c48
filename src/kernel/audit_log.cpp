#include "kernel/audit_log.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace royaos::kernel {

using json = nlohmann::json;

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["category"] = audit_category_to_string(category);
    j["event_type"] = event_type;
    if (!session_id.empty()) {
        j["session_id"] = session_id;
    }
    j["success"] = success;
    j["details"] = details;
    return j;
}

// ============================================================================
// AuditConfig Implementation
// ============================================================================

bool AuditConfig::is_enabled(AuditCategory cat) const {
    switch (cat) {
        case AuditCategory::SECURITY: return true;
        case AuditCategory::SESSION:  return log_session;
        case AuditCategory::MEMORY:   return log_memory;
        case AuditCategory::TOOL:     return log_tool;
        case AuditCategory::SYSTEM:   return log_system;
        default: return false;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    spdlog::debug("Audit log ready, keeping at most {} entries", config_.max_entries);
}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      const std::string& session_id,
                      const json& details,
                      bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.is_enabled(category)) {
        return;
    }

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.session_id = session_id;
    entry.details = details;
    entry.success = success;

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Audit[{}]: {} session={} success={}",
                  audit_category_to_string(category),
                  event_type, session_id, success);
}

void AuditLogger::log_decision(const std::string& session_id,
                               const json& triple,
                               bool allowed,
                               const json& details) {
    json d = details;
    d["triple"] = triple;
    d["verdict"] = allowed ? "allow" : "deny";
    log(AuditCategory::SECURITY,
        allowed ? "PERMISSION_GRANTED" : "PERMISSION_DENIED",
        session_id, d, allowed);
}

void AuditLogger::log_failure(const std::string& session_id,
                              const std::string& request_type,
                              const std::string& error_kind,
                              const std::string& message) {
    json details;
    details["request_type"] = request_type;
    details["error_kind"] = error_kind;
    details["message"] = message;
    log(AuditCategory::SECURITY, "REQUEST_FAILED", session_id, details, false);
}

std::vector<AuditLogEntry> AuditLogger::get_entries(
    const AuditCategory* category,
    const std::string* session_id,
    uint64_t since_id,
    size_t limit) const {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        const auto& entry = *it;

        if (entry.id <= since_id) {
            break;  // Ids only grow, nothing older can match
        }
        if (category && entry.category != *category) {
            continue;
        }
        if (session_id && entry.session_id != *session_id) {
            continue;
        }

        result.push_back(entry);
    }

    return result;
}

std::vector<AuditLogEntry> AuditLogger::recent(size_t limit) const {
    return get_entries(nullptr, nullptr, 0, limit);
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_json().dump() << '\n';
        count++;
    }

    return oss.str();
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace royaos::kernel
