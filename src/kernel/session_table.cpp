#include "kernel/session_table.hpp"
#include "kernel/errors.hpp"
#include "util/ids.hpp"
#include "util/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace royaos::kernel {

using json = nlohmann::json;

json Session::to_json() const {
    json j;
    j["session_id"] = id;
    j["status"] = session_status_to_string(status);
    j["created_at"] = util::format_iso8601(created_at);
    j["last_activity"] = util::format_iso8601(last_activity);
    j["metadata"] = metadata;
    j["owned_handles"] = owned_handles;
    return j;
}

// ============================================================================
// Transaction
// ============================================================================

SessionTable::Transaction::Transaction(SessionTable& table)
    : table_(table)
    , lock_(table.mutex_) {}

Session& SessionTable::Transaction::active(const std::string& session_id) {
    auto it = table_.sessions_.find(session_id);
    if (it == table_.sessions_.end() || it->second.status != SessionStatus::ACTIVE) {
        throw KernelError(ErrorKind::SESSION_NOT_FOUND,
            fmt::format("session {} not found", session_id));
    }
    it->second.last_activity = std::chrono::system_clock::now();
    return it->second;
}

void SessionTable::Transaction::own(Session& session, const std::string& handle_id) {
    auto [it, inserted] = table_.handle_owners_.emplace(handle_id, session.id);
    if (!inserted) {
        throw InvariantViolation(fmt::format(
            "handle {} already owned by session {}", handle_id, it->second));
    }
    session.owned_handles.insert(handle_id);
}

std::optional<std::string> SessionTable::Transaction::disown(const std::string& handle_id) {
    auto it = table_.handle_owners_.find(handle_id);
    if (it == table_.handle_owners_.end()) {
        return std::nullopt;
    }
    std::string owner = it->second;
    table_.handle_owners_.erase(it);

    auto session = table_.sessions_.find(owner);
    if (session == table_.sessions_.end() || session->second.owned_handles.erase(handle_id) == 0) {
        throw InvariantViolation(fmt::format(
            "handle {} indexed to session {} which does not hold it", handle_id, owner));
    }
    return owner;
}

std::optional<std::string> SessionTable::Transaction::owner_of(const std::string& handle_id) const {
    auto it = table_.handle_owners_.find(handle_id);
    if (it == table_.handle_owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// SessionTable
// ============================================================================

SessionTable::Transaction SessionTable::begin() {
    return Transaction(*this);
}

Session SessionTable::create(const std::map<std::string, std::string>& metadata) {
    Session session;
    session.id = util::generate_token("sess");
    session.created_at = std::chrono::system_clock::now();
    session.last_activity = session.created_at;
    session.metadata = metadata;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(session.id, session).second) {
        throw InvariantViolation(fmt::format("duplicate session id {}", session.id));
    }
    spdlog::info("Created session {}", session.id);
    return session;
}

std::optional<Session> SessionTable::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Session> SessionTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::vector<std::string> SessionTable::begin_close(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.status != SessionStatus::ACTIVE) {
        throw KernelError(ErrorKind::SESSION_NOT_FOUND,
            fmt::format("session {} not found", session_id));
    }
    it->second.status = SessionStatus::CLOSING;
    spdlog::debug("Session {} closing ({} handle(s))", session_id, it->second.owned_handles.size());
    return std::vector<std::string>(it->second.owned_handles.begin(), it->second.owned_handles.end());
}

Session SessionTable::finish_close(const std::string& session_id) {
    Session closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second.status != SessionStatus::CLOSING) {
            throw InvariantViolation(fmt::format(
                "finish_close on session {} which is not closing", session_id));
        }

        for (const auto& handle_id : it->second.owned_handles) {
            handle_owners_.erase(handle_id);
        }
        it->second.owned_handles.clear();
        it->second.status = SessionStatus::CLOSED;
        closed = std::move(it->second);
        sessions_.erase(it);
    }
    drained_.notify_all();
    spdlog::info("Closed session {}", session_id);
    return closed;
}

std::vector<std::string> SessionTable::live_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> SessionTable::active_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, session] : sessions_) {
        if (session.status == SessionStatus::ACTIVE) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t SessionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionTable::wait_until_empty(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_for(lock, timeout, [this] { return sessions_.empty(); });
}

} // namespace royaos::kernel
