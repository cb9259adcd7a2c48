/**
 * RoyaOS Session Table
 *
 * Live sessions, their metadata, and the resource handles each one owns.
 * A handle -> owner index enforces that a handle belongs to at most one
 * session. Multi-step updates that must be atomic with another subsystem
 * run inside a Transaction, which holds the table lock for its lifetime.
 *
 * Lock order: the table lock is always taken before the memory registry
 * lock, never the other way round.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace royaos::kernel {

// Longest shutdown drain a request or the configuration may ask for.
// wait_until_empty converts to nanoseconds, which overflows far above this.
constexpr std::chrono::milliseconds MAX_DRAIN_TIMEOUT = std::chrono::hours(24);

enum class SessionStatus {
    ACTIVE,
    CLOSING,    // Close in progress, no new requests accepted
    CLOSED
};

inline const char* session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::ACTIVE:  return "active";
        case SessionStatus::CLOSING: return "closing";
        case SessionStatus::CLOSED:  return "closed";
        default: return "unknown";
    }
}

struct Session {
    std::string id;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;
    std::map<std::string, std::string> metadata;
    SessionStatus status = SessionStatus::ACTIVE;
    std::set<std::string> owned_handles;

    bool owns(const std::string& handle_id) const {
        return owned_handles.count(handle_id) > 0;
    }

    nlohmann::json to_json() const;
};

class SessionTable {
public:
    class Transaction {
    public:
        // Active session or SESSION_NOT_FOUND; refreshes last_activity
        Session& active(const std::string& session_id);

        // Record ownership. A handle already owned by anyone is an
        // invariant violation.
        void own(Session& session, const std::string& handle_id);

        // Drop ownership wherever it is; returns the former owner
        std::optional<std::string> disown(const std::string& handle_id);

        std::optional<std::string> owner_of(const std::string& handle_id) const;

    private:
        friend class SessionTable;
        explicit Transaction(SessionTable& table);

        SessionTable& table_;
        std::unique_lock<std::mutex> lock_;
    };

    SessionTable() = default;

    // Non-copyable
    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;

    Transaction begin();

    Session create(const std::map<std::string, std::string>& metadata);

    std::optional<Session> get(const std::string& session_id) const;
    std::vector<Session> list() const;

    // Active -> Closing. Returns a snapshot of the owned handles; throws
    // SESSION_NOT_FOUND unless the session is Active.
    std::vector<std::string> begin_close(const std::string& session_id);

    // Closing -> Closed: drops any ownership left and removes the record.
    // Returns the final record.
    Session finish_close(const std::string& session_id);

    // Sessions still in the table (Active or Closing)
    std::vector<std::string> live_ids() const;
    std::vector<std::string> active_ids() const;
    size_t size() const;

    // Blocks until the table is empty or the timeout elapses. The timeout
    // must not exceed MAX_DRAIN_TIMEOUT.
    bool wait_until_empty(std::chrono::milliseconds timeout);

private:
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, std::string> handle_owners_;  // handle -> session
    mutable std::mutex mutex_;
    std::condition_variable drained_;
};

} // namespace royaos::kernel
