/**
 * RoyaOS Socket Server
 *
 * Unix domain socket transport. Each accepted client gets its own thread
 * that reads framed messages, hands them to the handler and writes the
 * reply back, so requests from different clients dispatch concurrently.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "ipc/protocol.hpp"

namespace royaos::ipc {

using MessageHandler = std::function<Message(const Message&)>;

class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Create, bind and listen
    bool init();

    void set_handler(MessageHandler handler);

    // Wait up to timeout_ms for a connection and start its client thread.
    // Returns false on a listening socket error.
    bool accept_pending(int timeout_ms);

    // Disconnect every client, join their threads, remove the socket file
    void stop();

    size_t client_count() const;
    const std::string& socket_path() const { return socket_path_; }

private:
    struct ClientConnection {
        int fd;
        uint32_t client_id;
        std::vector<uint8_t> recv_buffer;
        std::thread worker;
        std::atomic<bool> finished{false};

        ClientConnection(int fd_, uint32_t id) : fd(fd_), client_id(id) {}
    };

    std::string socket_path_;
    int server_fd_ = -1;
    MessageHandler handler_;
    uint32_t next_client_id_ = 1;

    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    mutable std::mutex clients_mutex_;

    void serve_client(ClientConnection& client);

    // Returns false when the connection should be dropped
    bool process_messages(ClientConnection& client);
    bool write_all(int fd, const std::vector<uint8_t>& data);

    // Join and forget clients whose thread has exited
    void reap_finished();
};

} // namespace royaos::ipc
