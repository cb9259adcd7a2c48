#include "ipc/socket_server.hpp"
#include "kernel/errors.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace royaos::ipc {

SocketServer::SocketServer(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    // Remove existing socket file
    unlink(socket_path_.c_str());

    // Create Unix domain socket
    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    // Bind to socket path
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Listen for connections
    if (listen(server_fd_, 16) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    spdlog::info("Socket server listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

bool SocketServer::accept_pending(int timeout_ms) {
    reap_finished();

    if (server_fd_ < 0) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = server_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int n = poll(&pfd, 1, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return true;
        }
        spdlog::error("Poll error on listening socket: {}", strerror(errno));
        return false;
    }
    if (n == 0 || !(pfd.revents & POLLIN)) {
        return true;
    }

    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            spdlog::error("Failed to accept: {}", strerror(errno));
        }
        return true;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    uint32_t client_id = next_client_id_++;
    auto client = std::make_unique<ClientConnection>(client_fd, client_id);
    ClientConnection& ref = *client;
    clients_[client_fd] = std::move(client);
    ref.worker = std::thread([this, &ref] { serve_client(ref); });

    spdlog::info("Client {} connected (fd={})", client_id, client_fd);
    return true;
}

void SocketServer::serve_client(ClientConnection& client) {
    uint8_t buffer[4096];

    while (true) {
        ssize_t n = read(client.fd, buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
            if (!process_messages(client)) {
                break;
            }
        } else if (n == 0) {
            spdlog::info("Client {} disconnected (fd={})", client.client_id, client.fd);
            break;
        } else {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("Read error for client {}: {}", client.client_id, strerror(errno));
            break;
        }
    }

    client.finished = true;
}

bool SocketServer::process_messages(ClientConnection& client) {
    while (client.recv_buffer.size() >= HEADER_SIZE) {
        auto msg_size = Message::get_message_size(
            client.recv_buffer.data(),
            client.recv_buffer.size()
        );

        if (!msg_size) {
            // Bad magic or oversized payload: the stream cannot be resynced
            spdlog::warn("Invalid frame from client {}, dropping connection", client.client_id);
            return false;
        }
        if (client.recv_buffer.size() < *msg_size) {
            break; // Need more data
        }

        auto msg = Message::deserialize(client.recv_buffer.data(), client.recv_buffer.size());
        client.recv_buffer.erase(
            client.recv_buffer.begin(),
            client.recv_buffer.begin() + *msg_size
        );
        if (!msg || !handler_) {
            continue;
        }

        spdlog::debug("Client {} -> {}B payload", client.client_id, msg->payload.size());

        Message response;
        try {
            response = handler_(*msg);
        } catch (const kernel::InvariantViolation& e) {
            spdlog::critical("Invariant violation while serving client {}: {}", client.client_id, e.what());
            spdlog::shutdown();
            std::abort();
        } catch (const std::exception& e) {
            spdlog::error("Handler failed for client {}: {}", client.client_id, e.what());
            return false;
        }

        if (!write_all(client.fd, response.serialize())) {
            return false;
        }
        spdlog::debug("Client {} <- {}B payload", client.client_id, response.payload.size());
    }
    return true;
}

bool SocketServer::write_all(int fd, const std::vector<uint8_t>& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            spdlog::debug("Write error on fd {}: {}", fd, strerror(errno));
            return false;
        }
    }
    return true;
}

void SocketServer::reap_finished() {
    std::vector<std::unique_ptr<ClientConnection>> done;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (it->second->finished) {
                done.push_back(std::move(it->second));
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : done) {
        if (client->worker.joinable()) {
            client->worker.join();
        }
        close(client->fd);
    }
}

size_t SocketServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void SocketServer::stop() {
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }

    // Unblock readers but keep the write side open, so a request being
    // handled right now (system_shutdown included) still gets its reply
    for (auto& [fd, client] : clients) {
        shutdown(fd, SHUT_RD);
    }
    for (auto& [fd, client] : clients) {
        if (client->worker.joinable()) {
            client->worker.join();
        }
        close(fd);
    }

    // Close server socket
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::info("Socket server stopped");
    }
}

} // namespace royaos::ipc
