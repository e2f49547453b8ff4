#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace caserun::ipc {

namespace {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace

SocketServer::SocketServer(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    // Stale socket from a previous run
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    if (!set_nonblocking(server_fd_)) {
        spdlog::error("Failed to set non-blocking: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 64) < 0) {
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

int SocketServer::accept_connection() {
    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept: {}", strerror(errno));
        }
        return -1;
    }

    uint32_t client_id = next_client_id_++;
    clients_[client_fd] = std::make_unique<ClientConnection>(client_fd, client_id);
    client_fds_[client_id] = client_fd;

    spdlog::debug("Client {} connected (fd={})", client_id, client_fd);
    return client_fd;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;
    uint8_t buffer[4096];

    while (true) {
        ssize_t n = read(client_fd, buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
        } else if (n == 0) {
            spdlog::debug("Client {} disconnected (fd={})", client.client_id, client_fd);
            return false;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Read error for client {}: {}", client.client_id, strerror(errno));
            return false;
        }
    }

    return process_messages(client);
}

bool SocketServer::process_messages(ClientConnection& client) {
    while (!client.close_after_flush) {
        const uint8_t* data = client.recv_buffer.data();
        size_t len = client.recv_buffer.size();

        // Framing is lost after a bad header; there is no resync marker
        if (Message::header_invalid(data, len)) {
            spdlog::warn("Invalid frame from client {}, closing connection", client.client_id);
            return false;
        }

        auto msg_size = Message::get_message_size(data, len);
        if (!msg_size || len < *msg_size) {
            break;  // Need more data
        }

        auto msg = Message::deserialize(data, len);
        client.recv_buffer.erase(client.recv_buffer.begin(),
                                 client.recv_buffer.begin() + *msg_size);
        if (!msg) {
            return false;
        }

        spdlog::debug("Client {} -> {} ({}B payload)",
            client.client_id, opcode_to_string(msg->opcode), msg->payload.size());

        if (!handler_) {
            continue;
        }

        msg->client_id = client.client_id;
        Message response = handler_(*msg);
        response.client_id = client.client_id;
        queue(client, response);

        if (msg->opcode == Opcode::EXIT) {
            client.close_after_flush = true;
        }

        spdlog::debug("Client {} <- {} ({}B payload)",
            client.client_id, opcode_to_string(response.opcode), response.payload.size());
    }
    return true;
}

void SocketServer::queue(ClientConnection& client, const Message& msg) {
    auto serialized = msg.serialize();
    client.send_buffer.insert(client.send_buffer.end(), serialized.begin(), serialized.end());
    client.want_write = true;
}

int SocketServer::send_to_client(uint32_t client_id, const Message& msg) {
    auto fd_it = client_fds_.find(client_id);
    if (fd_it == client_fds_.end()) {
        return -1;
    }
    auto it = clients_.find(fd_it->second);
    if (it == clients_.end()) {
        return -1;
    }

    auto& client = *it->second;
    if (client.send_buffer.size() > MAX_SEND_BACKLOG) {
        spdlog::warn("Client {} send backlog full, dropping {}",
            client_id, opcode_to_string(msg.opcode));
        return -1;
    }

    Message framed = msg;
    framed.client_id = client_id;
    queue(client, framed);
    return client.fd;
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;

    while (!client.send_buffer.empty()) {
        ssize_t n = send(client_fd, client.send_buffer.data(), client.send_buffer.size(),
                         MSG_NOSIGNAL);
        if (n > 0) {
            client.send_buffer.erase(client.send_buffer.begin(),
                                     client.send_buffer.begin() + n);
        } else if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Write error for client {}: {}", client.client_id, strerror(errno));
            return false;
        }
    }

    client.want_write = !client.send_buffer.empty();
    if (client.close_after_flush && !client.want_write) {
        return false;
    }
    return true;
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    return it->second->want_write;
}

uint32_t SocketServer::client_id_for_fd(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it == clients_.end() ? 0 : it->second->client_id;
}

void SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it != clients_.end()) {
        client_fds_.erase(it->second->client_id);
        close(client_fd);
        clients_.erase(it);
    }
}

void SocketServer::stop() {
    for (auto& [fd, client] : clients_) {
        close(fd);
    }
    clients_.clear();
    client_fds_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::info("Socket server stopped");
    }
}

} // namespace caserun::ipc
