/**
 * caserun Socket Server
 *
 * Non-blocking Unix domain socket server. Owns per-connection receive and
 * send buffers; the reactor drives it. Replies are queued by the message
 * handler, stream pushes by send_to_client().
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ipc/protocol.hpp"

namespace caserun::ipc {

struct ClientConnection {
    int fd;
    uint32_t client_id;
    std::vector<uint8_t> recv_buffer;
    std::vector<uint8_t> send_buffer;
    bool want_write = false;
    bool close_after_flush = false;   // set by EXIT

    ClientConnection(int fd_, uint32_t id) : fd(fd_), client_id(id) {}
};

using MessageHandler = std::function<Message(const Message&)>;

class SocketServer {
public:
    // Pushes are dropped for a client whose unsent backlog exceeds this
    static constexpr size_t MAX_SEND_BACKLOG = 8 * 1024 * 1024;

    explicit SocketServer(const std::string& socket_path);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool init();
    int get_server_fd() const { return server_fd_; }
    const std::string& socket_path() const { return socket_path_; }

    void set_handler(MessageHandler handler);

    // Returns the client fd, or -1 when nothing is pending
    int accept_connection();

    // false = connection should be dropped
    bool handle_client(int client_fd);
    bool flush_client(int client_fd);
    bool client_wants_write(int client_fd) const;

    // Queue an unsolicited frame. Returns the client fd, or -1 when the
    // client is gone or its backlog is full.
    int send_to_client(uint32_t client_id, const Message& msg);

    uint32_t client_id_for_fd(int client_fd) const;
    void remove_client(int client_fd);
    void stop();

    size_t client_count() const { return clients_.size(); }

private:
    std::string socket_path_;
    int server_fd_ = -1;
    MessageHandler handler_;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    std::unordered_map<uint32_t, int> client_fds_;
    uint32_t next_client_id_ = 1;

    bool process_messages(ClientConnection& client);
    void queue(ClientConnection& client, const Message& msg);
};

} // namespace caserun::ipc
