/**
 * caserund Server
 *
 * Orchestrates the daemon:
 * - Reactor (epoll event loop)
 * - SocketServer (Unix domain socket IPC)
 * - Engine (pool, dispatcher, sessions)
 * - stream attachments, pushed to clients as STREAM_EVENT frames
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "engine/engine.hpp"
#include "ipc/protocol.hpp"
#include "ipc/reactor.hpp"
#include "ipc/socket_server.hpp"
#include "util/config.hpp"

namespace caserun::server {

class Server {
public:
    explicit Server(const util::Config& config,
                    std::unique_ptr<engine::ScriptCatalog> catalog = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Engine first, then the socket. Installs SIGINT/SIGTERM handlers.
    bool init();

    // Blocks until shutdown()
    void run();

    // Async-signal-safe
    void shutdown();

    bool is_running() const { return running_; }
    engine::Engine& engine() { return *engine_; }

    // Opcode dispatch; public so tests can drive it without a socket
    ipc::Message handle_message(const ipc::Message& msg);

    // Forward queued stream events to attached clients. Returns the number
    // of frames queued.
    size_t pump_streams();

    size_t attachment_count() const { return attachments_.size(); }

private:
    using AttachmentKey = std::pair<uint32_t, std::string>;  // client id, execution id

    util::Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<engine::Engine> engine_;
    std::unique_ptr<ipc::Reactor> reactor_;
    std::unique_ptr<ipc::SocketServer> socket_server_;

    std::map<AttachmentKey, std::shared_ptr<engine::StreamSubscription>> attachments_;
    std::chrono::steady_clock::time_point last_sweep_;

    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);
    void update_client_events(int fd);
    void drop_client(int fd);
    void detach_client(uint32_t client_id);

    nlohmann::json dispatch(const ipc::Message& msg, const nlohmann::json& request);

    // Session handlers
    nlohmann::json handle_session_create(const nlohmann::json& request);
    nlohmann::json handle_session_get(const nlohmann::json& request);
    nlohmann::json handle_session_pause(const nlohmann::json& request);
    nlohmann::json handle_session_resume(const nlohmann::json& request);
    nlohmann::json handle_session_extend(const nlohmann::json& request);
    nlohmann::json handle_session_terminate(const nlohmann::json& request);
    nlohmann::json handle_session_files(const nlohmann::json& request);
    nlohmann::json handle_session_update_file(const nlohmann::json& request);
    nlohmann::json handle_session_reset_files(const nlohmann::json& request);

    // Execution handlers
    nlohmann::json handle_exec_start(const nlohmann::json& request);
    nlohmann::json handle_exec_get(const nlohmann::json& request);
    nlohmann::json handle_exec_cancel(const nlohmann::json& request);
    nlohmann::json handle_exec_list(const nlohmann::json& request);
    nlohmann::json handle_exec_attach(uint32_t client_id, const nlohmann::json& request);
    nlohmann::json handle_exec_detach(uint32_t client_id, const nlohmann::json& request);

    // Observability
    nlohmann::json handle_audit_log(const nlohmann::json& request);
};

// Error reply for the wire: {"success": false, "error", "code", "class", "retry_after_ms"?}
nlohmann::json error_response(const engine::EngineError& e);

} // namespace caserun::server
