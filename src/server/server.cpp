#include "server/server.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <csignal>
#include <set>

using json = nlohmann::json;

namespace caserun::server {

using engine::EngineError;
using engine::ErrorCode;

// Global server pointer for signal handling
static Server* g_server = nullptr;

static void signal_handler(int /*signum*/) {
    if (g_server) {
        g_server->shutdown();
    }
}

namespace {

constexpr auto SWEEP_INTERVAL = std::chrono::seconds(60);
constexpr int IDLE_POLL_MS = 100;
constexpr int STREAMING_POLL_MS = 20;

[[noreturn]] void bad_request(const std::string& message) {
    throw EngineError(ErrorCode::INVALID_ARGUMENT, message);
}

std::string require_string(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || !it->is_string() || it->get<std::string>().empty()) {
        bad_request(std::string("'") + key + "' is required");
    }
    return it->get<std::string>();
}

std::string optional_string(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        bad_request(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<uint32_t> optional_uint(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_unsigned() || it->get<uint64_t>() > UINT32_MAX) {
        bad_request(std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<uint32_t>();
}

json files_to_json(const engine::FileMap& files) {
    json j = json::object();
    for (const auto& [path, content] : files) {
        j[path] = content;
    }
    return j;
}

} // namespace

json error_response(const EngineError& e) {
    json response;
    response["success"] = false;
    response["error"] = e.what();
    response["code"] = engine::error_code_to_string(e.code());
    response["class"] = engine::error_class_to_string(e.error_class());
    if (e.code() == ErrorCode::POOL_EXHAUSTED) {
        response["retry_after_ms"] = e.retry_after_ms();
    }
    return response;
}

Server::Server(const util::Config& config, std::unique_ptr<engine::ScriptCatalog> catalog)
    : config_(config)
    , engine_(std::make_unique<engine::Engine>(config, std::move(catalog)))
    , reactor_(std::make_unique<ipc::Reactor>())
    , socket_server_(std::make_unique<ipc::SocketServer>(config.server.socket_path))
    , last_sweep_(std::chrono::steady_clock::now()) {}

Server::~Server() {
    if (g_server == this) {
        g_server = nullptr;
    }
}

bool Server::init() {
    spdlog::info("Initializing caserund...");

    if (!engine_->init()) {
        spdlog::error("Failed to initialize execution engine");
        return false;
    }

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    socket_server_->set_handler([this](const ipc::Message& msg) {
        return handle_message(msg);
    });

    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    int server_fd = socket_server_->get_server_fd();
    if (!reactor_->add(server_fd, EPOLLIN, [this](int fd, uint32_t events) {
            on_server_event(fd, events);
        })) {
        return false;
    }

    g_server = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("caserund initialized");
    return true;
}

void Server::run() {
    running_ = true;
    spdlog::info("caserund running, listening on {}", config_.server.socket_path);

    while (running_) {
        int timeout = attachments_.empty() ? IDLE_POLL_MS : STREAMING_POLL_MS;
        if (reactor_->poll(timeout) < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }

        pump_streams();

        auto now = std::chrono::steady_clock::now();
        if (now - last_sweep_ >= SWEEP_INTERVAL) {
            last_sweep_ = now;
            engine_->sessions().sweep_expired();
        }
    }

    spdlog::info("caserund shutting down...");
    for (const auto& [key, subscription] : attachments_) {
        engine_->dispatcher().detach(key.second, subscription);
    }
    attachments_.clear();
    socket_server_->stop();
    engine_->shutdown();
    spdlog::info("caserund stopped");
}

void Server::shutdown() {
    running_ = false;
}

// ============================================================================
// Connections
// ============================================================================

void Server::on_server_event(int /*fd*/, uint32_t events) {
    if (!(events & EPOLLIN)) {
        return;
    }
    while (true) {
        int client_fd = socket_server_->accept_connection();
        if (client_fd < 0) {
            break;
        }
        if (!reactor_->add(client_fd, EPOLLIN | EPOLLHUP | EPOLLERR,
                [this](int cfd, uint32_t ev) { on_client_event(cfd, ev); })) {
            socket_server_->remove_client(client_fd);
        }
    }
}

void Server::on_client_event(int fd, uint32_t events) {
    if (events & (EPOLLHUP | EPOLLERR)) {
        drop_client(fd);
        return;
    }

    if (events & EPOLLIN) {
        if (!socket_server_->handle_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    if (events & EPOLLOUT) {
        if (!socket_server_->flush_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    update_client_events(fd);
}

void Server::update_client_events(int fd) {
    uint32_t events = EPOLLIN | EPOLLHUP | EPOLLERR;
    if (socket_server_->client_wants_write(fd)) {
        events |= EPOLLOUT;
    }
    reactor_->modify(fd, events);
}

void Server::drop_client(int fd) {
    uint32_t client_id = socket_server_->client_id_for_fd(fd);
    if (client_id != 0) {
        detach_client(client_id);
    }
    reactor_->remove(fd);
    socket_server_->remove_client(fd);
}

void Server::detach_client(uint32_t client_id) {
    auto it = attachments_.lower_bound({client_id, ""});
    while (it != attachments_.end() && it->first.first == client_id) {
        engine_->dispatcher().detach(it->first.second, it->second);
        it = attachments_.erase(it);
    }
}

size_t Server::pump_streams() {
    size_t pushed = 0;
    std::set<int> touched;

    for (auto it = attachments_.begin(); it != attachments_.end();) {
        uint32_t client_id = it->first.first;
        auto& subscription = it->second;

        while (auto event = subscription->try_next()) {
            ipc::Message frame(client_id, ipc::Opcode::STREAM_EVENT, event->to_json().dump());
            int fd = socket_server_->send_to_client(client_id, frame);
            if (fd >= 0) {
                touched.insert(fd);
                pushed++;
            }
        }

        if (subscription->finished()) {
            if (subscription->dropped() > 0) {
                spdlog::debug("Client {} missed {} events of {}",
                    client_id, subscription->dropped(), it->first.second);
            }
            engine_->dispatcher().detach(it->first.second, subscription);
            it = attachments_.erase(it);
        } else {
            ++it;
        }
    }

    for (int fd : touched) {
        update_client_events(fd);
    }
    return pushed;
}

// ============================================================================
// Dispatch
// ============================================================================

ipc::Message Server::handle_message(const ipc::Message& msg) {
    switch (msg.opcode) {
        case ipc::Opcode::NOOP:
            return ipc::Message(msg.client_id, ipc::Opcode::NOOP, msg.payload);

        case ipc::Opcode::EXIT:
            spdlog::debug("Client {} requested exit", msg.client_id);
            return ipc::Message(msg.client_id, ipc::Opcode::EXIT, R"({"success": true})");

        default:
            break;
    }

    json response;
    try {
        json request = msg.payload.empty() ? json::object() : json::parse(msg.payload_str());
        if (!request.is_object()) {
            bad_request("payload must be a JSON object");
        }
        response = dispatch(msg, request);
    } catch (const EngineError& e) {
        response = error_response(e);
    } catch (const json::exception& e) {
        response = error_response(EngineError(ErrorCode::INVALID_ARGUMENT,
            std::string("invalid request: ") + e.what()));
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", ipc::opcode_to_string(msg.opcode), e.what());
        response = error_response(EngineError(ErrorCode::INFRASTRUCTURE_UNAVAILABLE, e.what()));
    }

    return ipc::Message(msg.client_id, msg.opcode, response.dump());
}

json Server::dispatch(const ipc::Message& msg, const json& request) {
    switch (msg.opcode) {
        case ipc::Opcode::SESSION_CREATE:      return handle_session_create(request);
        case ipc::Opcode::SESSION_GET:         return handle_session_get(request);
        case ipc::Opcode::SESSION_PAUSE:       return handle_session_pause(request);
        case ipc::Opcode::SESSION_RESUME:      return handle_session_resume(request);
        case ipc::Opcode::SESSION_EXTEND:      return handle_session_extend(request);
        case ipc::Opcode::SESSION_TERMINATE:   return handle_session_terminate(request);
        case ipc::Opcode::SESSION_FILES:       return handle_session_files(request);
        case ipc::Opcode::SESSION_UPDATE_FILE: return handle_session_update_file(request);
        case ipc::Opcode::SESSION_RESET_FILES: return handle_session_reset_files(request);

        case ipc::Opcode::EXEC_START:  return handle_exec_start(request);
        case ipc::Opcode::EXEC_GET:    return handle_exec_get(request);
        case ipc::Opcode::EXEC_CANCEL: return handle_exec_cancel(request);
        case ipc::Opcode::EXEC_LIST:   return handle_exec_list(request);
        case ipc::Opcode::EXEC_ATTACH: return handle_exec_attach(msg.client_id, request);
        case ipc::Opcode::EXEC_DETACH: return handle_exec_detach(msg.client_id, request);

        case ipc::Opcode::POOL_STATS: {
            json response = engine_->pool_stats();
            response["success"] = true;
            return response;
        }
        case ipc::Opcode::AUDIT_LOG:
            return handle_audit_log(request);

        default:
            bad_request(std::string("unsupported opcode ") + ipc::opcode_to_string(msg.opcode));
    }
}

// ============================================================================
// Sessions
// ============================================================================

json Server::handle_session_create(const json& request) {
    engine::CaseRef case_ref;
    case_ref.book_slug = require_string(request, "book_slug");
    case_ref.chapter_slug = optional_string(request, "chapter_slug");
    case_ref.case_slug = require_string(request, "case_slug");

    std::optional<engine::SessionQuota> quota;
    if (request.contains("quota")) {
        const auto& q = request.at("quota");
        if (!q.is_object()) {
            bad_request("'quota' must be an object");
        }
        engine::SessionQuota value = config_.session.default_quota;
        if (auto n = optional_uint(q, "max_concurrent_executions")) {
            value.max_concurrent_executions = *n;
        }
        if (auto n = optional_uint(q, "max_execution_seconds")) {
            value.max_execution_seconds = *n;
        }
        quota = value;
    }

    auto session = engine_->sessions().create(require_string(request, "user_id"), case_ref, quota);
    return {{"success", true}, {"session", session.to_json()}};
}

json Server::handle_session_get(const json& request) {
    auto session = engine_->sessions().get(require_string(request, "session_id"));
    bool include_files = request.value("include_files", false);
    return {{"success", true}, {"session", session.to_json(include_files)}};
}

json Server::handle_session_pause(const json& request) {
    auto session = engine_->sessions().pause(require_string(request, "session_id"));
    return {{"success", true}, {"session", session.to_json()}};
}

json Server::handle_session_resume(const json& request) {
    auto session = engine_->sessions().resume(require_string(request, "session_id"));
    return {{"success", true}, {"session", session.to_json()}};
}

json Server::handle_session_extend(const json& request) {
    auto it = request.find("seconds");
    if (it == request.end() || !it->is_number_integer()) {
        bad_request("'seconds' must be an integer");
    }
    auto session = engine_->sessions().extend(require_string(request, "session_id"),
                                              std::chrono::seconds(it->get<int64_t>()));
    return {{"success", true}, {"session", session.to_json()}};
}

json Server::handle_session_terminate(const json& request) {
    auto session = engine_->sessions().terminate(require_string(request, "session_id"));
    return {{"success", true}, {"session", session.to_json()}};
}

json Server::handle_session_files(const json& request) {
    auto files = engine_->sessions().get_files(require_string(request, "session_id"));
    return {
        {"success", true},
        {"original", files_to_json(files.original)},
        {"modified", files_to_json(files.modified)}
    };
}

json Server::handle_session_update_file(const json& request) {
    auto it = request.find("content");
    if (it == request.end() || !it->is_string()) {
        bad_request("'content' must be a string");
    }
    auto session = engine_->sessions().update_file(require_string(request, "session_id"),
                                                   require_string(request, "path"),
                                                   it->get<std::string>());
    return {{"success", true}, {"modified_count", session.files.modified.size()}};
}

json Server::handle_session_reset_files(const json& request) {
    engine_->sessions().reset_files(require_string(request, "session_id"));
    return {{"success", true}};
}

// ============================================================================
// Executions
// ============================================================================

json Server::handle_exec_start(const json& request) {
    json parameters = json::object();
    if (request.contains("parameters") && !request.at("parameters").is_null()) {
        parameters = request.at("parameters");
        if (!parameters.is_object()) {
            bad_request("'parameters' must be an object");
        }
    }

    std::string execution_id = engine_->sessions().start_execution(
        require_string(request, "session_id"),
        require_string(request, "script_ref"),
        parameters,
        optional_uint(request, "timeout"));

    return {
        {"success", true},
        {"execution_id", execution_id},
        {"status", engine::execution_status_to_string(engine::ExecutionStatus::PENDING)}
    };
}

json Server::handle_exec_get(const json& request) {
    auto execution = engine_->dispatcher().status(require_string(request, "execution_id"));
    return {{"success", true}, {"execution", execution.to_json()}};
}

json Server::handle_exec_cancel(const json& request) {
    std::string execution_id = require_string(request, "execution_id");
    engine_->dispatcher().cancel(execution_id);
    return {{"success", true}, {"execution_id", execution_id}};
}

json Server::handle_exec_list(const json& request) {
    auto executions = engine_->sessions().list_executions(require_string(request, "session_id"));
    json list = json::array();
    for (const auto& exec : executions) {
        list.push_back(exec.to_json());
    }
    return {{"success", true}, {"count", executions.size()}, {"executions", list}};
}

json Server::handle_exec_attach(uint32_t client_id, const json& request) {
    std::string execution_id = require_string(request, "execution_id");
    AttachmentKey key{client_id, execution_id};

    // Events before the attach are not replayed; the snapshot backfills
    auto snapshot = engine_->dispatcher().status(execution_id);

    if (attachments_.find(key) == attachments_.end()) {
        attachments_[key] = engine_->dispatcher().attach(execution_id);
        spdlog::debug("Client {} attached to {}", client_id, execution_id);
    }

    return {{"success", true}, {"attached", true}, {"execution", snapshot.to_json()}};
}

json Server::handle_exec_detach(uint32_t client_id, const json& request) {
    std::string execution_id = require_string(request, "execution_id");
    auto it = attachments_.find({client_id, execution_id});
    if (it == attachments_.end()) {
        return {{"success", true}, {"detached", false}};
    }
    engine_->dispatcher().detach(execution_id, it->second);
    attachments_.erase(it);
    return {{"success", true}, {"detached", true}};
}

// ============================================================================
// Observability
// ============================================================================

json Server::handle_audit_log(const json& request) {
    std::optional<engine::AuditCategory> category;
    std::string category_str = optional_string(request, "category");
    if (!category_str.empty()) {
        category = engine::audit_category_from_string(category_str);
        if (!category) {
            bad_request("unknown audit category: " + category_str);
        }
    }

    auto entries = engine_->audit().get_entries(
        category,
        optional_string(request, "subject"),
        request.value("since_id", static_cast<uint64_t>(0)),
        request.value("limit", static_cast<size_t>(100)));

    json response;
    response["success"] = true;
    response["count"] = entries.size();
    response["entries"] = json::array();
    for (const auto& entry : entries) {
        response["entries"].push_back(entry.to_json());
    }
    return response;
}

} // namespace caserun::server
