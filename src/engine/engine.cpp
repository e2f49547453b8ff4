#include "engine/engine.hpp"
#include <spdlog/spdlog.h>

namespace caserun::engine {

namespace {

AuditConfig audit_config_from(const util::Config& config) {
    AuditConfig audit;
    audit.max_entries = config.server.audit_max_entries;
    return audit;
}

} // namespace

Engine::Engine(const util::Config& config, std::unique_ptr<ScriptCatalog> catalog)
    : config_(config)
    , store_(std::make_unique<MemoryRecordStore>(config.retention, config.server.journal_path))
    , streams_(std::make_unique<StreamRegistry>(config.stream_buffer_events))
    , audit_(std::make_unique<AuditLogger>(audit_config_from(config)))
    , catalog_(std::move(catalog))
    , validator_(std::make_unique<SyntaxValidator>(config.validator, config.sandbox))
    , pool_(std::make_unique<runtime::SandboxPool>(config.pool, config.sandbox))
{
    if (!catalog_) {
        catalog_ = std::make_unique<FilesystemCatalog>(config.catalog_root);
    }
    dispatcher_ = std::make_unique<Dispatcher>(
        config.execution, *pool_, *store_, *streams_, audit_.get());
    sessions_ = std::make_unique<SessionManager>(
        config.session, *store_, *dispatcher_, *catalog_,
        validator_->available() ? validator_.get() : nullptr, audit_.get());
}

Engine::~Engine() {
    shutdown();
}

bool Engine::init() {
    if (running_) {
        return true;
    }
    spdlog::info("Initializing execution engine...");

    if (!pool_->start()) {
        spdlog::error("Failed to start sandbox pool");
        return false;
    }
    dispatcher_->start_workers();

    running_ = true;
    spdlog::info("Execution engine ready (timeout default {}s, max {}s)",
        config_.execution.default_timeout_seconds, config_.execution.max_timeout_seconds);
    return true;
}

void Engine::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("Execution engine shutting down...");
    dispatcher_->shutdown();
    pool_->shutdown();

    auto stats = pool_->stats();
    spdlog::info("Execution engine stopped (created={}, tainted={}, destroyed={})",
        stats.total_created, stats.total_tainted, stats.total_destroyed);
}

nlohmann::json Engine::pool_stats() const {
    auto stats = pool_->stats();
    return {
        {"warm_count", stats.warm_count},
        {"in_use_count", stats.in_use_count},
        {"total_created", stats.total_created},
        {"total_tainted", stats.total_tainted},
        {"total_destroyed", stats.total_destroyed},
        {"max_sandboxes", stats.max_sandboxes},
        {"warm_target", stats.warm_target},
        {"in_flight", dispatcher_->in_flight()}
    };
}

} // namespace caserun::engine
