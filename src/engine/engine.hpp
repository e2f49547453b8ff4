/**
 * caserun Engine
 *
 * Process-wide application state: owns the record store, stream registry,
 * audit log, catalog, syntax validator, sandbox pool, dispatcher and
 * session manager, wired together from one Config.
 *
 * Construction has no side effects. init() pre-warms the pool and starts
 * the dispatcher workers; shutdown() cancels in-flight executions, joins
 * the workers and destroys every sandbox.
 */
#pragma once
#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include "engine/audit_log.hpp"
#include "engine/dispatcher.hpp"
#include "engine/record_store.hpp"
#include "engine/script_catalog.hpp"
#include "engine/session_manager.hpp"
#include "engine/stream_channel.hpp"
#include "engine/syntax_validator.hpp"
#include "runtime/sandbox_pool.hpp"
#include "util/config.hpp"

namespace caserun::engine {

class Engine {
public:
    // catalog: null = FilesystemCatalog over config.catalog_root
    explicit Engine(const util::Config& config,
                    std::unique_ptr<ScriptCatalog> catalog = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool init();
    void shutdown();
    bool running() const { return running_; }

    SessionManager& sessions() { return *sessions_; }
    Dispatcher& dispatcher() { return *dispatcher_; }
    runtime::SandboxPool& pool() { return *pool_; }
    RecordStore& store() { return *store_; }
    StreamRegistry& streams() { return *streams_; }
    AuditLogger& audit() { return *audit_; }
    const SyntaxValidator* validator() const { return validator_.get(); }
    const util::Config& config() const { return config_; }

    nlohmann::json pool_stats() const;

private:
    util::Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<MemoryRecordStore> store_;
    std::unique_ptr<StreamRegistry> streams_;
    std::unique_ptr<AuditLogger> audit_;
    std::unique_ptr<ScriptCatalog> catalog_;
    std::unique_ptr<SyntaxValidator> validator_;
    std::unique_ptr<runtime::SandboxPool> pool_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<SessionManager> sessions_;
};

} // namespace caserun::engine
