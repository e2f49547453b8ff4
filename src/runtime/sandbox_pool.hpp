#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include "runtime/sandbox.hpp"

namespace caserun::runtime {

struct PoolConfig {
    uint32_t warm_target = 2;             // idle sandboxes kept ready
    uint32_t max_sandboxes = 8;           // hard cap on warm + in-use + being created
    uint32_t max_reuse = 50;              // runs before a clean sandbox is retired
    uint32_t replenish_interval_ms = 200; // min spacing between background creations
    uint32_t retry_after_ms = 1000;       // hint returned with PoolExhausted
};

enum class HandleState {
    WARM,
    IN_USE,
    TAINTED,
    DESTROYED
};

const char* handle_state_to_string(HandleState state);

class SandboxPool;

// A pooled sandbox. Owned by the pool; borrowed by one execution at a time.
class SandboxHandle {
public:
    SandboxHandle(uint32_t slot, std::unique_ptr<Sandbox> sandbox);

    uint32_t slot() const { return slot_; }
    Sandbox& sandbox() { return *sandbox_; }
    HandleState state() const { return state_; }
    uint32_t reuse_count() const { return reuse_count_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }
    std::chrono::system_clock::time_point last_used_at() const { return last_used_at_; }

private:
    friend class SandboxPool;

    uint32_t slot_;
    std::unique_ptr<Sandbox> sandbox_;
    std::atomic<HandleState> state_{HandleState::WARM};
    uint32_t reuse_count_ = 0;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point last_used_at_;
};

struct PoolStats {
    uint32_t warm_count = 0;
    uint32_t in_use_count = 0;
    uint64_t total_created = 0;
    uint64_t total_tainted = 0;
    uint64_t total_destroyed = 0;
    uint32_t max_sandboxes = 0;
    uint32_t warm_target = 0;
};

class SandboxPool {
public:
    // sandbox_template supplies root path, limits and isolation switches;
    // each sandbox gets "<template name>-<slot>" as its name.
    SandboxPool(const PoolConfig& config, const SandboxConfig& sandbox_template);
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Pre-warm and launch the replenisher. Construction has no side effects.
    bool start();

    // Stop the replenisher and destroy idle sandboxes. Handles still borrowed
    // are destroyed when released.
    void shutdown();

    // Throws EngineError POOL_EXHAUSTED at the cap, INFRASTRUCTURE_UNAVAILABLE
    // when a sandbox cannot be created or the pool is not running.
    std::shared_ptr<SandboxHandle> acquire();

    void release(const std::shared_ptr<SandboxHandle>& handle, bool taint);

    PoolStats stats() const;
    bool running() const;
    const PoolConfig& config() const { return config_; }

private:
    PoolConfig config_;
    SandboxConfig template_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<SandboxHandle>> warm_;
    uint32_t in_use_ = 0;
    uint32_t creating_ = 0;
    uint32_t retiring_ = 0;
    uint64_t total_created_ = 0;
    uint64_t total_tainted_ = 0;
    uint64_t total_destroyed_ = 0;
    bool running_ = false;
    bool stopping_ = false;

    std::atomic<uint32_t> next_slot_{1};
    std::thread replenisher_;

    // Called without the lock held
    std::shared_ptr<SandboxHandle> create_handle();
    void destroy_handle(const std::shared_ptr<SandboxHandle>& handle);

    uint32_t total_locked() const {
        return static_cast<uint32_t>(warm_.size()) + in_use_ + creating_ + retiring_;
    }
    bool needs_replenish_locked() const;
    void replenish_loop();
};

} // namespace caserun::runtime
