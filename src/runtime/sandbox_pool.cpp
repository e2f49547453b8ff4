#include "runtime/sandbox_pool.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace caserun::runtime {

const char* handle_state_to_string(HandleState state) {
    switch (state) {
        case HandleState::WARM: return "warm";
        case HandleState::IN_USE: return "in_use";
        case HandleState::TAINTED: return "tainted";
        case HandleState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

SandboxHandle::SandboxHandle(uint32_t slot, std::unique_ptr<Sandbox> sandbox)
    : slot_(slot)
    , sandbox_(std::move(sandbox))
    , created_at_(std::chrono::system_clock::now())
    , last_used_at_(created_at_) {}

// ============================================================================
// SandboxPool
// ============================================================================

SandboxPool::SandboxPool(const PoolConfig& config, const SandboxConfig& sandbox_template)
    : config_(config)
    , template_(sandbox_template) {
    if (config_.max_sandboxes == 0) {
        config_.max_sandboxes = 1;
    }
    if (config_.warm_target > config_.max_sandboxes) {
        spdlog::warn("Pool warm target {} exceeds cap {}, clamping",
            config_.warm_target, config_.max_sandboxes);
        config_.warm_target = config_.max_sandboxes;
    }
    if (template_.name.empty()) {
        template_.name = "sandbox";
    }
}

SandboxPool::~SandboxPool() {
    shutdown();
}

std::shared_ptr<SandboxHandle> SandboxPool::create_handle() {
    uint32_t slot = next_slot_++;
    SandboxConfig cfg = template_;
    cfg.name = template_.name + "-" + std::to_string(slot);

    auto sandbox = std::make_unique<Sandbox>(cfg);
    if (!sandbox->create()) {
        spdlog::error("Failed to create sandbox {}", cfg.name);
        return nullptr;
    }
    return std::make_shared<SandboxHandle>(slot, std::move(sandbox));
}

void SandboxPool::destroy_handle(const std::shared_ptr<SandboxHandle>& handle) {
    if (!handle->sandbox_->destroy()) {
        spdlog::warn("Sandbox {} left residue on destroy", handle->sandbox_->name());
    }
    handle->state_ = HandleState::DESTROYED;
}

bool SandboxPool::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return true;
        }
        running_ = true;
        stopping_ = false;
    }

    uint32_t created = 0;
    for (uint32_t i = 0; i < config_.warm_target; ++i) {
        auto handle = create_handle();
        if (!handle) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        warm_.push_back(handle);
        total_created_++;
        created++;
    }

    if (config_.warm_target > 0 && created == 0) {
        spdlog::error("Sandbox pool failed to start: no sandbox could be created under {}",
            template_.root_path);
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        return false;
    }
    if (created < config_.warm_target) {
        spdlog::warn("Sandbox pool pre-warmed {}/{} sandboxes", created, config_.warm_target);
    }

    replenisher_ = std::thread(&SandboxPool::replenish_loop, this);

    spdlog::info("Sandbox pool started ({} warm, cap {}, reuse ceiling {})",
        created, config_.max_sandboxes, config_.max_reuse);
    return true;
}

void SandboxPool::shutdown() {
    std::deque<std::shared_ptr<SandboxHandle>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !replenisher_.joinable()) {
            return;
        }
        running_ = false;
        stopping_ = true;
        idle.swap(warm_);
        retiring_ += static_cast<uint32_t>(idle.size());
    }
    cv_.notify_all();

    if (replenisher_.joinable()) {
        replenisher_.join();
    }

    for (auto& handle : idle) {
        destroy_handle(handle);
    }

    uint32_t still_borrowed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retiring_ -= static_cast<uint32_t>(idle.size());
        total_destroyed_ += idle.size();
        still_borrowed = in_use_;
    }

    if (still_borrowed > 0) {
        spdlog::warn("Sandbox pool shut down with {} sandboxes still borrowed", still_borrowed);
    }
    spdlog::info("Sandbox pool shut down ({} idle sandboxes destroyed)", idle.size());
}

std::shared_ptr<SandboxHandle> SandboxPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw engine::EngineError(engine::ErrorCode::INFRASTRUCTURE_UNAVAILABLE,
                "sandbox pool is not running");
        }

        if (!warm_.empty()) {
            auto handle = warm_.front();
            warm_.pop_front();
            handle->state_ = HandleState::IN_USE;
            handle->last_used_at_ = std::chrono::system_clock::now();
            in_use_++;
            cv_.notify_all();
            spdlog::trace("Acquired warm sandbox slot {}", handle->slot_);
            return handle;
        }

        if (total_locked() >= config_.max_sandboxes) {
            spdlog::warn("Sandbox pool exhausted ({} in use, cap {})", in_use_, config_.max_sandboxes);
            throw engine::EngineError(engine::ErrorCode::POOL_EXHAUSTED,
                "all " + std::to_string(config_.max_sandboxes) + " sandboxes are busy",
                config_.retry_after_ms);
        }

        // Reserve capacity; creation happens outside the lock
        creating_++;
    }

    spdlog::debug("Warm pool empty, creating sandbox on demand");
    auto handle = create_handle();

    std::lock_guard<std::mutex> lock(mutex_);
    creating_--;
    if (!handle) {
        cv_.notify_all();
        throw engine::EngineError(engine::ErrorCode::INFRASTRUCTURE_UNAVAILABLE,
            "sandbox runtime unavailable: cannot create sandbox under " + template_.root_path);
    }
    total_created_++;
    handle->state_ = HandleState::IN_USE;
    handle->last_used_at_ = std::chrono::system_clock::now();
    in_use_++;
    cv_.notify_all();
    return handle;
}

void SandboxPool::release(const std::shared_ptr<SandboxHandle>& handle, bool taint) {
    if (!handle || handle->state_ != HandleState::IN_USE) {
        spdlog::error("release() called with a handle that is not in use");
        return;
    }

    bool reusable = !taint && handle->reuse_count_ + 1 < config_.max_reuse;
    if (reusable && !handle->sandbox_->reset()) {
        spdlog::warn("Sandbox slot {} failed to reset, tainting", handle->slot_);
        reusable = false;
        taint = true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_use_--;
        if (reusable && running_) {
            handle->reuse_count_++;
            handle->state_ = HandleState::WARM;
            warm_.push_back(handle);
            cv_.notify_all();
            return;
        }
        handle->state_ = HandleState::TAINTED;
        retiring_++;
        if (taint) {
            total_tainted_++;
        }
    }

    if (taint) {
        spdlog::warn("Destroying tainted sandbox slot {}", handle->slot_);
    } else {
        spdlog::debug("Retiring sandbox slot {} after {} runs", handle->slot_, handle->reuse_count_ + 1);
    }
    destroy_handle(handle);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        retiring_--;
        total_destroyed_++;
    }
    cv_.notify_all();
}

bool SandboxPool::needs_replenish_locked() const {
    return running_ &&
           warm_.size() + creating_ < config_.warm_target &&
           total_locked() < config_.max_sandboxes;
}

void SandboxPool::replenish_loop() {
    auto interval = std::chrono::milliseconds(config_.replenish_interval_ms);
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        cv_.wait(lock, [this] { return stopping_ || needs_replenish_locked(); });
        if (stopping_) {
            break;
        }

        creating_++;
        lock.unlock();
        auto handle = create_handle();
        lock.lock();
        creating_--;

        auto pause = interval;
        if (handle) {
            total_created_++;
            if (running_) {
                warm_.push_back(handle);
                spdlog::debug("Replenished warm pool (slot {}, {} warm)", handle->slot_, warm_.size());
            } else {
                retiring_++;
                lock.unlock();
                destroy_handle(handle);
                lock.lock();
                retiring_--;
                total_destroyed_++;
            }
        } else {
            spdlog::warn("Replenisher could not create a sandbox, backing off");
            pause = std::max(interval, std::chrono::milliseconds(1000));
        }

        // Rate limit so a burst of taints does not become a burst of creations
        cv_.wait_for(lock, pause, [this] { return stopping_; });
    }
}

PoolStats SandboxPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats s;
    s.warm_count = static_cast<uint32_t>(warm_.size());
    s.in_use_count = in_use_;
    s.total_created = total_created_;
    s.total_tainted = total_tainted_;
    s.total_destroyed = total_destroyed_;
    s.max_sandboxes = config_.max_sandboxes;
    s.warm_target = config_.warm_target;
    return s;
}

bool SandboxPool::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace caserun::runtime
