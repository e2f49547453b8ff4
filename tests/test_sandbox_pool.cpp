#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "engine/errors.hpp"
#include "runtime/sandbox_pool.hpp"
#include "test_helpers.hpp"

using namespace caserun::runtime;
using caserun::engine::EngineError;
using caserun::engine::ErrorCode;
using caserun::testing::TempDir;
using caserun::testing::plain_sandbox;
using caserun::testing::wait_until;

namespace {

PoolConfig small_pool(uint32_t warm, uint32_t max, uint32_t max_reuse = 50) {
    PoolConfig cfg;
    cfg.warm_target = warm;
    cfg.max_sandboxes = max;
    cfg.max_reuse = max_reuse;
    cfg.replenish_interval_ms = 10;
    cfg.retry_after_ms = 321;
    return cfg;
}

} // namespace

TEST(SandboxPoolTest, StartPrewarmsToTarget) {
    TempDir dir;
    SandboxPool pool(small_pool(2, 4), plain_sandbox(dir.path(), "pw"));
    ASSERT_TRUE(pool.start());

    auto stats = pool.stats();
    EXPECT_EQ(stats.warm_count, 2u);
    EXPECT_EQ(stats.in_use_count, 0u);
    EXPECT_EQ(stats.total_created, 2u);
    pool.shutdown();
    pool.shutdown();
}

TEST(SandboxPoolTest, AcquireBeforeStartIsInfrastructureError) {
    TempDir dir;
    SandboxPool pool(small_pool(1, 2), plain_sandbox(dir.path()));
    try {
        pool.acquire();
        FAIL() << "expected INFRASTRUCTURE_UNAVAILABLE";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INFRASTRUCTURE_UNAVAILABLE);
    }
}

TEST(SandboxPoolTest, UnusableRootFailsStart) {
    SandboxPool pool(small_pool(1, 2), plain_sandbox("/proc/caserun-cannot-exist"));
    EXPECT_FALSE(pool.start());
    EXPECT_FALSE(pool.running());
}

TEST(SandboxPoolTest, ExhaustionFailsFastWithRetryHint) {
    TempDir dir;
    SandboxPool pool(small_pool(0, 2), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    auto a = pool.acquire();
    auto b = pool.acquire();
    try {
        pool.acquire();
        FAIL() << "expected POOL_EXHAUSTED";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::POOL_EXHAUSTED);
        EXPECT_EQ(e.retry_after_ms(), 321u);
    }

    pool.release(a, false);
    EXPECT_NO_THROW(pool.release(pool.acquire(), false));
    pool.release(b, false);
}

TEST(SandboxPoolTest, ConcurrentAcquiresNeverExceedCap) {
    TempDir dir;
    constexpr uint32_t CAP = 3;
    SandboxPool pool(small_pool(1, CAP), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    std::atomic<int> holding{0};
    std::atomic<int> peak{0};
    std::atomic<int> exhausted{0};
    std::atomic<int> other_errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                try {
                    auto handle = pool.acquire();
                    int now = ++holding;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    --holding;
                    pool.release(handle, i % 2 == 0);
                } catch (const EngineError& e) {
                    if (e.code() == ErrorCode::POOL_EXHAUSTED) {
                        exhausted++;
                    } else {
                        other_errors++;
                    }
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), static_cast<int>(CAP));
    EXPECT_GT(exhausted.load(), 0);
    EXPECT_EQ(other_errors.load(), 0);

    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use_count, 0u);
    EXPECT_LE(stats.warm_count, CAP);
}

TEST(SandboxPoolTest, CleanReleaseReturnsResetSandbox) {
    TempDir dir;
    SandboxPool pool(small_pool(1, 1), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    auto handle = pool.acquire();
    EXPECT_EQ(handle->state(), HandleState::IN_USE);
    ASSERT_TRUE(handle->sandbox().write_file("leftover.txt", "x"));
    pool.release(handle, false);

    EXPECT_EQ(handle->state(), HandleState::WARM);
    EXPECT_EQ(handle->reuse_count(), 1u);
    EXPECT_TRUE(handle->sandbox().list_files().empty());

    auto again = pool.acquire();
    EXPECT_EQ(again->slot(), handle->slot());
    pool.release(again, false);
}

TEST(SandboxPoolTest, TaintedReleaseDestroysBeforeReturning) {
    TempDir dir;
    SandboxPool pool(small_pool(1, 2), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    auto handle = pool.acquire();
    std::string work = handle->sandbox().work_dir();
    pool.release(handle, true);

    EXPECT_EQ(handle->state(), HandleState::DESTROYED);
    EXPECT_FALSE(std::filesystem::exists(work));

    auto stats = pool.stats();
    EXPECT_EQ(stats.total_tainted, 1u);
    EXPECT_EQ(stats.total_destroyed, 1u);

    // Replenisher restores the warm target
    EXPECT_TRUE(wait_until([&] { return pool.stats().warm_count == 1; }));

    auto next = pool.acquire();
    EXPECT_NE(next->slot(), handle->slot());
    pool.release(next, false);
}

TEST(SandboxPoolTest, RetiresAfterMaxReuse) {
    TempDir dir;
    SandboxPool pool(small_pool(0, 1, 2), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    auto first = pool.acquire();
    pool.release(first, false);
    EXPECT_EQ(first->state(), HandleState::WARM);

    auto second = pool.acquire();
    EXPECT_EQ(second, first);
    pool.release(second, false);
    EXPECT_EQ(second->state(), HandleState::DESTROYED);

    auto stats = pool.stats();
    EXPECT_EQ(stats.total_tainted, 0u);
    EXPECT_EQ(stats.total_destroyed, 1u);
}

TEST(SandboxPoolTest, DoubleReleaseIsIgnored) {
    TempDir dir;
    SandboxPool pool(small_pool(0, 1), plain_sandbox(dir.path()));
    ASSERT_TRUE(pool.start());

    auto handle = pool.acquire();
    pool.release(handle, true);
    pool.release(handle, true);
    EXPECT_EQ(pool.stats().total_tainted, 1u);
    EXPECT_EQ(pool.stats().in_use_count, 0u);
}
