#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "engine/errors.hpp"
#include "test_helpers.hpp"

using namespace caserun::engine;
using caserun::testing::DEMO_CASE;
using caserun::testing::EngineFixture;

namespace {

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const EngineError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected EngineError";
    return ErrorCode::INVALID_ARGUMENT;
}

} // namespace

class SessionManagerTest : public EngineFixture {
protected:
    TimePoint fake_now = std::chrono::system_clock::from_time_t(1700000000);

    SessionManager& sessions() { return engine->sessions(); }

    void use_fake_clock() {
        sessions().set_clock([this] { return fake_now; });
    }

    size_t executions_of(const std::string& session_id) {
        return engine->store().list_executions(session_id).size();
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(SessionManagerTest, CreateSnapshotsCaseFiles) {
    auto session = sessions().create("learner-1", DEMO_CASE);
    EXPECT_EQ(session.status, SessionStatus::ACTIVE);
    EXPECT_EQ(session.user_id, "learner-1");
    EXPECT_EQ(session.files.original.count("main.sh"), 1u);
    EXPECT_TRUE(session.files.modified.empty());
    EXPECT_GT(session.expires_at, session.created_at);
    EXPECT_EQ(session.quota.max_concurrent_executions, 1u);
}

TEST_F(SessionManagerTest, CreateValidatesArguments) {
    EXPECT_EQ(code_of([&] { sessions().create("", DEMO_CASE); }), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(code_of([&] { sessions().create("u", {"..", "", "case"}); }), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(code_of([&] { sessions().create("u", DEMO_CASE, SessionQuota{0, 30}); }),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SessionManagerTest, UnknownCaseStartsEmpty) {
    auto session = sessions().create("u", {"physics", "ch9", "case-nowhere"});
    EXPECT_TRUE(session.files.original.empty());
}

TEST_F(SessionManagerTest, PauseResumeCycle) {
    auto id = sessions().create("u", DEMO_CASE).id;

    EXPECT_EQ(sessions().pause(id).status, SessionStatus::PAUSED);
    EXPECT_EQ(code_of([&] { sessions().pause(id); }), ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(sessions().resume(id).status, SessionStatus::ACTIVE);
    EXPECT_EQ(code_of([&] { sessions().resume(id); }), ErrorCode::INVALID_TRANSITION);
}

TEST_F(SessionManagerTest, UnknownSessionIsNotFound) {
    EXPECT_EQ(code_of([&] { sessions().get("ses_missing"); }), ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(code_of([&] { sessions().terminate("ses_missing"); }), ErrorCode::SESSION_NOT_FOUND);
}

TEST_F(SessionManagerTest, UnknownIdsAreNotTracked) {
    auto id = sessions().create("u", DEMO_CASE).id;
    sessions().get(id);
    auto tracked = sessions().lock_count();
    EXPECT_EQ(tracked, 1u);

    for (int i = 0; i < 50; ++i) {
        std::string missing = "ses_missing_" + std::to_string(i);
        EXPECT_EQ(code_of([&] { sessions().get(missing); }), ErrorCode::SESSION_NOT_FOUND);
        EXPECT_EQ(code_of([&] { sessions().pause(missing); }), ErrorCode::SESSION_NOT_FOUND);
        EXPECT_EQ(code_of([&] { sessions().list_executions(missing); }), ErrorCode::SESSION_NOT_FOUND);
        EXPECT_EQ(code_of([&] { sessions().start_execution(missing, "main.sh", {}); }),
                  ErrorCode::SESSION_NOT_FOUND);
    }
    EXPECT_EQ(sessions().lock_count(), tracked);
}

TEST_F(SessionManagerTest, SweepForgetsLocksOfFinishedSessions) {
    use_fake_clock();
    auto kept = sessions().create("u", DEMO_CASE).id;
    auto ended = sessions().create("u", DEMO_CASE).id;
    auto stale = sessions().create("u", DEMO_CASE).id;
    sessions().extend(kept, std::chrono::seconds(7200));
    sessions().get(stale);
    sessions().terminate(ended);
    EXPECT_EQ(sessions().lock_count(), 3u);

    fake_now += std::chrono::seconds(4000);
    EXPECT_EQ(sessions().sweep_expired(), 1u);
    EXPECT_EQ(sessions().lock_count(), 1u);

    // Reads of finished sessions still work without being tracked again
    EXPECT_EQ(sessions().get(ended).status, SessionStatus::TERMINATED);
    EXPECT_EQ(sessions().get(stale).status, SessionStatus::EXPIRED);
    EXPECT_EQ(sessions().lock_count(), 1u);
}

TEST_F(SessionManagerTest, TerminateIsIdempotent) {
    auto id = sessions().create("u", DEMO_CASE).id;
    EXPECT_EQ(sessions().terminate(id).status, SessionStatus::TERMINATED);
    EXPECT_EQ(sessions().terminate(id).status, SessionStatus::TERMINATED);

    EXPECT_EQ(code_of([&] { sessions().resume(id); }), ErrorCode::SESSION_TERMINAL);
    EXPECT_EQ(code_of([&] { sessions().extend(id, std::chrono::seconds(60)); }),
              ErrorCode::SESSION_TERMINAL);
    EXPECT_EQ(code_of([&] { sessions().update_file(id, "main.sh", "x"); }),
              ErrorCode::SESSION_TERMINAL);
}

TEST_F(SessionManagerTest, ExpiresLazilyOnRead) {
    use_fake_clock();
    auto id = sessions().create("u", DEMO_CASE).id;

    fake_now += std::chrono::seconds(3599);
    EXPECT_EQ(sessions().get(id).status, SessionStatus::ACTIVE);

    fake_now += std::chrono::seconds(1);
    EXPECT_EQ(sessions().get(id).status, SessionStatus::EXPIRED);
    EXPECT_EQ(code_of([&] { sessions().start_execution(id, "main.sh", {}); }),
              ErrorCode::SESSION_NOT_ACTIVE);

    // Terminating an expired session leaves it expired
    EXPECT_EQ(sessions().terminate(id).status, SessionStatus::EXPIRED);
}

TEST_F(SessionManagerTest, ExtendPushesExpiry) {
    use_fake_clock();
    auto session = sessions().create("u", DEMO_CASE);

    auto extended = sessions().extend(session.id, std::chrono::seconds(600));
    EXPECT_EQ(extended.expires_at, session.expires_at + std::chrono::seconds(600));

    fake_now += std::chrono::seconds(3700);
    EXPECT_EQ(sessions().get(session.id).status, SessionStatus::ACTIVE);

    EXPECT_EQ(code_of([&] { sessions().extend(session.id, std::chrono::seconds(0)); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(code_of([&] { sessions().extend(session.id, std::chrono::seconds(90000)); }),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SessionManagerTest, SweepExpiresStaleSessions) {
    use_fake_clock();
    auto a = sessions().create("u", DEMO_CASE).id;
    auto b = sessions().create("u", DEMO_CASE).id;
    sessions().extend(b, std::chrono::seconds(7200));

    fake_now += std::chrono::seconds(4000);
    EXPECT_EQ(sessions().sweep_expired(), 1u);
    EXPECT_EQ(engine->store().load_session(a)->status, SessionStatus::EXPIRED);
    EXPECT_EQ(engine->store().load_session(b)->status, SessionStatus::ACTIVE);
    EXPECT_EQ(sessions().sweep_expired(), 0u);
}

// ============================================================================
// Working files
// ============================================================================

TEST_F(SessionManagerTest, EditsShadowOriginalUntilReset) {
    auto id = sessions().create("u", DEMO_CASE).id;

    sessions().update_file(id, "main.sh", "echo edited\n");
    sessions().update_file(id, "notes/todo.txt", "try k=2");
    auto files = sessions().get_files(id);
    EXPECT_EQ(files.modified.size(), 2u);
    EXPECT_EQ(files.effective().at("main.sh"), "echo edited\n");
    EXPECT_NE(files.original.at("main.sh"), "echo edited\n");

    EXPECT_EQ(code_of([&] { sessions().update_file(id, "../escape.sh", "x"); }),
              ErrorCode::INVALID_ARGUMENT);

    sessions().reset_files(id);
    EXPECT_TRUE(sessions().get_files(id).modified.empty());
}

TEST_F(SessionManagerTest, RunUsesEditedFiles) {
    auto id = sessions().create("u", DEMO_CASE).id;
    sessions().update_file(id, "main.sh", "echo edited\n");

    auto exec_id = sessions().start_execution(id, "main.sh", {});
    auto exec = wait_terminal(exec_id);
    EXPECT_EQ(exec.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(exec.stdout_text, "edited\n");
}

// ============================================================================
// Admission
// ============================================================================

TEST_F(SessionManagerTest, TerminatedSessionRejectsStart) {
    auto id = sessions().create("u", DEMO_CASE).id;
    sessions().terminate(id);

    auto in_use_before = engine->pool().stats().in_use_count;
    EXPECT_EQ(code_of([&] { sessions().start_execution(id, "main.sh", {}); }),
              ErrorCode::SESSION_NOT_ACTIVE);
    EXPECT_EQ(executions_of(id), 0u);
    EXPECT_TRUE(sessions().list_executions(id).empty());
    EXPECT_EQ(engine->pool().stats().in_use_count, in_use_before);
}

TEST_F(SessionManagerTest, PausedSessionRejectsStart) {
    auto id = sessions().create("u", DEMO_CASE).id;
    sessions().pause(id);
    EXPECT_EQ(code_of([&] { sessions().start_execution(id, "main.sh", {}); }),
              ErrorCode::SESSION_NOT_ACTIVE);
    EXPECT_EQ(executions_of(id), 0u);
}

TEST_F(SessionManagerTest, MissingScriptCreatesNoRecord) {
    auto id = sessions().create("u", DEMO_CASE).id;
    EXPECT_EQ(code_of([&] { sessions().start_execution(id, "nope.sh", {}); }),
              ErrorCode::SCRIPT_NOT_FOUND);
    EXPECT_EQ(code_of([&] { sessions().start_execution(id, "../main.sh", {}); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(executions_of(id), 0u);
}

TEST_F(SessionManagerTest, SyntaxErrorRejectedBeforeSandbox) {
    auto id = sessions().create("u", DEMO_CASE).id;
    sessions().update_file(id, "main.sh", "if then fi (\n");

    try {
        sessions().start_execution(id, "main.sh", {});
        FAIL() << "expected SYNTAX_ERROR";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SYNTAX_ERROR);
        EXPECT_EQ(e.error_class(), ErrorClass::ADMISSION);
    }
    EXPECT_EQ(executions_of(id), 0u);
    EXPECT_EQ(engine->pool().stats().in_use_count, 0u);

    auto rejected = engine->audit().get_entries(AuditCategory::ADMISSION, id);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].event_type, "SYNTAX_ERROR");
}

TEST_F(SessionManagerTest, ConcurrentStartsRespectQuota) {
    auto id = sessions().create("u", DEMO_CASE).id;

    std::atomic<int> started{0};
    std::atomic<int> limited{0};
    std::atomic<int> other{0};
    std::vector<std::string> ids(2);

    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&, i] {
            try {
                ids[i] = sessions().start_execution(id, "slow.sh", {});
                started++;
            } catch (const EngineError& e) {
                (e.code() == ErrorCode::CONCURRENCY_LIMIT_EXCEEDED ? limited : other)++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(limited.load(), 1);
    EXPECT_EQ(other.load(), 0);
    EXPECT_EQ(executions_of(id), 1u);

    // Terminating the session cancels the run and frees the quota slot
    sessions().terminate(id);
    for (const auto& exec_id : ids) {
        if (!exec_id.empty()) {
            EXPECT_EQ(wait_terminal(exec_id).status, ExecutionStatus::CANCELLED);
        }
    }
}

TEST_F(SessionManagerTest, QuotaCapsTimeout) {
    auto id = sessions().create("u", DEMO_CASE, SessionQuota{1, 1}).id;
    auto exec_id = sessions().start_execution(id, "main.sh", {}, 120);
    EXPECT_EQ(engine->dispatcher().status(exec_id).timeout_seconds, 1u);
    wait_terminal(exec_id);
}

TEST_F(SessionManagerTest, HistoryIsOrderedByStart) {
    auto id = sessions().create("u", DEMO_CASE).id;
    auto first = sessions().start_execution(id, "main.sh", {});
    wait_terminal(first);
    auto second = sessions().start_execution(id, "fail.sh", {});
    wait_terminal(second);

    auto history = sessions().list_executions(id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, first);
    EXPECT_EQ(history[1].id, second);
    EXPECT_EQ(sessions().get(id).execution_ids, (std::vector<std::string>{first, second}));
}
