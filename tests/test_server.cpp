#include <gtest/gtest.h>
#include "engine/errors.hpp"
#include "server/server.hpp"
#include "test_helpers.hpp"

namespace engine = caserun::engine;
namespace ipc = caserun::ipc;
namespace server = caserun::server;
using json = nlohmann::json;
using caserun::testing::TempDir;
using caserun::testing::wait_until;

class ServerTest : public ::testing::Test {
protected:
    TempDir dir;
    std::unique_ptr<server::Server> srv;

    void SetUp() override {
        srv = std::make_unique<server::Server>(caserun::testing::shell_config(dir.path()),
                                               caserun::testing::demo_catalog());
        // Engine only; the socket is not needed to drive handle_message
        ASSERT_TRUE(srv->engine().init());
    }

    void TearDown() override {
        srv->engine().shutdown();
    }

    json call(ipc::Opcode op, const json& request, uint32_t client_id = 7) {
        auto reply = srv->handle_message(ipc::Message(client_id, op, request.dump()));
        EXPECT_EQ(reply.opcode, op);
        EXPECT_EQ(reply.client_id, client_id);
        return json::parse(reply.payload_str());
    }

    std::string create_session() {
        auto reply = call(ipc::Opcode::SESSION_CREATE, {
            {"user_id", "learner"},
            {"book_slug", "physics"},
            {"chapter_slug", "ch1"},
            {"case_slug", "case-demo"},
            {"quota", {{"max_concurrent_executions", 2}}}
        });
        EXPECT_TRUE(reply["success"].get<bool>()) << reply.dump();
        return reply["session"]["session_id"].get<std::string>();
    }

    json wait_execution(const std::string& execution_id) {
        json exec;
        wait_until([&] {
            exec = call(ipc::Opcode::EXEC_GET, {{"execution_id", execution_id}})["execution"];
            auto status = exec["status"].get<std::string>();
            return status != "pending" && status != "running";
        });
        return exec;
    }
};

TEST_F(ServerTest, NoopEchoesPayload) {
    auto reply = srv->handle_message(ipc::Message(1, ipc::Opcode::NOOP, std::string("ping")));
    EXPECT_EQ(reply.payload_str(), "ping");
}

TEST_F(ServerTest, SessionLifecycleOverTheWire) {
    auto id = create_session();

    auto got = call(ipc::Opcode::SESSION_GET, {{"session_id", id}, {"include_files", true}});
    EXPECT_EQ(got["session"]["status"], "active");
    EXPECT_EQ(got["session"]["quota"]["max_concurrent_executions"], 2);
    EXPECT_TRUE(got["session"]["files"]["original"].contains("main.sh"));

    EXPECT_EQ(call(ipc::Opcode::SESSION_PAUSE, {{"session_id", id}})["session"]["status"], "paused");
    EXPECT_EQ(call(ipc::Opcode::SESSION_RESUME, {{"session_id", id}})["session"]["status"], "active");
    EXPECT_TRUE(call(ipc::Opcode::SESSION_EXTEND, {{"session_id", id}, {"seconds", 60}})["success"].get<bool>());

    auto update = call(ipc::Opcode::SESSION_UPDATE_FILE,
        {{"session_id", id}, {"path", "main.sh"}, {"content", "echo hi\n"}});
    EXPECT_EQ(update["modified_count"], 1);

    auto files = call(ipc::Opcode::SESSION_FILES, {{"session_id", id}});
    EXPECT_EQ(files["modified"]["main.sh"], "echo hi\n");

    call(ipc::Opcode::SESSION_RESET_FILES, {{"session_id", id}});
    EXPECT_TRUE(call(ipc::Opcode::SESSION_FILES, {{"session_id", id}})["modified"].empty());

    EXPECT_EQ(call(ipc::Opcode::SESSION_TERMINATE, {{"session_id", id}})["session"]["status"], "terminated");
}

TEST_F(ServerTest, ExecutionRoundTrip) {
    auto id = create_session();

    auto started = call(ipc::Opcode::EXEC_START, {
        {"session_id", id}, {"script_ref", "params.sh"},
        {"parameters", {{"mass", 3}}}, {"timeout", 10}
    });
    ASSERT_TRUE(started["success"].get<bool>()) << started.dump();
    EXPECT_EQ(started["status"], "pending");
    std::string exec_id = started["execution_id"];

    auto exec = wait_execution(exec_id);
    EXPECT_EQ(exec["status"], "completed");
    EXPECT_EQ(json::parse(exec["stdout"].get<std::string>())["mass"], 3);
    EXPECT_EQ(exec["timeout_seconds"], 10);

    auto list = call(ipc::Opcode::EXEC_LIST, {{"session_id", id}});
    EXPECT_EQ(list["count"], 1);
    EXPECT_EQ(list["executions"][0]["execution_id"], exec_id);
}

TEST_F(ServerTest, ErrorsCarryCodeAndClass) {
    auto missing = call(ipc::Opcode::SESSION_GET, {{"session_id", "ses_missing"}});
    EXPECT_FALSE(missing["success"].get<bool>());
    EXPECT_EQ(missing["code"], "SESSION_NOT_FOUND");
    EXPECT_EQ(missing["class"], "caller");

    auto id = create_session();
    auto no_script = call(ipc::Opcode::EXEC_START, {{"session_id", id}, {"script_ref", "nope.sh"}});
    EXPECT_EQ(no_script["code"], "SCRIPT_NOT_FOUND");
    EXPECT_EQ(no_script["class"], "admission");
    EXPECT_FALSE(no_script.contains("retry_after_ms"));

    auto bad_args = call(ipc::Opcode::EXEC_START, {{"session_id", id}});
    EXPECT_EQ(bad_args["code"], "INVALID_ARGUMENT");

    auto bad_timeout = call(ipc::Opcode::EXEC_START,
        {{"session_id", id}, {"script_ref", "main.sh"}, {"timeout", -5}});
    EXPECT_EQ(bad_timeout["code"], "INVALID_ARGUMENT");
}

TEST_F(ServerTest, MalformedPayloadIsInvalidArgument) {
    auto reply = srv->handle_message(ipc::Message(7, ipc::Opcode::SESSION_GET, std::string("{not json")));
    auto body = json::parse(reply.payload_str());
    EXPECT_EQ(body["code"], "INVALID_ARGUMENT");

    auto array = srv->handle_message(ipc::Message(7, ipc::Opcode::SESSION_GET, std::string("[1,2]")));
    EXPECT_EQ(json::parse(array.payload_str())["code"], "INVALID_ARGUMENT");
}

TEST_F(ServerTest, UnsupportedOpcodeIsRejected) {
    auto reply = call(ipc::Opcode::STREAM_EVENT, json::object());
    EXPECT_FALSE(reply["success"].get<bool>());
    EXPECT_EQ(reply["code"], "INVALID_ARGUMENT");
}

TEST_F(ServerTest, PoolStatsReportCapacity) {
    auto stats = call(ipc::Opcode::POOL_STATS, json::object());
    EXPECT_TRUE(stats["success"].get<bool>());
    EXPECT_EQ(stats["max_sandboxes"], 4);
    EXPECT_EQ(stats["warm_target"], 1);
    EXPECT_EQ(stats["in_flight"], 0);
}

TEST_F(ServerTest, AttachTracksUntilTerminal) {
    auto id = create_session();
    std::string exec_id = call(ipc::Opcode::EXEC_START,
        {{"session_id", id}, {"script_ref", "main.sh"}})["execution_id"];

    auto attached = call(ipc::Opcode::EXEC_ATTACH, {{"execution_id", exec_id}});
    EXPECT_TRUE(attached["attached"].get<bool>());
    EXPECT_EQ(attached["execution"]["execution_id"], exec_id);
    EXPECT_EQ(srv->attachment_count(), 1u);

    wait_execution(exec_id);
    EXPECT_TRUE(wait_until([&] {
        srv->pump_streams();
        return srv->attachment_count() == 0;
    }));

    auto detached = call(ipc::Opcode::EXEC_DETACH, {{"execution_id", exec_id}});
    EXPECT_FALSE(detached["detached"].get<bool>());
}

TEST_F(ServerTest, DetachBeforeFinish) {
    auto id = create_session();
    std::string exec_id = call(ipc::Opcode::EXEC_START,
        {{"session_id", id}, {"script_ref", "slow.sh"}})["execution_id"];

    call(ipc::Opcode::EXEC_ATTACH, {{"execution_id", exec_id}});
    auto detached = call(ipc::Opcode::EXEC_DETACH, {{"execution_id", exec_id}});
    EXPECT_TRUE(detached["detached"].get<bool>());
    EXPECT_EQ(srv->attachment_count(), 0u);

    auto cancelled = call(ipc::Opcode::EXEC_CANCEL, {{"execution_id", exec_id}});
    EXPECT_TRUE(cancelled["success"].get<bool>());
    EXPECT_EQ(wait_execution(exec_id)["status"], "cancelled");
}

TEST_F(ServerTest, AuditLogQuery) {
    auto id = create_session();
    auto log = call(ipc::Opcode::AUDIT_LOG, {{"category", "SESSION"}, {"subject", id}});
    ASSERT_EQ(log["count"], 1);
    EXPECT_EQ(log["entries"][0]["event_type"], "SESSION_CREATED");

    auto bad = call(ipc::Opcode::AUDIT_LOG, {{"category", "KERNEL"}});
    EXPECT_EQ(bad["code"], "INVALID_ARGUMENT");
}

TEST(ErrorResponseTest, RetryHintOnlyForPoolExhaustion) {
    auto busy = server::error_response(
        engine::EngineError(engine::ErrorCode::POOL_EXHAUSTED, "busy", 1000));
    EXPECT_EQ(busy["class"], "infrastructure");
    EXPECT_EQ(busy["retry_after_ms"], 1000);

    auto other = server::error_response(
        engine::EngineError(engine::ErrorCode::CONCURRENCY_LIMIT_EXCEEDED, "one at a time"));
    EXPECT_FALSE(other.contains("retry_after_ms"));
    EXPECT_EQ(other["error"], "one at a time");
}
