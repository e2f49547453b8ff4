#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <optional>
#include "engine/errors.hpp"
#include "test_helpers.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

using caserun::engine::EngineError;
using caserun::engine::ErrorCode;
using caserun::testing::TempDir;
using namespace caserun::util;
using json = nlohmann::json;

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

// Restores the variable on scope exit
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (old_) {
            setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = parse_config(json::object());
    EXPECT_EQ(config.server.socket_path, "/tmp/caserun.sock");
    EXPECT_EQ(config.sandbox.name, "sbx");
    EXPECT_EQ(config.pool.max_sandboxes, 8u);
    EXPECT_EQ(config.execution.default_timeout_seconds, 30u);
    EXPECT_EQ(config.execution.max_timeout_seconds, 300u);
    EXPECT_EQ(config.session.default_quota.max_concurrent_executions, 1u);
    EXPECT_EQ(config.stream_buffer_events, 1024u);
}

TEST(ConfigTest, ReadsEverySection) {
    json doc = {
        {"server", {{"socket_path", "/run/c.sock"}, {"log_level", "debug"}}},
        {"sandbox", {{"work_root", "/var/lib/caserun"}, {"memory_limit_mb", 256},
                     {"enable_cgroups", false}, {"max_pids", 32}}},
        {"pool", {{"warm_target", 3}, {"max_sandboxes", 6}, {"retry_after_ms", 250}}},
        {"execution", {{"interpreter", {"python3", "-u"}}, {"default_timeout_seconds", 10},
                       {"max_timeout_seconds", 60}, {"retention", 5}}},
        {"session", {{"default_lifetime_seconds", 120}, {"max_concurrent_executions", 2}}},
        {"catalog", {{"root", "/srv/books"}}},
        {"validator", {{"enabled", false}, {"extensions", {".py", ".pyw"}}}}
    };

    auto config = parse_config(doc);
    EXPECT_EQ(config.server.socket_path, "/run/c.sock");
    EXPECT_EQ(config.server.log_level, "debug");
    EXPECT_EQ(config.sandbox.root_path, "/var/lib/caserun");
    EXPECT_EQ(config.sandbox.limits.memory_limit_bytes, 256ull * 1024 * 1024);
    EXPECT_FALSE(config.sandbox.enable_cgroups);
    EXPECT_EQ(config.sandbox.limits.max_pids, 32u);
    EXPECT_EQ(config.pool.warm_target, 3u);
    EXPECT_EQ(config.pool.max_sandboxes, 6u);
    EXPECT_EQ(config.pool.retry_after_ms, 250u);
    EXPECT_EQ(config.execution.interpreter, (std::vector<std::string>{"python3", "-u"}));
    EXPECT_EQ(config.execution.default_timeout_seconds, 10u);
    EXPECT_EQ(config.retention, 5u);
    EXPECT_EQ(config.session.default_lifetime_seconds, 120u);
    EXPECT_EQ(config.session.default_quota.max_concurrent_executions, 2u);
    EXPECT_EQ(config.catalog_root, "/srv/books");
    EXPECT_FALSE(config.validator.enabled);
    EXPECT_EQ(config.validator.extensions.size(), 2u);
}

TEST(ConfigTest, RejectsMalformedDocuments) {
    EXPECT_EQ(code_of([] { parse_config(json::array()); }), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"pool", 3}}); }), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"pool", {{"max_sandboxes", "many"}}}}); }),
              ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"execution", {{"interpreter", "python3"}}}}); }),
              ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, RejectsInconsistentLimits) {
    EXPECT_EQ(code_of([] { parse_config({{"pool", {{"max_sandboxes", 0}}}}); }),
              ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"pool", {{"warm_target", 9}, {"max_sandboxes", 4}}}}); }),
              ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] {
        parse_config({{"execution", {{"default_timeout_seconds", 600}, {"max_timeout_seconds", 60}}}});
    }), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"execution", {{"interpreter", json::array()}}}}); }),
              ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(code_of([] { parse_config({{"session", {{"max_concurrent_executions", 0}}}}); }),
              ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    ScopedEnv socket("CASERUN_SOCKET", "/tmp/override.sock");
    ScopedEnv pool_max("CASERUN_POOL_MAX", "12");

    Config config;
    apply_env_overrides(config);
    EXPECT_EQ(config.server.socket_path, "/tmp/override.sock");
    EXPECT_EQ(config.pool.max_sandboxes, 12u);
}

TEST(ConfigTest, BadEnvironmentIntegerIsConfigError) {
    ScopedEnv pool_warm("CASERUN_POOL_WARM", "two");
    Config config;
    EXPECT_EQ(code_of([&] { apply_env_overrides(config); }), ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, LoadConfigReadsFile) {
    TempDir dir;
    std::string path = dir.sub("caserun.json");
    {
        std::ofstream out(path);
        out << R"({"pool": {"warm_target": 1, "max_sandboxes": 2}, "catalog": {"root": "/books"}})";
    }

    auto config = load_config(path);
    EXPECT_EQ(config.pool.max_sandboxes, 2u);
    EXPECT_EQ(config.catalog_root, "/books");

    EXPECT_EQ(code_of([&] { load_config(dir.sub("missing.json")); }), ErrorCode::CONFIG_ERROR);

    std::string broken = dir.sub("broken.json");
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    EXPECT_EQ(code_of([&] { load_config(broken); }), ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, DotenvNeverOverridesExistingVariables) {
    TempDir dir;
    std::string path = dir.sub(".env");
    {
        std::ofstream out(path);
        out << "# local settings\n"
            << "export CASERUN_TEST_FRESH=\"from file\"\n"
            << "CASERUN_TEST_KEPT = 'file'\n"
            << "not a pair\n";
    }

    ScopedEnv fresh("CASERUN_TEST_FRESH", nullptr);
    ScopedEnv kept("CASERUN_TEST_KEPT", "process");

    load_dotenv_file(path);
    ASSERT_NE(std::getenv("CASERUN_TEST_FRESH"), nullptr);
    EXPECT_STREQ(std::getenv("CASERUN_TEST_FRESH"), "from file");
    EXPECT_STREQ(std::getenv("CASERUN_TEST_KEPT"), "process");
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
}
