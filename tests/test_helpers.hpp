#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "engine/engine.hpp"
#include "engine/script_catalog.hpp"
#include "runtime/sandbox.hpp"
#include "util/config.hpp"

namespace caserun::testing {

// mkdtemp directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "caserun-test-XXXXXX").string();
        char* made = mkdtemp(tmpl.data());
        path_ = made ? made : "";
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string sub(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// No namespaces, no cgroups: runs unprivileged
inline runtime::SandboxConfig plain_sandbox(const std::string& root, const std::string& name = "t") {
    runtime::SandboxConfig cfg;
    cfg.name = name;
    cfg.root_path = root;
    cfg.enable_pid_namespace = false;
    cfg.enable_mount_namespace = false;
    cfg.enable_uts_namespace = false;
    cfg.enable_network = true;
    cfg.enable_cgroups = false;
    return cfg;
}

// Whole-engine config driving /bin/sh scripts, checked with `sh -n`
inline util::Config shell_config(const std::string& root) {
    util::Config config;
    config.server.socket_path = root + "/caserun.sock";
    config.sandbox = plain_sandbox(root + "/sandboxes", "sbx");
    config.pool.warm_target = 1;
    config.pool.max_sandboxes = 4;
    config.pool.replenish_interval_ms = 10;
    config.execution.interpreter = {"/bin/sh"};
    config.execution.snapshot_interval_ms = 10;
    config.validator.command = {"/bin/sh", "-n"};
    config.validator.extensions = {".sh"};
    config.validator.timeout_ms = 5000;
    config.catalog_root = root + "/books";
    return config;
}

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

inline const engine::CaseRef DEMO_CASE{"physics", "ch1", "case-demo"};

// Shell scripts standing in for a case's analysis code
inline std::unique_ptr<engine::MemoryCatalog> demo_catalog() {
    auto catalog = std::make_unique<engine::MemoryCatalog>();
    catalog->add_case(DEMO_CASE, {
        {"main.sh", "echo \"running $CASERUN_EXECUTION_ID\"\necho warn >&2\n"},
        {"params.sh", "cat \"$1\"\n"},
        {"plot.sh", "printf 'x,y\\n1,2\\n' > table.csv\necho '{}' > summary.json\ntouch ignored.bin\n"},
        {"fail.sh", "echo partial\nexit 4\n"},
        {"slow.sh", "echo started\nsleep 10\n"},
        {"stray.sh", "(sleep 3; echo leaked > stolen.txt) >/dev/null 2>&1 &\necho launched\n"},
        {"chatty.sh", "sleep 1\ni=0\nwhile [ $i -lt 200 ]; do echo line $i; i=$((i+1)); done\n"},
        {"data/input.csv", "a,b\n1,2\n"},
    });
    return catalog;
}

// Engine over a temp root, initialised, with the demo catalog
class EngineFixture : public ::testing::Test {
protected:
    TempDir dir;
    std::unique_ptr<engine::Engine> engine;

    virtual void tune(util::Config&) {}

    void SetUp() override {
        auto config = shell_config(dir.path());
        tune(config);
        engine = std::make_unique<engine::Engine>(config, demo_catalog());
        ASSERT_TRUE(engine->init());
    }

    void TearDown() override {
        engine->shutdown();
        engine.reset();
    }

    engine::Execution wait_terminal(const std::string& execution_id,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(15)) {
        wait_until([&] {
            return engine::is_terminal(engine->dispatcher().status(execution_id).status);
        }, timeout);
        return engine->dispatcher().status(execution_id);
    }
};

} // namespace caserun::testing
