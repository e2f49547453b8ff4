/**
 * caserun configuration
 *
 * One JSON document with sections server, sandbox, pool, execution,
 * session, catalog and validator. Missing keys keep their defaults.
 * Environment variables (CASERUN_*) override the file; a .env file is
 * consulted first and never overrides variables already set.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/dispatcher.hpp"
#include "engine/session_manager.hpp"
#include "engine/syntax_validator.hpp"
#include "runtime/sandbox.hpp"
#include "runtime/sandbox_pool.hpp"

namespace caserun::util {

struct ServerConfig {
    std::string socket_path = "/tmp/caserun.sock";
    std::string log_level = "info";
    size_t audit_max_entries = 10000;
    std::string journal_path;           // empty = records kept in memory only
};

struct Config {
    ServerConfig server;
    runtime::SandboxConfig sandbox;     // name is the pool's sandbox prefix
    runtime::PoolConfig pool;
    engine::DispatcherConfig execution;
    size_t stream_buffer_events = 1024; // per consumer
    size_t retention = 50;              // terminal executions kept per session
    engine::SessionConfig session;
    std::string catalog_root = "./books";
    engine::ValidatorConfig validator;

    Config();
};

// Throws engine::EngineError(CONFIG_ERROR) on malformed or invalid input
Config parse_config(const nlohmann::json& doc);

// Empty path = defaults. Applies the .env file and environment overrides.
Config load_config(const std::string& path);

void apply_env_overrides(Config& config);

// Loads the first .env found in the working directory, its parents, or
// next to the executable
void load_dotenv();
void load_dotenv_file(const std::filesystem::path& path);

} // namespace caserun::util
