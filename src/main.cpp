#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include "engine/errors.hpp"
#include "server/server.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include <string>

namespace {

constexpr const char* VERSION = "v0.1.0";
constexpr int BOX_WIDTH = 57;

void print_row(const std::string& label, const std::string& value, fmt::terminal_color color) {
    std::string cell = fmt::format("  {:<12}", label);
    int padding = BOX_WIDTH - static_cast<int>(cell.size() + value.size());
    fmt::print(fmt::emphasis::bold, "    │");
    fmt::print("{}", cell);
    fmt::print(fg(color), "{}", value);
    fmt::print("{:{}}", "", padding > 0 ? padding : 0);
    fmt::print(fmt::emphasis::bold, "│\n");
}

void print_status_box(const caserun::util::Config& config) {
    const auto& sb = config.sandbox;
    std::string isolation;
    if (sb.enable_pid_namespace || sb.enable_mount_namespace || sb.enable_uts_namespace) {
        isolation += "namespaces";
    }
    if (sb.enable_cgroups) {
        isolation += isolation.empty() ? "cgroups" : " + cgroups";
    }
    if (isolation.empty()) {
        isolation = "process only";
    }

    std::string line;
    for (int i = 0; i < BOX_WIDTH; ++i) line += "─";

    fmt::print(fmt::emphasis::bold, "\n    ┌{}┐\n", line);
    fmt::print(fmt::emphasis::bold, "    │");
    fmt::print(fg(fmt::terminal_color::cyan), "{:<{}}", "  CASERUN STATUS", BOX_WIDTH);
    fmt::print(fmt::emphasis::bold, "│\n    ├{}┤\n", line);

    print_row("Version", VERSION, fmt::terminal_color::green);
    print_row("Socket", config.server.socket_path, fmt::terminal_color::yellow);
    print_row("Work root", sb.root_path, fmt::terminal_color::yellow);
    print_row("Catalog", config.catalog_root, fmt::terminal_color::yellow);
    print_row("Isolation", isolation,
        isolation == "process only" ? fmt::terminal_color::yellow : fmt::terminal_color::green);
    print_row("Pool", fmt::format("{} warm / {} max", config.pool.warm_target, config.pool.max_sandboxes),
        fmt::terminal_color::magenta);
    print_row("Timeout", fmt::format("{}s default / {}s max",
        config.execution.default_timeout_seconds, config.execution.max_timeout_seconds),
        fmt::terminal_color::magenta);

    fmt::print(fmt::emphasis::bold, "    └{}┘\n\n", line);
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        fmt::print(stderr, "usage: {} [config.json]\n", argv[0]);
        return 2;
    }

    caserun::util::init_logger();

    caserun::util::Config config;
    try {
        config = caserun::util::load_config(argc > 1 ? argv[1] : "");
    } catch (const caserun::engine::EngineError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    caserun::util::set_log_level(caserun::util::parse_log_level(config.server.log_level));

    caserun::server::Server server(config);
    if (!server.init()) {
        fmt::print(fg(fmt::terminal_color::red) | fmt::emphasis::bold,
            "\n    ✗  Failed to initialize caserund\n\n");
        return 1;
    }

    print_status_box(config);

    // Blocks until SIGINT/SIGTERM
    server.run();

    fmt::print(fg(fmt::terminal_color::yellow), "\n    ⟳  Shut down gracefully\n\n");
    return 0;
}
