#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace caserun::util {

// Install the process-wide "caserun" console logger
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "off" (case-sensitive).
// Unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace caserun::util
