#include "engine/syntax_validator.hpp"
#include "engine/types.hpp"
#include "util/which.hpp"
#include <spdlog/spdlog.h>

namespace caserun::engine {

// Diagnostics returned to the caller are capped
constexpr size_t MAX_DIAGNOSTICS = 8 * 1024;

SyntaxValidator::SyntaxValidator(const ValidatorConfig& config,
                                 const runtime::SandboxConfig& sandbox_template)
    : config_(config)
    , template_(sandbox_template) {
    template_.enable_cgroups = false;
    template_.enable_pid_namespace = false;
    template_.enable_mount_namespace = false;
    template_.enable_uts_namespace = false;
    template_.enable_network = true;

    if (!config_.enabled) {
        spdlog::info("Syntax pre-flight disabled by configuration");
        return;
    }
    if (config_.command.empty()) {
        spdlog::warn("Syntax pre-flight has no checker command, disabling");
        return;
    }
    if (util::which(config_.command[0]).empty()) {
        spdlog::warn("Syntax checker '{}' not found on PATH, pre-flight disabled", config_.command[0]);
        return;
    }
    available_ = true;
}

bool SyntaxValidator::applies_to(const std::string& script_ref) const {
    if (config_.extensions.empty()) {
        return true;
    }
    for (const auto& ext : config_.extensions) {
        if (script_ref.size() >= ext.size() &&
            script_ref.compare(script_ref.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

ValidationResult SyntaxValidator::validate(const std::string& script_ref,
                                           const std::string& source) const {
    ValidationResult result;
    if (!available_ || !applies_to(script_ref)) {
        return result;
    }

    runtime::SandboxConfig cfg = template_;
    cfg.name = generate_id("check");
    runtime::Sandbox scratch(cfg);
    if (!scratch.create() || !scratch.write_file(script_ref, source)) {
        spdlog::warn("Syntax pre-flight could not prepare {}, letting it through", script_ref);
        return result;
    }

    runtime::ExecRequest request;
    request.argv = config_.command;
    request.argv.push_back(script_ref);
    request.timeout = std::chrono::milliseconds(config_.timeout_ms);

    std::string diagnostics;
    auto exec = scratch.exec(request, [&diagnostics](runtime::StreamKind, const std::string& chunk) {
        if (diagnostics.size() < MAX_DIAGNOSTICS) {
            diagnostics.append(chunk, 0, MAX_DIAGNOSTICS - diagnostics.size());
        }
    });

    if (!scratch.destroy()) {
        spdlog::debug("Syntax pre-flight scratch {} not fully removed", cfg.name);
    }

    if (exec.spawn_failed) {
        spdlog::warn("Syntax checker failed to start for {}, letting it through", script_ref);
        return result;
    }
    if (exec.timed_out) {
        spdlog::warn("Syntax check of {} timed out after {}ms, letting it through",
            script_ref, config_.timeout_ms);
        return result;
    }

    result.checked = true;
    result.ok = exec.exit_code == 0;
    if (!result.ok) {
        result.diagnostics = diagnostics;
        spdlog::debug("Syntax check rejected {}: {}", script_ref, diagnostics);
    }
    return result;
}

} // namespace caserun::engine
