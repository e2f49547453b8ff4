#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "runtime/sandbox.hpp"

namespace caserun::engine {

struct ValidatorConfig {
    bool enabled = true;
    // Script path is appended as the last argument
    std::vector<std::string> command = {
        "python3", "-c",
        "import ast, sys; ast.parse(open(sys.argv[1], encoding='utf-8').read(), sys.argv[1])"
    };
    // Only scripts with these extensions are checked; empty = all
    std::vector<std::string> extensions = {".py"};
    uint32_t timeout_ms = 5000;
};

struct ValidationResult {
    bool ok = true;
    bool checked = false;       // false when skipped (disabled, other language, timeout)
    std::string diagnostics;
};

// Pre-flight syntax check, run before any pooled sandbox is acquired
class SyntaxValidator {
public:
    // sandbox_template supplies the scratch root; isolation is not needed
    // for a parse-only check and is switched off
    SyntaxValidator(const ValidatorConfig& config, const runtime::SandboxConfig& sandbox_template);

    bool available() const { return available_; }

    ValidationResult validate(const std::string& script_ref, const std::string& source) const;

private:
    ValidatorConfig config_;
    runtime::SandboxConfig template_;
    bool available_ = false;

    bool applies_to(const std::string& script_ref) const;
};

} // namespace caserun::engine
