/**
 * caserun error taxonomy
 *
 * Admission and infrastructure failures are thrown as EngineError from the
 * boundary operations. Execution outcomes (failed, timeout, cancelled) are
 * never thrown; they live on the Execution record.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace caserun::engine {

enum class ErrorCode {
    SESSION_NOT_FOUND,
    SESSION_NOT_ACTIVE,
    SESSION_TERMINAL,
    INVALID_TRANSITION,
    CONCURRENCY_LIMIT_EXCEEDED,
    POOL_EXHAUSTED,
    SCRIPT_NOT_FOUND,
    SYNTAX_ERROR,
    EXECUTION_NOT_FOUND,
    EXECUTION_NOT_CANCELLABLE,
    INFRASTRUCTURE_UNAVAILABLE,
    INVALID_ARGUMENT,
    CONFIG_ERROR
};

// Who is at fault, so a UI can tell "your code broke" from "the
// platform is overloaded"
enum class ErrorClass {
    ADMISSION,       // request rejected before any sandbox was touched
    INFRASTRUCTURE,  // pool exhausted, runtime unreachable
    CALLER           // bad id, bad argument, invalid state change
};

const char* error_code_to_string(ErrorCode code);
ErrorClass error_class_of(ErrorCode code);
const char* error_class_to_string(ErrorClass cls);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message, uint32_t retry_after_ms = 0)
        : std::runtime_error(message)
        , code_(code)
        , retry_after_ms_(retry_after_ms) {}

    ErrorCode code() const noexcept { return code_; }
    ErrorClass error_class() const noexcept { return error_class_of(code_); }

    // Only meaningful for POOL_EXHAUSTED
    uint32_t retry_after_ms() const noexcept { return retry_after_ms_; }

private:
    ErrorCode code_;
    uint32_t retry_after_ms_;
};

} // namespace caserun::engine
