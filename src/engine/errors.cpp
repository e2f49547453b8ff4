#include "engine/errors.hpp"

namespace caserun::engine {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SESSION_NOT_FOUND:          return "SESSION_NOT_FOUND";
        case ErrorCode::SESSION_NOT_ACTIVE:         return "SESSION_NOT_ACTIVE";
        case ErrorCode::SESSION_TERMINAL:           return "SESSION_TERMINAL";
        case ErrorCode::INVALID_TRANSITION:         return "INVALID_TRANSITION";
        case ErrorCode::CONCURRENCY_LIMIT_EXCEEDED: return "CONCURRENCY_LIMIT_EXCEEDED";
        case ErrorCode::POOL_EXHAUSTED:             return "POOL_EXHAUSTED";
        case ErrorCode::SCRIPT_NOT_FOUND:           return "SCRIPT_NOT_FOUND";
        case ErrorCode::SYNTAX_ERROR:               return "SYNTAX_ERROR";
        case ErrorCode::EXECUTION_NOT_FOUND:        return "EXECUTION_NOT_FOUND";
        case ErrorCode::EXECUTION_NOT_CANCELLABLE:  return "EXECUTION_NOT_CANCELLABLE";
        case ErrorCode::INFRASTRUCTURE_UNAVAILABLE: return "INFRASTRUCTURE_UNAVAILABLE";
        case ErrorCode::INVALID_ARGUMENT:           return "INVALID_ARGUMENT";
        case ErrorCode::CONFIG_ERROR:               return "CONFIG_ERROR";
        default: return "UNKNOWN";
    }
}

ErrorClass error_class_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::SESSION_NOT_ACTIVE:
        case ErrorCode::SESSION_TERMINAL:
        case ErrorCode::CONCURRENCY_LIMIT_EXCEEDED:
        case ErrorCode::SCRIPT_NOT_FOUND:
        case ErrorCode::SYNTAX_ERROR:
            return ErrorClass::ADMISSION;
        case ErrorCode::POOL_EXHAUSTED:
        case ErrorCode::INFRASTRUCTURE_UNAVAILABLE:
            return ErrorClass::INFRASTRUCTURE;
        default:
            return ErrorClass::CALLER;
    }
}

const char* error_class_to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::ADMISSION:      return "admission";
        case ErrorClass::INFRASTRUCTURE: return "infrastructure";
        case ErrorClass::CALLER:         return "caller";
        default: return "unknown";
    }
}

} // namespace caserun::engine
