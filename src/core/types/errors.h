#ifndef UCOP_CORE_TYPES_ERRORS_H
#define UCOP_CORE_TYPES_ERRORS_H

#include "context.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ucop {

enum class ErrorCode : uint8_t {
    COMPILE_ERROR,
    CYCLE_ERROR,
    STEP_TIMEOUT,
    STEP_FAILURE,
    VERSION_MISMATCH,
    JOB_NOT_FOUND,
    CHECKPOINT_NOT_FOUND,
    INVALID_TRANSITION,
    WORKFLOW_NOT_FOUND,
    STORAGE_ERROR,
    CONFIG_ERROR
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::COMPILE_ERROR: return "compile_error";
        case ErrorCode::CYCLE_ERROR: return "cycle_error";
        case ErrorCode::STEP_TIMEOUT: return "step_timeout";
        case ErrorCode::STEP_FAILURE: return "step_failure";
        case ErrorCode::VERSION_MISMATCH: return "version_mismatch";
        case ErrorCode::JOB_NOT_FOUND: return "job_not_found";
        case ErrorCode::CHECKPOINT_NOT_FOUND: return "checkpoint_not_found";
        case ErrorCode::INVALID_TRANSITION: return "invalid_transition";
        case ErrorCode::WORKFLOW_NOT_FOUND: return "workflow_not_found";
        case ErrorCode::STORAGE_ERROR: return "storage_error";
        case ErrorCode::CONFIG_ERROR: return "config_error";
    }
    return "unknown";
}

// Base of every error the orchestration core raises to callers
class UcopError : public std::runtime_error {
public:
    UcopError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

enum class CompileErrorKind : uint8_t {
    DUPLICATE_STEP,
    UNKNOWN_DEPENDENCY,
    UNKNOWN_STEP_REF,
    UNRESOLVED_CAPABILITY,
    INVALID_DEFINITION,
    CYCLE
};

inline const char* to_string(CompileErrorKind kind) {
    switch (kind) {
        case CompileErrorKind::DUPLICATE_STEP: return "duplicate_step";
        case CompileErrorKind::UNKNOWN_DEPENDENCY: return "unknown_dependency";
        case CompileErrorKind::UNKNOWN_STEP_REF: return "unknown_step_ref";
        case CompileErrorKind::UNRESOLVED_CAPABILITY: return "unresolved_capability";
        case CompileErrorKind::INVALID_DEFINITION: return "invalid_definition";
        case CompileErrorKind::CYCLE: return "cycle";
    }
    return "unknown";
}

class CompileError : public UcopError {
public:
    CompileError(CompileErrorKind kind, std::string workflow_id, const std::string& message)
        : UcopError(kind == CompileErrorKind::CYCLE ? ErrorCode::CYCLE_ERROR : ErrorCode::COMPILE_ERROR,
                    "Workflow '" + workflow_id + "': " + message),
          kind_(kind),
          workflow_id_(std::move(workflow_id)) {}

    CompileErrorKind kind() const noexcept { return kind_; }
    const std::string& workflow_id() const noexcept { return workflow_id_; }

private:
    CompileErrorKind kind_;
    std::string workflow_id_;
};

// Carries the step ids along the detected cycle, in dependency order
class CycleError : public CompileError {
public:
    CycleError(std::string workflow_id, std::vector<StepId> cycle)
        : CompileError(CompileErrorKind::CYCLE, std::move(workflow_id), describe(cycle)),
          cycle_(std::move(cycle)) {}

    const std::vector<StepId>& cycle() const noexcept { return cycle_; }

private:
    static std::string describe(const std::vector<StepId>& cycle) {
        std::string path;
        for (const auto& id : cycle) {
            path += id + " -> ";
        }
        path += cycle.empty() ? std::string{} : cycle.front();
        return "dependency cycle detected: " + path;
    }

    std::vector<StepId> cycle_;
};

class VersionMismatch : public UcopError {
public:
    explicit VersionMismatch(const std::string& message)
        : UcopError(ErrorCode::VERSION_MISMATCH, message) {}
};

class JobNotFound : public UcopError {
public:
    explicit JobNotFound(const JobId& job_id)
        : UcopError(ErrorCode::JOB_NOT_FOUND, "Job not found: " + job_id) {}
};

class CheckpointNotFound : public UcopError {
public:
    explicit CheckpointNotFound(const std::string& message)
        : UcopError(ErrorCode::CHECKPOINT_NOT_FOUND, message) {}
};

class InvalidTransition : public UcopError {
public:
    explicit InvalidTransition(const std::string& message)
        : UcopError(ErrorCode::INVALID_TRANSITION, message) {}
};

class WorkflowNotFound : public UcopError {
public:
    explicit WorkflowNotFound(const std::string& message)
        : UcopError(ErrorCode::WORKFLOW_NOT_FOUND, message) {}
};

class StorageError : public UcopError {
public:
    explicit StorageError(const std::string& message)
        : UcopError(ErrorCode::STORAGE_ERROR, message) {}
};

class ConfigError : public UcopError {
public:
    explicit ConfigError(const std::string& message)
        : UcopError(ErrorCode::CONFIG_ERROR, message) {}
};

} // namespace ucop

#endif // UCOP_CORE_TYPES_ERRORS_H
