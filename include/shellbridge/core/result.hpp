/*
 * Command results and error taxonomy - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/backend.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace shellbridge {

enum class ErrorCategory {
    Validation,        // malformed or rejected command / options
    SpawnFailure,      // the OS could not create the process
    Timeout,
    Cancelled,
    ResourceExhausted, // pool at capacity
    NonZeroExit,       // ran to completion with a failing code, or killed by a signal
    Internal           // unexpected fault converted by BatchRunner
};

const char* to_string(ErrorCategory c);

namespace error_code {
inline constexpr const char* InvalidCommand    = "INVALID_COMMAND";
inline constexpr const char* InvalidTimeout    = "INVALID_TIMEOUT";
inline constexpr const char* DangerousCommand  = "DANGEROUS_COMMAND";
inline constexpr const char* SpawnFailed       = "SPAWN_FAILED";
inline constexpr const char* Timeout           = "TIMEOUT";
inline constexpr const char* Cancelled         = "CANCELLED";
inline constexpr const char* ResourceExhausted = "RESOURCE_EXHAUSTED";
inline constexpr const char* NonZeroExit       = "NON_ZERO_EXIT";
inline constexpr const char* Signaled          = "TERMINATED_BY_SIGNAL";
inline constexpr const char* Internal          = "INTERNAL_ERROR";
} // namespace error_code

struct ExecError {
    ErrorCategory category = ErrorCategory::Internal;
    std::string code;
    std::string message;
    std::error_code os_error;                        // SpawnFailure only
    std::optional<std::chrono::milliseconds> budget; // Timeout only
    std::optional<int> signal;                       // NonZeroExit by signal
};

// Fields shared by both result arms.
struct RunRecord {
    std::string command;                 // normalized text (raw text if validation failed)
    std::optional<BackendKind> backend;  // unset when nothing was classified
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
    std::string timestamp;               // ISO-8601, set when the result is built
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

struct SuccessResult { RunRecord record; };
struct FailureResult { RunRecord record; ExecError error; };

// Exactly one arm is populated; only the failure arm carries an error.
class CommandResult {
public:
    static CommandResult success(RunRecord record);
    static CommandResult failure(RunRecord record, ExecError error);

    bool ok() const { return std::holds_alternative<SuccessResult>(m_value); }
    const RunRecord& record() const;
    const ExecError* error() const; // nullptr on success

    const std::string& stdout_text() const { return record().stdout_text; }
    const std::string& stderr_text() const { return record().stderr_text; }
    int exit_code() const { return record().exit_code; }
    std::chrono::milliseconds duration() const { return record().duration; }
    const std::string& timestamp() const { return record().timestamp; }

    const std::variant<SuccessResult, FailureResult>& value() const { return m_value; }

private:
    explicit CommandResult(std::variant<SuccessResult, FailureResult> v) : m_value(std::move(v)) {}
    std::variant<SuccessResult, FailureResult> m_value;
};

// One-line JSON rendering for adapters (line-delimited output).
std::string to_json(const CommandResult& result);

} // namespace shellbridge
