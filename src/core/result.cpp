/*
 * Command results and error taxonomy - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/core/result.hpp>
#include <shellbridge/core/json.hpp>
#include <shellbridge/core/time.hpp>

namespace shellbridge {

const char* to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Validation: return "VALIDATION";
        case ErrorCategory::SpawnFailure: return "SPAWN_FAILURE";
        case ErrorCategory::Timeout: return "TIMEOUT";
        case ErrorCategory::Cancelled: return "CANCELLED";
        case ErrorCategory::ResourceExhausted: return "RESOURCE_EXHAUSTED";
        case ErrorCategory::NonZeroExit: return "NON_ZERO_EXIT";
        case ErrorCategory::Internal: return "INTERNAL";
    }
    return "INTERNAL";
}

CommandResult CommandResult::success(RunRecord record) {
    record.exit_code = 0;
    if (record.timestamp.empty()) record.timestamp = iso8601_now();
    return CommandResult(SuccessResult{std::move(record)});
}

CommandResult CommandResult::failure(RunRecord record, ExecError error) {
    if (record.timestamp.empty()) record.timestamp = iso8601_now();
    return CommandResult(FailureResult{std::move(record), std::move(error)});
}

const RunRecord& CommandResult::record() const {
    if (auto* s = std::get_if<SuccessResult>(&m_value)) return s->record;
    return std::get<FailureResult>(m_value).record;
}

const ExecError* CommandResult::error() const {
    if (auto* f = std::get_if<FailureResult>(&m_value)) return &f->error;
    return nullptr;
}

std::string to_json(const CommandResult& result) {
    const RunRecord& r = result.record();
    json::Object o;
    o.add("success", result.ok());
    o.add("command", r.command);
    if (r.backend) o.add("backend", to_string(*r.backend));
    else o.add_raw("backend", "null");
    o.add("stdout", r.stdout_text);
    o.add("stderr", r.stderr_text);
    o.add("exitCode", r.exit_code);
    o.add("durationMs", static_cast<long long>(r.duration.count()));
    o.add("timestamp", r.timestamp);
    o.add("stdoutTruncated", r.stdout_truncated);
    o.add("stderrTruncated", r.stderr_truncated);
    if (const ExecError* e = result.error()) {
        json::Object err;
        err.add("code", e->code);
        err.add("category", to_string(e->category));
        err.add("message", e->message);
        if (e->os_error) {
            err.add("osError", e->os_error.value());
            err.add("osMessage", e->os_error.message());
        }
        if (e->budget) err.add("timeoutMs", static_cast<long long>(e->budget->count()));
        if (e->signal) err.add("signal", *e->signal);
        o.add("error", err);
    }
    return o.str();
}

} // namespace shellbridge
