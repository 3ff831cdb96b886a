/*
 * Command executor - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/exec/executor.hpp>
#include <shellbridge/core/command.hpp>
#include <shellbridge/exec/child_process.hpp>
#include <shellbridge/shell/safety.hpp>
#include <algorithm>

namespace shellbridge {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{20};
constexpr const char* kComponent = "executor";

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

ExecError make_error(ErrorCategory category, const char* code, std::string message) {
    ExecError e;
    e.category = category;
    e.code = code;
    e.message = std::move(message);
    return e;
}

// t + d, saturating at the end of the clock's range.
std::chrono::steady_clock::time_point saturating_add(std::chrono::steady_clock::time_point t,
                                                     std::chrono::milliseconds d) {
    using clock = std::chrono::steady_clock;
    const auto room = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - t);
    return d >= room ? clock::time_point::max() : t + d;
}

enum class StopReason { None, Timeout, Cancelled };

} // namespace

Executor::Executor(ExecutorConfig cfg, Logger& logger)
    : m_cfg(std::move(cfg)),
      m_logger(logger),
      m_pool(m_cfg.max_concurrent),
      m_classifier(m_cfg.shells, m_cfg.classifier_cache_capacity),
      m_normalizer(m_cfg.normalizer_cache_capacity, m_cfg.shells.powershell.executable,
                   m_cfg.rewrite_drive_paths) {}

Executor::~Executor() {
    m_shutdown.store(true);
    m_pool.close();
    m_pool.kill_all();
}

void Executor::shutdown() {
    if (m_shutdown.exchange(true)) return;
    m_pool.close();
    std::size_t n = m_pool.kill_all();
    json::Object p;
    p.add("signalled", n);
    m_logger.record(LogLevel::Warn, "shutdown: admissions closed", kComponent, p);
}

ExecutorStats Executor::stats() const {
    ExecutorStats s;
    s.pool = m_pool.stats();
    s.metrics = m_metrics.snapshot();
    s.classifier_cache = m_classifier.cache_size();
    s.normalizer_cache = m_normalizer.cache_size();
    return s;
}

std::string to_json(const ExecutorStats& s) {
    json::Object pool;
    pool.add("active", s.pool.active);
    pool.add("tracked", s.pool.tracked);
    pool.add("peak", s.pool.peak);
    pool.add("maxConcurrent", s.pool.max_concurrent);
    pool.add("admitted", s.pool.admitted);
    pool.add("refused", s.pool.refused);
    json::Object metrics;
    metrics.add("commandsExecuted", s.metrics.commands_executed);
    metrics.add("totalDurationMs", static_cast<long long>(s.metrics.total_duration.count()));
    metrics.add("averageDurationMs", static_cast<long long>(s.metrics.average_duration.count()));
    metrics.add("successRate", s.metrics.success_rate);
    metrics.add("lastReset", s.metrics.last_reset);
    json::Object o;
    o.add("pool", pool);
    o.add("metrics", metrics);
    o.add("classifierCache", s.classifier_cache);
    o.add("normalizerCache", s.normalizer_cache);
    return o.str();
}

CommandResult Executor::run(std::string_view raw, const ExecutionOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    const std::string correlation = m_logger.next_correlation_id();

    RunRecord rec;
    rec.command = std::string(raw);
    rec.exit_code = -1;
    auto fail_early = [&](ExecError err) {
        rec.duration = elapsed_since(start);
        return finish(CommandResult::failure(std::move(rec), std::move(err)), options, correlation, nullptr);
    };

    // 1. validate
    std::string trimmed = trim_copy(raw);
    auto cmd = Command::make(trimmed);
    if (!cmd) {
        bool has_nul = raw.find('\0') != std::string_view::npos;
        return fail_early(make_error(ErrorCategory::Validation, error_code::InvalidCommand,
                                     has_nul ? "command contains a NUL byte" : "command is empty or blank"));
    }
    rec.command = cmd->text();
    if (options.timeout && options.timeout->count() <= 0) {
        return fail_early(make_error(ErrorCategory::Validation, error_code::InvalidTimeout,
                                     "timeout must be positive, got " + std::to_string(options.timeout->count()) + " ms"));
    }
    if (m_cfg.reject_dangerous) {
        if (auto why = find_dangerous_construct(cmd->text()))
            return fail_early(make_error(ErrorCategory::Validation, error_code::DangerousCommand,
                                         "rejected: " + *why));
    }
    if (m_shutdown.load()) {
        return fail_early(make_error(ErrorCategory::Cancelled, error_code::Cancelled, "executor is shutting down"));
    }

    // 2. normalize, classify
    Command normalized = m_normalizer.normalize(*cmd);
    rec.command = normalized.text();
    ShellPlan plan = m_classifier.classify(normalized, options.shell_override);
    rec.backend = plan.kind;

    // 3. admission. The child outlives the slot so a reaped pid is never
    // left in the pool's table.
    std::unique_ptr<ChildProcess> child;
    auto slot = m_pool.try_admit();
    if (!slot) {
        rec.duration = elapsed_since(start);
        return finish(CommandResult::failure(std::move(rec),
                          make_error(ErrorCategory::ResourceExhausted, error_code::ResourceExhausted,
                                     "process pool at capacity (" + std::to_string(m_pool.max_concurrent()) + ")")),
                      options, correlation, &plan);
    }

    // 4. spawn
    LaunchSpec spec = make_launch_spec(plan);
    spec.working_directory = options.working_directory;
    spec.environment = options.extra_environment;
    spec.max_output_bytes = m_cfg.max_output_bytes;
    SpawnError spawn_err;
    child = ChildProcess::spawn(spec, spawn_err);
    if (!child) {
        slot->release();
        ExecError e = make_error(ErrorCategory::SpawnFailure, error_code::SpawnFailed,
                                 spawn_err.message + ": " + spawn_err.os_error.message());
        e.os_error = spawn_err.os_error;
        rec.duration = elapsed_since(start);
        return finish(CommandResult::failure(std::move(rec), std::move(e)), options, correlation, &plan);
    }
    slot->attach(child->id(), child->native_handle());
    {
        json::Object p;
        p.add("pid", static_cast<long long>(child->id()));
        p.add("executable", plan.executable);
        m_logger.record(LogLevel::Debug, "spawned", kComponent, p, correlation);
    }

    // 5-6. capture until exit; timeout and cancellation take the grace-kill path
    const auto budget = options.timeout.value_or(m_cfg.default_timeout);
    const auto deadline = saturating_add(start, budget);
    StopReason stop = StopReason::None;
    std::chrono::steady_clock::time_point kill_at{};
    bool forced = false;
    while (!child->wait_for(kWaitSlice)) {
        auto now = std::chrono::steady_clock::now();
        if (stop == StopReason::None) {
            if (now >= deadline) stop = StopReason::Timeout;
            else if ((options.cancellation && options.cancellation->is_cancelled()) || m_shutdown.load())
                stop = StopReason::Cancelled;
            if (stop != StopReason::None) {
                child->terminate();
                kill_at = saturating_add(now, m_cfg.kill_grace);
                m_logger.record(LogLevel::Warn,
                                stop == StopReason::Timeout ? "timeout, sending graceful stop" : "cancelled, sending graceful stop",
                                kComponent, json::Object(), correlation);
            }
        } else if (!forced && now >= kill_at) {
            child->kill();
            forced = true;
            m_logger.record(LogLevel::Warn, "grace period elapsed, killing", kComponent, json::Object(), correlation);
        }
    }
    if (stop == StopReason::None && m_shutdown.load()) stop = StopReason::Cancelled;

    // 7. release before reaping, then collect
    slot->release();
    ChildExit ex = child->reap();
    rec.stdout_truncated = child->out().truncated();
    rec.stderr_truncated = child->err().truncated();
    rec.stdout_text = to_utf8(child->out().take(), options.output_encoding);
    rec.stderr_text = to_utf8(child->err().take(), options.output_encoding);
    rec.exit_code = ex.exit_code;
    rec.duration = elapsed_since(start);

    if (stop == StopReason::Timeout) {
        ExecError e = make_error(ErrorCategory::Timeout, error_code::Timeout,
                                 "timed out after " + std::to_string(budget.count()) + " ms" +
                                     (forced ? " (killed)" : ""));
        e.budget = budget;
        e.signal = ex.signal;
        return finish(CommandResult::failure(std::move(rec), std::move(e)), options, correlation, &plan);
    }
    if (stop == StopReason::Cancelled) {
        ExecError e = make_error(ErrorCategory::Cancelled, error_code::Cancelled, "cancelled");
        e.signal = ex.signal;
        return finish(CommandResult::failure(std::move(rec), std::move(e)), options, correlation, &plan);
    }
    if (ex.signal) {
        ExecError e = make_error(ErrorCategory::NonZeroExit, error_code::Signaled,
                                 "terminated by signal " + std::to_string(*ex.signal));
        e.signal = ex.signal;
        return finish(CommandResult::failure(std::move(rec), std::move(e)), options, correlation, &plan);
    }
    if (ex.exit_code != 0) {
        int code = ex.exit_code;
        return finish(CommandResult::failure(std::move(rec),
                          make_error(ErrorCategory::NonZeroExit, error_code::NonZeroExit,
                                     "exited with code " + std::to_string(code))),
                      options, correlation, &plan);
    }
    return finish(CommandResult::success(std::move(rec)), options, correlation, &plan);
}

CommandResult Executor::finish(CommandResult result, const ExecutionOptions& options,
                               const std::string& correlation_id, const ShellPlan* plan) {
    const RunRecord& r = result.record();
    m_metrics.record(r.duration, result.ok());

    json::Object p;
    p.add("command", r.command);
    if (plan) {
        p.add("backend", to_string(plan->kind));
        p.add("rule", plan->rule);
    }
    if (options.description) p.add("description", *options.description);
    p.add("exitCode", r.exit_code);
    p.add("durationMs", static_cast<long long>(r.duration.count()));
    p.add("success", result.ok());

    LogLevel level = LogLevel::Info;
    std::string message = "command succeeded";
    if (const ExecError* e = result.error()) {
        p.add("errorCode", e->code);
        p.add("category", to_string(e->category));
        message = "command failed: " + e->message;
        level = (e->category == ErrorCategory::SpawnFailure || e->category == ErrorCategory::Internal)
                    ? LogLevel::Error
                    : LogLevel::Warn;
    }
    m_logger.record(level, std::move(message), kComponent, p, correlation_id);
    return result;
}

} // namespace shellbridge
