/*
 * Command executor - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/options.hpp>
#include <shellbridge/core/result.hpp>
#include <shellbridge/exec/process_pool.hpp>
#include <shellbridge/log/logger.hpp>
#include <shellbridge/log/metrics.hpp>
#include <shellbridge/shell/classifier.hpp>
#include <shellbridge/shell/normalizer.hpp>
#include <atomic>
#include <chrono>
#include <string_view>

namespace shellbridge {

struct ExecutorConfig {
    std::size_t max_concurrent = 10;
    std::chrono::milliseconds default_timeout{120000};
    std::chrono::milliseconds kill_grace{5000};
    std::size_t max_output_bytes = 16u * 1024u * 1024u;
    std::size_t classifier_cache_capacity = ShellClassifier::kDefaultCacheCapacity;
    std::size_t normalizer_cache_capacity = CommandNormalizer::kDefaultCacheCapacity;
    bool reject_dangerous = true;
    bool rewrite_drive_paths = CommandNormalizer::default_rewrite_drive_paths();
    ShellTable shells = ShellTable::platform_defaults();
};

struct ExecutorStats {
    PoolStats pool;
    MetricsSnapshot metrics;
    std::size_t classifier_cache = 0;
    std::size_t normalizer_cache = 0;
};

std::string to_json(const ExecutorStats& stats);

// Runs one command at a time per call: validate, normalize, classify,
// admit, spawn, capture, enforce timeout/cancellation, then log and
// account. Safe to call from many threads. Operational faults come back
// as Failure results; run() does not throw for them.
class Executor {
public:
    Executor(ExecutorConfig cfg, Logger& logger);
    ~Executor();
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    CommandResult run(std::string_view raw, const ExecutionOptions& options = ExecutionOptions());

    ExecutorStats stats() const;
    void reset_metrics() { m_metrics.reset(); }

    // Stop admissions, make in-flight runs report Cancelled, and signal
    // every tracked process. Idempotent.
    void shutdown();
    bool is_shut_down() const { return m_shutdown.load(); }

    const ExecutorConfig& config() const { return m_cfg; }
    ProcessPool& pool() { return m_pool; }
    ShellClassifier& classifier() { return m_classifier; }
    CommandNormalizer& normalizer() { return m_normalizer; }

private:
    CommandResult finish(CommandResult result, const ExecutionOptions& options,
                         const std::string& correlation_id, const ShellPlan* plan);

    ExecutorConfig m_cfg;
    Logger& m_logger;
    ProcessPool m_pool;
    ShellClassifier m_classifier;
    CommandNormalizer m_normalizer;
    PerformanceMetrics m_metrics;
    std::atomic<bool> m_shutdown{false};
};

} // namespace shellbridge
