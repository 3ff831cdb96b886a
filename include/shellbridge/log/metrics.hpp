/*
 * Execution metrics - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace shellbridge {

struct MetricsSnapshot {
    std::uint64_t commands_executed = 0;
    std::uint64_t succeeded = 0;
    std::chrono::milliseconds total_duration{0};
    std::chrono::milliseconds average_duration{0};
    double success_rate = 1.0; // 1.0 until something has run
    std::string last_reset;    // ISO-8601
};

class PerformanceMetrics {
public:
    PerformanceMetrics();

    void record(std::chrono::milliseconds duration, bool success);
    MetricsSnapshot snapshot() const;
    void reset();

private:
    mutable std::mutex m_mutex;
    std::uint64_t m_count = 0;
    std::uint64_t m_succeeded = 0;
    std::chrono::milliseconds m_total{0};
    std::string m_last_reset;
};

} // namespace shellbridge
