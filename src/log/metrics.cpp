/*
 * Execution metrics - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/log/metrics.hpp>
#include <shellbridge/core/time.hpp>

namespace shellbridge {

PerformanceMetrics::PerformanceMetrics() : m_last_reset(iso8601_now()) {}

void PerformanceMetrics::record(std::chrono::milliseconds duration, bool success) {
    std::lock_guard<std::mutex> lk(m_mutex);
    ++m_count;
    if (success) ++m_succeeded;
    m_total += duration;
}

MetricsSnapshot PerformanceMetrics::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    MetricsSnapshot s;
    s.commands_executed = m_count;
    s.succeeded = m_succeeded;
    s.total_duration = m_total;
    if (m_count > 0) {
        s.average_duration = std::chrono::milliseconds(m_total.count() / static_cast<long long>(m_count));
        s.success_rate = static_cast<double>(m_succeeded) / static_cast<double>(m_count);
    }
    s.last_reset = m_last_reset;
    return s;
}

void PerformanceMetrics::reset() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_count = 0;
    m_succeeded = 0;
    m_total = std::chrono::milliseconds(0);
    m_last_reset = iso8601_now();
}

} // namespace shellbridge
