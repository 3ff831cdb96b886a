/*
 * Buffered structured logger - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace shellbridge {

enum class LogLevel { Debug, Info, Warn, Error };

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

struct LogEntry {
    std::string timestamp;
    LogLevel level = LogLevel::Info;
    std::string message;
    std::string payload;        // rendered JSON object, empty when absent
    std::string correlation_id; // empty when absent
    std::string component;      // empty when absent
};

// <timestamp> [LEVEL] [component] (correlation) message {payload}
std::string format_line(const LogEntry& entry);

struct LoggerConfig {
    std::string path = default_log_path();
    std::size_t buffer_bytes = 64 * 1024;          // flush when the buffer grows past this
    std::chrono::milliseconds flush_interval{5000}; // periodic flush; zero disables the timer
    std::uint64_t max_file_bytes = 50ull * 1024 * 1024;
    std::size_t max_files = 5;                     // rotated backlog files kept
    std::size_t max_buffered_entries = 10000;      // cap while the destination is failing
    bool debug = false;

    static std::string default_log_path();
};

struct LoggerStats {
    std::size_t buffered_entries = 0;
    std::size_t buffered_bytes = 0;
    std::uint64_t flushes = 0;
    std::uint64_t failed_flushes = 0;
    std::uint64_t dropped_entries = 0;
    std::uint64_t rotations = 0;
    std::string path;
};

// Append-only line sink. Entries are buffered and written in bulk on a
// size threshold, on every ERROR entry and from a periodic flush thread.
// Before each write the destination is rotated into path.1 .. path.N once
// it exceeds max_file_bytes.
class Logger {
public:
    explicit Logger(LoggerConfig cfg = LoggerConfig());
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void record(LogLevel level, std::string message, std::string component = {},
                const json::Object& payload = json::Object(), std::string correlation_id = {});

    void debug(std::string msg, std::string component = {}) { record(LogLevel::Debug, std::move(msg), std::move(component)); }
    void info(std::string msg, std::string component = {}) { record(LogLevel::Info, std::move(msg), std::move(component)); }
    void warn(std::string msg, std::string component = {}) { record(LogLevel::Warn, std::move(msg), std::move(component)); }
    void error(std::string msg, std::string component = {}) { record(LogLevel::Error, std::move(msg), std::move(component)); }

    // Synchronous write of everything buffered. False when the write failed
    // (entries are kept for the next attempt).
    bool flush();

    // Final flush and timer shutdown. Safe to call more than once; later
    // records are ignored.
    void dispose();
    bool disposed() const { return m_disposed.load(); }

    // 8-char base-36, zero padded, process-unique per logger.
    std::string next_correlation_id();

    LoggerStats stats() const;
    const LoggerConfig& config() const { return m_cfg; }
    void set_debug(bool on) { m_debug.store(on); }

private:
    bool rotate_if_needed();
    bool append_lines(const std::deque<std::string>& lines);
    void timer_loop();

    LoggerConfig m_cfg;
    std::atomic<bool> m_debug;
    std::atomic<bool> m_disposed{false};
    std::atomic<std::uint64_t> m_next_id{0};

    mutable std::mutex m_mutex;
    std::mutex m_io_mutex; // serializes rotation + append
    std::deque<std::string> m_buffer;
    std::size_t m_buffer_bytes = 0;
    std::uint64_t m_flushes = 0;
    std::uint64_t m_failed_flushes = 0;
    std::uint64_t m_dropped = 0;
    std::atomic<std::uint64_t> m_rotations{0};

    std::mutex m_timer_mutex;
    std::condition_variable m_timer_cv;
    bool m_stop_timer = false;
    std::thread m_timer;
};

} // namespace shellbridge
