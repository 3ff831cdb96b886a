/*
 * Buffered structured logger - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/log/logger.hpp>
#include <shellbridge/core/time.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace shellbridge {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string format_line(const LogEntry& e) {
    std::string line = e.timestamp;
    line += " [";
    line += to_string(e.level);
    line += "]";
    if (!e.component.empty()) line += " [" + e.component + "]";
    if (!e.correlation_id.empty()) line += " (" + e.correlation_id + ")";
    line += " ";
    // one entry per line
    for (char c : e.message) line.push_back(c == '\n' || c == '\r' ? ' ' : c);
    if (!e.payload.empty()) line += " " + e.payload;
    line += "\n";
    return line;
}

std::string LoggerConfig::default_log_path() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home) return "shellbridge.log";
    return (fs::path(home) / ".shellbridge" / "logs" / "shellbridge.log").string();
}

Logger::Logger(LoggerConfig cfg) : m_cfg(std::move(cfg)), m_debug(m_cfg.debug) {
    if (m_cfg.flush_interval.count() > 0) m_timer = std::thread([this] { timer_loop(); });
}

Logger::~Logger() { dispose(); }

void Logger::record(LogLevel level, std::string message, std::string component,
                    const json::Object& payload, std::string correlation_id) {
    if (m_disposed.load()) return;
    if (level == LogLevel::Debug && !m_debug.load()) return;

    LogEntry e;
    e.timestamp = iso8601_now();
    e.level = level;
    e.message = std::move(message);
    e.component = std::move(component);
    e.correlation_id = correlation_id.empty() ? next_correlation_id() : std::move(correlation_id);
    if (!payload.empty()) e.payload = payload.str();
    std::string line = format_line(e);

    bool need_flush = level == LogLevel::Error;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_buffer_bytes += line.size();
        m_buffer.push_back(std::move(line));
        while (m_buffer.size() > m_cfg.max_buffered_entries && !m_buffer.empty()) {
            m_buffer_bytes -= m_buffer.front().size();
            m_buffer.pop_front();
            ++m_dropped;
        }
        if (m_buffer_bytes >= m_cfg.buffer_bytes) need_flush = true;
    }
    if (need_flush) flush();
}

bool Logger::flush() {
    std::lock_guard<std::mutex> io(m_io_mutex);
    std::deque<std::string> pending;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_buffer.empty()) return true;
        pending.swap(m_buffer);
        m_buffer_bytes = 0;
    }

    bool ok = rotate_if_needed() && append_lines(pending);

    std::lock_guard<std::mutex> lk(m_mutex);
    if (ok) {
        ++m_flushes;
        return true;
    }
    ++m_failed_flushes;
    // Put the batch back in front of anything recorded meanwhile.
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        m_buffer_bytes += it->size();
        m_buffer.push_front(std::move(*it));
    }
    while (m_buffer.size() > m_cfg.max_buffered_entries) {
        m_buffer_bytes -= m_buffer.front().size();
        m_buffer.pop_front();
        ++m_dropped;
    }
    return false;
}

bool Logger::rotate_if_needed() {
    std::error_code ec;
    fs::path dest(m_cfg.path);
    auto size = fs::file_size(dest, ec);
    if (ec || size <= m_cfg.max_file_bytes) return true;

    auto numbered = [&](std::size_t i) { return fs::path(m_cfg.path + "." + std::to_string(i)); };
    if (m_cfg.max_files == 0) {
        fs::remove(dest, ec);
        if (ec) { std::cerr << "shellbridge: cannot remove " << dest << ": " << ec.message() << '\n'; return false; }
        ++m_rotations;
        return true;
    }
    fs::remove(numbered(m_cfg.max_files), ec);
    for (std::size_t i = m_cfg.max_files - 1; i >= 1; --i) {
        if (fs::exists(numbered(i), ec)) fs::rename(numbered(i), numbered(i + 1), ec);
    }
    fs::rename(dest, numbered(1), ec);
    if (ec) {
        std::cerr << "shellbridge: cannot rotate " << dest << ": " << ec.message() << '\n';
        return false;
    }
    ++m_rotations;
    return true;
}

bool Logger::append_lines(const std::deque<std::string>& lines) {
    fs::path dest(m_cfg.path);
    std::error_code ec;
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path(), ec);

    std::FILE* f = std::fopen(m_cfg.path.c_str(), "ab");
    if (!f) {
        std::cerr << "shellbridge: cannot open log " << m_cfg.path << '\n';
        return false;
    }
    bool ok = true;
    for (auto& l : lines) {
        if (std::fwrite(l.data(), 1, l.size(), f) != l.size()) { ok = false; break; }
    }
    if (std::fclose(f) != 0) ok = false;
    if (!ok) std::cerr << "shellbridge: write to " << m_cfg.path << " failed\n";
    return ok;
}

void Logger::timer_loop() {
    std::unique_lock<std::mutex> lk(m_timer_mutex);
    while (!m_stop_timer) {
        if (m_timer_cv.wait_for(lk, m_cfg.flush_interval, [this] { return m_stop_timer; })) break;
        lk.unlock();
        bool has_entries;
        {
            std::lock_guard<std::mutex> b(m_mutex);
            has_entries = !m_buffer.empty();
        }
        if (has_entries) flush();
        lk.lock();
    }
}

void Logger::dispose() {
    if (m_disposed.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(m_timer_mutex);
        m_stop_timer = true;
    }
    m_timer_cv.notify_all();
    if (m_timer.joinable()) {
        if (m_timer.get_id() == std::this_thread::get_id()) m_timer.detach();
        else m_timer.join();
    }
    flush();
}

std::string Logger::next_correlation_id() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uint64_t n = ++m_next_id;
    std::string out(8, '0');
    for (int i = 7; i >= 0 && n > 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[n % 36];
        n /= 36;
    }
    return out;
}

LoggerStats Logger::stats() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    LoggerStats s;
    s.buffered_entries = m_buffer.size();
    s.buffered_bytes = m_buffer_bytes;
    s.flushes = m_flushes;
    s.failed_flushes = m_failed_flushes;
    s.dropped_entries = m_dropped;
    s.rotations = m_rotations;
    s.path = m_cfg.path;
    return s;
}

} // namespace shellbridge
