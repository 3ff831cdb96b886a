/*
 * Engine configuration - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/config/config.hpp>
#include <shellbridge/core/command.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <istream>

namespace shellbridge {

namespace {

std::optional<bool> parse_bool(const std::string& v) {
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    return std::nullopt;
}

std::optional<unsigned long long> parse_count(const std::string& v) {
    unsigned long long n = 0;
    auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec != std::errc() || p != v.data() + v.size() || v.empty()) return std::nullopt;
    return n;
}

bool set_count(const std::string& key, const std::string& value, bool allow_zero,
               unsigned long long& out, std::string& warning) {
    auto n = parse_count(value);
    if (!n || (!allow_zero && *n == 0)) {
        warning = "invalid value for " + key + ": '" + value + "'";
        return false;
    }
    out = *n;
    return true;
}

// Durations must fit the signed millisecond count.
bool set_duration(const std::string& key, const std::string& value, bool allow_zero,
                  std::chrono::milliseconds& out, std::string& warning) {
    unsigned long long n = 0;
    if (!set_count(key, value, allow_zero, n, warning)) return false;
    if (n > static_cast<unsigned long long>(std::chrono::milliseconds::max().count())) {
        warning = "value out of range for " + key + ": '" + value + "'";
        return false;
    }
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(n));
    return true;
}

} // namespace

ShellTable EngineConfig::shell_table() const {
    ShellTable t = ShellTable::platform_defaults();
    if (console_shell) t.console.executable = *console_shell;
    if (powershell_path) t.powershell.executable = *powershell_path;
    if (subsystem_shell) t.subsystem.executable = *subsystem_shell;
#ifdef _WIN32
    if (wsl_distribution && !wsl_distribution->empty())
        t.subsystem.prefix_args.insert(t.subsystem.prefix_args.begin(), {"-d", *wsl_distribution});
#endif
    return t;
}

ExecutorConfig EngineConfig::executor_config() const {
    ExecutorConfig e;
    e.max_concurrent = max_concurrent;
    e.default_timeout = default_timeout;
    e.kill_grace = kill_grace;
    e.max_output_bytes = max_output_bytes;
    e.classifier_cache_capacity = classifier_cache_capacity;
    e.normalizer_cache_capacity = normalizer_cache_capacity;
    e.reject_dangerous = reject_dangerous;
    e.rewrite_drive_paths = rewrite_drive_paths;
    e.shells = shell_table();
    return e;
}

std::string default_config_path() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home) return ".shellbridgerc";
    return std::string(home) + "/.shellbridgerc";
}

bool apply_setting(EngineConfig& cfg, const std::string& key, const std::string& value, std::string& warning) {
    unsigned long long n = 0;
    if (key == "max_concurrent") {
        if (!set_count(key, value, false, n, warning)) return false;
        cfg.max_concurrent = static_cast<std::size_t>(n);
    } else if (key == "default_timeout_ms") {
        if (!set_duration(key, value, false, cfg.default_timeout, warning)) return false;
    } else if (key == "kill_grace_ms") {
        if (!set_duration(key, value, true, cfg.kill_grace, warning)) return false;
    } else if (key == "max_output_bytes") {
        if (!set_count(key, value, false, n, warning)) return false;
        cfg.max_output_bytes = static_cast<std::size_t>(n);
    } else if (key == "classifier_cache_capacity") {
        if (!set_count(key, value, true, n, warning)) return false;
        cfg.classifier_cache_capacity = static_cast<std::size_t>(n);
    } else if (key == "normalizer_cache_capacity") {
        if (!set_count(key, value, true, n, warning)) return false;
        cfg.normalizer_cache_capacity = static_cast<std::size_t>(n);
    } else if (key == "reject_dangerous" || key == "rewrite_drive_paths" || key == "log_debug") {
        auto b = parse_bool(value);
        if (!b) { warning = "invalid boolean for " + key + ": '" + value + "'"; return false; }
        if (key == "reject_dangerous") cfg.reject_dangerous = *b;
        else if (key == "rewrite_drive_paths") cfg.rewrite_drive_paths = *b;
        else cfg.log.debug = *b;
    } else if (key == "console_shell" || key == "powershell_path" || key == "subsystem_shell" ||
               key == "wsl_distribution" || key == "log_path") {
        if (value.empty()) { warning = "empty value for " + key; return false; }
        if (key == "console_shell") cfg.console_shell = value;
        else if (key == "powershell_path") cfg.powershell_path = value;
        else if (key == "subsystem_shell") cfg.subsystem_shell = value;
        else if (key == "wsl_distribution") cfg.wsl_distribution = value;
        else cfg.log.path = value;
    } else if (key == "log_buffer_bytes") {
        if (!set_count(key, value, false, n, warning)) return false;
        cfg.log.buffer_bytes = static_cast<std::size_t>(n);
    } else if (key == "log_flush_interval_ms") {
        if (!set_count(key, value, true, n, warning)) return false;
        cfg.log.flush_interval = std::chrono::milliseconds(n);
    } else if (key == "log_max_file_bytes") {
        if (!set_count(key, value, false, n, warning)) return false;
        cfg.log.max_file_bytes = n;
    } else if (key == "log_max_files") {
        if (!set_count(key, value, true, n, warning)) return false;
        cfg.log.max_files = static_cast<std::size_t>(n);
    } else {
        warning = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

void parse_config(std::istream& in, ConfigLoad& out) {
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string t = trim_copy(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) {
            out.warnings.push_back("line " + std::to_string(lineno) + ": expected key=value");
            continue;
        }
        std::string key = trim_copy(t.substr(0, eq));
        std::string val = trim_copy(t.substr(eq + 1));
        std::string warning;
        if (!apply_setting(out.config, key, val, warning))
            out.warnings.push_back("line " + std::to_string(lineno) + ": " + warning);
    }
}

void apply_environment(ConfigLoad& out, const EnvLookup& getenv_fn) {
    if (const char* v = getenv_fn("SHELLBRIDGE_LOG_PATH"); v && *v) out.config.log.path = v;
    if (const char* v = getenv_fn("SHELLBRIDGE_DEBUG"); v && *v) {
        auto b = parse_bool(v);
        if (b) out.config.log.debug = *b;
        else out.warnings.push_back(std::string("SHELLBRIDGE_DEBUG: invalid boolean '") + v + "'");
    }
    if (const char* v = getenv_fn("SHELLBRIDGE_MAX_CONCURRENT"); v && *v) {
        std::string warning;
        if (!apply_setting(out.config, "max_concurrent", v, warning))
            out.warnings.push_back("SHELLBRIDGE_MAX_CONCURRENT: " + warning);
    }
}

ConfigLoad load_config(const std::optional<std::string>& explicit_path) {
    ConfigLoad out;
    out.path = explicit_path ? *explicit_path : default_config_path();
    std::ifstream in(out.path);
    if (in) {
        out.file_found = true;
        parse_config(in, out);
    } else if (explicit_path) {
        out.warnings.push_back("cannot open config file " + out.path);
    }
    apply_environment(out, [](const char* k) { return std::getenv(k); });
    return out;
}

} // namespace shellbridge
