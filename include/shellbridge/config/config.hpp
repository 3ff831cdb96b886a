/*
 * Engine configuration - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/exec/executor.hpp>
#include <shellbridge/log/logger.hpp>
#include <shellbridge/shell/shell_plan.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace shellbridge {

struct EngineConfig {
    std::size_t max_concurrent = 10;
    std::chrono::milliseconds default_timeout{120000};
    std::chrono::milliseconds kill_grace{5000};
    std::size_t max_output_bytes = 16u * 1024u * 1024u;
    std::size_t classifier_cache_capacity = 500;
    std::size_t normalizer_cache_capacity = 1000;
    bool reject_dangerous = true;
    bool rewrite_drive_paths = CommandNormalizer::default_rewrite_drive_paths();

    std::optional<std::string> console_shell;
    std::optional<std::string> powershell_path;
    std::optional<std::string> subsystem_shell;
    std::optional<std::string> wsl_distribution;

    LoggerConfig log;

    // Platform defaults with the executable overrides above applied.
    ShellTable shell_table() const;
    ExecutorConfig executor_config() const;
};

struct ConfigLoad {
    EngineConfig config;
    std::vector<std::string> warnings; // malformed lines and values
    std::string path;                  // file consulted
    bool file_found = false;
};

// $HOME/.shellbridgerc (%USERPROFILE% on Windows).
std::string default_config_path();

// Applies one key=value setting. Unknown keys and malformed values leave
// the config untouched and fill `warning`.
bool apply_setting(EngineConfig& cfg, const std::string& key, const std::string& value, std::string& warning);

// key=value lines, '#' comments, blank lines ignored.
void parse_config(std::istream& in, ConfigLoad& out);

using EnvLookup = std::function<const char*(const char*)>;

// SHELLBRIDGE_LOG_PATH, SHELLBRIDGE_DEBUG, SHELLBRIDGE_MAX_CONCURRENT.
void apply_environment(ConfigLoad& out, const EnvLookup& getenv_fn);

// File (explicit path or the default one, missing is fine) then environment.
ConfigLoad load_config(const std::optional<std::string>& explicit_path = std::nullopt);

} // namespace shellbridge
