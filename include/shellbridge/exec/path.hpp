/*
 * PATH resolution utilities - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace shellbridge {

// Resolve a program name against a PATH value (':'-separated on POSIX).
// Names containing '/' are checked as-is. Returns nullopt when no
// executable regular file is found.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_value);

// Same, using the PATH of the current process.
std::optional<std::string> resolve_executable(const std::string& cmd);

} // namespace shellbridge
