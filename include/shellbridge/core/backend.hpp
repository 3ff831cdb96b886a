/*
 * Shell backend kinds - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string_view>

namespace shellbridge {

enum class BackendKind { ConsoleShell, PowerShell, PosixSubsystem };

const char* to_string(BackendKind kind);

// Accepts the canonical names ("console", "powershell", "posix") and the
// user-facing aliases cmd, pwsh, wsl, bash, sh.
std::optional<BackendKind> parse_backend(std::string_view name);

} // namespace shellbridge
