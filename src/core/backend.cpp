/*
 * Backend kinds - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/core/backend.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace shellbridge {

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::ConsoleShell: return "console";
        case BackendKind::PowerShell: return "powershell";
        case BackendKind::PosixSubsystem: return "posix";
    }
    return "console";
}

std::optional<BackendKind> parse_backend(std::string_view name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (n == "console" || n == "cmd" || n == "sh") return BackendKind::ConsoleShell;
    if (n == "powershell" || n == "pwsh") return BackendKind::PowerShell;
    if (n == "posix" || n == "wsl" || n == "bash") return BackendKind::PosixSubsystem;
    return std::nullopt;
}

} // namespace shellbridge
