/*
 * Shell plans and backend tables - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/shell/shell_plan.hpp>

namespace shellbridge {

ShellTable ShellTable::windows_defaults() {
    ShellTable t;
    t.console = {"cmd.exe", {"/d", "/s", "/c"}, TrailingArgMode::Verbatim};
    t.powershell = {"powershell.exe", {"-NoProfile", "-Command"}, TrailingArgMode::SingleArgument};
    t.subsystem = {"wsl.exe", {"--", "bash", "-c"}, TrailingArgMode::SingleArgument};
    return t;
}

ShellTable ShellTable::posix_defaults() {
    ShellTable t;
    t.console = {"/bin/sh", {"-c"}, TrailingArgMode::SingleArgument};
    t.powershell = {"pwsh", {"-NoProfile", "-Command"}, TrailingArgMode::SingleArgument};
    t.subsystem = {"/bin/bash", {"-c"}, TrailingArgMode::SingleArgument};
    return t;
}

ShellTable ShellTable::platform_defaults() {
#ifdef _WIN32
    return windows_defaults();
#else
    return posix_defaults();
#endif
}

const ShellSpec& ShellTable::spec(BackendKind kind) const {
    switch (kind) {
        case BackendKind::PowerShell: return powershell;
        case BackendKind::PosixSubsystem: return subsystem;
        case BackendKind::ConsoleShell: break;
    }
    return console;
}

std::vector<std::string> ShellPlan::arguments() const {
    std::vector<std::string> args = prefix_args;
    args.push_back(payload);
    return args;
}

} // namespace shellbridge
