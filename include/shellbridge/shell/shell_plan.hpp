/*
 * Shell plans and backend tables - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/backend.hpp>
#include <string>
#include <vector>

namespace shellbridge {

// How the command text is attached after the prefix arguments.
//  SingleArgument: one argv entry (quoted as needed on Windows).
//  Verbatim:       appended raw to the native command line (cmd.exe /s /c).
//                  On POSIX this behaves like SingleArgument.
enum class TrailingArgMode { SingleArgument, Verbatim };

struct ShellSpec {
    std::string executable;
    std::vector<std::string> prefix_args;
    TrailingArgMode trailing_mode = TrailingArgMode::SingleArgument;
};

struct ShellTable {
    ShellSpec console;
    ShellSpec powershell;
    ShellSpec subsystem;

    static ShellTable windows_defaults();
    static ShellTable posix_defaults();
    static ShellTable platform_defaults();

    const ShellSpec& spec(BackendKind kind) const;
};

struct ShellPlan {
    BackendKind kind = BackendKind::ConsoleShell;
    std::string executable;
    std::vector<std::string> prefix_args;
    TrailingArgMode trailing_mode = TrailingArgMode::SingleArgument;
    std::string payload; // text handed to the shell as its trailing argument
    std::string rule;    // detector that produced the plan

    // prefix_args followed by payload
    std::vector<std::string> arguments() const;

    bool operator==(const ShellPlan& o) const {
        return kind == o.kind && executable == o.executable && prefix_args == o.prefix_args &&
               trailing_mode == o.trailing_mode && payload == o.payload && rule == o.rule;
    }
    bool operator!=(const ShellPlan& o) const { return !(*this == o); }
};

} // namespace shellbridge
