/*
 * Shell classifier - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/backend.hpp>
#include <shellbridge/core/bounded_cache.hpp>
#include <shellbridge/core/command.hpp>
#include <shellbridge/shell/shell_plan.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace shellbridge {

// Rule names recorded in ShellPlan::rule.
namespace rule {
constexpr const char* Override = "override";
constexpr const char* SubsystemPrefix = "wsl-prefix";
constexpr const char* SubsystemPath = "mount-path";
constexpr const char* PowerShellSyntax = "powershell";
constexpr const char* Git = "git";
constexpr const char* NodeTooling = "node";
constexpr const char* Docker = "docker";
constexpr const char* Python = "python";
constexpr const char* Default = "default";
} // namespace rule

// True when the text starts with a `wsl` invocation or references
// subsystem mount paths (/mnt/..., \\wsl$\..., \\wsl.localhost\...).
bool is_subsystem_invocation(std::string_view text);

// Remainder after a leading `wsl <ws>` token, or nullopt when absent.
std::optional<std::string> strip_subsystem_prefix(std::string_view text);

// Verb-Noun cmdlet syntax or $PSVersionTable.
bool has_powershell_syntax(std::string_view text);

class ShellClassifier {
public:
    static constexpr std::size_t kDefaultCacheCapacity = 500;

    explicit ShellClassifier(ShellTable table = ShellTable::platform_defaults(),
                             std::size_t cache_capacity = kDefaultCacheCapacity);

    // Deterministic for a given command text. An override always wins and
    // bypasses the memo table.
    ShellPlan classify(const Command& command,
                       std::optional<BackendKind> override_kind = std::nullopt) const;

    const ShellTable& table() const { return m_table; }
    std::size_t cache_size() const { return m_cache.size(); }
    void clear_cache() { m_cache.clear(); }

private:
    ShellPlan detect(const std::string& text) const;
    ShellPlan make_plan(BackendKind kind, std::string payload, const char* rule_name) const;

    ShellTable m_table;
    mutable BoundedCache<ShellPlan> m_cache;
};

} // namespace shellbridge
