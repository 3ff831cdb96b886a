/*
 * Shell classifier - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/shell/classifier.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>

namespace shellbridge {

namespace {

// Approved verbs recognised in Verb-Noun cmdlet names.
constexpr std::string_view kVerbs[] = {
    "Get", "Set", "New", "Remove", "Invoke", "Start", "Stop", "Test", "Write",
    "Select", "Where", "ForEach", "Out", "Import", "Export", "Add", "Clear", "Copy",
    "Move", "Rename", "Measure", "Sort", "Format", "ConvertTo", "ConvertFrom"};

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; }

bool is_cmdlet_boundary(char c) {
    return is_blank(c) || c == '|' || c == ';' || c == '(' || c == '{' || c == '&';
}

bool is_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// Length of `word` plus the whitespace run after it when `text` starts
// with that word followed by at least one blank; 0 otherwise.
std::size_t leading_word(std::string_view text, std::string_view word, bool ignore_case = false) {
    if (text.size() <= word.size()) return 0;
    for (std::size_t i = 0; i < word.size(); ++i) {
        char c = text[i];
        if (ignore_case) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c != word[i]) return 0;
    }
    std::size_t end = word.size();
    while (end < text.size() && is_blank(text[end])) ++end;
    return end == word.size() ? 0 : end;
}

bool starts_with_any(std::string_view text, std::initializer_list<std::string_view> words) {
    for (auto w : words)
        if (leading_word(text, w)) return true;
    return false;
}

std::string lower_copy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<std::string> strip_subsystem_prefix(std::string_view text) {
    std::size_t n = leading_word(text, "wsl.exe", true);
    if (!n) n = leading_word(text, "wsl", true);
    if (!n) return std::nullopt;
    return std::string(text.substr(n));
}

bool is_subsystem_invocation(std::string_view text) {
    if (strip_subsystem_prefix(text)) return true;
    if (text.find("/mnt/") != std::string_view::npos) return true;
    return lower_copy(text).find("\\\\wsl") != std::string::npos;
}

bool has_powershell_syntax(std::string_view text) {
    if (text.find("$PSVersionTable") != std::string_view::npos) return true;
    for (std::string_view verb : kVerbs) {
        for (auto pos = text.find(verb); pos != std::string_view::npos; pos = text.find(verb, pos + 1)) {
            if (pos > 0 && !is_cmdlet_boundary(text[pos - 1])) continue;
            std::size_t dash = pos + verb.size();
            if (dash + 1 < text.size() && text[dash] == '-' && is_letter(text[dash + 1])) return true;
        }
    }
    return false;
}

ShellClassifier::ShellClassifier(ShellTable table, std::size_t cache_capacity)
    : m_table(std::move(table)), m_cache(cache_capacity) {}

ShellPlan ShellClassifier::make_plan(BackendKind kind, std::string payload,
                                     const char* rule_name) const {
    const ShellSpec& spec = m_table.spec(kind);
    ShellPlan plan;
    plan.kind = kind;
    plan.executable = spec.executable;
    plan.prefix_args = spec.prefix_args;
    plan.trailing_mode = spec.trailing_mode;
    plan.payload = std::move(payload);
    plan.rule = rule_name;
    return plan;
}

ShellPlan ShellClassifier::detect(const std::string& text) const {
    if (auto rest = strip_subsystem_prefix(text))
        return make_plan(BackendKind::PosixSubsystem, *rest, rule::SubsystemPrefix);
    if (is_subsystem_invocation(text))
        return make_plan(BackendKind::PosixSubsystem, text, rule::SubsystemPath);
    if (has_powershell_syntax(text))
        return make_plan(BackendKind::PowerShell, text, rule::PowerShellSyntax);
    if (starts_with_any(text, {"git"}))
        return make_plan(BackendKind::ConsoleShell, text, rule::Git);
    if (starts_with_any(text, {"npm", "npx", "node", "yarn", "pnpm"}))
        return make_plan(BackendKind::ConsoleShell, text, rule::NodeTooling);
    if (starts_with_any(text, {"docker"}))
        return make_plan(BackendKind::ConsoleShell, text, rule::Docker);
    if (starts_with_any(text, {"python", "python3", "py"}))
        return make_plan(BackendKind::ConsoleShell, text, rule::Python);
    return make_plan(BackendKind::ConsoleShell, text, rule::Default);
}

ShellPlan ShellClassifier::classify(const Command& command,
                                    std::optional<BackendKind> override_kind) const {
    const std::string& text = command.text();
    if (override_kind) {
        std::string payload = text;
        if (*override_kind == BackendKind::PosixSubsystem) {
            if (auto rest = strip_subsystem_prefix(text)) payload = *rest;
        }
        return make_plan(*override_kind, std::move(payload), rule::Override);
    }
    if (auto hit = m_cache.find(text)) return *hit;
    ShellPlan plan = detect(text);
    m_cache.insert(text, plan);
    return plan;
}

} // namespace shellbridge
