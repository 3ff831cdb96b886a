/*
 * Command value type - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/core/command.hpp>

namespace shellbridge {

static bool is_blank(char c) { return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\v' || c=='\f'; }

bool is_valid_command_text(std::string_view text) {
    if (text.empty()) return false;
    if (text.find('\0') != std::string_view::npos) return false;
    for (char c : text) if (!is_blank(c)) return true;
    return false;
}

std::optional<Command> Command::make(std::string text) {
    if (!is_valid_command_text(text)) return std::nullopt;
    return Command(std::move(text));
}

std::string trim_copy(std::string_view s) {
    size_t a = 0, b = s.size();
    while (a < b && is_blank(s[a])) ++a;
    while (b > a && is_blank(s[b-1])) --b;
    return std::string(s.substr(a, b - a));
}

} // namespace shellbridge
