/*
 * Command value type - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace shellbridge {

// Validated command text: non-empty, not blank, no embedded NUL.
// Only constructible through Command::make().
class Command {
public:
    static std::optional<Command> make(std::string text);

    const std::string& text() const { return m_text; }
    bool operator==(const Command& o) const { return m_text == o.m_text; }
    bool operator!=(const Command& o) const { return m_text != o.m_text; }

private:
    explicit Command(std::string text) : m_text(std::move(text)) {}
    std::string m_text;
};

bool is_valid_command_text(std::string_view text);

// Strip leading/trailing spaces, tabs, CR and LF.
std::string trim_copy(std::string_view s);

} // namespace shellbridge
