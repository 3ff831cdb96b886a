/*
 * Output transcoding - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace shellbridge {

enum class OutputEncoding { Utf8, Latin1, Utf16Le };

const char* to_string(OutputEncoding e);
std::optional<OutputEncoding> parse_encoding(std::string_view name);

// Convert captured bytes to UTF-8. Utf8 is a pass-through; invalid UTF-16
// code units become U+FFFD.
std::string to_utf8(std::string bytes, OutputEncoding from);

} // namespace shellbridge
