/*
 * Timestamp helpers - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <string>

namespace shellbridge {

// ISO-8601 UTC with millisecond precision, e.g. 2025-03-01T10:20:30.123Z
std::string iso8601(std::chrono::system_clock::time_point tp);
inline std::string iso8601_now() { return iso8601(std::chrono::system_clock::now()); }

} // namespace shellbridge
