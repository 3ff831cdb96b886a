/*
 * Dangerous command guard - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace shellbridge {

// Returns a short description of the first destructive construct found
// (root removal, raw device writes, filesystem creation, fork bombs,
// piping downloads into a shell, formatting a drive), or nullopt.
std::optional<std::string> find_dangerous_construct(std::string_view command);

inline bool is_dangerous(std::string_view command) {
    return find_dangerous_construct(command).has_value();
}

} // namespace shellbridge
