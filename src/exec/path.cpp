/*
 * PATH resolution implementation - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace shellbridge {

#ifndef _WIN32

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_value) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd;
        return std::nullopt;
    }
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t colon = path_value.find(':', start);
        if (colon == std::string::npos) { parts.push_back(path_value.substr(start)); break; }
        parts.push_back(path_value.substr(start, colon - start));
        start = colon + 1;
    }
    for (auto& d : parts) {
        if (d.empty()) continue;
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

#else

// CreateProcessW performs its own search; names pass through unchanged.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string&) {
    if (cmd.empty()) return std::nullopt;
    return cmd;
}

#endif

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* path_env = std::getenv("PATH");
    return resolve_executable(cmd, path_env ? std::string(path_env) : std::string());
}

} // namespace shellbridge
