/*
 * Command normalizer - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/bounded_cache.hpp>
#include <shellbridge/core/command.hpp>
#include <string>
#include <string_view>

namespace shellbridge {

// Rewrites commands into the form the native shells expect. The rewrite
// is idempotent: normalize(normalize(c)) == normalize(c).
//
// Steps, in order:
//   1. every " && " becomes " ; " (repeated until none remain)
//   2. when drive-path rewriting is on (Windows hosts by default) and the
//      command is not a subsystem invocation, tokens shaped /x/rest
//      become X:\rest
//   3. "pwsh <args>" without a command flag gains
//      "<powershell> -NoProfile -Command "
class CommandNormalizer {
public:
    static constexpr std::size_t kDefaultCacheCapacity = 1000;

    explicit CommandNormalizer(std::size_t cache_capacity = kDefaultCacheCapacity,
                               std::string powershell_executable = default_powershell(),
                               bool rewrite_drive_paths = default_rewrite_drive_paths());

    Command normalize(const Command& raw) const;

    // Memoized rewrite of arbitrary text; does not validate.
    std::string rewrite(std::string_view text) const;

    std::size_t cache_size() const { return m_cache.size(); }
    void clear_cache() { m_cache.clear(); }

    static std::string default_powershell();
    static bool default_rewrite_drive_paths();
    bool rewrites_drive_paths() const { return m_drive_paths; }

    // Individual passes, exposed for tests.
    static std::string replace_chain_operators(std::string text);
    static std::string rewrite_drive_paths(std::string_view text);
    static bool has_command_flag(std::string_view args);

private:
    std::string rewrite_uncached(std::string_view text) const;

    std::string m_powershell;
    bool m_drive_paths;
    mutable BoundedCache<std::string> m_cache;
};

} // namespace shellbridge
