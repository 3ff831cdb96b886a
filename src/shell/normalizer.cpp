/*
 * Command normalizer - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/shell/normalizer.hpp>
#include <shellbridge/shell/classifier.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shellbridge {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Characters that end a path token.
bool ends_token(char c) {
    return is_space(c) || c == '"' || c == '\'' || c == ')' || c == ';' || c == '|' ||
           c == '&' || c == '<' || c == '>';
}

// Characters after which a path token may begin.
bool starts_token_after(char c) { return ends_token(c) || c == '=' || c == '('; }

bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

} // namespace

std::string CommandNormalizer::default_powershell() {
#ifdef _WIN32
    return "powershell.exe";
#else
    return "pwsh";
#endif
}

bool CommandNormalizer::default_rewrite_drive_paths() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

CommandNormalizer::CommandNormalizer(std::size_t cache_capacity, std::string powershell_executable,
                                     bool rewrite_drive_paths)
    : m_powershell(std::move(powershell_executable)), m_drive_paths(rewrite_drive_paths),
      m_cache(cache_capacity) {}

std::string CommandNormalizer::replace_chain_operators(std::string text) {
    static const std::string from = " && ";
    static const std::string to = " ; ";
    for (;;) {
        std::size_t pos = text.find(from);
        if (pos == std::string::npos) break;
        while (pos != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos = text.find(from, pos + to.size());
        }
    }
    return text;
}

std::string CommandNormalizer::rewrite_drive_paths(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        bool boundary = (i == 0) || starts_token_after(text[i - 1]);
        if (boundary && text[i] == '/' && i + 2 < n && is_alpha(text[i + 1]) && text[i + 2] == '/') {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i + 1]))));
            out += ":\\";
            std::size_t j = i + 3;
            for (; j < n && !ends_token(text[j]); ++j) out.push_back(text[j] == '/' ? '\\' : text[j]);
            i = j;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

bool CommandNormalizer::has_command_flag(std::string_view args) {
    std::istringstream iss{std::string(args)};
    std::string tok;
    while (iss >> tok) {
        std::transform(tok.begin(), tok.end(), tok.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (tok == "-command" || tok == "-c" || tok == "-file" || tok == "-f" ||
            tok == "-encodedcommand" || tok == "-e" || tok == "-ec")
            return true;
    }
    return false;
}

std::string CommandNormalizer::rewrite_uncached(std::string_view text) const {
    std::string s = replace_chain_operators(std::string(text));
    if (m_drive_paths && !is_subsystem_invocation(s)) s = rewrite_drive_paths(s);
    static const std::string pwsh_prefix = "pwsh ";
    if (s.compare(0, pwsh_prefix.size(), pwsh_prefix) == 0) {
        std::string rest = s.substr(pwsh_prefix.size());
        if (!has_command_flag(rest)) s = m_powershell + " -NoProfile -Command " + rest;
    }
    return s;
}

std::string CommandNormalizer::rewrite(std::string_view text) const {
    std::string key(text);
    if (auto hit = m_cache.find(key)) return *hit;
    std::string out = rewrite_uncached(text);
    m_cache.insert(key, out);
    return out;
}

Command CommandNormalizer::normalize(const Command& raw) const {
    auto cmd = Command::make(rewrite(raw.text()));
    // The passes never blank a valid command; keep the input if they somehow do.
    return cmd ? *cmd : raw;
}

} // namespace shellbridge
