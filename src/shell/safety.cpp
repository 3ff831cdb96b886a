/*
 * Dangerous command guard - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/shell/safety.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace shellbridge {

namespace {

enum class TokenKind { Word, Operator };

struct Token {
    TokenKind kind;
    std::string_view text;
    bool redirect_target = false;
};

// One simple command: its name (after sudo and VAR=value prefixes) and
// the words that follow, redirect targets excluded.
struct SimpleCommand {
    std::string_view name;
    std::vector<std::string_view> args;
    std::string_view next_operator; // operator that ended it, empty at end of text
};

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f'; }

bool is_operator_char(char c) {
    return c == ';' || c == '&' || c == '|' || c == '(' || c == ')' || c == '<' || c == '>' || c == '\n';
}

bool is_redirect(const Token& t) { return t.kind == TokenKind::Operator && (t.text == ">" || t.text == "<"); }

bool is_separator(const Token& t) { return t.kind == TokenKind::Operator && !is_redirect(t); }

bool starts_with(std::string_view s, std::string_view prefix) { return s.substr(0, prefix.size()) == prefix; }

bool is_assignment(std::string_view word) {
    auto eq = word.find('=');
    return eq != std::string_view::npos && eq > 0;
}

std::string_view basename(std::string_view word) {
    auto slash = word.rfind('/');
    return slash == std::string_view::npos ? word : word.substr(slash + 1);
}

// Linear in the input length.
std::vector<Token> tokenize(std::string_view s) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if (is_blank(c)) { ++i; continue; }
        if (is_operator_char(c)) {
            std::size_t len = ((c == '&' || c == '|') && i + 1 < s.size() && s[i + 1] == c) ? 2 : 1;
            out.push_back({TokenKind::Operator, s.substr(i, len)});
            i += len;
            continue;
        }
        std::size_t j = i;
        while (j < s.size() && !is_blank(s[j]) && !is_operator_char(s[j])) ++j;
        Token t{TokenKind::Word, s.substr(i, j - i)};
        t.redirect_target = !out.empty() && is_redirect(out.back());
        out.push_back(t);
        i = j;
    }
    return out;
}

std::vector<SimpleCommand> split_commands(const std::vector<Token>& tokens) {
    std::vector<SimpleCommand> out;
    std::size_t i = 0;
    while (i < tokens.size()) {
        if (is_separator(tokens[i])) { ++i; continue; }
        SimpleCommand cmd;
        bool named = false, after_sudo = false;
        for (; i < tokens.size() && !is_separator(tokens[i]); ++i) {
            const Token& t = tokens[i];
            if (t.kind == TokenKind::Operator || t.redirect_target) continue;
            if (named) { cmd.args.push_back(t.text); continue; }
            if (t.text == "sudo") { after_sudo = true; continue; }
            if (is_assignment(t.text) || (after_sudo && t.text[0] == '-')) continue;
            cmd.name = t.text;
            named = true;
        }
        if (i < tokens.size()) cmd.next_operator = tokens[i].text;
        if (named) out.push_back(std::move(cmd));
    }
    return out;
}

bool is_block_device(std::string_view path) {
    if (!starts_with(path, "/dev/")) return false;
    path.remove_prefix(5);
    for (std::string_view dev : {"sd", "hd", "nvme", "disk", "mmcblk"})
        if (starts_with(path, dev)) return true;
    return false;
}

bool removes_root(const SimpleCommand& c) {
    if (basename(c.name) != "rm") return false;
    bool recursive = false, force = false, root = false;
    for (auto a : c.args) {
        if (a == "--recursive") recursive = true;
        else if (a == "--force") force = true;
        else if (a.size() > 1 && a[0] == '-' && a[1] != '-') {
            recursive = recursive || a.find('r') != std::string_view::npos;
            force = force || a.find('f') != std::string_view::npos;
        } else if (a == "/" || a == "/*" || a == "~" || a == "~/" || a == "~/*") {
            root = true;
        }
    }
    return recursive && force && root;
}

bool writes_block_device(const std::vector<Token>& tokens) {
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Operator && tokens[i].text == ">" &&
            tokens[i + 1].kind == TokenKind::Word && is_block_device(tokens[i + 1].text))
            return true;
    }
    return false;
}

bool dd_onto_device(const SimpleCommand& c) {
    if (basename(c.name) != "dd") return false;
    return std::any_of(c.args.begin(), c.args.end(), [](std::string_view a) {
        return starts_with(a, "of=") && is_block_device(a.substr(3));
    });
}

bool creates_filesystem(const SimpleCommand& c) {
    auto name = basename(c.name);
    return name == "mkfs" || starts_with(name, "mkfs.");
}

bool is_shell_name(std::string_view name) {
    name = basename(name);
    return name == "sh" || name == "bash" || name == "zsh" || name == "dash" || name == "ksh";
}

// curl/wget whose pipeline ends up in a shell.
bool pipes_download_into_shell(const std::vector<SimpleCommand>& cmds) {
    for (std::size_t k = 0; k < cmds.size(); ++k) {
        auto name = basename(cmds[k].name);
        if (name != "curl" && name != "wget") continue;
        for (std::size_t j = k; j + 1 < cmds.size() && cmds[j].next_operator == "|"; ++j)
            if (is_shell_name(cmds[j + 1].name)) return true;
    }
    return false;
}

bool is_fork_bomb(std::string_view lower) {
    std::string compact;
    compact.reserve(lower.size());
    for (char c : lower)
        if (!is_blank(c) && c != '\n') compact.push_back(c);
    return compact.find(":(){:|:&};:") != std::string::npos;
}

bool formats_drive(const SimpleCommand& c) {
    if (c.name != "format" && c.name != "format.com") return false;
    if (c.args.empty()) return false;
    auto a = c.args.front();
    return a.size() >= 2 && a[0] >= 'a' && a[0] <= 'z' && a[1] == ':';
}

} // namespace

std::optional<std::string> find_dangerous_construct(std::string_view command) {
    std::string lower(command);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto tokens = tokenize(lower);
    const auto cmds = split_commands(tokens);
    auto any = [&](bool (*rule)(const SimpleCommand&)) { return std::any_of(cmds.begin(), cmds.end(), rule); };

    if (any(removes_root)) return std::string("recursive removal of the filesystem root");
    if (writes_block_device(tokens)) return std::string("raw write to a block device");
    if (any(dd_onto_device)) return std::string("dd onto a block device");
    if (any(creates_filesystem)) return std::string("filesystem creation");
    if (is_fork_bomb(lower)) return std::string("fork bomb");
    if (pipes_download_into_shell(cmds)) return std::string("download piped into a shell");
    if (any(formats_drive)) return std::string("drive format");
    return std::nullopt;
}

} // namespace shellbridge
