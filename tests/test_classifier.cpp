#include <gtest/gtest.h>
#include <shellbridge/shell/classifier.hpp>

using namespace shellbridge;

static Command cmd(const std::string& s) { return *Command::make(s); }

TEST(Classifier, WslPrefixStripsToken) {
    ShellClassifier c(ShellTable::posix_defaults());
    auto plan = c.classify(cmd("wsl ls -la /home"));
    EXPECT_EQ(plan.kind, BackendKind::PosixSubsystem);
    EXPECT_EQ(plan.payload, "ls -la /home");
    EXPECT_EQ(plan.rule, "wsl-prefix");
    EXPECT_EQ(plan.executable, "/bin/bash");
    EXPECT_EQ(plan.arguments(), (std::vector<std::string>{"-c", "ls -la /home"}));
}

TEST(Classifier, MountPathKeepsWholeText) {
    ShellClassifier c(ShellTable::posix_defaults());
    auto plan = c.classify(cmd("cat /mnt/c/Users/me/notes.txt"));
    EXPECT_EQ(plan.kind, BackendKind::PosixSubsystem);
    EXPECT_EQ(plan.payload, "cat /mnt/c/Users/me/notes.txt");
    EXPECT_EQ(plan.rule, "mount-path");
}

TEST(Classifier, PowerShellCmdlets) {
    ShellClassifier c(ShellTable::windows_defaults());
    auto plan = c.classify(cmd("Get-Process | Select-Object -First 5"));
    EXPECT_EQ(plan.kind, BackendKind::PowerShell);
    EXPECT_EQ(plan.rule, "powershell");
    EXPECT_EQ(plan.executable, "powershell.exe");
    EXPECT_EQ(plan.arguments(),
              (std::vector<std::string>{"-NoProfile", "-Command", "Get-Process | Select-Object -First 5"}));

    EXPECT_EQ(c.classify(cmd("$PSVersionTable")).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("Import-Module Foo; Invoke-Thing")).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("ls | ForEach-Object { $_.Name }")).kind, BackendKind::PowerShell);
}

TEST(Classifier, CmdletNeedsVerbNounShape) {
    ShellClassifier c(ShellTable::windows_defaults());
    EXPECT_EQ(c.classify(cmd("get-process")).kind, BackendKind::ConsoleShell);
    EXPECT_EQ(c.classify(cmd("echo Get-")).kind, BackendKind::ConsoleShell);
    EXPECT_EQ(c.classify(cmd("echo budget-Report")).kind, BackendKind::ConsoleShell);
    EXPECT_EQ(c.classify(cmd("Get-1")).kind, BackendKind::ConsoleShell);
}

TEST(Classifier, CmdletNounCaseIsFree) {
    ShellClassifier c(ShellTable::windows_defaults());
    EXPECT_EQ(c.classify(cmd("Get-process")).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("Set-location C:\\")).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("echo a;remove-item x")).kind, BackendKind::ConsoleShell);
}

TEST(Classifier, VeryLongCommandsClassify) {
    ShellClassifier c(ShellTable::posix_defaults());
    const std::string filler(1024u * 1024u, 'a');
    EXPECT_EQ(c.classify(cmd("Get-" + filler)).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("echo " + filler)).rule, "default");
    auto wsl = c.classify(cmd("wsl" + std::string(1024u * 1024u, ' ') + "ls"));
    EXPECT_EQ(wsl.rule, "wsl-prefix");
    EXPECT_EQ(wsl.payload, "ls");
    EXPECT_EQ(c.classify(cmd("git" + std::string(1024u * 1024u, '\t') + "status")).rule, "git");
}

TEST(Classifier, EcosystemPrefixesUseConsole) {
    ShellClassifier c(ShellTable::windows_defaults());
    struct Case { const char* text; const char* rule; };
    for (auto& k : {Case{"git status", "git"}, Case{"npm install", "node"}, Case{"npx jest", "node"},
                    Case{"yarn build", "node"}, Case{"docker ps -a", "docker"},
                    Case{"python3 -m pip list", "python"}, Case{"py -3 script.py", "python"},
                    Case{"dir", "default"}, Case{"uv run app.py", "default"}}) {
        auto plan = c.classify(cmd(k.text));
        EXPECT_EQ(plan.kind, BackendKind::ConsoleShell) << k.text;
        EXPECT_EQ(plan.rule, k.rule) << k.text;
        EXPECT_EQ(plan.executable, "cmd.exe");
        EXPECT_EQ(plan.trailing_mode, TrailingArgMode::Verbatim);
    }
}

TEST(Classifier, FirstMatchWinsOverEcosystemPrefix) {
    ShellClassifier c(ShellTable::posix_defaults());
    EXPECT_EQ(c.classify(cmd("docker run img Get-ChildItem")).kind, BackendKind::PowerShell);
    EXPECT_EQ(c.classify(cmd("git -C /mnt/c/repo status")).kind, BackendKind::PosixSubsystem);
}

TEST(Classifier, OverrideWinsAndIsNotCached) {
    ShellClassifier c(ShellTable::posix_defaults());
    auto plan = c.classify(cmd("Get-Process"), BackendKind::ConsoleShell);
    EXPECT_EQ(plan.kind, BackendKind::ConsoleShell);
    EXPECT_EQ(plan.rule, "override");
    EXPECT_EQ(c.cache_size(), 0u);

    auto wsl = c.classify(cmd("wsl uname -a"), BackendKind::PosixSubsystem);
    EXPECT_EQ(wsl.payload, "uname -a");
    auto ps = c.classify(cmd("echo hi"), BackendKind::PowerShell);
    EXPECT_EQ(ps.executable, "pwsh");
    EXPECT_EQ(ps.payload, "echo hi");
}

TEST(Classifier, Deterministic) {
    ShellClassifier c(ShellTable::posix_defaults());
    for (const char* s : {"Get-ChildItem", "wsl pwd", "echo x", "git log"}) {
        auto a = c.classify(cmd(s));
        auto b = c.classify(cmd(s));
        EXPECT_EQ(a, b) << s;
        ShellClassifier fresh(ShellTable::posix_defaults());
        EXPECT_EQ(fresh.classify(cmd(s)), a) << s;
    }
    EXPECT_EQ(c.cache_size(), 4u);
}

TEST(Classifier, CacheEvictsOldestBatch) {
    ShellClassifier c(ShellTable::posix_defaults(), 10);
    for (int i = 0; i < 10; ++i) c.classify(cmd("echo " + std::to_string(i)));
    EXPECT_EQ(c.cache_size(), 10u);
    c.classify(cmd("echo overflow"));
    EXPECT_EQ(c.cache_size(), 9u); // 2 evicted, 1 added
    c.clear_cache();
    EXPECT_EQ(c.cache_size(), 0u);
}

TEST(Classifier, SubsystemDetection) {
    EXPECT_TRUE(is_subsystem_invocation("wsl ls"));
    EXPECT_TRUE(is_subsystem_invocation("WSL.exe ls"));
    EXPECT_TRUE(is_subsystem_invocation("type \\\\wsl$\\Ubuntu\\etc\\hosts"));
    EXPECT_FALSE(is_subsystem_invocation("wslconfig /list"));
    EXPECT_FALSE(is_subsystem_invocation("echo wsl"));
    EXPECT_EQ(strip_subsystem_prefix("wsl   echo hi").value_or(""), "echo hi");
    EXPECT_FALSE(strip_subsystem_prefix("echo").has_value());
}

TEST(ShellTable, PlatformDefaults) {
    auto w = ShellTable::windows_defaults();
    EXPECT_EQ(w.spec(BackendKind::ConsoleShell).prefix_args, (std::vector<std::string>{"/d", "/s", "/c"}));
    EXPECT_EQ(w.spec(BackendKind::PosixSubsystem).executable, "wsl.exe");
    auto p = ShellTable::posix_defaults();
    EXPECT_EQ(p.spec(BackendKind::ConsoleShell).executable, "/bin/sh");
    EXPECT_EQ(p.spec(BackendKind::PowerShell).prefix_args, (std::vector<std::string>{"-NoProfile", "-Command"}));
}

TEST(Backend, ParseAliases) {
    EXPECT_EQ(parse_backend("cmd"), BackendKind::ConsoleShell);
    EXPECT_EQ(parse_backend("PWSH"), BackendKind::PowerShell);
    EXPECT_EQ(parse_backend("wsl"), BackendKind::PosixSubsystem);
    EXPECT_FALSE(parse_backend("fish").has_value());
    EXPECT_STREQ(to_string(BackendKind::PosixSubsystem), "posix");
}
