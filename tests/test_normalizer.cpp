#include <gtest/gtest.h>
#include <shellbridge/shell/normalizer.hpp>
#include <vector>

using namespace shellbridge;

static CommandNormalizer make_normalizer() { return CommandNormalizer(1000, "powershell.exe", true); }

TEST(Normalizer, ChainOperatorBecomesSemicolon) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("echo hello && echo world"), "echo hello ; echo world");
    EXPECT_EQ(n.rewrite("a && b && c"), "a ; b ; c");
}

TEST(Normalizer, RepeatedChainOperatorsAllReplaced) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("a && && b"), "a ; ; b");
}

TEST(Normalizer, BareAmpersandUntouched) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("sleep 5 & echo hi"), "sleep 5 & echo hi");
    EXPECT_EQ(n.rewrite("a&&b"), "a&&b");
}

TEST(Normalizer, DrivePathsRewritten) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("dir /c/Users/me"), "dir C:\\Users\\me");
    EXPECT_EQ(n.rewrite("copy \"/d/ab/x.txt\" /e/"), "copy \"D:\\ab\\x.txt\" E:\\");
    EXPECT_EQ(n.rewrite("set X=/f/data"), "set X=F:\\data");
}

TEST(Normalizer, NonDrivePathsLeftAlone) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("cat /tmp/file"), "cat /tmp/file");
    EXPECT_EQ(n.rewrite("ls src/c/d"), "ls src/c/d");
    EXPECT_EQ(n.rewrite("curl http://example.com/a/b"), "curl http://example.com/a/b");
}

TEST(Normalizer, DrivePathRewriteCanBeDisabled) {
    CommandNormalizer n(1000, "pwsh", false);
    EXPECT_FALSE(n.rewrites_drive_paths());
    EXPECT_EQ(n.rewrite("echo a && echo /a/b"), "echo a ; echo /a/b");
    EXPECT_EQ(n.rewrite("ls /c/Users"), "ls /c/Users");
}

#ifndef _WIN32
TEST(Normalizer, PosixHostsKeepSingleLetterDirectories) {
    CommandNormalizer n;
    EXPECT_FALSE(n.rewrites_drive_paths());
    EXPECT_EQ(n.rewrite("echo /a/b"), "echo /a/b");
}
#endif

TEST(Normalizer, SubsystemCommandsKeepPosixPaths) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("wsl ls /c/x"), "wsl ls /c/x");
    EXPECT_EQ(n.rewrite("cat /mnt/c/Users/file /d/x"), "cat /mnt/c/Users/file /d/x");
    EXPECT_EQ(n.rewrite("wsl echo a && echo b"), "wsl echo a ; echo b");
}

TEST(Normalizer, PwshGetsCommandFlag) {
    auto n = make_normalizer();
    EXPECT_EQ(n.rewrite("pwsh Get-Date"), "powershell.exe -NoProfile -Command Get-Date");
    EXPECT_EQ(n.rewrite("pwsh -Command Get-Date"), "pwsh -Command Get-Date");
    EXPECT_EQ(n.rewrite("pwsh -c Get-Date"), "pwsh -c Get-Date");
    EXPECT_EQ(n.rewrite("pwsh -File x.ps1"), "pwsh -File x.ps1");
}

TEST(Normalizer, Idempotent) {
    std::vector<std::string> corpus = {
        "echo hello && echo world",
        "a && && b",
        "a && && && b",
        " && ",
        "x &&  && y",
        "dir /c/Users/me && type /d/x.txt",
        "cd /c/ && ls",
        "/c/a;/d/b|/e/c",
        "echo \"/c/quoted path\" '/d/single'",
        "wsl ls /c/x && pwd",
        "ls /mnt/d/data",
        "type \\\\wsl$\\Ubuntu\\home /c/x",
        "pwsh Get-Process && pwsh -c Get-Date",
        "pwsh /c/scripts/run.ps1",
        "pwsh ",
        "sleep 1 & echo",
        "echo $PATH",
        "a=/z/b c=(/y/d)",
        "/c//wsl /d/e",
    };
    for (const char* ps : {"powershell.exe", "pwsh"}) {
        CommandNormalizer n(1000, ps, true);
        for (auto& s : corpus) {
            std::string once = n.rewrite(s);
            EXPECT_EQ(n.rewrite(once), once) << "input: " << s << " powershell: " << ps;
        }
    }
}

TEST(Normalizer, NormalizeReturnsCommand) {
    auto n = make_normalizer();
    auto raw = Command::make("echo a && echo b");
    ASSERT_TRUE(raw.has_value());
    Command c = n.normalize(*raw);
    EXPECT_EQ(c.text(), "echo a ; echo b");
    EXPECT_EQ(n.normalize(c), c);
}

TEST(Normalizer, Memoized) {
    auto n = make_normalizer();
    n.rewrite("echo a && echo b");
    n.rewrite("echo a && echo b");
    EXPECT_EQ(n.cache_size(), 1u);
    n.clear_cache();
    EXPECT_EQ(n.cache_size(), 0u);
}

TEST(Normalizer, CacheBounded) {
    CommandNormalizer n(10, "powershell.exe");
    for (int i = 0; i < 50; ++i) n.rewrite("echo " + std::to_string(i));
    EXPECT_LE(n.cache_size(), 10u);
    EXPECT_EQ(n.rewrite("echo 1 && echo 2"), "echo 1 ; echo 2");
}
