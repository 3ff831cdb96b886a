#include <gtest/gtest.h>
#include <shellbridge/exec/child_process.hpp>
#include <shellbridge/exec/process_pool.hpp>
#include <vector>
#ifndef _WIN32
#include <csignal>
#endif

using namespace shellbridge;

TEST(ProcessPool, RefusesBeyondCapacity) {
    ProcessPool pool(2);
    auto a = pool.try_admit();
    auto b = pool.try_admit();
    ASSERT_TRUE(a && b);
    EXPECT_FALSE(pool.try_admit().has_value());
    auto s = pool.stats();
    EXPECT_EQ(s.active, 2u);
    EXPECT_EQ(s.refused, 1u);
    EXPECT_EQ(s.peak, 2u);
}

TEST(ProcessPool, SlotReleasesOnceOnDestruction) {
    ProcessPool pool(1);
    {
        auto a = pool.try_admit();
        ASSERT_TRUE(a);
        a->release();
        a->release();
        EXPECT_EQ(pool.active(), 0u);
        auto b = pool.try_admit();
        EXPECT_TRUE(b.has_value());
    }
    EXPECT_EQ(pool.active(), 0u);
}

TEST(ProcessPool, MovedSlotReleasedOnce) {
    ProcessPool pool(2);
    std::vector<PoolSlot> held;
    {
        auto a = pool.try_admit();
        ASSERT_TRUE(a);
        held.push_back(std::move(*a));
    }
    EXPECT_EQ(pool.active(), 1u);
    held.clear();
    EXPECT_EQ(pool.active(), 0u);
}

TEST(ProcessPool, AttachTracksUntilRelease) {
    ProcessPool pool(2);
    auto a = pool.try_admit();
    ASSERT_TRUE(a);
    a->attach(424242, NativeProcessHandle{});
    EXPECT_EQ(pool.tracked(), 1u);
    a->release();
    EXPECT_EQ(pool.tracked(), 0u);
}

TEST(ProcessPool, CloseRefusesAdmission) {
    ProcessPool pool(4);
    pool.close();
    EXPECT_TRUE(pool.closed());
    EXPECT_FALSE(pool.try_admit().has_value());
}

#ifndef _WIN32
static std::unique_ptr<ChildProcess> spawn_sh(const std::string& script) {
    LaunchSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", script};
    SpawnError err;
    auto child = ChildProcess::spawn(spec, err);
    EXPECT_TRUE(child) << err.message;
    return child;
}

TEST(ProcessPool, KillAllSignalsTrackedProcesses) {
    ProcessPool pool(2);
    auto child = spawn_sh("sleep 30");
    ASSERT_TRUE(child);
    auto slot = pool.try_admit();
    ASSERT_TRUE(slot);
    slot->attach(child->id(), child->native_handle());

    EXPECT_EQ(pool.kill_all(), 1u);
    EXPECT_EQ(pool.tracked(), 0u);
    while (!child->wait_for(std::chrono::milliseconds(20))) {}
    slot->release();
    auto ex = child->reap();
    ASSERT_TRUE(ex.signal.has_value());
    EXPECT_EQ(*ex.signal, SIGTERM);
    EXPECT_EQ(pool.active(), 0u);
}

TEST(ChildProcess, CapturesBothStreams) {
    auto child = spawn_sh("echo out; echo err 1>&2; exit 4");
    ASSERT_TRUE(child);
    while (!child->wait_for(std::chrono::milliseconds(20))) {}
    auto ex = child->reap();
    EXPECT_EQ(ex.exit_code, 4);
    EXPECT_FALSE(ex.signal.has_value());
    EXPECT_EQ(child->out().take(), "out\n");
    EXPECT_EQ(child->err().take(), "err\n");
}

TEST(ChildProcess, MissingExecutableFailsToSpawn) {
    LaunchSpec spec;
    spec.executable = "definitely-not-a-real-program-xyz";
    SpawnError err;
    EXPECT_EQ(ChildProcess::spawn(spec, err), nullptr);
    EXPECT_EQ(err.os_error, std::errc::no_such_file_or_directory);
}

TEST(ChildProcess, BadWorkingDirectoryFailsToSpawn) {
    LaunchSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", "true"};
    spec.working_directory = "/nonexistent/shellbridge/dir";
    SpawnError err;
    EXPECT_EQ(ChildProcess::spawn(spec, err), nullptr);
    EXPECT_EQ(err.os_error, std::errc::no_such_file_or_directory);
    EXPECT_NE(err.message.find("/nonexistent/shellbridge/dir"), std::string::npos);
}

TEST(ChildProcess, OutputCapIsEnforced) {
    LaunchSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", "printf 0123456789abcdef"};
    spec.max_output_bytes = 10;
    SpawnError err;
    auto child = ChildProcess::spawn(spec, err);
    ASSERT_TRUE(child);
    while (!child->wait_for(std::chrono::milliseconds(20))) {}
    child->reap();
    EXPECT_TRUE(child->out().truncated());
    EXPECT_EQ(child->out().take(), "0123456789");
}
#endif
