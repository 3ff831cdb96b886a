#include <gtest/gtest.h>
#include <shellbridge/exec/shutdown.hpp>
#include "test_util.hpp"
#include <optional>
#include <thread>
#include <vector>

using namespace shellbridge;
using namespace std::chrono_literals;

namespace {

LoggerConfig buffered_log(const TempDir& dir) {
    LoggerConfig cfg;
    cfg.path = dir.file("engine.log");
    cfg.flush_interval = 0ms;
    return cfg;
}

ExecutorConfig posix_config() {
    ExecutorConfig cfg;
    cfg.shells = ShellTable::posix_defaults();
    return cfg;
}

} // namespace

TEST(Shutdown, RunsOnceAndDisposesLogger) {
    TempDir dir;
    Logger log(buffered_log(dir));
    Executor ex(posix_config(), log);
    ShutdownCoordinator coordinator(ex, log);

    log.info("buffered before shutdown", "test");
    EXPECT_EQ(slurp(dir.file("engine.log")).find("buffered before shutdown"), std::string::npos);
    EXPECT_FALSE(coordinator.done());

    EXPECT_TRUE(coordinator.shutdown());
    EXPECT_FALSE(coordinator.shutdown());
    EXPECT_TRUE(coordinator.done());
    EXPECT_TRUE(ex.is_shut_down());
    EXPECT_TRUE(ex.pool().closed());
    EXPECT_TRUE(log.disposed());

    std::string text = slurp(dir.file("engine.log"));
    EXPECT_NE(text.find("buffered before shutdown"), std::string::npos);
    EXPECT_NE(text.find("shutdown: admissions closed"), std::string::npos);
    // Exactly one executor shutdown entry.
    EXPECT_EQ(text.find("shutdown: admissions closed"), text.rfind("shutdown: admissions closed"));
}

TEST(Shutdown, ConcurrentCallersAgreeOnOneWinner) {
    TempDir dir;
    Logger log(buffered_log(dir));
    Executor ex(posix_config(), log);
    ShutdownCoordinator coordinator(ex, log);
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] { if (coordinator.shutdown()) ++winners; });
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(log.disposed());
}

#ifndef _WIN32
TEST(Shutdown, InFlightRunReportsCancelled) {
    TempDir dir;
    Logger log(buffered_log(dir));
    Executor ex(posix_config(), log);
    ShutdownCoordinator coordinator(ex, log);

    std::optional<CommandResult> inflight;
    std::thread runner([&] { inflight = ex.run("sleep 30"); });
    for (int i = 0; i < 200 && ex.pool().active() == 0; ++i) std::this_thread::sleep_for(10ms);
    ASSERT_EQ(ex.pool().active(), 1u);

    EXPECT_TRUE(coordinator.shutdown());
    runner.join();
    ASSERT_TRUE(inflight.has_value());
    ASSERT_FALSE(inflight->ok());
    EXPECT_EQ(inflight->error()->category, ErrorCategory::Cancelled);
    EXPECT_LT(inflight->duration(), 5000ms);
    EXPECT_EQ(ex.pool().active(), 0u);

    auto later = ex.run("echo hi");
    ASSERT_FALSE(later.ok());
    EXPECT_EQ(later.error()->category, ErrorCategory::Cancelled);
}
#endif
