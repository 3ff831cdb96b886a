#include <gtest/gtest.h>
#include <shellbridge/config/config.hpp>
#include "test_util.hpp"
#include <map>
#include <sstream>

using namespace shellbridge;
using namespace std::chrono_literals;

TEST(Config, Defaults) {
    EngineConfig cfg;
    EXPECT_EQ(cfg.max_concurrent, 10u);
    EXPECT_EQ(cfg.default_timeout, 120000ms);
    EXPECT_EQ(cfg.kill_grace, 5000ms);
    EXPECT_EQ(cfg.classifier_cache_capacity, 500u);
    EXPECT_EQ(cfg.normalizer_cache_capacity, 1000u);
    EXPECT_TRUE(cfg.reject_dangerous);
    EXPECT_EQ(cfg.log.flush_interval, 5000ms);
    EXPECT_EQ(cfg.log.max_file_bytes, 50ull * 1024 * 1024);
    EXPECT_EQ(cfg.log.max_files, 5u);
}

TEST(Config, ParsesKeyValueLines) {
    std::istringstream in(
        "# engine\n"
        "max_concurrent=4\n"
        "  default_timeout_ms = 2500 \n"
        "\n"
        "kill_grace_ms=0\n"
        "reject_dangerous=off\n"
        "powershell_path=pwsh.exe\n"
        "log_path=/var/tmp/sb.log\n"
        "log_max_files=2\n"
        "log_debug=yes\n");
    ConfigLoad load;
    parse_config(in, load);
    EXPECT_TRUE(load.warnings.empty());
    EXPECT_EQ(load.config.max_concurrent, 4u);
    EXPECT_EQ(load.config.default_timeout, 2500ms);
    EXPECT_EQ(load.config.kill_grace, 0ms);
    EXPECT_FALSE(load.config.reject_dangerous);
    EXPECT_EQ(load.config.powershell_path.value_or(""), "pwsh.exe");
    EXPECT_EQ(load.config.log.path, "/var/tmp/sb.log");
    EXPECT_EQ(load.config.log.max_files, 2u);
    EXPECT_TRUE(load.config.log.debug);
}

TEST(Config, MalformedValuesBecomeWarnings) {
    std::istringstream in("max_concurrent=0\ndefault_timeout_ms=soon\nreject_dangerous=maybe\nbogus=1\nno equals sign\n");
    ConfigLoad load;
    parse_config(in, load);
    EXPECT_EQ(load.warnings.size(), 5u);
    EXPECT_EQ(load.config.max_concurrent, 10u);
    EXPECT_EQ(load.config.default_timeout, 120000ms);
    EXPECT_TRUE(load.config.reject_dangerous);
    EXPECT_NE(load.warnings[0].find("line 1"), std::string::npos);
}

TEST(Config, DurationsMustFitMilliseconds) {
    std::istringstream in("default_timeout_ms=18446744073709551615\n"
                          "kill_grace_ms=9223372036854775808\n"
                          "default_timeout_ms=9223372036854775807\n");
    ConfigLoad load;
    parse_config(in, load);
    ASSERT_EQ(load.warnings.size(), 2u);
    EXPECT_NE(load.warnings[0].find("out of range"), std::string::npos);
    EXPECT_NE(load.warnings[1].find("line 2"), std::string::npos);
    EXPECT_EQ(load.config.kill_grace, 5000ms);
    EXPECT_EQ(load.config.default_timeout, std::chrono::milliseconds::max());
    EXPECT_GT(load.config.executor_config().default_timeout.count(), 0);
}

TEST(Config, DrivePathRewriteSetting) {
    std::istringstream in("rewrite_drive_paths=on\n");
    ConfigLoad load;
    parse_config(in, load);
    EXPECT_TRUE(load.warnings.empty());
    EXPECT_TRUE(load.config.rewrite_drive_paths);
    EXPECT_TRUE(load.config.executor_config().rewrite_drive_paths);
}

TEST(Config, EnvironmentOverrides) {
    std::map<std::string, std::string> env = {
        {"SHELLBRIDGE_LOG_PATH", "/tmp/override.log"},
        {"SHELLBRIDGE_DEBUG", "1"},
        {"SHELLBRIDGE_MAX_CONCURRENT", "3"},
    };
    ConfigLoad load;
    apply_environment(load, [&](const char* k) -> const char* {
        auto it = env.find(k);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    EXPECT_EQ(load.config.log.path, "/tmp/override.log");
    EXPECT_TRUE(load.config.log.debug);
    EXPECT_EQ(load.config.max_concurrent, 3u);
    EXPECT_TRUE(load.warnings.empty());

    env["SHELLBRIDGE_MAX_CONCURRENT"] = "many";
    apply_environment(load, [&](const char* k) -> const char* {
        auto it = env.find(k);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    EXPECT_EQ(load.config.max_concurrent, 3u);
    EXPECT_EQ(load.warnings.size(), 1u);
}

TEST(Config, LoadsExplicitFile) {
    TempDir dir;
    { std::ofstream f(dir.file("rc")); f << "max_output_bytes=1024\nclassifier_cache_capacity=7\n"; }
    auto load = load_config(dir.file("rc"));
    EXPECT_TRUE(load.file_found);
    EXPECT_EQ(load.config.max_output_bytes, 1024u);
    EXPECT_EQ(load.config.classifier_cache_capacity, 7u);
}

TEST(Config, MissingExplicitFileWarns) {
    auto load = load_config(std::string("/nonexistent/shellbridge/rc"));
    EXPECT_FALSE(load.file_found);
    ASSERT_FALSE(load.warnings.empty());
    EXPECT_NE(load.warnings[0].find("cannot open"), std::string::npos);
}

TEST(Config, ShellOverridesAndExecutorMapping) {
    EngineConfig cfg;
    cfg.console_shell = "/bin/dash";
    cfg.subsystem_shell = "/usr/bin/zsh";
    cfg.max_concurrent = 6;
    cfg.kill_grace = 1234ms;
    auto ex = cfg.executor_config();
    EXPECT_EQ(ex.max_concurrent, 6u);
    EXPECT_EQ(ex.kill_grace, 1234ms);
    EXPECT_EQ(ex.shells.console.executable, "/bin/dash");
    EXPECT_EQ(ex.shells.subsystem.executable, "/usr/bin/zsh");
}
