/*
 * ShellBridge command-line front end
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/config/config.hpp>
#include <shellbridge/core/result.hpp>
#include <shellbridge/exec/batch_runner.hpp>
#include <shellbridge/exec/executor.hpp>
#include <shellbridge/exec/shutdown.hpp>
#include <shellbridge/log/logger.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace shellbridge;

static volatile sig_atomic_t g_interrupted = 0;
static void signal_handler(int) { g_interrupted = 1; }

static void usage() {
    std::cerr << "usage: shellbridge [--config <path>] [--timeout <ms>] [--cwd <dir>] <command>\n"
                 "  exec <command...>   run with automatic shell selection\n"
                 "  pwsh <command...>   force the PowerShell backend\n"
                 "  wsl <command...>    force the POSIX subsystem backend\n"
                 "  batch <file>        run one command per line (# comments)\n"
                 "  stats               print engine statistics\n";
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> cwd;
    std::string verb;
    std::vector<std::string> rest;
};

static bool parse_args(int argc, char* argv[], CliArgs& out) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--config" || a == "--timeout" || a == "--cwd") && i + 1 < argc) {
            std::string v = argv[++i];
            if (a == "--config") out.config_path = v;
            else if (a == "--cwd") out.cwd = v;
            else {
                long long ms = 0;
                auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), ms);
                if (ec != std::errc() || p != v.data() + v.size()) {
                    std::cerr << "shellbridge: invalid --timeout '" << v << "'\n";
                    return false;
                }
                out.timeout = std::chrono::milliseconds(ms);
            }
            continue;
        }
        if (a.rfind("--", 0) == 0) {
            std::cerr << "shellbridge: unknown option " << a << '\n';
            return false;
        }
        break;
    }
    if (i >= argc) return false;
    out.verb = argv[i++];
    for (; i < argc; ++i) out.rest.push_back(argv[i]);
    return true;
}

static std::string join(const std::vector<std::string>& parts) {
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) s.push_back(' ');
        s += parts[i];
    }
    return s;
}

static bool read_batch_file(const std::string& path, std::vector<std::string>& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty() && line[0] == '#') continue;
        out.push_back(line);
    }
    return true;
}

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) { usage(); return 2; }

    ConfigLoad loaded = load_config(args.config_path);
    Logger logger(loaded.config.log);
    for (auto& w : loaded.warnings) logger.warn("config: " + w, "config");

    Executor executor(loaded.config.executor_config(), logger);
    ShutdownCoordinator coordinator(executor, logger);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (g_interrupted) {
                logger.warn("interrupted, shutting down", "cli");
                coordinator.shutdown();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ExecutionOptions opts;
    opts.timeout = args.timeout;
    opts.working_directory = args.cwd;

    int status = 0;
    if (args.verb == "exec" || args.verb == "pwsh" || args.verb == "wsl") {
        if (args.verb == "pwsh") opts.shell_override = BackendKind::PowerShell;
        if (args.verb == "wsl") opts.shell_override = BackendKind::PosixSubsystem;
        CommandResult r = executor.run(join(args.rest), opts);
        std::cout << to_json(r) << std::endl;
        status = r.ok() ? 0 : 1;
    } else if (args.verb == "batch") {
        std::vector<std::string> commands;
        if (args.rest.size() != 1 || !read_batch_file(args.rest[0], commands)) {
            std::cerr << "shellbridge: cannot read batch file\n";
            status = 2;
        } else {
            BatchRunner runner(executor);
            auto results = runner.run_batch(commands, opts);
            for (auto& r : results) {
                std::cout << to_json(r) << '\n';
                if (!r.ok()) status = 1;
            }
            std::cout.flush();
        }
    } else if (args.verb == "stats") {
        std::cout << to_json(executor.stats()) << std::endl;
    } else {
        usage();
        status = 2;
    }

    finished.store(true);
    watcher.join();
    coordinator.shutdown();
    return status;
}
