/*
 * Child process with captured output - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/exec/output_buffer.hpp>
#include <shellbridge/exec/process_pool.hpp>
#include <shellbridge/shell/shell_plan.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace shellbridge {

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args; // not including the program name
    TrailingArgMode trailing_mode = TrailingArgMode::SingleArgument;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment; // merged over the ambient env
    std::size_t max_output_bytes = 16u * 1024u * 1024u;
};

LaunchSpec make_launch_spec(const ShellPlan& plan);

struct ChildExit {
    int exit_code = 0;         // 128 + signal when killed by a signal
    std::optional<int> signal; // POSIX only
};

struct SpawnError {
    std::error_code os_error;
    std::string message;
};

// One spawned shell. Runs in its own process group (job object on
// Windows) with stdin from the null device and stdout/stderr piped.
//
// Lifecycle: spawn -> wait_for() until it returns true -> reap().
// wait_for() leaves the exited child unreaped so its id cannot be reused
// while the pool still tracks it. The destructor kills and reaps a child
// that was never reaped.
class ChildProcess {
public:
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // nullptr on failure, with `err` filled in (not found, permission,
    // bad working directory, fork/pipe failure).
    static std::unique_ptr<ChildProcess> spawn(const LaunchSpec& spec, SpawnError& err);

    ProcessId id() const { return m_id; }
    NativeProcessHandle native_handle() const;

    // Pump output for at most `slice`. True once the child has exited.
    bool wait_for(std::chrono::milliseconds slice);

    void terminate(); // graceful: SIGTERM to the group / CTRL_BREAK
    void kill();      // forceful: SIGKILL to the group / TerminateJobObject

    // Collect the exit status and drain what is left in the pipes.
    ChildExit reap();

    OutputBuffer& out() { return m_out; }
    OutputBuffer& err() { return m_err; }

private:
    explicit ChildProcess(std::size_t cap) : m_out(cap), m_err(cap) {}
    void drain();
    void close_pipes();

    ProcessId m_id = 0;
    bool m_reaped = false;
    OutputBuffer m_out;
    OutputBuffer m_err;
#ifdef _WIN32
    void* m_process = nullptr;
    void* m_thread = nullptr;
    void* m_job = nullptr;
    void* m_out_pipe = nullptr;
    void* m_err_pipe = nullptr;
#else
    int m_out_fd = -1;
    int m_err_fd = -1;
#endif
};

} // namespace shellbridge
