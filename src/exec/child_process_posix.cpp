/*
 * POSIX child process - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifndef _WIN32
#include <shellbridge/exec/child_process.hpp>
#include <shellbridge/exec/path.hpp>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace shellbridge {

namespace {

void set_cloexec(int fd) { fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC); }
void set_nonblocking(int fd) { fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK); }

bool make_pipe(int p[2]) {
    if (pipe(p) != 0) return false;
    set_cloexec(p[0]);
    set_cloexec(p[1]);
    return true;
}

void close_fd(int& fd) {
    if (fd != -1) { close(fd); fd = -1; }
}

// Ambient environment with overrides applied, as NAME=value strings.
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& extra,
                                            std::string& path_value) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (auto& [k, v] : extra) env[k] = v;
    auto it = env.find("PATH");
    path_value = it != env.end() ? it->second : std::string("/usr/bin:/bin");
    std::vector<std::string> out;
    out.reserve(env.size());
    for (auto& [k, v] : env) out.push_back(k + "=" + v);
    return out;
}

// Reads whatever is available on fd; closes it on EOF or hard error.
void read_available(int& fd, OutputBuffer& buf) {
    char chunk[8192];
    while (fd != -1) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) { buf.append(chunk, static_cast<std::size_t>(n)); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchSpec& spec, SpawnError& err) {
    std::string path_value;
    std::vector<std::string> env = merged_environment(spec.environment, path_value);

    auto exe = resolve_executable(spec.executable, path_value);
    if (!exe) {
        err.os_error = std::error_code(ENOENT, std::generic_category());
        err.message = spec.executable + ": command not found";
        return nullptr;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(spec.args.size() + 2);
    cargv.push_back(const_cast<char*>(exe->c_str()));
    for (auto& a : spec.args) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    std::vector<char*> cenv;
    cenv.reserve(env.size() + 1);
    for (auto& e : env) cenv.push_back(const_cast<char*>(e.c_str()));
    cenv.push_back(nullptr);
    const char* cwd = spec.working_directory ? spec.working_directory->c_str() : nullptr;

    int out_p[2] = {-1, -1}, err_p[2] = {-1, -1}, status_p[2] = {-1, -1};
    if (!make_pipe(out_p) || !make_pipe(err_p) || !make_pipe(status_p)) {
        int e = errno;
        for (int* p : {out_p, err_p, status_p}) { close_fd(p[0]); close_fd(p[1]); }
        err.os_error = std::error_code(e, std::generic_category());
        err.message = "pipe failed";
        return nullptr;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        for (int* p : {out_p, err_p, status_p}) { close_fd(p[0]); close_fd(p[1]); }
        err.os_error = std::error_code(e, std::generic_category());
        err.message = "fork failed";
        return nullptr;
    }
    if (pid == 0) {
        setpgid(0, 0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull != -1) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(out_p[1], STDOUT_FILENO);
        dup2(err_p[1], STDERR_FILENO);
        int report[2] = {0, 0}; // {step, errno}; step 1 = chdir, 2 = exec
        if (cwd && chdir(cwd) != 0) {
            report[0] = 1;
        } else {
            execve(cargv[0], cargv.data(), cenv.data());
            report[0] = 2;
        }
        report[1] = errno;
        ssize_t w = write(status_p[1], report, sizeof(report));
        (void)w;
        _exit(127);
    }

    setpgid(pid, pid); // races with the child's own call; either wins
    close(out_p[1]);
    close(err_p[1]);
    close(status_p[1]);

    int report[2] = {0, 0};
    ssize_t n;
    do { n = read(status_p[0], report, sizeof(report)); } while (n < 0 && errno == EINTR);
    close(status_p[0]);
    if (n == static_cast<ssize_t>(sizeof(report))) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        close(out_p[0]);
        close(err_p[0]);
        err.os_error = std::error_code(report[1], std::generic_category());
        err.message = report[0] == 1 ? "cannot change directory to " + *spec.working_directory
                                     : "cannot execute " + *exe;
        return nullptr;
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess(spec.max_output_bytes));
    child->m_id = pid;
    child->m_out_fd = out_p[0];
    child->m_err_fd = err_p[0];
    set_nonblocking(child->m_out_fd);
    set_nonblocking(child->m_err_fd);
    return child;
}

ChildProcess::~ChildProcess() {
    if (!m_reaped && m_id > 0) {
        ::kill(-static_cast<pid_t>(m_id), SIGKILL);
        int st = 0;
        while (waitpid(static_cast<pid_t>(m_id), &st, 0) < 0 && errno == EINTR) {}
    }
    close_pipes();
}

NativeProcessHandle ChildProcess::native_handle() const { return static_cast<pid_t>(m_id); }

void ChildProcess::drain() {
    read_available(m_out_fd, m_out);
    read_available(m_err_fd, m_err);
}

void ChildProcess::close_pipes() {
    close_fd(m_out_fd);
    close_fd(m_err_fd);
}

bool ChildProcess::wait_for(std::chrono::milliseconds slice) {
    if (m_reaped) return true;
    pollfd fds[2];
    nfds_t nfds = 0;
    if (m_out_fd != -1) fds[nfds++] = {m_out_fd, POLLIN, 0};
    if (m_err_fd != -1) fds[nfds++] = {m_err_fd, POLLIN, 0};
    int rc = poll(nfds ? fds : nullptr, nfds, static_cast<int>(slice.count()));
    if (rc > 0) drain();

    siginfo_t info{};
    int w;
    do {
        w = waitid(P_PID, static_cast<id_t>(m_id), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (w < 0 && errno == EINTR);
    if (w < 0) return true; // not our child any more; reap() reports it
    return info.si_pid != 0;
}

void ChildProcess::terminate() {
    if (!m_reaped) ::kill(-static_cast<pid_t>(m_id), SIGTERM);
}

void ChildProcess::kill() {
    if (!m_reaped) ::kill(-static_cast<pid_t>(m_id), SIGKILL);
}

ChildExit ChildProcess::reap() {
    ChildExit ex;
    if (m_reaped) return ex;
    int st = 0;
    pid_t r;
    do { r = waitpid(static_cast<pid_t>(m_id), &st, 0); } while (r < 0 && errno == EINTR);
    m_reaped = true;
    // Descendants may keep the pipes open; take only what is buffered.
    drain();
    close_pipes();
    if (r < 0) {
        ex.exit_code = -1;
    } else if (WIFEXITED(st)) {
        ex.exit_code = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        ex.signal = WTERMSIG(st);
        ex.exit_code = 128 + WTERMSIG(st);
    }
    return ex;
}

} // namespace shellbridge
#endif // _WIN32
