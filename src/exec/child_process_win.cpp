/*
 * Windows child process - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifdef _WIN32
#include <shellbridge/exec/child_process.hpp>
#include <windows.h>
#include <algorithm>
#include <cwchar>
#include <thread>

namespace shellbridge {

namespace {

std::wstring widen(const std::string& s) {
    if (s.empty()) return std::wstring();
    int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
    std::wstring out(n, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), out.data(), n);
    return out;
}

std::error_code last_error() { return std::error_code((int)GetLastError(), std::system_category()); }

// Quote one argument so CommandLineToArgvW yields it back unchanged.
void append_quoted(std::wstring& cmd, const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) { cmd += arg; return; }
    cmd.push_back(L'"');
    for (auto it = arg.begin();; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == L'\\') { ++it; ++backslashes; }
        if (it == arg.end()) { cmd.append(backslashes * 2, L'\\'); break; }
        if (*it == L'"') { cmd.append(backslashes * 2 + 1, L'\\'); cmd.push_back(*it); }
        else { cmd.append(backslashes, L'\\'); cmd.push_back(*it); }
    }
    cmd.push_back(L'"');
}

std::wstring build_command_line(const LaunchSpec& spec) {
    std::wstring cmd;
    append_quoted(cmd, widen(spec.executable));
    for (size_t i = 0; i < spec.args.size(); ++i) {
        cmd.push_back(L' ');
        bool last = i + 1 == spec.args.size();
        if (last && spec.trailing_mode == TrailingArgMode::Verbatim) cmd += widen(spec.args[i]);
        else append_quoted(cmd, widen(spec.args[i]));
    }
    return cmd;
}

struct NoCaseLess {
    bool operator()(const std::wstring& a, const std::wstring& b) const {
        return _wcsicmp(a.c_str(), b.c_str()) < 0;
    }
};

// Double-NUL terminated block, sorted case-insensitively as Windows expects.
std::wstring build_environment(const std::map<std::string, std::string>& extra) {
    std::map<std::wstring, std::wstring, NoCaseLess> env;
    if (wchar_t* block = GetEnvironmentStringsW()) {
        for (wchar_t* p = block; *p; p += wcslen(p) + 1) {
            std::wstring kv = p;
            auto eq = kv.find(L'=', 1); // entries like "=C:=C:\" start with '='
            if (eq == std::wstring::npos) continue;
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        FreeEnvironmentStringsW(block);
    }
    for (auto& [k, v] : extra) env[widen(k)] = widen(v);
    std::wstring out;
    for (auto& [k, v] : env) { out += k; out.push_back(L'='); out += v; out.push_back(L'\0'); }
    out.push_back(L'\0');
    return out;
}

void close_handle(void*& h) {
    if (h) { CloseHandle(static_cast<HANDLE>(h)); h = nullptr; }
}

void read_available(void*& pipe, OutputBuffer& buf) {
    char chunk[8192];
    while (pipe) {
        DWORD avail = 0;
        if (!PeekNamedPipe(static_cast<HANDLE>(pipe), nullptr, 0, nullptr, &avail, nullptr)) {
            close_handle(pipe); // broken pipe: writer gone
            return;
        }
        if (avail == 0) return;
        DWORD got = 0;
        DWORD want = std::min<DWORD>(avail, sizeof(chunk));
        if (!ReadFile(static_cast<HANDLE>(pipe), chunk, want, &got, nullptr) || got == 0) {
            close_handle(pipe);
            return;
        }
        buf.append(chunk, got);
    }
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchSpec& spec, SpawnError& err) {
    SECURITY_ATTRIBUTES sa{sizeof(sa), nullptr, TRUE};
    HANDLE out_r = nullptr, out_w = nullptr, err_r = nullptr, err_w = nullptr;
    if (!CreatePipe(&out_r, &out_w, &sa, 0) || !CreatePipe(&err_r, &err_w, &sa, 0)) {
        err.os_error = last_error();
        err.message = "CreatePipe failed";
        for (HANDLE h : {out_r, out_w, err_r, err_w}) if (h) CloseHandle(h);
        return nullptr;
    }
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);
    HANDLE null_in = CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                 OPEN_EXISTING, 0, nullptr);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = null_in != INVALID_HANDLE_VALUE ? null_in : nullptr;
    si.hStdOutput = out_w;
    si.hStdError = err_w;

    std::wstring cmdline = build_command_line(spec);
    std::wstring env = build_environment(spec.environment);
    std::wstring cwd = spec.working_directory ? widen(*spec.working_directory) : std::wstring();

    PROCESS_INFORMATION pi{};
    DWORD flags = CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW | CREATE_UNICODE_ENVIRONMENT | CREATE_SUSPENDED;
    BOOL ok = CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, TRUE, flags, env.data(),
                             spec.working_directory ? cwd.c_str() : nullptr, &si, &pi);
    std::error_code create_error = ok ? std::error_code() : last_error();
    CloseHandle(out_w);
    CloseHandle(err_w);
    if (null_in != INVALID_HANDLE_VALUE) CloseHandle(null_in);
    if (!ok) {
        CloseHandle(out_r);
        CloseHandle(err_r);
        err.os_error = create_error;
        err.message = "cannot execute " + spec.executable;
        return nullptr;
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess(spec.max_output_bytes));
    child->m_id = pi.dwProcessId;
    child->m_process = pi.hProcess;
    child->m_thread = pi.hThread;
    child->m_out_pipe = out_r;
    child->m_err_pipe = err_r;
    child->m_job = CreateJobObjectW(nullptr, nullptr);
    if (child->m_job) {
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
        limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        SetInformationJobObject(child->m_job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));
        AssignProcessToJobObject(child->m_job, pi.hProcess);
    }
    ResumeThread(pi.hThread);
    return child;
}

ChildProcess::~ChildProcess() {
    if (!m_reaped && m_process) {
        kill();
        WaitForSingleObject(static_cast<HANDLE>(m_process), INFINITE);
    }
    close_pipes();
    close_handle(m_thread);
    close_handle(m_process);
    close_handle(m_job);
}

NativeProcessHandle ChildProcess::native_handle() const { return m_process; }

void ChildProcess::drain() {
    read_available(m_out_pipe, m_out);
    read_available(m_err_pipe, m_err);
}

void ChildProcess::close_pipes() {
    close_handle(m_out_pipe);
    close_handle(m_err_pipe);
}

bool ChildProcess::wait_for(std::chrono::milliseconds slice) {
    if (m_reaped) return true;
    auto deadline = std::chrono::steady_clock::now() + slice;
    for (;;) {
        drain();
        if (WaitForSingleObject(static_cast<HANDLE>(m_process), 0) == WAIT_OBJECT_0) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ChildProcess::terminate() {
    if (m_reaped) return;
    if (!GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(m_id)))
        TerminateProcess(static_cast<HANDLE>(m_process), 1);
}

void ChildProcess::kill() {
    if (m_reaped) return;
    if (!m_job || !TerminateJobObject(static_cast<HANDLE>(m_job), 1))
        TerminateProcess(static_cast<HANDLE>(m_process), 1);
}

ChildExit ChildProcess::reap() {
    ChildExit ex;
    if (m_reaped) return ex;
    WaitForSingleObject(static_cast<HANDLE>(m_process), INFINITE);
    DWORD code = 0;
    if (!GetExitCodeProcess(static_cast<HANDLE>(m_process), &code)) code = static_cast<DWORD>(-1);
    m_reaped = true;
    drain();
    close_pipes();
    ex.exit_code = static_cast<int>(code);
    return ex;
}

} // namespace shellbridge
#endif // _WIN32
