#include "process.hpp"
#include "platform.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>

#ifndef _WIN32
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <cerrno>
#endif

namespace platform {

#ifdef __linux__
// An exited child stays in the process table until its parent reaps it.
// /proc/<pid>/stat reads "pid (comm) S ..."; comm may itself contain ')'.
static bool is_zombie(int pid) {
    std::string path = "/proc/" + std::to_string(pid) + "/stat";
    std::FILE* f = std::fopen(path.c_str(), "r");
    if (!f) return false;
    char buf[512];
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
    std::fclose(f);
    buf[n] = '\0';

    const char* close_paren = std::strrchr(buf, ')');
    if (!close_paren || close_paren[1] != ' ') return false;
    char state = close_paren[2];
    return state == 'Z' || state == 'X';
}
#endif

bool process_exists(int pid) {
    if (pid <= 0) return false;
#ifdef _WIN32
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!h) return GetLastError() == ERROR_ACCESS_DENIED;
    DWORD code = 0;
    bool alive = GetExitCodeProcess(h, &code) && code == STILL_ACTIVE;
    CloseHandle(h);
    return alive;
#else
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno != EPERM) return false;
#ifdef __linux__
    // Dead but not yet reaped: its locks and descriptors are already gone
    if (is_zombie(pid)) return false;
#endif
    return true;
#endif
}

// Our buffered output must reach the terminal before anything the child prints
static void flush_output() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

ChildProcess::~ChildProcess() {
#ifdef _WIN32
    if (process_) CloseHandle(process_);
#endif
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
#ifdef _WIN32
    process_ = other.process_;
    other.process_ = nullptr;
#endif
    other.pid_ = -1;
    other.exit_code_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (process_) CloseHandle(process_);
        process_ = other.process_;
        other.process_ = nullptr;
#endif
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

#ifdef _WIN32

ChildProcess ChildProcess::start(const std::vector<std::string>& argv) {
    ChildProcess child;
    if (argv.empty()) return child;
    flush_output();

    std::string cmdline;
    for (const auto& arg : argv) {
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += "\"" + arg + "\"";
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};
    if (CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, FALSE,
                       0, nullptr, nullptr, &si, &pi)) {
        CloseHandle(pi.hThread);
        child.process_ = pi.hProcess;
        child.pid_ = static_cast<int>(pi.dwProcessId);
    }
    return child;
}

std::optional<int> ChildProcess::poll() {
    if (exit_code_ || !process_) return exit_code_;
    DWORD code = 0;
    if (GetExitCodeProcess(process_, &code) && code != STILL_ACTIVE)
        exit_code_ = static_cast<int>(code);
    return exit_code_;
}

int ChildProcess::wait() {
    if (exit_code_) return *exit_code_;
    if (!process_) return -1;
    WaitForSingleObject(process_, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(process_, &code);
    exit_code_ = static_cast<int>(code);
    return *exit_code_;
}

void ChildProcess::stop(int grace_ms) {
    if (!process_ || poll()) return;
    // No portable polite stop for an arbitrary console child
    (void)grace_ms;
    TerminateProcess(process_, 1);
    WaitForSingleObject(process_, INFINITE);
}

#else // Unix

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ChildProcess ChildProcess::start(const std::vector<std::string>& argv) {
    ChildProcess child;
    if (argv.empty()) return child;
    flush_output();

    // Built before fork; the child only calls async-signal-safe functions
    std::vector<const char*> cargv;
    for (const auto& a : argv) cargv.push_back(a.c_str());
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return child;
    if (pid == 0) {
        // Lock descriptors are O_CLOEXEC, so exec drops them
        execvp(cargv[0], const_cast<char* const*>(cargv.data()));
        _exit(127);
    }
    child.pid_ = pid;
    return child;
}

std::optional<int> ChildProcess::poll() {
    if (exit_code_ || pid_ <= 0) return exit_code_;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) exit_code_ = decode_status(status);
    return exit_code_;
}

int ChildProcess::wait() {
    if (exit_code_) return *exit_code_;
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret != pid_) return -1;
    exit_code_ = decode_status(status);
    return *exit_code_;
}

void ChildProcess::stop(int grace_ms) {
    if (pid_ <= 0 || poll()) return;
    kill(pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 50) {
        if (poll()) return;
        sleep_ms(50);
    }
    kill(pid_, SIGKILL);
    wait();
}

#endif

} // namespace platform
