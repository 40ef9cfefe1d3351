#pragma once

#include <string>
#include <vector>
#include <optional>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// True if a process with this id currently exists. A process we are not
// allowed to signal or open still counts as existing.
bool process_exists(int pid);

// A program run on behalf of the instance holder. It shares our stdio but
// never inherits the lock handles, so its lifetime can't extend the claim.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // argv[0] is looked up on PATH. Check started() on the result.
    static ChildProcess start(const std::vector<std::string>& argv);

    bool started() const { return pid_ > 0; }
    int pid() const { return pid_; }

    // Exit code if the child has finished, nullopt while it runs.
    // Death by signal is reported as 128 + signal number.
    std::optional<int> poll();

    // Block until the child exits and return its exit code (-1 if never started).
    int wait();

    // Ask the child to stop, then force it after grace_ms.
    void stop(int grace_ms);

private:
    int pid_ = -1;
    std::optional<int> exit_code_;
#ifdef _WIN32
    HANDLE process_ = nullptr;
#endif
};

} // namespace platform
