#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "platform_lock.hpp"

namespace fs = std::filesystem;

enum class AcquireStatus {
    Acquired,
    AlreadyRunning,     // another process holds the claim; the host should exit
    Unavailable,        // the lock file couldn't be used; see last_error()
};

const char* to_string(AcquireStatus status);

// Owns the process-lifetime claim of being "the one instance".
//
// acquire() is the authoritative step: it succeeds for exactly one of any
// number of concurrent callers, whether or not they ran InstanceDetector first.
// The locked handle is kept until release() or destruction; the file's text is
// never consulted to decide ownership.
//
//   Unacquired --acquire()--> Acquired --release()--> Released (terminal)
//
// The PlatformLock must outlive the guard.
class InstanceGuard {
public:
    enum class State { Unacquired, Acquired, Released };

    InstanceGuard(PlatformLock& lock, fs::path lock_path, std::string app_tag);
    ~InstanceGuard();

    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;

    // Returns Acquired again if already held. Throws std::logic_error once
    // released; construct a new guard to try again.
    AcquireStatus acquire();

    // Unlock and delete the lock file. Safe to call any number of times, and
    // on a guard that never acquired.
    void release();

    State state() const { return state_; }
    bool held() const { return state_ == State::Acquired; }
    const fs::path& lock_path() const { return lock_path_; }
    LockStrategy strategy() const { return lock_.strategy(); }

    // Record written by the last successful acquire().
    const std::optional<LockRecord>& record() const { return record_; }

    const std::string& last_error() const { return last_error_; }

private:
    PlatformLock& lock_;
    fs::path lock_path_;
    std::string app_tag_;
    LockHandle handle_;
    State state_ = State::Unacquired;
    std::optional<LockRecord> record_;
    std::string last_error_;
};
