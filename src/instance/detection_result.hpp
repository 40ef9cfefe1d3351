#pragma once

#include <string>
#include <optional>
#include "lock_record.hpp"

// Which check saw the other instance.
enum class DetectionMethod {
    FileHandleExclusivity,  // activity log is locked by someone else
    ByteRangeLockHeld,      // lock file is locked by someone else
    PidLiveness,            // lock record names a live process
};

enum class IndeterminateCause {
    IoError,                    // a check couldn't run at all
    StaleRecordCleanupFailed,   // dead claim found but couldn't be deleted
};

// Answer to "is another instance alive right now?"
struct DetectionResult {
    enum class State { NotRunning, Running, Indeterminate };

    State state = State::NotRunning;
    DetectionMethod method = DetectionMethod::ByteRangeLockHeld;    // when Running
    std::optional<LockRecord> record;                               // when Running, if readable
    IndeterminateCause cause = IndeterminateCause::IoError;         // when Indeterminate
    std::string reason;                                             // when Indeterminate

    static DetectionResult not_running();
    static DetectionResult running(DetectionMethod method,
                                   std::optional<LockRecord> record = std::nullopt);
    static DetectionResult indeterminate(IndeterminateCause cause, std::string reason);

    bool is_running() const { return state == State::Running; }
    bool is_indeterminate() const { return state == State::Indeterminate; }
};

const char* to_string(DetectionMethod method);
const char* to_string(DetectionResult::State state);
const char* to_string(IndeterminateCause cause);

// One line for logs: "running (pid-liveness, pid 4242)".
std::string summarize(const DetectionResult& result);

// User-facing explanation, worded per detection method.
std::string describe(const DetectionResult& result, const std::string& app_name);
