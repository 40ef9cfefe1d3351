#include "detection_result.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

DetectionResult DetectionResult::not_running() {
    return DetectionResult{};
}

DetectionResult DetectionResult::running(DetectionMethod method,
                                         std::optional<LockRecord> record) {
    DetectionResult r;
    r.state = State::Running;
    r.method = method;
    r.record = std::move(record);
    return r;
}

DetectionResult DetectionResult::indeterminate(IndeterminateCause cause, std::string reason) {
    DetectionResult r;
    r.state = State::Indeterminate;
    r.cause = cause;
    r.reason = std::move(reason);
    return r;
}

const char* to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::FileHandleExclusivity: return "file-handle-exclusivity";
        case DetectionMethod::ByteRangeLockHeld:     return "byte-range-lock-held";
        case DetectionMethod::PidLiveness:           return "pid-liveness";
    }
    return "unknown";
}

const char* to_string(DetectionResult::State state) {
    switch (state) {
        case DetectionResult::State::NotRunning:    return "not running";
        case DetectionResult::State::Running:       return "running";
        case DetectionResult::State::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

const char* to_string(IndeterminateCause cause) {
    switch (cause) {
        case IndeterminateCause::IoError:                  return "io-error";
        case IndeterminateCause::StaleRecordCleanupFailed: return "stale-record-cleanup-failed";
    }
    return "unknown";
}

std::string summarize(const DetectionResult& result) {
    switch (result.state) {
        case DetectionResult::State::NotRunning:
            return "not running";
        case DetectionResult::State::Running:
            if (result.record)
                return fmt::format("running ({}, pid {})", to_string(result.method),
                                   result.record->owner_id);
            return fmt::format("running ({})", to_string(result.method));
        case DetectionResult::State::Indeterminate:
            return fmt::format("indeterminate ({}: {})", to_string(result.cause), result.reason);
    }
    return "unknown";
}

std::string describe(const DetectionResult& result, const std::string& app_name) {
    if (result.state == DetectionResult::State::NotRunning) {
        return fmt::format("No other instance of {} is running.", app_name);
    }

    if (result.state == DetectionResult::State::Indeterminate) {
        if (result.cause == IndeterminateCause::StaleRecordCleanupFailed) {
            return fmt::format("A previous instance of {} exited without cleaning up, and its "
                               "lock file could not be removed ({}). Remove it manually if "
                               "startup keeps failing.", app_name, result.reason);
        }
        return fmt::format("Could not check whether {} is already running ({}).",
                           app_name, result.reason);
    }

    std::string since;
    if (result.record && result.record->claimed_at > 0) {
        since = fmt::format(" since {}", format_unix_time(result.record->claimed_at));
    }

    switch (result.method) {
        case DetectionMethod::FileHandleExclusivity:
            return fmt::format("Another instance of {} is currently writing to the log file. "
                               "Only one instance can run at a time.", app_name);
        case DetectionMethod::ByteRangeLockHeld:
            if (result.record) {
                return fmt::format("Another instance of {} is running (process ID {}){}. "
                                   "Only one instance can run at a time.",
                                   app_name, result.record->owner_id, since);
            }
            return fmt::format("Another instance of {} holds the instance lock. "
                               "Only one instance can run at a time.", app_name);
        case DetectionMethod::PidLiveness:
            return fmt::format("Another instance of {} is running (process ID {}){}. "
                               "Only one instance can run at a time.", app_name,
                               result.record ? std::to_string(result.record->owner_id)
                                             : std::string("unknown"),
                               since);
    }
    return fmt::format("Another instance of {} appears to be running.", app_name);
}
