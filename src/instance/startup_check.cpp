#include "startup_check.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

StartupDecision run_startup_check(InstanceDetector& detector, InstanceGuard& guard,
                                  const StartupPolicy& policy, const std::string& app_name) {
    StartupDecision d;
    d.detection = detector.detect();

    if (d.detection.is_running()) {
        d.proceed = false;
        d.exit_code = policy.already_running_exit_code;
        d.message = describe(d.detection, app_name);
        return d;
    }

    if (d.detection.is_indeterminate()) {
        d.message = describe(d.detection, app_name);
        if (policy.on_indeterminate == IndeterminatePolicy::FailClosed) {
            d.proceed = false;
            d.exit_code = EXIT_INDETERMINATE;
            return d;
        }
        solo_warn("startup: detection indeterminate, continuing (fail open)");
    }

    d.acquire = guard.acquire();
    switch (*d.acquire) {
        case AcquireStatus::Acquired:
            d.proceed = true;
            break;

        case AcquireStatus::AlreadyRunning: {
            // Lost the race to a process that started alongside us
            auto read = read_lock_record(detector.paths().lock_file);
            std::optional<LockRecord> record;
            if (read.is_ok() && read.value.state == RecordState::Valid)
                record = read.value.record;
            auto method = guard.strategy() == LockStrategy::PidLiveness
                              ? DetectionMethod::PidLiveness
                              : DetectionMethod::ByteRangeLockHeld;
            d.detection = DetectionResult::running(method, record);
            d.proceed = false;
            d.exit_code = policy.already_running_exit_code;
            d.message = describe(d.detection, app_name);
            break;
        }

        case AcquireStatus::Unavailable:
            d.message = fmt::format("Could not claim the instance lock ({}).", guard.last_error());
            if (policy.on_indeterminate == IndeterminatePolicy::FailClosed) {
                d.proceed = false;
                d.exit_code = EXIT_INDETERMINATE;
            } else {
                solo_warn("startup: running without an instance lock (fail open)");
                d.proceed = true;
                d.degraded = true;
            }
            break;
    }
    return d;
}
