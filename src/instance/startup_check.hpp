#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include "detection_result.hpp"
#include "instance_detector.hpp"
#include "instance_guard.hpp"

struct StartupPolicy {
    IndeterminatePolicy on_indeterminate = IndeterminatePolicy::FailOpen;
    int already_running_exit_code = 3;
};

// Outcome of the detect-then-acquire sequence, ready for the host to act on.
struct StartupDecision {
    bool proceed = false;
    int exit_code = 0;                      // meaningful when !proceed
    DetectionResult detection;
    std::optional<AcquireStatus> acquire;   // unset if detection already said stop
    bool degraded = false;                  // proceeding without a held claim
    std::string message;                    // user-facing, empty when all is well
};

// Detect, then acquire. Only "another instance is running" (found by detection
// or by losing the acquire race) stops the host, unless the policy is
// fail-closed, in which case anything indeterminate stops it too.
StartupDecision run_startup_check(InstanceDetector& detector, InstanceGuard& guard,
                                  const StartupPolicy& policy, const std::string& app_name);
