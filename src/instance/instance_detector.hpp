#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "platform_lock.hpp"
#include "detection_result.hpp"
#include "stale_claim_reclaimer.hpp"

namespace fs = std::filesystem;

// The two files an instance is recognised by.
struct InstancePaths {
    fs::path lock_file;     // canonical claim
    fs::path activity_log;  // held open and locked by a running instance
};

// Read-only "is another instance alive?" check. Runs, in order, and stops at
// the first positive signal:
//   1. activity log locked by someone else   -> file-handle-exclusivity
//   2. lock file locked by someone else      -> byte-range-lock-held
//   3. lock file free but its record names a live process -> pid-liveness
// Dead claims found in step 3 are reclaimed on the way. Every lock taken to
// check is released before detect() returns; taking the claim is
// InstanceGuard's job. Under the pid-liveness strategy only step 3 runs.
class InstanceDetector {
public:
    InstanceDetector(PlatformLock& lock, InstancePaths paths, std::string app_tag,
                     LivenessProbe is_alive);

    DetectionResult detect();

    const InstancePaths& paths() const { return paths_; }

private:
    DetectionResult check_activity_log();
    DetectionResult check_lock_file();
    DetectionResult check_record(const RecordRead& read, platform::FileLock* held);

    PlatformLock& lock_;
    InstancePaths paths_;
    std::string app_tag_;
    LivenessProbe is_alive_;
    StaleClaimReclaimer reclaimer_;
};
