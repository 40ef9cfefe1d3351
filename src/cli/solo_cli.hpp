#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <instance/platform_lock.hpp>
#include <instance/instance_detector.hpp>
#include <instance/startup_check.hpp>
#include <platform/file_lock.hpp>

// Host side of the instance lock: runs the startup check and reports the
// result the way a user expects to see it.
class SoloCLI {
public:
    explicit SoloCLI(Config config);

    // Detection only; never takes the claim.
    int run_status();

    // Take the claim and keep it until SIGINT/SIGTERM.
    int run_hold();

    // Take the claim, run argv[0] with the remaining arguments, release when
    // it exits. Returns the child's exit code.
    int run_command(const std::vector<std::string>& argv);

private:
    bool prepare();
    InstanceDetector make_detector();
    StartupPolicy policy() const;

    // Returns true if the host may continue.
    bool report_startup(const StartupDecision& decision);

    // Lock and adopt the activity log once the claim is ours.
    void open_activity_log();
    void close_activity_log();

    Config config_;
    std::unique_ptr<PlatformLock> lock_;
    platform::FileLock activity_log_;
};
