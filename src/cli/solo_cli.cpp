#include "solo_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <instance/instance_guard.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <csignal>
#include <iostream>

static volatile std::sig_atomic_t g_stop_requested = 0;

static void on_stop_signal(int) {
    g_stop_requested = 1;
}

static void install_stop_handlers() {
    g_stop_requested = 0;
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
}

SoloCLI::SoloCLI(Config config) : config_(std::move(config)) {}

bool SoloCLI::prepare() {
    auto dir = ensure_data_directory(config_.data_dir());
    if (dir.is_err()) {
        // Fail open: the lock layer reports the same problem as indeterminate
        std::cout << theme::note(dir.error);
        solo_warn(dir.error);
    }
    lock_ = make_platform_lock(config_.strategy(), config_.app_tag(), config_.data_dir());
    return lock_ != nullptr;
}

InstanceDetector SoloCLI::make_detector() {
    InstancePaths paths{config_.lock_path(), config_.activity_log_path()};
    return InstanceDetector(*lock_, paths, config_.app_tag(), platform::process_exists);
}

StartupPolicy SoloCLI::policy() const {
    StartupPolicy p;
    p.on_indeterminate = config_.on_indeterminate();
    p.already_running_exit_code = config_.already_running_exit_code();
    return p;
}

bool SoloCLI::report_startup(const StartupDecision& decision) {
    if (!decision.proceed) {
        std::cout << theme::fail(decision.message);
        if (decision.detection.is_running()) {
            std::cout << theme::kv("detected by", to_string(decision.detection.method));
        }
        return false;
    }
    if (!decision.message.empty()) {
        std::cout << theme::info(decision.message);
    }
    if (decision.degraded) {
        std::cout << theme::info("Continuing without an instance lock.");
    } else {
        std::cout << theme::ok(fmt::format("Instance lock held: {}", config_.lock_path().string()));
    }
    return true;
}

void SoloCLI::open_activity_log() {
    fs::path log = config_.activity_log_path();
    auto attempt = activity_log_.try_lock(log.string());
    if (attempt == platform::LockAttempt::Locked) {
        set_log_path(log);
        solo_log(fmt::format("=== {} pid {} started ===", config_.app_name(), platform::current_pid()));
    } else if (attempt == platform::LockAttempt::Busy) {
        solo_warn(fmt::format("activity log {} is locked by another process", log.string()));
    } else {
        solo_warn(fmt::format("can't open activity log: {}", activity_log_.error_message()));
    }
}

void SoloCLI::close_activity_log() {
    if (!activity_log_.held()) return;
    solo_log(fmt::format("=== {} pid {} stopping ===", config_.app_name(), platform::current_pid()));
    activity_log_.close();
}

int SoloCLI::run_status() {
    if (!prepare()) return 1;
    auto detector = make_detector();
    auto result = detector.detect();

    std::cout << theme::section("Instance status");
    std::cout << theme::kv("app", config_.app_name());
    std::cout << theme::kv("strategy", to_string(lock_->strategy()));
    std::cout << theme::kv("lock file", config_.lock_path().string());
    std::cout << theme::kv("state", to_string(result.state));
    if (result.is_running()) {
        std::cout << theme::kv("detected by", to_string(result.method));
        if (result.record) {
            std::cout << theme::kv("pid", std::to_string(result.record->owner_id));
            std::cout << theme::kv("since", format_unix_time(result.record->claimed_at));
        }
    }
    std::cout << "\n";

    switch (result.state) {
        case DetectionResult::State::NotRunning:
            std::cout << theme::ok(describe(result, config_.app_name()));
            return 0;
        case DetectionResult::State::Running:
            std::cout << theme::info(describe(result, config_.app_name()));
            return config_.already_running_exit_code();
        case DetectionResult::State::Indeterminate:
            std::cout << theme::fail(describe(result, config_.app_name()));
            return config_.on_indeterminate() == IndeterminatePolicy::FailClosed
                       ? EXIT_INDETERMINATE : 0;
    }
    return 0;
}

int SoloCLI::run_hold() {
    if (!prepare()) return 1;
    auto detector = make_detector();
    InstanceGuard guard(*lock_, config_.lock_path(), config_.app_tag());

    install_stop_handlers();
    auto decision = run_startup_check(detector, guard, policy(), config_.app_name());
    if (!report_startup(decision)) return decision.exit_code;

    open_activity_log();
    std::cout << theme::step("Holding. Press Ctrl-C to release.");
    while (!g_stop_requested) {
        platform::sleep_ms(HOLD_POLL_MS);
    }

    guard.release();
    close_activity_log();
    std::cout << theme::ok("Released.");
    return 0;
}

int SoloCLI::run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        std::cout << theme::fail("Nothing to run.");
        std::cout << theme::step("Usage: solo run -- <program> [args...]");
        return 1;
    }
    if (!prepare()) return 1;
    auto detector = make_detector();
    InstanceGuard guard(*lock_, config_.lock_path(), config_.app_tag());

    install_stop_handlers();
    auto decision = run_startup_check(detector, guard, policy(), config_.app_name());
    if (!report_startup(decision)) return decision.exit_code;

    open_activity_log();
    auto child = platform::ChildProcess::start(argv);
    if (!child.started()) {
        std::cout << theme::fail("Failed to start " + argv[0]);
        solo_warn("run: spawn failed for " + argv[0]);
        guard.release();
        close_activity_log();
        return EXIT_SPAWN_FAILED;
    }
    solo_log(fmt::format("run: started {} (pid {})", argv[0], child.pid()));

    while (!child.poll() && !g_stop_requested) {
        platform::sleep_ms(HOLD_POLL_MS);
    }
    if (g_stop_requested) {
        solo_log("run: stop requested, stopping child");
        child.stop(CHILD_STOP_GRACE_MS);
    }
    int code = child.wait();
    solo_log(fmt::format("run: {} exited with {}", argv[0], code));

    guard.release();
    close_activity_log();
    return code < 0 ? 1 : code;
}
