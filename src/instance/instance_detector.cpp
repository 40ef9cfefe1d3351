#include "instance_detector.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

InstanceDetector::InstanceDetector(PlatformLock& lock, InstancePaths paths,
                                   std::string app_tag, LivenessProbe is_alive)
    : lock_(lock),
      paths_(std::move(paths)),
      app_tag_(std::move(app_tag)),
      is_alive_(is_alive),
      reclaimer_(paths_.lock_file, std::move(is_alive)) {}

DetectionResult InstanceDetector::detect() {
    solo_log(fmt::format("detect: start (strategy={}, lock={})",
                         to_string(lock_.strategy()), paths_.lock_file.string()));

    DetectionResult result;
    if (lock_.strategy() == LockStrategy::ByteRange) {
        result = check_activity_log();
        if (!result.is_running()) {
            result = check_lock_file();
        }
    } else {
        auto read = read_lock_record(paths_.lock_file);
        if (read.is_err()) {
            result = DetectionResult::indeterminate(IndeterminateCause::IoError, read.error);
        } else {
            result = check_record(read.value, nullptr);
        }
    }

    if (result.is_indeterminate()) {
        solo_warn(fmt::format("detect: {}", summarize(result)));
    } else {
        solo_log(fmt::format("detect: {}", summarize(result)));
    }
    return result;
}

DetectionResult InstanceDetector::check_activity_log() {
    std::error_code ec;
    if (paths_.activity_log.empty() || !fs::exists(paths_.activity_log, ec)) {
        return DetectionResult::not_running();
    }

    auto outcome = lock_.try_lock(paths_.activity_log);
    switch (outcome.status) {
        case LockStatus::HeldByOther:
            return DetectionResult::running(DetectionMethod::FileHandleExclusivity);
        case LockStatus::IoError:
            // Secondary evidence only; the lock file check below still decides
            solo_warn(fmt::format("detect: can't probe activity log: {}", outcome.error));
            return DetectionResult::not_running();
        case LockStatus::Acquired:
            break;
    }
    // outcome.handle closes here, dropping the probe lock and keeping the log
    return DetectionResult::not_running();
}

DetectionResult InstanceDetector::check_lock_file() {
    auto outcome = lock_.try_lock(paths_.lock_file);
    if (outcome.status == LockStatus::HeldByOther) {
        std::optional<LockRecord> record;
        auto read = read_lock_record(paths_.lock_file);
        if (read.is_ok() && read.value.state == RecordState::Valid &&
            read.value.record.app_tag == app_tag_) {
            record = read.value.record;
        }
        if (record && record->owner_id == platform::current_pid()) {
            // Held by this process's own guard
            solo_log(fmt::format("detect: lock file is held by this process (pid {})",
                                 record->owner_id));
            return DetectionResult::not_running();
        }
        return DetectionResult::running(DetectionMethod::ByteRangeLockHeld, record);
    }
    if (outcome.status == LockStatus::IoError) {
        return DetectionResult::indeterminate(IndeterminateCause::IoError, outcome.error);
    }

    // No live OS lock. Whatever is in the file was left by a process that
    // exited, or was written by a writer that couldn't lock.
    LockHandle probe = std::move(outcome.handle);
    auto contents = probe.file()->read_contents();
    if (contents.is_err()) {
        return DetectionResult::indeterminate(IndeterminateCause::IoError, contents.error);
    }

    auto read = classify_lock_record(contents.value);
    if (read.state == RecordState::Empty) {
        // Either we just created it or a release was interrupted; don't leave it behind
        auto removed = probe.file()->remove_file();
        if (removed.is_err()) solo_warn("detect: " + removed.error);
        return DetectionResult::not_running();
    }
    return check_record(read, probe.file());
}

DetectionResult InstanceDetector::check_record(const RecordRead& read, platform::FileLock* held) {
    switch (read.state) {
        case RecordState::Missing:
        case RecordState::Empty:
            return DetectionResult::not_running();

        case RecordState::Malformed: {
            auto out = reclaimer_.discard_malformed(held);
            if (out.status == ReclaimStatus::CleanupFailed) {
                return DetectionResult::indeterminate(
                    IndeterminateCause::StaleRecordCleanupFailed, out.error);
            }
            return DetectionResult::not_running();
        }

        case RecordState::Valid:
            break;
    }

    const LockRecord& record = read.record;
    if (record.app_tag != app_tag_) {
        solo_log(fmt::format("detect: ignoring lock record for '{}' (pid {})",
                             record.app_tag, record.owner_id));
        return DetectionResult::not_running();
    }

    if (record.owner_id == platform::current_pid()) {
        // Our own claim, or a dead one whose pid we were handed; neither is another instance
        solo_log(fmt::format("detect: lock record names this process (pid {})", record.owner_id));
        return DetectionResult::not_running();
    }

    if (is_alive_(record.owner_id)) {
        return DetectionResult::running(DetectionMethod::PidLiveness, record);
    }

    auto out = reclaimer_.reclaim(record, held);
    switch (out.status) {
        case ReclaimStatus::Reclaimed:
            return DetectionResult::not_running();
        case ReclaimStatus::Superseded: {
            // Only possible without a held lock: someone wrote a new claim meanwhile
            auto fresh = read_lock_record(paths_.lock_file);
            if (fresh.is_ok() && fresh.value.state == RecordState::Valid &&
                fresh.value.record.app_tag == app_tag_ &&
                is_alive_(fresh.value.record.owner_id)) {
                return DetectionResult::running(DetectionMethod::PidLiveness,
                                                fresh.value.record);
            }
            return DetectionResult::not_running();
        }
        case ReclaimStatus::OwnerAlive:
            return DetectionResult::running(DetectionMethod::PidLiveness, record);
        case ReclaimStatus::CleanupFailed:
            break;
    }
    return DetectionResult::indeterminate(IndeterminateCause::StaleRecordCleanupFailed,
                                          out.error);
}
