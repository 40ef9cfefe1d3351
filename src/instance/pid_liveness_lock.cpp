#include "pid_liveness_lock.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <fstream>

PidLivenessLock::PidLivenessLock(std::string app_tag, LivenessProbe is_alive)
    : app_tag_(std::move(app_tag)), is_alive_(std::move(is_alive)) {}

LockOutcome PidLivenessLock::try_lock(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path.parent_path(), ec)) {
        return LockOutcome::io_error(ENOENT, fmt::format("{}: parent directory missing",
                                                         path.string()));
    }

    auto read = read_lock_record(path);
    if (read.is_err()) {
        return LockOutcome::io_error(EIO, read.error);
    }

    const auto& r = read.value;
    if (r.state == RecordState::Valid && r.record.app_tag == app_tag_ &&
        r.record.owner_id != platform::current_pid() && is_alive_(r.record.owner_id)) {
        return LockOutcome::held_by_other();
    }
    return LockOutcome::acquired(LockHandle(path));
}

Result<void> PidLivenessLock::write_claim(LockHandle& handle, const LockRecord& record) {
    if (!handle.valid()) return Result<void>::Err("write_claim on an invalid handle");

    // Write aside and rename so a concurrent reader never sees half a record
    // (which it would discard as malformed).
    fs::path tmp = handle.path();
    tmp += fmt::format(".{}.tmp", platform::current_pid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(fmt::format("{}: {}", tmp.string(),
                                                 platform::error_text(errno)));
        }
        out << format_lock_record(record);
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Result<void>::Err(fmt::format("{}: write failed", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, handle.path(), ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void>::Err(fmt::format("{}: {}", handle.path().string(), ec.message()));
    }
    return Result<void>::Ok();
}

void PidLivenessLock::unlock(LockHandle& handle) {
    if (!handle.valid()) return;

    // Only remove the file while it still names us; a newer claimant may
    // have replaced it after we lost a race.
    auto read = read_lock_record(handle.path());
    if (read.is_ok() && read.value.state == RecordState::Valid &&
        read.value.record.owner_id == platform::current_pid()) {
        std::error_code ec;
        fs::remove(handle.path(), ec);
        if (ec) solo_warn(fmt::format("couldn't remove lock file {}: {}",
                                      handle.path().string(), ec.message()));
    } else if (read.is_err()) {
        solo_warn(fmt::format("couldn't read lock file on release: {}", read.error));
    }
    handle.reset();
}
