#include "byte_range_lock.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

LockOutcome ByteRangeLock::try_lock(const fs::path& path) {
    auto file = std::make_unique<platform::FileLock>();
    switch (file->try_lock(path.string())) {
        case platform::LockAttempt::Locked:
            return LockOutcome::acquired(LockHandle(path, std::move(file)));
        case platform::LockAttempt::Busy:
            return LockOutcome::held_by_other();
        case platform::LockAttempt::Failed:
            break;
    }
    return LockOutcome::io_error(file->error_code(), file->error_message());
}

Result<void> ByteRangeLock::write_claim(LockHandle& handle, const LockRecord& record) {
    if (!handle.valid() || !handle.file())
        return Result<void>::Err("write_claim on a handle that holds no lock");

    // The OS lock is the claim; the text is for humans and for the
    // pid-liveness check, so a failed write doesn't undo the claim.
    auto written = handle.file()->write_contents(format_lock_record(record));
    if (written.is_err()) {
        solo_warn(fmt::format("couldn't write lock record: {}", written.error));
    }
    return Result<void>::Ok();
}

void ByteRangeLock::unlock(LockHandle& handle) {
    if (!handle.valid()) return;
    auto* file = handle.file();
    if (file && file->held()) {
        auto removed = file->remove_file();
        if (removed.is_err()) {
            // Harmless: the next claimant locks and rewrites it
            solo_warn(fmt::format("couldn't remove lock file: {}", removed.error));
        }
    }
    handle.reset();
}
