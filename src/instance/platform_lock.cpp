#include "platform_lock.hpp"
#include "byte_range_lock.hpp"
#include "pid_liveness_lock.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

// ── LockHandle ───────────────────────────────────────────────

LockHandle::LockHandle(fs::path path, std::unique_ptr<platform::FileLock> file)
    : path_(std::move(path)), file_(std::move(file)), valid_(true) {}

LockHandle::LockHandle(LockHandle&& other) noexcept
    : path_(std::move(other.path_)), file_(std::move(other.file_)), valid_(other.valid_) {
    other.path_.clear();
    other.valid_ = false;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
    if (this != &other) {
        path_ = std::move(other.path_);
        file_ = std::move(other.file_);
        valid_ = other.valid_;
        other.path_.clear();
        other.valid_ = false;
    }
    return *this;
}

void LockHandle::reset() {
    file_.reset();
    path_.clear();
    valid_ = false;
}

// ── LockOutcome ──────────────────────────────────────────────

LockOutcome LockOutcome::acquired(LockHandle handle) {
    LockOutcome out;
    out.status = LockStatus::Acquired;
    out.handle = std::move(handle);
    return out;
}

LockOutcome LockOutcome::held_by_other() {
    LockOutcome out;
    out.status = LockStatus::HeldByOther;
    return out;
}

LockOutcome LockOutcome::io_error(int code, std::string message) {
    LockOutcome out;
    out.status = LockStatus::IoError;
    out.error_code = code;
    out.error = std::move(message);
    return out;
}

const char* to_string(LockStatus status) {
    switch (status) {
        case LockStatus::Acquired:    return "acquired";
        case LockStatus::HeldByOther: return "held-by-other";
        case LockStatus::IoError:     return "io-error";
    }
    return "unknown";
}

const char* to_string(LockStrategy strategy) {
    switch (strategy) {
        case LockStrategy::Auto:        return "auto";
        case LockStrategy::ByteRange:   return "byte-range";
        case LockStrategy::PidLiveness: return "pid";
    }
    return "unknown";
}

// ── Strategy selection ───────────────────────────────────────

static bool byte_range_supported(const fs::path& probe_dir) {
    platform::FileLock probe;
    auto attempt = probe.try_lock((probe_dir / PROBE_FILE_NAME).string());
    if (attempt == platform::LockAttempt::Locked) {
        auto removed = probe.remove_file();
        if (removed.is_err()) solo_warn("lock probe cleanup: " + removed.error);
        return true;
    }
    if (attempt == platform::LockAttempt::Busy) {
        // Someone else is probing right now, which proves locks work
        return true;
    }
    if (platform::lock_unsupported(probe.error_code())) {
        solo_warn(fmt::format("byte-range locks unsupported in {} ({})",
                              probe_dir.string(), probe.error_message()));
        return false;
    }
    // Other failures (permissions, missing dir) will show up again on the real
    // lock file and be reported there; they don't say locking is unsupported.
    return true;
}

std::unique_ptr<PlatformLock> make_platform_lock(LockStrategy strategy,
                                                 const std::string& app_tag,
                                                 const fs::path& probe_dir) {
    if (strategy == LockStrategy::Auto) {
        strategy = byte_range_supported(probe_dir) ? LockStrategy::ByteRange
                                                   : LockStrategy::PidLiveness;
        solo_log(fmt::format("lock strategy: auto -> {}", to_string(strategy)));
    }
    if (strategy == LockStrategy::PidLiveness) {
        return std::make_unique<PidLivenessLock>(app_tag, platform::process_exists);
    }
    return std::make_unique<ByteRangeLock>();
}
