#include "instance_guard.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <stdexcept>

const char* to_string(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::Acquired:       return "acquired";
        case AcquireStatus::AlreadyRunning: return "already-running";
        case AcquireStatus::Unavailable:    return "unavailable";
    }
    return "unknown";
}

InstanceGuard::InstanceGuard(PlatformLock& lock, fs::path lock_path, std::string app_tag)
    : lock_(lock), lock_path_(std::move(lock_path)), app_tag_(std::move(app_tag)) {}

InstanceGuard::~InstanceGuard() {
    release();
}

AcquireStatus InstanceGuard::acquire() {
    if (state_ == State::Released) {
        throw std::logic_error("InstanceGuard::acquire() after release()");
    }
    if (state_ == State::Acquired) {
        return AcquireStatus::Acquired;
    }
    last_error_.clear();

    auto outcome = lock_.try_lock(lock_path_);
    if (outcome.status == LockStatus::HeldByOther) {
        solo_log(fmt::format("guard: {} is held by another instance", lock_path_.string()));
        return AcquireStatus::AlreadyRunning;
    }
    if (outcome.status == LockStatus::IoError) {
        last_error_ = outcome.error;
        solo_warn(fmt::format("guard: can't lock {}: {}", lock_path_.string(), outcome.error));
        return AcquireStatus::Unavailable;
    }

    LockRecord record = make_lock_record(app_tag_);
    auto written = lock_.write_claim(outcome.handle, record);
    if (written.is_err()) {
        last_error_ = written.error;
        solo_warn(fmt::format("guard: can't write claim: {}", written.error));
        lock_.unlock(outcome.handle);
        return AcquireStatus::Unavailable;
    }

    handle_ = std::move(outcome.handle);
    record_ = record;
    state_ = State::Acquired;
    solo_log(fmt::format("guard: acquired {} (pid {}, {})", lock_path_.string(),
                         record.owner_id, to_string(lock_.strategy())));
    return AcquireStatus::Acquired;
}

void InstanceGuard::release() {
    if (state_ != State::Acquired) return;
    lock_.unlock(handle_);
    state_ = State::Released;
    solo_log(fmt::format("guard: released {}", lock_path_.string()));
}
