#pragma once

#include "platform_lock.hpp"

// Fallback for filesystems without working byte-range locks. The record in
// the file is the claim and exclusivity is emulated by probing whether its
// owner is alive. Nothing is cleaned up by the OS if the owner dies, and
// check-then-write is not atomic: two processes starting in the same instant
// can both win.
class PidLivenessLock : public PlatformLock {
public:
    PidLivenessLock(std::string app_tag, LivenessProbe is_alive);

    LockOutcome try_lock(const fs::path& path) override;
    Result<void> write_claim(LockHandle& handle, const LockRecord& record) override;
    void unlock(LockHandle& handle) override;
    LockStrategy strategy() const override { return LockStrategy::PidLiveness; }

private:
    std::string app_tag_;
    LivenessProbe is_alive_;
};
