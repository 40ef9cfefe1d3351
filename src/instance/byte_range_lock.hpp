#pragma once

#include "platform_lock.hpp"

// Claim = an OS lock on one byte of the lock file. Authoritative: exactly one
// non-blocking request can win, and the OS frees it when the holder dies.
class ByteRangeLock : public PlatformLock {
public:
    LockOutcome try_lock(const fs::path& path) override;
    Result<void> write_claim(LockHandle& handle, const LockRecord& record) override;
    void unlock(LockHandle& handle) override;
    LockStrategy strategy() const override { return LockStrategy::ByteRange; }
};
