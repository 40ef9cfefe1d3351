#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <core/types.hpp>
#include <platform/file_lock.hpp>
#include "lock_record.hpp"

namespace fs = std::filesystem;

// Proof that a PlatformLock::try_lock succeeded. Move-only; whoever holds it
// owns the claim. Under the byte-range strategy it carries the open, locked
// file; destroying it closes the file and the OS drops the lock (the file
// itself stays, use PlatformLock::unlock to remove it).
class LockHandle {
public:
    LockHandle() = default;
    explicit LockHandle(fs::path path,
                        std::unique_ptr<platform::FileLock> file = nullptr);

    LockHandle(LockHandle&& other) noexcept;
    LockHandle& operator=(LockHandle&& other) noexcept;
    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;

    bool valid() const { return valid_; }
    const fs::path& path() const { return path_; }

    // Locked file, or nullptr when the strategy has no OS-level handle.
    platform::FileLock* file() const { return file_.get(); }

    void reset();

private:
    fs::path path_;
    std::unique_ptr<platform::FileLock> file_;
    bool valid_ = false;
};

enum class LockStatus {
    Acquired,
    HeldByOther,    // expected: someone else owns the claim
    IoError,        // couldn't check at all; never means "held"
};

struct LockOutcome {
    LockStatus status = LockStatus::IoError;
    LockHandle handle;              // valid only when Acquired
    int error_code = 0;             // OS error when IoError
    std::string error;

    static LockOutcome acquired(LockHandle handle);
    static LockOutcome held_by_other();
    static LockOutcome io_error(int code, std::string message);
};

const char* to_string(LockStatus status);
const char* to_string(LockStrategy strategy);

// "Take an exclusive, non-blocking claim on the file at path" and its inverse.
// One implementation per strategy, chosen once at construction.
class PlatformLock {
public:
    virtual ~PlatformLock() = default;

    virtual LockOutcome try_lock(const fs::path& path) = 0;

    // Persist the claim for a handle returned by try_lock. For the byte-range
    // strategy the content is informational; for pid-liveness it IS the claim.
    virtual Result<void> write_claim(LockHandle& handle, const LockRecord& record) = 0;

    // Release the claim and remove the backing file. No-op on an invalid handle.
    virtual void unlock(LockHandle& handle) = 0;

    virtual LockStrategy strategy() const = 0;
};

// Build the lock for a strategy. Auto probes probe_dir with the byte-range
// primitive and falls back to pid-liveness when the filesystem can't lock.
std::unique_ptr<PlatformLock> make_platform_lock(LockStrategy strategy,
                                                 const std::string& app_tag,
                                                 const fs::path& probe_dir);
