#pragma once

#include <string>
#include <core/types.hpp>

namespace platform {

enum class LockAttempt {
    Locked,     // this handle now holds the lock
    Busy,       // another handle holds it
    Failed,     // couldn't open or lock; see error_code()
};

// RAII exclusive lock on one byte of a file: byte 0 under open-file-description
// locks on Linux or flock() on other Unix, a byte far past the content under
// LockFileEx() on Windows so other handles can still read and append. The lock belongs to the open handle, so the OS
// drops it when the handle closes, including when the process crashes.
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Opens (creating if needed) and tries to lock without blocking.
    // Never creates parent directories.
    LockAttempt try_lock(const std::string& path);

    // Returns true if this handle holds the lock.
    bool held() const { return fd_ >= 0; }

    const std::string& path() const { return path_; }

    // errno (or GetLastError on Windows) of the last Failed attempt.
    int error_code() const { return error_; }
    std::string error_message() const;

    // Replace the whole file content through the locked handle.
    Result<void> write_contents(const std::string& data);
    Result<std::string> read_contents() const;

    // Delete the file and drop the lock. On Unix the file is unlinked while
    // the lock is still held, so nobody can lock the old inode in between.
    Result<void> remove_file();

    // Drop the lock and close the handle; the file stays.
    void close();

private:
    int fd_ = -1;
    int error_ = 0;
    std::string path_;
};

// True for errors meaning "this filesystem can't do locks at all"
// (NFS without lockd and the like), as opposed to a real I/O failure.
bool lock_unsupported(int error_code);

} // namespace platform
