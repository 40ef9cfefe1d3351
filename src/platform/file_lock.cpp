#include "file_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <cerrno>
#include <fmt/format.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#else
#  include <sys/file.h>
#  include <sys/stat.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

namespace platform {

FileLock::~FileLock() {
    close();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), error_(other.error_), path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.path_.clear();
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        error_ = other.error_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.path_.clear();
    }
    return *this;
}

std::string FileLock::error_message() const {
    return fmt::format("{}: {}", path_, error_text(error_));
}

#ifdef _WIN32

// Windows byte-range locks are mandatory: no other handle may read or write
// inside the range. Lock one byte far past any real content so the record
// and the activity log stay readable and appendable through other handles.
static OVERLAPPED lock_region() {
    OVERLAPPED ov = {};
    ov.Offset = MAXDWORD;
    ov.OffsetHigh = 0;
    return ov;
}

LockAttempt FileLock::try_lock(const std::string& path) {
    close();
    path_ = path;
    error_ = 0;

    int fd = _open(path.c_str(), _O_CREAT | _O_RDWR | _O_BINARY | _O_NOINHERIT,
                   _S_IREAD | _S_IWRITE);
    if (fd < 0) {
        error_ = errno;
        return LockAttempt::Failed;
    }
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = lock_region();
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        DWORD err = GetLastError();
        _close(fd);
        if (err == ERROR_LOCK_VIOLATION || err == ERROR_SHARING_VIOLATION)
            return LockAttempt::Busy;
        error_ = static_cast<int>(err);
        return LockAttempt::Failed;
    }
    fd_ = fd;
    return LockAttempt::Locked;
}

void FileLock::close() {
    if (fd_ < 0) return;
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = lock_region();
    UnlockFileEx(h, 0, 1, 0, &ov);
    _close(fd_);
    fd_ = -1;
}

Result<void> FileLock::write_contents(const std::string& data) {
    if (fd_ < 0) return Result<void>::Err("lock not held");
    if (_chsize(fd_, 0) != 0 || _lseek(fd_, 0, SEEK_SET) != 0)
        return Result<void>::Err(fmt::format("{}: truncate failed", path_));
    int n = _write(fd_, data.data(), static_cast<unsigned>(data.size()));
    if (n != static_cast<int>(data.size()))
        return Result<void>::Err(fmt::format("{}: short write", path_));
    _commit(fd_);
    return Result<void>::Ok();
}

Result<std::string> FileLock::read_contents() const {
    if (fd_ < 0) return Result<std::string>::Err("lock not held");
    if (_lseek(fd_, 0, SEEK_SET) != 0)
        return Result<std::string>::Err(fmt::format("{}: seek failed", path_));
    std::string out;
    char buf[512];
    int n;
    while ((n = _read(fd_, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
        if (out.size() > RECORD_MAX_BYTES) break;
    }
    if (n < 0) return Result<std::string>::Err(fmt::format("{}: read failed", path_));
    return Result<std::string>::Ok(out);
}

Result<void> FileLock::remove_file() {
    if (fd_ < 0) return Result<void>::Err("lock not held");
    // Windows refuses to delete an open file, so close first
    std::string path = path_;
    close();
    if (!DeleteFileA(path.c_str())) {
        DWORD err = GetLastError();
        if (err == ERROR_FILE_NOT_FOUND) return Result<void>::Ok();
        return Result<void>::Err(fmt::format("{}: {}", path, error_text(static_cast<int>(err))));
    }
    return Result<void>::Ok();
}

bool lock_unsupported(int error_code) {
    return error_code == ERROR_NOT_SUPPORTED || error_code == ERROR_INVALID_FUNCTION;
}

#else // Unix

static int lock_first_byte(int fd) {
#ifdef F_OFD_SETLK
    struct flock fl = {};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 1;
    return fcntl(fd, F_OFD_SETLK, &fl);
#else
    return flock(fd, LOCK_EX | LOCK_NB);
#endif
}

LockAttempt FileLock::try_lock(const std::string& path) {
    close();
    path_ = path;
    error_ = 0;

    for (int attempt = 0; attempt < LOCK_REOPEN_ATTEMPTS; ++attempt) {
        int fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            error_ = errno;
            return LockAttempt::Failed;
        }
        if (lock_first_byte(fd) != 0) {
            int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK || err == EAGAIN || err == EACCES)
                return LockAttempt::Busy;
            error_ = err;
            return LockAttempt::Failed;
        }

        // The previous holder may have unlinked the file between our open()
        // and the lock; then we hold a lock nobody else can see.
        struct stat held_st = {};
        struct stat path_st = {};
        if (fstat(fd, &held_st) == 0 && stat(path.c_str(), &path_st) == 0 &&
            held_st.st_dev == path_st.st_dev && held_st.st_ino == path_st.st_ino) {
            fd_ = fd;
            return LockAttempt::Locked;
        }
        ::close(fd);
    }

    error_ = ESTALE;
    return LockAttempt::Failed;
}

void FileLock::close() {
    if (fd_ < 0) return;
    ::close(fd_);  // releases the lock
    fd_ = -1;
}

Result<void> FileLock::write_contents(const std::string& data) {
    if (fd_ < 0) return Result<void>::Err("lock not held");
    if (ftruncate(fd_, 0) != 0)
        return Result<void>::Err(fmt::format("{}: {}", path_, error_text(errno)));

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = pwrite(fd_, data.data() + written, data.size() - written,
                           static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(fmt::format("{}: {}", path_, error_text(errno)));
        }
        written += static_cast<size_t>(n);
    }
    fsync(fd_);
    return Result<void>::Ok();
}

Result<std::string> FileLock::read_contents() const {
    if (fd_ < 0) return Result<std::string>::Err("lock not held");
    std::string out;
    char buf[512];
    off_t offset = 0;
    for (;;) {
        ssize_t n = pread(fd_, buf, sizeof(buf), offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::string>::Err(fmt::format("{}: {}", path_, error_text(errno)));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
        offset += n;
        if (out.size() > RECORD_MAX_BYTES) break;
    }
    return Result<std::string>::Ok(out);
}

Result<void> FileLock::remove_file() {
    if (fd_ < 0) return Result<void>::Err("lock not held");
    Result<void> result = Result<void>::Ok();
    if (unlink(path_.c_str()) != 0 && errno != ENOENT)
        result = Result<void>::Err(fmt::format("{}: {}", path_, error_text(errno)));
    close();
    return result;
}

bool lock_unsupported(int error_code) {
    return error_code == ENOLCK || error_code == EOPNOTSUPP ||
           error_code == ENOSYS || error_code == EINVAL;
}

#endif

} // namespace platform
