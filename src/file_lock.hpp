#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace cronreg {

// Another process held the lock for longer than the allowed wait
class LockTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Exclusive flock(2) on a lock file, held for the lifetime of the object.
// The parent directory is created (mode 0700) if missing. The lock file must
// be a regular file owned by the caller; symlinks are refused. If the lock
// is still taken after `timeout`, LockTimeout is thrown. The file itself is
// left in place.
class FileLock {
public:
    FileLock(std::string path, std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace cronreg
