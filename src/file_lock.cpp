#include "file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <sys/stat.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

namespace cronreg {

static void ensure_parent_dir(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    if (std::filesystem::exists(parent, ec)) return;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create lock directory " + parent.string() +
                                 ": " + ec.message());
    }
    std::filesystem::permissions(parent, std::filesystem::perms::owner_all, ec);
    if (ec) {
        throw std::runtime_error("Failed to restrict lock directory " + parent.string() +
                                 ": " + ec.message());
    }
}

FileLock::FileLock(std::string path, std::chrono::milliseconds timeout)
    : path_(std::move(path)) {
    ensure_parent_dir(path_);

    fd_ = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd_ < 0) {
        throw std::runtime_error("Failed to open lock file " + path_ + ": " +
                                 std::strerror(errno));
    }

    struct stat st {};
    if (fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode) || st.st_uid != geteuid()) {
        close(fd_);
        fd_ = -1;
        throw std::runtime_error("Lock file " + path_ +
                                 " is not a regular file owned by the current user");
    }

    constexpr auto kRetryInterval = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        if (err == EINTR) continue;
        if (err == EWOULDBLOCK && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kRetryInterval);
            continue;
        }
        close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw LockTimeout("Timed out waiting for lock " + path_ +
                              " (another cronreg run is in progress)");
        }
        throw std::runtime_error("Failed to lock " + path_ + ": " + std::strerror(err));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

} // namespace cronreg
