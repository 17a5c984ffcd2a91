#include "crontab.hpp"
#include "process.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <utility>

namespace cronreg {

namespace {

// mkstemp-backed file, removed when the guard goes out of scope
class TempFile {
public:
    TempFile(const std::string& dir, const std::string& contents) {
        std::string tmpl = join_path(dir, "cronreg-XXXXXX");
        int fd = mkstemp(tmpl.data());
        if (fd < 0) {
            throw std::runtime_error("Failed to create temporary file in " + dir +
                                     ": " + std::strerror(errno));
        }
        path_ = tmpl;

        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                std::string reason = std::strerror(errno);
                close(fd);
                unlink(path_.c_str());
                throw std::runtime_error("Failed to write temporary file " + path_ +
                                         ": " + reason);
            }
            written += static_cast<size_t>(n);
        }
        if (close(fd) != 0) {
            std::string reason = std::strerror(errno);
            unlink(path_.c_str());
            throw std::runtime_error("Failed to close temporary file " + path_ +
                                     ": " + reason);
        }
    }

    ~TempFile() { unlink(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string describe_failure(const std::string& what, const ProcessResult& r) {
    std::string msg = what;
    if (r.signaled) {
        msg += " (killed by signal " + std::to_string(r.exit_code - 128) + ")";
    } else {
        msg += " (exit status " + std::to_string(r.exit_code) + ")";
    }
    std::string detail = trim(r.err);
    if (!detail.empty()) msg += ": " + detail;
    return msg;
}

} // namespace

SystemCrontab::SystemCrontab(std::string command, std::string temp_dir)
    : command_(std::move(command)), temp_dir_(std::move(temp_dir)) {
    if (temp_dir_.empty()) {
        temp_dir_ = std::filesystem::temp_directory_path().string();
    }
}

std::string SystemCrontab::read() {
    ProcessResult r = run_process({command_, "-l"});
    if (r.success()) return r.out;

    // Vixie/cronie/busybox all report an absent table this way
    if (!r.signaled && r.exit_code != 127 &&
        r.err.find("no crontab for") != std::string::npos) {
        return {};
    }
    if (r.exit_code == 127) {
        throw CrontabError(describe_failure("Scheduler tool '" + command_ + "' is not available", r));
    }
    throw CrontabError(describe_failure("'" + command_ + " -l' failed", r));
}

void SystemCrontab::write(const std::string& contents) {
    TempFile file(temp_dir_, contents);
    ProcessResult r = run_process({command_, file.path()});
    if (!r.success()) {
        if (r.exit_code == 127) {
            throw CrontabError(describe_failure("Scheduler tool '" + command_ + "' is not available", r));
        }
        throw CrontabError(describe_failure("Installing crontab with '" + command_ + "' failed", r));
    }
}

} // namespace cronreg
