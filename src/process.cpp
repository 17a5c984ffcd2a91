#include "process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace cronreg {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data) {
    if (argv.empty()) {
        throw std::runtime_error("run_process: empty argument list");
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::runtime_error("Failed to create pipes: " + reason);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::runtime_error("Failed to fork process: " + reason);
    }

    if (pid == 0) {
        // Child: wire pipes to stdio and exec
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close(p[0]);
            close(p[1]);
        }
        execvp(c_argv[0], c_argv.data());
        const char* reason = std::strerror(errno);
        ssize_t ignored = write(STDERR_FILENO, c_argv[0], std::strlen(c_argv[0]));
        ignored = write(STDERR_FILENO, ": ", 2);
        ignored = write(STDERR_FILENO, reason, std::strlen(reason));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    // A child that exits before reading its input must not kill us with SIGPIPE
    struct sigaction ignore_pipe {};
    struct sigaction old_pipe {};
    ignore_pipe.sa_handler = SIG_IGN;
    sigemptyset(&ignore_pipe.sa_mask);
    sigaction(SIGPIPE, &ignore_pipe, &old_pipe);

    // stdin is fed in pieces from the same poll loop that drains stdout and
    // stderr, so a child echoing its input cannot fill both pipes at once.
    int in_fd = stdin_pipe[1];
    size_t in_offset = 0;
    if (stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    }

    ProcessResult result;
    std::array<char, 4096> buffer;
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    while (in_fd >= 0 || out_fd >= 0 || err_fd >= 0) {
        std::array<struct pollfd, 3> pfds{};
        pfds[0].fd = out_fd;
        pfds[0].events = POLLIN;
        pfds[1].fd = err_fd;
        pfds[1].events = POLLIN;
        pfds[2].fd = in_fd;
        pfds[2].events = POLLOUT;

        int ret = poll(pfds.data(), pfds.size(), -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (pfds[2].fd >= 0 && pfds[2].revents != 0) {
            size_t chunk = std::min<size_t>(stdin_data.size() - in_offset, 65536);
            ssize_t n = write(in_fd, stdin_data.data() + in_offset, chunk);
            if (n > 0) {
                in_offset += static_cast<size_t>(n);
                if (in_offset == stdin_data.size()) close_fd(in_fd);
            } else if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
                // retry on the next poll round
            } else {
                close_fd(in_fd);  // child closed its stdin; nothing more to deliver
            }
        }

        for (size_t i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            int& fd = i == 0 ? out_fd : err_fd;
            std::string& sink = i == 0 ? result.out : result.err;
            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);  // EOF or error
            }
        }
    }
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    sigaction(SIGPIPE, &old_pipe, nullptr);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace cronreg
