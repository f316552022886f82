// Copyright (C) 2025-2026 PrinterPal Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_runner.h"

#include "printerpal_error.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace printerpal {

namespace {

constexpr size_t READ_CHUNK = 4096;
constexpr int KILL_GRACE_MS = 200;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Read whatever is available; returns false on EOF or hard error.
bool drain_fd(int fd, std::string& sink) {
    char buf[READ_CHUNK];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void kill_child(pid_t pid) {
    kill(pid, SIGTERM);
    std::this_thread::sleep_for(std::chrono::milliseconds(KILL_GRACE_MS));
    int status = 0;
    if (waitpid(pid, &status, WNOHANG) == 0) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

} // namespace

std::string CommandResult::command_line() const {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << argv[i];
    }
    return oss.str();
}

CommandResult CommandRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout, bool check) {
    if (argv.empty()) {
        throw PrinterPalException(PrinterPalError::validation("argv must not be empty"));
    }

    CommandResult result;
    result.argv = argv;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;

    spdlog::trace("[CommandRunner] exec: {}", result.command_line());

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // reports execvp errno back to the parent
    // CLOEXEC from creation: children forked by other threads must not inherit these
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw PrinterPalException(
            PrinterPalError::unknown(std::string("pipe2() failed: ") + strerror(saved)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        spdlog::error("[CommandRunner] fork() failed: {}", strerror(saved));
        throw PrinterPalException(
            PrinterPalError::unknown(std::string("fork() failed: ") + strerror(saved)));
    }

    if (pid == 0) {
        // Child: wire stdout/stderr to the pipes, stdin to /dev/null
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            cargv.push_back(const_cast<char*>(a.c_str()));
        }
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // Blocks until execvp succeeds (CLOEXEC closes the pipe) or the child reports errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (exec_errno == ENOENT) {
            spdlog::debug("[CommandRunner] Command not found: {}", argv[0]);
            throw PrinterPalException(PrinterPalError::command_not_found(argv[0]));
        }
        throw PrinterPalException(PrinterPalError::unknown(
            "Failed to execute " + argv[0] + ": " + std::string(strerror(exec_errno))));
    }

    bool timed_out = false;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int rc = poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("[CommandRunner] poll() failed: {}", strerror(errno));
            break;
        }

        if (fds[0].fd >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!drain_fd(fds[0].fd, result.out)) {
                close(fds[0].fd);
                fds[0].fd = -1;
            }
        }
        if (fds[1].fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!drain_fd(fds[1].fd, result.err)) {
                close(fds[1].fd);
                fds[1].fd = -1;
            }
        }
    }

    // Output closed; the child may still be exiting
    int status = 0;
    bool reaped = false;
    while (!timed_out && !reaped) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
        } else if (w < 0 && errno != EINTR) {
            spdlog::error("[CommandRunner] waitpid() failed: {}", strerror(errno));
            break;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
            fd.fd = -1;
        }
    }

    result.duration_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (timed_out) {
        kill_child(pid);
        char msg[64];
        std::snprintf(msg, sizeof(msg), "%.1f", timeout.count() / 1000.0);
        spdlog::warn("[CommandRunner] Timed out after {}s: {}", msg, result.command_line());
        throw PrinterPalException(PrinterPalError::timeout(
            "Command timed out after " + std::string(msg) + "s: " + result.command_line()));
    }

    result.exit_code = reaped ? decode_exit_status(status) : -1;
    spdlog::trace("[CommandRunner] {} exited {} in {:.3f}s", argv[0], result.exit_code,
                  result.duration_s);

    if (check && result.exit_code != 0) {
        throw PrinterPalException(PrinterPalError::command_failed(
            "Command failed (" + std::to_string(result.exit_code) + "): " + result.command_line(),
            result.exit_code, result.err));
    }

    return result;
}

bool CommandRunner::which(const std::string& program) const {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }

    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + program;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace printerpal
