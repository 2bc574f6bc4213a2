// Copyright (c) 2025 VAM Desktop Live Whisper
// Child process with line-oriented stdin/stdout pipes

#include "core/native_process.hpp"
#include "core/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace core {

namespace {

// Both ends close on exec from the start, so a child spawned concurrently by
// another thread never inherits them.
bool open_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Writing to a closed pipe must not kill the host. Process-wide, set once.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        std::signal(SIGPIPE, SIG_IGN);
        log_debug("[process] SIGPIPE ignored for worker pipes");
    });
}

} // namespace

NativeProcess::~NativeProcess() {
    if (pid_ > 0) {
        terminate(std::chrono::milliseconds(2000));
    }
    close_pipes();
}

bool NativeProcess::start(const std::vector<std::string>& argv) {
    if (pid_ > 0) {
        log_error("[process] already running, pid " + std::to_string(pid_));
        return false;
    }
    if (argv.empty()) {
        log_error("[process] empty command");
        return false;
    }

    ignore_sigpipe();

    int in_pipe[2];
    int out_pipe[2];
    if (!open_pipe(in_pipe)) {
        log_error(std::string("[process] pipe failed: ") + std::strerror(errno));
        return false;
    }
    if (!open_pipe(out_pipe)) {
        log_error(std::string("[process] pipe failed: ") + std::strerror(errno));
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        log_error(std::string("[process] fork failed: ") + std::strerror(errno));
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return false;
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on. dup2 clears
        // close-on-exec on the new stdin/stdout; the pipe ends close at exec.
        if (in_pipe[0] == STDIN_FILENO) fcntl(STDIN_FILENO, F_SETFD, 0);
        else dup2(in_pipe[0], STDIN_FILENO);
        if (out_pipe[1] == STDOUT_FILENO) fcntl(STDOUT_FILENO, F_SETFD, 0);
        else dup2(out_pipe[1], STDOUT_FILENO);
        std::signal(SIGPIPE, SIG_DFL);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    pid_ = pid;
    exit_status_ = -1;
    read_buf_.clear();
    log_debug("[process] started " + argv[0] + " pid " + std::to_string(pid_));
    return true;
}

bool NativeProcess::reap(bool block) {
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
        exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        pid_ = -1;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        pid_ = -1;
        return true;
    }
    return false;
}

bool NativeProcess::is_running() {
    if (pid_ <= 0) return false;
    return !reap(false);
}

bool NativeProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) return false;
    std::string data = line;
    data.push_back('\n');
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(stdin_fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_error(std::string("[process] write failed: ") + std::strerror(errno));
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool NativeProcess::read_line(std::string& line, std::chrono::milliseconds timeout) {
    if (stdout_fd_ < 0) return false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        size_t nl = read_buf_.find('\n');
        if (nl != std::string::npos) {
            line = read_buf_.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            read_buf_.erase(0, nl + 1);
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            log_warn("[process] read timed out after " + std::to_string(timeout.count()) + " ms");
            return false;
        }
        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            log_error(std::string("[process] poll failed: ") + std::strerror(errno));
            return false;
        }
        if (pr == 0) continue;
        char buf[4096];
        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            log_error(std::string("[process] read failed: ") + std::strerror(errno));
            return false;
        }
        if (n == 0) {
            return false; // EOF
        }
        read_buf_.append(buf, static_cast<size_t>(n));
    }
}

bool NativeProcess::terminate(std::chrono::milliseconds grace) {
    close_pipes();
    if (pid_ <= 0) return true;
    const pid_t pid = pid_;
    if (reap(false)) return true;

    ::kill(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            log_debug("[process] pid " + std::to_string(pid) + " exited after SIGTERM");
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    log_warn("[process] pid " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    ::kill(pid, SIGKILL);
    reap(true);
    return false;
}

void NativeProcess::close_input() {
    if (stdin_fd_ >= 0) { ::close(stdin_fd_); stdin_fd_ = -1; }
}

void NativeProcess::close_pipes() {
    close_input();
    if (stdout_fd_ >= 0) { ::close(stdout_fd_); stdout_fd_ = -1; }
}

} // namespace core
