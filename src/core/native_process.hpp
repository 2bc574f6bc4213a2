// Copyright (c) 2025 VAM Desktop Live Whisper
// Child process with line-oriented stdin/stdout pipes

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

namespace core {

class NativeProcess {
public:
    NativeProcess() = default;
    ~NativeProcess();

    NativeProcess(const NativeProcess&) = delete;
    NativeProcess& operator=(const NativeProcess&) = delete;

    // Spawns argv[0] (PATH lookup) with piped stdin/stdout; stderr is inherited.
    bool start(const std::vector<std::string>& argv);

    pid_t pid() const { return pid_; }
    bool is_running();

    // Writes line plus '\n'. Returns false if the child closed its stdin.
    bool write_line(const std::string& line);

    // Closes the child's stdin; a child reading lines sees EOF.
    void close_input();

    // Reads up to the next '\n' (stripped). Returns false on EOF, error or timeout.
    bool read_line(std::string& line, std::chrono::milliseconds timeout);

    // SIGTERM, wait up to grace for exit, then SIGKILL and reap.
    // Returns true if the child exited within the grace period.
    bool terminate(std::chrono::milliseconds grace);

    // Exit status from waitpid once the child has been reaped, -1 before.
    int exit_status() const { return exit_status_; }

private:
    bool reap(bool block);
    void close_pipes();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int exit_status_ = -1;
    std::string read_buf_;
};

} // namespace core
