#pragma once
#include <string>
#include <vector>
#include <map>
#include <sys/types.h>

namespace toolchat {

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // overrides on top of the parent environment
    std::string working_dir;
};

// Returns the absolute path of an executable, searching PATH when the
// command has no '/'. Empty when nothing executable is found.
std::string resolve_executable(const std::string& command);

// A child process with stdin/stdout/stderr attached to pipes.
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Throws std::runtime_error with a descriptive message when the command
    // cannot be resolved or the exec fails.
    void spawn(const SpawnOptions& opts);

    bool write_all(const std::string& data);

    // Reads whatever is available on fd within timeout_ms.
    // Returns bytes read, 0 on EOF, -1 when nothing arrived in time.
    static long read_some(int fd, char* buf, size_t len, int timeout_ms);

    // Reads stdout until EOF or until timeout_ms elapses. *eof tells which.
    std::string read_all_stdout(int timeout_ms, bool* eof = nullptr);

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    pid_t pid() const { return pid_; }

    bool alive();
    // Polls for exit for up to timeout_ms; true once the child is reaped.
    bool wait_exit(int timeout_ms);
    int exit_code() const { return exit_code_; }

    void close_stdin();
    // Closes stdin, sends SIGTERM, waits up to grace_ms, then SIGKILL.
    // stdout/stderr stay open so readers can drain them.
    void terminate(int grace_ms);
    void close_pipes();

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void reap(int status);
};

} // namespace toolchat
