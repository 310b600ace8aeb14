#include "subprocess.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <chrono>
#include <thread>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <sys/stat.h>

extern char** environ;

namespace toolchat {

static bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

std::string resolve_executable(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        if (!is_executable_file(command)) return "";
        return fs::absolute(command).string();
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t colon = path.find(':', start);
        if (colon == std::string::npos) colon = path.size();
        std::string dir = path.substr(start, colon - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + command;
        if (is_executable_file(candidate)) return candidate;
        start = colon + 1;
    }
    return "";
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !reaped_) terminate(0);
    close_pipes();
}

void Subprocess::spawn(const SpawnOptions& opts) {
    if (pid_ > 0) {
        throw std::runtime_error("Process already spawned");
    }
    if (opts.command.empty()) {
        throw std::runtime_error("No command specified");
    }

    std::string exe = resolve_executable(opts.command);
    if (exe.empty()) {
        throw std::runtime_error("Command '" + opts.command + "' not found in PATH");
    }

    // A dead reader must surface as a failed write, not kill the host.
    std::signal(SIGPIPE, SIG_IGN);

    // Everything the child needs is built before fork.
    std::vector<std::string> argv_store;
    argv_store.push_back(opts.command);
    for (auto& a : opts.args) argv_store.push_back(a);
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (opts.env.count(key)) continue;
        env_store.push_back(std::move(entry));
    }
    for (auto& [k, v] : opts.env) env_store.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int pipe_in[2], pipe_out[2], pipe_err[2], pipe_status[2];
    if (pipe2(pipe_in, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe2(pipe_out, O_CLOEXEC) != 0) {
        close(pipe_in[0]); close(pipe_in[1]);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe2(pipe_err, O_CLOEXEC) != 0) {
        close(pipe_in[0]); close(pipe_in[1]);
        close(pipe_out[0]); close(pipe_out[1]);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe2(pipe_status, O_CLOEXEC) != 0) {
        close(pipe_in[0]); close(pipe_in[1]);
        close(pipe_out[0]); close(pipe_out[1]);
        close(pipe_err[0]); close(pipe_err[1]);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {pipe_in[0], pipe_in[1], pipe_out[0], pipe_out[1],
                       pipe_err[0], pipe_err[1], pipe_status[0], pipe_status[1]}) {
            close(fd);
        }
        throw std::runtime_error(std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        dup2(pipe_in[0], STDIN_FILENO);
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(pipe_status[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execve(exe.c_str(), argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = write(pipe_status[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(pipe_in[0]);
    close(pipe_out[1]);
    close(pipe_err[1]);
    close(pipe_status[1]);

    pid_ = pid;
    reaped_ = false;
    exit_code_ = -1;
    stdin_fd_ = pipe_in[1];
    stdout_fd_ = pipe_out[0];
    stderr_fd_ = pipe_err[0];

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(pipe_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(pipe_status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid_, &status, 0);
        reap(status);
        close_pipes();
        std::string what = opts.working_dir.empty() || child_errno != ENOENT
            ? std::strerror(child_errno)
            : std::string(std::strerror(child_errno)) + " (working directory '" + opts.working_dir + "')";
        throw std::runtime_error("Failed to start '" + opts.command + "': " + what);
    }
}

bool Subprocess::write_all(const std::string& data) {
    if (stdin_fd_ < 0) return false;
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + total, data.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

long Subprocess::read_some(int fd, char* buf, size_t len, int timeout_ms) {
    if (fd < 0) return 0;
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret == 0) return -1;
    if (ret < 0) return errno == EINTR ? -1 : 0;

    ssize_t n = read(fd, buf, len);
    if (n > 0) return static_cast<long>(n);
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return -1;
    return 0;
}

std::string Subprocess::read_all_stdout(int timeout_ms, bool* eof) {
    std::string out;
    if (eof) *eof = false;
    char buf[8192];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        long n = read_some(stdout_fd_, buf, sizeof(buf), static_cast<int>(left));
        if (n == 0) {
            if (eof) *eof = true;
            break;
        }
        if (n > 0) out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

void Subprocess::reap(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
}

bool Subprocess::alive() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) reap(status);
    else reaped_ = true;
    return false;
}

bool Subprocess::wait_exit(int timeout_ms) {
    int waited = 0;
    while (alive()) {
        if (waited >= timeout_ms) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        waited += 20;
    }
    return true;
}

void Subprocess::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void Subprocess::terminate(int grace_ms) {
    close_stdin();
    if (pid_ <= 0 || reaped_) return;

    if (alive()) {
        kill(pid_, SIGTERM);
        wait_exit(grace_ms);
    }
    // Force kill if still running
    if (alive()) {
        kill(pid_, SIGKILL);
        int status = 0;
        if (waitpid(pid_, &status, 0) == pid_) reap(status);
        else reaped_ = true;
    }
}

void Subprocess::close_pipes() {
    close_stdin();
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

} // namespace toolchat
