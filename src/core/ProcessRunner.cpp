/**
 * @file ProcessRunner.cpp
 * @brief Implementation of subprocess execution with stream capture
 */

#include "ProcessRunner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace keyforge {

namespace {

/**
 * @brief Owning file descriptor
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

void make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& extra_env) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string var(*entry);
        bool overridden = false;
        for (const auto& [name, value] : extra_env) {
            if (var.compare(0, name.size() + 1, name + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(var);
        }
    }
    for (const auto& [name, value] : extra_env) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (auto& s : strings) {
        result.push_back(s.data());
    }
    result.push_back(nullptr);
    return result;
}

void write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        const ssize_t n = write(fd, data, len);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        data += n;
        len -= static_cast<size_t>(n);
    }
}

/**
 * @brief Decimal errno text for the forked child, which cannot call strerror
 * @return Number of characters written (no terminator)
 */
size_t format_errno(int value, char (&out)[16]) {
    char digits[12];
    size_t count = 0;
    unsigned int magnitude = value < 0 ? 0u - static_cast<unsigned int>(value)
                                       : static_cast<unsigned int>(value);
    do {
        digits[count++] = static_cast<char>('0' + magnitude % 10);
        magnitude /= 10;
    } while (magnitude > 0 && count < sizeof(digits));

    size_t len = 0;
    if (value < 0) {
        out[len++] = '-';
    }
    while (count > 0) {
        out[len++] = digits[--count];
    }
    return len;
}

/**
 * @brief Wait for the child until the deadline, killing it on expiry
 * @return true if the child had to be killed
 */
bool await_exit(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        const pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return false;
        }
        if (rc < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            return true;
        }
        poll(nullptr, 0, 10);
    }
}

// Returns false once the descriptor reached EOF
bool drain(UniqueFd& fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        fd.reset();
        return false;
    }
}

} // namespace

ProcessResult ProcessRunner::run(const ProcessSpec& spec) const {
    if (spec.argv.empty()) {
        throw std::runtime_error("No command given");
    }

    const auto started = std::chrono::steady_clock::now();

    // Everything the child needs is prepared before fork
    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = build_environment(spec.extra_env);
    std::vector<char*> c_args = to_c_array(args);
    std::vector<char*> c_env = to_c_array(env);
    const std::string exec_error_prefix = "Failed to execute " + spec.argv.front() + ": errno ";

    UniqueFd out_read, out_write, err_read, err_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    const pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(err_write.get(), STDERR_FILENO);

        execvpe(c_args[0], c_args.data(), c_env.data());

        // Only async-signal-safe calls past this point
        char errno_text[16];
        const size_t errno_len = format_errno(errno, errno_text);
        write_all(STDERR_FILENO, exec_error_prefix.data(), exec_error_prefix.size());
        write_all(STDERR_FILENO, errno_text, errno_len);
        write_all(STDERR_FILENO, "\n", 1);
        _exit(kExecFailedStatus);
    }

    out_write.reset();
    err_write.reset();

    ProcessResult result;
    const bool has_deadline = spec.timeout.count() > 0;
    const auto deadline = started + spec.timeout;

    while (out_read.valid() || err_read.valid()) {
        int wait_ms = -1;
        if (has_deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_read.valid()) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{out_read.get(), POLLIN, 0};
        }
        if (err_read.valid()) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{err_read.get(), POLLIN, 0};
        }

        const int rc = poll(fds, count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc == 0) continue;

        if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain(out_read, result.stdout_text);
        }
        if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain(err_read, result.stderr_text);
        }
    }

    out_read.reset();
    err_read.reset();

    int status = 0;
    bool reaped = false;
    // The child may close its streams and keep running; the deadline still applies
    if (has_deadline && !result.timed_out) {
        result.timed_out = await_exit(pid, deadline, status);
        reaped = !result.timed_out;
    }
    while (!reaped && waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

} // namespace keyforge
