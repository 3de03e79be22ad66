#include "calregress/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 50;

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void close_read() {
        if (read_end >= 0) {
            ::close(read_end);
            read_end = -1;
        }
    }

    void close_write() {
        if (write_end >= 0) {
            ::close(write_end);
            write_end = -1;
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }
};

/// Appends to `buffer`, keeping at most `limit` trailing bytes.
void append_capped(std::string& buffer, const char* data, std::size_t size, std::size_t limit) {
    buffer.append(data, size);
    if (buffer.size() > limit) {
        buffer.erase(0, buffer.size() - limit);
    }
}

/// Reads what is available on `fd`. Returns false on EOF or error.
bool drain_fd(int fd, std::string& buffer, std::size_t limit) {
    std::array<char, 8192> chunk{};
    while (true) {
        const auto got = ::read(fd, chunk.data(), chunk.size());
        if (got > 0) {
            append_capped(buffer, chunk.data(), static_cast<std::size_t>(got), limit);
            return true;
        }
        if (got < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

/// Waits for readable output on the open descriptors for up to `timeout_ms`.
void pump_output(Pipe& out, Pipe& err, calregress::ProcessResult& result, std::size_t limit, int timeout_ms) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out.read_end >= 0) {
        fds[count++] = pollfd{out.read_end, POLLIN, 0};
    }
    if (err.read_end >= 0) {
        fds[count++] = pollfd{err.read_end, POLLIN, 0};
    }
    if (count == 0) {
        return;
    }
    const int ready = ::poll(fds.data(), count, timeout_ms);
    if (ready <= 0) {
        return;
    }
    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }
        const bool is_out = fds[i].fd == out.read_end;
        auto& buffer = is_out ? result.stdout_text : result.stderr_text;
        if (!drain_fd(fds[i].fd, buffer, limit)) {
            (is_out ? out : err).close_read();
        }
    }
}

std::optional<int> try_reap(pid_t pid, bool block) {
    int status = 0;
    while (true) {
        const pid_t r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        if (r == pid) {
            return status;
        }
        if (r < 0 && errno == EINTR) {
            continue;
        }
        return std::nullopt;
    }
}

[[noreturn]] void child_fail(int status_fd) {
    const int err = errno;
    // Best effort: the parent treats a short report as a generic launch failure.
    [[maybe_unused]] const auto written = ::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

}  // namespace

namespace calregress {

const char* to_string(ProcessStatus status) noexcept {
    switch (status) {
        case ProcessStatus::Exited: return "exited";
        case ProcessStatus::Signalled: return "signalled";
        case ProcessStatus::TimedOut: return "timeout";
        case ProcessStatus::Cancelled: return "cancelled";
        case ProcessStatus::LaunchFailed: return "launch-failure";
    }
    return "launch-failure";
}

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken& cancellation) {
    ProcessResult result;
    const auto started = Clock::now();
    const auto finish = [&](ProcessResult& r) -> ProcessResult& {
        r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        return r;
    };

    if (spec.argv.empty()) {
        result.error = "empty command line";
        return finish(result);
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = spec.working_directory.string();

    Pipe out;
    Pipe err;
    Pipe status;
    if (!out.open() || !err.open() || !status.open()) {
        result.error = std::string{"pipe failed: "} + std::strerror(errno);
        return finish(result);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string{"fork failed: "} + std::strerror(errno);
        return finish(result);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        // The harness may block termination signals; the pipeline must not inherit that.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            child_fail(status.write_end);
        }
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0 ||
            ::dup2(out.write_end, STDOUT_FILENO) < 0 || ::dup2(err.write_end, STDERR_FILENO) < 0) {
            child_fail(status.write_end);
        }
        ::execvp(argv[0], argv.data());
        child_fail(status.write_end);
    }

    ::setpgid(pid, pid);
    out.close_write();
    err.close_write();
    status.close_write();

    // The status pipe closes on a successful exec (O_CLOEXEC) or carries errno.
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status.read_end, &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    status.close_read();
    if (got > 0) {
        (void)try_reap(pid, true);
        result.error = spec.argv.front() + ": " + std::strerror(child_errno);
        return finish(result);
    }

    std::optional<ProcessStatus> forced;
    std::optional<int> wait_status;
    Clock::time_point kill_deadline{};
    bool killed = false;

    while (!wait_status) {
        if (out.read_end >= 0 || err.read_end >= 0) {
            pump_output(out, err, result, spec.capture_limit, kPollIntervalMs);
        } else {
            cancellation.wait_for(std::chrono::milliseconds{kPollIntervalMs});
        }

        wait_status = try_reap(pid, false);
        if (wait_status) {
            break;
        }

        const auto now = Clock::now();
        if (!forced) {
            if (cancellation.cancelled()) {
                forced = ProcessStatus::Cancelled;
            } else if (spec.timeout.count() > 0 && now - started >= spec.timeout) {
                forced = ProcessStatus::TimedOut;
            }
            if (forced) {
                ::kill(-pid, SIGTERM);
                kill_deadline = now + spec.grace;
            }
        } else if (!killed && now >= kill_deadline) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    }

    if (forced) {
        // Leftover members of the group must not outlive the case.
        ::kill(-pid, SIGKILL);
    }

    // Collect what is still buffered; descendants holding the pipes are not waited for.
    for (int i = 0; i < 64 && (out.read_end >= 0 || err.read_end >= 0); ++i) {
        const auto before = result.stdout_text.size() + result.stderr_text.size();
        pump_output(out, err, result, spec.capture_limit, 0);
        if (result.stdout_text.size() + result.stderr_text.size() == before) {
            break;
        }
    }

    if (forced) {
        result.status = *forced;
    } else if (WIFEXITED(*wait_status)) {
        result.status = ProcessStatus::Exited;
        result.exit_code = WEXITSTATUS(*wait_status);
    } else if (WIFSIGNALED(*wait_status)) {
        result.status = ProcessStatus::Signalled;
        result.signal = WTERMSIG(*wait_status);
        result.exit_code = 128 + result.signal;
    } else {
        result.status = ProcessStatus::Exited;
        result.exit_code = 1;
    }
    return finish(result);
}

}  // namespace calregress
