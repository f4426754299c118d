#include "sandbox/sandbox_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "sandbox/process_probe.hpp"
#include "sandbox/test_report.hpp"

namespace arena::sandbox {

using core::errors::ContestError;
using core::errors::ErrorCategory;
using protocol::ExecutionOutcome;

namespace {

enum class StopReason {
    Exited,
    TimedOut,
    MemoryExceeded
};

struct ProcessCapture {
    StopReason reason = StopReason::Exited;
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
    double peak_memory_mb = 0.0;
    double breach_memory_mb = 0.0;
};

// Private directory under the scratch root, removed on every exit path.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::filesystem::path& root) {
        std::string pattern = (root / "arena-sandbox-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) != nullptr) {
            path_ = std::filesystem::path(buffer.data());
        }
    }

    ~ScratchDirectory() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Sandbox: failed to remove " + path_.string() + ": " + ec.message());
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

double kb_to_mb(const std::uint64_t kb) {
    return static_cast<double>(kb) / 1024.0;
}

// SIGTERM the whole group, escalate to SIGKILL after the grace period, and
// reap the leader. Returns the leader's wait status.
int terminate_group(const pid_t pgid, const std::uint32_t grace_ms) {
    static_cast<void>(kill(-pgid, SIGTERM));

    int status = 0;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t waited = waitpid(pgid, &status, WNOHANG);
        if (waited == pgid || (waited < 0 && errno == ECHILD)) {
            // Leader is gone; make sure no descendant outlives it.
            static_cast<void>(kill(-pgid, SIGKILL));
            return status;
        }
        static_cast<void>(poll(nullptr, 0, 5));
    }

    static_cast<void>(kill(-pgid, SIGKILL));
    static_cast<void>(waitpid(pgid, &status, 0));
    return status;
}

bool write_unit(const std::filesystem::path& file, const std::string& code,
                const std::string& harness) {
    std::ofstream out(file);
    if (!out.is_open()) {
        return false;
    }
    // Submission first so the harness can reference its symbols.
    out << code << "\n\n" << harness << "\n";
    return out.good();
}

std::optional<ProcessCapture> run_monitored(const SandboxOptions& options,
                                            const std::filesystem::path& cwd,
                                            const double timeout_seconds,
                                            const std::uint32_t memory_limit_mb,
                                            std::string& launch_error) {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        launch_error = std::string("Failed to create process pipes: ") + std::strerror(errno);
        return std::nullopt;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        launch_error = std::string("Failed to create process pipes: ") + std::strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return std::nullopt;
    }

    // The child may only make async-signal-safe calls, so nothing is built there.
    const std::string exec_failed_message = "exec " + options.interpreter + " failed\n";

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        launch_error = std::string("Failed to fork sandbox process: ") + std::strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Own process group so the whole tree can be signalled at once.
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(close(dev_null));
        }
        execlp(options.interpreter.c_str(), options.interpreter.c_str(),
               options.unit_filename.c_str(), static_cast<char*>(nullptr));
        static_cast<void>(
            write(STDERR_FILENO, exec_failed_message.data(), exec_failed_message.size()));
        _exit(127);
    }

    // Both sides set the group to close the race with the child's setpgid.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool child_exited = false;
    int status = 0;
    const double limit_mb = static_cast<double>(memory_limit_mb);
    const auto timeout = std::chrono::duration<double>(timeout_seconds);
    std::optional<std::chrono::steady_clock::time_point> exited_at;

    while (!child_exited || stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0) {
        if (child_exited) {
            // A process that left the group can keep the pipes open forever.
            if (!exited_at.has_value()) {
                exited_at = std::chrono::steady_clock::now();
            } else if (std::chrono::steady_clock::now() - exited_at.value() >
                       std::chrono::milliseconds(options.kill_grace_ms + 1000)) {
                close_fd(stdout_pipe[0]);
                close_fd(stderr_pipe[0]);
                break;
            }
        }

        if (!child_exited) {
            if (std::chrono::steady_clock::now() - started > timeout) {
                capture.reason = StopReason::TimedOut;
                status = terminate_group(pid, options.kill_grace_ms);
                child_exited = true;
            }
        }

        if (!child_exited) {
            // Empty means the leader finished between polls; waitpid below
            // picks it up as a normal exit.
            const auto rss_kb = group_resident_kb(pid);
            if (rss_kb.has_value()) {
                const double rss_mb = kb_to_mb(rss_kb.value());
                capture.peak_memory_mb = std::max(capture.peak_memory_mb, rss_mb);
                if (rss_mb > limit_mb) {
                    capture.reason = StopReason::MemoryExceeded;
                    capture.breach_memory_mb = rss_mb;
                    status = terminate_group(pid, options.kill_grace_ms);
                    child_exited = true;
                }
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds,
                               static_cast<int>(options.poll_interval_ms)));

        drain_pipe(stdout_pipe[0], capture.stdout_text);
        drain_pipe(stderr_pipe[0], capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                // Orphaned descendants may still hold the pipes open.
                static_cast<void>(kill(-pid, SIGKILL));
            } else if (waited < 0 && errno == ECHILD) {
                child_exited = true;
            }
        }
    }

    capture.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
        capture.exit_code = 128 + capture.term_signal;
    }
    return capture;
}

std::string format_megabytes(const double mb) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", mb);
    return buffer;
}

}  // namespace

std::string format_seconds(const double seconds) {
    const double rounded = static_cast<double>(static_cast<long long>(seconds));
    if (rounded == seconds) {
        return std::to_string(static_cast<long long>(seconds));
    }
    std::ostringstream out;
    out << seconds;
    return out.str();
}

SandboxRunner::SandboxRunner(SandboxOptions options) : options_(std::move(options)) {}

core::errors::Result<ExecutionOutcome> SandboxRunner::execute(
    const std::string& code, const std::string& harness,
    const double timeout_seconds, const std::uint32_t memory_limit_mb) {
    if (used_) {
        return ContestError{ErrorCategory::Sandbox,
                            "Sandbox runner instances execute exactly one submission.",
                            "sandbox_reused",
                            "Create a new SandboxRunner per submission."};
    }
    used_ = true;

    ScratchDirectory scratch(options_.scratch_root);
    if (!scratch.valid()) {
        return protocol::failed_outcome("Failed to create sandbox working directory under " +
                                        options_.scratch_root.string());
    }
    working_directory_ = scratch.path();

    if (!write_unit(scratch.path() / options_.unit_filename, code, harness)) {
        return protocol::failed_outcome("Failed to write sandbox unit file.");
    }

    std::string launch_error;
    const auto capture_result = run_monitored(options_, scratch.path(), timeout_seconds,
                                              memory_limit_mb, launch_error);
    if (!capture_result.has_value()) {
        LOG_ERROR("Sandbox: " + launch_error);
        return protocol::failed_outcome(launch_error);
    }
    const ProcessCapture& capture = capture_result.value();

    ExecutionOutcome outcome;
    outcome.stdout_text = capture.stdout_text;
    outcome.duration_ms = capture.duration_ms;
    outcome.peak_memory_mb = capture.peak_memory_mb;

    if (capture.reason == StopReason::TimedOut) {
        outcome.success = false;
        outcome.error = "Timeout after " + format_seconds(timeout_seconds) + "s";
        outcome.tests_passed = 0;
        outcome.total_tests = 1;
        LOG_DEBUG("Sandbox: " + outcome.error.value());
        return outcome;
    }

    if (capture.reason == StopReason::MemoryExceeded) {
        outcome.success = false;
        outcome.error = "Memory limit exceeded: " + format_megabytes(capture.breach_memory_mb) +
                        "MB > " + std::to_string(memory_limit_mb) + "MB";
        outcome.tests_passed = 0;
        outcome.total_tests = 1;
        LOG_DEBUG("Sandbox: " + outcome.error.value());
        return outcome;
    }

    TestCounts counts = parse_test_report(capture.stdout_text);
    if (!counts.recognized) {
        counts = parse_test_report(capture.stderr_text);
    }
    outcome.tests_passed = counts.passed;
    outcome.total_tests = counts.total;
    outcome.success = capture.exit_code == 0 && counts.passed == counts.total;

    if (!capture.stderr_text.empty()) {
        outcome.error = capture.stderr_text;
    } else if (capture.term_signal != 0) {
        outcome.error = "Process terminated by signal " + std::to_string(capture.term_signal);
    } else if (capture.exit_code != 0) {
        outcome.error = "Process exited with code " + std::to_string(capture.exit_code);
    } else if (!counts.recognized) {
        outcome.error = "No test summary found in harness output.";
    }
    return outcome;
}

}  // namespace arena::sandbox
