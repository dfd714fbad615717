//! # Child Processes
//!
//! fork/execvp with one pipe for stdout and stderr. The parent polls the
//! child with WNOHANG and drains the pipe while it runs, so a chatty
//! compiler can never block on a full pipe buffer.

#include "common/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cyforge {

namespace {

using Clock = std::chrono::steady_clock;

void drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

/// SIGTERM to the child's process group, wait up to `grace`, then SIGKILL.
/// Returns the reaped status.
int terminate(pid_t pid, std::chrono::milliseconds grace, int read_fd, std::string& out) {
    kill(-pid, SIGTERM);
    auto deadline = Clock::now() + grace;
    int status = 0;
    while (Clock::now() < deadline) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid)
            return status;
        drain(read_fd, out);
        usleep(5000);
    }
    kill(-pid, SIGKILL);
    waitpid(pid, &status, 0);
    return status;
}

} // namespace

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty())
            out += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    auto start = Clock::now();
    ProcessResult result;

    if (argv.empty()) {
        result.output = "empty command line";
        return result;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.output = std::string("failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    // The child must not allocate after fork(): build its argv here.
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);
    std::string working_dir_str = options.working_dir;
    const char* working_dir = working_dir_str.empty() ? nullptr : working_dir_str.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        result.output = std::string("failed to fork: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        // Own process group: terminal signals reach the parent only.
        setpgid(0, 0);

        if (working_dir && chdir(working_dir) != 0) {
            _exit(126);
        }

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    // Also set in the parent so the group exists before any kill below
    setpgid(pid, pid);
    result.launched = true;
    close(out_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);

    bool has_deadline = options.timeout.count() > 0;
    auto deadline = start + options.timeout;

    int status = 0;
    bool finished = false;

    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            finished = true;
            break;
        }
        if (options.cancel && options.cancel->is_cancelled()) {
            result.cancelled = true;
            break;
        }
        if (has_deadline && Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{out_pipe[0], POLLIN, 0};
        if (poll(&pfd, 1, 10) > 0) {
            drain(out_pipe[0], result.output);
        }
    }

    if (!finished) {
        CYFORGE_LOG_DEBUG("process", "Terminating " << argv[0] << " (pid " << pid << ")");
        status = terminate(pid, options.grace_period, out_pipe[0], result.output);
    }

    // Non-blocking: a background grandchild may still hold the write end.
    drain(out_pipe[0], result.output);
    close(out_pipe[0]);

    result.exit_code = decode_status(status);
    if (!finished) {
        result.exit_code = -1;
        result.output += result.timed_out
                             ? "\n[cyforge] killed after " +
                                   std::to_string(options.timeout.count()) + "s timeout\n"
                             : std::string("\n[cyforge] cancelled\n");
    }

    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    return result;
}

} // namespace cyforge
