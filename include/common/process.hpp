//! # Child Processes
//!
//! Runs external tools (the compiler, pip, the wheel builder) with their
//! combined stdout and stderr captured, a wall-clock timeout and cooperative
//! cancellation.
//!
//! ## Termination
//!
//! When the timeout expires or the token is cancelled the child receives
//! SIGTERM. If it is still alive after the grace period it receives SIGKILL.

#ifndef CYFORGE_COMMON_PROCESS_HPP
#define CYFORGE_COMMON_PROCESS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cyforge {

/// A flag shared between a signal handler and the workers of a run.
///
/// `cancel()` only stores to a lock-free atomic and may be called from a
/// signal handler.
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        cancelled_.store(false, std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Outcome of run_process().
struct ProcessResult {
    bool launched = false;  ///< fork/exec succeeded
    int exit_code = -1;     ///< Exit status, 128+N when killed by signal N, 127 if exec failed
    std::string output;     ///< stdout and stderr interleaved
    bool timed_out = false; ///< Killed because the timeout expired
    bool cancelled = false; ///< Killed because the token was cancelled
    int64_t duration_ms = 0;
};

struct ProcessOptions {
    std::chrono::seconds timeout{600};           ///< 0 = no limit
    std::chrono::milliseconds grace_period{3000}; ///< SIGTERM → SIGKILL delay
    const CancellationToken* cancel = nullptr;
    std::string working_dir; ///< Empty = inherit
};

/// Runs `argv[0]` (looked up on PATH) with the remaining arguments.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

/// Joins argv into a shell-like display string for log lines.
std::string format_command(const std::vector<std::string>& argv);

} // namespace cyforge

#endif // CYFORGE_COMMON_PROCESS_HPP
