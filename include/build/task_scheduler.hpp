//! # Task Scheduler
//!
//! Turns scanned units into compiled artifacts on a fixed-size worker pool.
//!
//! ## Pipeline
//!
//! ```text
//! units ─dedupe─▶ plan() ── staleness checks on the pool ──▶ Skipped | Pending
//!                 execute() ── Pending tasks on the pool:
//!                     claim path → annotate → write .pyx → compile → record
//! ```
//!
//! | Class            | Description                                    |
//! |------------------|------------------------------------------------|
//! | `BuildTask`      | One unit's state for the current run          |
//! | `BuildReport`    | Aggregated outcome, keyed by path              |
//! | `BuildStats`     | Live atomic counters for progress lines       |
//! | `TaskScheduler`  | Owns the pool for the duration of a run       |
//!
//! ## Invariants
//!
//! - A path is processed by at most one worker: workers claim it in the
//!   in-flight set first, and a second claim is refused.
//! - Each annotated output has one owner, the first unit in path order
//!   that maps to it (a.py before a.pyx). Every other unit mapping there
//!   fails without compiling, whatever the job count.
//! - A fingerprint is recorded only after the compiler exits with 0.
//! - A failing unit never stops the others.

#ifndef CYFORGE_BUILD_TASK_SCHEDULER_HPP
#define CYFORGE_BUILD_TASK_SCHEDULER_HPP

#include "annotate/annotator.hpp"
#include "build/toolchain.hpp"
#include "cache/fingerprint_store.hpp"
#include "common.hpp"
#include "scan/source_unit.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace cyforge::build {

enum class TaskStatus { Pending, Running, Succeeded, Failed, Skipped, Cancelled };

const char* task_status_name(TaskStatus status);

struct BuildTask {
    SourceUnit unit;
    fs::path annotated_path;
    TaskStatus status = TaskStatus::Pending;
    std::string diagnostics;
    cache::StaleReason reason = cache::StaleReason::New;
    std::string content_hash; ///< From the staleness check, if it hashed
    std::string output_owner; ///< Set when another unit owns annotated_path
    int64_t duration_ms = 0;
};

struct BuildReport {
    std::set<std::string> succeeded;
    std::map<std::string, CompileError> failed;
    std::map<std::string, MissingModuleError> missing_modules;
    std::set<std::string> skipped;
    std::set<std::string> cancelled;
    size_t attempted = 0;
    size_t compiler_invocations = 0;
    int64_t elapsed_ms = 0;

    size_t failure_count() const {
        return failed.size() + missing_modules.size();
    }

    bool all_succeeded() const {
        return failure_count() == 0 && cancelled.empty();
    }

    /// Distinct top-level module names from missing_modules.
    std::set<std::string> missing_module_names() const;
};

struct BuildStats {
    std::atomic<int> total{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::atomic<int> skipped{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total = 0;
        completed = 0;
        failed = 0;
        skipped = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

struct SchedulerOptions {
    int jobs = 0;                   ///< 0 = hardware concurrency
    fs::path output_dir;            ///< Root of the annotated / compiled tree
    std::vector<std::string> flags; ///< Passed to every compile
    bool force = false;             ///< Treat every unit as stale
    std::string annotated_extension = ".pyx";
    std::vector<std::string> artifact_extensions = {".so", ".pyd"};
    annotate::AnnotatorOptions annotator;
};

/// Output of the pruning phase: one task per distinct unit path.
struct BuildPlan {
    std::vector<BuildTask> tasks;
    size_t duplicates = 0;
    size_t collisions = 0; ///< Tasks whose annotated output another unit owns

    size_t pending() const;
};

class TaskScheduler {
public:
    TaskScheduler(cache::FingerprintStore& store, Toolchain& toolchain, SchedulerOptions options);

    /// De-duplicates `units`, assigns each annotated output to one unit and
    /// checks each remaining unit's staleness on the pool.
    BuildPlan plan(const std::vector<SourceUnit>& units,
                   const CancellationToken* cancel = nullptr);

    /// Builds every Pending task of `plan`.
    BuildReport execute(BuildPlan plan, const CancellationToken* cancel = nullptr);

    /// plan() followed by execute().
    BuildReport submit(const std::vector<SourceUnit>& units,
                       const CancellationToken* cancel = nullptr);

    /// Tasks of the last execute(), in input order.
    const std::vector<BuildTask>& tasks() const {
        return tasks_;
    }

    const BuildStats& stats() const {
        return stats_;
    }

    /// Adds `key` to the in-flight set. False if it is already there.
    bool try_claim(const std::string& key);

    void release(const std::string& key);

    /// Where the annotated copy of `unit` is written.
    fs::path annotated_path_for(const SourceUnit& unit) const;

private:
    int worker_count(size_t work_items) const;

    void run_task(BuildTask& task, const CancellationToken* cancel, BuildReport& report);

    void finish_failed(BuildTask& task, CompileError error, BuildReport& report);

    /// Newest artifact the compiler produced next to `annotated`, if any.
    std::optional<fs::path> find_artifact(const fs::path& annotated) const;

    cache::FingerprintStore& store_;
    Toolchain& toolchain_;
    SchedulerOptions options_;
    annotate::Annotator annotator_;

    std::vector<BuildTask> tasks_;
    BuildStats stats_;

    std::mutex in_flight_mutex_;
    std::unordered_set<std::string> in_flight_;

    std::mutex report_mutex_;
};

} // namespace cyforge::build

#endif // CYFORGE_BUILD_TASK_SCHEDULER_HPP
