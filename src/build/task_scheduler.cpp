//! # Task Scheduler
//!
//! ## Worker Loop
//!
//! Both phases share the same shape, adapted from a queue-draining build
//! pool: indices into the task vector go into a `WorkQueue`, N workers pop
//! until the queue is empty, each worker touches only the task it popped.
//! Report maps are written under `report_mutex_`; fingerprints go through
//! the store's own writer lock.
//!
//! ## Cancellation
//!
//! Once the token is set, workers stop starting compiles. Tasks still in
//! the queue are marked Cancelled; running compilers are terminated by
//! `run_process()` (SIGTERM, grace period, SIGKILL).

#include "build/task_scheduler.hpp"

#include "common/content_hash.hpp"
#include "common/work_queue.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <map>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <unordered_map>

namespace cyforge::build {

const char* task_status_name(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Running:
        return "running";
    case TaskStatus::Succeeded:
        return "succeeded";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Skipped:
        return "skipped";
    case TaskStatus::Cancelled:
        return "cancelled";
    }
    return "?";
}

std::set<std::string> BuildReport::missing_module_names() const {
    std::set<std::string> names;
    for (const auto& [_, err] : missing_modules) {
        auto top = err.module_name.substr(0, err.module_name.find('.'));
        if (!top.empty() && top != "<unknown>")
            names.insert(top);
    }
    return names;
}

size_t BuildPlan::pending() const {
    return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(), [](const BuildTask& t) {
        return t.status == TaskStatus::Pending;
    }));
}

TaskScheduler::TaskScheduler(cache::FingerprintStore& store, Toolchain& toolchain,
                             SchedulerOptions options)
    : store_(store), toolchain_(toolchain), options_(std::move(options)),
      annotator_(options_.annotator) {}

int TaskScheduler::worker_count(size_t work_items) const {
    int n = options_.jobs > 0 ? options_.jobs
                              : static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0)
        n = 4;
    return std::max(1, std::min(n, static_cast<int>(work_items)));
}

fs::path TaskScheduler::annotated_path_for(const SourceUnit& unit) const {
    fs::path rel(unit.relative_path);
    fs::path out = options_.output_dir / rel.parent_path();
    return out / (rel.stem().string() + options_.annotated_extension);
}

// ============================================================================
// In-Flight Claims
// ============================================================================

bool TaskScheduler::try_claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(key).second;
}

void TaskScheduler::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(key);
}

// ============================================================================
// Pruning
// ============================================================================

BuildPlan TaskScheduler::plan(const std::vector<SourceUnit>& units,
                              const CancellationToken* cancel) {
    BuildPlan plan;
    plan.tasks.reserve(units.size());

    std::unordered_set<std::string> seen;
    for (const auto& unit : units) {
        if (!seen.insert(unit.relative_path).second) {
            ++plan.duplicates;
            continue;
        }
        BuildTask task;
        task.unit = unit;
        task.annotated_path = annotated_path_for(unit);
        plan.tasks.push_back(std::move(task));
    }
    if (plan.duplicates > 0) {
        CYFORGE_LOG_DEBUG("build", "Dropped " << plan.duplicates << " duplicate units");
    }

    std::map<fs::path, size_t> owners;
    for (size_t i = 0; i < plan.tasks.size(); ++i) {
        auto [it, inserted] = owners.emplace(plan.tasks[i].annotated_path, i);
        if (inserted)
            continue;
        auto& owner = plan.tasks[it->second];
        auto& task = plan.tasks[i];
        if (task.unit.relative_path < owner.unit.relative_path) {
            owner.output_owner = task.unit.relative_path;
            it->second = i;
        } else {
            task.output_owner = owner.unit.relative_path;
        }
    }
    for (auto& task : plan.tasks) {
        if (task.output_owner.empty())
            continue;
        // Whatever an earlier run recorded for it describes the owner's artifact
        store_.erase(task.unit.relative_path);
        ++plan.collisions;
    }

    if (options_.force) {
        for (auto& task : plan.tasks)
            task.reason = cache::StaleReason::New;
        return plan;
    }

    WorkQueue<size_t> queue;
    for (size_t i = 0; i < plan.tasks.size(); ++i) {
        queue.push(i);
    }

    auto worker = [&](int slot) {
        log::ScopedWorkerSlot tag(slot);
        while (auto index = queue.pop(0)) {
            auto& task = plan.tasks[*index];
            if (cancel && cancel->is_cancelled())
                continue;
            if (!task.output_owner.empty())
                continue;
            auto check = store_.check(task.unit);
            task.reason = check.reason;
            task.content_hash = std::move(check.content_hash);
            if (!check.stale) {
                task.status = TaskStatus::Skipped;
                CYFORGE_LOG_TRACE("build", "Up to date: " << task.unit.relative_path);
            } else {
                CYFORGE_LOG_DEBUG("build", "Stale (" << cache::stale_reason_name(check.reason)
                                                     << "): " << task.unit.relative_path);
            }
        }
    };

    int n = worker_count(plan.tasks.size());
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        workers.emplace_back(worker, i);
    }
    for (auto& t : workers) {
        t.join();
    }

    return plan;
}

// ============================================================================
// Building
// ============================================================================

BuildReport TaskScheduler::execute(BuildPlan plan, const CancellationToken* cancel) {
    tasks_ = std::move(plan.tasks);
    BuildReport report;
    stats_.reset();

    std::vector<size_t> collided;
    WorkQueue<size_t> queue;
    for (size_t i = 0; i < tasks_.size(); ++i) {
        auto& task = tasks_[i];
        if (!task.output_owner.empty()) {
            collided.push_back(i);
            stats_.total++;
        } else if (task.status == TaskStatus::Skipped) {
            report.skipped.insert(task.unit.relative_path);
            stats_.skipped++;
        } else if (task.status == TaskStatus::Pending) {
            queue.push(i);
            stats_.total++;
        }
    }

    if (stats_.total > 0) {
        CYFORGE_LOG_INFO("build", "Compiling " << stats_.total << " units ("
                                               << report.skipped.size() << " up to date)");
    }

    for (size_t i : collided) {
        auto& task = tasks_[i];
        report.attempted++;
        finish_failed(task,
                      CompileError{task.unit.relative_path, -1,
                                   "annotated output " + task.annotated_path.string() +
                                       " belongs to " + task.output_owner +
                                       "; rename one of the two sources"},
                      report);
    }

    auto worker = [&](int slot) {
        log::ScopedWorkerSlot tag(slot);
        while (auto index = queue.pop(0)) {
            auto& task = tasks_[*index];

            if (cancel && cancel->is_cancelled()) {
                task.status = TaskStatus::Cancelled;
                std::lock_guard<std::mutex> lock(report_mutex_);
                report.cancelled.insert(task.unit.relative_path);
                continue;
            }

            if (!try_claim(task.unit.relative_path)) {
                CYFORGE_LOG_WARN("build", task.unit.relative_path
                                              << " is already being built; not claiming it twice");
                continue;
            }
            run_task(task, cancel, report);
            release(task.unit.relative_path);
        }
    };

    int n = worker_count(static_cast<size_t>(stats_.total.load()));
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        workers.emplace_back(worker, i);
    }
    for (auto& t : workers) {
        t.join();
    }

    report.elapsed_ms = stats_.elapsed_ms();
    return report;
}

BuildReport TaskScheduler::submit(const std::vector<SourceUnit>& units,
                                  const CancellationToken* cancel) {
    return execute(plan(units, cancel), cancel);
}

void TaskScheduler::finish_failed(BuildTask& task, CompileError error, BuildReport& report) {
    task.status = TaskStatus::Failed;
    task.diagnostics = error.diagnostics;
    int done = ++stats_.completed;
    stats_.failed++;

    auto module = detect_missing_module(error.diagnostics);

    std::lock_guard<std::mutex> lock(report_mutex_);
    if (module && error.exit_code != -1) {
        CYFORGE_LOG_ERROR("build", "[" << done << "/" << stats_.total << "] "
                                       << task.unit.relative_path << ": missing module '"
                                       << *module << "'");
        MissingModuleError missing{std::move(error), *module};
        report.missing_modules.emplace(task.unit.relative_path, std::move(missing));
    } else {
        CYFORGE_LOG_ERROR("build", "[" << done << "/" << stats_.total << "] "
                                       << task.unit.relative_path << " failed (exit "
                                       << error.exit_code << ")");
        report.failed.emplace(task.unit.relative_path, std::move(error));
    }
}

void TaskScheduler::run_task(BuildTask& task, const CancellationToken* cancel,
                             BuildReport& report) {
    auto start = std::chrono::steady_clock::now();
    const auto& rel = task.unit.relative_path;
    task.status = TaskStatus::Running;

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        report.attempted++;
    }

    bool compiled = false;
    auto outcome = [&]() -> std::optional<CompileError> {
        try {
            if (task.content_hash.empty()) {
                auto hashed = hash_file(task.unit.absolute_path);
                if (is_err(hashed))
                    return CompileError{rel, -1, unwrap_err(hashed).message};
                task.content_hash = std::move(unwrap(hashed));
            }

            auto annotated = annotator_.annotate_unit(task.unit);
            if (is_err(annotated))
                return CompileError{rel, -1, unwrap_err(annotated)};

            std::error_code ec;
            fs::create_directories(task.annotated_path.parent_path(), ec);
            if (ec)
                return CompileError{rel, -1, "cannot create " +
                                                 task.annotated_path.parent_path().string() +
                                                 ": " + ec.message()};

            fs::path tmp = task.annotated_path;
            tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(log::current_worker());
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                out << unwrap(annotated).text;
                if (!out.flush())
                    return CompileError{rel, -1, "cannot write " + tmp.string()};
            }
            fs::rename(tmp, task.annotated_path, ec);
            if (ec) {
                std::error_code rm_ec;
                fs::remove(tmp, rm_ec);
                return CompileError{rel, -1, "cannot write " + task.annotated_path.string() +
                                                 ": " + ec.message()};
            }

            if (cancel && cancel->is_cancelled())
                return std::nullopt;

            CompileRequest request{task.annotated_path, task.annotated_path.parent_path(),
                                   options_.flags};
            {
                std::lock_guard<std::mutex> lock(report_mutex_);
                report.compiler_invocations++;
            }
            auto result = toolchain_.compile(request, cancel);
            task.diagnostics = result.output;
            if (result.exit_code != 0)
                return CompileError{rel, result.exit_code, result.output};
            compiled = true;
            return std::nullopt;
        } catch (const std::exception& e) {
            return CompileError{rel, -1, std::string("toolchain error: ") + e.what()};
        }
    }();

    task.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

    if (cancel && cancel->is_cancelled() && !compiled) {
        task.status = TaskStatus::Cancelled;
        std::lock_guard<std::mutex> lock(report_mutex_);
        report.cancelled.insert(rel);
        return;
    }

    if (outcome) {
        finish_failed(task, std::move(*outcome), report);
        return;
    }

    std::string output_rel;
    uint64_t output_size = 0;
    if (auto artifact = find_artifact(task.annotated_path)) {
        std::error_code ec;
        output_rel = fs::relative(*artifact, options_.output_dir, ec).generic_string();
        if (ec)
            output_rel.clear();
        output_size = fs::file_size(*artifact, ec);
        if (ec)
            output_size = 0;
    }

    store_.record(task.unit, store_.make_fingerprint(task.unit, task.content_hash, output_rel,
                                                     output_size));

    task.status = TaskStatus::Succeeded;
    int done = ++stats_.completed;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        report.succeeded.insert(rel);
    }
    CYFORGE_LOG_INFO("build", "[" << done << "/" << stats_.total << "] " << rel << " ("
                                  << task.duration_ms << " ms)");
}

std::optional<fs::path> TaskScheduler::find_artifact(const fs::path& annotated) const {
    std::error_code ec;
    fs::path dir = annotated.parent_path();
    std::string prefix = annotated.stem().string() + ".";

    std::optional<fs::path> newest;
    fs::file_time_type newest_time{};
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        auto name = p.filename().string();
        auto ext = p.extension().string();
        if (!name.starts_with(prefix))
            continue;
        if (std::find(options_.artifact_extensions.begin(), options_.artifact_extensions.end(),
                      ext) == options_.artifact_extensions.end())
            continue;
        std::error_code t_ec;
        auto t = fs::last_write_time(p, t_ec);
        if (!t_ec && (!newest || t > newest_time)) {
            newest = p;
            newest_time = t;
        }
    }
    return newest;
}

} // namespace cyforge::build
