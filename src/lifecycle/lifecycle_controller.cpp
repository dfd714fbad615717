//! # Lifecycle Controller
//!
//! ## Build Run
//!
//! 1. Load and compile the exclusion rules (a bad rule fails from Idle)
//! 2. Scan the target, skipping the output and cache directories
//! 3. Load the store and split units into fresh and stale
//! 4. Check the stale units' imports; optionally install what is missing
//! 5. Build the stale units; optionally install missing modules and retry
//! 6. Flush the store, even after cancellation
//! 7. Report, then package and install when requested
//!
//! ## Clean Run
//!
//! Walks the target without following symlinks. Only artifact files and
//! artifact directories are removed; sources and the root never are.

#include "lifecycle/lifecycle_controller.hpp"

#include "cache/fingerprint_store.hpp"
#include "log/log.hpp"
#include "matcher/path_matcher.hpp"
#include "scan/scanner.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace cyforge::lifecycle {

const char* state_name(State state) {
    switch (state) {
    case State::Idle:
        return "Idle";
    case State::Scanning:
        return "Scanning";
    case State::Pruning:
        return "Pruning";
    case State::Building:
        return "Building";
    case State::Reporting:
        return "Reporting";
    case State::Done:
        return "Done";
    case State::Failed:
        return "Failed";
    case State::Packaging:
        return "Packaging";
    case State::Installing:
        return "Installing";
    case State::Cleaning:
        return "Cleaning";
    }
    return "?";
}

bool is_valid_transition(State from, State to) {
    switch (from) {
    case State::Idle:
        return to == State::Scanning || to == State::Cleaning || to == State::Failed;
    case State::Scanning:
        return to == State::Pruning || to == State::Reporting;
    case State::Pruning:
        return to == State::Building || to == State::Reporting;
    case State::Building:
        return to == State::Reporting;
    case State::Reporting:
        return to == State::Done || to == State::Failed;
    case State::Done:
        return to == State::Packaging;
    case State::Packaging:
        return to == State::Installing || to == State::Failed;
    case State::Installing:
        return to == State::Done || to == State::Failed;
    case State::Cleaning:
        return to == State::Done || to == State::Failed;
    case State::Failed:
        return false;
    }
    return false;
}

LifecycleController::LifecycleController(config::BuildConfig config, build::Toolchain& toolchain,
                                         build::PackageTools& tools, ControllerOptions options)
    : config_(std::move(config)), toolchain_(toolchain), tools_(tools),
      options_(std::move(options)) {
    std::error_code ec;
    auto absolute = fs::absolute(config_.target, ec);
    if (!ec)
        config_.target = absolute.lexically_normal();
}

void LifecycleController::transition(State next) {
    if (!is_valid_transition(state_, next)) {
        throw std::logic_error(std::string("invalid lifecycle transition ") + state_name(state_) +
                               " -> " + state_name(next));
    }
    CYFORGE_LOG_DEBUG("lifecycle", state_name(state_) << " -> " << state_name(next));
    state_ = next;
    history_.push_back(next);
}

RunOutcome LifecycleController::fail(RunOutcome outcome, std::string error) {
    CYFORGE_LOG_ERROR("lifecycle", error);
    transition(State::Failed);
    outcome.state = State::Failed;
    outcome.error = std::move(error);
    if (outcome.exit_code == EXIT_OK)
        outcome.exit_code = EXIT_FAILED;
    return outcome;
}

std::string LifecycleController::relative_to_target(const fs::path& dir) const {
    auto rel = dir.lexically_normal().lexically_relative(config_.target);
    auto text = rel.generic_string();
    if (rel.empty() || text == "." || text.starts_with(".."))
        return {};
    while (!text.empty() && text.back() == '/')
        text.pop_back();
    return text;
}

// ============================================================================
// Build
// ============================================================================

RunOutcome LifecycleController::run_build(const CancellationToken* cancel) {
    RunOutcome outcome;
    auto cancelled = [cancel] { return cancel && cancel->is_cancelled(); };

    auto rules = matcher::load_exclusion_rules(config_.target, config_.exclude_file);
    auto compiled = matcher::PathMatcher::compile(rules);
    if (is_err(compiled)) {
        const auto& e = unwrap_err(compiled);
        std::ostringstream msg;
        msg << config_.exclude_file;
        if (e.line > 0)
            msg << ":" << e.line;
        msg << ": invalid pattern '" << e.raw << "': " << e.message;
        outcome.exit_code = EXIT_USAGE;
        return fail(std::move(outcome), msg.str());
    }
    const auto& matcher = unwrap(compiled);

    // Scanning
    transition(State::Scanning);
    scan::ScanOptions scan_options;
    scan_options.extensions = config_.extensions;
    scan_options.jobs = config_.resolved_jobs();
    for (const auto& dir : {config_.output_dir(), config_.cache_path().parent_path()}) {
        auto rel = relative_to_target(dir);
        if (!rel.empty())
            scan_options.skip_dirs.push_back(rel);
    }

    auto scanned = scan::Scanner(scan_options).scan(config_.target, matcher);
    outcome.warnings = scanned.warnings;
    outcome.units_found = scanned.units.size();

    if (scanned.root_missing) {
        transition(State::Reporting);
        return fail(std::move(outcome),
                    "target directory " + config_.target.string() + " does not exist");
    }

    build::BuildReport report;
    if (!cancelled()) {
        // Pruning
        transition(State::Pruning);
        auto store = cache::FingerprintStore::load(
            config_.cache_path(), build::toolchain_tag(toolchain_, config_.toolchain.flags));
        store.set_artifact_root(config_.output_dir());

        build::SchedulerOptions sched_options;
        sched_options.jobs = config_.resolved_jobs();
        sched_options.output_dir = config_.output_dir();
        sched_options.flags = config_.toolchain.flags;
        sched_options.force = !config_.use_cache;
        sched_options.artifact_extensions = config_.clean.artifact_extensions;
        build::TaskScheduler scheduler(store, toolchain_, sched_options);

        auto plan = scheduler.plan(scanned.units, cancel);
        size_t pending = plan.pending();
        CYFORGE_LOG_INFO("lifecycle", (plan.tasks.size() - pending)
                                          << " up to date, " << pending << " to build");

        std::set<std::string> install_attempted;
        if (config_.install.check_imports && pending > 0 && !cancelled())
            check_imports(plan, scanned.units, outcome, install_attempted);

        if (!cancelled()) {
            // Building
            transition(State::Building);
            report = scheduler.execute(std::move(plan), cancel);

            if (config_.install.auto_install_missing && !report.missing_modules.empty() &&
                !cancelled()) {
                remediate_missing_modules(scheduler, scanned.units, report, install_attempted,
                                          cancel);
            }
        } else {
            for (const auto& task : plan.tasks) {
                if (task.status == build::TaskStatus::Skipped)
                    report.skipped.insert(task.unit.relative_path);
                else
                    report.cancelled.insert(task.unit.relative_path);
            }
        }

        auto flushed = store.flush();
        if (is_err(flushed)) {
            CYFORGE_LOG_WARN("cache", "Could not save fingerprints: "
                                          << unwrap_err(flushed).message);
        }
    }

    // Reporting
    transition(State::Reporting);
    outcome.report = std::move(report);
    const auto& r = outcome.report;

    if (cancelled()) {
        CYFORGE_LOG_WARN("lifecycle", "Build cancelled: " << r.succeeded.size() << " built, "
                                                          << r.cancelled.size()
                                                          << " not finished");
    }

    if (r.succeeded.empty() && r.attempted > 0) {
        return fail(std::move(outcome), "no unit compiled successfully");
    }

    transition(State::Done);
    outcome.state = State::Done;
    outcome.exit_code = (r.failure_count() > 0 || cancelled()) ? EXIT_FAILED : EXIT_OK;

    if (options_.install) {
        if (cancelled()) {
            CYFORGE_LOG_WARN("lifecycle", "Skipping package and install after cancellation");
        } else {
            fs::path project = options_.project_dir;
            if (project.empty()) {
                std::error_code ec;
                project = fs::current_path(ec);
            }
            package_and_install(outcome, project);
        }
    }
    return outcome;
}

void LifecycleController::check_imports(const build::BuildPlan& plan,
                                        const std::vector<SourceUnit>& units,
                                        RunOutcome& outcome, std::set<std::string>& attempted) {
    // Modules of the project itself resolve once it is built or installed
    std::set<std::string> local;
    for (const auto& unit : units) {
        fs::path rel(unit.relative_path);
        for (auto it = rel.begin(); it != rel.end(); ++it) {
            local.insert(std::next(it) == rel.end() ? it->stem().string() : it->string());
        }
    }

    std::set<std::string> imported;
    for (const auto& task : plan.tasks) {
        if (task.status != build::TaskStatus::Pending || !task.output_owner.empty())
            continue;
        std::ifstream in(task.unit.absolute_path, std::ios::binary);
        if (!in)
            continue;
        std::ostringstream text;
        text << in.rdbuf();
        for (auto& name : build::scan_imports(text.str())) {
            if (!local.count(name))
                imported.insert(std::move(name));
        }
    }
    if (imported.empty())
        return;

    auto lookup = tools_.find_missing_modules(imported);
    if (is_err(lookup)) {
        CYFORGE_LOG_WARN("install", "Skipping import check: " << unwrap_err(lookup));
        return;
    }
    auto missing = std::move(unwrap(lookup));
    if (missing.empty()) {
        CYFORGE_LOG_DEBUG("install", "All " << imported.size() << " imported modules resolve");
        return;
    }

    std::string list;
    for (const auto& name : missing)
        list += (list.empty() ? "" : ", ") + name;
    CYFORGE_LOG_WARN("install", "Missing modules detected: " << list);

    if (config_.install.auto_install_missing) {
        for (const auto& name : install_modules(missing, attempted))
            missing.erase(name);
    }
    outcome.missing_imports = std::move(missing);
}

std::set<std::string> LifecycleController::install_modules(const std::set<std::string>& names,
                                                           std::set<std::string>& attempted) {
    std::set<std::string> installed;
    for (const auto& name : names) {
        if (!attempted.insert(name).second)
            continue;
        auto result = tools_.install_module(name);
        if (is_ok(result)) {
            installed.insert(name);
        } else {
            CYFORGE_LOG_WARN("install", unwrap_err(result));
        }
    }
    return installed;
}

void LifecycleController::remediate_missing_modules(build::TaskScheduler& scheduler,
                                                    const std::vector<SourceUnit>& units,
                                                    build::BuildReport& report,
                                                    std::set<std::string>& attempted,
                                                    const CancellationToken* cancel) {
    auto installed = install_modules(report.missing_module_names(), attempted);
    if (installed.empty())
        return;

    std::vector<SourceUnit> retry;
    for (auto it = report.missing_modules.begin(); it != report.missing_modules.end();) {
        const auto& module = it->second.module_name;
        auto top = module.substr(0, module.find('.'));
        auto unit = std::find_if(units.begin(), units.end(), [&](const SourceUnit& u) {
            return u.relative_path == it->first;
        });
        if (installed.count(top) && unit != units.end()) {
            retry.push_back(*unit);
            it = report.missing_modules.erase(it);
        } else {
            ++it;
        }
    }

    CYFORGE_LOG_INFO("lifecycle", "Retrying " << retry.size() << " units after installing "
                                              << installed.size() << " modules");
    auto again = scheduler.submit(retry, cancel);

    report.succeeded.insert(again.succeeded.begin(), again.succeeded.end());
    report.cancelled.insert(again.cancelled.begin(), again.cancelled.end());
    for (auto& [path, err] : again.failed)
        report.failed.insert_or_assign(path, std::move(err));
    for (auto& [path, err] : again.missing_modules)
        report.missing_modules.insert_or_assign(path, std::move(err));
    report.attempted += again.attempted;
    report.compiler_invocations += again.compiler_invocations;
    report.elapsed_ms += again.elapsed_ms;
}

void LifecycleController::package_and_install(RunOutcome& outcome, const fs::path& project_dir) {
    if (outcome.report.failure_count() > 0) {
        CYFORGE_LOG_WARN("lifecycle", "Packaging although " << outcome.report.failure_count()
                                                            << " units failed");
    }

    transition(State::Packaging);
    auto wheel = tools_.build_wheel(project_dir);
    if (is_err(wheel)) {
        outcome = fail(std::move(outcome), unwrap_err(wheel));
        return;
    }
    outcome.wheel = unwrap(wheel);

    transition(State::Installing);
    auto installed = tools_.install_wheel(outcome.wheel);
    if (is_err(installed)) {
        outcome = fail(std::move(outcome), unwrap_err(installed));
        return;
    }

    transition(State::Done);
    outcome.state = State::Done;
    CYFORGE_LOG_INFO("lifecycle", "Installed " << outcome.wheel.filename().string());
}

// ============================================================================
// Library Mode
// ============================================================================

RunOutcome LifecycleController::run_library(const std::string& name, const fs::path& work_dir,
                                            const CancellationToken* cancel) {
    auto located = tools_.locate_library(name);
    if (is_err(located)) {
        return fail(RunOutcome{}, unwrap_err(located));
    }
    const fs::path& source = unwrap(located);

    fs::path tmp = work_dir / ".cyforge_tmp" / name;
    std::error_code ec;
    fs::remove_all(tmp, ec);
    fs::create_directories(tmp, ec);
    if (!ec) {
        CYFORGE_LOG_INFO("lifecycle", "Copying " << name << " from " << source.string());
        fs::copy(source, tmp, fs::copy_options::recursive | fs::copy_options::overwrite_existing,
                 ec);
    }
    if (ec) {
        fs::remove_all(tmp, ec);
        return fail(RunOutcome{}, "cannot copy " + source.string() + " to " + tmp.string() + ": " +
                                      ec.message());
    }

    config_.target = tmp;
    config_.output = "build";
    options_.install = true;
    options_.project_dir = tmp;

    auto outcome = run_build(cancel);

    std::error_code rm_ec;
    fs::remove_all(tmp, rm_ec);
    if (rm_ec) {
        CYFORGE_LOG_WARN("lifecycle", "Could not remove " << tmp.string() << ": "
                                                          << rm_ec.message());
    } else {
        // Leave work_dir as it was when this was the only library
        fs::remove(tmp.parent_path(), rm_ec);
    }

    if (outcome.state == State::Done && outcome.exit_code == EXIT_OK) {
        CYFORGE_LOG_INFO("lifecycle", name << " rebuilt and reinstalled");
    }
    return outcome;
}

// ============================================================================
// Clean
// ============================================================================

namespace {

bool is_generated_pyx(const fs::path& file) {
    std::error_code ec;
    fs::path source = file;
    source.replace_extension(".py");
    if (!fs::is_regular_file(source, ec))
        return false;

    std::ifstream in(file);
    std::string line;
    for (int i = 0; i < 3 && std::getline(in, line); ++i) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line == "# cimport cython")
            return true;
    }
    return false;
}

bool has_source_sibling(const fs::path& file) {
    std::error_code ec;
    for (const char* ext : {".pyx", ".py"}) {
        fs::path sibling = file;
        sibling.replace_extension(ext);
        if (fs::is_regular_file(sibling, ec))
            return true;
    }
    return false;
}

/// How much of a directory clean may take.
enum class CleanZone {
    Tree,     ///< Ordinary source tree: only artifact files go
    Artifact, ///< Named like an artifact dir: everything but sources goes
    Owned,    ///< Output or cache directory: everything goes
};

struct Cleaner {
    const matcher::PathMatcher& keep;
    const std::vector<std::string>& extensions; ///< Artifact file extensions
    const std::vector<std::string>& sources;    ///< Source extensions, never removed
    std::set<std::string> artifact_dirs;        ///< Directory names
    std::set<std::string> owned_dirs;           ///< Relative paths (output, cache)
    size_t removed = 0;
    size_t kept = 0;

    bool is_source_file(const fs::path& file) const {
        auto ext = file.extension().string();
        return std::find(sources.begin(), sources.end(), ext) != sources.end();
    }

    bool is_artifact_file(const fs::path& file) const {
        auto ext = file.extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end())
            return true;
        if (ext == ".c" || ext == ".cpp")
            return has_source_sibling(file);
        if (ext == ".pyx")
            return is_generated_pyx(file);
        return false;
    }

    void remove(const fs::path& path, bool is_dir) {
        std::error_code ec;
        if (is_dir)
            fs::remove_all(path, ec);
        else
            fs::remove(path, ec);
        if (ec) {
            CYFORGE_LOG_WARN("clean", "Cannot remove " << path.string() << ": " << ec.message());
            return;
        }
        CYFORGE_LOG_DEBUG("clean", "Removed " << path.string());
        ++removed;
    }

    CleanZone zone_for(const std::string& name, const std::string& rel, CleanZone parent) const {
        if (parent == CleanZone::Owned || owned_dirs.count(rel))
            return CleanZone::Owned;
        if (parent == CleanZone::Artifact || artifact_dirs.count(name))
            return CleanZone::Artifact;
        return CleanZone::Tree;
    }

    bool should_remove(const fs::path& file, CleanZone zone) const {
        switch (zone) {
        case CleanZone::Owned:
            return true;
        case CleanZone::Artifact:
            return !is_source_file(file) || is_artifact_file(file);
        case CleanZone::Tree:
            return is_artifact_file(file);
        }
        return false;
    }

    /// Walks `dir`. Returns true if something under `dir` was kept.
    bool walk(const fs::path& dir, const std::string& rel_dir, CleanZone zone) {
        std::error_code ec;
        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            CYFORGE_LOG_WARN("clean", "Cannot list " << dir.string() << ": " << ec.message());
            return true;
        }

        bool kept_any = false;
        for (const auto& entry : entries) {
            auto name = entry.path().filename().string();
            auto rel = rel_dir.empty() ? name : rel_dir + "/" + name;
            auto status = entry.symlink_status(ec);
            bool is_dir = !ec && fs::is_directory(status);

            if (keep.is_excluded(rel, is_dir)) {
                CYFORGE_LOG_TRACE("clean", "Keeping " << rel);
                ++kept;
                kept_any = true;
                continue;
            }

            if (is_dir) {
                auto child_zone = zone_for(name, rel, zone);
                bool kept_below = walk(entry.path(), rel, child_zone);
                if (child_zone != CleanZone::Tree && !kept_below)
                    remove(entry.path(), true);
                kept_any = kept_any || kept_below;
            } else if (fs::is_regular_file(status) || fs::is_symlink(status)) {
                if (should_remove(entry.path(), zone)) {
                    remove(entry.path(), false);
                } else if (zone == CleanZone::Artifact) {
                    CYFORGE_LOG_DEBUG("clean", "Keeping source " << rel << " inside " << rel_dir);
                    kept_any = true;
                }
            }
        }
        return kept_any;
    }
};

} // namespace

RunOutcome LifecycleController::run_clean() {
    RunOutcome outcome;

    matcher::ExclusionRuleSet keep_rules;
    for (const auto& pattern : config_.clean.keep) {
        matcher::ExclusionRule rule;
        if (matcher::parse_rule(pattern, rule))
            keep_rules.push_back(std::move(rule));
    }
    auto keep = matcher::PathMatcher::compile(keep_rules);
    if (is_err(keep)) {
        const auto& e = unwrap_err(keep);
        outcome.exit_code = EXIT_USAGE;
        return fail(std::move(outcome), "invalid keep pattern '" + e.raw + "': " + e.message);
    }

    transition(State::Cleaning);
    std::error_code ec;
    if (!fs::is_directory(config_.target, ec)) {
        return fail(std::move(outcome),
                    "target directory " + config_.target.string() + " does not exist");
    }

    if (fs::exists(config_.cache_path(), ec)) {
        auto store = cache::FingerprintStore::load(config_.cache_path(), "");
        store.clear();
        auto flushed = store.flush();
        if (is_err(flushed)) {
            CYFORGE_LOG_WARN("cache", "Could not clear fingerprints: "
                                          << unwrap_err(flushed).message);
        }
    }

    Cleaner cleaner{unwrap(keep), config_.clean.artifact_extensions, config_.extensions, {}, {}};
    cleaner.artifact_dirs.insert(config_.clean.artifact_dirs.begin(),
                                 config_.clean.artifact_dirs.end());
    for (const auto& dir : {config_.output_dir(), config_.cache_path().parent_path()}) {
        auto rel = relative_to_target(dir);
        if (!rel.empty())
            cleaner.owned_dirs.insert(rel);
    }
    cleaner.walk(config_.target, "", CleanZone::Tree);

    outcome.removed = cleaner.removed;
    CYFORGE_LOG_INFO("clean", "Removed " << cleaner.removed << " paths, kept " << cleaner.kept);

    transition(State::Done);
    outcome.state = State::Done;
    return outcome;
}

// ============================================================================
// List
// ============================================================================

std::vector<ArtifactInfo> LifecycleController::list_artifacts() const {
    std::vector<ArtifactInfo> out;
    fs::path root = config_.output_dir();
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return out;

    std::map<std::string, std::string> sources;
    auto store = cache::FingerprintStore::load(config_.cache_path(), "");
    for (const auto& fp : store.entries()) {
        if (!fp.output_path.empty())
            sources.emplace(fp.output_path, fp.path);
    }

    const auto& extensions = config_.clean.artifact_extensions;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        auto ext = it->path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
            continue;

        ArtifactInfo info;
        info.path = it->path().lexically_relative(root).generic_string();
        std::error_code size_ec;
        info.size = it->file_size(size_ec);
        if (auto src = sources.find(info.path); src != sources.end()) {
            info.tracked = true;
            info.source = src->second;
        }
        out.push_back(std::move(info));
    }

    std::sort(out.begin(), out.end(),
              [](const ArtifactInfo& a, const ArtifactInfo& b) { return a.path < b.path; });
    return out;
}

// ============================================================================
// Report
// ============================================================================

std::string format_report(const build::BuildReport& report, bool verbose) {
    std::ostringstream out;
    out << "Build summary: " << report.succeeded.size() << " built, " << report.skipped.size()
        << " up to date, " << report.failed.size() << " failed, "
        << report.missing_modules.size() << " missing modules";
    if (!report.cancelled.empty())
        out << ", " << report.cancelled.size() << " cancelled";
    out << " (" << std::fixed << std::setprecision(2)
        << static_cast<double>(report.elapsed_ms) / 1000.0 << "s)\n";

    auto indent = [](const std::string& text) {
        std::string result;
        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line))
            result += "    " + line + "\n";
        return result;
    };

    for (const auto& [path, err] : report.failed) {
        out << "  FAILED " << path;
        if (err.exit_code >= 0)
            out << " (exit " << err.exit_code << ")";
        out << "\n";
        if (!err.diagnostics.empty())
            out << indent(err.diagnostics);
    }
    for (const auto& [path, err] : report.missing_modules) {
        out << "  MISSING " << err.module_name << " needed by " << path << "\n";
        if (verbose && !err.diagnostics.empty())
            out << indent(err.diagnostics);
    }
    if (verbose) {
        for (const auto& path : report.cancelled)
            out << "  CANCELLED " << path << "\n";
    }
    auto names = report.missing_module_names();
    if (!names.empty()) {
        out << "Install the missing modules (or pass --auto-install):";
        for (const auto& n : names)
            out << " " << n;
        out << "\n";
    }
    return out.str();
}

} // namespace cyforge::lifecycle
