//! # Lifecycle Controller
//!
//! Drives one cyforge invocation through its states and owns everything
//! that lives for exactly one run: the fingerprint store handle, the
//! compiled exclusion rules and the scheduler.
//!
//! ## States
//!
//! ```text
//! Idle ─▶ Scanning ─▶ Pruning ─▶ Building ─▶ Reporting ─▶ Done | Failed
//!                                                 Done ─▶ Packaging ─▶ Installing ─▶ Done
//! Idle ─▶ Cleaning ─▶ Done | Failed
//! Idle ─▶ Failed                          (configuration or pattern error)
//! ```
//!
//! `Building → Reporting` happens even when units fail. `Reporting → Failed`
//! only when nothing succeeded out of at least one attempt, or the target
//! root does not exist. A cancelled run goes straight to Reporting from
//! whichever phase it was in.
//!
//! Every transition is checked against the table above and logged; an
//! illegal one throws `std::logic_error`.

#ifndef CYFORGE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP
#define CYFORGE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP

#include "build/package_tools.hpp"
#include "build/task_scheduler.hpp"
#include "build/toolchain.hpp"
#include "common.hpp"
#include "config/build_config.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace cyforge::lifecycle {

namespace fs = std::filesystem;

enum class State {
    Idle,
    Scanning,
    Pruning,
    Building,
    Reporting,
    Done,
    Failed,
    Packaging,
    Installing,
    Cleaning,
};

const char* state_name(State state);

/// True if `from → to` is in the transition table.
bool is_valid_transition(State from, State to);

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1; ///< A unit failed, or the run reached Failed
constexpr int EXIT_USAGE = 2;  ///< Bad arguments or configuration

struct RunOutcome {
    State state = State::Idle;
    build::BuildReport report;
    std::vector<ScanError> warnings;
    std::set<std::string> missing_imports; ///< Still unresolved after the pre-build check
    std::string error;          ///< Why the run reached Failed, if it did
    size_t units_found = 0;
    size_t removed = 0;         ///< Paths deleted by a clean
    fs::path wheel;             ///< Set when a wheel was built
    int exit_code = EXIT_OK;
};

/// One entry of `--list`.
struct ArtifactInfo {
    std::string path;    ///< Relative to the output directory
    uint64_t size = 0;
    bool tracked = false; ///< Referenced by a fingerprint
    std::string source;  ///< Source unit of a tracked artifact
};

struct ControllerOptions {
    bool install = false; ///< Package and install after a successful build
    fs::path project_dir; ///< Where the wheel is built. Empty = current directory
};

class LifecycleController {
public:
    /// `toolchain` and `tools` must outlive the controller.
    LifecycleController(config::BuildConfig config, build::Toolchain& toolchain,
                        build::PackageTools& tools, ControllerOptions options = {});

    /// Scan, prune, build and report; then package and install if asked.
    RunOutcome run_build(const CancellationToken* cancel = nullptr);

    /// Removes build artifacts under the target.
    RunOutcome run_clean();

    /// Builds an installed library from a temporary copy of its sources and
    /// reinstalls it. The copy lives in `<work_dir>/.cyforge_tmp/<name>`.
    RunOutcome run_library(const std::string& name, const fs::path& work_dir,
                           const CancellationToken* cancel = nullptr);

    /// Artifacts currently in the output directory.
    std::vector<ArtifactInfo> list_artifacts() const;

    State state() const {
        return state_;
    }

    /// Every state entered so far, starting with Idle.
    const std::vector<State>& history() const {
        return history_;
    }

    const config::BuildConfig& config() const {
        return config_;
    }

private:
    void transition(State next);

    RunOutcome fail(RunOutcome outcome, std::string error);

    /// Looks up the imports of the units about to compile. Missing modules are
    /// listed, and installed first when auto-install is on.
    void check_imports(const build::BuildPlan& plan, const std::vector<SourceUnit>& units,
                       RunOutcome& outcome, std::set<std::string>& attempted);

    /// pip-installs every name not yet in `attempted`. Returns the ones that
    /// installed.
    std::set<std::string> install_modules(const std::set<std::string>& names,
                                          std::set<std::string>& attempted);

    /// Installs each missing module once and rebuilds the units that needed it.
    void remediate_missing_modules(build::TaskScheduler& scheduler,
                                   const std::vector<SourceUnit>& units, build::BuildReport& report,
                                   std::set<std::string>& attempted,
                                   const CancellationToken* cancel);

    /// Done → Packaging → Installing → Done.
    void package_and_install(RunOutcome& outcome, const fs::path& project_dir);

    /// Relative form of `dir` under the target, or "" when it is outside.
    std::string relative_to_target(const fs::path& dir) const;

    config::BuildConfig config_;
    build::Toolchain& toolchain_;
    build::PackageTools& tools_;
    ControllerOptions options_;

    State state_ = State::Idle;
    std::vector<State> history_{State::Idle};
};

/// Multi-line human readable summary of a build report.
std::string format_report(const build::BuildReport& report, bool verbose = false);

} // namespace cyforge::lifecycle

#endif // CYFORGE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP
