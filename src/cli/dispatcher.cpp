//! # CLI Command Dispatcher
//!
//! Parses the command line, loads the configuration and routes to the
//! lifecycle controller.
//!
//! ## Architecture
//!
//! ```text
//! cyforge_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ --clean, -c    → LifecycleController::run_clean()
//!   ├─ --list         → LifecycleController::list_artifacts()
//!   ├─ --lib, -l      → LifecycleController::run_library()
//!   └─ --target, -t   → LifecycleController::run_build()
//! ```
//!
//! Command-line options override `cyforge.toml`, which overrides the
//! built-in defaults.
//!
//! ## Signals
//!
//! SIGINT and SIGTERM cancel the run: no new units start, running
//! compilers are terminated and the fingerprint store is saved. A second
//! signal kills the process.

#include "build/package_tools.hpp"
#include "build/toolchain.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "driver.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <charconv>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cyforge::cli {

namespace fs = std::filesystem;

namespace {

CancellationToken g_cancel;

void handle_stop_signal(int) {
    g_cancel.cancel();
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

struct CliOptions {
    std::optional<std::string> target;
    std::optional<std::string> output;
    std::optional<std::string> library;
    std::optional<std::string> config_file;
    std::optional<std::string> flags;
    std::optional<std::string> compiler;
    std::optional<int> jobs;
    std::vector<std::string> keep;
    bool install = false;
    bool clean = false;
    bool list = false;
    bool no_cache = false;
    bool auto_install = false;
    bool no_import_check = false;
    bool help = false;
    bool version = false;
    bool verbose = false;
};

/// Parses argv into `out`. Returns an error message on bad usage.
std::optional<std::string> parse_args(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            if (arg.starts_with("-v") || arg == "--verbose")
                out.verbose = true;
            continue;
        }

        // Accept both "--opt value" and "--opt=value"
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        auto value = [&](std::optional<std::string>& slot) -> std::optional<std::string> {
            if (inline_value) {
                slot = *inline_value;
                return std::nullopt;
            }
            if (i + 1 >= argc)
                return "option '" + arg + "' requires a value";
            slot = argv[++i];
            return std::nullopt;
        };

        std::optional<std::string> err;
        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "-V" || arg == "--version") {
            out.version = true;
        } else if (arg == "-t" || arg == "--target") {
            err = value(out.target);
        } else if (arg == "-o" || arg == "--output") {
            err = value(out.output);
        } else if (arg == "-l" || arg == "--lib") {
            err = value(out.library);
        } else if (arg == "--config") {
            err = value(out.config_file);
        } else if (arg == "--flags") {
            err = value(out.flags);
        } else if (arg == "--compiler") {
            err = value(out.compiler);
        } else if (arg == "--keep") {
            std::optional<std::string> pattern;
            err = value(pattern);
            if (pattern)
                out.keep.push_back(*pattern);
        } else if (arg == "-j" || arg == "--jobs") {
            std::optional<std::string> text;
            err = value(text);
            if (text) {
                int jobs = 0;
                auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), jobs);
                if (ec != std::errc() || ptr != text->data() + text->size() || jobs < 0)
                    return "invalid job count '" + *text + "'";
                out.jobs = jobs;
            }
        } else if (arg == "-i" || arg == "--install") {
            out.install = true;
        } else if (arg == "-c" || arg == "--clean") {
            out.clean = true;
        } else if (arg == "--list") {
            out.list = true;
        } else if (arg == "--no-cache") {
            out.no_cache = true;
        } else if (arg == "--auto-install") {
            out.auto_install = true;
        } else if (arg == "--no-import-check") {
            out.no_import_check = true;
        } else {
            return "unknown option '" + std::string(argv[i]) + "'";
        }
        if (err)
            return err;
    }

    int modes = (out.clean ? 1 : 0) + (out.list ? 1 : 0) + (out.library ? 1 : 0);
    if (modes > 1)
        return std::string("--clean, --list and --lib are mutually exclusive");
    return std::nullopt;
}

void apply_overrides(const CliOptions& cli, config::BuildConfig& config) {
    if (cli.output)
        config.output = *cli.output;
    if (cli.jobs)
        config.jobs = *cli.jobs;
    if (cli.no_cache)
        config.use_cache = false;
    if (cli.flags)
        config.toolchain.flags = split_words(*cli.flags);
    if (cli.compiler) {
        auto command = split_words(*cli.compiler);
        bool has_input = false;
        for (const auto& word : command) {
            if (word.find("{input}") != std::string::npos)
                has_input = true;
        }
        if (!has_input) {
            command.push_back("{flags}");
            command.push_back("{input}");
        }
        config.toolchain.command = std::move(command);
    }
    if (cli.auto_install)
        config.install.auto_install_missing = true;
    if (cli.no_import_check)
        config.install.check_imports = false;
    config.clean.keep.insert(config.clean.keep.end(), cli.keep.begin(), cli.keep.end());
}

void print_artifacts(const std::vector<lifecycle::ArtifactInfo>& artifacts,
                     const fs::path& output_dir) {
    if (artifacts.empty()) {
        std::cout << "No artifacts in " << output_dir.string() << "\n";
        return;
    }
    uintmax_t total = 0;
    for (const auto& a : artifacts) {
        std::cout << (a.tracked ? "  " : "? ") << a.path << "  " << format_size(a.size);
        if (a.tracked)
            std::cout << "  <- " << a.source;
        std::cout << "\n";
        total += a.size;
    }
    std::cout << artifacts.size() << " artifacts, " << format_size(total) << " in "
              << output_dir.string() << "\n";
}

} // namespace

/// Main entry point for the cyforge CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                      |
/// |------|----------------------------------------------|
/// | 0    | Success                                      |
/// | 1    | A unit failed, or the run failed             |
/// | 2    | Bad usage or configuration                   |
int cyforge_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    CliOptions cli;
    if (auto err = parse_args(argc, argv, cli)) {
        std::cerr << "error: " << *err << "\n";
        std::cerr << "Run 'cyforge --help' for usage.\n";
        return lifecycle::EXIT_USAGE;
    }

    if (cli.help) {
        print_usage();
        return 0;
    }
    if (cli.version) {
        print_version();
        return 0;
    }

    bool needs_target = !cli.clean && !cli.list && !cli.library;
    if (needs_target && !cli.target) {
        std::cerr << "error: provide --target, --lib, --clean or --list\n";
        std::cerr << "Run 'cyforge --help' for usage.\n";
        return lifecycle::EXIT_USAGE;
    }

    config::BuildConfig base;
    base.target = cli.target.value_or(".");

    fs::path config_file = cli.config_file ? fs::path(*cli.config_file)
                                           : base.target / config::CONFIG_FILE_NAME;
    std::error_code ec;
    if (cli.config_file && !fs::is_regular_file(config_file, ec)) {
        std::cerr << "error: config file " << config_file.string() << " not found\n";
        return lifecycle::EXIT_USAGE;
    }
    auto loaded = config::load_build_config(config_file, base);
    if (is_err(loaded)) {
        const auto& e = unwrap_err(loaded);
        std::cerr << "error: " << e.path;
        if (e.line > 0)
            std::cerr << ":" << e.line;
        std::cerr << ": " << e.message << "\n";
        return lifecycle::EXIT_USAGE;
    }
    auto config = std::move(unwrap(loaded));
    apply_overrides(cli, config);

    build::ProcessToolchainOptions tc_options;
    tc_options.command = config.toolchain.command;
    tc_options.version = config.toolchain.version;
    tc_options.timeout = std::chrono::seconds(config.toolchain.timeout_s);
    tc_options.grace_period = std::chrono::milliseconds(config.toolchain.grace_period_ms);
    build::ProcessToolchain toolchain(tc_options);

    build::ProcessPackageToolsOptions pkg_options;
    pkg_options.python = config.install.python;
    pkg_options.cancel = &g_cancel;
    build::ProcessPackageTools tools(pkg_options);

    lifecycle::ControllerOptions ctl_options;
    ctl_options.install = cli.install;
    lifecycle::LifecycleController controller(config, toolchain, tools, ctl_options);

    install_signal_handlers();

    try {
        if (cli.list) {
            print_artifacts(controller.list_artifacts(), controller.config().output_dir());
            return 0;
        }

        lifecycle::RunOutcome outcome;
        if (cli.clean) {
            outcome = controller.run_clean();
            if (outcome.state == lifecycle::State::Done)
                std::cout << "Removed " << outcome.removed << " paths\n";
        } else if (cli.library) {
            outcome = controller.run_library(*cli.library, fs::current_path(ec), &g_cancel);
        } else {
            outcome = controller.run_build(&g_cancel);
        }

        if (outcome.report.attempted > 0 || !outcome.report.skipped.empty()) {
            std::cout << lifecycle::format_report(outcome.report, cli.verbose);
        }
        if (!outcome.error.empty()) {
            std::cerr << "error: " << outcome.error << "\n";
        }
        if (!outcome.wheel.empty() && outcome.state == lifecycle::State::Done) {
            std::cout << "Installed " << outcome.wheel.filename().string() << "\n";
        }

        log::Logger::instance().flush();
        return outcome.exit_code;
    } catch (const std::exception& e) {
        CYFORGE_LOG_FATAL("cli", e.what());
        log::Logger::instance().flush();
        return lifecycle::EXIT_FAILED;
    }
}

} // namespace cyforge::cli

int cyforge_main(int argc, char* argv[]) {
    return cyforge::cli::cyforge_main(argc, argv);
}
