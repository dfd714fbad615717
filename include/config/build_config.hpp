//! # Build Configuration
//!
//! Settings for one cyforge run, read from `cyforge.toml` in the target
//! directory and then overridden by command-line options.
//!
//! ## File Format
//!
//! ```toml
//! [build]
//! extensions = [".py"]
//! output = "build_lib"
//! jobs = 8
//! cache = ".cyforge/fingerprints.idx"
//! exclude_file = "exclude.txt"
//!
//! [toolchain]
//! command = ["cythonize", "-i", "-3", "{flags}", "{input}"]
//! flags = ["-X", "boundscheck=False"]
//! version = ""
//! timeout = 600
//! grace_period_ms = 3000
//!
//! [clean]
//! keep = ["data/"]
//! artifact_extensions = [".so", ".pyd"]
//! artifact_dirs = ["build", "cython_cache", "__pycache__"]
//!
//! [install]
//! auto_install_missing = false
//! check_imports = true
//! python = "python3"
//! ```
//!
//! Only one-line values are understood: quoted strings, integers, `true` /
//! `false` and single-line arrays of quoted strings. Unknown keys are
//! logged and ignored; anything that does not parse is a `ConfigError`.

#ifndef CYFORGE_CONFIG_BUILD_CONFIG_HPP
#define CYFORGE_CONFIG_BUILD_CONFIG_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cyforge::config {

namespace fs = std::filesystem;

/// Name of the per-project configuration file.
inline constexpr const char* CONFIG_FILE_NAME = "cyforge.toml";

/// Compiler directives passed to every compile by default.
inline constexpr const char* DEFAULT_DIRECTIVES =
    "boundscheck=False,wraparound=False,nonecheck=False,cdivision=True,"
    "language_level=3,initializedcheck=False,infer_types=True";

struct ToolchainConfig {
    /// argv template; `{input}`, `{output_dir}` and `{flags}` are expanded.
    std::vector<std::string> command = {"cythonize", "-i", "-3", "{flags}", "{input}"};
    std::vector<std::string> flags = {"-X", DEFAULT_DIRECTIVES};
    /// Fingerprint version tag. Empty = ask `<command[0]> --version`.
    std::string version;
    int timeout_s = 600;
    int grace_period_ms = 3000;
};

struct CleanConfig {
    std::vector<std::string> keep;
    std::vector<std::string> artifact_extensions = {".so", ".pyd"};
    std::vector<std::string> artifact_dirs = {"build", "cython_cache", "__pycache__"};
};

struct InstallConfig {
    bool auto_install_missing = false;
    bool check_imports = true; ///< Look up stale units' imports before compiling
    std::string python = "python3";
};

/// Complete settings of a run.
struct BuildConfig {
    fs::path target;                             ///< Root of the source tree
    std::vector<std::string> extensions = {".py"};
    std::string output = "build_lib";            ///< Relative to the target unless absolute
    int jobs = 0;                                ///< 0 = hardware concurrency
    std::string cache = ".cyforge/fingerprints.idx";
    bool use_cache = true;                       ///< false = every unit is stale
    std::string exclude_file = "exclude.txt";

    ToolchainConfig toolchain;
    CleanConfig clean;
    InstallConfig install;

    /// Absolute output directory.
    fs::path output_dir() const;

    /// Absolute fingerprint store path.
    fs::path cache_path() const;

    /// Worker count with 0 resolved to the hardware concurrency.
    int resolved_jobs() const;
};

/// Parses configuration text on top of `base`. `origin` names the source
/// in error messages.
Result<BuildConfig, ConfigError> parse_build_config(std::string_view text,
                                                    const std::string& origin,
                                                    BuildConfig base = {});

/// Reads `file` on top of `base`. A missing file yields `base` unchanged.
Result<BuildConfig, ConfigError> load_build_config(const fs::path& file, BuildConfig base = {});

} // namespace cyforge::config

#endif // CYFORGE_CONFIG_BUILD_CONFIG_HPP
