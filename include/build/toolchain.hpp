//! # Toolchain
//!
//! The external compiler, seen through a narrow interface: one blocking
//! call per annotated source, returning an exit code and the captured
//! output. Everything else about the compiler is opaque.
//!
//! ## Command Template
//!
//! `ProcessToolchain` expands these placeholders in its argv template:
//!
//! | Placeholder    | Expansion                                          |
//! |----------------|----------------------------------------------------|
//! | `{input}`      | annotated source path                              |
//! | `{output_dir}` | directory the artifact should land in              |
//! | `{flags}`      | the configured flags, one argv entry each          |
//!
//! An argument that is exactly `{flags}` expands to zero or more entries.
//!
//! ## Missing Modules
//!
//! `detect_missing_module()` recognises the usual import failure messages
//! in compiler output so the caller can tell an unresolved import apart
//! from a genuine compile error.

#ifndef CYFORGE_BUILD_TOOLCHAIN_HPP
#define CYFORGE_BUILD_TOOLCHAIN_HPP

#include "common/process.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cyforge::build {

namespace fs = std::filesystem;

struct CompileRequest {
    fs::path source;                ///< Annotated source to compile
    fs::path output_dir;            ///< Where the artifact should be written
    std::vector<std::string> flags; ///< Optimisation flags
};

struct CompileOutcome {
    int exit_code = -1;
    std::string output; ///< stdout and stderr
};

/// Interface to the source-to-native compiler.
///
/// Implementations must be callable from several worker threads at once.
class Toolchain {
public:
    virtual ~Toolchain() = default;

    /// Compiles one file. Blocks until the compiler exits.
    virtual CompileOutcome compile(const CompileRequest& request,
                                   const CancellationToken* cancel) = 0;

    /// Version string recorded in fingerprints. A change invalidates them.
    virtual std::string version() const = 0;
};

struct ProcessToolchainOptions {
    std::vector<std::string> command = {"cythonize", "-i", "-3", "{flags}", "{input}"};
    std::string version;                         ///< Empty = ask `<command[0]> --version`
    std::chrono::seconds timeout{600};
    std::chrono::milliseconds grace_period{3000};
};

/// Runs the configured compiler as a child process.
///
/// The version is queried on the first call to version(), so a toolchain
/// that never compiles never starts a process.
class ProcessToolchain : public Toolchain {
public:
    explicit ProcessToolchain(ProcessToolchainOptions options);

    CompileOutcome compile(const CompileRequest& request,
                           const CancellationToken* cancel) override;

    std::string version() const override;

    /// argv for `request` with every placeholder expanded.
    std::vector<std::string> expand_command(const CompileRequest& request) const;

private:
    ProcessToolchainOptions options_;
    mutable std::once_flag version_once_;
    mutable std::string version_;
};

/// Name of the module an import failure in `output` refers to, if any.
/// Dotted names are returned whole ("pkg.sub").
std::optional<std::string> detect_missing_module(const std::string& output);

/// Fingerprint version tag: the toolchain version plus a digest of the
/// flags, so changing either invalidates every record.
std::string toolchain_tag(const Toolchain& toolchain, const std::vector<std::string>& flags);

} // namespace cyforge::build

#endif // CYFORGE_BUILD_TOOLCHAIN_HPP
