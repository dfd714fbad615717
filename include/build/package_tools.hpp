//! # Package Tools
//!
//! Wheel packaging, package installation and installed-library lookup.
//! All of it is delegated to the Python interpreter named in the
//! `[install]` section; cyforge only sequences the calls and reads their
//! exit codes.
//!
//! | Operation          | Command                                              |
//! |--------------------|------------------------------------------------------|
//! | `build_wheel`      | `python3 -m build --wheel` (in the project dir)      |
//! | `install_wheel`    | `python3 -m pip install --upgrade <wheel>`           |
//! | `install_module`   | `python3 -m pip install <module>`                    |
//! | `locate_library`   | `importlib.util.find_spec(<name>).origin` lookup     |
//! | `find_missing_modules` | one `find_spec` run for a batch of names         |
//!
//! `scan_imports` reads the top-level module names a source imports, so
//! missing dependencies can be listed (and installed) before compiling.

#ifndef CYFORGE_BUILD_PACKAGE_TOOLS_HPP
#define CYFORGE_BUILD_PACKAGE_TOOLS_HPP

#include "common.hpp"
#include "common/process.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cyforge::build {

namespace fs = std::filesystem;

/// Interface to the packaging ecosystem. Errors carry a printable reason.
class PackageTools {
public:
    virtual ~PackageTools() = default;

    /// Builds a wheel from `project_dir` and returns the newest wheel in
    /// `<project_dir>/dist`.
    virtual Result<fs::path, std::string> build_wheel(const fs::path& project_dir) = 0;

    virtual Result<bool, std::string> install_wheel(const fs::path& wheel) = 0;

    /// Installs a module an import failure named.
    virtual Result<bool, std::string> install_module(const std::string& name) = 0;

    /// Source directory of an installed package.
    virtual Result<fs::path, std::string> locate_library(const std::string& name) = 0;

    /// The subset of `names` the interpreter cannot import.
    virtual Result<std::set<std::string>, std::string>
    find_missing_modules(const std::set<std::string>& names) = 0;
};

struct ProcessPackageToolsOptions {
    std::string python = "python3";
    std::chrono::seconds timeout{0}; ///< 0 = no limit
    const CancellationToken* cancel = nullptr;
};

/// Runs the interpreter as a child process for each operation.
class ProcessPackageTools : public PackageTools {
public:
    explicit ProcessPackageTools(ProcessPackageToolsOptions options);

    Result<fs::path, std::string> build_wheel(const fs::path& project_dir) override;
    Result<bool, std::string> install_wheel(const fs::path& wheel) override;
    Result<bool, std::string> install_module(const std::string& name) override;
    Result<fs::path, std::string> locate_library(const std::string& name) override;
    Result<std::set<std::string>, std::string>
    find_missing_modules(const std::set<std::string>& names) override;

private:
    ProcessResult run(const std::vector<std::string>& args, const fs::path& working_dir = {});

    ProcessPackageToolsOptions options_;
};

/// Last `*.whl` in `dist_dir` in file name order.
Result<fs::path, std::string> find_newest_wheel(const fs::path& dist_dir);

/// Top-level modules named by `import` and `from ... import` statements.
///
/// Relative imports and `__future__` are skipped, as is anything inside a
/// triple-quoted string. `import a.b as c, d` yields `a` and `d`.
std::set<std::string> scan_imports(std::string_view source);

} // namespace cyforge::build

#endif // CYFORGE_BUILD_PACKAGE_TOOLS_HPP
