//! # Scanner
//!
//! Concurrent directory walk producing the candidate units of a run.
//!
//! ## Ordering
//!
//! Directories are listed by a pool of workers, one job per directory. Each
//! job fills its own arena; when the pool drains the arenas are merged and
//! sorted component-wise, which is the order of a depth-first walk with
//! entries sorted by name. The result therefore never depends on thread
//! interleaving.
//!
//! ## Failures
//!
//! A directory that cannot be listed becomes a `ScanError` warning and its
//! subtree is skipped. Symlinked directories are not followed.

#ifndef CYFORGE_SCAN_SCANNER_HPP
#define CYFORGE_SCAN_SCANNER_HPP

#include "common.hpp"
#include "matcher/path_matcher.hpp"
#include "scan/source_unit.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cyforge::scan {

namespace fs = std::filesystem;

struct ScanOptions {
    std::vector<std::string> extensions = {".py"}; ///< Matched against the file suffix
    int jobs = 0;                                  ///< 0 = hardware concurrency
    /// Relative directories never descended (output tree, cache directory).
    std::vector<std::string> skip_dirs;
};

struct ScanResult {
    std::vector<SourceUnit> units; ///< Sorted, depth-first by name
    std::vector<ScanError> warnings;
    bool root_missing = false;
    size_t directories_visited = 0;
    size_t excluded = 0; ///< Files and pruned directories rejected by the matcher
};

class Scanner {
public:
    explicit Scanner(ScanOptions options = {});

    ScanResult scan(const fs::path& root, const matcher::PathMatcher& matcher) const;

private:
    bool has_wanted_extension(const fs::path& file) const;
    bool is_skipped_dir(const std::string& relative) const;

    ScanOptions options_;
};

/// Component-wise path order used for the final sort ("a/b" < "a.py").
bool path_less(const std::string& lhs, const std::string& rhs);

} // namespace cyforge::scan

#endif // CYFORGE_SCAN_SCANNER_HPP
