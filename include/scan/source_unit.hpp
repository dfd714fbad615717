//! # Source Unit
//!
//! One candidate source file discovered by a scan.

#ifndef CYFORGE_SCAN_SOURCE_UNIT_HPP
#define CYFORGE_SCAN_SOURCE_UNIT_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace cyforge {

struct SourceUnit {
    std::string relative_path;            ///< Identity: forward slashes, relative to the target
    std::filesystem::path absolute_path;
    uint64_t size_bytes = 0;
    int64_t modified_time = 0;            ///< Nanoseconds, file_time_type epoch
};

/// Modification time of `path` in the units used by SourceUnit, 0 on error.
int64_t file_mtime(const std::filesystem::path& path);

} // namespace cyforge

#endif // CYFORGE_SCAN_SOURCE_UNIT_HPP
