//! # Fingerprint Store
//!
//! Durable map from unit path to the fingerprint of its last successful
//! compile. A unit whose fingerprint no longer matches is stale and gets
//! rebuilt.
//!
//! ## Staleness
//!
//! | Check                               | Outcome                          |
//! |-------------------------------------|----------------------------------|
//! | no record, or no hash / toolchain   | stale                            |
//! | toolchain version differs           | stale                            |
//! | recorded artifact missing           | stale                            |
//! | mtime and size unchanged            | fresh, no hashing                |
//! | SHA-256 of current bytes == record  | fresh, record's mtime refreshed  |
//! | otherwise                           | stale                            |
//!
//! ## On-Disk Format
//!
//! ```text
//! # cyforge fingerprints v1
//! path=pkg/mod.py<TAB>hash=3a7b...<TAB>mtime=1700000000000000000<TAB>size=812<TAB>toolchain=3.0.11
//! ```
//!
//! Values escape `\t`, `\n` and `\\`. Keys this version does not know are
//! kept and written back unchanged. `flush()` writes a temporary file next
//! to the store and renames it over the old one, so a crash leaves either
//! the old or the new store, never a torn one.
//!
//! ## Thread Safety
//!
//! Readers take a shared lock; `record()`, mtime refresh, `clear()` and
//! `flush()` take the exclusive lock.

#ifndef CYFORGE_CACHE_FINGERPRINT_STORE_HPP
#define CYFORGE_CACHE_FINGERPRINT_STORE_HPP

#include "common.hpp"
#include "scan/source_unit.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cyforge::cache {

namespace fs = std::filesystem;

/// First line of every store file.
inline constexpr const char* STORE_HEADER = "# cyforge fingerprints v1";

struct Fingerprint {
    std::string path;
    std::string content_hash;      ///< Hex SHA-256, empty = unknown
    int64_t source_mtime = 0;
    uint64_t source_size = 0;
    std::string toolchain_version; ///< Empty = unknown
    std::string output_path;       ///< Artifact, relative to the artifact root
    uint64_t output_size = 0;
    std::map<std::string, std::string> extra; ///< Unknown keys, preserved
};

enum class StaleReason {
    Fresh,      ///< Up to date
    New,        ///< No usable record
    Toolchain,  ///< Recorded under another compiler version
    Content,    ///< Bytes changed
    Artifact,   ///< Recorded artifact no longer exists
    Unreadable, ///< Source could not be hashed
};

const char* stale_reason_name(StaleReason reason);

/// Result of a staleness check.
struct StalenessCheck {
    bool stale = true;
    StaleReason reason = StaleReason::New;
    /// Hash computed during the check, empty when the fast path applied.
    std::string content_hash;
};

class FingerprintStore {
public:
    /// An in-memory store that is never written.
    FingerprintStore() = default;

    /// Loads `file`. A missing file gives an empty store; an unreadable or
    /// corrupt one gives an empty store and sets load_error().
    static FingerprintStore load(const fs::path& file, std::string toolchain_version);

    FingerprintStore(FingerprintStore&& other) noexcept;
    FingerprintStore& operator=(FingerprintStore&& other) noexcept;

    bool is_stale(const SourceUnit& unit) const;

    StalenessCheck check(const SourceUnit& unit) const;

    /// Stores `fp` for `unit.relative_path` and marks the store dirty.
    void record(const SourceUnit& unit, Fingerprint fp);

    /// A fingerprint for `unit` under the active toolchain version.
    Fingerprint make_fingerprint(const SourceUnit& unit, std::string content_hash,
                                 std::string output_path = {}, uint64_t output_size = 0) const;

    std::optional<Fingerprint> lookup(const std::string& path) const;

    /// Copy of every entry, sorted by path.
    std::vector<Fingerprint> entries() const;

    /// Drops the entry for `path`. Returns true if there was one.
    bool erase(const std::string& path);

    void clear();

    size_t size() const;

    bool dirty() const;

    /// Atomically writes the store if it is dirty. Ok(false) = nothing to do.
    Result<bool, CacheError> flush();

    /// Directory that recorded `output_path`s are relative to. When set, a
    /// record whose artifact has vanished is stale.
    void set_artifact_root(fs::path root);

    const std::string& toolchain_version() const {
        return toolchain_version_;
    }

    const fs::path& file() const {
        return file_;
    }

    const std::optional<CacheError>& load_error() const {
        return load_error_;
    }

    /// Lines dropped while loading because they had no usable `path`.
    size_t dropped_entries() const {
        return dropped_entries_;
    }

private:
    void refresh_mtime(const std::string& path, int64_t mtime) const;

    fs::path file_;
    std::string toolchain_version_;
    fs::path artifact_root_;
    mutable std::unordered_map<std::string, Fingerprint> entries_;
    mutable bool dirty_ = false;
    std::optional<CacheError> load_error_;
    size_t dropped_entries_ = 0;
    mutable std::shared_mutex mutex_;
};

/// Escapes tab, newline and backslash for the store format.
std::string escape_value(std::string_view value);

/// Inverse of escape_value(). Unknown escapes are kept literally.
std::string unescape_value(std::string_view value);

/// Parses one entry line. Returns nullopt when the line has no `path`.
std::optional<Fingerprint> parse_entry(std::string_view line);

/// Renders one entry line (no trailing newline).
std::string format_entry(const Fingerprint& fp);

} // namespace cyforge::cache

#endif // CYFORGE_CACHE_FINGERPRINT_STORE_HPP
