//! # Common Definitions
//!
//! Types and helpers shared by every cyforge component.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: error handling without exceptions
//! - **Error Taxonomy**: one struct per failure class of a build run
//!
//! ## Error Policy
//!
//! | Error                | Raised by           | Effect on the run               |
//! |----------------------|---------------------|---------------------------------|
//! | `ScanError`          | Scanner             | subtree skipped, run continues  |
//! | `PatternError`       | PathMatcher         | fatal before the run starts     |
//! | `ConfigError`        | build_config        | fatal before the run starts     |
//! | `CompileError`       | TaskScheduler       | recorded per unit               |
//! | `MissingModuleError` | TaskScheduler       | recorded per unit, remediable   |
//! | `CacheError`         | FingerprintStore    | store treated as empty          |

#ifndef CYFORGE_COMMON_HPP
#define CYFORGE_COMMON_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace cyforge {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = PathMatcher::compile(rules);
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// auto& matcher = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Error Taxonomy
// ============================================================================

/// A directory that could not be listed during a scan.
struct ScanError {
    std::string path;    ///< Relative path of the unreadable directory ("" = root)
    std::string message; ///< OS error text
};

/// A malformed exclusion rule. Fatal at startup.
struct PatternError {
    size_t rule_index = 0; ///< 0-based index of the rule in its rule set
    size_t line = 0;       ///< 1-based line in the exclusion file (0 = not from a file)
    std::string raw;       ///< The rule exactly as written
    std::string message;   ///< What is wrong with it
};

/// A malformed configuration file or option. Fatal at startup.
struct ConfigError {
    std::string path; ///< Config file, or "<cli>" for command-line options
    int line = 0;     ///< 1-based line (0 = not line related)
    std::string message;
};

/// The external compiler rejected a unit, or the unit could not be prepared.
struct CompileError {
    std::string path;        ///< Relative path of the unit
    int exit_code = -1;      ///< Compiler exit code (-1 = never ran or killed)
    std::string diagnostics; ///< Captured compiler output or failure reason
};

/// A compile failure caused by an unresolved import.
///
/// Kept apart from generic failures so the caller can install the module
/// and retry.
struct MissingModuleError : CompileError {
    std::string module_name;
};

/// The fingerprint store could not be read or written.
struct CacheError {
    std::string path;
    std::string message;
};

} // namespace cyforge

#endif // CYFORGE_COMMON_HPP
