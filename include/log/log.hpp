//! # cyforge Logging
//!
//! Structured, module-tagged logging shared by every component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-component filtering ("scan", "cache", "build", ...)
//! - Worker slot tagging so interleaved pool output stays readable
//! - Console (stderr) and file sinks, text or JSON lines
//! - Compile-time level elision via CYFORGE_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! CYFORGE_LOG_INFO("scan", "Found " << units.size() << " units under " << root);
//! CYFORGE_LOG_WARN("cache", "Ignoring unreadable store " << path);
//! ```

#ifndef CYFORGE_LOG_HPP
#define CYFORGE_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cyforge::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General progress messages
    Warn = 3,  ///< Recoverable problems (skipped subtrees, unreadable cache)
    Error = 4, ///< Failed units and fatal configuration problems
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
const char* level_name(LogLevel level);

/// Parses a level name (lower or upper case). Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Worker Slot
// ============================================================================

/// Index of the pool worker running on this thread, -1 on the main thread.
int current_worker();

/// Tags the calling thread as worker `slot` for its lifetime in a pool.
class ScopedWorkerSlot {
public:
    explicit ScopedWorkerSlot(int slot);
    ~ScopedWorkerSlot();

    ScopedWorkerSlot(const ScopedWorkerSlot&) = delete;
    ScopedWorkerSlot& operator=(const ScopedWorkerSlot&) = delete;

private:
    int previous_;
};

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
    int worker;              ///< Worker slot, -1 for the main thread
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Formatter
// ============================================================================

/// Renders a record through a template.
///
/// Tokens: {time}, {time_ms}, {level}, {module}, {worker}, {message},
/// {file}, {line}. `{worker}` expands to "#N" inside a pool and to nothing
/// on the main thread.
class LogFormatter {
public:
    explicit LogFormatter(std::string_view format_template = "{time} {level} [{module}{worker}] "
                                                             "{message}");

    std::string format(const LogRecord& record) const;

    void set_template(std::string_view format_template) {
        template_ = std::string(format_template);
    }

    const std::string& get_template() const {
        return template_;
    }

private:
    std::string template_;
};

/// Renders a record as a single JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colouring the level when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from specs like "scan=debug,build=trace,*=warn".
///
/// A bare module name ("scan") enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured anywhere; the logger's fast-path gate.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe process-wide logger.
///
/// Usable before `init()`: it then logs Info and above to stderr.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Records logged afterwards go nowhere.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the CYFORGE_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options handled by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef CYFORGE_MIN_LOG_LEVEL
#define CYFORGE_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define CYFORGE_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= CYFORGE_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::cyforge::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define CYFORGE_LOG_TRACE(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Trace, module, msg)
#define CYFORGE_LOG_DEBUG(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Debug, module, msg)
#define CYFORGE_LOG_INFO(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Info, module, msg)
#define CYFORGE_LOG_WARN(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Warn, module, msg)
#define CYFORGE_LOG_ERROR(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Error, module, msg)
#define CYFORGE_LOG_FATAL(module, msg) CYFORGE_LOG_IMPL(::cyforge::log::LogLevel::Fatal, module, msg)

} // namespace cyforge::log

#endif // CYFORGE_LOG_HPP
