//! # Logger Implementation
//!
//! Logger singleton, sinks, formatter, filter and worker slot tagging.

#include "log/log.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>

#include <unistd.h>

namespace cyforge::log {

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Worker Slot
// ============================================================================

namespace {
thread_local int t_worker_slot = -1;
}

int current_worker() {
    return t_worker_slot;
}

ScopedWorkerSlot::ScopedWorkerSlot(int slot) : previous_(t_worker_slot) {
    t_worker_slot = slot;
}

ScopedWorkerSlot::~ScopedWorkerSlot() {
    t_worker_slot = previous_;
}

// ============================================================================
// Time
// ============================================================================

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

// ============================================================================
// Formatting
// ============================================================================

static void append_json_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

std::string format_json(const LogRecord& record) {
    std::string out;
    out.reserve(record.message.size() + 96);
    out += "{\"ts\":";
    out += std::to_string(record.timestamp_ms);
    out += ",\"level\":\"";
    out += level_name(record.level);
    out += "\",\"module\":\"";
    append_json_escaped(out, record.module);
    out += "\"";
    if (record.worker >= 0) {
        out += ",\"worker\":";
        out += std::to_string(record.worker);
    }
    out += ",\"msg\":\"";
    append_json_escaped(out, record.message);
    out += "\"}";
    return out;
}

LogFormatter::LogFormatter(std::string_view format_template) : template_(format_template) {}

std::string LogFormatter::format(const LogRecord& record) const {
    std::string result;
    result.reserve(template_.size() + record.message.size() + 48);

    size_t i = 0;
    while (i < template_.size()) {
        size_t close = template_[i] == '{' ? template_.find('}', i + 1) : std::string::npos;
        if (close == std::string::npos) {
            result += template_[i++];
            continue;
        }

        auto token = std::string_view(template_).substr(i + 1, close - i - 1);
        if (token == "time") {
            result += get_timestamp();
        } else if (token == "time_ms") {
            result += std::to_string(record.timestamp_ms);
        } else if (token == "level") {
            std::string name = level_name(record.level);
            name.resize(5, ' ');
            result += name;
        } else if (token == "module") {
            result += record.module;
        } else if (token == "worker") {
            if (record.worker >= 0) {
                result += '#';
                result += std::to_string(record.worker);
            }
        } else if (token == "message") {
            result += record.message;
        } else if (token == "file") {
            result += record.file ? record.file : "";
        } else if (token == "line") {
            result += std::to_string(record.line);
        } else {
            // Unknown token: keep it verbatim
            result += template_.substr(i, close - i + 1);
        }
        i = close + 1;
    }

    return result;
}

// ============================================================================
// ConsoleSink
// ============================================================================

static bool detect_terminal_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string_view(term) != "dumb";
}

static const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string line;
    if (format_ == LogFormat::JSON) {
        line = format_json(record);
    } else if (colors_enabled_) {
        line = level_color(record.level) + formatter_.format(record) + "\033[0m";
    } else {
        line = formatter_.format(record);
    }
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : formatter_.format(record)) << '\n';

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = parse_level(token.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter{};

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Without an explicit "*=level" the CLI level is the default.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();
    record.worker = current_worker();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace cyforge::log
