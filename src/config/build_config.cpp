//! # Build Configuration
//!
//! Line-oriented reader for the `cyforge.toml` subset documented in
//! build_config.hpp.

#include "config/build_config.hpp"

#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <thread>

namespace cyforge::config {

// ============================================================================
// Paths
// ============================================================================

fs::path BuildConfig::output_dir() const {
    fs::path out(output);
    return out.is_absolute() ? out : target / out;
}

fs::path BuildConfig::cache_path() const {
    fs::path p(cache);
    return p.is_absolute() ? p : target / p;
}

int BuildConfig::resolved_jobs() const {
    if (jobs > 0)
        return jobs;
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : static_cast<int>(hw);
}

// ============================================================================
// Value Parsing
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Removes a trailing `# comment` that is not inside a quoted string.
std::string_view strip_comment(std::string_view s) {
    bool in_string = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\\' && in_string) {
            ++i;
        } else if (c == '"') {
            in_string = !in_string;
        } else if (c == '#' && !in_string) {
            return s.substr(0, i);
        }
    }
    return s;
}

/// Parses `"..."` with \" \\ \t \n escapes. Returns false on malformed input.
bool parse_string(std::string_view v, std::string& out) {
    if (v.size() < 2 || v.front() != '"' || v.back() != '"')
        return false;
    out.clear();
    for (size_t i = 1; i + 1 < v.size(); ++i) {
        char c = v[i];
        if (c == '\\') {
            if (i + 2 >= v.size())
                return false;
            char n = v[++i];
            switch (n) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case '"':
            case '\\':
                out += n;
                break;
            default:
                return false;
            }
        } else if (c == '"') {
            return false;
        } else {
            out += c;
        }
    }
    return true;
}

bool parse_int(std::string_view v, int& out) {
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    return ec == std::errc() && ptr == v.data() + v.size();
}

bool parse_bool(std::string_view v, bool& out) {
    if (v == "true") {
        out = true;
        return true;
    }
    if (v == "false") {
        out = false;
        return true;
    }
    return false;
}

/// Parses `["a", "b"]`. Elements must be quoted strings.
bool parse_string_array(std::string_view v, std::vector<std::string>& out) {
    if (v.size() < 2 || v.front() != '[' || v.back() != ']')
        return false;
    out.clear();
    std::string_view body = trim(v.substr(1, v.size() - 2));
    size_t pos = 0;
    while (pos < body.size()) {
        size_t start = body.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos)
            break;
        if (body[start] != '"')
            return false;
        size_t end = start + 1;
        while (end < body.size() && body[end] != '"') {
            end += body[end] == '\\' ? 2 : 1;
        }
        if (end >= body.size())
            return false;
        std::string item;
        if (!parse_string(body.substr(start, end - start + 1), item))
            return false;
        out.push_back(std::move(item));

        size_t next = body.find_first_not_of(" \t", end + 1);
        if (next == std::string_view::npos)
            break;
        if (body[next] != ',')
            return false;
        pos = next + 1;
    }
    return true;
}

} // namespace

// ============================================================================
// Config File Parsing
// ============================================================================

Result<BuildConfig, ConfigError> parse_build_config(std::string_view text,
                                                    const std::string& origin, BuildConfig base) {
    BuildConfig config = std::move(base);
    std::string section;
    int line_no = 0;

    std::istringstream in{std::string(text)};
    std::string raw;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string_view line = trim(strip_comment(raw));
        if (line.empty())
            continue;

        auto fail = [&](const std::string& message) -> Result<BuildConfig, ConfigError> {
            return ConfigError{origin, line_no, message};
        };

        // Section headers
        if (line.front() == '[') {
            if (line.back() != ']')
                return fail("unterminated section header");
            section = std::string(trim(line.substr(1, line.size() - 2)));
            if (section != "build" && section != "toolchain" && section != "clean" &&
                section != "install") {
                CYFORGE_LOG_WARN("config", origin << ":" << line_no << ": unknown section ["
                                                  << section << "]");
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos)
            return fail("expected `key = value`");

        std::string key(trim(line.substr(0, eq)));
        std::string_view value = trim(line.substr(eq + 1));
        if (key.empty())
            return fail("missing key before `=`");
        if (value.empty())
            return fail("missing value for `" + key + "`");

        bool ok = true;
        bool known = true;

        if (section == "build") {
            if (key == "extensions") {
                ok = parse_string_array(value, config.extensions);
            } else if (key == "output") {
                ok = parse_string(value, config.output);
            } else if (key == "jobs") {
                ok = parse_int(value, config.jobs) && config.jobs >= 0;
            } else if (key == "cache") {
                ok = parse_string(value, config.cache);
            } else if (key == "use_cache") {
                ok = parse_bool(value, config.use_cache);
            } else if (key == "exclude_file") {
                ok = parse_string(value, config.exclude_file);
            } else {
                known = false;
            }
        } else if (section == "toolchain") {
            auto& tc = config.toolchain;
            if (key == "command") {
                ok = parse_string_array(value, tc.command) && !tc.command.empty();
            } else if (key == "flags") {
                ok = parse_string_array(value, tc.flags);
            } else if (key == "version") {
                ok = parse_string(value, tc.version);
            } else if (key == "timeout") {
                ok = parse_int(value, tc.timeout_s) && tc.timeout_s >= 0;
            } else if (key == "grace_period_ms") {
                ok = parse_int(value, tc.grace_period_ms) && tc.grace_period_ms >= 0;
            } else {
                known = false;
            }
        } else if (section == "clean") {
            if (key == "keep") {
                ok = parse_string_array(value, config.clean.keep);
            } else if (key == "artifact_extensions") {
                ok = parse_string_array(value, config.clean.artifact_extensions);
            } else if (key == "artifact_dirs") {
                ok = parse_string_array(value, config.clean.artifact_dirs);
            } else {
                known = false;
            }
        } else if (section == "install") {
            if (key == "auto_install_missing") {
                ok = parse_bool(value, config.install.auto_install_missing);
            } else if (key == "check_imports") {
                ok = parse_bool(value, config.install.check_imports);
            } else if (key == "python") {
                ok = parse_string(value, config.install.python) && !config.install.python.empty();
            } else {
                known = false;
            }
        } else {
            known = false;
        }

        if (!ok)
            return fail("invalid value for `" + key + "`: " + std::string(value));
        if (!known) {
            CYFORGE_LOG_WARN("config", origin << ":" << line_no << ": ignoring unknown key `"
                                              << key << "`");
        }
    }

    return config;
}

Result<BuildConfig, ConfigError> load_build_config(const fs::path& file, BuildConfig base) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return base;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return ConfigError{file.string(), 0, "cannot open configuration file"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    CYFORGE_LOG_DEBUG("config", "Loading " << file.string());
    return parse_build_config(ss.str(), file.string(), std::move(base));
}

} // namespace cyforge::config
