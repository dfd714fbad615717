//! # Toolchain
//!
//! Child-process compiler and diagnostics classification.

#include "build/toolchain.hpp"

#include "common/content_hash.hpp"
#include "log/log.hpp"

namespace cyforge::build {

// ============================================================================
// ProcessToolchain
// ============================================================================

ProcessToolchain::ProcessToolchain(ProcessToolchainOptions options)
    : options_(std::move(options)) {}

std::string ProcessToolchain::version() const {
    std::call_once(version_once_, [this] {
        if (!options_.version.empty()) {
            version_ = options_.version;
            return;
        }
        if (options_.command.empty()) {
            version_ = "unknown";
            return;
        }

        ProcessOptions query;
        query.timeout = std::chrono::seconds(30);
        auto result = run_process({options_.command.front(), "--version"}, query);

        std::string text = result.output;
        while (!text.empty() &&
               (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
            text.pop_back();
        }
        if (auto nl = text.find('\n'); nl != std::string::npos) {
            text.resize(nl);
        }

        if (result.launched && result.exit_code == 0 && !text.empty()) {
            version_ = text;
        } else {
            version_ = options_.command.front() + " (version unknown)";
            CYFORGE_LOG_WARN("build", "Could not determine the version of '"
                                          << options_.command.front()
                                          << "'; set [toolchain] version");
        }
        CYFORGE_LOG_DEBUG("build", "Toolchain version: " << version_);
    });
    return version_;
}

std::vector<std::string> ProcessToolchain::expand_command(const CompileRequest& request) const {
    std::vector<std::string> argv;
    argv.reserve(options_.command.size() + request.flags.size());

    auto replace_all = [](std::string s, std::string_view from, const std::string& to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    };

    std::string input = request.source.string();
    std::string output_dir = request.output_dir.string();

    for (const auto& arg : options_.command) {
        if (arg == "{flags}") {
            argv.insert(argv.end(), request.flags.begin(), request.flags.end());
            continue;
        }
        std::string expanded = replace_all(arg, "{input}", input);
        expanded = replace_all(std::move(expanded), "{output_dir}", output_dir);
        argv.push_back(std::move(expanded));
    }
    return argv;
}

CompileOutcome ProcessToolchain::compile(const CompileRequest& request,
                                         const CancellationToken* cancel) {
    auto argv = expand_command(request);
    CYFORGE_LOG_DEBUG("build", "$ " << format_command(argv));

    ProcessOptions opts;
    opts.timeout = options_.timeout;
    opts.grace_period = options_.grace_period;
    opts.cancel = cancel;

    auto result = run_process(argv, opts);

    CompileOutcome outcome;
    outcome.output = std::move(result.output);
    if (!result.launched) {
        outcome.exit_code = -1;
        outcome.output = "failed to launch '" + argv.front() + "': " + outcome.output;
    } else if (result.exit_code == 127 && outcome.output.empty()) {
        outcome.exit_code = 127;
        outcome.output = "command not found: " + argv.front();
    } else {
        outcome.exit_code = result.exit_code;
    }
    return outcome;
}

// ============================================================================
// Diagnostics
// ============================================================================

namespace {

bool is_module_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.';
}

/// Reads a (possibly quoted) dotted module name starting at `pos`.
std::string read_module_name(const std::string& text, size_t pos) {
    while (pos < text.size() && text[pos] == ' ')
        ++pos;
    if (pos < text.size() && (text[pos] == '\'' || text[pos] == '"'))
        ++pos;
    size_t end = pos;
    while (end < text.size() && is_module_char(text[end]))
        ++end;
    std::string name = text.substr(pos, end - pos);
    while (!name.empty() && name.back() == '.')
        name.pop_back();
    return name;
}

} // namespace

std::optional<std::string> detect_missing_module(const std::string& output) {
    constexpr std::string_view NO_MODULE = "No module named";
    if (auto pos = output.find(NO_MODULE); pos != std::string::npos) {
        auto name = read_module_name(output, pos + NO_MODULE.size());
        if (!name.empty())
            return name;
    }

    // Cython: "'numpy.pxd' not found" or "'pkg/sub.pxd' not found"
    constexpr std::string_view PXD_NOT_FOUND = ".pxd' not found";
    if (auto pos = output.find(PXD_NOT_FOUND); pos != std::string::npos) {
        auto open = output.rfind('\'', pos);
        if (open != std::string::npos) {
            std::string name = output.substr(open + 1, pos - open - 1);
            for (char& c : name) {
                if (c == '/' || c == '\\')
                    c = '.';
            }
            if (!name.empty())
                return name;
        }
    }

    constexpr std::string_view NOT_FOUND_ERROR = "ModuleNotFoundError";
    if (auto pos = output.find(NOT_FOUND_ERROR); pos != std::string::npos) {
        size_t after = pos + NOT_FOUND_ERROR.size();
        if (after < output.size() && output[after] == ':')
            ++after;
        auto name = read_module_name(output, after);
        return name.empty() ? std::string("<unknown>") : name;
    }

    return std::nullopt;
}

std::string toolchain_tag(const Toolchain& toolchain, const std::vector<std::string>& flags) {
    std::string joined;
    for (const auto& flag : flags) {
        joined += flag;
        joined += '\0';
    }
    return toolchain.version() + "+flags:" + hash_bytes(joined).substr(0, 12);
}

} // namespace cyforge::build
