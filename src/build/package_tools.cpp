//! # Package Tools
//!
//! Interpreter-backed packaging and installation.

#include "build/package_tools.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace cyforge::build {

namespace {

std::string tail_of(const std::string& output, size_t max_lines = 20) {
    size_t pos = output.size();
    size_t lines = 0;
    while (pos > 0 && lines <= max_lines) {
        pos = output.rfind('\n', pos - 1);
        if (pos == std::string::npos) {
            return output;
        }
        ++lines;
    }
    return output.substr(pos + 1);
}

std::string describe_failure(const std::string& what, const ProcessResult& result) {
    std::string msg = what;
    if (!result.launched) {
        msg += ": could not start the interpreter";
    } else if (result.timed_out) {
        msg += ": timed out";
    } else if (result.cancelled) {
        msg += ": cancelled";
    } else {
        msg += " (exit " + std::to_string(result.exit_code) + ")";
    }
    if (!result.output.empty()) {
        msg += "\n" + tail_of(result.output);
    }
    return msg;
}

bool is_identifier(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

/// `a.b.c` -> `a`, or "" when the dotted name is not a module path.
std::string top_level_of(std::string_view dotted) {
    dotted = trim(dotted);
    if (auto space = dotted.find_first_of(" \t"); space != std::string_view::npos)
        dotted = dotted.substr(0, space);
    auto top = dotted.substr(0, dotted.find('.'));
    return is_identifier(top) ? std::string(top) : std::string();
}

size_t count_of(std::string_view line, std::string_view needle) {
    size_t n = 0;
    for (size_t pos = line.find(needle); pos != std::string_view::npos;
         pos = line.find(needle, pos + needle.size()))
        ++n;
    return n;
}

} // namespace

std::set<std::string> scan_imports(std::string_view source) {
    std::set<std::string> modules;
    std::string_view in_string; // Active triple-quote delimiter
    std::istringstream stream{std::string(source)};
    std::string raw;
    while (std::getline(stream, raw)) {
        auto line = trim(raw);

        if (!in_string.empty()) {
            if (count_of(line, in_string) % 2 == 1)
                in_string = {};
            continue;
        }
        for (std::string_view quote : {"\"\"\"", "'''"}) {
            if (count_of(line, quote) % 2 == 1) {
                in_string = quote;
                break;
            }
        }
        if (!in_string.empty() && !line.starts_with("import ") && !line.starts_with("from "))
            continue;

        if (auto hash = line.find('#'); hash != std::string_view::npos)
            line = trim(line.substr(0, hash));
        if (auto semi = line.find(';'); semi != std::string_view::npos)
            line = trim(line.substr(0, semi));

        if (line.starts_with("import ")) {
            auto names = line.substr(7);
            size_t start = 0;
            while (start <= names.size()) {
                auto comma = names.find(',', start);
                auto part = names.substr(start, comma == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : comma - start);
                if (auto top = top_level_of(part); !top.empty())
                    modules.insert(std::move(top));
                if (comma == std::string_view::npos)
                    break;
                start = comma + 1;
            }
        } else if (line.starts_with("from ")) {
            auto rest = trim(line.substr(5));
            if (rest.starts_with("."))
                continue;
            auto top = top_level_of(rest);
            if (!top.empty() && top != "__future__")
                modules.insert(std::move(top));
        }
    }
    return modules;
}

Result<fs::path, std::string> find_newest_wheel(const fs::path& dist_dir) {
    std::error_code ec;
    std::vector<fs::path> wheels;
    for (fs::directory_iterator it(dist_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".whl" && it->is_regular_file(ec)) {
            wheels.push_back(it->path());
        }
    }
    if (wheels.empty()) {
        return std::string("no wheel found in " + dist_dir.string());
    }
    std::sort(wheels.begin(), wheels.end());
    return wheels.back();
}

ProcessPackageTools::ProcessPackageTools(ProcessPackageToolsOptions options)
    : options_(std::move(options)) {}

ProcessResult ProcessPackageTools::run(const std::vector<std::string>& args,
                                       const fs::path& working_dir) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.python);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions opts;
    opts.timeout = options_.timeout;
    opts.cancel = options_.cancel;
    opts.working_dir = working_dir.string();

    CYFORGE_LOG_DEBUG("install", "$ " << format_command(argv));
    auto result = run_process(argv, opts);
    CYFORGE_LOG_TRACE("install", result.output);
    return result;
}

Result<fs::path, std::string> ProcessPackageTools::build_wheel(const fs::path& project_dir) {
    CYFORGE_LOG_INFO("install", "Building wheel in " << project_dir.string());
    auto result = run({"-m", "build", "--wheel"}, project_dir);
    if (!result.launched || result.exit_code != 0) {
        return describe_failure("wheel build failed", result);
    }
    return find_newest_wheel(project_dir / "dist");
}

Result<bool, std::string> ProcessPackageTools::install_wheel(const fs::path& wheel) {
    CYFORGE_LOG_INFO("install", "Installing " << wheel.filename().string());
    auto result = run({"-m", "pip", "install", "--upgrade", wheel.string()});
    if (!result.launched || result.exit_code != 0) {
        return describe_failure("pip install of " + wheel.filename().string() + " failed", result);
    }
    return true;
}

Result<bool, std::string> ProcessPackageTools::install_module(const std::string& name) {
    CYFORGE_LOG_INFO("install", "Installing missing module '" << name << "'");
    auto result = run({"-m", "pip", "install", name});
    if (!result.launched || result.exit_code != 0) {
        return describe_failure("pip install " + name + " failed", result);
    }
    return true;
}

Result<fs::path, std::string> ProcessPackageTools::locate_library(const std::string& name) {
    // The name is passed as argv[1], never spliced into the program text
    static const std::string PROGRAM =
        "import importlib.util, sys\n"
        "spec = importlib.util.find_spec(sys.argv[1])\n"
        "if spec is None or not spec.origin:\n"
        "    sys.exit(3)\n"
        "print(spec.origin)\n";

    auto result = run({"-c", PROGRAM, name});
    if (result.launched && result.exit_code == 3) {
        return std::string("library '" + name + "' is not installed");
    }
    if (!result.launched || result.exit_code != 0) {
        return describe_failure("lookup of '" + name + "' failed", result);
    }

    std::string origin = result.output;
    while (!origin.empty() && (origin.back() == '\n' || origin.back() == '\r')) {
        origin.pop_back();
    }
    if (auto nl = origin.rfind('\n'); nl != std::string::npos) {
        origin = origin.substr(nl + 1);
    }

    fs::path dir = fs::path(origin).parent_path();
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        return std::string("library '" + name + "' has no source directory (" + origin + ")");
    }
    return dir;
}

Result<std::set<std::string>, std::string>
ProcessPackageTools::find_missing_modules(const std::set<std::string>& names) {
    std::set<std::string> missing;
    if (names.empty())
        return missing;

    // Names arrive as argv; one interpreter run for the whole batch
    static const std::string PROGRAM = "import importlib.util, sys\n"
                                     "for name in sys.argv[1:]:\n"
                                     "    try:\n"
                                     "        found = importlib.util.find_spec(name) is not None\n"
                                     "    except (ImportError, ValueError):\n"
                                     "        found = False\n"
                                     "    if not found:\n"
                                     "        print(name)\n";

    std::vector<std::string> args = {"-c", PROGRAM};
    args.insert(args.end(), names.begin(), names.end());
    auto result = run(args);
    if (!result.launched || result.exit_code != 0) {
        return describe_failure("import check failed", result);
    }

    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (names.count(line))
            missing.insert(line);
    }
    return missing;
}

} // namespace cyforge::build
