#include "utils.hpp"

#include "common.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cyforge::cli {

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos)
            break;
        size_t end = text.find_first_of(" \t", start);
        if (end == std::string_view::npos)
            end = text.size();
        words.emplace_back(text.substr(start, end - start));
        pos = end;
    }
    return words;
}

std::string format_size(uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 3) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit_index == 0 ? 0 : 2) << size << " "
        << units[unit_index];
    return oss.str();
}

void print_usage() {
    std::cout << "cyforge " << VERSION << " - incremental Cython build orchestrator\n\n";
    std::cout << "Usage: cyforge -t <dir> [options]\n";
    std::cout << "       cyforge -l <library> [options]\n";
    std::cout << "       cyforge -c [-t <dir>] [--keep <pattern>]...\n";
    std::cout << "       cyforge --list [-t <dir>]\n\n";
    std::cout << "Modes:\n";
    std::cout << "  -t, --target <dir>   Annotate and compile every source under <dir>\n";
    std::cout << "  -l, --lib <name>     Rebuild an installed library and reinstall it\n";
    std::cout << "  -c, --clean          Remove build artifacts under the target\n";
    std::cout << "  --list               List compiled artifacts in the output directory\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -o, --output <dir>   Output directory (default: build_lib)\n";
    std::cout << "  -i, --install        Build a wheel and install it after the build\n";
    std::cout << "  -j, --jobs <n>       Worker threads (default: all cores)\n";
    std::cout << "  --no-cache           Rebuild every unit\n";
    std::cout << "  --flags \"<flags>\"    Compiler flags (replaces the defaults)\n";
    std::cout << "  --compiler \"<cmd>\"   Compiler command template\n";
    std::cout << "  --config <file>      Configuration file (default: <target>/cyforge.toml)\n";
    std::cout << "  --auto-install       Install missing modules and retry\n";
    std::cout << "  --no-import-check    Skip the pre-build import check\n";
    std::cout << "  --keep <pattern>     Never remove paths matching <pattern> (repeatable)\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv              Debug / trace output\n";
    std::cout << "  -q, --quiet          Warnings and errors only\n";
    std::cout << "  --log-level=<lvl>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>  Per-module levels, e.g. build=debug,*=warn\n";
    std::cout << "  --log-file=<path>    Also write log records to <path>\n";
    std::cout << "  --log-format=json    Structured log output\n";
    std::cout << "\nExit codes: 0 success, 1 a unit or the run failed, 2 usage or "
                 "configuration error\n";
}

void print_version() {
    std::cout << "cyforge " << VERSION << "\n";
}

} // namespace cyforge::cli
