//! # Annotator
//!
//! Single pass over the lines of a file. The only state carried between
//! lines is whether a triple-quoted string is open.

#include "annotate/annotator.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace cyforge::annotate {

namespace {

constexpr const char* FUNCTION_DIRECTIVES[] = {
    "# @boundscheck(False)",
    "# @wraparound(False)",
    "# @nonecheck(False)",
    "# @cdivision(True)",
};

constexpr const char* LOOP_DIRECTIVE = "# @boundscheck(False) @wraparound(False) (loop)";

struct Line {
    std::string_view body; ///< Without the line terminator
    bool crlf = false;
};

std::vector<Line> split_lines(std::string_view source, bool& trailing_newline) {
    std::vector<Line> lines;
    trailing_newline = !source.empty() && source.back() == '\n';
    size_t pos = 0;
    while (pos < source.size()) {
        size_t nl = source.find('\n', pos);
        if (nl == std::string_view::npos)
            nl = source.size();
        Line line{source.substr(pos, nl - pos), false};
        if (!line.body.empty() && line.body.back() == '\r') {
            line.body.remove_suffix(1);
            line.crlf = true;
        }
        lines.push_back(line);
        pos = nl + 1;
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool is_identifier(std::string_view s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front())))
        return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
            return false;
    }
    return true;
}

bool starts_with_keyword(std::string_view s, std::string_view keyword) {
    if (!s.starts_with(keyword))
        return false;
    if (s.size() == keyword.size())
        return true;
    char next = s[keyword.size()];
    return next == ' ' || next == '\t' || next == '(';
}

/// Updates the open triple-quote delimiter ("" when none) across one line.
void track_triple_quotes(std::string_view line, std::string& open_delim) {
    size_t i = 0;
    while (i < line.size()) {
        if (!open_delim.empty()) {
            if (line[i] == '\\') {
                i += 2;
            } else if (line.substr(i).starts_with(open_delim)) {
                i += 3;
                open_delim.clear();
            } else {
                ++i;
            }
            continue;
        }

        char c = line[i];
        if (c == '#')
            return;
        if (c == '"' || c == '\'') {
            std::string_view rest = line.substr(i);
            if (rest.starts_with("\"\"\"") || rest.starts_with("'''")) {
                open_delim = std::string(rest.substr(0, 3));
                i += 3;
                continue;
            }
            // Single-line string: skip to its closing quote
            ++i;
            while (i < line.size() && line[i] != c) {
                i += line[i] == '\\' ? 2 : 1;
            }
            ++i;
            continue;
        }
        ++i;
    }
}

enum class Construct { None, Function, RangeLoop, Loop };

Construct classify(std::string_view stripped, std::string& loop_var) {
    if (starts_with_keyword(stripped, "def") || starts_with_keyword(stripped, "cpdef") ||
        (starts_with_keyword(stripped, "async") &&
         starts_with_keyword(trim(stripped.substr(5)), "def"))) {
        return Construct::Function;
    }

    std::string_view loop = stripped;
    if (starts_with_keyword(loop, "async"))
        loop = trim(loop.substr(5));

    if (starts_with_keyword(loop, "for")) {
        std::string_view rest = trim(loop.substr(3));
        size_t end = rest.find_first_of(" \t");
        std::string_view var = rest.substr(0, end);
        if (is_identifier(var) && loop.find(" in range(") != std::string_view::npos) {
            loop_var = std::string(var);
            return Construct::RangeLoop;
        }
        return Construct::Loop;
    }
    if (starts_with_keyword(loop, "while"))
        return Construct::Loop;
    return Construct::None;
}

} // namespace

Annotator::Annotator(AnnotatorOptions options) : options_(std::move(options)) {}

std::string Annotator::annotate(std::string_view source) const {
    return annotate_counted(source).text;
}

AnnotatedSource Annotator::annotate_counted(std::string_view source) const {
    AnnotatedSource result;

    bool trailing_newline = false;
    auto lines = split_lines(source, trailing_newline);

    struct OutLine {
        std::string text;
        bool crlf;
    };
    std::vector<OutLine> out;
    out.reserve(lines.size() + lines.size() / 4 + 1);

    // Header goes after a shebang / encoding line, if any
    bool has_header = source.find("cimport cython") != std::string_view::npos;
    size_t header_at = 0;
    while (header_at < lines.size() && header_at < 2 &&
           (lines[header_at].body.starts_with("#!") ||
            lines[header_at].body.find("coding") != std::string_view::npos) &&
           lines[header_at].body.starts_with("#")) {
        ++header_at;
    }
    bool default_crlf = !lines.empty() && lines.front().crlf;

    // Inserts `directive` above the current line unless the comment block
    // directly above already contains it.
    auto insert_directive = [&](size_t block_start, std::string_view indent,
                                std::string_view directive, bool crlf) {
        for (size_t k = block_start; k < out.size(); ++k) {
            if (trim(out[k].text) == directive)
                return;
        }
        out.push_back(OutLine{std::string(indent) + std::string(directive), crlf});
        ++result.directives_added;
    };

    std::string open_delim;
    for (size_t idx = 0; idx < lines.size(); ++idx) {
        if (!has_header && idx == header_at) {
            out.push_back(OutLine{options_.header_line, default_crlf});
            ++result.directives_added;
            has_header = true;
        }

        const Line& line = lines[idx];

        if (!open_delim.empty()) {
            out.push_back(OutLine{std::string(line.body), line.crlf});
            track_triple_quotes(line.body, open_delim);
            continue;
        }

        std::string_view stripped = trim(line.body);
        if (stripped.empty() || stripped.front() == '#') {
            out.push_back(OutLine{std::string(line.body), line.crlf});
            continue;
        }

        std::string_view indent = line.body.substr(0, line.body.find_first_not_of(" \t"));

        // Comment lines directly above the construct
        size_t block_start = out.size();
        while (block_start > 0 && trim(out[block_start - 1].text).starts_with("#")) {
            --block_start;
        }

        std::string loop_var;
        switch (classify(stripped, loop_var)) {
        case Construct::Function:
            if (options_.annotate_functions) {
                for (const char* directive : FUNCTION_DIRECTIVES) {
                    insert_directive(block_start, indent, directive, line.crlf);
                }
            }
            break;
        case Construct::RangeLoop:
            if (options_.annotate_loops) {
                insert_directive(block_start, indent, "# cdef int " + loop_var + " (annotated)",
                                 line.crlf);
            }
            break;
        case Construct::Loop:
            if (options_.annotate_loops) {
                insert_directive(block_start, indent, LOOP_DIRECTIVE, line.crlf);
            }
            break;
        case Construct::None:
            break;
        }

        out.push_back(OutLine{std::string(line.body), line.crlf});
        track_triple_quotes(line.body, open_delim);
    }

    if (!has_header) {
        out.insert(out.begin() + static_cast<std::ptrdiff_t>(std::min(header_at, out.size())),
                   OutLine{options_.header_line, default_crlf});
        ++result.directives_added;
    }

    size_t total = 0;
    for (const auto& l : out) {
        total += l.text.size() + 2;
    }
    result.text.reserve(total);
    for (size_t i = 0; i < out.size(); ++i) {
        result.text += out[i].text;
        bool last = i + 1 == out.size();
        if (!last || trailing_newline) {
            if (out[i].crlf)
                result.text += '\r';
            result.text += '\n';
        }
    }
    return result;
}

Result<AnnotatedSource, std::string> Annotator::annotate_unit(const SourceUnit& unit) const {
    std::ifstream in(unit.absolute_path, std::ios::binary);
    if (!in) {
        return std::string("cannot read " + unit.absolute_path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::string("read error on " + unit.absolute_path.string());
    }

    auto annotated = annotate_counted(ss.str());
    CYFORGE_LOG_TRACE("annotate", unit.relative_path << ": " << annotated.directives_added
                                                     << " directives");
    return annotated;
}

} // namespace cyforge::annotate
