//! # Path Matcher
//!
//! Rule parsing, tokenisation and prefix-depth evaluation.
//!
//! ## Compiled Form
//!
//! ```text
//! "src/**/gen_*.py"  →  [Literal "src"] [**] [Literal "gen_", Star, Literal ".py"]
//! "*.tmp"            →  [**] [Star, Literal ".tmp"]        (unanchored)
//! "cache/**"         →  [Literal "cache"] [Star]           (trailing ** = one or more)
//! ```

#include "matcher/path_matcher.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace cyforge::matcher {

// ============================================================================
// Rule Parsing
// ============================================================================

bool parse_rule(std::string_view line, ExclusionRule& out) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    // Trailing blanks are dropped unless escaped
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        if (line.size() >= 2 && line[line.size() - 2] == '\\')
            break;
        line.remove_suffix(1);
    }
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string_view::npos)
        return false;
    line.remove_prefix(start);

    if (line.front() == '#')
        return false;

    out = ExclusionRule{};
    out.raw = std::string(line);

    if (line.front() == '!') {
        out.negated = true;
        line.remove_prefix(1);
    } else if (line.starts_with("\\!") || line.starts_with("\\#")) {
        line.remove_prefix(1);
    }

    while (!line.empty() && line.back() == '/' &&
           !(line.size() >= 2 && line[line.size() - 2] == '\\')) {
        out.directory_only = true;
        line.remove_suffix(1);
    }

    if (!line.empty() && line.front() == '/') {
        out.anchored = true;
        while (!line.empty() && line.front() == '/') {
            line.remove_prefix(1);
        }
    }

    if (line.find('/') != std::string_view::npos) {
        out.anchored = true;
    }

    out.pattern = std::string(line);
    return true;
}

ExclusionRuleSet parse_rules(std::string_view text) {
    ExclusionRuleSet rules;
    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos)
            nl = text.size();
        ++line_no;

        ExclusionRule rule;
        if (parse_rule(text.substr(pos, nl - pos), rule)) {
            rule.source_line = line_no;
            rules.push_back(std::move(rule));
        }
        pos = nl + 1;
    }
    return rules;
}

ExclusionRuleSet load_exclusion_rules(const fs::path& target, const std::string& file_name) {
    std::error_code ec;
    fs::path chosen = target / file_name;
    if (!fs::is_regular_file(chosen, ec)) {
        chosen = target / ".gitignore";
        if (!fs::is_regular_file(chosen, ec)) {
            CYFORGE_LOG_DEBUG("matcher", "No exclusion file under " << target.string());
            return {};
        }
    }

    std::ifstream file(chosen, std::ios::binary);
    if (!file) {
        CYFORGE_LOG_WARN("matcher", "Cannot read " << chosen.string() << ", excluding nothing");
        return {};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto rules = parse_rules(ss.str());
    CYFORGE_LOG_INFO("matcher", "Loaded " << rules.size() << " exclusion rules from "
                                          << chosen.filename().string());
    return rules;
}

std::vector<std::string_view> split_path(std::string_view relative_path) {
    std::vector<std::string_view> out;
    size_t pos = 0;
    while (pos <= relative_path.size()) {
        size_t slash = relative_path.find('/', pos);
        if (slash == std::string_view::npos)
            slash = relative_path.size();
        auto part = relative_path.substr(pos, slash - pos);
        if (!part.empty() && part != ".")
            out.push_back(part);
        pos = slash + 1;
    }
    return out;
}

// ============================================================================
// Compilation
// ============================================================================

namespace {

/// Splits on `/` that is not escaped. Empty segments are dropped.
std::vector<std::string_view> split_pattern(std::string_view pattern) {
    std::vector<std::string_view> segs;
    size_t begin = 0;
    for (size_t i = 0; i <= pattern.size(); ++i) {
        if (i + 1 < pattern.size() && pattern[i] == '\\') {
            ++i;
            continue;
        }
        if (i == pattern.size() || pattern[i] == '/') {
            if (i > begin)
                segs.push_back(pattern.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    return segs;
}

} // namespace

Result<PathMatcher, PatternError> PathMatcher::compile(const ExclusionRuleSet& rules) {
    PathMatcher matcher;
    matcher.rules_.reserve(rules.size());

    for (size_t index = 0; index < rules.size(); ++index) {
        const auto& rule = rules[index];
        auto fail = [&](std::string message) -> Result<PathMatcher, PatternError> {
            return PatternError{index, rule.source_line, rule.raw, std::move(message)};
        };

        if (rule.pattern.empty()) {
            return fail(rule.negated ? "empty negation" : "empty pattern");
        }

        CompiledRule compiled;
        compiled.negated = rule.negated;
        compiled.directory_only = rule.directory_only;

        if (!rule.anchored) {
            Segment any;
            any.double_star = true;
            compiled.segments.push_back(std::move(any));
        }

        for (std::string_view text : split_pattern(rule.pattern)) {
            Segment seg;
            if (text == "**") {
                if (!compiled.segments.empty() && compiled.segments.back().double_star)
                    continue;
                seg.double_star = true;
                compiled.segments.push_back(std::move(seg));
                continue;
            }

            for (size_t i = 0; i < text.size(); ++i) {
                char c = text[i];
                if (c == '\\') {
                    if (i + 1 >= text.size())
                        return fail("trailing backslash");
                    c = text[++i];
                } else if (c == '*') {
                    if (seg.tokens.empty() || seg.tokens.back().kind != TokenKind::Star)
                        seg.tokens.push_back(Token{TokenKind::Star, {}, {}, false});
                    continue;
                } else if (c == '?') {
                    seg.tokens.push_back(Token{TokenKind::Question, {}, {}, false});
                    continue;
                } else if (c == '[') {
                    Token cls;
                    cls.kind = TokenKind::Class;
                    size_t j = i + 1;
                    if (j < text.size() && (text[j] == '!' || text[j] == '^')) {
                        cls.class_negated = true;
                        ++j;
                    }
                    bool closed = false;
                    bool first = true;
                    while (j < text.size()) {
                        char lo = text[j];
                        if (lo == ']' && !first) {
                            closed = true;
                            break;
                        }
                        first = false;
                        if (lo == '\\' && j + 1 < text.size())
                            lo = text[++j];
                        char hi = lo;
                        if (j + 2 < text.size() && text[j + 1] == '-' && text[j + 2] != ']') {
                            hi = text[j + 2];
                            if (hi == '\\' && j + 3 < text.size()) {
                                hi = text[j + 3];
                                ++j;
                            }
                            j += 2;
                        }
                        if (hi < lo)
                            return fail("reversed range in bracket class");
                        cls.ranges.emplace_back(lo, hi);
                        ++j;
                    }
                    if (!closed)
                        return fail("unbalanced '[' in pattern");
                    seg.tokens.push_back(std::move(cls));
                    i = j;
                    continue;
                }

                if (seg.tokens.empty() || seg.tokens.back().kind != TokenKind::Literal)
                    seg.tokens.push_back(Token{TokenKind::Literal, {}, {}, false});
                seg.tokens.back().literal += c;
            }
            compiled.segments.push_back(std::move(seg));
        }

        // "dir/**" matches inside dir but not dir itself
        if (compiled.segments.size() > 1 && compiled.segments.back().double_star) {
            Segment one;
            one.tokens.push_back(Token{TokenKind::Star, {}, {}, false});
            compiled.segments.back() = std::move(one);
        }

        matcher.has_negation_ = matcher.has_negation_ || compiled.negated;
        matcher.rules_.push_back(std::move(compiled));
    }

    return matcher;
}

// ============================================================================
// Matching
// ============================================================================

bool PathMatcher::match_tokens(const std::vector<Token>& tokens, size_t ti, std::string_view s) {
    while (ti < tokens.size()) {
        const Token& tok = tokens[ti];
        switch (tok.kind) {
        case TokenKind::Literal:
            if (!s.starts_with(tok.literal))
                return false;
            s.remove_prefix(tok.literal.size());
            break;
        case TokenKind::Question:
            if (s.empty())
                return false;
            s.remove_prefix(1);
            break;
        case TokenKind::Class: {
            if (s.empty())
                return false;
            char c = s.front();
            bool hit = std::any_of(tok.ranges.begin(), tok.ranges.end(),
                                   [c](const auto& r) { return c >= r.first && c <= r.second; });
            if (hit == tok.class_negated)
                return false;
            s.remove_prefix(1);
            break;
        }
        case TokenKind::Star:
            if (ti + 1 == tokens.size())
                return true;
            for (size_t k = 0; k <= s.size(); ++k) {
                if (match_tokens(tokens, ti + 1, s.substr(k)))
                    return true;
            }
            return false;
        }
        ++ti;
    }
    return s.empty();
}

bool PathMatcher::match_segment(const Segment& seg, std::string_view name) {
    return match_tokens(seg.tokens, 0, name);
}

size_t PathMatcher::match_depth(const CompiledRule& rule,
                                const std::vector<std::string_view>& components,
                                bool is_directory) {
    const auto& segs = rule.segments;

    // Deepest ci reachable once every segment is consumed.
    auto deepest = [&](auto& self, size_t si, size_t ci) -> size_t {
        if (si == segs.size()) {
            if (ci == 0)
                return 0;
            bool names_directory = ci < components.size() || is_directory;
            return (!rule.directory_only || names_directory) ? ci : 0;
        }
        const Segment& seg = segs[si];
        if (seg.double_star) {
            size_t best = 0;
            for (size_t k = components.size() + 1; k-- > ci;) {
                best = std::max(best, self(self, si + 1, k));
                if (best == components.size())
                    break;
            }
            return best;
        }
        if (ci < components.size() && match_segment(seg, components[ci]))
            return self(self, si + 1, ci + 1);
        return 0;
    };

    return deepest(deepest, 0, 0);
}

bool PathMatcher::can_match_below(const CompiledRule& rule,
                                  const std::vector<std::string_view>& components) {
    const auto& segs = rule.segments;

    auto extend = [&](auto& self, size_t si, size_t ci) -> bool {
        if (ci == components.size())
            return si < segs.size();
        if (si == segs.size())
            return false;
        const Segment& seg = segs[si];
        if (seg.double_star)
            return self(self, si + 1, ci) || self(self, si, ci + 1);
        return match_segment(seg, components[ci]) && self(self, si + 1, ci + 1);
    };

    return extend(extend, 0, 0);
}

bool PathMatcher::is_excluded(std::string_view relative_path, bool is_directory) const {
    if (rules_.empty())
        return false;

    auto components = split_path(relative_path);
    if (components.empty())
        return false;

    size_t best_depth = 0;
    const CompiledRule* winner = nullptr;
    for (const auto& rule : rules_) {
        size_t depth = match_depth(rule, components, is_directory);
        if (depth > 0 && depth >= best_depth) {
            best_depth = depth;
            winner = &rule;
        }
    }
    return winner != nullptr && !winner->negated;
}

bool PathMatcher::can_prune(std::string_view relative_dir) const {
    if (!is_excluded(relative_dir, true))
        return false;
    if (!has_negation_)
        return true;

    auto components = split_path(relative_dir);
    for (const auto& rule : rules_) {
        if (rule.negated && can_match_below(rule, components))
            return false;
    }
    return true;
}

} // namespace cyforge::matcher
