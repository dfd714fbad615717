//! # Path Matcher
//!
//! Compiles ignore-file rules into a predicate over paths relative to the
//! target root.
//!
//! ## Pattern Syntax
//!
//! | Syntax      | Meaning                                               |
//! |-------------|-------------------------------------------------------|
//! | `*`         | any run of characters except `/`                      |
//! | `?`         | exactly one character except `/`                      |
//! | `[a-z]`     | one character from the class, `[!..]`/`[^..]` negates |
//! | `**`        | zero or more whole directories                        |
//! | `/x`        | anchored at the root                                  |
//! | `a/b`       | a `/` anywhere but the end also anchors               |
//! | `x/`        | directories only                                      |
//! | `!x`        | re-include                                            |
//! | `\c`        | literal `c`                                           |
//!
//! ## Evaluation
//!
//! A rule that matches a directory matches everything beneath it. For each
//! rule the deepest matching prefix of the path is found; the rule with the
//! deepest match decides, and among equally deep matches the later rule
//! wins. So `["build/", "!build/keep.ext"]` keeps `build/keep.ext` and
//! excludes the rest of `build/`, and `["*.tmp", "!important.tmp"]` keeps
//! `important.tmp`.
//!
//! Patterns are tokenised once by `compile()`; matching only walks the
//! pre-built tokens.

#ifndef CYFORGE_MATCHER_PATH_MATCHER_HPP
#define CYFORGE_MATCHER_PATH_MATCHER_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cyforge::matcher {

namespace fs = std::filesystem;

/// One line of an exclusion file, with its prefix/suffix markers decoded.
struct ExclusionRule {
    std::string raw;             ///< The line as written (trailing blanks removed)
    std::string pattern;         ///< Glob body without `!`, leading `/` or trailing `/`
    bool negated = false;        ///< `!pattern`
    bool directory_only = false; ///< `pattern/`
    bool anchored = false;       ///< Leading `/` or an inner `/`
    size_t source_line = 0;      ///< 1-based line in the source file, 0 if synthetic
};

/// Ordered rules; later rules win ties.
using ExclusionRuleSet = std::vector<ExclusionRule>;

/// Decodes one rule line. Returns false for blank lines and comments.
bool parse_rule(std::string_view line, ExclusionRule& out);

/// Parses exclusion-file text, one rule per line.
ExclusionRuleSet parse_rules(std::string_view text);

/// Reads `<target>/<file_name>`, or `<target>/.gitignore` when that is
/// absent. No file at all yields an empty rule set.
ExclusionRuleSet load_exclusion_rules(const fs::path& target,
                                      const std::string& file_name = "exclude.txt");

class PathMatcher {
public:
    /// A matcher without rules; excludes nothing.
    PathMatcher() = default;

    /// Tokenises every rule. Fails on the first malformed pattern.
    static Result<PathMatcher, PatternError> compile(const ExclusionRuleSet& rules);

    /// True if `relative_path` (forward slashes, no leading `/`) is excluded.
    bool is_excluded(std::string_view relative_path, bool is_directory = false) const;

    /// True if `relative_dir` is excluded and no negation could re-include
    /// anything beneath it, so a walk may skip the whole subtree.
    bool can_prune(std::string_view relative_dir) const;

    size_t rule_count() const {
        return rules_.size();
    }

private:
    enum class TokenKind { Literal, Star, Question, Class };

    struct Token {
        TokenKind kind = TokenKind::Literal;
        std::string literal;                          ///< Literal
        std::vector<std::pair<char, char>> ranges;    ///< Class, inclusive
        bool class_negated = false;                   ///< Class
    };

    struct Segment {
        bool double_star = false;
        std::vector<Token> tokens;
    };

    struct CompiledRule {
        std::vector<Segment> segments;
        bool negated = false;
        bool directory_only = false;
    };

    static bool match_tokens(const std::vector<Token>& tokens, size_t ti, std::string_view s);

    static bool match_segment(const Segment& seg, std::string_view name);

    /// Length of the deepest prefix of `components` the rule matches, 0 for none.
    static size_t match_depth(const CompiledRule& rule,
                              const std::vector<std::string_view>& components,
                              bool is_directory);

    /// True if the rule could match a prefix longer than `components`.
    static bool can_match_below(const CompiledRule& rule,
                                const std::vector<std::string_view>& components);

    std::vector<CompiledRule> rules_;
    bool has_negation_ = false;
};

/// Splits a relative path on `/`, dropping empty and `.` components.
std::vector<std::string_view> split_path(std::string_view relative_path);

} // namespace cyforge::matcher

#endif // CYFORGE_MATCHER_PATH_MATCHER_HPP
