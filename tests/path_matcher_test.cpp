//! # Path Matcher Tests
//!
//! Rule parsing, glob semantics, negation ordering, directory pruning and
//! pattern errors.

#include "matcher/path_matcher.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace cyforge;
using namespace cyforge::matcher;

namespace {

PathMatcher compile_or_die(std::string_view text) {
    auto result = PathMatcher::compile(parse_rules(text));
    EXPECT_TRUE(is_ok(result)) << "failed to compile: " << text;
    return is_ok(result) ? std::move(unwrap(result)) : PathMatcher{};
}

} // namespace

// ============================================================================
// Rule Parsing
// ============================================================================

TEST(ParseRuleTest, SkipsCommentsAndBlankLines) {
    auto rules = parse_rules("# comment\n\n   \n*.tmp\n  # indented comment\nbuild/\n");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].pattern, "*.tmp");
    EXPECT_EQ(rules[0].source_line, 4u);
    EXPECT_EQ(rules[1].pattern, "build");
    EXPECT_TRUE(rules[1].directory_only);
    EXPECT_EQ(rules[1].source_line, 6u);
}

TEST(ParseRuleTest, Flags) {
    ExclusionRule rule;
    ASSERT_TRUE(parse_rule("!/docs/", rule));
    EXPECT_TRUE(rule.negated);
    EXPECT_TRUE(rule.anchored);
    EXPECT_TRUE(rule.directory_only);
    EXPECT_EQ(rule.pattern, "docs");
    EXPECT_EQ(rule.raw, "!/docs/");

    ASSERT_TRUE(parse_rule("src/gen", rule));
    EXPECT_TRUE(rule.anchored) << "an inner slash anchors the pattern";
    EXPECT_FALSE(rule.negated);

    ASSERT_TRUE(parse_rule("\\!literal.py", rule));
    EXPECT_FALSE(rule.negated);
    EXPECT_EQ(rule.pattern, "!literal.py");
}

TEST(ParseRuleTest, CrlfLinesAreTrimmed) {
    auto rules = parse_rules("*.tmp\r\nbuild/\r\n");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].pattern, "*.tmp");
    EXPECT_EQ(rules[1].pattern, "build");
}

// ============================================================================
// Exclusion Semantics
// ============================================================================

TEST(PathMatcherTest, EmptyRuleSetExcludesNothing) {
    auto m = compile_or_die("");
    EXPECT_EQ(m.rule_count(), 0u);
    EXPECT_FALSE(m.is_excluded("a.py"));
    EXPECT_FALSE(m.can_prune("build"));
}

TEST(PathMatcherTest, DirectoryExclusionWithNegatedFile) {
    auto m = compile_or_die("build/\n!build/keep.ext\n");

    EXPECT_TRUE(m.is_excluded("build", true));
    EXPECT_TRUE(m.is_excluded("build/a.py"));
    EXPECT_TRUE(m.is_excluded("build/sub/b.py"));
    EXPECT_FALSE(m.is_excluded("build/keep.ext"));
    EXPECT_FALSE(m.is_excluded("src/a.py"));
}

TEST(PathMatcherTest, NegationAfterExcludeIncludes) {
    auto m = compile_or_die("*.tmp\n!important.tmp\n");

    EXPECT_TRUE(m.is_excluded("a.tmp"));
    EXPECT_TRUE(m.is_excluded("deep/dir/b.tmp"));
    EXPECT_FALSE(m.is_excluded("important.tmp"));
    EXPECT_FALSE(m.is_excluded("deep/important.tmp"));
}

TEST(PathMatcherTest, LaterRuleWinsAtEqualDepth) {
    auto m = compile_or_die("!a.py\na.py\n");
    EXPECT_TRUE(m.is_excluded("a.py"));

    auto n = compile_or_die("a.py\n!a.py\n");
    EXPECT_FALSE(n.is_excluded("a.py"));
}

TEST(PathMatcherTest, DeeperNegationBeatsDirectoryExclusion) {
    auto m = compile_or_die("vendor/\n!vendor/keep/\n");

    EXPECT_TRUE(m.is_excluded("vendor/x.py"));
    EXPECT_FALSE(m.is_excluded("vendor/keep/a.py"));
    EXPECT_FALSE(m.is_excluded("vendor/keep", true));
}

TEST(PathMatcherTest, AnchoredPatterns) {
    auto m = compile_or_die("/setup.py\ndocs/*.py\n");

    EXPECT_TRUE(m.is_excluded("setup.py"));
    EXPECT_FALSE(m.is_excluded("pkg/setup.py"));
    EXPECT_TRUE(m.is_excluded("docs/conf.py"));
    EXPECT_FALSE(m.is_excluded("pkg/docs/conf.py"));
    EXPECT_FALSE(m.is_excluded("docs/sub/conf.py")) << "* never crosses '/'";
}

TEST(PathMatcherTest, UnanchoredPatternsMatchAtAnyDepth) {
    auto m = compile_or_die("__pycache__\ntest_*.py\n");

    EXPECT_TRUE(m.is_excluded("__pycache__", true));
    EXPECT_TRUE(m.is_excluded("a/b/__pycache__/x.pyc"));
    EXPECT_TRUE(m.is_excluded("test_one.py"));
    EXPECT_TRUE(m.is_excluded("pkg/tests/test_two.py"));
    EXPECT_FALSE(m.is_excluded("pkg/helper.py"));
}

TEST(PathMatcherTest, DirectoryOnlyIgnoresFiles) {
    auto m = compile_or_die("logs/\n");

    EXPECT_FALSE(m.is_excluded("logs"));
    EXPECT_TRUE(m.is_excluded("logs", true));
    EXPECT_TRUE(m.is_excluded("logs/today.py"));
}

TEST(PathMatcherTest, DoubleStar) {
    auto m = compile_or_die("a/**/b\ncache/**\n");

    EXPECT_TRUE(m.is_excluded("a/b"));
    EXPECT_TRUE(m.is_excluded("a/x/y/b"));
    EXPECT_TRUE(m.is_excluded("a/x/b/file.py"));
    EXPECT_FALSE(m.is_excluded("a/x/c"));

    EXPECT_FALSE(m.is_excluded("cache", true)) << "dir/** matches inside dir only";
    EXPECT_TRUE(m.is_excluded("cache/x.py"));
    EXPECT_TRUE(m.is_excluded("cache/deep/x.py"));
}

TEST(PathMatcherTest, QuestionMarkAndClasses) {
    auto m = compile_or_die("file[0-9].py\n[!a]?.py\n");

    EXPECT_TRUE(m.is_excluded("file3.py"));
    EXPECT_FALSE(m.is_excluded("filex.py"));
    EXPECT_TRUE(m.is_excluded("bc.py"));
    EXPECT_FALSE(m.is_excluded("ac.py"));
    EXPECT_FALSE(m.is_excluded("b.py"));
}

TEST(PathMatcherTest, EscapedCharacters) {
    auto m = compile_or_die("\\#weird.py\nstar\\*.py\n");

    EXPECT_TRUE(m.is_excluded("#weird.py"));
    EXPECT_TRUE(m.is_excluded("star*.py"));
    EXPECT_FALSE(m.is_excluded("starX.py"));
}

// ============================================================================
// Pruning
// ============================================================================

TEST(PathMatcherTest, PrunesExcludedDirectoryWithoutNegations) {
    auto m = compile_or_die("build/\n*.tmp\n");

    EXPECT_TRUE(m.can_prune("build"));
    EXPECT_TRUE(m.can_prune("pkg/build"));
    EXPECT_FALSE(m.can_prune("src"));
}

TEST(PathMatcherTest, DoesNotPruneWhenNegationCanReinclude) {
    auto m = compile_or_die("build/\n!build/keep.ext\n");
    EXPECT_FALSE(m.can_prune("build"));

    auto unrelated = compile_or_die("build/\n!other/keep.ext\n");
    EXPECT_TRUE(unrelated.can_prune("build"));

    auto anywhere = compile_or_die("build/\n!keep.ext\n");
    EXPECT_FALSE(anywhere.can_prune("build")) << "an unanchored negation can match below";
}

// ============================================================================
// Errors
// ============================================================================

TEST(PathMatcherTest, UnbalancedBracketIsPatternError) {
    auto result = PathMatcher::compile(parse_rules("*.py\n\nfile[abc\n"));
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.rule_index, 1u);
    EXPECT_EQ(err.line, 3u);
    EXPECT_EQ(err.raw, "file[abc");
    EXPECT_NE(err.message.find("unbalanced"), std::string::npos);
}

TEST(PathMatcherTest, EmptyNegationIsPatternError) {
    auto result = PathMatcher::compile(parse_rules("!\n"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "empty negation");
}

TEST(PathMatcherTest, ReversedRangeIsPatternError) {
    auto result = PathMatcher::compile(parse_rules("[z-a].py\n"));
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("reversed"), std::string::npos);
}

// ============================================================================
// Exclusion File Loading
// ============================================================================

class ExclusionFileTest : public cyforge::testing::TempDirTest {};

TEST_F(ExclusionFileTest, PrefersExcludeFile) {
    write("exclude.txt", "a.py\n");
    write(".gitignore", "b.py\nc.py\n");

    auto rules = load_exclusion_rules(root_);
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].pattern, "a.py");
}

TEST_F(ExclusionFileTest, FallsBackToGitignore) {
    write(".gitignore", "b.py\nc.py\n");

    auto rules = load_exclusion_rules(root_);
    EXPECT_EQ(rules.size(), 2u);
}

TEST_F(ExclusionFileTest, NoFileMeansNoRules) {
    EXPECT_TRUE(load_exclusion_rules(root_).empty());
    EXPECT_TRUE(load_exclusion_rules(root_, "custom.txt").empty());
}
