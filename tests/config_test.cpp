//! # Configuration Tests

#include "config/build_config.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace cyforge;
using namespace cyforge::config;

TEST(BuildConfigTest, Defaults) {
    BuildConfig config;
    config.target = "/work/proj";
    EXPECT_EQ(config.output_dir(), fs::path("/work/proj/build_lib"));
    EXPECT_EQ(config.cache_path(), fs::path("/work/proj/.cyforge/fingerprints.idx"));
    EXPECT_GE(config.resolved_jobs(), 1);
    EXPECT_EQ(config.extensions, (std::vector<std::string>{".py"}));
    EXPECT_TRUE(config.use_cache);
    EXPECT_FALSE(config.install.auto_install_missing);
    EXPECT_TRUE(config.install.check_imports);
}

TEST(BuildConfigTest, AbsoluteOutputIsKept) {
    BuildConfig config;
    config.target = "/work/proj";
    config.output = "/tmp/out";
    EXPECT_EQ(config.output_dir(), fs::path("/tmp/out"));
}

TEST(ParseBuildConfigTest, ReadsEverySection) {
    auto result = parse_build_config(R"(
# project settings
[build]
extensions = [".py", ".pyx"]   # both
output = "out"
jobs = 3
use_cache = false

[toolchain]
command = ["cython", "{flags}", "{input}"]
flags = ["-X", "boundscheck=False"]
version = "3.0.11"
timeout = 60

[clean]
keep = ["data/", "*.keep"]

[install]
auto_install_missing = true
check_imports = false
python = "/usr/bin/python3.11"
)",
                                     "cyforge.toml");
    ASSERT_TRUE(is_ok(result));
    const auto& c = unwrap(result);
    EXPECT_EQ(c.extensions, (std::vector<std::string>{".py", ".pyx"}));
    EXPECT_EQ(c.output, "out");
    EXPECT_EQ(c.jobs, 3);
    EXPECT_FALSE(c.use_cache);
    EXPECT_EQ(c.toolchain.command, (std::vector<std::string>{"cython", "{flags}", "{input}"}));
    EXPECT_EQ(c.toolchain.flags, (std::vector<std::string>{"-X", "boundscheck=False"}));
    EXPECT_EQ(c.toolchain.version, "3.0.11");
    EXPECT_EQ(c.toolchain.timeout_s, 60);
    EXPECT_EQ(c.clean.keep, (std::vector<std::string>{"data/", "*.keep"}));
    EXPECT_TRUE(c.install.auto_install_missing);
    EXPECT_FALSE(c.install.check_imports);
    EXPECT_EQ(c.install.python, "/usr/bin/python3.11");
}

TEST(ParseBuildConfigTest, LayersOnTopOfBase) {
    BuildConfig base;
    base.target = "/src";
    base.jobs = 7;

    auto result = parse_build_config("[build]\noutput = \"o\"\n", "x", base);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).target, fs::path("/src"));
    EXPECT_EQ(unwrap(result).jobs, 7);
    EXPECT_EQ(unwrap(result).output, "o");
}

TEST(ParseBuildConfigTest, StringEscapesAndHashInsideString) {
    auto result = parse_build_config("[build]\noutput = \"a#b \\\"q\\\"\"  # trailing\n", "x");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).output, "a#b \"q\"");
}

TEST(ParseBuildConfigTest, UnknownKeysAndSectionsAreIgnored) {
    auto result = parse_build_config("[build]\ncolour = \"blue\"\n[future]\nx = 1\n", "x");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).output, "build_lib");
}

TEST(ParseBuildConfigTest, ErrorsCarryLineNumbers) {
    struct Case {
        const char* text;
        int line;
    };
    const Case cases[] = {
        {"[build]\njobs = many\n", 2},
        {"[build]\n\njobs = -1\n", 3},
        {"[build\n", 1},
        {"[build]\noutput\n", 2},
        {"[build]\noutput = unquoted\n", 2},
        {"[build]\nextensions = [\".py\" \".pyx\"]\n", 2},
        {"[toolchain]\ncommand = []\n", 2},
        {"[install]\nauto_install_missing = yes\n", 2},
        {"[build]\nuse_cache =\n", 2},
    };
    for (const auto& c : cases) {
        auto result = parse_build_config(c.text, "cyforge.toml");
        ASSERT_TRUE(is_err(result)) << c.text;
        EXPECT_EQ(unwrap_err(result).line, c.line) << c.text;
        EXPECT_EQ(unwrap_err(result).path, "cyforge.toml");
    }
}

class LoadConfigTest : public cyforge::testing::TempDirTest {};

TEST_F(LoadConfigTest, MissingFileReturnsBase) {
    BuildConfig base;
    base.jobs = 5;
    auto result = load_build_config(root_ / "cyforge.toml", base);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).jobs, 5);
}

TEST_F(LoadConfigTest, ReadsFileAndReportsItsPath) {
    write("cyforge.toml", "[build]\njobs = 2\n");
    auto ok = load_build_config(root_ / "cyforge.toml");
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).jobs, 2);

    write("bad.toml", "[build]\njobs = x\n");
    auto bad = load_build_config(root_ / "bad.toml");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).path, (root_ / "bad.toml").string());
    EXPECT_EQ(unwrap_err(bad).line, 2);
}
