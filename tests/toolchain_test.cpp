//! # Toolchain Tests
//!
//! Command expansion, version probing, compile outcomes and import
//! failure classification.

#include "build/toolchain.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace cyforge;
using namespace cyforge::build;

namespace {

class FixedVersionToolchain : public Toolchain {
public:
    explicit FixedVersionToolchain(std::string version) : version_(std::move(version)) {}

    CompileOutcome compile(const CompileRequest&, const CancellationToken*) override {
        return {0, ""};
    }

    std::string version() const override {
        return version_;
    }

private:
    std::string version_;
};

} // namespace

// ============================================================================
// Command Expansion
// ============================================================================

TEST(ProcessToolchainTest, ExpandsPlaceholders) {
    ProcessToolchainOptions opts;
    opts.command = {"cc", "{flags}", "-o", "{output_dir}/out", "{input}"};
    opts.version = "1.0";
    ProcessToolchain tc(opts);

    CompileRequest req{"/src/a.pyx", "/build", {"-O2", "-march=native"}};
    EXPECT_EQ(tc.expand_command(req), (std::vector<std::string>{"cc", "-O2", "-march=native", "-o",
                                                                "/build/out", "/src/a.pyx"}));

    req.flags.clear();
    EXPECT_EQ(tc.expand_command(req),
              (std::vector<std::string>{"cc", "-o", "/build/out", "/src/a.pyx"}));
}

TEST(ProcessToolchainTest, DefaultCommandIsCythonize) {
    ProcessToolchain tc(ProcessToolchainOptions{});
    CompileRequest req{"a.pyx", "out", {"-X", "boundscheck=False"}};
    EXPECT_EQ(tc.expand_command(req), (std::vector<std::string>{"cythonize", "-i", "-3", "-X",
                                                                "boundscheck=False", "a.pyx"}));
}

// ============================================================================
// Compile
// ============================================================================

TEST(ProcessToolchainTest, CompileReportsExitCodeAndOutput) {
    ProcessToolchainOptions opts;
    opts.command = {"/bin/sh", "-c", "echo compiling \"$@\"; exit 3", "cc", "{flags}", "{input}"};
    opts.version = "1.0";
    ProcessToolchain tc(opts);

    auto outcome = tc.compile(CompileRequest{"mod.pyx", "out", {"-O3"}}, nullptr);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_NE(outcome.output.find("compiling -O3 mod.pyx"), std::string::npos);
}

TEST(ProcessToolchainTest, MissingCompilerIsReported) {
    ProcessToolchainOptions opts;
    opts.command = {"cyforge-no-such-compiler", "{input}"};
    opts.version = "1.0";
    ProcessToolchain tc(opts);

    auto outcome = tc.compile(CompileRequest{"mod.pyx", "out", {}}, nullptr);
    EXPECT_EQ(outcome.exit_code, 127);
    EXPECT_NE(outcome.output.find("cyforge-no-such-compiler"), std::string::npos);
}

// ============================================================================
// Version Query
// ============================================================================

class VersionQueryTest : public cyforge::testing::TempDirTest {};

TEST_F(VersionQueryTest, ExplicitVersionWins) {
    ProcessToolchainOptions opts;
    opts.command = {"cyforge-no-such-compiler"};
    opts.version = "3.0.11";
    EXPECT_EQ(ProcessToolchain(opts).version(), "3.0.11");
}

TEST_F(VersionQueryTest, ReadsFirstLine) {
    auto script = write_script("fakec", "echo 'FakeC 1.2.3'\necho 'build info'\n");
    ProcessToolchainOptions opts;
    opts.command = {script.string(), "{input}"};
    ProcessToolchain tc(opts);
    EXPECT_EQ(tc.version(), "FakeC 1.2.3");
    EXPECT_EQ(tc.version(), "FakeC 1.2.3");
}

TEST_F(VersionQueryTest, FailedQueryFallsBack) {
    auto script = write_script("broken", "exit 1\n");
    ProcessToolchainOptions opts;
    opts.command = {script.string()};
    EXPECT_EQ(ProcessToolchain(opts).version(), script.string() + " (version unknown)");
}

// ============================================================================
// Toolchain Tag
// ============================================================================

TEST(ToolchainTagTest, DependsOnVersionAndFlags) {
    FixedVersionToolchain v1("v1");
    FixedVersionToolchain v2("v2");

    auto tag = toolchain_tag(v1, {"-O2"});
    EXPECT_EQ(tag.rfind("v1+flags:", 0), 0u);
    EXPECT_EQ(tag.size(), std::string("v1+flags:").size() + 12);

    EXPECT_EQ(tag, toolchain_tag(v1, {"-O2"}));
    EXPECT_NE(tag, toolchain_tag(v2, {"-O2"}));
    EXPECT_NE(tag, toolchain_tag(v1, {"-O3"}));
    EXPECT_NE(toolchain_tag(v1, {"-a", "b"}), toolchain_tag(v1, {"-ab"}));
}

// ============================================================================
// Missing Module Detection
// ============================================================================

TEST(DetectMissingModuleTest, PythonImportErrors) {
    EXPECT_EQ(detect_missing_module("Traceback...\nModuleNotFoundError: No module named 'numpy'\n"),
              "numpy");
    EXPECT_EQ(detect_missing_module("ImportError: No module named pkg.sub\n"), "pkg.sub");
    EXPECT_EQ(detect_missing_module("No module named \"yaml\"."), "yaml");
}

TEST(DetectMissingModuleTest, CythonPxdNotFound) {
    EXPECT_EQ(detect_missing_module("mod.pyx:1:8: 'scipy/linalg.pxd' not found"), "scipy.linalg");
    EXPECT_EQ(detect_missing_module("mod.pyx:2:0: 'numpy.pxd' not found"), "numpy");
}

TEST(DetectMissingModuleTest, UnnamedModuleNotFound) {
    EXPECT_EQ(detect_missing_module("ModuleNotFoundError"), "<unknown>");
}

TEST(DetectMissingModuleTest, OtherFailuresAreNotImportErrors) {
    EXPECT_FALSE(detect_missing_module("mod.pyx:3:4: Syntax error in simple statement list"));
    EXPECT_FALSE(detect_missing_module(""));
}
