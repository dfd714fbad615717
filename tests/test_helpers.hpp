//! # Test Helpers
//!
//! Scratch directories and file helpers shared by the test executables.

#ifndef CYFORGE_TESTS_TEST_HELPERS_HPP
#define CYFORGE_TESTS_TEST_HELPERS_HPP

#include "scan/source_unit.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace cyforge::testing {

namespace fs = std::filesystem;

/// Fixture owning a fresh directory under the system temp dir.
class TempDirTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                ("cyforge_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                 std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::error_code ec;
        fs::remove_all(root_, ec);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        // Restore permissions changed by a test so the tree can be removed
        for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_directory(ec))
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
        fs::remove_all(root_, ec);
    }

    fs::path write(const std::string& rel, const std::string& content) const {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

    std::string read(const std::string& rel) const {
        return read_path(root_ / rel);
    }

    static std::string read_path(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /// An executable /bin/sh script.
    fs::path write_script(const std::string& rel, const std::string& body) const {
        auto p = write(rel, "#!/bin/sh\n" + body);
        fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
        return p;
    }

    SourceUnit unit(const std::string& rel) const {
        SourceUnit u;
        u.relative_path = rel;
        u.absolute_path = root_ / rel;
        u.size_bytes = fs::file_size(u.absolute_path);
        u.modified_time = file_mtime(u.absolute_path);
        return u;
    }

    /// Moves the file's mtime forward so the fast path cannot hide an edit.
    void touch_later(const std::string& rel, int seconds = 5) const {
        auto p = root_ / rel;
        fs::last_write_time(p, fs::last_write_time(p) + std::chrono::seconds(seconds));
    }
};

} // namespace cyforge::testing

#endif // CYFORGE_TESTS_TEST_HELPERS_HPP
