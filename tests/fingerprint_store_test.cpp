//! # Fingerprint Store Tests
//!
//! Staleness rules, persistence, forward compatibility, crash safety and
//! concurrent access.

#include "cache/fingerprint_store.hpp"
#include "common/content_hash.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

using namespace cyforge;
using namespace cyforge::cache;

class FingerprintStoreTest : public cyforge::testing::TempDirTest {
protected:
    fs::path store_file() const {
        return root_ / ".cyforge" / "fingerprints.idx";
    }

    /// Records `rel` with its current content under `version`.
    void record_current(FingerprintStore& store, const std::string& rel) {
        auto u = unit(rel);
        auto hash = hash_file(u.absolute_path);
        ASSERT_TRUE(is_ok(hash));
        store.record(u, store.make_fingerprint(u, unwrap(hash)));
    }
};

// ============================================================================
// Hashing
// ============================================================================

TEST(ContentHashTest, KnownDigest) {
    EXPECT_EQ(hash_bytes(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash_bytes("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(FingerprintStoreTest, HashFileMatchesHashBytes) {
    std::string big(200 * 1024, 'x');
    write("big.py", big);
    auto hashed = hash_file(root_ / "big.py");
    ASSERT_TRUE(is_ok(hashed));
    EXPECT_EQ(unwrap(hashed), hash_bytes(big));

    EXPECT_TRUE(is_err(hash_file(root_ / "missing.py")));
}

// ============================================================================
// Staleness
// ============================================================================

TEST_F(FingerprintStoreTest, UnknownUnitIsStale) {
    write("a.py", "x = 1\n");
    auto store = FingerprintStore::load(store_file(), "cython 3.0");
    auto check = store.check(unit("a.py"));
    EXPECT_TRUE(check.stale);
    EXPECT_EQ(check.reason, StaleReason::New);
}

TEST_F(FingerprintStoreTest, RecordedUnitIsFreshViaFastPath) {
    write("a.py", "x = 1\n");
    auto store = FingerprintStore::load(store_file(), "cython 3.0");
    record_current(store, "a.py");

    auto check = store.check(unit("a.py"));
    EXPECT_FALSE(check.stale);
    EXPECT_EQ(check.reason, StaleReason::Fresh);
    EXPECT_TRUE(check.content_hash.empty()) << "fast path must not hash";
}

TEST_F(FingerprintStoreTest, EditedUnitIsStale) {
    write("a.py", "x = 1\n");
    auto store = FingerprintStore::load(store_file(), "cython 3.0");
    record_current(store, "a.py");

    write("a.py", "x = 2\n");
    touch_later("a.py");
    auto check = store.check(unit("a.py"));
    EXPECT_TRUE(check.stale);
    EXPECT_EQ(check.reason, StaleReason::Content);
    EXPECT_EQ(check.content_hash, hash_bytes("x = 2\n"));
}

TEST_F(FingerprintStoreTest, TouchedButUnchangedIsFreshAndRefreshed) {
    write("a.py", "x = 1\n");
    auto store = FingerprintStore::load(store_file(), "cython 3.0");
    record_current(store, "a.py");
    ASSERT_TRUE(is_ok(store.flush()));

    touch_later("a.py");
    auto touched = unit("a.py");
    auto check = store.check(touched);
    EXPECT_FALSE(check.stale);
    EXPECT_FALSE(check.content_hash.empty()) << "slow path hashes";
    EXPECT_TRUE(store.dirty());
    EXPECT_EQ(store.lookup("a.py")->source_mtime, touched.modified_time);
}

TEST_F(FingerprintStoreTest, ToolchainChangeInvalidates) {
    write("a.py", "x = 1\n");
    {
        auto store = FingerprintStore::load(store_file(), "cython 3.0");
        record_current(store, "a.py");
        ASSERT_TRUE(is_ok(store.flush()));
    }

    auto store = FingerprintStore::load(store_file(), "cython 3.1");
    auto check = store.check(unit("a.py"));
    EXPECT_TRUE(check.stale);
    EXPECT_EQ(check.reason, StaleReason::Toolchain);
}

TEST_F(FingerprintStoreTest, MissingArtifactInvalidates) {
    write("a.py", "x = 1\n");
    write("out/a.cpython-311-x86_64-linux-gnu.so", "ELF");

    auto store = FingerprintStore::load(store_file(), "v1");
    store.set_artifact_root(root_ / "out");
    auto u = unit("a.py");
    store.record(u, store.make_fingerprint(u, hash_bytes("x = 1\n"),
                                           "a.cpython-311-x86_64-linux-gnu.so", 3));
    EXPECT_FALSE(store.is_stale(u));

    fs::remove(root_ / "out" / "a.cpython-311-x86_64-linux-gnu.so");
    auto check = store.check(u);
    EXPECT_TRUE(check.stale);
    EXPECT_EQ(check.reason, StaleReason::Artifact);
}

TEST_F(FingerprintStoreTest, EntryWithoutHashIsAlwaysStale) {
    write("a.py", "x = 1\n");
    auto u = unit("a.py");
    write(".cyforge/fingerprints.idx", std::string(STORE_HEADER) + "\npath=a.py\tmtime=" +
                                           std::to_string(u.modified_time) + "\tsize=" +
                                           std::to_string(u.size_bytes) + "\ttoolchain=v1\n");

    auto store = FingerprintStore::load(store_file(), "v1");
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.is_stale(u));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(FingerprintStoreTest, FlushAndReload) {
    write("a.py", "a\n");
    write("pkg/b.py", "b\n");
    {
        auto store = FingerprintStore::load(store_file(), "v1");
        record_current(store, "pkg/b.py");
        record_current(store, "a.py");
        auto flushed = store.flush();
        ASSERT_TRUE(is_ok(flushed));
        EXPECT_TRUE(unwrap(flushed));
        EXPECT_FALSE(store.dirty());

        auto again = store.flush();
        ASSERT_TRUE(is_ok(again));
        EXPECT_FALSE(unwrap(again)) << "clean store is not rewritten";
    }

    auto text = read(".cyforge/fingerprints.idx");
    EXPECT_EQ(text.rfind(STORE_HEADER, 0), 0u);
    EXPECT_LT(text.find("path=a.py"), text.find("path=pkg/b.py")) << "entries are sorted";

    auto store = FingerprintStore::load(store_file(), "v1");
    EXPECT_FALSE(store.load_error().has_value());
    EXPECT_EQ(store.size(), 2u);
    EXPECT_FALSE(store.is_stale(unit("a.py")));
    EXPECT_FALSE(store.is_stale(unit("pkg/b.py")));
}

TEST_F(FingerprintStoreTest, MissingFileIsEmptyWithoutError) {
    auto store = FingerprintStore::load(store_file(), "v1");
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(store.load_error().has_value());
}

TEST_F(FingerprintStoreTest, CorruptFileIsIgnored) {
    write(".cyforge/fingerprints.idx", "\x01\x02garbage\nmore garbage\n");
    write("a.py", "a\n");

    auto store = FingerprintStore::load(store_file(), "v1");
    ASSERT_TRUE(store.load_error().has_value());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.is_stale(unit("a.py")));

    // The next flush replaces the corrupt file
    record_current(store, "a.py");
    ASSERT_TRUE(is_ok(store.flush()));
    auto reloaded = FingerprintStore::load(store_file(), "v1");
    EXPECT_FALSE(reloaded.load_error().has_value());
    EXPECT_EQ(reloaded.size(), 1u);
}

TEST_F(FingerprintStoreTest, TruncatedFileKeepsCompleteEntries) {
    write(".cyforge/fingerprints.idx",
          std::string(STORE_HEADER) + "\npath=a.py\thash=aa\tmtime=1\tsize=2\ttoolchain=v1\nhash=");

    auto store = FingerprintStore::load(store_file(), "v1");
    EXPECT_FALSE(store.load_error().has_value());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.dropped_entries(), 1u);
}

TEST_F(FingerprintStoreTest, NoTemporaryFileLeftBehind) {
    write("a.py", "a\n");
    auto store = FingerprintStore::load(store_file(), "v1");
    record_current(store, "a.py");
    ASSERT_TRUE(is_ok(store.flush()));

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(root_ / ".cyforge")) {
        EXPECT_EQ(entry.path().filename(), "fingerprints.idx");
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(FingerprintStoreTest, FailedFlushLeavesPreviousIndexIntact) {
    write("a.py", "a\n");
    write("b.py", "b\n");
    {
        auto store = FingerprintStore::load(store_file(), "v1");
        record_current(store, "a.py");
        ASSERT_TRUE(is_ok(store.flush()));
    }
    auto before = read(".cyforge/fingerprints.idx");

    // A directory squatting on the temporary name makes the write fail
    fs::path tmp = store_file();
    tmp += ".tmp." + std::to_string(getpid());
    fs::create_directories(tmp);

    auto store = FingerprintStore::load(store_file(), "v1");
    record_current(store, "b.py");
    auto flushed = store.flush();
    ASSERT_TRUE(is_err(flushed));
    EXPECT_EQ(unwrap_err(flushed).path, tmp.string());
    EXPECT_NE(unwrap_err(flushed).message.find("cannot open"), std::string::npos);
    EXPECT_TRUE(store.dirty()) << "a failed flush keeps the pending entries";

    EXPECT_EQ(read(".cyforge/fingerprints.idx"), before);

    fs::remove_all(tmp);
    ASSERT_TRUE(is_ok(store.flush()));
    EXPECT_EQ(FingerprintStore::load(store_file(), "v1").size(), 2u);
}

TEST_F(FingerprintStoreTest, UnknownKeysSurviveRewrite) {
    write("a.py", "a\n");
    auto u = unit("a.py");
    write(".cyforge/fingerprints.idx",
          std::string(STORE_HEADER) + "\npath=a.py\thash=" + hash_bytes("a\n") +
              "\tmtime=1\tsize=2\ttoolchain=v1\tfuture_field=some\\tvalue\n");

    auto store = FingerprintStore::load(store_file(), "v1");
    ASSERT_EQ(store.lookup("a.py")->extra.at("future_field"), "some\tvalue");

    store.record(u, store.make_fingerprint(u, hash_bytes("a\n")));
    ASSERT_TRUE(is_ok(store.flush()));

    auto text = read(".cyforge/fingerprints.idx");
    EXPECT_NE(text.find("future_field=some\\tvalue"), std::string::npos);
}

TEST(FingerprintEntryTest, EscapingRoundTrip) {
    Fingerprint fp;
    fp.path = "dir with\ttab/new\nline\\x.py";
    fp.content_hash = "abc";
    fp.toolchain_version = "cython 3.0+flags:123";
    fp.source_mtime = -5;

    auto line = format_entry(fp);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto parsed = parse_entry(line);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->path, fp.path);
    EXPECT_EQ(parsed->source_mtime, -5);
    EXPECT_EQ(parsed->toolchain_version, fp.toolchain_version);
}

TEST(FingerprintEntryTest, EntryWithoutPathIsDropped) {
    EXPECT_FALSE(parse_entry("hash=abc\ttoolchain=v1").has_value());
    EXPECT_FALSE(parse_entry("").has_value());
}

// ============================================================================
// Mutation and Concurrency
// ============================================================================

TEST_F(FingerprintStoreTest, EraseAndClear) {
    write("a.py", "a\n");
    write("b.py", "b\n");
    auto store = FingerprintStore::load(store_file(), "v1");
    record_current(store, "a.py");
    record_current(store, "b.py");

    EXPECT_TRUE(store.erase("a.py"));
    EXPECT_FALSE(store.erase("a.py"));
    EXPECT_EQ(store.size(), 1u);

    store.clear();
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.dirty());
}

TEST_F(FingerprintStoreTest, ConcurrentChecksAndRecords) {
    const int units = 64;
    for (int i = 0; i < units; ++i) {
        write("m" + std::to_string(i) + ".py", std::to_string(i));
    }
    auto store = FingerprintStore::load(store_file(), "v1");

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = t; i < units; i += 8) {
                auto u = unit("m" + std::to_string(i) + ".py");
                auto check = store.check(u);
                if (check.stale)
                    store.record(u, store.make_fingerprint(u, hash_bytes(std::to_string(i))));
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(store.size(), static_cast<size_t>(units));
    ASSERT_TRUE(is_ok(store.flush()));
    EXPECT_EQ(FingerprintStore::load(store_file(), "v1").size(), static_cast<size_t>(units));
}
