//! # Scanner
//!
//! ## Worker Loop
//!
//! ```text
//! queue: ["", "pkg", "pkg/sub", ...]   one entry per directory
//! worker: pop → list → prune subdirs → push subdirs → filter files → arena
//! ```
//!
//! `pending` counts directories pushed but not yet finished. A worker only
//! decrements it after pushing the children of its directory, so it reaches
//! zero exactly when the walk is complete.

#include "scan/scanner.hpp"

#include "common/work_queue.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <thread>

namespace cyforge {

int64_t file_mtime(const std::filesystem::path& path) {
    std::error_code ec;
    auto t = std::filesystem::last_write_time(path, ec);
    if (ec)
        return 0;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

} // namespace cyforge

namespace cyforge::scan {

bool path_less(const std::string& lhs, const std::string& rhs) {
    size_t i = 0;
    size_t j = 0;
    while (i < lhs.size() && j < rhs.size()) {
        size_t li = lhs.find('/', i);
        size_t rj = rhs.find('/', j);
        if (li == std::string::npos)
            li = lhs.size();
        if (rj == std::string::npos)
            rj = rhs.size();

        int cmp = std::string_view(lhs).substr(i, li - i).compare(
            std::string_view(rhs).substr(j, rj - j));
        if (cmp != 0)
            return cmp < 0;

        i = li + 1;
        j = rj + 1;
    }
    // Equal prefix: the path with fewer components sorts first
    return i >= lhs.size() && j < rhs.size();
}

Scanner::Scanner(ScanOptions options) : options_(std::move(options)) {}

bool Scanner::has_wanted_extension(const fs::path& file) const {
    auto ext = file.extension().string();
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) !=
           options_.extensions.end();
}

bool Scanner::is_skipped_dir(const std::string& relative) const {
    return std::find(options_.skip_dirs.begin(), options_.skip_dirs.end(), relative) !=
           options_.skip_dirs.end();
}

ScanResult Scanner::scan(const fs::path& root, const matcher::PathMatcher& matcher) const {
    ScanResult result;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        CYFORGE_LOG_ERROR("scan", "Target root " << root.string() << " does not exist");
        result.root_missing = true;
        return result;
    }

    WorkQueue<std::string> queue;
    std::atomic<int> pending{1};
    std::atomic<size_t> visited{0};
    std::atomic<size_t> excluded{0};

    std::mutex arena_mutex;
    std::map<std::string, std::vector<SourceUnit>> arenas;
    std::vector<ScanError> warnings;

    queue.push(std::string());

    auto list_directory = [&](const std::string& rel_dir) {
        fs::path abs_dir = rel_dir.empty() ? root : root / fs::path(rel_dir);
        std::vector<SourceUnit> arena;

        std::error_code iter_ec;
        fs::directory_iterator it(abs_dir, fs::directory_options::none, iter_ec);
        if (iter_ec) {
            CYFORGE_LOG_WARN("scan", "Skipping unreadable directory '"
                                         << (rel_dir.empty() ? "." : rel_dir)
                                         << "': " << iter_ec.message());
            std::lock_guard<std::mutex> lock(arena_mutex);
            warnings.push_back(ScanError{rel_dir, iter_ec.message()});
            return;
        }

        for (; it != fs::directory_iterator(); it.increment(iter_ec)) {
            const auto& entry = *it;
            std::string name = entry.path().filename().string();
            std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;

            std::error_code st_ec;
            auto link_status = entry.symlink_status(st_ec);
            if (st_ec)
                continue;

            bool is_link = fs::is_symlink(link_status);
            auto status = is_link ? entry.status(st_ec) : link_status;
            if (st_ec)
                continue;

            if (fs::is_directory(status)) {
                if (is_link) {
                    CYFORGE_LOG_TRACE("scan", "Not following symlinked directory " << rel);
                    continue;
                }
                if (is_skipped_dir(rel))
                    continue;
                if (matcher.can_prune(rel)) {
                    CYFORGE_LOG_TRACE("scan", "Pruned " << rel << "/");
                    excluded.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                pending.fetch_add(1, std::memory_order_relaxed);
                queue.push(std::move(rel));
                continue;
            }

            if (!fs::is_regular_file(status) || !has_wanted_extension(entry.path()))
                continue;

            if (matcher.is_excluded(rel, false)) {
                CYFORGE_LOG_TRACE("scan", "Excluded " << rel);
                excluded.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            SourceUnit unit;
            unit.relative_path = std::move(rel);
            unit.absolute_path = entry.path();
            std::error_code size_ec;
            unit.size_bytes = entry.file_size(size_ec);
            if (size_ec)
                unit.size_bytes = 0;
            unit.modified_time = file_mtime(entry.path());
            arena.push_back(std::move(unit));
        }

        if (iter_ec) {
            CYFORGE_LOG_WARN("scan", "Listing of '" << (rel_dir.empty() ? "." : rel_dir)
                                                    << "' stopped early: " << iter_ec.message());
            std::lock_guard<std::mutex> lock(arena_mutex);
            warnings.push_back(ScanError{rel_dir, iter_ec.message()});
        }

        if (!arena.empty()) {
            std::lock_guard<std::mutex> lock(arena_mutex);
            arenas[rel_dir] = std::move(arena);
        }
    };

    auto worker = [&](int slot) {
        log::ScopedWorkerSlot tag(slot);
        while (true) {
            auto job = queue.pop(20);
            if (!job) {
                if (pending.load() == 0)
                    break;
                continue;
            }
            visited.fetch_add(1, std::memory_order_relaxed);
            list_directory(*job);
            if (pending.fetch_sub(1) == 1) {
                queue.stop();
            }
        }
    };

    int num_threads = options_.jobs > 0 ? options_.jobs
                                        : static_cast<int>(std::thread::hardware_concurrency());
    if (num_threads <= 0)
        num_threads = 4;

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(num_threads));
    for (int i = 0; i < num_threads; ++i) {
        workers.emplace_back(worker, i);
    }
    for (auto& t : workers) {
        t.join();
    }

    // Merge arenas, then impose the depth-first order
    for (auto& [dir, arena] : arenas) {
        for (auto& unit : arena) {
            result.units.push_back(std::move(unit));
        }
    }
    std::sort(result.units.begin(), result.units.end(),
              [](const SourceUnit& a, const SourceUnit& b) {
                  return path_less(a.relative_path, b.relative_path);
              });

    std::sort(warnings.begin(), warnings.end(), [](const ScanError& a, const ScanError& b) {
        return path_less(a.path, b.path);
    });
    result.warnings = std::move(warnings);
    result.directories_visited = visited.load();
    result.excluded = excluded.load();

    CYFORGE_LOG_INFO("scan", "Found " << result.units.size() << " units in "
                                      << result.directories_visited << " directories ("
                                      << result.excluded << " excluded, "
                                      << result.warnings.size() << " warnings)");
    return result;
}

} // namespace cyforge::scan
