//! # Fingerprint Store
//!
//! Load, staleness, record and atomic flush.

#include "cache/fingerprint_store.hpp"

#include "common/content_hash.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace cyforge::cache {

const char* stale_reason_name(StaleReason reason) {
    switch (reason) {
    case StaleReason::Fresh:
        return "fresh";
    case StaleReason::New:
        return "new";
    case StaleReason::Toolchain:
        return "toolchain changed";
    case StaleReason::Content:
        return "content changed";
    case StaleReason::Artifact:
        return "artifact missing";
    case StaleReason::Unreadable:
        return "unreadable";
    }
    return "?";
}

// ============================================================================
// Entry Encoding
// ============================================================================

std::string escape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\n':
            out += "\\n";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string unescape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 == value.size()) {
            out += c;
            continue;
        }
        char n = value[++i];
        switch (n) {
        case '\\':
            out += '\\';
            break;
        case 't':
            out += '\t';
            break;
        case 'n':
            out += '\n';
            break;
        default:
            out += '\\';
            out += n;
        }
    }
    return out;
}

namespace {

template <typename T> bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

std::string errno_message() {
    return std::system_category().message(errno);
}

/// Writes `data` to a fresh `path` and fsyncs it. Returns an error message.
std::optional<std::string> write_synced(const fs::path& path, std::string_view data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        return "cannot open for writing: " + errno_message();

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            auto msg = "write failed: " + errno_message();
            ::close(fd);
            return msg;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        auto msg = "fsync failed: " + errno_message();
        ::close(fd);
        return msg;
    }
    if (::close(fd) != 0)
        return "close failed: " + errno_message();
    return std::nullopt;
}

/// Makes a rename inside `dir` durable. Failure only costs durability.
void sync_directory(const fs::path& dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return;
    if (::fsync(fd) != 0) {
        CYFORGE_LOG_DEBUG("cache", "fsync of " << dir.string() << " failed: " << errno_message());
    }
    ::close(fd);
}

} // namespace

std::optional<Fingerprint> parse_entry(std::string_view line) {
    Fingerprint fp;
    bool has_path = false;

    size_t pos = 0;
    while (pos <= line.size()) {
        size_t tab = line.find('\t', pos);
        if (tab == std::string_view::npos)
            tab = line.size();
        auto field = line.substr(pos, tab - pos);
        pos = tab + 1;

        if (field.empty())
            continue;
        size_t eq = field.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;

        std::string key(field.substr(0, eq));
        std::string value = unescape_value(field.substr(eq + 1));

        if (key == "path") {
            fp.path = std::move(value);
            has_path = !fp.path.empty();
        } else if (key == "hash") {
            fp.content_hash = std::move(value);
        } else if (key == "mtime") {
            if (!parse_number(value, fp.source_mtime))
                fp.source_mtime = 0;
        } else if (key == "size") {
            if (!parse_number(value, fp.source_size))
                fp.source_size = 0;
        } else if (key == "toolchain") {
            fp.toolchain_version = std::move(value);
        } else if (key == "output") {
            fp.output_path = std::move(value);
        } else if (key == "output_size") {
            if (!parse_number(value, fp.output_size))
                fp.output_size = 0;
        } else {
            fp.extra[key] = std::move(value);
        }
    }

    if (!has_path)
        return std::nullopt;
    return fp;
}

std::string format_entry(const Fingerprint& fp) {
    std::string line;
    line += "path=" + escape_value(fp.path);
    line += "\thash=" + escape_value(fp.content_hash);
    line += "\tmtime=" + std::to_string(fp.source_mtime);
    line += "\tsize=" + std::to_string(fp.source_size);
    line += "\ttoolchain=" + escape_value(fp.toolchain_version);
    if (!fp.output_path.empty()) {
        line += "\toutput=" + escape_value(fp.output_path);
        line += "\toutput_size=" + std::to_string(fp.output_size);
    }
    for (const auto& [key, value] : fp.extra) {
        line += '\t' + escape_value(key) + '=' + escape_value(value);
    }
    return line;
}

// ============================================================================
// Loading
// ============================================================================

FingerprintStore::FingerprintStore(FingerprintStore&& other) noexcept {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    file_ = std::move(other.file_);
    toolchain_version_ = std::move(other.toolchain_version_);
    artifact_root_ = std::move(other.artifact_root_);
    entries_ = std::move(other.entries_);
    dirty_ = other.dirty_;
    load_error_ = std::move(other.load_error_);
    dropped_entries_ = other.dropped_entries_;
}

FingerprintStore& FingerprintStore::operator=(FingerprintStore&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        file_ = std::move(other.file_);
        toolchain_version_ = std::move(other.toolchain_version_);
        artifact_root_ = std::move(other.artifact_root_);
        entries_ = std::move(other.entries_);
        dirty_ = other.dirty_;
        load_error_ = std::move(other.load_error_);
        dropped_entries_ = other.dropped_entries_;
    }
    return *this;
}

FingerprintStore FingerprintStore::load(const fs::path& file, std::string toolchain_version) {
    FingerprintStore store;
    store.file_ = file;
    store.toolchain_version_ = std::move(toolchain_version);

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        CYFORGE_LOG_DEBUG("cache", "No fingerprint store at " << file.string()
                                                              << ", starting empty");
        return store;
    }

    auto fail = [&](const std::string& message) {
        CYFORGE_LOG_WARN("cache", "Ignoring fingerprint store " << file.string() << ": " << message
                                                                << "; rebuilding everything");
        store.entries_.clear();
        store.load_error_ = CacheError{file.string(), message};
        return std::move(store);
    };

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return fail("cannot open for reading");
    }

    std::string line;
    if (!std::getline(in, line)) {
        return fail("empty file");
    }
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (line != STORE_HEADER) {
        return fail("unrecognised header '" + line.substr(0, 64) + "'");
    }

    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#')
            continue;
        auto fp = parse_entry(line);
        if (!fp) {
            ++store.dropped_entries_;
            continue;
        }
        std::string key = fp->path;
        store.entries_[key] = std::move(*fp);
    }
    if (in.bad()) {
        return fail("read error");
    }

    if (store.dropped_entries_ > 0) {
        CYFORGE_LOG_WARN("cache", "Dropped " << store.dropped_entries_
                                             << " fingerprint entries without a path");
    }
    CYFORGE_LOG_DEBUG("cache", "Loaded " << store.entries_.size() << " fingerprints from "
                                         << file.string());
    return store;
}

// ============================================================================
// Staleness
// ============================================================================

StalenessCheck FingerprintStore::check(const SourceUnit& unit) const {
    StalenessCheck result;

    Fingerprint recorded;
    fs::path artifact;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(unit.relative_path);
        if (it == entries_.end()) {
            result.reason = StaleReason::New;
            return result;
        }
        recorded = it->second;
        if (!artifact_root_.empty() && !recorded.output_path.empty())
            artifact = artifact_root_ / recorded.output_path;
    }

    if (recorded.content_hash.empty() || recorded.toolchain_version.empty()) {
        result.reason = StaleReason::New;
        return result;
    }
    if (recorded.toolchain_version != toolchain_version_) {
        result.reason = StaleReason::Toolchain;
        return result;
    }
    if (!artifact.empty()) {
        std::error_code ec;
        if (!fs::exists(artifact, ec)) {
            result.reason = StaleReason::Artifact;
            return result;
        }
    }

    // Fast path: untouched since the record was written
    if (recorded.source_mtime == unit.modified_time && recorded.source_size == unit.size_bytes) {
        result.stale = false;
        result.reason = StaleReason::Fresh;
        return result;
    }

    auto hashed = hash_file(unit.absolute_path);
    if (is_err(hashed)) {
        CYFORGE_LOG_DEBUG("cache", unit.relative_path << ": " << unwrap_err(hashed).message);
        result.reason = StaleReason::Unreadable;
        return result;
    }
    result.content_hash = std::move(unwrap(hashed));

    if (result.content_hash != recorded.content_hash) {
        result.reason = StaleReason::Content;
        return result;
    }

    // Touched but not edited: refresh the mtime for the fast path
    refresh_mtime(unit.relative_path, unit.modified_time);
    result.stale = false;
    result.reason = StaleReason::Fresh;
    return result;
}

bool FingerprintStore::is_stale(const SourceUnit& unit) const {
    return check(unit).stale;
}

void FingerprintStore::refresh_mtime(const std::string& path, int64_t mtime) const {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it != entries_.end() && it->second.source_mtime != mtime) {
        it->second.source_mtime = mtime;
        dirty_ = true;
    }
}

// ============================================================================
// Mutation
// ============================================================================

Fingerprint FingerprintStore::make_fingerprint(const SourceUnit& unit, std::string content_hash,
                                               std::string output_path,
                                               uint64_t output_size) const {
    Fingerprint fp;
    fp.path = unit.relative_path;
    fp.content_hash = std::move(content_hash);
    fp.source_mtime = unit.modified_time;
    fp.source_size = unit.size_bytes;
    fp.toolchain_version = toolchain_version_;
    fp.output_path = std::move(output_path);
    fp.output_size = output_size;
    return fp;
}

void FingerprintStore::record(const SourceUnit& unit, Fingerprint fp) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    fp.path = unit.relative_path;
    auto it = entries_.find(fp.path);
    if (it != entries_.end()) {
        // Keys written by other versions survive a rebuild
        for (auto& [key, value] : it->second.extra) {
            fp.extra.emplace(key, value);
        }
        it->second = std::move(fp);
    } else {
        std::string key = fp.path;
        entries_.emplace(std::move(key), std::move(fp));
    }
    dirty_ = true;
}

std::optional<Fingerprint> FingerprintStore::lookup(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool FingerprintStore::erase(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.erase(path) == 0)
        return false;
    dirty_ = true;
    return true;
}

std::vector<Fingerprint> FingerprintStore::entries() const {
    std::vector<Fingerprint> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [_, fp] : entries_)
            out.push_back(fp);
    }
    std::sort(out.begin(), out.end(),
              [](const Fingerprint& a, const Fingerprint& b) { return a.path < b.path; });
    return out;
}

void FingerprintStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!entries_.empty())
        dirty_ = true;
    entries_.clear();
}

size_t FingerprintStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool FingerprintStore::dirty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dirty_;
}

void FingerprintStore::set_artifact_root(fs::path root) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    artifact_root_ = std::move(root);
}

// ============================================================================
// Flush
// ============================================================================

Result<bool, CacheError> FingerprintStore::flush() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!dirty_ || file_.empty())
        return false;

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            return CacheError{file_.string(), "cannot create directory: " + ec.message()};
        }
    }

    // Entries are written sorted by path
    std::vector<const Fingerprint*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [_, fp] : entries_) {
        ordered.push_back(&fp);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Fingerprint* a, const Fingerprint* b) { return a->path < b->path; });

    fs::path tmp = file_;
    tmp += ".tmp." + std::to_string(getpid());

    std::string data;
    data += STORE_HEADER;
    data += '\n';
    for (const auto* fp : ordered) {
        data += format_entry(*fp);
        data += '\n';
    }

    // Data must reach the disk before the rename publishes it
    if (auto err = write_synced(tmp, data)) {
        fs::remove(tmp, ec);
        return CacheError{tmp.string(), *err};
    }

    fs::rename(tmp, file_, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return CacheError{file_.string(), "rename failed: " + ec.message()};
    }
    sync_directory(file_.parent_path());

    dirty_ = false;
    CYFORGE_LOG_DEBUG("cache", "Flushed " << entries_.size() << " fingerprints to "
                                          << file_.string());
    return true;
}

} // namespace cyforge::cache
