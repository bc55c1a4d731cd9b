#include <strand/clone_cache.hpp>
#include <strand/log.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace strand {

Result<std::string> make_scratch_dir(const std::string& base) {
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        return StrandError{StrandError::IO,
            "cannot create " + base + ": " + ec.message()};
    }

    std::string templ = (fs::path(base) / "strand-XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return StrandError{StrandError::IO,
            "mkdtemp failed for " + templ + ": " + strerror(errno)};
    }
    return Result<std::string>::ok(std::string(buf.data()));
}

Result<std::string> process_temp_root() {
    static std::mutex mutex;
    static std::string root;

    std::lock_guard<std::mutex> guard(mutex);
    if (!root.empty()) return Result<std::string>::ok(root);

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return StrandError{StrandError::IO,
            "cannot locate temporary directory: " + ec.message()};
    }

    auto dir = make_scratch_dir(base.string());
    if (dir.is_err()) return std::move(dir).error();
    root = dir.value();
    strand::log::debug("temporary root: %s", root.c_str());
    return Result<std::string>::ok(root);
}

TempCloneCache::TempCloneCache(std::string root)
    : root_(std::move(root)) {}

std::string TempCloneCache::slug(const std::string& uri) {
    std::string s = uri;
    for (char& c : s) {
        if (c == '/' || c == '\\' || c == ':') c = '-';
    }
    return s;
}

Result<std::string> TempCloneCache::scratch() {
    std::lock_guard<std::mutex> guard(mutex_);
    if (scratch_.empty()) {
        auto dir = root_.empty() ? process_temp_root() : make_scratch_dir(root_);
        if (dir.is_err()) return std::move(dir).error();
        scratch_ = dir.value();
        strand::log::debug("clones under %s", scratch_.c_str());
    }
    return Result<std::string>::ok(scratch_);
}

Result<std::string> TempCloneCache::clone_path(const std::string& uri) {
    auto dir = scratch();
    if (dir.is_err()) return std::move(dir).error();
    return Result<std::string>::ok((fs::path(dir.value()) / slug(uri)).string());
}

std::shared_ptr<std::mutex> TempCloneCache::lock_for(const std::string& uri) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto& lock = uri_locks_[uri];
    if (!lock) lock = std::make_shared<std::mutex>();
    return lock;
}

Result<CloneLease> TempCloneCache::ensure_clone(const std::string& uri,
                                                GitTransport& git) {
    auto path = clone_path(uri);
    if (path.is_err()) return std::move(path).error();

    // The map never drops entries, so the mutex outlives every lease
    std::unique_lock<std::mutex> lock(*lock_for(uri));
    CloneLease lease{std::move(path).value(), std::move(lock)};

    std::error_code ec;
    if (fs::exists(lease.path, ec)) {
        strand::log::debug("reusing clone of %s at %s",
                           uri.c_str(), lease.path.c_str());
        return Result<CloneLease>::ok(std::move(lease));
    }

    strand::log::info("cloning %s -> %s", uri.c_str(), lease.path.c_str());
    auto cloned = git.clone(uri, lease.path);
    if (cloned.is_err()) {
        // Leave no half-written clone behind for the next caller to reuse
        fs::remove_all(lease.path, ec);
        return std::move(cloned).error();
    }
    return Result<CloneLease>::ok(std::move(lease));
}

} // namespace strand
