#pragma once

#include <strand/result.hpp>
#include <strand/git.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace strand {

// Fresh <base>/strand-XXXXXX directory. <base> is created if missing.
Result<std::string> make_scratch_dir(const std::string& base);

// Per-process scratch directory under the system temp dir, created on first
// call and returned unchanged afterwards. Never removed by strand.
Result<std::string> process_temp_root();

// A clone directory and exclusive use of it. The working tree is shared by
// every location with the same URI; checkout and copying happen while the
// lease is held. Releasing the lease (destroying it) lets the next caller in.
struct CloneLease {
    std::string path;
    std::unique_lock<std::mutex> lock;
};

// Maps a repository URI to a local clone, cloning at most once per URI.
class CloneCache {
public:
    virtual ~CloneCache() = default;

    // Blocks while another lease on the same URI is alive
    virtual Result<CloneLease> ensure_clone(const std::string& uri,
                                            GitTransport& git) = 0;
};

// Clones live at <scratch>/<slug(uri)>, where <scratch> belongs to this cache
// alone: process_temp_root() by default, or a fresh strand-XXXXXX directory
// under an explicit root. Clones from an earlier run are therefore never
// picked up. Within one cache an existing clone is reused as-is, without
// fetching.
class TempCloneCache : public CloneCache {
public:
    TempCloneCache() = default;
    // An empty root behaves like the default constructor
    explicit TempCloneCache(std::string root);

    Result<CloneLease> ensure_clone(const std::string& uri,
                                    GitTransport& git) override;

    // Filesystem-safe directory name: '/', '\' and ':' become '-'
    static std::string slug(const std::string& uri);

    // Creates the scratch directory on first use
    Result<std::string> clone_path(const std::string& uri);

private:
    Result<std::string> scratch();
    std::shared_ptr<std::mutex> lock_for(const std::string& uri);

    std::string root_;
    std::string scratch_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> uri_locks_;
};

} // namespace strand
