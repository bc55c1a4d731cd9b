#pragma once

#include <strand/result.hpp>
#include <strand/clone_cache.hpp>
#include <strand/git.hpp>
#include <strand/location.hpp>
#include <strand/package.hpp>

#include <string>

namespace strand {

// Outcome of resolving one git dependency
struct ResolvedGit {
    // ref is the checked-out commit; branch is kept only when it names what
    // was checked out; constraint is narrowed to the tag version when a
    // ${version} template was resolved
    GitLocation location;
    CachedPackage package;
};

// Turns a GitLocation into a validated package under a destination root.
// Layout written: <destination>/<name>-<commit>/
class GitResolver {
public:
    GitResolver(GitTransport& git, CloneCache& clones,
                PackageLayout layout = PackageLayout{});
    GitResolver(GitTransport& git, CloneCache& clones,
                PackageLayout layout, const PackageValidator& validator);

    GitResolver(const GitResolver&) = delete;
    GitResolver& operator=(const GitResolver&) = delete;

    Result<ResolvedGit> resolve(const GitLocation& location,
                                const std::string& destination);

    const PackageLayout& layout() const { return layout_; }

private:
    // Explicit-ref request whose <name>-<ref> directory already exists
    Result<ResolvedGit> load_cached(const GitLocation& location,
                                    const std::string& path);

    // Validate the checked-out subtree, move it into place, wrap it
    Result<ResolvedGit> materialize(const GitLocation& resolved,
                                    const std::string& clone_dir,
                                    const std::string& destination);

    GitTransport& git_;
    CloneCache& clones_;
    PackageLayout layout_;
    ManifestValidator default_validator_;
    const PackageValidator* validator_;
};

// Copy <source> (minus any top-level .git) to <target> through a staging
// directory renamed into place. Whatever was at <target> is replaced.
Status install_tree(const std::string& source, const std::string& target);

} // namespace strand
