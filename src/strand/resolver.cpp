#include <strand/resolver.hpp>
#include <strand/tag_resolver.hpp>
#include <strand/log.hpp>

#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace strand {

GitResolver::GitResolver(GitTransport& git, CloneCache& clones,
                         PackageLayout layout)
    : git_(git), clones_(clones), layout_(std::move(layout)),
      validator_(&default_validator_) {}

GitResolver::GitResolver(GitTransport& git, CloneCache& clones,
                         PackageLayout layout, const PackageValidator& validator)
    : git_(git), clones_(clones), layout_(std::move(layout)),
      validator_(&validator) {}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<ResolvedGit> GitResolver::resolve(const GitLocation& location,
                                         const std::string& destination) {
    if (auto cached = location.revision_path(destination)) {
        std::error_code ec;
        if (fs::exists(*cached, ec)) {
            return load_cached(location, *cached);
        }
    }

    // Held until the package has been copied out of the shared clone
    auto leased = clones_.ensure_clone(location.uri(), git_);
    if (leased.is_err()) return std::move(leased).error();
    CloneLease lease = std::move(leased).value();
    const std::string& clone_dir = lease.path;

    std::optional<std::string> ref = location.ref();
    std::optional<std::string> branch = location.branch();
    std::optional<std::string> rel = location.rel();
    VersionReq constraint = location.constraint();

    if (location.is_version_templated()) {
        const std::string& templ = location.effective_pointer();

        auto tags = git_.list_tags(clone_dir);
        if (tags.is_err()) return std::move(tags).error();
        strand::log::debug("%s: %zu tags in %s",
                           location.name().c_str(), tags.value().size(),
                           location.uri().c_str());

        auto winner = select_version_tag(tags.value(), templ,
                                          location.tag_constraint());
        if (!winner) {
            // Left unresolved on purpose: the checkout below fails and
            // reports the template as a transport error.
            strand::log::warn("%s: no tag of %s matches '%s' with version '%s'",
                              location.name().c_str(), location.uri().c_str(),
                              templ.c_str(),
                              location.tag_constraint().to_string().c_str());
        } else {
            strand::log::info("%s: using tag %s (%s)",
                              location.name().c_str(), winner->tag.c_str(),
                              winner->version.to_string().c_str());
            constraint = VersionReq::exact(winner->version);
            if (ref) {
                ref = winner->tag;
                branch.reset();
            } else {
                branch = winner->tag;
            }
            if (rel) rel = substitute_version(*rel, winner->version);
        }
    }

    const std::string pointer = ref ? *ref : *branch;
    strand::log::debug("%s: checking out '%s'",
                       location.name().c_str(), pointer.c_str());
    STRAND_TRY(git_.checkout(clone_dir, pointer));

    auto commit = git_.rev_parse(clone_dir);
    if (commit.is_err()) return std::move(commit).error();

    if (branch && *branch != pointer) branch.reset();

    GitLocation resolved = location.pinned(std::move(commit).value(),
                                           std::move(branch),
                                           std::move(constraint),
                                           std::move(rel));
    return materialize(resolved, clone_dir, destination);
}

// ---------------------------------------------------------------------------
// Revision cache
// ---------------------------------------------------------------------------

Result<ResolvedGit> GitResolver::load_cached(const GitLocation& location,
                                             const std::string& path) {
    strand::log::debug("%s: using cached revision %s",
                       location.name().c_str(), path.c_str());

    const std::string& ref = *location.ref();
    std::optional<std::string> branch = location.branch();
    if (branch && *branch != ref) branch.reset();

    GitLocation resolved = location.pinned(ref, std::move(branch),
                                           location.constraint(), location.rel());

    auto pkg = CachedPackage::from_store_path(path, ref, layout_);
    if (pkg.is_err()) return std::move(pkg).error();
    STRAND_TRY(validator_->validate(pkg.value(), resolved));

    return Result<ResolvedGit>::ok(
        ResolvedGit{std::move(resolved), std::move(pkg).value()});
}

// ---------------------------------------------------------------------------
// Materialization
// ---------------------------------------------------------------------------

Result<ResolvedGit> GitResolver::materialize(const GitLocation& resolved,
                                             const std::string& clone_dir,
                                             const std::string& destination) {
    fs::path source = resolved.rel() ? fs::path(clone_dir) / *resolved.rel()
                                     : fs::path(clone_dir);

    if (!layout_.looks_like_package(source.string())) {
        std::string msg = "package '" + resolved.name() + "' not found at git: " +
                          resolved.uri();
        if (resolved.branch()) msg += " with branch '" + *resolved.branch() + "'";
        if (resolved.ref()) msg += " with ref '" + *resolved.ref() + "'";
        if (resolved.rel()) msg += " at path '" + *resolved.rel() + "'";
        return StrandError{StrandError::PackageNotFound, msg,
            "expected " + layout_.marker() + " in " + source.string()};
    }

    const std::string& commit = *resolved.ref();
    std::string target = (fs::path(destination) / (resolved.name() + "-" + commit)).string();

    strand::log::info("%s: installing %s -> %s",
                      resolved.name().c_str(), commit.c_str(), target.c_str());
    STRAND_TRY(install_tree(source.string(), target));

    auto pkg = CachedPackage::from_store_path(target, commit, layout_);
    if (pkg.is_err()) return std::move(pkg).error();
    STRAND_TRY(validator_->validate(pkg.value(), resolved));

    return Result<ResolvedGit>::ok(ResolvedGit{resolved, std::move(pkg).value()});
}

Status install_tree(const std::string& source, const std::string& target) {
    fs::path dst(target);
    fs::path staging = dst.parent_path() /
        ("." + dst.filename().string() + ".tmp-" + std::to_string(getpid()));

    auto io_error = [&](const std::string& what, const std::error_code& ec) {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
        return StrandError{StrandError::IO, what + ": " + ec.message()};
    };

    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) return io_error("cannot create " + dst.parent_path().string(), ec);

    fs::remove_all(staging, ec);
    fs::create_directory(staging, ec);
    if (ec) return io_error("cannot create " + staging.string(), ec);

    fs::recursive_directory_iterator it(source, ec);
    if (ec) return io_error("cannot read " + source, ec);

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) return io_error("cannot read " + source, ec);

        fs::path rel = it->path().lexically_relative(source);
        if (it.depth() == 0 && rel == ".git") {
            it.disable_recursion_pending();
            continue;
        }

        fs::path out = staging / rel;
        if (it->is_symlink(ec)) {
            fs::copy_symlink(it->path(), out, ec);
        } else if (it->is_directory(ec)) {
            fs::create_directory(out, ec);
        } else {
            fs::copy_file(it->path(), out, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) return io_error("cannot copy " + it->path().string(), ec);
    }
    if (ec) return io_error("cannot read " + source, ec);

    // Last writer wins
    fs::remove_all(dst, ec);
    if (ec) return io_error("cannot replace " + target, ec);

    fs::rename(staging, dst, ec);
    if (ec) return io_error("cannot move package into " + target, ec);

    return ok_status();
}

} // namespace strand
