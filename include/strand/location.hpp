#pragma once

#include <strand/result.hpp>
#include <strand/version.hpp>

#include <optional>
#include <string>
#include <vector>

namespace strand {

// Options of a git dependency as written by the user
struct GitOptions {
    std::string git;                     // repository URI
    std::optional<std::string> ref;      // commit or alias
    std::optional<std::string> branch;
    std::optional<std::string> tag;      // alias of branch
    std::optional<std::string> rel;      // package subpath in the repository
    // Constraint used for ${version} tag matching instead of the
    // dependency constraint, e.g. "~> 1.2" from package metadata
    std::optional<std::string> version_from_metadata;
};

// Replace every "${name}" with <name>. "${version}" is left alone.
std::string substitute_variables(const std::string& value, const std::string& name);
std::optional<std::string> substitute_variables(const std::optional<std::string>& value,
                                                const std::string& name);

// Where a git dependency comes from. Immutable: resolution produces a new
// GitLocation describing what was actually checked out.
class GitLocation {
public:
    static constexpr const char* kDefaultBranch = "master";
    static constexpr const char* kVersionToken = "${version}";

    // Validates the URI and substitutes ${name} in ref, branch and rel.
    // Branch defaults to "master" when none of branch, tag and ref is given.
    static Result<GitLocation> create(const std::string& name,
                                      VersionReq constraint,
                                      const GitOptions& options);

    const std::string& name() const { return name_; }
    const VersionReq& constraint() const { return constraint_; }
    const std::string& uri() const { return uri_; }
    const std::optional<std::string>& ref() const { return ref_; }
    const std::optional<std::string>& branch() const { return branch_; }
    const std::optional<std::string>& rel() const { return rel_; }

    // Constraint applied to ${version} tags: the metadata constraint when
    // one was given, the dependency constraint otherwise
    const VersionReq& tag_constraint() const;
    bool has_metadata_constraint() const { return metadata_constraint_.has_value(); }

    // ref when set, branch otherwise
    const std::string& effective_pointer() const;
    bool is_version_templated() const;

    // <destination>/<name>-<ref>, only known when ref is set
    std::optional<std::string> revision_path(const std::string& destination) const;

    // Copy pinned to a checked-out commit
    GitLocation pinned(std::string commit,
                       std::optional<std::string> branch,
                       VersionReq constraint,
                       std::optional<std::string> rel) const;

    // git: '<uri>' with branch: '<branch>' at ref: '<ref>'
    std::string to_string() const;

    // TOML table: git, branch, ref, rel (unset fields omitted)
    std::string to_toml() const;

private:
    GitLocation() = default;

    std::string name_;
    VersionReq constraint_;
    std::string uri_;
    std::optional<std::string> ref_;
    std::optional<std::string> branch_;
    std::optional<std::string> rel_;
    std::optional<VersionReq> metadata_constraint_;
};

// Parse the [dependencies.<name>] tables of a TOML document
Result<std::vector<GitLocation>> parse_dependencies(const std::string& toml_str);
Result<std::vector<GitLocation>> load_dependencies(const std::string& path);

} // namespace strand
