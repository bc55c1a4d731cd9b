#include <strand/location.hpp>
#include <strand/git.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace strand {

// ---------------------------------------------------------------------------
// Variable substitution
// ---------------------------------------------------------------------------

std::string substitute_variables(const std::string& value, const std::string& name) {
    static const std::string token = "${name}";

    std::string out;
    size_t pos = 0;
    for (;;) {
        size_t hit = value.find(token, pos);
        if (hit == std::string::npos) break;
        out.append(value, pos, hit - pos);
        out += name;
        pos = hit + token.size();
    }
    out.append(value, pos, std::string::npos);
    return out;
}

std::optional<std::string> substitute_variables(const std::optional<std::string>& value,
                                                const std::string& name) {
    if (!value) return std::nullopt;
    return substitute_variables(*value, name);
}

// ---------------------------------------------------------------------------
// GitLocation
// ---------------------------------------------------------------------------

Result<GitLocation> GitLocation::create(const std::string& name,
                                        VersionReq constraint,
                                        const GitOptions& options) {
    if (name.empty()) {
        return StrandError{StrandError::InvalidArg, "dependency name is empty"};
    }

    STRAND_TRY(validate_git_uri(options.git).context("dependency '" + name + "': "));

    GitLocation loc;
    loc.name_ = name;
    loc.constraint_ = std::move(constraint);
    loc.uri_ = options.git;

    loc.ref_ = substitute_variables(options.ref, name);
    loc.branch_ = substitute_variables(options.branch ? options.branch : options.tag, name);
    loc.rel_ = substitute_variables(options.rel, name);
    if (!loc.ref_ && !loc.branch_) {
        loc.branch_ = kDefaultBranch;
    }

    if (options.version_from_metadata) {
        auto req = VersionReq::parse(*options.version_from_metadata);
        if (req.is_err()) {
            return StrandError{StrandError::Config,
                "dependency '" + name + "' has invalid metadata version: " +
                req.error().message};
        }
        loc.metadata_constraint_ = std::move(req).value();
    }

    return Result<GitLocation>::ok(std::move(loc));
}

const VersionReq& GitLocation::tag_constraint() const {
    return metadata_constraint_ ? *metadata_constraint_ : constraint_;
}

const std::string& GitLocation::effective_pointer() const {
    // create() and pinned() guarantee at least one of ref/branch
    return ref_ ? *ref_ : *branch_;
}

bool GitLocation::is_version_templated() const {
    return effective_pointer().find(kVersionToken) != std::string::npos;
}

std::optional<std::string> GitLocation::revision_path(const std::string& destination) const {
    if (!ref_) return std::nullopt;
    return (std::filesystem::path(destination) / (name_ + "-" + *ref_)).string();
}

GitLocation GitLocation::pinned(std::string commit,
                                std::optional<std::string> branch,
                                VersionReq constraint,
                                std::optional<std::string> rel) const {
    GitLocation loc = *this;
    loc.ref_ = std::move(commit);
    loc.branch_ = std::move(branch);
    loc.constraint_ = std::move(constraint);
    loc.rel_ = std::move(rel);
    return loc;
}

std::string GitLocation::to_string() const {
    std::string s = "git: '" + uri_ + "'";
    if (branch_) s += " with branch: '" + *branch_ + "'";
    if (ref_) s += " at ref: '" + *ref_ + "'";
    return s;
}

std::string GitLocation::to_toml() const {
    toml::table tbl;
    tbl.insert("git", uri_);
    if (branch_) tbl.insert("branch", *branch_);
    if (ref_) tbl.insert("ref", *ref_);
    if (rel_) tbl.insert("rel", *rel_);

    std::ostringstream ss;
    ss << tbl;
    return ss.str();
}

// ---------------------------------------------------------------------------
// Dependency tables
// ---------------------------------------------------------------------------

static Result<GitLocation> parse_dependency(const std::string& name,
                                            const toml::node& node) {
    const auto* tbl = node.as_table();
    if (!tbl) {
        return StrandError{StrandError::Manifest,
            "dependency '" + name + "' must be a table"};
    }

    GitOptions opts;
    if (auto v = (*tbl)["git"].value<std::string>()) {
        opts.git = *v;
    } else {
        return StrandError{StrandError::Manifest,
            "dependency '" + name + "' has no git URI",
            "add git = \"<uri>\""};
    }
    if (auto v = (*tbl)["ref"].value<std::string>()) opts.ref = *v;
    if (auto v = (*tbl)["branch"].value<std::string>()) opts.branch = *v;
    if (auto v = (*tbl)["tag"].value<std::string>()) opts.tag = *v;
    if (auto v = (*tbl)["rel"].value<std::string>()) opts.rel = *v;
    if (auto v = (*tbl)["version-from-metadata"].value<std::string>()) {
        opts.version_from_metadata = *v;
    }

    if (opts.branch && opts.tag) {
        return StrandError{StrandError::Manifest,
            "dependency '" + name + "' sets both branch and tag",
            "tag is an alias of branch; keep one"};
    }

    VersionReq constraint = VersionReq::any();
    if (auto v = (*tbl)["version"].value<std::string>()) {
        auto req = VersionReq::parse(*v);
        if (req.is_err()) {
            return StrandError{StrandError::Manifest,
                "dependency '" + name + "' has invalid version constraint: " +
                req.error().message};
        }
        constraint = std::move(req).value();
    }

    return GitLocation::create(name, std::move(constraint), opts);
}

Result<std::vector<GitLocation>> parse_dependencies(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrandError{StrandError::Parse,
            std::string("dependencies TOML parse error: ") + e.what()};
    }

    std::vector<GitLocation> deps;
    if (auto tbl = doc["dependencies"].as_table()) {
        for (const auto& [key, val] : *tbl) {
            auto dep = parse_dependency(std::string(key.str()), val);
            if (dep.is_err()) return std::move(dep).error();
            deps.push_back(std::move(dep).value());
        }
    }
    return Result<std::vector<GitLocation>>::ok(std::move(deps));
}

Result<std::vector<GitLocation>> load_dependencies(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrandError{StrandError::IO,
            "cannot open dependencies file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    return parse_dependencies(ss.str()).with_file(path);
}

} // namespace strand
