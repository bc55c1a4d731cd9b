#include <catch2/catch.hpp>
#include <strand/location.hpp>
#include "fixtures.hpp"

using namespace strand;
using namespace strand::testing;

static const char* kUri = "https://github.com/acme/foo.git";

static GitLocation make(GitOptions opts, const std::string& name = "foo") {
    if (opts.git.empty()) opts.git = kUri;
    auto r = GitLocation::create(name, VersionReq::any(), opts);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Variable substitution =====

TEST_CASE("substitute_variables replaces every ${name}", "[location]") {
    REQUIRE(substitute_variables("${name}/cookbooks", "foo") == "foo/cookbooks");
    REQUIRE(substitute_variables("${name}-${name}", "foo") == "foo-foo");
    REQUIRE(substitute_variables("plain", "foo") == "plain");
}

TEST_CASE("substitute_variables leaves ${version} for later", "[location]") {
    REQUIRE(substitute_variables("${name}-${version}", "foo") == "foo-${version}");
}

TEST_CASE("substitute_variables is idempotent and passes absent values", "[location]") {
    auto once = substitute_variables("${name}/x", "foo");
    REQUIRE(substitute_variables(once, "foo") == once);
    REQUIRE_FALSE(substitute_variables(std::optional<std::string>{}, "foo").has_value());
}

TEST_CASE("create substitutes ${name} in ref, branch and rel", "[location]") {
    GitOptions opts;
    opts.branch = "${name}-stable";
    opts.rel = "${name}/cookbooks";
    auto loc = make(opts);
    REQUIRE(loc.branch() == std::optional<std::string>("foo-stable"));
    REQUIRE(loc.rel() == std::optional<std::string>("foo/cookbooks"));

    GitOptions with_ref;
    with_ref.ref = "${name}-v${version}";
    REQUIRE(make(with_ref).ref() == std::optional<std::string>("foo-v${version}"));
}

// ===== Defaults and precedence =====

TEST_CASE("branch defaults to master when nothing is given", "[location]") {
    auto loc = make(GitOptions{});
    REQUIRE(loc.branch() == std::optional<std::string>("master"));
    REQUIRE_FALSE(loc.ref().has_value());
    REQUIRE(loc.effective_pointer() == "master");
}

TEST_CASE("no default branch when ref is given", "[location]") {
    GitOptions opts;
    opts.ref = "abc123";
    auto loc = make(opts);
    REQUIRE_FALSE(loc.branch().has_value());
    REQUIRE(loc.effective_pointer() == "abc123");
}

TEST_CASE("tag is an alias of branch", "[location]") {
    GitOptions opts;
    opts.tag = "v2.0.0";
    auto loc = make(opts);
    REQUIRE(loc.branch() == std::optional<std::string>("v2.0.0"));
}

TEST_CASE("ref takes precedence over branch", "[location]") {
    GitOptions opts;
    opts.ref = "deadbeef";
    opts.branch = "develop";
    auto loc = make(opts);
    REQUIRE(loc.effective_pointer() == "deadbeef");
    REQUIRE(loc.branch() == std::optional<std::string>("develop"));
}

TEST_CASE("version templating follows the effective pointer", "[location]") {
    GitOptions branch_templ;
    branch_templ.branch = "release-${version}";
    REQUIRE(make(branch_templ).is_version_templated());

    GitOptions ref_wins;
    ref_wins.ref = "abc123";
    ref_wins.branch = "release-${version}";
    REQUIRE_FALSE(make(ref_wins).is_version_templated());

    GitOptions rel_only;
    rel_only.rel = "pkg-${version}";
    REQUIRE_FALSE(make(rel_only).is_version_templated());
}

// ===== Validation =====

TEST_CASE("create rejects a malformed URI", "[location]") {
    GitOptions opts;
    opts.git = "not a uri";
    auto r = GitLocation::create("foo", VersionReq::any(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrandError::Config);
    REQUIRE(r.error().message.find("foo") != std::string::npos);
}

TEST_CASE("create rejects an invalid metadata version", "[location]") {
    GitOptions opts;
    opts.git = kUri;
    opts.version_from_metadata = ">= banana";
    auto r = GitLocation::create("foo", VersionReq::any(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrandError::Config);
}

TEST_CASE("tag_constraint prefers the metadata constraint", "[location]") {
    auto plain = make(GitOptions{});
    REQUIRE_FALSE(plain.has_metadata_constraint());
    REQUIRE(plain.tag_constraint().to_string() == ">=0.0.0");

    GitOptions opts;
    opts.version_from_metadata = "~> 1.2";
    auto meta = make(opts);
    REQUIRE(meta.has_metadata_constraint());
    REQUIRE(meta.tag_constraint().to_string() == "~>1.2");
    REQUIRE(meta.constraint().to_string() == ">=0.0.0");
}

// ===== Paths and display =====

TEST_CASE("revision_path only exists with a ref", "[location]") {
    REQUIRE_FALSE(make(GitOptions{}).revision_path("/cache").has_value());

    GitOptions opts;
    opts.ref = "abc123";
    REQUIRE(make(opts).revision_path("/cache") ==
            std::optional<std::string>("/cache/foo-abc123"));
}

TEST_CASE("to_string shows branch and ref when set", "[location]") {
    REQUIRE(make(GitOptions{}).to_string() ==
            "git: 'https://github.com/acme/foo.git' with branch: 'master'");

    GitOptions opts;
    opts.ref = "abc123";
    REQUIRE(make(opts).to_string() ==
            "git: 'https://github.com/acme/foo.git' at ref: 'abc123'");
}

TEST_CASE("pinned returns a new descriptor", "[location]") {
    GitOptions opts;
    opts.branch = "v${version}";
    auto loc = make(opts);
    auto pinned = loc.pinned("0123abcd", std::string("v1.2.0"),
                             VersionReq::exact(Version::parse("1.2.0").value()),
                             std::nullopt);

    REQUIRE(pinned.ref() == std::optional<std::string>("0123abcd"));
    REQUIRE(pinned.branch() == std::optional<std::string>("v1.2.0"));
    REQUIRE(pinned.constraint().to_string() == "=1.2.0");
    // Source descriptor unchanged
    REQUIRE_FALSE(loc.ref().has_value());
    REQUIRE(loc.branch() == std::optional<std::string>("v${version}"));
}

TEST_CASE("to_toml emits only set fields", "[location]") {
    GitOptions opts;
    opts.ref = "abc123";
    opts.rel = "pkg";
    auto toml = make(opts).to_toml();
    REQUIRE(toml.find("git = ") != std::string::npos);
    REQUIRE(toml.find("https://github.com/acme/foo.git") != std::string::npos);
    REQUIRE(toml.find("ref = ") != std::string::npos);
    REQUIRE(toml.find("abc123") != std::string::npos);
    REQUIRE(toml.find("rel = ") != std::string::npos);
    REQUIRE(toml.find("branch") == std::string::npos);
}

// ===== Dependency tables =====

TEST_CASE("parse_dependencies reads git dependencies", "[location]") {
    auto r = parse_dependencies(R"(
[dependencies.foo]
git = "https://github.com/acme/foo.git"
branch = "release-${version}"
rel = "${name}/pkg"
version = ">=1.1.0, <2.0.0"

[dependencies.bar]
git = "git@github.com:acme/bar.git"
ref = "abc123"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);

    const GitLocation* foo = nullptr;
    for (const auto& d : r.value()) if (d.name() == "foo") foo = &d;
    REQUIRE(foo != nullptr);
    REQUIRE(foo->branch() == std::optional<std::string>("release-${version}"));
    REQUIRE(foo->rel() == std::optional<std::string>("foo/pkg"));
    REQUIRE(foo->constraint().to_string() == ">=1.1.0, <2.0.0");
}

TEST_CASE("parse_dependencies errors", "[location]") {
    REQUIRE(parse_dependencies("[dependencies.foo]\nbranch = \"x\"\n").error().code ==
            StrandError::Manifest);
    REQUIRE(parse_dependencies("[dependencies.foo]\ngit = \"bad uri\"\n").error().code ==
            StrandError::Config);
    REQUIRE(parse_dependencies("[dependencies.foo]\ngit = \"git://h/r\"\nversion = \"x\"\n")
                .error().code == StrandError::Manifest);
    REQUIRE(parse_dependencies("[dependencies.foo]\ngit = \"git://h/r\"\n"
                               "branch = \"a\"\ntag = \"b\"\n").error().code ==
            StrandError::Manifest);
    REQUIRE(parse_dependencies("not [valid").error().code == StrandError::Parse);
}

TEST_CASE("load_dependencies reads a file", "[location]") {
    TempDir td;
    td.write_file("deps.toml", "[dependencies.foo]\ngit = \"git://h/foo\"\ntag = \"v1.0.0\"\n");

    auto r = load_dependencies((td.path / "deps.toml").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().at(0).branch() == std::optional<std::string>("v1.0.0"));

    auto missing = load_dependencies((td.path / "nope.toml").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StrandError::IO);
}
