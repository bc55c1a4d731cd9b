#include <strand/package.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace strand {

// ---------------------------------------------------------------------------
// PackageManifest
// ---------------------------------------------------------------------------

Result<PackageManifest> PackageManifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrandError{StrandError::Manifest,
            std::string("manifest TOML parse error: ") + e.what()};
    }

    auto pkg = doc["package"].as_table();
    if (!pkg) {
        return StrandError{StrandError::Manifest,
            "manifest has no [package] table"};
    }

    PackageManifest m;
    if (auto v = (*pkg)["name"].value<std::string>()) {
        m.name = *v;
    }
    if (m.name.empty()) {
        return StrandError{StrandError::Manifest,
            "manifest [package] has no name"};
    }

    auto ver_str = (*pkg)["version"].value<std::string>();
    if (!ver_str) {
        return StrandError{StrandError::Manifest,
            "package '" + m.name + "' has no version"};
    }
    auto ver = Version::parse(*ver_str);
    if (ver.is_err()) {
        return StrandError{StrandError::Manifest,
            "package '" + m.name + "' has invalid version: " + ver.error().message};
    }
    m.version = std::move(ver).value();

    if (auto v = (*pkg)["description"].value<std::string>()) {
        m.description = *v;
    }

    return Result<PackageManifest>::ok(std::move(m));
}

Result<PackageManifest> PackageManifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrandError{StrandError::IO, "cannot open manifest: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    return parse(ss.str()).with_file(path);
}

// ---------------------------------------------------------------------------
// PackageLayout
// ---------------------------------------------------------------------------

PackageLayout::PackageLayout(std::string marker)
    : marker_(std::move(marker)) {}

std::string PackageLayout::manifest_path(const std::string& dir) const {
    return (fs::path(dir) / marker_).string();
}

bool PackageLayout::looks_like_package(const std::string& dir) const {
    std::error_code ec;
    return fs::is_directory(dir, ec) && fs::is_regular_file(manifest_path(dir), ec);
}

// ---------------------------------------------------------------------------
// CachedPackage
// ---------------------------------------------------------------------------

Result<CachedPackage> CachedPackage::from_store_path(const std::string& path,
                                                     const std::string& commit,
                                                     const PackageLayout& layout) {
    auto manifest = PackageManifest::load(layout.manifest_path(path));
    if (manifest.is_err()) return std::move(manifest).error();

    CachedPackage pkg;
    pkg.path = path;
    pkg.commit = commit;
    pkg.manifest = std::move(manifest).value();
    return Result<CachedPackage>::ok(std::move(pkg));
}

// ---------------------------------------------------------------------------
// ManifestValidator
// ---------------------------------------------------------------------------

Status ManifestValidator::validate(const CachedPackage& package,
                                   const GitLocation& location) const {
    if (package.manifest.name != location.name()) {
        return StrandError{StrandError::Validation,
            "expected a package at " + package.path + " named '" +
            location.name() + "', but it is named '" + package.manifest.name + "'",
            "check the dependency name or its rel path"};
    }

    if (!location.constraint().matches(package.manifest.version)) {
        return StrandError{StrandError::Validation,
            "package '" + location.name() + "' at " + package.path +
            " has version " + package.manifest.version.to_string() +
            ", which does not satisfy '" + location.constraint().to_string() + "'"};
    }

    return ok_status();
}

} // namespace strand
