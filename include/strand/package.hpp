#pragma once

#include <strand/result.hpp>
#include <strand/version.hpp>
#include <strand/location.hpp>

#include <string>

namespace strand {

// [package] table of a package manifest
struct PackageManifest {
    std::string name;
    Version version;
    std::string description;

    static Result<PackageManifest> parse(const std::string& toml_str);
    static Result<PackageManifest> load(const std::string& path);
};

// A directory is a package when it holds the marker manifest at its root
class PackageLayout {
public:
    static constexpr const char* kDefaultMarker = "Strand.toml";

    explicit PackageLayout(std::string marker = kDefaultMarker);

    bool looks_like_package(const std::string& dir) const;
    std::string manifest_path(const std::string& dir) const;
    const std::string& marker() const { return marker_; }

private:
    std::string marker_;
};

// A package materialized at <destination>/<name>-<commit>
struct CachedPackage {
    std::string path;
    std::string commit;
    PackageManifest manifest;

    static Result<CachedPackage> from_store_path(const std::string& path,
                                                 const std::string& commit,
                                                 const PackageLayout& layout);
};

class PackageValidator {
public:
    virtual ~PackageValidator() = default;

    // Fails with StrandError::Validation
    virtual Status validate(const CachedPackage& package,
                            const GitLocation& location) const = 0;
};

// The manifest name must equal the dependency name and the manifest version
// must satisfy the dependency constraint.
class ManifestValidator : public PackageValidator {
public:
    Status validate(const CachedPackage& package,
                    const GitLocation& location) const override;
};

} // namespace strand
