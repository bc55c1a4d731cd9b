#pragma once

#include <strand/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace strand {

// major.minor.patch[-label]. Tags and manifests carry these.
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string label;  // pre-release label, empty for a release

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !label.empty(); }

    // <0, 0, >0. Numeric per component; a pre-release sorts before its release.
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

// Operand of a constraint: "1", "1.2" or "1.2.3"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int patch = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    // Unset components read as 0
    Version floor() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    Caret,       // ^1.2.3, also a bare "1.2.3"
    Tilde,       // ~1.2.3
    Pessimistic, // ~>1.2 or ~>1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
};

// Interval of release versions
struct VersionRange {
    Version lower;
    bool lower_inclusive = true;
    std::optional<Version> upper;  // unbounded when empty
    bool upper_inclusive = false;

    bool contains(const Version& v) const;
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Caret;
    PartialVersion version;

    VersionRange range() const;

    // Pre-release versions never match
    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Comma-separated conjunction: ">=1.1.0, <1.3.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);

    // >=0.0.0
    static VersionReq any();
    // =X.Y.Z
    static VersionReq exact(const Version& v);

    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace strand
