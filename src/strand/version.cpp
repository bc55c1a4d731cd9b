#include <strand/version.hpp>

#include <algorithm>
#include <cctype>
#include <climits>
#include <tuple>

namespace strand {

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = s.find(sep, start);
        parts.push_back(s.substr(start, end - start));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return parts;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(' ');
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(' ');
    return s.substr(b, e - b + 1);
}

// Non-empty run of ASCII digits that fits in an int
bool parse_component(const std::string& s, int& out) {
    if (s.empty()) return false;
    long long value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
        if (value > INT_MAX) return false;
    }
    out = static_cast<int>(value);
    return true;
}

Version make_version(int major, int minor, int patch) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    return v;
}

StrandError version_error(const std::string& what, const std::string& s,
                          std::string hint = "") {
    return StrandError{StrandError::Version, what + " '" + s + "'", std::move(hint)};
}

} // namespace

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return StrandError{StrandError::Version, "empty version string"};
    }

    Version v;
    std::string core = s;
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        core = s.substr(0, dash);
        v.label = s.substr(dash + 1);
        if (v.label.empty()) return version_error("empty pre-release label in", s);
    }

    auto parts = split(core, '.');
    if (parts.size() != 3 ||
        !parse_component(parts[0], v.major) ||
        !parse_component(parts[1], v.minor) ||
        !parse_component(parts[2], v.patch)) {
        return version_error("invalid version", s,
                             "expected major.minor.patch[-label]");
    }
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." +
                    std::to_string(patch);
    return label.empty() ? s : s + "-" + label;
}

int Version::compare(const Version& o) const {
    auto lhs = std::tie(major, minor, patch);
    auto rhs = std::tie(o.major, o.minor, o.patch);
    if (lhs != rhs) return lhs < rhs ? -1 : 1;

    if (label == o.label) return 0;
    if (label.empty()) return 1;
    if (o.label.empty()) return -1;
    return label < o.label ? -1 : 1;
}

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    auto parts = split(s, '.');
    if (s.empty() || parts.size() > 3) {
        return version_error("invalid partial version", s);
    }

    PartialVersion pv;
    int* fields[] = {&pv.major, &pv.minor, &pv.patch};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parse_component(parts[i], *fields[i])) {
            return version_error("invalid partial version", s);
        }
        // range() computes the next major/minor/patch
        if (*fields[i] == INT_MAX) {
            return version_error("version component too large in", s);
        }
    }
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) s += "." + std::to_string(minor);
    if (minor >= 0 && patch >= 0) s += "." + std::to_string(patch);
    return s;
}

Version PartialVersion::floor() const {
    return make_version(major, std::max(minor, 0), std::max(patch, 0));
}

// ---------------------------------------------------------------------------
// Ranges
// ---------------------------------------------------------------------------

bool VersionRange::contains(const Version& v) const {
    int lo = v.compare(lower);
    if (lo < 0 || (lo == 0 && !lower_inclusive)) return false;
    if (!upper) return true;
    int hi = v.compare(*upper);
    return hi < 0 || (hi == 0 && upper_inclusive);
}

VersionRange VersionConstraint::range() const {
    const Version base = version.floor();
    const Version next_major = make_version(base.major + 1, 0, 0);
    const Version next_minor = make_version(base.major, base.minor + 1, 0);

    VersionRange r;
    r.lower = base;

    switch (op) {
    case ConstraintOp::Exact:
        r.upper = base;
        r.upper_inclusive = true;
        break;
    case ConstraintOp::Caret:
        // Leftmost non-zero component is fixed
        if (base.major > 0 || version.minor < 0) {
            r.upper = next_major;
        } else if (base.minor > 0 || version.patch < 0) {
            r.upper = next_minor;
        } else {
            r.upper = make_version(0, 0, base.patch + 1);
        }
        break;
    case ConstraintOp::Tilde:
        r.upper = version.minor < 0 ? next_major : next_minor;
        break;
    case ConstraintOp::Pessimistic:
        // Only the last written component may increase
        r.upper = version.patch < 0 ? next_major : next_minor;
        break;
    case ConstraintOp::GreaterEq:
        break;
    case ConstraintOp::Greater:
        r.lower_inclusive = false;
        break;
    case ConstraintOp::LessEq:
        r.lower = Version{};
        r.upper = base;
        r.upper_inclusive = true;
        break;
    case ConstraintOp::Less:
        r.lower = Version{};
        r.upper = base;
        break;
    }
    return r;
}

bool VersionConstraint::matches(const Version& v) const {
    return !v.is_prerelease() && range().contains(v);
}

std::string VersionConstraint::to_string() const {
    static const char* const prefixes[] = {"=", "^", "~", "~>", ">=", ">", "<=", "<"};
    return prefixes[static_cast<int>(op)] + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_constraint(const std::string& text) {
    // Longest operators first
    static const std::pair<const char*, ConstraintOp> ops[] = {
        {"~>", ConstraintOp::Pessimistic}, {">=", ConstraintOp::GreaterEq},
        {"<=", ConstraintOp::LessEq},      {"^", ConstraintOp::Caret},
        {"~", ConstraintOp::Tilde},        {"=", ConstraintOp::Exact},
        {">", ConstraintOp::Greater},      {"<", ConstraintOp::Less},
    };

    std::string s = trim(text);
    VersionConstraint c;
    for (const auto& [prefix, op] : ops) {
        std::string p(prefix);
        if (s.compare(0, p.size(), p) == 0) {
            c.op = op;
            s = trim(s.substr(p.size()));
            break;
        }
    }

    if (s.empty()) return version_error("missing version in constraint", trim(text));

    auto pv = PartialVersion::parse(s);
    if (pv.is_err()) return std::move(pv).error();
    c.version = pv.value();
    return Result<VersionConstraint>::ok(c);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return StrandError{StrandError::Version, "empty version requirement"};
    }

    VersionReq req;
    for (const auto& part : split(s, ',')) {
        auto c = parse_constraint(part);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(c.value());
    }
    return Result<VersionReq>::ok(std::move(req));
}

VersionReq VersionReq::any() {
    VersionReq req;
    req.constraints.push_back({ConstraintOp::GreaterEq, PartialVersion{0, 0, 0}});
    return req;
}

VersionReq VersionReq::exact(const Version& v) {
    VersionReq req;
    req.constraints.push_back(
        {ConstraintOp::Exact, PartialVersion{v.major, v.minor, v.patch}});
    return req;
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
                       [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (const auto& c : constraints) {
        if (!s.empty()) s += ", ";
        s += c.to_string();
    }
    return s;
}

} // namespace strand
