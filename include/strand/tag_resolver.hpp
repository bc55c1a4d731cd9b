#pragma once

#include <strand/version.hpp>

#include <optional>
#include <string>
#include <vector>

namespace strand {

// A repository tag and the version embedded in it
struct TagCandidate {
    std::string tag;
    Version version;
};

// Regex matching a whole tag for a template such as "release-${version}".
// The first ${version} captures MAJOR.MINOR.PATCH; everything else in the
// template is matched literally.
std::string version_tag_pattern(const std::string& templ);

// Tags matching <templ> whose version satisfies <req>, in input order
std::vector<TagCandidate> match_version_tags(const std::vector<std::string>& tags,
                                             const std::string& templ,
                                             const VersionReq& req);

// Highest matching candidate, or nullopt when none matches
std::optional<TagCandidate> select_version_tag(const std::vector<std::string>& tags,
                                               const std::string& templ,
                                               const VersionReq& req);

// Replace every "${version}" with <version>
std::string substitute_version(const std::string& value, const Version& version);

} // namespace strand
