#include <strand/tag_resolver.hpp>
#include <strand/location.hpp>
#include <strand/log.hpp>

#include <algorithm>
#include <cstring>
#include <regex>

namespace strand {

static std::string escape_regex(const std::string& s) {
    static const char* const special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (std::strchr(special, c)) out += '\\';
        out += c;
    }
    return out;
}

std::string version_tag_pattern(const std::string& templ) {
    const std::string token = GitLocation::kVersionToken;
    size_t pos = templ.find(token);
    if (pos == std::string::npos) {
        return escape_regex(templ);
    }
    return escape_regex(templ.substr(0, pos)) +
           "([0-9]+\\.[0-9]+\\.[0-9]+)" +
           escape_regex(templ.substr(pos + token.size()));
}

std::vector<TagCandidate> match_version_tags(const std::vector<std::string>& tags,
                                             const std::string& templ,
                                             const VersionReq& req) {
    const std::regex pattern(version_tag_pattern(templ));

    std::vector<TagCandidate> candidates;
    for (const auto& tag : tags) {
        std::smatch m;
        if (!std::regex_match(tag, m, pattern) || m.size() < 2) continue;

        auto ver = Version::parse(m[1].str());
        if (ver.is_err()) {
            strand::log::debug("skipping tag '%s': %s",
                               tag.c_str(), ver.error().message.c_str());
            continue;
        }
        if (!req.matches(ver.value())) continue;

        candidates.push_back(TagCandidate{tag, std::move(ver).value()});
    }
    return candidates;
}

std::optional<TagCandidate> select_version_tag(const std::vector<std::string>& tags,
                                               const std::string& templ,
                                               const VersionReq& req) {
    auto candidates = match_version_tags(tags, templ, req);
    if (candidates.empty()) return std::nullopt;

    auto best = std::max_element(candidates.begin(), candidates.end(),
        [](const TagCandidate& a, const TagCandidate& b) {
            return a.version < b.version;
        });
    return *best;
}

std::string substitute_version(const std::string& value, const Version& version) {
    const std::string token = GitLocation::kVersionToken;
    const std::string replacement = version.to_string();

    std::string out = value;
    size_t pos = 0;
    while ((pos = out.find(token, pos)) != std::string::npos) {
        out.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return out;
}

} // namespace strand
