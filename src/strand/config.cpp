#include <strand/config.hpp>
#include <strand/package.hpp>

#include <toml++/toml.hpp>

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace strand {

static constexpr int kDefaultGitTimeout = 60;

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrandError{StrandError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    auto fetch = doc["fetch"].as_table();
    if (!fetch) return Result<Config>::ok(std::move(cfg));

    for (const auto& [key, val] : *fetch) {
        std::string k(key.str());
        auto type_error = [&](const char* expected) {
            return StrandError{StrandError::Config,
                "[fetch] " + k + " must be " + expected};
        };

        if (k == "cache-root" || k == "temp-root" || k == "marker") {
            auto s = val.value<std::string>();
            if (!s) return type_error("a string");
            if (k == "cache-root") cfg.fetch.cache_root = *s;
            else if (k == "temp-root") cfg.fetch.temp_root = *s;
            else cfg.fetch.marker = *s;
        } else if (k == "git-timeout") {
            auto n = val.value<int64_t>();
            if (!n || *n <= 0 || *n > INT_MAX) return type_error("a positive integer");
            cfg.fetch.git_timeout = static_cast<int>(*n);
        } else if (k == "offline") {
            auto b = val.value<bool>();
            if (!b) return type_error("a boolean");
            cfg.fetch.offline = *b;
        } else if (k == "log-level") {
            auto s = val.value<std::string>();
            if (!s) return type_error("a string");
            auto lvl = log::level_from_string(*s);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.fetch.log_level = lvl.value();
        } else {
            log::warn("ignoring unknown config key [fetch] %s", k.c_str());
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrandError{StrandError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    return Config::parse(ss.str()).with_file(path);
}

void Config::merge(const Config& other) {
    const auto& o = other.fetch;
    if (o.cache_root) fetch.cache_root = o.cache_root;
    if (o.temp_root) fetch.temp_root = o.temp_root;
    if (o.marker) fetch.marker = o.marker;
    if (o.git_timeout) fetch.git_timeout = o.git_timeout;
    if (o.offline) fetch.offline = o.offline;
    if (o.log_level) fetch.log_level = o.log_level;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string Config::cache_root() const {
    return fetch.cache_root.value_or(default_cache_root());
}

std::string Config::marker() const {
    return fetch.marker.value_or(PackageLayout::kDefaultMarker);
}

int Config::git_timeout() const {
    return fetch.git_timeout.value_or(kDefaultGitTimeout);
}

bool Config::offline() const {
    return fetch.offline.value_or(false);
}

log::Level Config::log_level() const {
    return fetch.log_level.value_or(log::Info);
}

void Config::apply(GitCli& git) const {
    git.set_timeout(git_timeout());
    git.set_offline(offline());
    log::set_level(log_level());
}

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    return home ? std::string(home) : std::string();
}

std::string global_config_path() {
    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.strand/config.toml";
}

std::string default_cache_root() {
    std::string home = home_dir();
    if (home.empty()) home = "/tmp";
    return home + "/.strand/cache";
}

} // namespace strand
