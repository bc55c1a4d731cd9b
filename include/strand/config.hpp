#pragma once

#include <strand/result.hpp>
#include <strand/git.hpp>
#include <strand/log.hpp>

#include <optional>
#include <string>

namespace strand {

// [fetch] section. Unset keys fall back to the defaults below.
struct FetchConfig {
    std::optional<std::string> cache_root;   // cache-root
    std::optional<std::string> temp_root;    // temp-root (parent of a fresh per-run dir)
    std::optional<std::string> marker;       // marker
    std::optional<int> git_timeout;          // git-timeout (seconds)
    std::optional<bool> offline;             // offline
    std::optional<log::Level> log_level;     // log-level
};

// Layered configuration: global < local (local wins)
struct Config {
    FetchConfig fetch;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set keys override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    std::string cache_root() const;
    std::string marker() const;
    int git_timeout() const;
    bool offline() const;
    log::Level log_level() const;

    // Push timeout/offline into the git client and the level into the logger
    void apply(GitCli& git) const;
};

// ~/.strand/config.toml, or "" when no home directory is known
std::string global_config_path();

// ~/.strand/cache
std::string default_cache_root();

} // namespace strand
