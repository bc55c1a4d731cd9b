// demo_fetch.cpp
//
// Resolves every [dependencies.<name>] entry of a TOML file into a package
// directory and prints where each one landed. Run it with:
//
//     ./demo_fetch deps.toml                 # into the configured cache root
//     ./demo_fetch deps.toml /tmp/packages   # into an explicit destination
//
// ~/.strand/config.toml and ./strand.toml are layered for settings.

#include <strand/config.hpp>
#include <strand/clone_cache.hpp>
#include <strand/git.hpp>
#include <strand/location.hpp>
#include <strand/log.hpp>
#include <strand/resolver.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace strand;

static std::optional<Config> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return std::nullopt;

    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        log::warn("%s", cfg.error().format().c_str());
        return std::nullopt;
    }
    return std::move(cfg).value();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << StrandError{StrandError::InvalidArg,
            "no dependencies file specified",
            "usage: demo_fetch <deps.toml> [destination]"}.format() << "\n";
        return 2;
    }

    Config cfg = Config::effective(load_optional(global_config_path()),
                                   load_optional("strand.toml"));

    GitCli git;
    cfg.apply(git);

    auto git_version = git.check_version();
    if (git_version.is_err()) {
        std::cerr << git_version.error().format() << "\n";
        return 1;
    }
    log::debug("git %s", git_version.value().c_str());

    auto deps = load_dependencies(argv[1]);
    if (deps.is_err()) {
        std::cerr << deps.error().format() << "\n";
        return 1;
    }

    std::string destination = argc > 2 ? argv[2] : cfg.cache_root();

    // Empty root: per-process temporary directory
    TempCloneCache clones(cfg.fetch.temp_root.value_or(std::string()));
    GitResolver resolver(git, clones, PackageLayout(cfg.marker()));

    int failures = 0;
    for (const auto& dep : deps.value()) {
        auto resolved = resolver.resolve(dep, destination);
        if (resolved.is_err()) {
            std::cerr << dep.name() << ": " << resolved.error().format() << "\n";
            ++failures;
            continue;
        }

        const auto& r = resolved.value();
        std::cout << dep.name() << " " << r.package.manifest.version.to_string()
                  << " (" << r.location.to_string() << ")\n"
                  << "  -> " << r.package.path << "\n";
    }

    return failures == 0 ? 0 : 1;
}
