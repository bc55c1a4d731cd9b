#pragma once

#include <catch2/catch.hpp>
#include <strand/git.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace strand::testing {

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        const char* src = std::getenv("STRAND_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("strand_test_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    std::string str() const { return path.string(); }
};

inline std::string manifest_toml(const std::string& name, const std::string& version) {
    return "[package]\nname = \"" + name + "\"\nversion = \"" + version + "\"\n";
}

// Runs git in <dir> and requires success
inline std::string git_ok(const std::vector<std::string>& args, const std::string& dir) {
    std::vector<std::string> argv{"git", "-c", "user.email=test@test.com",
                                  "-c", "user.name=Test"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto r = run_command(argv, dir);
    REQUIRE(r.is_ok());
    INFO(r.value().stderr_str);
    REQUIRE(r.value().exit_code == 0);
    return r.value().stdout_str;
}

// A local git repository addressed through a file:// URI
struct GitRepoFixture {
    TempDir td;
    fs::path repo;

    explicit GitRepoFixture(const std::string& dir_name = "origin") {
        repo = td.path / dir_name;
        fs::create_directories(repo);
        git_ok({"init", "--quiet"}, repo.string());
        // Pin the initial branch name regardless of init.defaultBranch
        git_ok({"symbolic-ref", "HEAD", "refs/heads/master"}, repo.string());
    }

    std::string uri() const { return "file://" + repo.string(); }

    void write(const std::string& rel, const std::string& content) const {
        fs::path full = repo / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    // Stage everything, commit, and return the new HEAD
    std::string commit(const std::string& message) const {
        git_ok({"add", "-A"}, repo.string());
        git_ok({"commit", "--quiet", "-m", message}, repo.string());
        std::string sha = git_ok({"rev-parse", "HEAD"}, repo.string());
        while (!sha.empty() && (sha.back() == '\n' || sha.back() == '\r')) sha.pop_back();
        return sha;
    }

    void tag(const std::string& name) const {
        git_ok({"tag", name}, repo.string());
    }

    void branch(const std::string& name) const {
        git_ok({"branch", name}, repo.string());
    }
};

// What a fake remote looks like once cloned
struct FakeRemote {
    std::map<std::string, std::string> files;    // rel path -> content
    std::vector<std::string> tags;
    std::map<std::string, std::string> commits;  // branch/tag/sha -> sha
};

// In-memory GitTransport that records every call
class RecordingTransport : public GitTransport {
public:
    std::map<std::string, FakeRemote> remotes;   // uri -> remote
    std::vector<std::string> calls;
    int clones = 0;
    int checkouts = 0;
    int tag_listings = 0;
    int rev_parses = 0;

    Status clone(const std::string& uri, const std::string& dest) override {
        ++clones;
        calls.push_back("clone " + uri);
        auto it = remotes.find(uri);
        if (it == remotes.end()) {
            return StrandError{StrandError::Transport,
                "git clone " + uri + " failed: repository not found"};
        }
        fs::create_directories(dest);
        for (const auto& [rel, content] : it->second.files) {
            fs::path full = fs::path(dest) / rel;
            fs::create_directories(full.parent_path());
            std::ofstream f(full);
            f << content;
        }
        origin_[dest] = uri;
        return ok_status();
    }

    Status checkout(const std::string& repo, const std::string& pointer) override {
        ++checkouts;
        calls.push_back("checkout " + pointer);
        const auto& remote = remote_for(repo);
        auto it = remote.commits.find(pointer);
        if (it == remote.commits.end()) {
            return StrandError{StrandError::Transport,
                "git checkout '" + pointer + "' failed: pathspec did not match"};
        }
        head_[repo] = it->second;
        return ok_status();
    }

    Result<std::vector<std::string>> list_tags(const std::string& repo) override {
        ++tag_listings;
        calls.push_back("list_tags");
        return Result<std::vector<std::string>>::ok(remote_for(repo).tags);
    }

    Result<std::string> rev_parse(const std::string& repo) override {
        ++rev_parses;
        calls.push_back("rev_parse");
        auto it = head_.find(repo);
        if (it == head_.end()) {
            return StrandError{StrandError::Transport, "git rev-parse HEAD failed"};
        }
        return Result<std::string>::ok(it->second);
    }

    int network_calls() const { return clones + checkouts + tag_listings; }

private:
    const FakeRemote& remote_for(const std::string& repo) {
        return remotes.at(origin_.at(repo));
    }

    std::map<std::string, std::string> origin_;  // clone dir -> uri
    std::map<std::string, std::string> head_;    // clone dir -> sha
};

} // namespace strand::testing
