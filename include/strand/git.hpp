#pragma once

#include <strand/result.hpp>
#include <string>
#include <vector>

namespace strand {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Accepts <scheme>://<rest> for https, http, ssh, git+ssh, git, rsync and
// file, or scp-like [user@]host:path. Fails with StrandError::Config.
Status validate_git_uri(const std::string& uri);

// The version-control operations the resolver depends on. Every failure is
// reported as StrandError::Transport.
class GitTransport {
public:
    virtual ~GitTransport() = default;

    // Full clone of <uri> into <dest> (which must not exist)
    virtual Status clone(const std::string& uri, const std::string& dest) = 0;

    // Check out a branch, tag, or commit in a working tree
    virtual Status checkout(const std::string& repo, const std::string& pointer) = 0;

    // All tag names in the repository, in no particular order
    virtual Result<std::vector<std::string>> list_tags(const std::string& repo) = 0;

    // Full SHA of HEAD
    virtual Result<std::string> rev_parse(const std::string& repo) = 0;
};

// GitTransport backed by the git command-line client
class GitCli : public GitTransport {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    Status clone(const std::string& uri, const std::string& dest) override;
    Status checkout(const std::string& repo, const std::string& pointer) override;
    Result<std::vector<std::string>> list_tags(const std::string& repo) override;
    Result<std::string> rev_parse(const std::string& repo) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    // Runs `git <args...>`; non-zero exit becomes a Transport error
    Result<std::string> git(const std::vector<std::string>& args,
                            const std::string& what);

    int timeout_seconds_ = 60;
    bool offline_ = false;
};

} // namespace strand
