#include <strand/git.hpp>
#include <strand/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace strand {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

namespace {

// Both ends closed on scope exit unless released
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() { close_read(); close_write(); }

    bool open() { return pipe(fds) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
};

StrandError os_error(const char* call) {
    return StrandError{StrandError::IO,
        std::string(call) + " failed: " + std::strerror(errno)};
}

// Appends what is readable now; returns false once the writer is gone
bool read_some(int fd, std::string& out) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    return n < 0 && (errno == EAGAIN || errno == EINTR);
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return StrandError{StrandError::InvalidArg, "run_command: empty args"};
    }

    std::vector<char*> argv;
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    Pipe out, err;
    if (!out.open() || !err.open()) return os_error("pipe()");

    pid_t pid = fork();
    if (pid < 0) return os_error("fork()");

    if (pid == 0) {
        // Never let git wait on a terminal for credentials
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out.write_end(), STDOUT_FILENO);
        dup2(err.write_end(), STDERR_FILENO);
        for (int fd : {out.read_end(), out.write_end(), err.read_end(), err.write_end()}) {
            close(fd);
        }
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) _exit(127);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    out.close_write();
    err.close_write();

    CommandResult result{-1, "", ""};
    pollfd fds[2] = {{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_str, &result.stderr_str};
    int open_streams = 2;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(timeout_seconds);

    while (open_streams > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return StrandError{StrandError::IO,
                "'" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        int ready = poll(fds, 2, static_cast<int>(std::min<long long>(left, 1000)));
        if (ready < 0 && errno != EINTR) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return os_error("poll()");
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            if (!read_some(fds[i].fd, *sinks[i])) {
                fds[i].fd = -1;  // poll() skips negative descriptors
                --open_streams;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return os_error("waitpid()");
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// URI validation
// ---------------------------------------------------------------------------

Status validate_git_uri(const std::string& uri) {
    if (uri.empty()) {
        return StrandError{StrandError::Config, "git URI is empty"};
    }
    if (std::any_of(uri.begin(), uri.end(),
                    [](unsigned char c) { return std::isspace(c); })) {
        return StrandError{StrandError::Config,
            "'" + uri + "' is not a valid git URI", "URIs may not contain whitespace"};
    }
    if (uri[0] == '-') {
        return StrandError{StrandError::Config,
            "'" + uri + "' is not a valid git URI", "URIs may not start with '-'"};
    }

    static const char* const schemes[] = {
        "https", "http", "ssh", "git+ssh", "git", "rsync", "file"};

    auto sep = uri.find("://");
    if (sep != std::string::npos) {
        std::string scheme = uri.substr(0, sep);
        bool known = std::find(std::begin(schemes), std::end(schemes), scheme)
                     != std::end(schemes);
        if (known && uri.size() > sep + 3) return ok_status();
        return StrandError{StrandError::Config,
            "'" + uri + "' is not a valid git URI",
            "supported schemes: https, http, ssh, git+ssh, git, rsync, file"};
    }

    // scp-like: [user@]host:path
    auto colon = uri.find(':');
    if (colon != std::string::npos && colon + 1 < uri.size()) {
        auto at = uri.find('@');
        size_t host_begin = (at != std::string::npos && at < colon) ? at + 1 : 0;
        std::string host = uri.substr(host_begin, colon - host_begin);
        bool host_ok = !host.empty() &&
            std::all_of(host.begin(), host.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '.' || c == '-' || c == '_';
            });
        if (host_ok) return ok_status();
    }

    return StrandError{StrandError::Config,
        "'" + uri + "' is not a valid git URI",
        "use <scheme>://... or [user@]host:path"};
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

static std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StrandError{StrandError::Transport,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing_newlines(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return StrandError{StrandError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return StrandError{StrandError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return StrandError{StrandError::Transport,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Result<std::string> GitCli::git(const std::vector<std::string>& args,
                                const std::string& what) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line += ' ';
        line += a;
    }
    strand::log::debug("%s", line.c_str());

    auto r = run_command(argv, "", timeout_seconds_);
    if (r.is_err()) {
        auto err = std::move(r).error();
        return StrandError{StrandError::Transport,
            what + " failed: " + err.message};
    }

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StrandError{StrandError::Transport,
            what + " failed: " + trim_trailing_newlines(cmd.stderr_str)};
    }

    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

Status GitCli::clone(const std::string& uri, const std::string& dest) {
    if (offline_) {
        return StrandError{StrandError::Transport,
            "cannot clone '" + uri + "' in offline mode", "set offline = false under [fetch]"};
    }

    STRAND_TRY(git({"clone", "--quiet", "--", uri, dest}, "git clone " + uri));
    return ok_status();
}

Status GitCli::checkout(const std::string& repo, const std::string& pointer) {
    // Trailing "--" makes git read the pointer as a revision only, never as
    // a path inside the working tree
    STRAND_TRY(git({"-C", repo, "checkout", "--quiet", pointer, "--"},
                   "git checkout '" + pointer + "'"));
    return ok_status();
}

Result<std::vector<std::string>> GitCli::list_tags(const std::string& repo) {
    auto out = git({"-C", repo, "tag", "--list"}, "git tag --list");
    if (out.is_err()) return std::move(out).error();

    std::vector<std::string> tags;
    std::istringstream stream(out.value());
    std::string line;
    while (std::getline(stream, line)) {
        line = trim_trailing_newlines(line);
        if (!line.empty()) tags.push_back(line);
    }
    return Result<std::vector<std::string>>::ok(std::move(tags));
}

Result<std::string> GitCli::rev_parse(const std::string& repo) {
    auto out = git({"-C", repo, "rev-parse", "HEAD"}, "git rev-parse HEAD");
    if (out.is_err()) return std::move(out).error();
    return Result<std::string>::ok(trim_trailing_newlines(out.value()));
}

} // namespace strand
