#include "github_client.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include "logger.hpp"
#include "process_utils.hpp"

namespace fleetfix {

namespace fs = std::filesystem;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string first_line(const std::string& text) {
    auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

const std::map<std::string, std::string>& gh_environment() {
    static const std::map<std::string, std::string> env{{"GH_PROMPT_DISABLED", "1"},
                                                        {"GIT_TERMINAL_PROMPT", "0"},
                                                        {"NO_COLOR", "1"}};
    return env;
}

} // namespace

PushAccess classify_push_probe(int exit_code, const std::string& output) {
    if (exit_code == 0)
        return PushAccess::ReadWrite;
    std::string text = lower(output);
    static const char* const denied[] = {"permission denied",
                                         "access denied",
                                         "not permitted",
                                         "write access to repository not granted",
                                         "insufficient permission",
                                         "forbidden",
                                         "error: 403",
                                         "the requested url returned error: 403",
                                         "authentication failed",
                                         "could not read from remote repository"};
    for (const char* d : denied) {
        if (text.find(d) != std::string::npos)
            return PushAccess::ReadOnly;
    }
    return PushAccess::Unknown;
}

std::vector<std::string> gh_fork_command(const RemoteRepoRef& source, const std::string& owner,
                                         const std::string& login) {
    std::vector<std::string> args{"gh", "repo", "fork", source.full_name(), "--remote=false",
                                  "--clone=false"};
    if (!owner.empty() && lower(owner) != lower(login)) {
        args.push_back("--org");
        args.push_back(owner);
    }
    return args;
}

GhCliGitHubClient::GhCliGitHubClient(GitClient& git, std::optional<fs::path> test_remote_root)
    : git_(git), test_root_(std::move(test_remote_root)) {}

fs::path GhCliGitHubClient::test_repo_path(const std::string& owner,
                                           const std::string& name) const {
    return *test_root_ / owner / (name + ".git");
}

void GhCliGitHubClient::ensure_gh_ready() {
    if (gh_checked_)
        return;
    auto r = procutil::run_command({"gh", "auth", "status"}, {}, gh_environment());
    if (r.exit_code == 127 || r.exit_code == -1)
        throw std::runtime_error("GitHub CLI (gh) is not installed or not on PATH");
    if (!r.ok())
        throw std::runtime_error("GitHub CLI is not authenticated; run `gh auth login` first");
    gh_checked_ = true;
}

const std::string& GhCliGitHubClient::authenticated_login() {
    if (login_)
        return *login_;
    std::vector<std::string> args{"gh", "api", "user", "--jq", ".login"};
    auto r = procutil::run_command(args, {}, gh_environment());
    if (!r.ok())
        throw CommandError(procutil::join_command(args), r.exit_code, first_line(r.output));
    std::string login = first_line(r.output);
    while (!login.empty() && std::isspace(static_cast<unsigned char>(login.back())))
        login.pop_back();
    login_ = login;
    return *login_;
}

void GhCliGitHubClient::create_repo(const std::string& owner, const std::string& name,
                                    Visibility visibility) {
    if (test_root_) {
        fs::path target = test_repo_path(owner, name);
        std::error_code ec;
        if (fs::exists(target, ec))
            throw std::runtime_error("repository " + owner + "/" + name + " already exists");
        fs::create_directories(target.parent_path(), ec);
        auto r = procutil::run_command({"git", "init", "--bare", target.string()});
        if (!r.ok())
            throw CommandError("git init --bare " + target.string(), r.exit_code, r.output);
        log_info("created test remote repository", {{"path", target.string()}});
        return;
    }
    ensure_gh_ready();
    std::vector<std::string> args{"gh", "repo", "create", owner + "/" + name,
                                  visibility == Visibility::Public ? "--public" : "--private"};
    auto r = procutil::run_command(args, {}, gh_environment());
    if (!r.ok())
        throw CommandError(procutil::join_command(args), r.exit_code, first_line(r.output));
    log_info("created GitHub repository", {{"repo", owner + "/" + name}});
}

void GhCliGitHubClient::fork_repo(const RemoteRepoRef& source, const std::string& owner) {
    if (test_root_) {
        fs::path src = test_repo_path(source.owner, source.name);
        fs::path dst = test_repo_path(owner, source.name);
        std::error_code ec;
        if (fs::exists(dst, ec)) {
            log_info("reusing existing fork", {{"path", dst.string()}});
            return;
        }
        fs::create_directories(dst.parent_path(), ec);
        auto r = procutil::run_command({"git", "clone", "--bare", src.string(), dst.string()});
        if (!r.ok())
            throw CommandError("git clone --bare " + src.string(), r.exit_code, r.output);
        return;
    }
    ensure_gh_ready();
    auto args = gh_fork_command(source, owner, authenticated_login());
    auto r = procutil::run_command(args, {}, gh_environment());
    if (!r.ok()) {
        if (lower(r.output).find("already exists") != std::string::npos) {
            log_info("reusing existing fork", {{"source", source.full_name()}, {"owner", owner}});
            return;
        }
        throw CommandError(procutil::join_command(args), r.exit_code, first_line(r.output));
    }
    log_info("forked repository", {{"source", source.full_name()}, {"owner", owner}});
}

PushAccessResult GhCliGitHubClient::probe_push_access(const fs::path& repo,
                                                      const std::string& preferred_remote) {
    PushAccessResult result;
    try {
        result.remote = effective_remote(git_, repo, preferred_remote);
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }
    std::string branch = git_.current_branch(repo);
    if (branch.empty() || branch == "HEAD") {
        result.error = "cannot probe push access without a checked-out branch";
        return result;
    }
    auto r = git_.push_dry_run(repo, result.remote, "HEAD:refs/heads/" + branch);
    result.access = classify_push_probe(r.exit_code, r.output);
    if (result.access == PushAccess::Unknown)
        result.error = first_line(r.output);
    return result;
}

} // namespace fleetfix
