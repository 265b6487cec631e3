#include "git_client.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include "git_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fleetfix {

CommandError::CommandError(const std::string& command, int exit_code, const std::string& output)
    : std::runtime_error(command + " failed (exit " + std::to_string(exit_code) + ")" +
                         (output.empty() ? "" : ": " + output)),
      command_(command), exit_code_(exit_code), output_(output) {}

std::string effective_remote(GitClient& git, const fs::path& repo,
                             const std::string& preferred_remote) {
    auto remotes = git.remote_names(repo);
    auto has = [&](const std::string& name) {
        return std::find(remotes.begin(), remotes.end(), name) != remotes.end();
    };
    if (!preferred_remote.empty()) {
        if (!has(preferred_remote))
            throw std::runtime_error("preferred remote \"" + preferred_remote +
                                     "\" is not configured");
        return preferred_remote;
    }
    std::string up = git.upstream(repo);
    auto slash = up.find('/');
    if (slash != std::string::npos && has(up.substr(0, slash)))
        return up.substr(0, slash);
    if (has("origin"))
        return "origin";
    if (remotes.empty())
        throw std::runtime_error("repository has no remotes: " + repo.string());
    return remotes.front();
}

bool output_indicates_conflict(const std::string& output) {
    std::string text = output;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* const indicators[] = {"conflict", "automatic merge failed",
                                             "could not apply", "resolve all conflicts manually",
                                             "merge conflict"};
    for (const char* ind : indicators) {
        if (text.find(ind) != std::string::npos)
            return true;
    }
    return false;
}

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    return s.substr(start);
}

/**
 * @brief Disposable detached worktree used for dry-run merges and rebases.
 *
 * The worktree and its temporary parent directory are removed when the
 * object goes out of scope.
 */
class ProbeWorktree {
  public:
    ProbeWorktree(CliGitClient& git, const fs::path& repo) : git_(git), repo_(repo) {
        std::string tmpl = (fs::temp_directory_path() / "fleetfix-probe-XXXXXX").string();
        if (mkdtemp(tmpl.data()) == nullptr) {
            error_ = "cannot create temporary directory for sync probe";
            return;
        }
        dir_ = tmpl;
        path_ = dir_ / "worktree";
        auto r = git_.run(repo_, {"-c", "core.hooksPath=/dev/null", "worktree", "add",
                                  "--detach", path_.string(), "HEAD"});
        if (!r.ok()) {
            error_ = r.output;
            return;
        }
        ready_ = true;
    }

    ~ProbeWorktree() {
        if (ready_) {
            auto r = git_.run(repo_, {"worktree", "remove", "--force", path_.string()});
            if (!r.ok()) {
                log_warning("failed to remove probe worktree",
                            {{"repo", repo_.string()}, {"error", trim(r.output)}});
            }
        }
        if (!dir_.empty()) {
            std::error_code ec;
            fs::remove_all(dir_, ec);
            if (ready_)
                git_.run(repo_, {"worktree", "prune"});
        }
    }

    ProbeWorktree(const ProbeWorktree&) = delete;
    ProbeWorktree& operator=(const ProbeWorktree&) = delete;

    bool ready() const { return ready_; }
    const fs::path& path() const { return path_; }
    const std::string& error() const { return error_; }

  private:
    CliGitClient& git_;
    fs::path repo_;
    fs::path dir_;
    fs::path path_;
    std::string error_;
    bool ready_ = false;
};

} // namespace

CliGitClient::CliGitClient(std::string git_executable) : git_(std::move(git_executable)) {}

std::map<std::string, std::string> CliGitClient::environment(const fs::path& repo) {
    std::map<std::string, std::string> env{{"GIT_TERMINAL_PROMPT", "0"},
                                           {"GIT_ASKPASS", ""},
                                           {"SSH_ASKPASS", ""},
                                           {"GCM_INTERACTIVE", "never"}};
    if (!procutil::safe_getenv("GIT_SSH_COMMAND"))
        env["GIT_SSH_COMMAND"] = "ssh -o BatchMode=yes";
    if (!repo.empty() && !procutil::safe_getenv("GIT_AUTHOR_NAME") &&
        !procutil::run_command({git_, "-C", repo.string(), "config", "user.name"}).ok()) {
        env["GIT_AUTHOR_NAME"] = "fleetfix";
        env["GIT_COMMITTER_NAME"] = "fleetfix";
    }
    if (!repo.empty() && !procutil::safe_getenv("GIT_AUTHOR_EMAIL") &&
        !procutil::run_command({git_, "-C", repo.string(), "config", "user.email"}).ok()) {
        env["GIT_AUTHOR_EMAIL"] = "fleetfix@localhost";
        env["GIT_COMMITTER_EMAIL"] = "fleetfix@localhost";
    }
    return env;
}

procutil::CommandResult CliGitClient::run(const fs::path& repo,
                                          const std::vector<std::string>& args) {
    std::vector<std::string> argv{git_};
    if (!repo.empty()) {
        argv.push_back("-C");
        argv.push_back(repo.string());
    }
    argv.insert(argv.end(), args.begin(), args.end());
    log_debug("running command", {{"cmd", procutil::join_command(argv)}});
    return procutil::run_command(argv, {}, environment(repo));
}

std::string CliGitClient::run_checked(const fs::path& repo, const std::vector<std::string>& args) {
    auto r = run(repo, args);
    if (!r.ok()) {
        std::vector<std::string> shown{"git"};
        shown.insert(shown.end(), args.begin(), args.end());
        throw CommandError(procutil::join_command(shown), r.exit_code, trim(r.output));
    }
    return r.output;
}

bool CliGitClient::is_git_repo(const fs::path& repo) { return git::is_git_repo(repo); }

std::vector<std::string> CliGitClient::remote_names(const fs::path& repo) {
    return git::list_remotes(repo);
}

std::string CliGitClient::remote_url(const fs::path& repo, const std::string& remote) {
    return git::get_remote_url(repo, remote).value_or("");
}

std::string CliGitClient::current_branch(const fs::path& repo) {
    return git::get_current_branch(repo).value_or("");
}

std::string CliGitClient::head_sha(const fs::path& repo) {
    return git::get_local_hash(repo).value_or("");
}

std::string CliGitClient::upstream(const fs::path& repo) {
    return git::get_upstream(repo).value_or("");
}

std::string CliGitClient::ref_sha(const fs::path& repo, const std::string& ref) {
    if (ref.empty())
        return "";
    return git::resolve_ref(repo, ref).value_or("");
}

std::pair<int, int> CliGitClient::ahead_behind(const fs::path& repo, const std::string& upstream) {
    if (upstream.empty())
        return {0, 0};
    std::string err;
    auto counts = git::get_ahead_behind(repo, upstream, &err);
    if (!counts) {
        log_debug("ahead/behind unavailable", {{"repo", repo.string()}, {"error", err}});
        return {0, 0};
    }
    return *counts;
}

WorktreeState CliGitClient::worktree_state(const fs::path& repo) {
    std::string err;
    auto st = git::get_worktree_status(repo, &err);
    if (!st)
        throw std::runtime_error("cannot read status of " + repo.string() + ": " + err);
    return WorktreeState{st->dirty_tracked, st->untracked};
}

GitOperation CliGitClient::operation(const fs::path& repo) {
    return git::get_operation(repo).value_or(GitOperation::None);
}

std::string CliGitClient::default_branch(const fs::path& repo, const std::string& remote) {
    return git::get_remote_default_branch(repo, remote.empty() ? "origin" : remote).value_or("");
}

std::string CliGitClient::status_porcelain(const fs::path& repo) {
    return run_checked(repo, {"status", "--porcelain", "--untracked-files=all"});
}

std::string CliGitClient::diff_numstat(const fs::path& repo, bool cached) {
    if (cached)
        return run_checked(repo, {"diff", "--cached", "--numstat"});
    return run_checked(repo, {"diff", "--numstat"});
}

ProbeOutcome CliGitClient::probe_sync(const fs::path& repo, const std::string& upstream,
                                      SyncStrategy strategy, std::string* detail) {
    ProbeWorktree wt(*this, repo);
    if (!wt.ready()) {
        if (detail)
            *detail = trim(wt.error());
        return ProbeOutcome::ProbeFailed;
    }
    procutil::CommandResult r;
    switch (strategy) {
    case SyncStrategy::Merge:
        r = run(wt.path(), {"-c", "core.hooksPath=/dev/null", "merge", "--no-commit", "--no-ff",
                            upstream});
        run(wt.path(), {"merge", "--abort"});
        break;
    case SyncStrategy::Rebase:
        r = run(wt.path(), {"-c", "core.hooksPath=/dev/null", "rebase", upstream});
        if (!r.ok())
            run(wt.path(), {"rebase", "--abort"});
        break;
    }
    if (detail)
        *detail = trim(r.output);
    if (r.ok())
        return ProbeOutcome::Clean;
    if (output_indicates_conflict(r.output))
        return ProbeOutcome::Conflict;
    return ProbeOutcome::ProbeFailed;
}

procutil::CommandResult CliGitClient::push_dry_run(const fs::path& repo, const std::string& remote,
                                                   const std::string& refspec) {
    return run(repo, {"push", "--dry-run", "--porcelain", remote, refspec});
}

void CliGitClient::fetch_prune(const fs::path& repo) { run_checked(repo, {"fetch", "--prune"}); }

void CliGitClient::merge_no_edit(const fs::path& repo, const std::string& upstream) {
    run_checked(repo, {"merge", "--no-edit", upstream});
}

void CliGitClient::rebase(const fs::path& repo, const std::string& upstream) {
    run_checked(repo, {"rebase", upstream});
}

void CliGitClient::push(const fs::path& repo) { run_checked(repo, {"push"}); }

void CliGitClient::push_upstream(const fs::path& repo, const std::string& remote,
                                 const std::string& branch, bool force) {
    std::vector<std::string> args{"push", "-u"};
    if (force)
        args.push_back("--force");
    args.push_back(remote.empty() ? "origin" : remote);
    args.push_back(branch);
    run_checked(repo, args);
}

void CliGitClient::pull_ff_only(const fs::path& repo) { run_checked(repo, {"pull", "--ff-only"}); }

void CliGitClient::abort_merge(const fs::path& repo) { run_checked(repo, {"merge", "--abort"}); }

void CliGitClient::abort_rebase(const fs::path& repo) { run_checked(repo, {"rebase", "--abort"}); }

void CliGitClient::abort_cherry_pick(const fs::path& repo) {
    run_checked(repo, {"cherry-pick", "--abort"});
}

void CliGitClient::bisect_reset(const fs::path& repo) { run_checked(repo, {"bisect", "reset"}); }

void CliGitClient::add_all(const fs::path& repo) { run_checked(repo, {"add", "-A"}); }

void CliGitClient::commit(const fs::path& repo, const std::string& message) {
    run_checked(repo, {"commit", "-m", message});
}

void CliGitClient::add_remote(const fs::path& repo, const std::string& name,
                              const std::string& url) {
    run_checked(repo, {"remote", "add", name, url});
}

void CliGitClient::set_remote_url(const fs::path& repo, const std::string& name,
                                  const std::string& url) {
    run_checked(repo, {"remote", "set-url", name, url});
}

} // namespace fleetfix
