#ifndef GIT_CLIENT_HPP
#define GIT_CLIENT_HPP
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "process_utils.hpp"
#include "repo.hpp"

namespace fleetfix {

namespace fs = std::filesystem;

/**
 * @brief An external command exited unsuccessfully.
 */
class CommandError : public std::runtime_error {
  public:
    CommandError(const std::string& command, int exit_code, const std::string& output);
    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    const std::string& output() const { return output_; }

  private:
    std::string command_;
    int exit_code_;
    std::string output_;
};

struct WorktreeState {
    bool dirty_tracked = false;
    bool untracked = false;
};

/**
 * @brief Every git interaction the fix engine needs.
 *
 * Queries return empty values when the information is unavailable (no
 * upstream, unborn HEAD, missing remote). Mutations throw @ref CommandError
 * when git reports a failure.
 */
class GitClient {
  public:
    virtual ~GitClient() = default;

    virtual bool is_git_repo(const fs::path& repo) = 0;
    virtual std::vector<std::string> remote_names(const fs::path& repo) = 0;
    virtual std::string remote_url(const fs::path& repo, const std::string& remote) = 0;
    virtual std::string current_branch(const fs::path& repo) = 0;
    virtual std::string head_sha(const fs::path& repo) = 0;
    virtual std::string upstream(const fs::path& repo) = 0;
    virtual std::string ref_sha(const fs::path& repo, const std::string& ref) = 0;
    /// @return (ahead, behind) relative to @p upstream, zeros when unknown.
    virtual std::pair<int, int> ahead_behind(const fs::path& repo, const std::string& upstream) = 0;
    virtual WorktreeState worktree_state(const fs::path& repo) = 0;
    virtual GitOperation operation(const fs::path& repo) = 0;
    /// Branch advertised by `refs/remotes/<remote>/HEAD`, empty when unknown.
    virtual std::string default_branch(const fs::path& repo, const std::string& remote) = 0;
    /// Output of `git status --porcelain`.
    virtual std::string status_porcelain(const fs::path& repo) = 0;
    /// Output of `git diff --numstat`, optionally for the index.
    virtual std::string diff_numstat(const fs::path& repo, bool cached) = 0;

    /**
     * @brief Dry-run @p strategy against @p upstream without touching the
     * repository's branch, index or working tree.
     *
     * @param detail Receives git's output for diagnostics.
     */
    virtual ProbeOutcome probe_sync(const fs::path& repo, const std::string& upstream,
                                    SyncStrategy strategy, std::string* detail = nullptr) = 0;

    /// `git push --dry-run --porcelain <remote> <refspec>`; never throws.
    virtual procutil::CommandResult push_dry_run(const fs::path& repo, const std::string& remote,
                                                 const std::string& refspec) = 0;

    virtual void fetch_prune(const fs::path& repo) = 0;
    virtual void merge_no_edit(const fs::path& repo, const std::string& upstream) = 0;
    virtual void rebase(const fs::path& repo, const std::string& upstream) = 0;
    virtual void push(const fs::path& repo) = 0;
    virtual void push_upstream(const fs::path& repo, const std::string& remote,
                               const std::string& branch, bool force) = 0;
    virtual void pull_ff_only(const fs::path& repo) = 0;
    virtual void abort_merge(const fs::path& repo) = 0;
    virtual void abort_rebase(const fs::path& repo) = 0;
    virtual void abort_cherry_pick(const fs::path& repo) = 0;
    virtual void bisect_reset(const fs::path& repo) = 0;
    virtual void add_all(const fs::path& repo) = 0;
    virtual void commit(const fs::path& repo, const std::string& message) = 0;
    virtual void add_remote(const fs::path& repo, const std::string& name,
                            const std::string& url) = 0;
    virtual void set_remote_url(const fs::path& repo, const std::string& name,
                                const std::string& url) = 0;
};

/**
 * @brief Remote used for pushes and push-access probes.
 *
 * The preferred remote when set (an error if it does not exist), else the
 * upstream's remote, else `origin`, else the first remote by name.
 *
 * @throws std::runtime_error when the preferred remote is missing or the
 *         repository has no remotes.
 */
std::string effective_remote(GitClient& git, const fs::path& repo,
                             const std::string& preferred_remote);

/**
 * @brief Output fragments git prints when a dry-run merge or rebase conflicts.
 */
bool output_indicates_conflict(const std::string& output);

/**
 * @brief GitClient backed by libgit2 for queries and the git executable for
 * mutations.
 *
 * Commands run with terminal prompts and askpass helpers disabled so a
 * missing credential fails instead of hanging. A fallback author identity is
 * supplied when the repository has none configured.
 */
class CliGitClient : public GitClient {
  public:
    explicit CliGitClient(std::string git_executable = "git");

    bool is_git_repo(const fs::path& repo) override;
    std::vector<std::string> remote_names(const fs::path& repo) override;
    std::string remote_url(const fs::path& repo, const std::string& remote) override;
    std::string current_branch(const fs::path& repo) override;
    std::string head_sha(const fs::path& repo) override;
    std::string upstream(const fs::path& repo) override;
    std::string ref_sha(const fs::path& repo, const std::string& ref) override;
    std::pair<int, int> ahead_behind(const fs::path& repo, const std::string& upstream) override;
    WorktreeState worktree_state(const fs::path& repo) override;
    GitOperation operation(const fs::path& repo) override;
    std::string default_branch(const fs::path& repo, const std::string& remote) override;
    std::string status_porcelain(const fs::path& repo) override;
    std::string diff_numstat(const fs::path& repo, bool cached) override;
    ProbeOutcome probe_sync(const fs::path& repo, const std::string& upstream,
                            SyncStrategy strategy, std::string* detail) override;
    procutil::CommandResult push_dry_run(const fs::path& repo, const std::string& remote,
                                         const std::string& refspec) override;

    void fetch_prune(const fs::path& repo) override;
    void merge_no_edit(const fs::path& repo, const std::string& upstream) override;
    void rebase(const fs::path& repo, const std::string& upstream) override;
    void push(const fs::path& repo) override;
    void push_upstream(const fs::path& repo, const std::string& remote,
                       const std::string& branch, bool force) override;
    void pull_ff_only(const fs::path& repo) override;
    void abort_merge(const fs::path& repo) override;
    void abort_rebase(const fs::path& repo) override;
    void abort_cherry_pick(const fs::path& repo) override;
    void bisect_reset(const fs::path& repo) override;
    void add_all(const fs::path& repo) override;
    void commit(const fs::path& repo, const std::string& message) override;
    void add_remote(const fs::path& repo, const std::string& name,
                    const std::string& url) override;
    void set_remote_url(const fs::path& repo, const std::string& name,
                        const std::string& url) override;

    /// Run `git -C <repo> <args...>` and return the result without throwing.
    procutil::CommandResult run(const fs::path& repo, const std::vector<std::string>& args);

  private:
    /// Like @ref run but throws @ref CommandError on failure.
    std::string run_checked(const fs::path& repo, const std::vector<std::string>& args);
    std::map<std::string, std::string> environment(const fs::path& repo);

    std::string git_;
};

} // namespace fleetfix

#endif // GIT_CLIENT_HPP
