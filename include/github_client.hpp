#ifndef GITHUB_CLIENT_HPP
#define GITHUB_CLIENT_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "git_client.hpp"
#include "origin_utils.hpp"
#include "repo.hpp"

namespace fleetfix {

/**
 * @brief Result of a push-access probe.
 */
struct PushAccessResult {
    PushAccess access = PushAccess::Unknown;
    std::string remote; ///< Remote that was probed, empty if none could be chosen
    std::string error;  ///< Why the classification is unknown
};

/**
 * @brief Hosted repository operations.
 */
class GitHubClient {
  public:
    virtual ~GitHubClient() = default;

    /**
     * @brief Create an empty remote repository.
     *
     * @throws std::runtime_error on failure.
     */
    virtual void create_repo(const std::string& owner, const std::string& name,
                             Visibility visibility) = 0;

    /**
     * @brief Fork @p source into @p owner, reusing an existing fork.
     *
     * @throws std::runtime_error on failure.
     */
    virtual void fork_repo(const RemoteRepoRef& source, const std::string& owner) = 0;

    /**
     * @brief Classify whether the current credentials can push to the repository.
     *
     * Never throws; failures are reported through @ref PushAccessResult::error.
     */
    virtual PushAccessResult probe_push_access(const std::filesystem::path& repo,
                                               const std::string& preferred_remote) = 0;
};

/**
 * @brief Classify `git push --dry-run` output.
 *
 * @return ReadWrite for success, ReadOnly when the output names a
 *         permission problem, Unknown otherwise.
 */
PushAccess classify_push_probe(int exit_code, const std::string& output);

/**
 * @brief Arguments for `gh repo fork`.
 *
 * Forks land in the authenticated account unless @p owner names a different
 * account, which is passed as the target organisation.
 */
std::vector<std::string> gh_fork_command(const RemoteRepoRef& source, const std::string& owner,
                                         const std::string& login);

/**
 * @brief GitHubClient driving the `gh` command line tool.
 *
 * When constructed with a test remote root, repositories are bare git
 * repositories at `<root>/<owner>/<name>.git` and `gh` is never invoked.
 */
class GhCliGitHubClient : public GitHubClient {
  public:
    explicit GhCliGitHubClient(GitClient& git,
                               std::optional<std::filesystem::path> test_remote_root = {});

    void create_repo(const std::string& owner, const std::string& name,
                     Visibility visibility) override;
    void fork_repo(const RemoteRepoRef& source, const std::string& owner) override;
    PushAccessResult probe_push_access(const std::filesystem::path& repo,
                                       const std::string& preferred_remote) override;

  private:
    void ensure_gh_ready();
    const std::string& authenticated_login();
    std::filesystem::path test_repo_path(const std::string& owner, const std::string& name) const;

    GitClient& git_;
    std::optional<std::filesystem::path> test_root_;
    bool gh_checked_ = false;
    std::optional<std::string> login_;
};

} // namespace fleetfix

#endif // GITHUB_CLIENT_HPP
