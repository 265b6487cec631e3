#ifndef FIX_ENGINE_HPP
#define FIX_ENGINE_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "eligibility.hpp"
#include "fix_action.hpp"
#include "fix_executor.hpp"
#include "git_client.hpp"
#include "github_client.hpp"
#include "repo_scanner.hpp"
#include "state_store.hpp"

namespace fleetfix {

/**
 * @brief Order used for display: unsyncable first, then name, then path.
 */
void sort_fix_repos(std::vector<FixRepoState>& repos);

/**
 * @brief Pick one repository by path, repo key or short name.
 *
 * Paths are compared after lexical cleanup. Keys compare case-insensitively.
 * Names must match exactly. Several key or name matches are an error
 * listing the candidate paths.
 *
 * @throws std::runtime_error when nothing or more than one repository matches.
 */
FixRepoState resolve_fix_target(const std::string& selector,
                                const std::vector<FixRepoState>& repos);

/**
 * @brief Loads fix candidates and applies fix actions under the state lock.
 */
class FixEngine {
  public:
    FixEngine(GitClient& git, GitHubClient& github, StateStore& store);

    /**
     * @brief Load every repository of @p catalogs with feasibility, risk and
     * metadata attached.
     *
     * An empty @p catalogs selects all catalogs. Repositories whose push
     * access is still unknown are probed and their metadata updated.
     */
    std::vector<FixRepoState> load_fix_repos(const std::vector<std::string>& catalogs,
                                             RefreshMode mode);

    /**
     * @brief Run @p action on the repository at @p path and revalidate it.
     *
     * Revalidation re-observes only @p path and falls back to a full rescan
     * of the selected catalogs when that fails.
     *
     * @return The repository state after revalidation.
     */
    FixRepoState apply_fix_action(const std::vector<std::string>& catalogs,
                                  const std::filesystem::path& path, FixAction action,
                                  const FixOptions& options, const StepObserver& observer = {});

    /// Plan for @p action without executing anything.
    std::vector<FixActionPlanEntry> plan_fix_action(FixAction action, const FixRepoState& state,
                                                    const FixOptions& options);

    /// Actions offered for @p state with the configured sync strategy.
    std::vector<FixAction> eligible_actions(const FixRepoState& state,
                                            bool interactive = false) const;

    /// Configuration read by the most recent load or apply.
    const AppConfig& config() const { return cfg_; }

  private:
    FixRepoState build_state(RepositoryRecord rec, std::optional<RepoMetadata> meta,
                             const MachineSnapshot& machine);
    void refresh_unknown_push_access(std::vector<FixRepoState>& repos);
    const RepositoryRecord* find_record(const MachineSnapshot& machine,
                                        const std::vector<Catalog>& catalogs,
                                        const std::filesystem::path& path) const;

    GitClient& git_;
    GitHubClient& github_;
    StateStore& store_;
    AppConfig cfg_;
};

} // namespace fleetfix

#endif // FIX_ENGINE_HPP
