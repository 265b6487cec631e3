#ifndef FIX_EXECUTOR_HPP
#define FIX_EXECUTOR_HPP
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "eligibility.hpp"
#include "fix_action.hpp"
#include "git_client.hpp"
#include "github_client.hpp"
#include "state_store.hpp"

namespace fleetfix {

enum class StepStatus { Running, Done, Failed, Skipped };

const char* to_string(StepStatus status);

/**
 * @brief Progress notification for one plan step.
 */
struct StepEvent {
    FixAction action;
    FixActionPlanEntry entry;
    StepStatus status;
    std::string error; ///< Set for StepStatus::Failed
};

/**
 * @brief Synchronous step listener. Runs on the executing thread.
 */
using StepObserver = std::function<void(const StepEvent&)>;

void emit_fix_step(const StepObserver& observer, FixAction action,
                   const FixActionPlanEntry& entry, StepStatus status,
                   const std::string& error = "");

/**
 * @brief Run @p fn as one step, reporting running then done or failed.
 *
 * Exceptions from @p fn are reported and rethrown.
 */
void run_fix_step(const StepObserver& observer, FixAction action,
                  const FixActionPlanEntry& entry, const std::function<void()>& fn);

/**
 * @brief Reject options that do not apply to @p action.
 *
 * @throws std::runtime_error describing the offending option.
 */
void validate_fix_options(FixAction action, const FixOptions& options);

/**
 * @brief Drives one fix action against a repository.
 *
 * Steps stop at the first failure; steps that already ran are not undone.
 */
class FixExecutor {
  public:
    FixExecutor(GitClient& git, GitHubClient& github, StateStore& store, const AppConfig& cfg);

    /// Plan context including facts that need a git query.
    PlanContext plan_context(const FixRepoState& state, const FixOptions& options);
    std::vector<FixActionPlanEntry> plan(FixAction action, const FixRepoState& state,
                                         const FixOptions& options);

    /**
     * @brief Re-check eligibility and run every step of @p action.
     *
     * Revalidation is left to the caller.
     *
     * @throws FixIneligibleError when the action is not allowed for @p state.
     * @throws CommandError or std::runtime_error when a step fails.
     */
    void execute(FixAction action, const FixRepoState& state, const FixOptions& options,
                 const StepObserver& observer = {});

  private:
    class Steps;

    void abort_operation(const FixRepoState& state, Steps& steps);
    void sync_with_upstream(const FixRepoState& state, SyncStrategy strategy, Steps& steps);
    void create_project(const FixRepoState& state, const FixOptions& options, Steps& steps);
    void fork_and_retarget(const FixRepoState& state, Steps& steps);
    void stage_commit_push(const FixRepoState& state, const FixOptions& options, Steps& steps);
    void pull_ff_only(const FixRepoState& state, Steps& steps);
    void set_upstream_push(const FixRepoState& state, Steps& steps);
    void enable_auto_push(const FixRepoState& state, Steps& steps);

    void fetch_prune_step(const std::string& id, const FixRepoState& state, Steps& steps);
    std::string resolve_branch(const FixRepoState& state);
    std::string push_remote(const FixRepoState& state);

    GitClient& git_;
    GitHubClient& github_;
    StateStore& store_;
    const AppConfig& cfg_;
};

} // namespace fleetfix

#endif // FIX_EXECUTOR_HPP
