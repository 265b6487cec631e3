#ifndef FIX_ACTION_HPP
#define FIX_ACTION_HPP
#include <optional>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "repo.hpp"
#include "risk_snapshot.hpp"
#include "sync_feasibility.hpp"

namespace fleetfix {

/**
 * @brief Remediation actions, in the priority order they are offered.
 */
enum class FixAction {
    Ignore,
    AbortOperation,
    CreateProject,
    ForkAndRetarget,
    SyncWithUpstream,
    Push,
    StageCommitPush,
    PullFFOnly,
    SetUpstreamPush,
    EnableAutoPush
};

const char* to_string(FixAction action);
std::optional<FixAction> parse_fix_action(const std::string& text);
/// Every action in declaration order.
const std::vector<FixAction>& all_fix_actions();
const char* fix_action_label(FixAction action);
const char* fix_action_description(FixAction action);
/// Whether the action changes the repository or its remote.
bool fix_action_risky(FixAction action);

constexpr const char* DEFAULT_COMMIT_MESSAGE = "fleetfix: checkpoint local changes before sync";
constexpr const char* REVALIDATE_STEP_ID = "revalidate-state";

/**
 * @brief One step of an action.
 */
struct FixActionPlanEntry {
    std::string id;
    bool command = false; ///< Runs an external command rather than an internal side effect
    std::string summary;

    bool operator==(const FixActionPlanEntry& other) const {
        return id == other.id && command == other.command && summary == other.summary;
    }
};

/**
 * @brief Caller choices for a single action.
 */
struct FixOptions {
    bool interactive = false;
    std::string commit_message; ///< Empty or "auto" selects DEFAULT_COMMIT_MESSAGE
    std::optional<SyncStrategy> sync_strategy; ///< Unset uses `sync.strategy`
    std::string project_name;                  ///< create-project only
    std::optional<Visibility> visibility;      ///< create-project only
    bool generate_gitignore = false;
    std::vector<std::string> gitignore_patterns;
};

/**
 * @brief Everything known about one repository while fixing it.
 */
struct FixRepoState {
    RepositoryRecord record;
    std::optional<RepoMetadata> metadata;
    RiskSnapshot risk;
    SyncFeasibility feasibility;
    bool is_default_catalog = false;
};

/**
 * @brief Inputs needed to describe an action's steps.
 */
struct PlanContext {
    GitOperation operation = GitOperation::None;
    std::string branch;
    std::string upstream;
    std::string head_sha;
    std::string origin_url;
    bool has_dirty_tracked = false;
    bool has_untracked = false;
    SyncStrategy sync_strategy = SyncStrategy::Rebase;
    std::string preferred_remote;
    std::string github_owner;
    RemoteProtocol remote_protocol = RemoteProtocol::Ssh;
    std::string remote_url_template;
    bool fork_remote_exists = false; ///< A remote named after the owner already exists
    std::string repo_name;
    std::string commit_message;
    std::string project_name;
    Visibility visibility = Visibility::Private;
    bool generate_gitignore = false;
    std::vector<std::string> gitignore_patterns;
    bool missing_root_gitignore = false;
    bool fetch_prune = true;
};

/**
 * @brief Sync strategy from @p options, falling back to the configured one.
 */
SyncStrategy resolve_sync_strategy(const FixOptions& options, const AppConfig& cfg);

/**
 * @brief Visibility for create-project: the explicit override or the configured default.
 */
Visibility resolve_visibility(const FixOptions& options, const AppConfig& cfg);

PlanContext make_plan_context(const FixRepoState& state, const AppConfig& cfg,
                              const FixOptions& options);

/**
 * @brief Steps @p action would run, ending with the revalidation step.
 *
 * Pure; used to preview an action as well as to label executed steps.
 */
std::vector<FixActionPlanEntry> build_fix_plan(FixAction action, const PlanContext& ctx);

std::string planned_commit_message(const std::string& raw);
/// Remote of @p upstream, else @p preferred_remote, else `origin`.
std::string planned_remote(const std::string& preferred_remote, const std::string& upstream);
/// @p branch, or `HEAD` when empty.
std::string planned_branch(const std::string& branch);
/// Sanitized @p name, else the sanitized repository name, else `repo`.
std::string planned_project_name(const std::string& name, const std::string& repo_name);

} // namespace fleetfix

#endif // FIX_ACTION_HPP
