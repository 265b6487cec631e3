#ifndef ELIGIBILITY_HPP
#define ELIGIBILITY_HPP
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "fix_action.hpp"

namespace fleetfix {

/**
 * @brief Inputs to eligibility beyond the record and its metadata.
 */
struct EligibilityContext {
    bool interactive = false;
    RiskSnapshot risk;
    SyncStrategy strategy = SyncStrategy::Rebase;
    SyncFeasibility feasibility;
};

EligibilityContext make_eligibility_context(const FixRepoState& state, SyncStrategy strategy,
                                            bool interactive = false);

/**
 * @brief The requested action is not currently allowed.
 *
 * `what()` is `fix action not eligible`, followed by `: <reason>` when a
 * reason is known.
 */
class FixIneligibleError : public std::runtime_error {
  public:
    FixIneligibleError(FixAction action, const std::string& reason);
    FixAction action() const { return action_; }
    const std::string& reason() const { return reason_; }

  private:
    FixAction action_;
    std::string reason_;
};

/**
 * @brief Whether push-capable actions may run against the repository's remote.
 *
 * Allowed without metadata or without an origin; otherwise the recorded push
 * access must be read-write.
 */
bool push_allowed(const RepositoryRecord& rec, const std::optional<RepoMetadata>& meta);

/**
 * @brief Actions that are currently safe for @p rec, in offer order.
 *
 * An operation in progress restricts the result to abort-operation.
 * `ignore` is never returned; interactive callers offer it themselves.
 */
std::vector<FixAction> eligible_fix_actions(const RepositoryRecord& rec,
                                            const std::optional<RepoMetadata>& meta,
                                            const EligibilityContext& ctx);

bool is_fix_action_eligible(FixAction action, const RepositoryRecord& rec,
                            const std::optional<RepoMetadata>& meta,
                            const EligibilityContext& ctx);

/**
 * @brief Explanation for an ineligible stage-commit-push or sync-with-upstream.
 *
 * @return An empty string for other actions or when nothing specific blocks.
 */
std::string ineligible_fix_reason(FixAction action, const RepositoryRecord& rec,
                                  const EligibilityContext& ctx);

/**
 * @brief Why sync-with-upstream must not run with @p strategy right now.
 *
 * Checked again at execution time. Empty when the sync may proceed.
 */
std::string sync_blocked_reason(const RepositoryRecord& rec, const SyncFeasibility& feasibility,
                                SyncStrategy strategy);

} // namespace fleetfix

#endif // ELIGIBILITY_HPP
