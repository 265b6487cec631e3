#ifndef SYNC_FEASIBILITY_HPP
#define SYNC_FEASIBILITY_HPP
#include "git_client.hpp"
#include "repo.hpp"

namespace fleetfix {

/**
 * @brief Dry-run results for both sync strategies of one repository.
 *
 * Recomputed on every load and never persisted.
 */
struct SyncFeasibility {
    bool checked = false; ///< Probes actually ran
    ProbeOutcome rebase = ProbeOutcome::Unknown;
    ProbeOutcome merge = ProbeOutcome::Unknown;

    ProbeOutcome outcome_for(SyncStrategy strategy) const {
        return strategy == SyncStrategy::Merge ? merge : rebase;
    }
    void set_outcome(SyncStrategy strategy, ProbeOutcome outcome) {
        (strategy == SyncStrategy::Merge ? merge : rebase) = outcome;
    }
    bool clean_for(SyncStrategy strategy) const {
        return outcome_for(strategy) == ProbeOutcome::Clean;
    }
    bool conflict_for(SyncStrategy strategy) const {
        return outcome_for(strategy) == ProbeOutcome::Conflict;
    }
    bool probe_failed_for(SyncStrategy strategy) const {
        return outcome_for(strategy) == ProbeOutcome::ProbeFailed;
    }
    /// Clean, or a failed probe the caller may retry by attempting the sync.
    bool can_attempt_for(SyncStrategy strategy) const {
        return clean_for(strategy) || probe_failed_for(strategy);
    }
    bool any_probe_failed() const {
        return rebase == ProbeOutcome::ProbeFailed || merge == ProbeOutcome::ProbeFailed;
    }
};

/**
 * @brief Whether @p rec qualifies for sync probing.
 *
 * Requires origin and upstream, a diverged branch, a clean working tree and
 * no operation in progress.
 */
bool feasibility_probe_applicable(const RepositoryRecord& rec);

/**
 * @brief Probe rebase and merge against the record's upstream.
 *
 * A probe that throws is classified as probe failed. Returns an unchecked
 * result when @ref feasibility_probe_applicable is false.
 */
SyncFeasibility probe_sync_feasibility(GitClient& git, const RepositoryRecord& rec);

/**
 * @brief Probe @p rec and fold the outcome into its unsyncable reasons.
 *
 * Adds `sync_conflict` when @p default_strategy conflicts and neither strategy
 * is clean, otherwise `sync_probe_failed` when neither is clean and a probe
 * failed.
 */
SyncFeasibility apply_sync_feasibility(GitClient& git, RepositoryRecord& rec,
                                       SyncStrategy default_strategy = SyncStrategy::Rebase);

} // namespace fleetfix

#endif // SYNC_FEASIBILITY_HPP
