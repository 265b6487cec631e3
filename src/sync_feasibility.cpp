#include "sync_feasibility.hpp"
#include <exception>
#include "logger.hpp"

namespace fleetfix {

bool feasibility_probe_applicable(const RepositoryRecord& rec) {
    return !rec.origin_url.empty() && !rec.upstream.empty() && rec.diverged &&
           !rec.has_dirty_tracked && !rec.has_untracked && rec.operation == GitOperation::None;
}

SyncFeasibility probe_sync_feasibility(GitClient& git, const RepositoryRecord& rec) {
    SyncFeasibility out;
    if (!feasibility_probe_applicable(rec))
        return out;
    out.checked = true;
    for (SyncStrategy strategy : {SyncStrategy::Rebase, SyncStrategy::Merge}) {
        ProbeOutcome outcome = ProbeOutcome::ProbeFailed;
        try {
            std::string detail;
            outcome = git.probe_sync(rec.path, rec.upstream, strategy, &detail);
            if (outcome == ProbeOutcome::ProbeFailed)
                log_warning("sync probe failed",
                            {{"repo", rec.path.string()},
                             {"strategy", to_string(strategy)},
                             {"output", detail}});
        } catch (const std::exception& e) {
            log_warning("sync probe failed", {{"repo", rec.path.string()},
                                              {"strategy", to_string(strategy)},
                                              {"error", e.what()}});
        }
        out.set_outcome(strategy, outcome);
    }
    log_debug("sync feasibility", {{"repo", rec.path.string()},
                                   {"rebase", to_string(out.rebase)},
                                   {"merge", to_string(out.merge)}});
    return out;
}

SyncFeasibility apply_sync_feasibility(GitClient& git, RepositoryRecord& rec,
                                       SyncStrategy default_strategy) {
    SyncFeasibility out = probe_sync_feasibility(git, rec);
    if (!out.checked)
        return out;
    const bool none_clean = !out.clean_for(SyncStrategy::Rebase) && !out.clean_for(SyncStrategy::Merge);
    if (!none_clean)
        return out;
    if (out.conflict_for(default_strategy))
        append_unsyncable_reason(rec, UnsyncableReason::SyncConflict);
    else if (out.any_probe_failed())
        append_unsyncable_reason(rec, UnsyncableReason::SyncProbeFailed);
    return out;
}

} // namespace fleetfix
