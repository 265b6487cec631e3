#include "eligibility.hpp"
#include <algorithm>

namespace fleetfix {

namespace {

bool dirty(const RepositoryRecord& rec) { return rec.has_dirty_tracked || rec.has_untracked; }

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += sep;
        out += item;
    }
    return out;
}

bool commit_risk_blocks(const EligibilityContext& ctx) {
    return ctx.risk.has_secret_like_changes() ||
           (ctx.risk.has_noisy_changes_without_gitignore() && !ctx.interactive);
}

} // namespace

EligibilityContext make_eligibility_context(const FixRepoState& state, SyncStrategy strategy,
                                            bool interactive) {
    EligibilityContext ctx;
    ctx.interactive = interactive;
    ctx.risk = state.risk;
    ctx.strategy = strategy;
    ctx.feasibility = state.feasibility;
    return ctx;
}

FixIneligibleError::FixIneligibleError(FixAction action, const std::string& reason)
    : std::runtime_error(reason.empty() ? std::string("fix action not eligible")
                                        : "fix action not eligible: " + reason),
      action_(action), reason_(reason) {}

bool push_allowed(const RepositoryRecord& rec, const std::optional<RepoMetadata>& meta) {
    if (!meta || rec.origin_url.empty())
        return true;
    return push_access_permits_push(meta->push_access);
}

std::vector<FixAction> eligible_fix_actions(const RepositoryRecord& rec,
                                            const std::optional<RepoMetadata>& meta,
                                            const EligibilityContext& ctx) {
    if (rec.operation != GitOperation::None)
        return {FixAction::AbortOperation};

    std::vector<FixAction> actions;
    const bool has_origin = !rec.origin_url.empty();
    const bool has_upstream = !rec.upstream.empty();
    const bool can_push = push_allowed(rec, meta);

    if (!has_origin)
        actions.push_back(FixAction::CreateProject);
    if (has_origin && has_upstream && rec.diverged && !dirty(rec) &&
        ctx.feasibility.can_attempt_for(ctx.strategy))
        actions.push_back(FixAction::SyncWithUpstream);
    if (has_origin && has_upstream && rec.ahead > 0 && !rec.diverged && can_push)
        actions.push_back(FixAction::Push);
    const bool push_after_commit_ok =
        !has_origin || !has_upstream || (!rec.diverged && rec.behind == 0);
    if (dirty(rec) && !rec.diverged && push_after_commit_ok && (!has_origin || can_push) &&
        !commit_risk_blocks(ctx))
        actions.push_back(FixAction::StageCommitPush);
    if (has_upstream && rec.behind > 0 && rec.ahead == 0 && !rec.diverged && !dirty(rec))
        actions.push_back(FixAction::PullFFOnly);
    if (has_origin && !has_upstream && !rec.branch.empty() && !rec.diverged && can_push)
        actions.push_back(FixAction::SetUpstreamPush);
    if (has_origin && meta && meta->push_access == PushAccess::ReadOnly && !rec.repo_key.empty())
        actions.push_back(FixAction::ForkAndRetarget);
    if (meta && !rec.repo_key.empty() && push_access_permits_push(meta->push_access)) {
        if (meta->auto_push == AutoPushMode::Disabled ||
            (meta->auto_push == AutoPushMode::Enabled &&
             rec.unsyncable_reasons.contains(UnsyncableReason::PushPolicyBlocked)))
            actions.push_back(FixAction::EnableAutoPush);
    }
    return actions;
}

bool is_fix_action_eligible(FixAction action, const RepositoryRecord& rec,
                            const std::optional<RepoMetadata>& meta,
                            const EligibilityContext& ctx) {
    auto actions = eligible_fix_actions(rec, meta, ctx);
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

std::string ineligible_fix_reason(FixAction action, const RepositoryRecord& rec,
                                  const EligibilityContext& ctx) {
    if (action == FixAction::StageCommitPush) {
        if (!rec.origin_url.empty() && !rec.upstream.empty() && (rec.diverged || rec.behind > 0))
            return "stage-commit-push is blocked: branch is behind upstream, so push would be "
                   "rejected; run sync-with-upstream first";
        if (ctx.risk.has_secret_like_changes())
            return "stage-commit-push is blocked: secret-like uncommitted files detected (" +
                   join(ctx.risk.secret_like_changes, ", ") + ")";
        if (ctx.risk.has_noisy_changes_without_gitignore() && !ctx.interactive)
            return "stage-commit-push is blocked: root .gitignore is missing and noisy "
                   "uncommitted paths were detected; run interactive fix to review/generate "
                   ".gitignore or add it manually";
        return "";
    }
    if (action == FixAction::SyncWithUpstream) {
        if (!ctx.feasibility.checked)
            return "sync-with-upstream is blocked: sync feasibility has not been validated";
        return sync_blocked_reason(rec, ctx.feasibility, ctx.strategy);
    }
    return "";
}

std::string sync_blocked_reason(const RepositoryRecord& rec, const SyncFeasibility& feasibility,
                                SyncStrategy strategy) {
    const std::string prefix = "sync-with-upstream is blocked: ";
    const std::string selected = std::string(" (selected strategy: ") + to_string(strategy) + ")";
    if (rec.upstream.empty())
        return prefix + "upstream is required";
    if (feasibility.conflict_for(strategy))
        return prefix + to_string(UnsyncableReason::SyncConflict) + selected;
    if (feasibility.probe_failed_for(strategy))
        return prefix + to_string(UnsyncableReason::SyncProbeFailed) + selected;
    if (!feasibility.clean_for(strategy))
        return prefix + "sync strategy " + to_string(strategy) +
               " is not marked clean by feasibility validation";
    return "";
}

} // namespace fleetfix
