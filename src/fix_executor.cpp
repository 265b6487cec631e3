#include "fix_executor.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include "logger.hpp"
#include "time_utils.hpp"

namespace fleetfix {

/**
 * @brief Step runner bound to one action's plan.
 *
 * Steps are labelled with the planned entry of the same id, falling back to
 * the entry supplied by the caller when the plan has none.
 */
class FixExecutor::Steps {
  public:
    Steps(FixAction action, const std::vector<FixActionPlanEntry>& plan,
          const StepObserver& observer)
        : action_(action), observer_(observer) {
        for (const auto& entry : plan)
            by_id_[entry.id] = entry;
    }

    void run(const FixActionPlanEntry& fallback, const std::function<void()>& fn) {
        run_fix_step(observer_, action_, entry_for(fallback), fn);
    }

    void skip(const FixActionPlanEntry& fallback) {
        FixActionPlanEntry entry = entry_for(fallback);
        log_info("fix step skipped", {{"action", to_string(action_)}, {"step", entry.id}});
        emit_fix_step(observer_, action_, entry, StepStatus::Skipped);
    }

    FixAction action() const { return action_; }

  private:
    FixActionPlanEntry entry_for(const FixActionPlanEntry& fallback) const {
        auto it = by_id_.find(fallback.id);
        return it != by_id_.end() ? it->second : fallback;
    }

    FixAction action_;
    const StepObserver& observer_;
    std::map<std::string, FixActionPlanEntry> by_id_;
};

const char* to_string(StepStatus status) {
    switch (status) {
    case StepStatus::Running:
        return "running";
    case StepStatus::Done:
        return "done";
    case StepStatus::Failed:
        return "failed";
    case StepStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

void emit_fix_step(const StepObserver& observer, FixAction action,
                   const FixActionPlanEntry& entry, StepStatus status, const std::string& error) {
    if (!observer)
        return;
    observer(StepEvent{action, entry, status, error});
}

void run_fix_step(const StepObserver& observer, FixAction action,
                  const FixActionPlanEntry& entry, const std::function<void()>& fn) {
    emit_fix_step(observer, action, entry, StepStatus::Running);
    log_info("fix step", {{"action", to_string(action)}, {"step", entry.id}, {"summary", entry.summary}});
    try {
        fn();
    } catch (const std::exception& e) {
        log_error("fix step failed",
                  {{"action", to_string(action)}, {"step", entry.id}, {"error", e.what()}});
        emit_fix_step(observer, action, entry, StepStatus::Failed, e.what());
        throw;
    }
    emit_fix_step(observer, action, entry, StepStatus::Done);
}

void validate_fix_options(FixAction action, const FixOptions& options) {
    const std::string name = to_string(action);
    if (!options.project_name.empty()) {
        if (action != FixAction::CreateProject)
            throw std::runtime_error("project name is only used by create-project, not " + name);
        std::string error;
        if (!validate_repo_name(sanitize_repo_name(options.project_name), &error))
            throw std::runtime_error("invalid repository name: " + error);
    }
    if (options.visibility && action != FixAction::CreateProject)
        throw std::runtime_error("visibility is only used by create-project, not " + name);
    if (!options.commit_message.empty() && action != FixAction::StageCommitPush)
        throw std::runtime_error("commit message is only used by stage-commit-push, not " + name);
    if ((options.generate_gitignore || !options.gitignore_patterns.empty()) &&
        action != FixAction::StageCommitPush)
        throw std::runtime_error("gitignore patterns are only used by stage-commit-push, not " +
                                 name);
}

FixExecutor::FixExecutor(GitClient& git, GitHubClient& github, StateStore& store,
                         const AppConfig& cfg)
    : git_(git), github_(github), store_(store), cfg_(cfg) {}

PlanContext FixExecutor::plan_context(const FixRepoState& state, const FixOptions& options) {
    PlanContext ctx = make_plan_context(state, cfg_, options);
    if (!ctx.github_owner.empty() && !state.record.path.empty()) {
        auto names = git_.remote_names(state.record.path);
        ctx.fork_remote_exists =
            std::find(names.begin(), names.end(), ctx.github_owner) != names.end();
    }
    return ctx;
}

std::vector<FixActionPlanEntry> FixExecutor::plan(FixAction action, const FixRepoState& state,
                                                  const FixOptions& options) {
    return build_fix_plan(action, plan_context(state, options));
}

void FixExecutor::execute(FixAction action, const FixRepoState& state, const FixOptions& options,
                          const StepObserver& observer) {
    validate_fix_options(action, options);
    const SyncStrategy strategy = resolve_sync_strategy(options, cfg_);
    const RepositoryRecord& rec = state.record;

    Steps steps(action, plan(action, state, options), observer);
    if (action == FixAction::Ignore) {
        if (!options.interactive)
            throw FixIneligibleError(action, "ignore is only available in interactive sessions");
        steps.run({"ignore-session", false, "Ignore this repository in the current session."},
                  [] {});
        return;
    }

    EligibilityContext ctx = make_eligibility_context(state, strategy, options.interactive);
    if (!is_fix_action_eligible(action, rec, state.metadata, ctx))
        throw FixIneligibleError(action, ineligible_fix_reason(action, rec, ctx));

    log_info("applying fix action", {{"action", to_string(action)}, {"repo", rec.path.string()}});
    switch (action) {
    case FixAction::Ignore:
        break;
    case FixAction::AbortOperation:
        abort_operation(state, steps);
        break;
    case FixAction::Push:
        if (!rec.upstream.empty() && (rec.diverged || rec.behind > 0))
            throw FixIneligibleError(
                action, "push is blocked: branch is behind upstream; run sync-with-upstream first");
        steps.run({"push-main", true, "git push"}, [&] { git_.push(rec.path); });
        break;
    case FixAction::SyncWithUpstream:
        sync_with_upstream(state, strategy, steps);
        break;
    case FixAction::CreateProject:
        create_project(state, options, steps);
        break;
    case FixAction::ForkAndRetarget:
        fork_and_retarget(state, steps);
        break;
    case FixAction::StageCommitPush:
        stage_commit_push(state, options, steps);
        break;
    case FixAction::PullFFOnly:
        pull_ff_only(state, steps);
        break;
    case FixAction::SetUpstreamPush:
        set_upstream_push(state, steps);
        break;
    case FixAction::EnableAutoPush:
        enable_auto_push(state, steps);
        break;
    }
}

void FixExecutor::abort_operation(const FixRepoState& state, Steps& steps) {
    const auto& path = state.record.path;
    switch (state.record.operation) {
    case GitOperation::Merge:
        steps.run({"abort-merge", true, "git merge --abort"}, [&] { git_.abort_merge(path); });
        return;
    case GitOperation::Rebase:
        steps.run({"abort-rebase", true, "git rebase --abort"}, [&] { git_.abort_rebase(path); });
        return;
    case GitOperation::CherryPick:
        steps.run({"abort-cherry-pick", true, "git cherry-pick --abort"},
                  [&] { git_.abort_cherry_pick(path); });
        return;
    case GitOperation::Bisect:
        steps.run({"abort-bisect", true, "git bisect reset"}, [&] { git_.bisect_reset(path); });
        return;
    case GitOperation::None:
        break;
    }
    throw std::runtime_error("no operation in progress for " + state.record.name);
}

void FixExecutor::fetch_prune_step(const std::string& id, const FixRepoState& state,
                                   Steps& steps) {
    FixActionPlanEntry entry{id, true, "git fetch --prune"};
    if (cfg_.sync.fetch_prune)
        steps.run(entry, [&] { git_.fetch_prune(state.record.path); });
    else
        steps.skip(entry);
}

void FixExecutor::sync_with_upstream(const FixRepoState& state, SyncStrategy strategy,
                                     Steps& steps) {
    const RepositoryRecord& rec = state.record;
    std::string reason = sync_blocked_reason(rec, state.feasibility, strategy);
    if (!reason.empty())
        throw FixIneligibleError(steps.action(), reason);
    fetch_prune_step("sync-fetch-prune", state, steps);
    if (strategy == SyncStrategy::Merge)
        steps.run({"sync-merge", true, "git merge --no-edit " + rec.upstream},
                  [&] { git_.merge_no_edit(rec.path, rec.upstream); });
    else
        steps.run({"sync-rebase", true, "git rebase " + rec.upstream},
                  [&] { git_.rebase(rec.path, rec.upstream); });
}

void FixExecutor::create_project(const FixRepoState& state, const FixOptions& options,
                                 Steps& steps) {
    const RepositoryRecord& rec = state.record;
    const std::string owner = cfg_.github.owner;
    if (owner.empty())
        throw std::runtime_error("github.owner is required; set github.owner in config.yaml");
    if (rec.catalog.empty())
        throw std::runtime_error("catalog is required for create-project");

    std::string name = options.project_name;
    if (name.empty())
        name = rec.name;
    if (name.empty())
        name = rec.path.filename().string();
    name = sanitize_repo_name(name);
    std::string error;
    if (!validate_repo_name(name, &error))
        throw std::runtime_error("invalid repository name: " + error);

    const Visibility visibility = resolve_visibility(options, cfg_);
    const std::string expected = remote_repo_url(owner, name, cfg_.github.remote_protocol,
                                                 cfg_.github.remote_url_template);
    const FixActionPlanEntry create_entry{"create-gh-repo", true,
                                          "gh repo create " + owner + "/" + name +
                                              (visibility == Visibility::Public ? " --public"
                                                                                : " --private")};

    std::string origin = git_.remote_url(rec.path, "origin");
    if (!origin.empty()) {
        steps.skip(create_entry);
        steps.run({"create-validate-origin", false,
                   "Validate existing origin URL matches the expected repository identity."},
                  [&] {
                      if (!same_origin_identity(origin, expected))
                          throw std::runtime_error("conflicting origin: existing \"" + origin +
                                                   "\" does not match expected \"" + expected +
                                                   "\"");
                  });
    } else {
        steps.run(create_entry, [&] { github_.create_repo(owner, name, visibility); });
        steps.run({"create-add-origin", true, "git remote add origin " + expected},
                  [&] { git_.add_remote(rec.path, "origin", expected); });
        origin = expected;
    }

    if (rec.repo_key.empty())
        throw std::runtime_error("repo_key is required for create-project");
    RepoMetadata meta;
    steps.run({"create-write-metadata", false,
               "Write/update repo metadata (origin URL, visibility, default auto-push policy)."},
              [&] {
                  meta = ensure_repo_metadata(
                      store_, cfg_, MetadataSeed{rec.repo_key, name, origin, visibility, rec.catalog});
              });

    std::string branch = git_.current_branch(rec.path);
    const std::string head = git_.head_sha(rec.path);
    const std::string upstream = git_.upstream(rec.path);
    if (branch.empty())
        branch = "main";
    const std::string remote = meta.preferred_remote.empty() ? "origin" : meta.preferred_remote;
    const FixActionPlanEntry push_entry{"create-initial-push", true,
                                        "git push -u " + remote + " " + branch};
    if (!head.empty() && upstream.empty())
        steps.run(push_entry, [&] { git_.push_upstream(rec.path, remote, branch, false); });
    else
        steps.skip(push_entry);
}

void FixExecutor::fork_and_retarget(const FixRepoState& state, Steps& steps) {
    const RepositoryRecord& rec = state.record;
    if (!state.metadata)
        throw std::runtime_error("repo metadata is required for fork-and-retarget");
    const std::string owner = cfg_.github.owner;
    if (owner.empty())
        throw std::runtime_error("github.owner is required; set github.owner in config.yaml");
    if (rec.origin_url.empty())
        throw std::runtime_error("origin URL is required for fork-and-retarget");
    auto source = parse_remote_repo(rec.origin_url);
    if (!source)
        throw std::runtime_error("cannot derive source repository from origin \"" +
                                 rec.origin_url + "\"");
    const std::string fork_url = remote_repo_url(owner, source->name, cfg_.github.remote_protocol,
                                                 cfg_.github.remote_url_template);

    steps.run({"fork-gh-fork", true,
               "gh repo fork " + source->full_name() + " --remote=false --clone=false"},
              [&] { github_.fork_repo(*source, owner); });

    auto names = git_.remote_names(rec.path);
    const bool exists = std::find(names.begin(), names.end(), owner) != names.end();
    steps.run({"fork-set-remote", true,
               (exists ? "git remote set-url " : "git remote add ") + owner + " " + fork_url},
              [&] {
                  if (exists)
                      git_.set_remote_url(rec.path, owner, fork_url);
                  else
                      git_.add_remote(rec.path, owner, fork_url);
              });

    steps.run({"fork-write-metadata", false,
               "Update repo metadata immediately after retargeting remote."},
              [&] {
                  RepoMetadata meta = *state.metadata;
                  meta.preferred_remote = owner;
                  meta.push_access = PushAccess::Unknown;
                  meta.push_access_checked_at.clear();
                  meta.push_access_checked_remote.clear();
                  meta.updated_at = format_rfc3339(current_time());
                  store_.save_repo_metadata(meta);
              });

    const std::string branch = resolve_branch(state);
    steps.run({"fork-push-upstream", true, "git push -u --force " + owner + " " + branch},
              [&] { git_.push_upstream(rec.path, owner, branch, true); });

    steps.run({"fork-refresh-metadata", false,
               "Refresh repo metadata push-access probe state after retarget push."},
              [&] {
                  auto meta = store_.load_repo_metadata(rec.repo_key);
                  if (!meta)
                      throw std::runtime_error("repo metadata not found for " + rec.repo_key);
                  PushAccessResult probe = github_.probe_push_access(rec.path, owner);
                  meta->push_access = probe.access;
                  meta->push_access_checked_at = format_rfc3339(current_time());
                  meta->push_access_checked_remote = probe.remote;
                  meta->updated_at = meta->push_access_checked_at;
                  store_.save_repo_metadata(*meta);
              });
}

void FixExecutor::stage_commit_push(const FixRepoState& state, const FixOptions& options,
                                    Steps& steps) {
    const RepositoryRecord& rec = state.record;
    if (!rec.origin_url.empty() && !rec.upstream.empty() && (rec.diverged || rec.behind > 0))
        throw FixIneligibleError(steps.action(),
                                 "stage-commit-push is blocked: branch is behind upstream, so push "
                                 "would be rejected; run sync-with-upstream first");

    if (options.generate_gitignore && !options.gitignore_patterns.empty()) {
        const std::string n = std::to_string(options.gitignore_patterns.size());
        FixActionPlanEntry entry{"stage-gitignore-append", false,
                                 "Append " + n + " selected pattern(s) to root .gitignore."};
        if (state.risk.missing_root_gitignore)
            entry = {"stage-gitignore-generate", false,
                     "Generate root .gitignore with " + n + " selected pattern(s)."};
        steps.run(entry, [&] { write_gitignore_patterns(rec.path, options.gitignore_patterns); });
    }

    steps.run({"stage-git-add", true, "git add -A"}, [&] { git_.add_all(rec.path); });
    const std::string message = planned_commit_message(options.commit_message);
    steps.run({"stage-git-commit", true, "git commit -m \"" + message + "\""},
              [&] { git_.commit(rec.path, message); });

    if (rec.origin_url.empty()) {
        steps.skip({"stage-skip-push-no-origin", false,
                    "Skip push because no origin remote is configured."});
        return;
    }
    if (rec.upstream.empty()) {
        const std::string branch = resolve_branch(state);
        const std::string remote = push_remote(state);
        steps.run({"stage-push-set-upstream", true, "git push -u " + remote + " " + branch},
                  [&] { git_.push_upstream(rec.path, remote, branch, false); });
        return;
    }
    steps.run({"stage-push", true, "git push"}, [&] { git_.push(rec.path); });
}

void FixExecutor::pull_ff_only(const FixRepoState& state, Steps& steps) {
    fetch_prune_step("pull-fetch-prune", state, steps);
    steps.run({"pull-ff-only", true, "git pull --ff-only"},
              [&] { git_.pull_ff_only(state.record.path); });
}

void FixExecutor::set_upstream_push(const FixRepoState& state, Steps& steps) {
    const std::string branch = resolve_branch(state);
    const std::string remote = push_remote(state);
    steps.run({"upstream-push", true, "git push -u " + remote + " " + branch},
              [&] { git_.push_upstream(state.record.path, remote, branch, false); });
}

void FixExecutor::enable_auto_push(const FixRepoState& state, Steps& steps) {
    const RepositoryRecord& rec = state.record;
    if (rec.repo_key.empty())
        throw std::runtime_error("repo_key is required for enable-auto-push");
    std::string remote = "origin";
    if (state.metadata && !state.metadata->preferred_remote.empty())
        remote = state.metadata->preferred_remote;
    const std::string default_branch = git_.default_branch(rec.path, remote);
    const AutoPushMode mode = is_default_branch(rec.branch, default_branch)
                                  ? AutoPushMode::IncludeDefaultBranch
                                  : AutoPushMode::Enabled;
    steps.run({"enable-auto-push", false,
               std::string("Write repo metadata: set auto_push=\"") + to_string(mode) + "\"."},
              [&] {
                  auto meta = store_.load_repo_metadata(rec.repo_key);
                  if (!meta)
                      throw std::runtime_error("repo metadata not found for " + rec.repo_key);
                  meta->auto_push = mode;
                  meta->updated_at = format_rfc3339(current_time());
                  store_.save_repo_metadata(*meta);
              });
}

std::string FixExecutor::resolve_branch(const FixRepoState& state) {
    std::string branch = state.record.branch;
    if (branch.empty())
        branch = git_.current_branch(state.record.path);
    if (branch.empty())
        throw std::runtime_error("cannot determine current branch for " + state.record.name);
    return branch;
}

std::string FixExecutor::push_remote(const FixRepoState& state) {
    const std::string preferred = state.metadata ? state.metadata->preferred_remote : "";
    const std::string remote = planned_remote(preferred, state.record.upstream);
    try {
        return effective_remote(git_, state.record.path, remote);
    } catch (const std::exception& e) {
        log_debug("planned push remote unavailable", {{"remote", remote}, {"error", e.what()}});
    }
    try {
        return effective_remote(git_, state.record.path, "");
    } catch (const std::exception& e) {
        log_debug("no fallback push remote", {{"repo", state.record.path.string()}, {"error", e.what()}});
    }
    return remote;
}

} // namespace fleetfix
