#include "fix_action.hpp"
#include <algorithm>
#include <cctype>

namespace fleetfix {

namespace {

struct ActionInfo {
    FixAction action;
    const char* name;
    const char* label;
    const char* description;
    bool risky;
};

const ActionInfo ACTIONS[] = {
    {FixAction::Ignore, "ignore", "Ignore for this session",
     "Hide this repository from the current interactive fix run without changing files.", false},
    {FixAction::AbortOperation, "abort-operation", "Abort operation",
     "Cancel the active git operation (merge, rebase, cherry-pick or bisect).", true},
    {FixAction::CreateProject, "create-project", "Create project & push",
     "Create the remote project, set origin, register metadata and push the current branch.",
     true},
    {FixAction::ForkAndRetarget, "fork-and-retarget", "Fork & retarget remote",
     "Fork the upstream repository, add your fork as a remote, retarget this branch and update "
     "repo metadata.",
     true},
    {FixAction::SyncWithUpstream, "sync-with-upstream", "Sync with upstream",
     "Integrate upstream commits into your local branch using the selected sync strategy "
     "(rebase by default).",
     true},
    {FixAction::Push, "push", "Push commits", "Push local commits that are ahead of upstream.",
     true},
    {FixAction::StageCommitPush, "stage-commit-push", "Stage, commit & push",
     "Stage all local changes and create a commit; push when a remote target is configured.",
     true},
    {FixAction::PullFFOnly, "pull-ff-only", "Pull (ff-only)",
     "Fast-forward your branch to upstream without creating a merge commit.", false},
    {FixAction::SetUpstreamPush, "set-upstream-push", "Set upstream & push",
     "Set this branch's upstream tracking target and push.", true},
    {FixAction::EnableAutoPush, "enable-auto-push", "Allow auto-push in sync",
     "Allow future sync runs to auto-push this repo by enabling its auto-push policy.", false},
};

const ActionInfo& info_for(FixAction action) {
    for (const auto& info : ACTIONS) {
        if (info.action == action)
            return info;
    }
    return ACTIONS[0];
}

std::string trimmed(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); })
                 .base();
    return b < e ? std::string(b, e) : std::string();
}

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out + "\"";
}

FixActionPlanEntry command(const std::string& id, const std::string& summary) {
    return {id, true, summary};
}

FixActionPlanEntry note(const std::string& id, const std::string& summary) {
    return {id, false, summary};
}

FixActionPlanEntry fetch_prune_entry(const std::string& id, bool fetch_prune) {
    if (fetch_prune)
        return command(id, "git fetch --prune");
    return note(id, "Skip fetch prune because sync.fetch_prune is disabled.");
}

std::vector<FixActionPlanEntry> plan_abort(const PlanContext& ctx) {
    switch (ctx.operation) {
    case GitOperation::Merge:
        return {command("abort-merge", "git merge --abort")};
    case GitOperation::Rebase:
        return {command("abort-rebase", "git rebase --abort")};
    case GitOperation::CherryPick:
        return {command("abort-cherry-pick", "git cherry-pick --abort")};
    case GitOperation::Bisect:
        return {command("abort-bisect", "git bisect reset")};
    case GitOperation::None:
        break;
    }
    return {note("abort-noop", "No merge/rebase/cherry-pick/bisect operation is currently active.")};
}

std::vector<FixActionPlanEntry> plan_sync(const PlanContext& ctx) {
    std::string upstream = ctx.upstream.empty() ? "@{u}" : ctx.upstream;
    std::vector<FixActionPlanEntry> out{fetch_prune_entry("sync-fetch-prune", ctx.fetch_prune)};
    if (ctx.sync_strategy == SyncStrategy::Merge)
        out.push_back(command("sync-merge", "git merge --no-edit " + upstream));
    else
        out.push_back(command("sync-rebase", "git rebase " + upstream));
    return out;
}

std::vector<FixActionPlanEntry> plan_stage_commit_push(const PlanContext& ctx) {
    std::vector<FixActionPlanEntry> out;
    if (ctx.generate_gitignore && !ctx.gitignore_patterns.empty()) {
        std::string n = std::to_string(ctx.gitignore_patterns.size());
        if (ctx.missing_root_gitignore)
            out.push_back(note("stage-gitignore-generate",
                               "Generate root .gitignore with " + n + " selected pattern(s)."));
        else
            out.push_back(note("stage-gitignore-append",
                               "Append " + n + " selected pattern(s) to root .gitignore."));
    }
    out.push_back(command("stage-git-add", "git add -A"));
    out.push_back(command("stage-git-commit",
                          "git commit -m " + quoted(planned_commit_message(ctx.commit_message))));
    if (ctx.origin_url.empty()) {
        out.push_back(note("stage-skip-push-no-origin", "Skip push because no origin remote is configured."));
    } else if (ctx.upstream.empty()) {
        out.push_back(command("stage-push-set-upstream",
                              "git push -u " + planned_remote(ctx.preferred_remote, ctx.upstream) +
                                  " " + planned_branch(ctx.branch)));
    } else {
        out.push_back(command("stage-push", "git push"));
    }
    return out;
}

std::vector<FixActionPlanEntry> plan_create_project(const PlanContext& ctx) {
    if (ctx.github_owner.empty())
        return {note("create-requires-owner",
                     "Configure github.owner before creating a GitHub project.")};
    std::string name = planned_project_name(ctx.project_name, ctx.repo_name);
    std::vector<FixActionPlanEntry> out;
    out.push_back(command("create-gh-repo", "gh repo create " + ctx.github_owner + "/" + name +
                                                (ctx.visibility == Visibility::Public
                                                     ? " --public"
                                                     : " --private")));
    if (ctx.origin_url.empty()) {
        out.push_back(command("create-add-origin",
                              "git remote add origin " +
                                  remote_repo_url(ctx.github_owner, name, ctx.remote_protocol,
                                                  ctx.remote_url_template)));
    } else {
        out.push_back(note("create-validate-origin",
                           "Validate existing origin URL matches the expected repository identity."));
    }
    out.push_back(note("create-write-metadata",
                       "Write/update repo metadata (origin URL, visibility, default auto-push "
                       "policy)."));
    if (ctx.upstream.empty()) {
        if (!ctx.head_sha.empty())
            out.push_back(command("create-initial-push",
                                  "git push -u " +
                                      planned_remote(ctx.preferred_remote, ctx.upstream) + " " +
                                      planned_branch(ctx.branch)));
        else
            out.push_back(note("create-initial-push", "Skip initial push because HEAD has no commits."));
    }
    return out;
}

std::vector<FixActionPlanEntry> plan_fork(const PlanContext& ctx) {
    const std::string& owner = ctx.github_owner;
    if (owner.empty())
        return {note("fork-requires-owner", "Configure github.owner before forking and retargeting.")};
    auto source = parse_remote_repo(ctx.origin_url);
    if (!source)
        return {note("fork-source-invalid",
                     "Cannot derive GitHub source repository from origin URL.")};
    std::string fork_url =
        remote_repo_url(owner, source->name, ctx.remote_protocol, ctx.remote_url_template);
    if (fork_url.empty())
        return {note("fork-url-invalid", "Cannot derive fork remote URL from GitHub owner/protocol.")};
    return {
        command("fork-gh-fork",
                "gh repo fork " + source->full_name() + " --remote=false --clone=false"),
        command("fork-set-remote", (ctx.fork_remote_exists ? "git remote set-url " : "git remote add ") +
                                       owner + " " + fork_url),
        note("fork-write-metadata", "Update repo metadata immediately after retargeting remote "
                                    "(preferred remote and push-access probe state reset)."),
        command("fork-push-upstream",
                "git push -u --force " + owner + " " + planned_branch(ctx.branch)),
        note("fork-refresh-metadata",
             "Refresh repo metadata push-access probe state after retarget push."),
    };
}

} // namespace

const char* to_string(FixAction action) { return info_for(action).name; }

std::optional<FixAction> parse_fix_action(const std::string& text) {
    std::string t = trimmed(text);
    for (const auto& info : ACTIONS) {
        if (t == info.name)
            return info.action;
    }
    return std::nullopt;
}

const std::vector<FixAction>& all_fix_actions() {
    static const std::vector<FixAction> actions = [] {
        std::vector<FixAction> out;
        for (const auto& info : ACTIONS)
            out.push_back(info.action);
        return out;
    }();
    return actions;
}

const char* fix_action_label(FixAction action) { return info_for(action).label; }

const char* fix_action_description(FixAction action) { return info_for(action).description; }

bool fix_action_risky(FixAction action) { return info_for(action).risky; }

SyncStrategy resolve_sync_strategy(const FixOptions& options, const AppConfig& cfg) {
    return options.sync_strategy.value_or(cfg.sync.strategy);
}

Visibility resolve_visibility(const FixOptions& options, const AppConfig& cfg) {
    return options.visibility.value_or(cfg.github.default_visibility);
}

PlanContext make_plan_context(const FixRepoState& state, const AppConfig& cfg,
                              const FixOptions& options) {
    const RepositoryRecord& rec = state.record;
    PlanContext ctx;
    ctx.operation = rec.operation;
    ctx.branch = rec.branch;
    ctx.upstream = rec.upstream;
    ctx.head_sha = rec.head_sha;
    ctx.origin_url = rec.origin_url;
    ctx.has_dirty_tracked = rec.has_dirty_tracked;
    ctx.has_untracked = rec.has_untracked;
    ctx.sync_strategy = resolve_sync_strategy(options, cfg);
    if (state.metadata)
        ctx.preferred_remote = state.metadata->preferred_remote;
    ctx.github_owner = trimmed(cfg.github.owner);
    ctx.remote_protocol = cfg.github.remote_protocol;
    ctx.remote_url_template = cfg.github.remote_url_template;
    ctx.repo_name = rec.name;
    ctx.commit_message = trimmed(options.commit_message);
    ctx.project_name = trimmed(options.project_name);
    ctx.visibility = resolve_visibility(options, cfg);
    ctx.generate_gitignore = options.generate_gitignore;
    ctx.gitignore_patterns = options.gitignore_patterns;
    ctx.missing_root_gitignore = state.risk.missing_root_gitignore;
    ctx.fetch_prune = cfg.sync.fetch_prune;
    return ctx;
}

std::vector<FixActionPlanEntry> build_fix_plan(FixAction action, const PlanContext& ctx) {
    std::vector<FixActionPlanEntry> out;
    switch (action) {
    case FixAction::Ignore:
        out = {note("ignore-session", "Ignore this repository in the current interactive session "
                                      "only (no file changes).")};
        break;
    case FixAction::AbortOperation:
        out = plan_abort(ctx);
        break;
    case FixAction::CreateProject:
        out = plan_create_project(ctx);
        break;
    case FixAction::ForkAndRetarget:
        out = plan_fork(ctx);
        break;
    case FixAction::SyncWithUpstream:
        out = plan_sync(ctx);
        break;
    case FixAction::Push:
        out = {command("push-main", "git push")};
        break;
    case FixAction::StageCommitPush:
        out = plan_stage_commit_push(ctx);
        break;
    case FixAction::PullFFOnly:
        out = {fetch_prune_entry("pull-fetch-prune", ctx.fetch_prune),
               command("pull-ff-only", "git pull --ff-only")};
        break;
    case FixAction::SetUpstreamPush:
        out = {command("upstream-push", "git push -u " +
                                            planned_remote(ctx.preferred_remote, ctx.upstream) +
                                            " " + planned_branch(ctx.branch))};
        break;
    case FixAction::EnableAutoPush:
        out = {note("enable-auto-push",
                    "Write repo metadata: set auto_push to the enabled mode for this branch.")};
        break;
    }
    out.push_back(note(REVALIDATE_STEP_ID, "Revalidate repository status and syncability state."));
    return out;
}

std::string planned_commit_message(const std::string& raw) {
    std::string msg = trimmed(raw);
    if (msg.empty() || msg == "auto")
        return DEFAULT_COMMIT_MESSAGE;
    return msg;
}

std::string planned_remote(const std::string& preferred_remote, const std::string& upstream) {
    std::string up = trimmed(upstream);
    auto slash = up.find('/');
    if (slash != std::string::npos && slash > 0)
        return up.substr(0, slash);
    std::string preferred = trimmed(preferred_remote);
    return preferred.empty() ? "origin" : preferred;
}

std::string planned_branch(const std::string& branch) {
    std::string b = trimmed(branch);
    return b.empty() ? "HEAD" : b;
}

std::string planned_project_name(const std::string& name, const std::string& repo_name) {
    std::string sanitized = sanitize_repo_name(trimmed(name));
    if (!sanitized.empty())
        return sanitized;
    sanitized = sanitize_repo_name(trimmed(repo_name));
    return sanitized.empty() ? "repo" : sanitized;
}

} // namespace fleetfix
