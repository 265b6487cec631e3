#include "fix_engine.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <stdexcept>
#include <system_error>
#include "logger.hpp"
#include "risk_snapshot.hpp"
#include "sync_feasibility.hpp"
#include "time_utils.hpp"

namespace fleetfix {

namespace {

fs::path clean_path(const fs::path& p) {
    fs::path out = p.lexically_normal();
    if (out.has_parent_path() && out.filename().empty())
        out = out.parent_path();
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool catalog_selected(const std::vector<Catalog>& catalogs, const std::string& name) {
    return std::any_of(catalogs.begin(), catalogs.end(),
                       [&](const Catalog& c) { return c.name == name; });
}

FixRepoState pick_unique(const std::string& selector, const std::vector<const FixRepoState*>& hits) {
    if (hits.size() == 1)
        return *hits.front();
    std::vector<std::string> paths;
    for (const auto* h : hits)
        paths.push_back(h->record.path.string());
    std::sort(paths.begin(), paths.end());
    std::string joined;
    for (const auto& p : paths) {
        if (!joined.empty())
            joined += ", ";
        joined += p;
    }
    throw std::runtime_error("project selector \"" + selector + "\" is ambiguous; matches: " +
                             joined);
}

} // namespace

void sort_fix_repos(std::vector<FixRepoState>& repos) {
    std::stable_sort(repos.begin(), repos.end(), [](const FixRepoState& a, const FixRepoState& b) {
        if (a.record.syncable != b.record.syncable)
            return !a.record.syncable;
        if (a.record.name != b.record.name)
            return a.record.name < b.record.name;
        return a.record.path < b.record.path;
    });
}

FixRepoState resolve_fix_target(const std::string& selector,
                                const std::vector<FixRepoState>& repos) {
    if (repos.empty())
        throw std::runtime_error("no repositories found for selected catalogs");
    if (selector.empty())
        throw std::runtime_error("project is required");

    const fs::path cleaned = clean_path(selector);
    std::error_code ec;
    fs::path absolute = fs::absolute(cleaned, ec);
    if (!ec)
        absolute = clean_path(absolute);
    for (const auto& r : repos) {
        fs::path p = clean_path(r.record.path);
        if (p == cleaned || (!ec && p == absolute))
            return r;
    }

    std::vector<const FixRepoState*> hits;
    const std::string key = lower(selector);
    for (const auto& r : repos) {
        if (!r.record.repo_key.empty() && lower(r.record.repo_key) == key)
            hits.push_back(&r);
    }
    if (!hits.empty())
        return pick_unique(selector, hits);

    for (const auto& r : repos) {
        if (r.record.name == selector)
            hits.push_back(&r);
    }
    if (!hits.empty())
        return pick_unique(selector, hits);
    throw std::runtime_error("project \"" + selector + "\" not found");
}

FixEngine::FixEngine(GitClient& git, GitHubClient& github, StateStore& store)
    : git_(git), github_(github), store_(store) {}

FixRepoState FixEngine::build_state(RepositoryRecord rec, std::optional<RepoMetadata> meta,
                                    const MachineSnapshot& machine) {
    FixRepoState state;
    state.feasibility = apply_sync_feasibility(git_, rec, cfg_.sync.strategy);
    try {
        state.risk = collect_risk_snapshot(git_, rec.path);
    } catch (const std::exception& e) {
        log_warning("risk scan failed", {{"repo", rec.path.string()}, {"error", e.what()}});
        state.risk = RiskSnapshot{};
    }
    state.is_default_catalog = !machine.default_catalog.empty() &&
                               rec.catalog == machine.default_catalog;
    state.record = std::move(rec);
    state.metadata = std::move(meta);
    return state;
}

std::vector<FixRepoState> FixEngine::load_fix_repos(const std::vector<std::string>& catalogs,
                                                    RefreshMode mode) {
    auto lock = store_.acquire_lock();
    cfg_ = store_.load_config();
    MachineSnapshot machine = store_.load_machine(cfg_);
    std::vector<Catalog> selected = select_catalogs(machine, catalogs);

    RepoScanner scanner(git_, store_, cfg_);
    scanner.refresh(machine, selected, mode);

    std::map<std::string, RepoMetadata> metadata;
    for (auto& m : store_.load_all_repo_metadata())
        metadata[m.repo_key] = std::move(m);

    std::vector<FixRepoState> repos;
    for (const auto& rec : machine.repos) {
        if (!catalog_selected(selected, rec.catalog))
            continue;
        std::optional<RepoMetadata> meta;
        auto it = metadata.find(rec.repo_key);
        if (it != metadata.end())
            meta = it->second;
        repos.push_back(build_state(rec, std::move(meta), machine));
    }
    sort_fix_repos(repos);
    refresh_unknown_push_access(repos);
    log_debug("loaded fix candidates", {{"repos", std::to_string(repos.size())},
                                        {"machine", machine.machine_id}});
    return repos;
}

void FixEngine::refresh_unknown_push_access(std::vector<FixRepoState>& repos) {
    std::vector<FixRepoState*> pending;
    for (auto& r : repos) {
        if (r.metadata && r.metadata->push_access == PushAccess::Unknown &&
            !r.record.repo_key.empty() && !r.record.path.empty() && !r.record.origin_url.empty())
            pending.push_back(&r);
    }
    std::sort(pending.begin(), pending.end(), [](const FixRepoState* a, const FixRepoState* b) {
        return a->record.repo_key < b->record.repo_key;
    });
    for (auto* r : pending) {
        PushAccessResult probe =
            github_.probe_push_access(r->record.path, r->metadata->preferred_remote);
        if (probe.access == PushAccess::Unknown) {
            if (!probe.error.empty())
                log_debug("push access still unknown",
                          {{"repo", r->record.repo_key}, {"error", probe.error}});
            continue;
        }
        RepoMetadata meta = *r->metadata;
        meta.push_access = probe.access;
        meta.push_access_checked_at = format_rfc3339(current_time());
        meta.push_access_checked_remote = probe.remote;
        meta.updated_at = meta.push_access_checked_at;
        store_.save_repo_metadata(meta);
        log_info("push access classified",
                 {{"repo", r->record.repo_key}, {"access", to_string(probe.access)}});
        r->metadata = meta;
    }
}

const RepositoryRecord* FixEngine::find_record(const MachineSnapshot& machine,
                                               const std::vector<Catalog>& catalogs,
                                               const fs::path& path) const {
    const fs::path target = clean_path(path);
    for (const auto& rec : machine.repos) {
        if (catalog_selected(catalogs, rec.catalog) && clean_path(rec.path) == target)
            return &rec;
    }
    return nullptr;
}

FixRepoState FixEngine::apply_fix_action(const std::vector<std::string>& catalogs,
                                         const fs::path& path, FixAction action,
                                         const FixOptions& options, const StepObserver& observer) {
    auto lock = store_.acquire_lock();
    cfg_ = store_.load_config();
    MachineSnapshot machine = store_.load_machine(cfg_);
    std::vector<Catalog> selected = select_catalogs(machine, catalogs);
    RepoScanner scanner(git_, store_, cfg_);

    if (const RepositoryRecord* known = find_record(machine, selected, path)) {
        scanner.refresh_repo(machine, fs::path(known->path));
    } else {
        log_info("repository missing from snapshot; rescanning", {{"repo", path.string()}});
        scanner.scan(machine, selected);
    }
    const RepositoryRecord* rec = find_record(machine, selected, path);
    if (!rec)
        throw std::runtime_error("project \"" + path.string() + "\" not found");

    const std::string repo_key = rec->repo_key;
    FixRepoState state = build_state(*rec, store_.load_repo_metadata(repo_key), machine);

    FixExecutor executor(git_, github_, store_, cfg_);
    std::vector<FixActionPlanEntry> plan = executor.plan(action, state, options);
    executor.execute(action, state, options, observer);
    if (action == FixAction::Ignore)
        return state;

    FixActionPlanEntry revalidate{REVALIDATE_STEP_ID, false,
                                  "Revalidate repository status and syncability state."};
    auto it = std::find_if(plan.begin(), plan.end(), [](const FixActionPlanEntry& e) {
        return e.id == REVALIDATE_STEP_ID;
    });
    if (it != plan.end())
        revalidate = *it;
    run_fix_step(observer, action, revalidate, [&] {
        try {
            scanner.refresh_repo(machine, state.record.path);
        } catch (const std::exception& e) {
            log_warning("targeted revalidation failed; rescanning catalogs",
                        {{"repo", state.record.path.string()}, {"error", e.what()}});
            scanner.scan(machine, selected);
        }
    });

    rec = find_record(machine, selected, state.record.path);
    if (!rec)
        throw std::runtime_error("project \"" + state.record.path.string() +
                                 "\" not found after revalidation");
    return build_state(*rec, store_.load_repo_metadata(rec->repo_key), machine);
}

std::vector<FixActionPlanEntry> FixEngine::plan_fix_action(FixAction action,
                                                           const FixRepoState& state,
                                                           const FixOptions& options) {
    FixExecutor executor(git_, github_, store_, cfg_);
    return executor.plan(action, state, options);
}

std::vector<FixAction> FixEngine::eligible_actions(const FixRepoState& state,
                                                   bool interactive) const {
    EligibilityContext ctx = make_eligibility_context(state, cfg_.sync.strategy, interactive);
    return eligible_fix_actions(state.record, state.metadata, ctx);
}

} // namespace fleetfix
