#include "repo_scanner.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include "logger.hpp"
#include "time_utils.hpp"

namespace fleetfix {

namespace fs = std::filesystem;

bool snapshot_is_stale(const MachineSnapshot& machine, const std::vector<Catalog>& catalogs,
                       std::chrono::seconds freshness, std::chrono::system_clock::time_point now) {
    if (freshness.count() <= 0)
        return true;
    auto last = parse_rfc3339(machine.last_scan_at);
    if (!last)
        return true;
    for (const auto& c : catalogs) {
        if (std::find(machine.last_scan_catalogs.begin(), machine.last_scan_catalogs.end(),
                      c.name) == machine.last_scan_catalogs.end())
            return true;
    }
    return now - *last > freshness;
}

void sort_snapshot_records(std::vector<RepositoryRecord>& repos) {
    std::sort(repos.begin(), repos.end(), [](const RepositoryRecord& a, const RepositoryRecord& b) {
        if (a.repo_key != b.repo_key)
            return a.repo_key < b.repo_key;
        return a.path < b.path;
    });
}

RepoScanner::RepoScanner(GitClient& git, StateStore& store, const AppConfig& cfg)
    : git_(git), store_(store), cfg_(cfg) {}

std::vector<DiscoveredRepo> RepoScanner::discover(const Catalog& catalog) {
    std::vector<DiscoveredRepo> result;
    std::error_code ec;
    if (!fs::is_directory(catalog.root, ec)) {
        log_warning("catalog root missing", {{"catalog", catalog.name}, {"root", catalog.root.string()}});
        return result;
    }
    const int depth = std::max(1, catalog.repo_path_depth);
    fs::recursive_directory_iterator it(catalog.root, fs::directory_options::skip_permission_denied,
                                        ec);
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        const fs::path p = it->path();
        const std::string name = p.filename().string();
        if (!it->is_directory(ec) || name.empty() || name[0] == '.') {
            if (ec)
                ec.clear();
            it.disable_recursion_pending();
            continue;
        }
        if (it.depth() + 1 < depth)
            continue;
        it.disable_recursion_pending();
        if (!git_.is_git_repo(p))
            continue;
        fs::path rel = p.lexically_relative(catalog.root);
        result.push_back({catalog.name, p, name, make_repo_key(catalog.name, rel)});
    }
    std::sort(result.begin(), result.end(),
              [](const DiscoveredRepo& a, const DiscoveredRepo& b) { return a.path < b.path; });
    return result;
}

RepositoryRecord RepoScanner::observe(const DiscoveredRepo& repo) {
    RepositoryRecord rec;
    rec.repo_key = repo.repo_key;
    rec.name = repo.name;
    rec.catalog = repo.catalog;
    rec.path = repo.path;
    rec.origin_url = git_.remote_url(repo.path, "origin");
    rec.branch = git_.current_branch(repo.path);
    rec.head_sha = git_.head_sha(repo.path);
    rec.upstream = git_.upstream(repo.path);
    if (!rec.upstream.empty()) {
        rec.upstream_head_sha = git_.ref_sha(repo.path, "refs/remotes/" + rec.upstream);
        auto counts = git_.ahead_behind(repo.path, rec.upstream);
        rec.ahead = counts.first;
        rec.behind = counts.second;
    }
    rec.diverged = rec.ahead > 0 && rec.behind > 0;
    WorktreeState wt = git_.worktree_state(repo.path);
    rec.has_dirty_tracked = wt.dirty_tracked;
    rec.has_untracked = wt.untracked;
    rec.operation = git_.operation(repo.path);

    std::optional<RepoMetadata> meta;
    if (!rec.origin_url.empty() && !rec.repo_key.empty())
        meta = ensure_repo_metadata(store_, cfg_,
                                    MetadataSeed{rec.repo_key, rec.name, rec.origin_url,
                                                 std::nullopt, rec.catalog});
    else if (!rec.repo_key.empty())
        meta = store_.load_repo_metadata(rec.repo_key);

    SyncabilityPolicy policy;
    policy.include_untracked_as_dirty = cfg_.sync.include_untracked_as_dirty;
    std::string remote = "origin";
    if (meta) {
        policy.auto_push = meta->auto_push;
        policy.push_access = meta->push_access;
        if (!meta->preferred_remote.empty())
            remote = meta->preferred_remote;
    }
    policy.default_branch = git_.default_branch(repo.path, remote);
    evaluate_syncability(rec, policy);
    return rec;
}

void RepoScanner::scan(MachineSnapshot& machine, const std::vector<Catalog>& catalogs) {
    std::vector<std::string> names;
    for (const auto& catalog : catalogs) {
        names.push_back(catalog.name);
        machine.repos.erase(std::remove_if(machine.repos.begin(), machine.repos.end(),
                                           [&](const RepositoryRecord& r) {
                                               return r.catalog == catalog.name;
                                           }),
                            machine.repos.end());
        for (const auto& found : discover(catalog)) {
            try {
                machine.repos.push_back(observe(found));
            } catch (const std::exception& e) {
                log_error("failed to observe repository",
                          {{"repo", found.path.string()}, {"error", e.what()}});
            }
        }
    }
    sort_snapshot_records(machine.repos);
    std::sort(names.begin(), names.end());
    const std::string now = format_rfc3339(current_time());
    machine.last_scan_at = now;
    machine.last_scan_catalogs = names;
    machine.updated_at = now;
    log_info("scanned catalogs", {{"catalogs", std::to_string(names.size())},
                                  {"repos", std::to_string(machine.repos.size())}});
    store_.save_machine(machine);
}

bool RepoScanner::refresh(MachineSnapshot& machine, const std::vector<Catalog>& catalogs,
                          RefreshMode mode) {
    switch (mode) {
    case RefreshMode::Never:
        log_debug("using existing machine snapshot without refresh");
        return false;
    case RefreshMode::IfStale:
        if (!snapshot_is_stale(machine, catalogs,
                               std::chrono::seconds(cfg_.sync.scan_freshness_seconds),
                               current_time())) {
            log_debug("machine snapshot is fresh", {{"last_scan_at", machine.last_scan_at}});
            return false;
        }
        break;
    case RefreshMode::Always:
        break;
    }
    log_info("refreshing machine snapshot");
    scan(machine, catalogs);
    return true;
}

void RepoScanner::refresh_repo(MachineSnapshot& machine, const fs::path& path) {
    const fs::path target = path.lexically_normal();
    auto it = std::find_if(machine.repos.begin(), machine.repos.end(),
                           [&](const RepositoryRecord& r) { return r.path.lexically_normal() == target; });
    if (it == machine.repos.end())
        throw std::runtime_error("project \"" + path.string() + "\" not found in machine snapshot");
    DiscoveredRepo repo{it->catalog, it->path, it->name, it->repo_key};
    *it = observe(repo);
    sort_snapshot_records(machine.repos);
    machine.updated_at = format_rfc3339(current_time());
    store_.save_machine(machine);
}

} // namespace fleetfix
