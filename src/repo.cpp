#include "repo.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fleetfix {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename E, size_t N>
std::optional<E> parse_enum(const std::string& text, const E (&values)[N]) {
    std::string v = lower(text);
    for (E e : values) {
        if (v == to_string(e))
            return e;
    }
    return std::nullopt;
}

constexpr GitOperation kOperations[] = {GitOperation::None, GitOperation::Merge,
                                        GitOperation::Rebase, GitOperation::CherryPick,
                                        GitOperation::Bisect};
constexpr AutoPushMode kAutoPushModes[] = {AutoPushMode::Disabled, AutoPushMode::Enabled,
                                           AutoPushMode::IncludeDefaultBranch};
constexpr PushAccess kPushAccess[] = {PushAccess::Unknown, PushAccess::ReadOnly,
                                      PushAccess::ReadWrite};
constexpr Visibility kVisibilities[] = {Visibility::Private, Visibility::Public};
constexpr UnsyncableReason kReasons[] = {
    UnsyncableReason::MissingOrigin,     UnsyncableReason::OperationInProgress,
    UnsyncableReason::DirtyTracked,      UnsyncableReason::DirtyUntracked,
    UnsyncableReason::MissingUpstream,   UnsyncableReason::Diverged,
    UnsyncableReason::PushPolicyBlocked, UnsyncableReason::PushAccessBlocked,
    UnsyncableReason::PushFailed,        UnsyncableReason::PullFailed,
    UnsyncableReason::CheckoutFailed,    UnsyncableReason::SyncConflict,
    UnsyncableReason::SyncProbeFailed};

} // namespace

const char* to_string(GitOperation op) {
    switch (op) {
    case GitOperation::None:
        return "none";
    case GitOperation::Merge:
        return "merge";
    case GitOperation::Rebase:
        return "rebase";
    case GitOperation::CherryPick:
        return "cherry-pick";
    case GitOperation::Bisect:
        return "bisect";
    }
    return "none";
}

const char* to_string(AutoPushMode mode) {
    switch (mode) {
    case AutoPushMode::Disabled:
        return "disabled";
    case AutoPushMode::Enabled:
        return "enabled";
    case AutoPushMode::IncludeDefaultBranch:
        return "include-default-branch";
    }
    return "disabled";
}

const char* to_string(PushAccess access) {
    switch (access) {
    case PushAccess::Unknown:
        return "unknown";
    case PushAccess::ReadOnly:
        return "read-only";
    case PushAccess::ReadWrite:
        return "read-write";
    }
    return "unknown";
}

const char* to_string(Visibility visibility) {
    switch (visibility) {
    case Visibility::Private:
        return "private";
    case Visibility::Public:
        return "public";
    }
    return "private";
}

const char* to_string(SyncStrategy strategy) {
    switch (strategy) {
    case SyncStrategy::Rebase:
        return "rebase";
    case SyncStrategy::Merge:
        return "merge";
    }
    return "rebase";
}

const char* to_string(ProbeOutcome outcome) {
    switch (outcome) {
    case ProbeOutcome::Unknown:
        return "unknown";
    case ProbeOutcome::Clean:
        return "clean";
    case ProbeOutcome::Conflict:
        return "conflict";
    case ProbeOutcome::ProbeFailed:
        return "probe_failed";
    }
    return "unknown";
}

const char* to_string(UnsyncableReason reason) {
    switch (reason) {
    case UnsyncableReason::MissingOrigin:
        return "missing_origin";
    case UnsyncableReason::OperationInProgress:
        return "operation_in_progress";
    case UnsyncableReason::DirtyTracked:
        return "dirty_tracked";
    case UnsyncableReason::DirtyUntracked:
        return "dirty_untracked";
    case UnsyncableReason::MissingUpstream:
        return "missing_upstream";
    case UnsyncableReason::Diverged:
        return "diverged";
    case UnsyncableReason::PushPolicyBlocked:
        return "push_policy_blocked";
    case UnsyncableReason::PushAccessBlocked:
        return "push_access_blocked";
    case UnsyncableReason::PushFailed:
        return "push_failed";
    case UnsyncableReason::PullFailed:
        return "pull_failed";
    case UnsyncableReason::CheckoutFailed:
        return "checkout_failed";
    case UnsyncableReason::SyncConflict:
        return "sync_conflict";
    case UnsyncableReason::SyncProbeFailed:
        return "sync_probe_failed";
    }
    return "unknown";
}

std::optional<GitOperation> parse_git_operation(const std::string& text) {
    if (text.empty())
        return GitOperation::None;
    return parse_enum(text, kOperations);
}

std::optional<AutoPushMode> parse_auto_push_mode(const std::string& text) {
    if (text.empty())
        return AutoPushMode::Disabled;
    return parse_enum(text, kAutoPushModes);
}

std::optional<PushAccess> parse_push_access(const std::string& text) {
    if (text.empty())
        return PushAccess::Unknown;
    return parse_enum(text, kPushAccess);
}

std::optional<Visibility> parse_visibility(const std::string& text) {
    return parse_enum(text, kVisibilities);
}

std::optional<UnsyncableReason> parse_unsyncable_reason(const std::string& text) {
    return parse_enum(text, kReasons);
}

SyncStrategy parse_sync_strategy(const std::string& text) {
    std::string v = lower(text);
    if (v.empty() || v == "rebase")
        return SyncStrategy::Rebase;
    if (v == "merge")
        return SyncStrategy::Merge;
    throw std::runtime_error("unsupported sync strategy \"" + text +
                             "\" (expected rebase or merge)");
}

bool ReasonSet::add(UnsyncableReason reason) {
    if (contains(reason))
        return false;
    items_.push_back(reason);
    return true;
}

bool ReasonSet::contains(UnsyncableReason reason) const {
    return std::find(items_.begin(), items_.end(), reason) != items_.end();
}

std::string compute_state_hash(const RepositoryRecord& rec) {
    nlohmann::json reasons = nlohmann::json::array();
    for (auto r : rec.unsyncable_reasons)
        reasons.push_back(to_string(r));
    nlohmann::json payload = {{"repo_key", rec.repo_key},
                              {"path", rec.path.string()},
                              {"origin_url", rec.origin_url},
                              {"branch", rec.branch},
                              {"head_sha", rec.head_sha},
                              {"upstream", rec.upstream},
                              {"upstream_head_sha", rec.upstream_head_sha},
                              {"ahead", rec.ahead},
                              {"behind", rec.behind},
                              {"diverged", rec.diverged},
                              {"has_dirty_tracked", rec.has_dirty_tracked},
                              {"has_untracked", rec.has_untracked},
                              {"operation", to_string(rec.operation)},
                              {"syncable", rec.syncable},
                              {"unsyncable_reasons", reasons}};
    // Object keys are sorted by nlohmann::json, so the dump is canonical.
    std::string text = payload.dump();
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return std::string("fnv1a64:") + buf;
}

bool is_default_branch(const std::string& branch, const std::string& default_branch) {
    if (branch.empty())
        return false;
    if (!default_branch.empty())
        return branch == default_branch;
    return branch == "main" || branch == "master";
}

bool auto_push_effective(AutoPushMode mode, bool on_default_branch) {
    switch (mode) {
    case AutoPushMode::Disabled:
        return false;
    case AutoPushMode::Enabled:
        return !on_default_branch;
    case AutoPushMode::IncludeDefaultBranch:
        return true;
    }
    return false;
}

bool push_access_permits_push(PushAccess access) { return access == PushAccess::ReadWrite; }

void evaluate_syncability(RepositoryRecord& rec, const SyncabilityPolicy& policy) {
    ReasonSet reasons;
    if (rec.origin_url.empty())
        reasons.add(UnsyncableReason::MissingOrigin);
    if (rec.operation != GitOperation::None)
        reasons.add(UnsyncableReason::OperationInProgress);
    if (rec.has_dirty_tracked)
        reasons.add(UnsyncableReason::DirtyTracked);
    if (rec.has_untracked && policy.include_untracked_as_dirty)
        reasons.add(UnsyncableReason::DirtyUntracked);
    if (rec.upstream.empty())
        reasons.add(UnsyncableReason::MissingUpstream);
    if (rec.diverged)
        reasons.add(UnsyncableReason::Diverged);
    if (rec.ahead > 0) {
        if (policy.push_access == PushAccess::ReadOnly) {
            reasons.add(UnsyncableReason::PushAccessBlocked);
        } else if (!auto_push_effective(policy.auto_push,
                                        is_default_branch(rec.branch, policy.default_branch))) {
            reasons.add(UnsyncableReason::PushPolicyBlocked);
        }
    }
    rec.unsyncable_reasons = reasons;
    rec.syncable = reasons.empty();
    rec.state_hash = compute_state_hash(rec);
}

void append_unsyncable_reason(RepositoryRecord& rec, UnsyncableReason reason) {
    if (!rec.unsyncable_reasons.add(reason))
        return;
    rec.syncable = false;
    rec.state_hash = compute_state_hash(rec);
}

std::optional<RepoKey> parse_repo_key(const std::string& key, std::string* error) {
    auto fail = [&](const std::string& msg) -> std::optional<RepoKey> {
        if (error)
            *error = msg;
        return std::nullopt;
    };
    auto slash = key.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= key.size())
        return fail("invalid repo key \"" + key + "\" (expected catalog/path)");
    RepoKey out{key.substr(0, slash), key.substr(slash + 1)};
    size_t start = 0;
    const std::string& rel = out.relative_path;
    while (start <= rel.size()) {
        size_t end = rel.find('/', start);
        if (end == std::string::npos)
            end = rel.size();
        std::string part = rel.substr(start, end - start);
        if (part.empty() || part == "." || part == "..")
            return fail("invalid repo key \"" + key + "\"");
        start = end + 1;
    }
    return out;
}

std::string make_repo_key(const std::string& catalog, const std::filesystem::path& relative) {
    return catalog + "/" + relative.lexically_normal().generic_string();
}

std::vector<Catalog> select_catalogs(const MachineSnapshot& machine,
                                     const std::vector<std::string>& names) {
    if (names.empty())
        return machine.catalogs;
    std::vector<Catalog> out;
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (!seen.insert(name).second)
            continue;
        auto it = std::find_if(machine.catalogs.begin(), machine.catalogs.end(),
                               [&](const Catalog& c) { return c.name == name; });
        if (it == machine.catalogs.end())
            throw std::runtime_error("invalid catalog \"" + name + "\"");
        out.push_back(*it);
    }
    return out;
}

} // namespace fleetfix
