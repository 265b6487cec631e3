#ifndef REPO_HPP
#define REPO_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fleetfix {

/**
 * @brief Git operation left in progress in a working tree.
 */
enum class GitOperation { None, Merge, Rebase, CherryPick, Bisect };

/**
 * @brief Per-repository policy for pushing local commits automatically.
 */
enum class AutoPushMode {
    Disabled,            ///< Never push automatically
    Enabled,             ///< Push automatically except on the default branch
    IncludeDefaultBranch ///< Push automatically on every branch
};

/**
 * @brief Result of probing whether the current credentials may push.
 */
enum class PushAccess { Unknown, ReadOnly, ReadWrite };

enum class Visibility { Private, Public };

/**
 * @brief Strategy used to reconcile a diverged branch with its upstream.
 */
enum class SyncStrategy { Rebase, Merge };

/**
 * @brief Classification of a dry-run rebase or merge.
 */
enum class ProbeOutcome {
    Unknown,    ///< No probe ran
    Clean,      ///< Would apply without conflicts
    Conflict,   ///< Would stop on conflicts
    ProbeFailed ///< The probe itself could not complete
};

/**
 * @brief Why a repository is not safe for automatic synchronization.
 */
enum class UnsyncableReason {
    MissingOrigin,
    OperationInProgress,
    DirtyTracked,
    DirtyUntracked,
    MissingUpstream,
    Diverged,
    PushPolicyBlocked,
    PushAccessBlocked,
    PushFailed,
    PullFailed,
    CheckoutFailed,
    SyncConflict,
    SyncProbeFailed
};

const char* to_string(GitOperation op);
const char* to_string(AutoPushMode mode);
const char* to_string(PushAccess access);
const char* to_string(Visibility visibility);
const char* to_string(SyncStrategy strategy);
const char* to_string(ProbeOutcome outcome);
const char* to_string(UnsyncableReason reason);

std::optional<GitOperation> parse_git_operation(const std::string& text);
std::optional<AutoPushMode> parse_auto_push_mode(const std::string& text);
std::optional<PushAccess> parse_push_access(const std::string& text);
std::optional<Visibility> parse_visibility(const std::string& text);
std::optional<UnsyncableReason> parse_unsyncable_reason(const std::string& text);

/**
 * @brief Parse a sync strategy name.
 *
 * An empty string selects the default strategy (rebase).
 *
 * @throws std::runtime_error for anything other than "rebase" or "merge".
 */
SyncStrategy parse_sync_strategy(const std::string& text);

/**
 * @brief Insertion-ordered set of unsyncable reasons.
 *
 * Adding a reason that is already present is a no-op, so the first-seen
 * order of reasons is preserved.
 */
class ReasonSet {
  public:
    /// @return `true` when @p reason was not present before.
    bool add(UnsyncableReason reason);
    bool contains(UnsyncableReason reason) const;
    void clear() { items_.clear(); }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }
    const std::vector<UnsyncableReason>& items() const { return items_; }
    std::vector<UnsyncableReason>::const_iterator begin() const { return items_.begin(); }
    std::vector<UnsyncableReason>::const_iterator end() const { return items_.end(); }
    bool operator==(const ReasonSet& other) const { return items_ == other.items_; }

  private:
    std::vector<UnsyncableReason> items_;
};

/**
 * @brief Observed state of one git working copy.
 */
struct RepositoryRecord {
    std::string repo_key;             ///< Stable `catalog/relative/path` identifier
    std::string name;                 ///< Display name, the last path segment
    std::string catalog;              ///< Catalog the repository was found in
    std::filesystem::path path;       ///< Absolute working tree location
    std::string origin_url;           ///< URL of `origin`, empty when missing
    std::string upstream;             ///< Upstream shorthand such as `origin/main`
    std::string branch;               ///< Checked-out branch, empty when detached
    std::string head_sha;             ///< HEAD commit, empty for an unborn branch
    std::string upstream_head_sha;    ///< Commit the upstream ref points at
    int ahead = 0;                    ///< Commits on HEAD not in upstream
    int behind = 0;                   ///< Commits in upstream not on HEAD
    bool diverged = false;            ///< Both ahead and behind
    bool has_dirty_tracked = false;   ///< Staged or unstaged tracked changes
    bool has_untracked = false;       ///< Untracked, not ignored files
    GitOperation operation = GitOperation::None;
    bool syncable = false;
    ReasonSet unsyncable_reasons;
    std::string state_hash;
};

/**
 * @brief Persisted per-repository policy.
 */
struct RepoMetadata {
    std::string repo_key;
    std::string name;
    std::string origin_url;
    Visibility visibility = Visibility::Private;
    std::string preferred_catalog;
    std::string preferred_remote;
    AutoPushMode auto_push = AutoPushMode::Disabled;
    bool branch_follow_enabled = true;
    PushAccess push_access = PushAccess::Unknown;
    std::string push_access_checked_at;
    std::string push_access_checked_remote;
    std::vector<std::string> previous_repo_keys;
    std::string updated_at;
};

/**
 * @brief Named root directory that repositories are discovered under.
 */
struct Catalog {
    std::string name;
    std::filesystem::path root;
    int repo_path_depth = 1; ///< Directory levels between root and a repository (1 or 2)
};

/**
 * @brief Everything one machine knows about its repositories.
 */
struct MachineSnapshot {
    int version = 1;
    std::string machine_id;
    std::string hostname;
    std::string default_catalog;
    std::vector<Catalog> catalogs;
    std::string last_scan_at;
    std::vector<std::string> last_scan_catalogs;
    std::string updated_at;
    std::vector<RepositoryRecord> repos;
};

/**
 * @brief Inputs to @ref evaluate_syncability beyond the observed record.
 */
struct SyncabilityPolicy {
    bool include_untracked_as_dirty = true;
    AutoPushMode auto_push = AutoPushMode::Disabled;
    PushAccess push_access = PushAccess::Unknown;
    std::string default_branch; ///< Remote HEAD branch, empty when unknown
};

/**
 * @brief Recompute `unsyncable_reasons`, `syncable` and `state_hash`.
 *
 * Reasons are appended in a fixed order: missing origin, operation in
 * progress, dirty tracked, dirty untracked, missing upstream, diverged and
 * finally the push policy/access reasons when the branch is ahead.
 */
void evaluate_syncability(RepositoryRecord& rec, const SyncabilityPolicy& policy);

/**
 * @brief Add a reason and mark the record unsyncable.
 *
 * The state hash is recomputed only when the reason was new.
 */
void append_unsyncable_reason(RepositoryRecord& rec, UnsyncableReason reason);

/**
 * @brief Content hash over the record's observable fields.
 *
 * Format is `fnv1a64:` followed by 16 hex digits. Only meant for change
 * detection.
 */
std::string compute_state_hash(const RepositoryRecord& rec);

/**
 * @brief Whether @p branch is the repository's default branch.
 *
 * Falls back to treating `main` and `master` as default when the remote HEAD
 * is unknown.
 */
bool is_default_branch(const std::string& branch, const std::string& default_branch);

/**
 * @brief Whether automatic pushing applies to the given branch.
 */
bool auto_push_effective(AutoPushMode mode, bool on_default_branch);

/**
 * @brief Whether a push-access classification allows pushing.
 *
 * Only a confirmed read-write classification allows it.
 */
bool push_access_permits_push(PushAccess access);

struct RepoKey {
    std::string catalog;
    std::string relative_path;
};

/**
 * @brief Split a `catalog/relative/path` key.
 *
 * Empty, `.` and `..` segments are rejected.
 */
std::optional<RepoKey> parse_repo_key(const std::string& key, std::string* error = nullptr);

/**
 * @brief Build a repo key from a catalog name and a path below its root.
 */
std::string make_repo_key(const std::string& catalog, const std::filesystem::path& relative);

/**
 * @brief Pick catalogs from the snapshot by name.
 *
 * An empty list selects every catalog. Duplicate names collapse.
 *
 * @throws std::runtime_error `invalid catalog "<name>"` for unknown names.
 */
std::vector<Catalog> select_catalogs(const MachineSnapshot& machine,
                                     const std::vector<std::string>& names);

} // namespace fleetfix

#endif // REPO_HPP
