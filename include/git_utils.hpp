#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "repo.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts initialization, so nesting guards is safe.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

// The functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is the top of a Git working tree.
 *
 * Both `.git` directories and `.git` files (linked worktrees, submodules)
 * are accepted.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @return 40 character hexadecimal commit hash or `std::nullopt` for an
 *         unborn branch or on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * Works for unborn branches by reading the symbolic `HEAD` target.
 *
 * @return Branch name, or `std::nullopt` when `HEAD` is detached.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Names of all configured remotes, sorted.
 */
std::vector<std::string> list_remotes(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Upstream of the current branch as a shorthand like `origin/main`.
 *
 * @return `std::nullopt` when HEAD is detached or no upstream is configured.
 */
std::optional<std::string> get_upstream(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Resolve any reference name or shorthand to a commit hash.
 */
std::optional<std::string> resolve_ref(const fs::path& repo, const std::string& ref,
                                       std::string* error = nullptr);

/**
 * @brief Count commits unique to HEAD and to @p upstream.
 *
 * @return Pair of (ahead, behind), or `std::nullopt` if either side cannot
 *         be resolved.
 */
std::optional<std::pair<int, int>> get_ahead_behind(const fs::path& repo,
                                                    const std::string& upstream,
                                                    std::string* error = nullptr);

/**
 * @brief Working tree dirtiness split by tracked and untracked files.
 */
struct WorktreeStatus {
    bool dirty_tracked = false; ///< Staged or unstaged changes to tracked files
    bool untracked = false;     ///< Untracked files that are not ignored
};

std::optional<WorktreeStatus> get_worktree_status(const fs::path& repo,
                                                  std::string* error = nullptr);

/**
 * @brief In-progress operation derived from `git_repository_state`.
 */
std::optional<fleetfix::GitOperation> get_operation(const fs::path& repo,
                                                    std::string* error = nullptr);

/**
 * @brief Default branch advertised by @p remote through `refs/remotes/<remote>/HEAD`.
 */
std::optional<std::string> get_remote_default_branch(const fs::path& repo,
                                                     const std::string& remote);

} // namespace git

#endif // GIT_UTILS_HPP
