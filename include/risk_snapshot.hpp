#ifndef RISK_SNAPSHOT_HPP
#define RISK_SNAPSHOT_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "git_client.hpp"

namespace fleetfix {

/**
 * @brief One uncommitted path reported by `git status --porcelain`.
 */
struct ChangedFile {
    std::string path;   ///< Slash separated, rename destination for renames
    std::string status; ///< untracked, deleted, added, renamed or modified
    int added = 0;
    int deleted = 0;
};

/**
 * @brief Uncommitted changes that make committing everything risky.
 */
struct RiskSnapshot {
    std::vector<ChangedFile> changed_files;          ///< Sorted by path
    std::vector<std::string> secret_like_changes;    ///< Sorted, unique
    std::vector<std::string> noisy_changed_paths;    ///< Sorted, unique
    bool missing_root_gitignore = false;
    std::vector<std::string> suggested_gitignore_patterns;
    /// Suggested patterns not yet listed in the root `.gitignore`.
    std::vector<std::string> missing_gitignore_patterns;

    bool has_secret_like_changes() const { return !secret_like_changes.empty(); }
    bool has_noisy_changes_without_gitignore() const {
        return missing_root_gitignore && !noisy_changed_paths.empty();
    }
};

/**
 * @brief Parse `git status --porcelain` output.
 *
 * Entries keep the order git printed them in.
 */
std::vector<ChangedFile> parse_porcelain_status(const std::string& raw);

/**
 * @brief Names that usually hold credentials (`.env`, ssh keys, key stores).
 */
bool is_secret_like_path(const std::string& path);

/**
 * @brief Ignore pattern for a path inside a build/dependency directory.
 *
 * @return e.g. `node_modules/`, or an empty string when the path is not noisy.
 */
std::string noisy_pattern_for_path(const std::string& path);

/**
 * @brief Inspect the uncommitted changes of the repository at @p repo.
 *
 * @throws CommandError when `git status` fails.
 */
RiskSnapshot collect_risk_snapshot(GitClient& git, const std::filesystem::path& repo);

/**
 * @brief Patterns from @p patterns that the root `.gitignore` does not list.
 */
std::vector<std::string> missing_gitignore_patterns(const std::filesystem::path& repo,
                                                    const std::vector<std::string>& patterns);

/**
 * @brief Write @p patterns to the root `.gitignore`.
 *
 * A missing file is generated with the sorted unique patterns; an existing
 * file only gets the patterns it lacks appended under a marker comment.
 *
 * @return Patterns that were written.
 * @throws std::runtime_error when the file cannot be written.
 */
std::vector<std::string> write_gitignore_patterns(const std::filesystem::path& repo,
                                                  const std::vector<std::string>& patterns);

} // namespace fleetfix

#endif // RISK_SNAPSHOT_HPP
