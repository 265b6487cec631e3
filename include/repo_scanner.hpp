#ifndef REPO_SCANNER_HPP
#define REPO_SCANNER_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "git_client.hpp"
#include "repo.hpp"
#include "state_store.hpp"

namespace fleetfix {

/**
 * @brief When a machine snapshot is rescanned before use.
 */
enum class RefreshMode { Never, IfStale, Always };

struct DiscoveredRepo {
    std::string catalog;
    std::filesystem::path path;
    std::string name;
    std::string repo_key;
};

/**
 * @brief Whether the snapshot is too old to trust for @p catalogs.
 *
 * Stale when @p freshness is zero, no scan ever ran, the last scan did not
 * cover every selected catalog, or it is older than @p freshness.
 */
bool snapshot_is_stale(const MachineSnapshot& machine, const std::vector<Catalog>& catalogs,
                       std::chrono::seconds freshness, std::chrono::system_clock::time_point now);

/**
 * @brief Finds repositories under catalogs and records their observed state.
 */
class RepoScanner {
  public:
    RepoScanner(GitClient& git, StateStore& store, const AppConfig& cfg);

    /**
     * @brief Git repositories exactly `repo_path_depth` levels below the root.
     *
     * Hidden directories are skipped. Results are sorted by path.
     */
    std::vector<DiscoveredRepo> discover(const Catalog& catalog);

    /**
     * @brief Build a record for one repository and evaluate its syncability.
     *
     * Repositories with an origin get metadata created on first sight.
     */
    RepositoryRecord observe(const DiscoveredRepo& repo);

    /**
     * @brief Rescan @p catalogs, replace their records and save the snapshot.
     */
    void scan(MachineSnapshot& machine, const std::vector<Catalog>& catalogs);

    /**
     * @brief Rescan when @p mode asks for it.
     *
     * @return `true` when a scan ran.
     */
    bool refresh(MachineSnapshot& machine, const std::vector<Catalog>& catalogs, RefreshMode mode);

    /**
     * @brief Re-observe the single repository at @p path and save the snapshot.
     *
     * @throws std::runtime_error when @p path is not in the snapshot.
     */
    void refresh_repo(MachineSnapshot& machine, const std::filesystem::path& path);

  private:
    GitClient& git_;
    StateStore& store_;
    const AppConfig& cfg_;
};

/// Snapshot order: repo key, then path.
void sort_snapshot_records(std::vector<RepositoryRecord>& repos);

} // namespace fleetfix

#endif // REPO_SCANNER_HPP
