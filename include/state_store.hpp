#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "repo.hpp"

namespace fleetfix {

/**
 * @brief Locations of configuration and state files.
 */
struct StatePaths {
    std::filesystem::path config_dir;
    std::filesystem::path state_dir;

    std::filesystem::path config_file() const { return config_dir / "config.yaml"; }
    std::filesystem::path lock_file() const { return state_dir / "lock"; }
    std::filesystem::path machine_id_file() const { return state_dir / "machine-id"; }
    std::filesystem::path machines_dir() const { return state_dir / "machines"; }
    std::filesystem::path repos_dir() const { return state_dir / "repos"; }

    /**
     * @brief Resolve directories from `FLEETFIX_CONFIG_HOME` / `FLEETFIX_STATE_HOME`,
     * then the XDG variables, then `~/.config/fleetfix` and `~/.local/state/fleetfix`.
     */
    static StatePaths from_environment();
};

/**
 * @brief Another process holds the state lock.
 */
class LockError : public std::runtime_error {
  public:
    explicit LockError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Scoped ownership of the process-wide state lock.
 *
 * Destroying the object releases the lock.
 */
class StateLock {
  public:
    virtual ~StateLock() = default;
};

/**
 * @brief Persistence for configuration, machine snapshots and repo metadata.
 *
 * Load/save failures throw std::runtime_error.
 */
class StateStore {
  public:
    virtual ~StateStore() = default;

    /// @throws LockError when another live process holds the lock.
    virtual std::unique_ptr<StateLock> acquire_lock() = 0;
    virtual AppConfig load_config() = 0;
    /// Load this machine's snapshot, bootstrapping one from @p cfg if missing.
    virtual MachineSnapshot load_machine(const AppConfig& cfg) = 0;
    virtual void save_machine(const MachineSnapshot& machine) = 0;
    virtual std::optional<RepoMetadata> load_repo_metadata(const std::string& repo_key) = 0;
    virtual void save_repo_metadata(const RepoMetadata& meta) = 0;
    virtual std::vector<RepoMetadata> load_all_repo_metadata() = 0;
};

/**
 * @brief File name used to store metadata for @p repo_key.
 *
 * `/` becomes `__` and `:`, `\`, `?`, `*` become `_`.
 */
std::string metadata_file_name(const std::string& repo_key);

/**
 * @brief Fields used to seed metadata for a repository seen for the first time.
 */
struct MetadataSeed {
    std::string repo_key;
    std::string name;
    std::string origin_url;
    std::optional<Visibility> visibility;
    std::string preferred_catalog;
};

/**
 * @brief Create metadata for @p seed or fill in missing fields of existing metadata.
 *
 * New metadata starts with the configured default auto-push mode for its
 * visibility. Existing metadata is only saved when something changed.
 */
RepoMetadata ensure_repo_metadata(StateStore& store, const AppConfig& cfg,
                                  const MetadataSeed& seed);

/**
 * @brief StateStore keeping YAML files under a state directory.
 *
 * Layout: `machines/<machine-id>.yaml`, `repos/<key>.yaml`, `machine-id` and
 * the `lock` file.
 */
class FileStateStore : public StateStore {
  public:
    explicit FileStateStore(StatePaths paths, std::string config_override = "");

    std::unique_ptr<StateLock> acquire_lock() override;
    AppConfig load_config() override;
    MachineSnapshot load_machine(const AppConfig& cfg) override;
    void save_machine(const MachineSnapshot& machine) override;
    std::optional<RepoMetadata> load_repo_metadata(const std::string& repo_key) override;
    void save_repo_metadata(const RepoMetadata& meta) override;
    std::vector<RepoMetadata> load_all_repo_metadata() override;

    /// Stable identifier of this machine, created on first use.
    std::string machine_id();
    const StatePaths& paths() const { return paths_; }

  private:
    std::filesystem::path machine_file();

    StatePaths paths_;
    std::string config_override_;
    std::string machine_id_;
};

} // namespace fleetfix

#endif // STATE_STORE_HPP
