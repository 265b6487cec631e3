#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>
#include "origin_utils.hpp"
#include "repo.hpp"

namespace fleetfix {

struct GitHubConfig {
    std::string owner;
    Visibility default_visibility = Visibility::Private;
    RemoteProtocol remote_protocol = RemoteProtocol::Ssh;
    std::string remote_url_template; ///< Overrides the GitHub URL when set
};

struct SyncConfig {
    bool fetch_prune = true;
    bool include_untracked_as_dirty = true;
    bool default_auto_push_private = true;
    bool default_auto_push_public = false;
    long long scan_freshness_seconds = 60;
    SyncStrategy strategy = SyncStrategy::Rebase;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    size_t max_size = 0;
    size_t max_files = 1;
    bool json = false;
    bool compress = false;
    bool syslog = false;
};

/**
 * @brief Settings read from `config.yaml` (or a JSON equivalent).
 */
struct AppConfig {
    GitHubConfig github;
    SyncConfig sync;
    std::vector<Catalog> catalogs;
    std::string default_catalog; ///< Catalog flagged `default: true`, else the first one
    LoggingConfig logging;
};

/**
 * @brief Auto-push mode a newly tracked repository starts with.
 */
AutoPushMode default_auto_push_mode(const SyncConfig& sync, Visibility visibility);

/**
 * @brief Load configuration from a YAML file.
 *
 * Settings live in `github`, `sync` and `logging` sections; `catalogs` is a
 * list of `{name, root, repo_path_depth, default}` maps. Keys that are not
 * recognized are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param cfg   Receives the parsed values on top of its current contents.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, AppConfig& cfg, std::string& error);

/**
 * @brief Load configuration from a JSON file with the same layout as YAML.
 */
bool load_json_config(const std::string& path, AppConfig& cfg, std::string& error);

/**
 * @brief Load a config file, choosing the parser by extension.
 *
 * `.json` files use the JSON loader, everything else is read as YAML.
 */
bool load_config_file(const std::string& path, AppConfig& cfg, std::string& error);

/**
 * @brief Apply flattened `section.key` values and catalog entries.
 *
 * Shared by both loaders. Fails on malformed values such as an unknown
 * remote protocol or a repo path depth other than 1 or 2.
 */
bool apply_config_values(const std::map<std::string, std::string>& values,
                         const std::vector<std::map<std::string, std::string>>& catalogs,
                         AppConfig& cfg, std::string& error);

} // namespace fleetfix

#endif // CONFIG_UTILS_HPP
