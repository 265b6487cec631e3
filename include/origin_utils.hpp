#ifndef ORIGIN_UTILS_HPP
#define ORIGIN_UTILS_HPP
#include <optional>
#include <string>

namespace fleetfix {

enum class RemoteProtocol { Ssh, Https };

const char* to_string(RemoteProtocol protocol);
std::optional<RemoteProtocol> parse_remote_protocol(const std::string& text);

/**
 * @brief Reduce a remote URL to a comparable `host/path` identity.
 *
 * `git@github.com:Org/Repo.git`, `ssh://git@github.com/org/repo` and
 * `https://github.com/org/repo.git` all normalize to `github.com/org/repo`.
 * Local paths and `file://` URLs become `file/<path>`. The result is
 * lowercased with a trailing `.git` and surrounding slashes removed.
 */
std::string normalize_origin_identity(const std::string& url);

/**
 * @brief Compare two remote URLs by their normalized identity.
 */
bool same_origin_identity(const std::string& a, const std::string& b);

/**
 * @brief Owner/name pair of a hosted repository.
 */
struct RemoteRepoRef {
    std::string owner;
    std::string name;
    std::string full_name() const { return owner + "/" + name; }
};

/**
 * @brief Derive owner and repository name from an origin URL.
 *
 * Uses the last two path segments of the normalized identity, so
 * `git@github.com:acme/tool.git` yields `acme/tool`.
 *
 * @return `std::nullopt` when the identity has no host plus two segments.
 */
std::optional<RemoteRepoRef> parse_remote_repo(const std::string& origin_url);

/**
 * @brief URL for @p owner / @p name on the configured remote host.
 *
 * A non-empty @p url_template takes precedence and may reference
 * `${owner}`, `${org}` (alias of owner) and `${repo}`. Otherwise GitHub URLs
 * are produced: `https://github.com/o/n.git` or `git@github.com:o/n.git`.
 */
std::string remote_repo_url(const std::string& owner, const std::string& name,
                            RemoteProtocol protocol, const std::string& url_template = "");

constexpr size_t MAX_REPO_NAME_LENGTH = 100;

/**
 * @brief Turn an arbitrary directory name into a valid repository name.
 *
 * Lowercases, collapses runs of characters outside `[a-z0-9._-]` into a
 * single `-`, drops leading dashes and truncates to 100 characters.
 */
std::string sanitize_repo_name(const std::string& raw);

/**
 * @brief Validate a repository name.
 *
 * @param error Receives a description of the first problem found.
 * @return `true` when the name is non-empty, at most 100 characters, uses
 *         only `[a-z0-9._-]` and is not `.` or `..`.
 */
bool validate_repo_name(const std::string& name, std::string* error = nullptr);

} // namespace fleetfix

#endif // ORIGIN_UTILS_HPP
