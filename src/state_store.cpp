#include "state_store.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <unistd.h>
#include "lock_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"

namespace fleetfix {

namespace fs = std::filesystem;

namespace {

class FileLock : public StateLock {
  public:
    explicit FileLock(std::unique_ptr<procutil::LockFileGuard> guard) : guard_(std::move(guard)) {}
    ~FileLock() override { log_debug("released state lock", {{"path", guard_->path.string()}}); }

  private:
    std::unique_ptr<procutil::LockFileGuard> guard_;
};

std::string scalar(const YAML::Node& node, const char* key) {
    const YAML::Node v = node[key];
    if (!v || v.IsNull() || !v.IsScalar())
        return "";
    return v.as<std::string>();
}

int integer(const YAML::Node& node, const char* key) {
    const YAML::Node v = node[key];
    if (!v || !v.IsScalar())
        return 0;
    return v.as<int>();
}

bool boolean(const YAML::Node& node, const char* key, bool fallback = false) {
    const YAML::Node v = node[key];
    if (!v || !v.IsScalar())
        return fallback;
    return v.as<bool>();
}

std::vector<std::string> string_list(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    const YAML::Node v = node[key];
    if (v && v.IsSequence()) {
        for (const auto& item : v)
            out.push_back(item.as<std::string>());
    }
    return out;
}

YAML::Node string_seq(const std::vector<std::string>& items) {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& s : items)
        seq.push_back(s);
    return seq;
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
        throw std::runtime_error("cannot create " + path.parent_path().string() + ": " +
                                 ec.message());
    fs::path tmp = path;
    tmp += ".tmp" + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            throw std::runtime_error("cannot write " + tmp.string());
        out << content;
        if (!out.good())
            throw std::runtime_error("cannot write " + tmp.string());
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("cannot replace " + path.string());
    }
}

std::string dump(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return std::string(out.c_str()) + "\n";
}

YAML::Node record_to_yaml(const RepositoryRecord& r) {
    YAML::Node n;
    n["repo_key"] = r.repo_key;
    n["name"] = r.name;
    n["catalog"] = r.catalog;
    n["path"] = r.path.string();
    n["origin_url"] = r.origin_url;
    n["upstream"] = r.upstream;
    n["branch"] = r.branch;
    n["head_sha"] = r.head_sha;
    n["upstream_head_sha"] = r.upstream_head_sha;
    n["ahead"] = r.ahead;
    n["behind"] = r.behind;
    n["diverged"] = r.diverged;
    n["has_dirty_tracked"] = r.has_dirty_tracked;
    n["has_untracked"] = r.has_untracked;
    n["operation"] = to_string(r.operation);
    n["syncable"] = r.syncable;
    std::vector<std::string> reasons;
    for (auto reason : r.unsyncable_reasons)
        reasons.push_back(to_string(reason));
    n["unsyncable_reasons"] = string_seq(reasons);
    n["state_hash"] = r.state_hash;
    return n;
}

RepositoryRecord record_from_yaml(const YAML::Node& n) {
    RepositoryRecord r;
    r.repo_key = scalar(n, "repo_key");
    r.name = scalar(n, "name");
    r.catalog = scalar(n, "catalog");
    r.path = scalar(n, "path");
    r.origin_url = scalar(n, "origin_url");
    r.upstream = scalar(n, "upstream");
    r.branch = scalar(n, "branch");
    r.head_sha = scalar(n, "head_sha");
    r.upstream_head_sha = scalar(n, "upstream_head_sha");
    r.ahead = integer(n, "ahead");
    r.behind = integer(n, "behind");
    r.diverged = boolean(n, "diverged");
    r.has_dirty_tracked = boolean(n, "has_dirty_tracked");
    r.has_untracked = boolean(n, "has_untracked");
    r.operation = parse_git_operation(scalar(n, "operation")).value_or(GitOperation::None);
    r.syncable = boolean(n, "syncable");
    for (const auto& s : string_list(n, "unsyncable_reasons")) {
        if (auto reason = parse_unsyncable_reason(s))
            r.unsyncable_reasons.add(*reason);
        else
            log_warning("ignoring unknown unsyncable reason", {{"reason", s}});
    }
    r.state_hash = scalar(n, "state_hash");
    if (r.state_hash.empty())
        r.state_hash = compute_state_hash(r);
    return r;
}

YAML::Node metadata_to_yaml(const RepoMetadata& m) {
    YAML::Node n;
    n["repo_key"] = m.repo_key;
    n["name"] = m.name;
    n["origin_url"] = m.origin_url;
    n["visibility"] = to_string(m.visibility);
    n["preferred_catalog"] = m.preferred_catalog;
    n["preferred_remote"] = m.preferred_remote;
    n["auto_push"] = to_string(m.auto_push);
    n["branch_follow_enabled"] = m.branch_follow_enabled;
    n["push_access"] = to_string(m.push_access);
    n["push_access_checked_at"] = m.push_access_checked_at;
    n["push_access_checked_remote"] = m.push_access_checked_remote;
    n["previous_repo_keys"] = string_seq(m.previous_repo_keys);
    n["updated_at"] = m.updated_at;
    return n;
}

RepoMetadata metadata_from_yaml(const YAML::Node& n, const fs::path& file) {
    RepoMetadata m;
    m.repo_key = scalar(n, "repo_key");
    m.name = scalar(n, "name");
    m.origin_url = scalar(n, "origin_url");
    m.visibility = parse_visibility(scalar(n, "visibility")).value_or(Visibility::Private);
    m.preferred_catalog = scalar(n, "preferred_catalog");
    m.preferred_remote = scalar(n, "preferred_remote");
    auto mode = parse_auto_push_mode(scalar(n, "auto_push"));
    if (!mode)
        throw std::runtime_error("invalid auto_push \"" + scalar(n, "auto_push") + "\" in " +
                                 file.string());
    m.auto_push = *mode;
    m.branch_follow_enabled = boolean(n, "branch_follow_enabled", true);
    auto access = parse_push_access(scalar(n, "push_access"));
    if (!access)
        throw std::runtime_error("invalid push_access \"" + scalar(n, "push_access") + "\" in " +
                                 file.string());
    m.push_access = *access;
    m.push_access_checked_at = scalar(n, "push_access_checked_at");
    m.push_access_checked_remote = scalar(n, "push_access_checked_remote");
    m.previous_repo_keys = string_list(n, "previous_repo_keys");
    m.updated_at = scalar(n, "updated_at");
    return m;
}

std::string sanitize_machine_id(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-')
            out += c;
        else if (!std::isspace(static_cast<unsigned char>(c)))
            out += '-';
    }
    return out.empty() ? "localhost" : out;
}

fs::path xdg_dir(const char* fleetfix_var, const char* xdg_var, const fs::path& fallback) {
    if (auto v = procutil::safe_getenv(fleetfix_var); v && !v->empty())
        return *v;
    if (auto v = procutil::safe_getenv(xdg_var); v && !v->empty())
        return fs::path(*v) / "fleetfix";
    return procutil::home_dir() / fallback;
}

} // namespace

StatePaths StatePaths::from_environment() {
    StatePaths p;
    p.config_dir = xdg_dir("FLEETFIX_CONFIG_HOME", "XDG_CONFIG_HOME", ".config/fleetfix");
    p.state_dir = xdg_dir("FLEETFIX_STATE_HOME", "XDG_STATE_HOME", ".local/state/fleetfix");
    return p;
}

std::string metadata_file_name(const std::string& repo_key) {
    std::string out;
    for (char c : repo_key) {
        switch (c) {
        case '/':
            out += "__";
            break;
        case ':':
        case '\\':
        case '?':
        case '*':
            out += '_';
            break;
        default:
            out += c;
            break;
        }
    }
    return out + ".yaml";
}

RepoMetadata ensure_repo_metadata(StateStore& store, const AppConfig& cfg,
                                  const MetadataSeed& seed) {
    if (seed.repo_key.empty())
        throw std::runtime_error("repo_key is required to record repo metadata");
    auto existing = store.load_repo_metadata(seed.repo_key);
    if (!existing) {
        RepoMetadata m;
        m.repo_key = seed.repo_key;
        m.name = seed.name;
        m.origin_url = seed.origin_url;
        m.visibility = seed.visibility.value_or(cfg.github.default_visibility);
        m.preferred_catalog = seed.preferred_catalog;
        m.auto_push = default_auto_push_mode(cfg.sync, m.visibility);
        m.branch_follow_enabled = true;
        m.updated_at = format_rfc3339(current_time());
        store.save_repo_metadata(m);
        log_info("created repo metadata",
                 {{"repo", m.repo_key}, {"auto_push", to_string(m.auto_push)}});
        return m;
    }
    RepoMetadata m = *existing;
    bool changed = false;
    auto fill = [&](std::string& field, const std::string& value) {
        if (field.empty() && !value.empty()) {
            field = value;
            changed = true;
        }
    };
    fill(m.name, seed.name);
    fill(m.preferred_catalog, seed.preferred_catalog);
    if (!seed.origin_url.empty() && m.origin_url != seed.origin_url) {
        m.origin_url = seed.origin_url;
        changed = true;
    }
    if (seed.visibility && m.visibility != *seed.visibility) {
        m.visibility = *seed.visibility;
        changed = true;
    }
    if (changed) {
        m.updated_at = format_rfc3339(current_time());
        store.save_repo_metadata(m);
    }
    return m;
}

FileStateStore::FileStateStore(StatePaths paths, std::string config_override)
    : paths_(std::move(paths)), config_override_(std::move(config_override)) {}

std::unique_ptr<StateLock> FileStateStore::acquire_lock() {
    std::error_code ec;
    fs::create_directories(paths_.state_dir, ec);
    if (ec)
        throw std::runtime_error("cannot create state directory " + paths_.state_dir.string() +
                                 ": " + ec.message());
    fs::path path = paths_.lock_file();
    std::string host = procutil::hostname();
    auto now = current_time();
    procutil::LockInfo info{static_cast<unsigned long>(getpid()), host, format_rfc3339(now)};
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto guard = std::make_unique<procutil::LockFileGuard>(path, info);
        if (guard->locked) {
            log_debug("acquired state lock", {{"path", path.string()}});
            return std::make_unique<FileLock>(std::move(guard));
        }
        auto holder = procutil::read_lock_info(path);
        auto modified = procutil::lock_file_mtime(path);
        if (!holder || !modified) {
            // Lock vanished between the failed create and the read.
            continue;
        }
        if (attempt == 0 && procutil::lock_is_stale(*holder, host, now, *modified)) {
            log_warning("removing stale state lock",
                        {{"path", path.string()},
                         {"pid", std::to_string(holder->pid)},
                         {"hostname", holder->hostname},
                         {"created_at", holder->created_at}});
            procutil::release_lock_file(path);
            continue;
        }
        throw LockError("another fleetfix process holds the lock: " + path.string() + " (pid " +
                        std::to_string(holder->pid) + " on " + holder->hostname + ")");
    }
    throw LockError("could not acquire lock: " + path.string());
}

AppConfig FileStateStore::load_config() {
    AppConfig cfg;
    std::string path = config_override_.empty() ? paths_.config_file().string() : config_override_;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!config_override_.empty())
            throw std::runtime_error("config file not found: " + path);
        log_debug("no config file, using defaults", {{"path", path}});
        return cfg;
    }
    std::string error;
    if (!load_config_file(path, cfg, error))
        throw std::runtime_error("failed to load config " + path + ": " + error);
    return cfg;
}

std::string FileStateStore::machine_id() {
    if (!machine_id_.empty())
        return machine_id_;
    std::ifstream in(paths_.machine_id_file());
    std::string id;
    if (in && std::getline(in, id))
        id = sanitize_machine_id(id);
    if (id.empty() || !in) {
        auto env = procutil::safe_getenv("FLEETFIX_MACHINE_ID");
        id = sanitize_machine_id(env && !env->empty() ? *env : procutil::hostname());
        write_file_atomic(paths_.machine_id_file(), id + "\n");
    }
    machine_id_ = id;
    return machine_id_;
}

fs::path FileStateStore::machine_file() { return paths_.machines_dir() / (machine_id() + ".yaml"); }

MachineSnapshot FileStateStore::load_machine(const AppConfig& cfg) {
    MachineSnapshot m;
    fs::path file = machine_file();
    std::error_code ec;
    if (fs::exists(file, ec)) {
        try {
            YAML::Node root = YAML::LoadFile(file.string());
            m.version = root["version"] ? root["version"].as<int>() : 1;
            m.machine_id = scalar(root, "machine_id");
            m.hostname = scalar(root, "hostname");
            m.default_catalog = scalar(root, "default_catalog");
            if (root["catalogs"] && root["catalogs"].IsSequence()) {
                for (const auto& c : root["catalogs"]) {
                    Catalog cat{scalar(c, "name"), scalar(c, "root"), integer(c, "repo_path_depth")};
                    if (cat.repo_path_depth < 1)
                        cat.repo_path_depth = 1;
                    m.catalogs.push_back(cat);
                }
            }
            m.last_scan_at = scalar(root, "last_scan_at");
            m.last_scan_catalogs = string_list(root, "last_scan_catalogs");
            m.updated_at = scalar(root, "updated_at");
            if (root["repos"] && root["repos"].IsSequence()) {
                for (const auto& r : root["repos"])
                    m.repos.push_back(record_from_yaml(r));
            }
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("failed to read machine snapshot " + file.string() + ": " +
                                     e.what());
        }
    } else {
        log_info("bootstrapping machine snapshot", {{"path", file.string()}});
    }
    m.machine_id = machine_id();
    m.hostname = procutil::hostname();
    if (!cfg.catalogs.empty()) {
        m.catalogs = cfg.catalogs;
        m.default_catalog = cfg.default_catalog;
    }
    return m;
}

void FileStateStore::save_machine(const MachineSnapshot& machine) {
    YAML::Node root;
    root["version"] = machine.version;
    root["machine_id"] = machine.machine_id;
    root["hostname"] = machine.hostname;
    root["default_catalog"] = machine.default_catalog;
    YAML::Node cats(YAML::NodeType::Sequence);
    for (const auto& c : machine.catalogs) {
        YAML::Node n;
        n["name"] = c.name;
        n["root"] = c.root.string();
        n["repo_path_depth"] = c.repo_path_depth;
        cats.push_back(n);
    }
    root["catalogs"] = cats;
    root["last_scan_at"] = machine.last_scan_at;
    root["last_scan_catalogs"] = string_seq(machine.last_scan_catalogs);
    root["updated_at"] = format_rfc3339(current_time());
    YAML::Node repos(YAML::NodeType::Sequence);
    for (const auto& r : machine.repos)
        repos.push_back(record_to_yaml(r));
    root["repos"] = repos;
    write_file_atomic(machine_file(), dump(root));
}

std::optional<RepoMetadata> FileStateStore::load_repo_metadata(const std::string& repo_key) {
    fs::path file = paths_.repos_dir() / metadata_file_name(repo_key);
    std::error_code ec;
    if (!fs::exists(file, ec))
        return std::nullopt;
    try {
        return metadata_from_yaml(YAML::LoadFile(file.string()), file);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to read repo metadata " + file.string() + ": " +
                                 e.what());
    }
}

void FileStateStore::save_repo_metadata(const RepoMetadata& meta) {
    if (meta.repo_key.empty())
        throw std::runtime_error("cannot save repo metadata without a repo_key");
    write_file_atomic(paths_.repos_dir() / metadata_file_name(meta.repo_key),
                      dump(metadata_to_yaml(meta)));
}

std::vector<RepoMetadata> FileStateStore::load_all_repo_metadata() {
    std::vector<RepoMetadata> out;
    std::error_code ec;
    if (!fs::is_directory(paths_.repos_dir(), ec))
        return out;
    std::vector<fs::path> files;
    for (const auto& entry :
         fs::directory_iterator(paths_.repos_dir(), fs::directory_options::skip_permission_denied,
                                ec)) {
        if (entry.path().extension() == ".yaml")
            files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        try {
            out.push_back(metadata_from_yaml(YAML::LoadFile(file.string()), file));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("failed to read repo metadata " + file.string() + ": " +
                                     e.what());
        }
    }
    return out;
}

} // namespace fleetfix
