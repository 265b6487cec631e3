#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "system_utils.hpp"

namespace fleetfix {

namespace {

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.as<std::string>();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool parse_bool(const std::string& key, const std::string& raw, bool& out, std::string& error) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
        return true;
    }
    error = "invalid " + key + " \"" + raw + "\" (expected true or false)";
    return false;
}

bool parse_number(const std::string& key, const std::string& raw, long long min,
                  long long& out, std::string& error) {
    try {
        size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used != raw.size() || v < min)
            throw std::invalid_argument(raw);
        out = v;
        return true;
    } catch (const std::exception&) {
        error = "invalid " + key + " \"" + raw + "\"";
        return false;
    }
}

std::filesystem::path expand_home(const std::string& raw) {
    if (raw == "~")
        return procutil::home_dir();
    if (raw.rfind("~/", 0) == 0)
        return procutil::home_dir() / raw.substr(2);
    return raw;
}

} // namespace

AutoPushMode default_auto_push_mode(const SyncConfig& sync, Visibility visibility) {
    bool on = visibility == Visibility::Public ? sync.default_auto_push_public
                                               : sync.default_auto_push_private;
    return on ? AutoPushMode::Enabled : AutoPushMode::Disabled;
}

bool apply_config_values(const std::map<std::string, std::string>& values,
                         const std::vector<std::map<std::string, std::string>>& catalogs,
                         AppConfig& cfg, std::string& error) {
    for (const auto& [key, val] : values) {
        long long n = 0;
        if (key == "github.owner") {
            cfg.github.owner = val;
        } else if (key == "github.default_visibility") {
            auto v = parse_visibility(val);
            if (!v) {
                error = "invalid github.default_visibility \"" + val + "\"";
                return false;
            }
            cfg.github.default_visibility = *v;
        } else if (key == "github.remote_protocol") {
            auto p = parse_remote_protocol(val);
            if (!p) {
                error = "invalid github.remote_protocol \"" + val + "\"";
                return false;
            }
            cfg.github.remote_protocol = *p;
        } else if (key == "github.remote_url_template") {
            cfg.github.remote_url_template = val;
        } else if (key == "sync.fetch_prune") {
            if (!parse_bool(key, val, cfg.sync.fetch_prune, error))
                return false;
        } else if (key == "sync.include_untracked_as_dirty") {
            if (!parse_bool(key, val, cfg.sync.include_untracked_as_dirty, error))
                return false;
        } else if (key == "sync.default_auto_push_private") {
            if (!parse_bool(key, val, cfg.sync.default_auto_push_private, error))
                return false;
        } else if (key == "sync.default_auto_push_public") {
            if (!parse_bool(key, val, cfg.sync.default_auto_push_public, error))
                return false;
        } else if (key == "sync.scan_freshness_seconds") {
            if (!parse_number(key, val, 0, n, error))
                return false;
            cfg.sync.scan_freshness_seconds = n;
        } else if (key == "sync.strategy") {
            try {
                cfg.sync.strategy = parse_sync_strategy(val);
            } catch (const std::exception& e) {
                error = e.what();
                return false;
            }
        } else if (key == "logging.level") {
            cfg.logging.level = val;
        } else if (key == "logging.file") {
            cfg.logging.file = val.empty() ? "" : expand_home(val).string();
        } else if (key == "logging.max_size") {
            if (!parse_number(key, val, 0, n, error))
                return false;
            cfg.logging.max_size = static_cast<size_t>(n);
        } else if (key == "logging.max_files") {
            if (!parse_number(key, val, 0, n, error))
                return false;
            cfg.logging.max_files = static_cast<size_t>(n);
        } else if (key == "logging.json") {
            if (!parse_bool(key, val, cfg.logging.json, error))
                return false;
        } else if (key == "logging.compress") {
            if (!parse_bool(key, val, cfg.logging.compress, error))
                return false;
        } else if (key == "logging.syslog") {
            if (!parse_bool(key, val, cfg.logging.syslog, error))
                return false;
        }
    }

    if (!catalogs.empty()) {
        cfg.catalogs.clear();
        cfg.default_catalog.clear();
    }
    for (const auto& entry : catalogs) {
        auto get = [&](const std::string& k) {
            auto it = entry.find(k);
            return it == entry.end() ? std::string() : it->second;
        };
        Catalog c;
        c.name = get("name");
        if (c.name.empty() || c.name.find('/') != std::string::npos) {
            error = "invalid catalog name \"" + c.name + "\"";
            return false;
        }
        if (get("root").empty()) {
            error = "catalog \"" + c.name + "\" has no root";
            return false;
        }
        c.root = expand_home(get("root"));
        std::string depth = get("repo_path_depth");
        if (!depth.empty()) {
            long long d = 0;
            if (!parse_number("repo_path_depth", depth, 1, d, error))
                return false;
            if (d > 2) {
                error = "invalid repo_path_depth " + depth + " for catalog \"" + c.name +
                        "\" (expected 1 or 2)";
                return false;
            }
            c.repo_path_depth = static_cast<int>(d);
        }
        bool is_default = false;
        std::string def = get("default");
        if (!def.empty() && !parse_bool("default", def, is_default, error))
            return false;
        for (const auto& existing : cfg.catalogs) {
            if (existing.name == c.name) {
                error = "duplicate catalog \"" + c.name + "\"";
                return false;
            }
        }
        if (is_default)
            cfg.default_catalog = c.name;
        cfg.catalogs.push_back(c);
    }
    if (cfg.default_catalog.empty() && !cfg.catalogs.empty())
        cfg.default_catalog = cfg.catalogs.front().name;
    return true;
}

bool load_yaml_config(const std::string& path, AppConfig& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        std::map<std::string, std::string> values;
        std::vector<std::map<std::string, std::string>> catalogs;
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string section = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (section == "catalogs" && node.IsSequence()) {
                for (const auto& item : node) {
                    if (!item.IsMap())
                        continue;
                    auto& m = catalogs.emplace_back();
                    for (auto it2 = item.begin(); it2 != item.end(); ++it2) {
                        std::string s;
                        if (it2->first.IsScalar() && to_string_value(it2->second, s))
                            m[it2->first.as<std::string>()] = s;
                    }
                }
            } else if (node.IsMap()) {
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    std::string s;
                    if (it2->first.IsScalar() && to_string_value(it2->second, s))
                        values[section + "." + it2->first.as<std::string>()] = s;
                }
            }
        }
        return apply_config_values(values, catalogs, cfg, error);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, AppConfig& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        std::map<std::string, std::string> values;
        std::vector<std::map<std::string, std::string>> catalogs;
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (it.key() == "catalogs" && val.is_array()) {
                for (const auto& item : val) {
                    if (!item.is_object())
                        continue;
                    auto& m = catalogs.emplace_back();
                    for (auto sub = item.begin(); sub != item.end(); ++sub) {
                        std::string s;
                        if (to_string_value(sub.value(), s))
                            m[sub.key()] = s;
                    }
                }
            } else if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        values[it.key() + "." + sub.key()] = s;
                }
            }
        }
        return apply_config_values(values, catalogs, cfg, error);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, AppConfig& cfg, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "json")
        return load_json_config(path, cfg, error);
    return load_yaml_config(path, cfg, error);
}

} // namespace fleetfix
