#include "test_common.hpp"

using namespace fleetfix;
using namespace fleetfix::test_support;

TEST_CASE("YAML config loading") {
    fs::path dir = fresh_dir("cfg_yaml");
    fs::path cfg_file = dir / "config.yaml";
    write_file(cfg_file, "github:\n"
                         "  owner: octo\n"
                         "  default_visibility: public\n"
                         "  remote_protocol: https\n"
                         "sync:\n"
                         "  fetch_prune: false\n"
                         "  scan_freshness_seconds: 120\n"
                         "  strategy: merge\n"
                         "  unknown_key: 1\n"
                         "catalogs:\n"
                         "  - name: code\n"
                         "    root: /srv/code\n"
                         "  - name: work\n"
                         "    root: /srv/work\n"
                         "    repo_path_depth: 2\n"
                         "    default: true\n"
                         "logging:\n"
                         "  level: DEBUG\n"
                         "  json: yes\n");
    AppConfig cfg;
    std::string err;
    REQUIRE(load_config_file(cfg_file.string(), cfg, err));
    REQUIRE(cfg.github.owner == "octo");
    REQUIRE(cfg.github.default_visibility == Visibility::Public);
    REQUIRE(cfg.github.remote_protocol == RemoteProtocol::Https);
    REQUIRE_FALSE(cfg.sync.fetch_prune);
    REQUIRE(cfg.sync.scan_freshness_seconds == 120);
    REQUIRE(cfg.sync.strategy == SyncStrategy::Merge);
    REQUIRE(cfg.catalogs.size() == 2);
    REQUIRE(cfg.catalogs[1].repo_path_depth == 2);
    REQUIRE(cfg.default_catalog == "work");
    REQUIRE(cfg.logging.level == "DEBUG");
    REQUIRE(cfg.logging.json);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON config loading") {
    fs::path dir = fresh_dir("cfg_json");
    fs::path cfg_file = dir / "config.json";
    write_file(cfg_file, "{\n"
                         "  \"github\": {\"owner\": \"octo\", \"remote_url_template\": "
                         "\"/srv/${owner}/${repo}.git\"},\n"
                         "  \"sync\": {\"include_untracked_as_dirty\": false, "
                         "\"default_auto_push_public\": true},\n"
                         "  \"catalogs\": [{\"name\": \"code\", \"root\": \"/srv/code\", "
                         "\"repo_path_depth\": 1}]\n"
                         "}\n");
    AppConfig cfg;
    std::string err;
    REQUIRE(load_config_file(cfg_file.string(), cfg, err));
    REQUIRE(cfg.github.remote_url_template == "/srv/${owner}/${repo}.git");
    REQUIRE_FALSE(cfg.sync.include_untracked_as_dirty);
    REQUIRE(default_auto_push_mode(cfg.sync, Visibility::Public) == AutoPushMode::Enabled);
    REQUIRE(cfg.default_catalog == "code");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("config defaults") {
    AppConfig cfg;
    REQUIRE(cfg.sync.fetch_prune);
    REQUIRE(cfg.sync.scan_freshness_seconds == 60);
    REQUIRE(cfg.sync.strategy == SyncStrategy::Rebase);
    REQUIRE(cfg.github.remote_protocol == RemoteProtocol::Ssh);
    REQUIRE(default_auto_push_mode(cfg.sync, Visibility::Private) == AutoPushMode::Enabled);
    REQUIRE(default_auto_push_mode(cfg.sync, Visibility::Public) == AutoPushMode::Disabled);
}

TEST_CASE("invalid config values are rejected") {
    AppConfig cfg;
    std::string err;

    SECTION("remote protocol") {
        REQUIRE_FALSE(apply_config_values({{"github.remote_protocol", "ftp"}}, {}, cfg, err));
        REQUIRE(err == "invalid github.remote_protocol \"ftp\"");
    }
    SECTION("sync strategy") {
        REQUIRE_FALSE(apply_config_values({{"sync.strategy", "squash"}}, {}, cfg, err));
        REQUIRE(err.find("unsupported sync strategy") != std::string::npos);
    }
    SECTION("boolean") {
        REQUIRE_FALSE(apply_config_values({{"sync.fetch_prune", "maybe"}}, {}, cfg, err));
        REQUIRE(err.find("expected true or false") != std::string::npos);
    }
    SECTION("catalog depth") {
        REQUIRE_FALSE(apply_config_values(
            {}, {{{"name", "code"}, {"root", "/srv"}, {"repo_path_depth", "3"}}}, cfg, err));
        REQUIRE(err.find("expected 1 or 2") != std::string::npos);
    }
    SECTION("duplicate catalogs") {
        REQUIRE_FALSE(apply_config_values({},
                                          {{{"name", "code"}, {"root", "/a"}},
                                           {{"name", "code"}, {"root", "/b"}}},
                                          cfg, err));
        REQUIRE(err == "duplicate catalog \"code\"");
    }
    SECTION("catalog without root") {
        REQUIRE_FALSE(apply_config_values({}, {{{"name", "code"}}}, cfg, err));
        REQUIRE(err == "catalog \"code\" has no root");
    }
}

TEST_CASE("missing config file reports an error") {
    AppConfig cfg;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/fleetfix/config.yaml", cfg, err));
    REQUIRE_FALSE(err.empty());
}
