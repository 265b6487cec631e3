#include "test_common.hpp"
#include "fakes.hpp"
#include <iterator>

using namespace fleetfix;
using namespace fleetfix::test_support;

TEST_CASE("porcelain status parsing") {
    auto files = parse_porcelain_status(" M src/a.cpp\n"
                                        "?? notes.txt\n"
                                        "D  old.txt\r\n"
                                        "A  new.txt\n"
                                        "R  before.txt -> after.txt\n"
                                        "?? \"with space.txt\"\n"
                                        "x\n");
    REQUIRE(files.size() == 6);
    REQUIRE(files[0].path == "src/a.cpp");
    REQUIRE(files[0].status == "modified");
    REQUIRE(files[1].status == "untracked");
    REQUIRE(files[2].status == "deleted");
    REQUIRE(files[3].status == "added");
    REQUIRE(files[4].path == "after.txt");
    REQUIRE(files[4].status == "renamed");
    REQUIRE(files[5].path == "with space.txt");
}

TEST_CASE("secret-like and noisy paths") {
    REQUIRE(is_secret_like_path(".env"));
    REQUIRE(is_secret_like_path("config/ID_RSA"));
    REQUIRE(is_secret_like_path("certs/server.pem"));
    REQUIRE(is_secret_like_path("android/release.keystore"));
    REQUIRE_FALSE(is_secret_like_path(".environment"));
    REQUIRE_FALSE(is_secret_like_path("src/key.cpp"));
    REQUIRE_FALSE(is_secret_like_path(".pem"));

    REQUIRE(noisy_pattern_for_path("web/node_modules/x/index.js") == "node_modules/");
    REQUIRE(noisy_pattern_for_path("Build/out.o") == "build/");
    REQUIRE(noisy_pattern_for_path("src/builder.cpp") == "");
}

TEST_CASE("risk snapshot collects changes") {
    fs::path repo = fresh_dir("risk_collect");
    write_file(repo / "notes.txt", "one\ntwo\nthree");
    fs::create_directories(repo / "dist");
    FakeGitClient git;
    git.porcelain = "?? notes.txt\n M src/main.cpp\n?? .env\n?? node_modules/a/b.js\n";
    git.numstat = "4\t1\tsrc/main.cpp\n-\t-\tlogo.png\n";

    RiskSnapshot risk = collect_risk_snapshot(git, repo);
    REQUIRE(risk.missing_root_gitignore);
    REQUIRE(risk.changed_files.size() == 4);
    REQUIRE(risk.changed_files[0].path == ".env");
    REQUIRE(risk.changed_files[2].path == "notes.txt");
    REQUIRE(risk.changed_files[2].added == 3);
    REQUIRE(risk.changed_files[3].path == "src/main.cpp");
    REQUIRE(risk.changed_files[3].added == 4);
    REQUIRE(risk.changed_files[3].deleted == 1);
    REQUIRE(risk.secret_like_changes == std::vector<std::string>{".env"});
    REQUIRE(risk.noisy_changed_paths == std::vector<std::string>{"node_modules/a/b.js"});
    REQUIRE(risk.suggested_gitignore_patterns ==
            std::vector<std::string>{"dist/", "node_modules/"});
    REQUIRE(risk.missing_gitignore_patterns == risk.suggested_gitignore_patterns);
    REQUIRE(risk.has_secret_like_changes());
    REQUIRE(risk.has_noisy_changes_without_gitignore());
    FS_REMOVE_ALL(repo);
}

TEST_CASE("existing gitignore entries are not suggested again") {
    fs::path repo = fresh_dir("risk_gitignore");
    write_file(repo / ".gitignore", "# deps\nnode_modules\n");
    auto missing = missing_gitignore_patterns(repo, {"node_modules/", "dist/", " dist/ ", ""});
    REQUIRE(missing == std::vector<std::string>{"dist/"});

    auto written = write_gitignore_patterns(repo, {"dist/", "node_modules/"});
    REQUIRE(written == std::vector<std::string>{"dist/"});
    std::ifstream in(repo / ".gitignore");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "# deps\nnode_modules\n# Added by fleetfix\ndist/\n");
    REQUIRE(write_gitignore_patterns(repo, {"dist/"}).empty());
    FS_REMOVE_ALL(repo);
}

TEST_CASE("status failure propagates") {
    struct FailingGit : FakeGitClient {
        std::string status_porcelain(const fs::path&) override {
            throw CommandError("git status --porcelain", 128, "fatal: not a git repository");
        }
    };
    FailingGit git;
    REQUIRE_THROWS_AS(collect_risk_snapshot(git, fs::temp_directory_path()), CommandError);
}
