#include "test_common.hpp"
#include "fakes.hpp"
#include "cli_commands.hpp"
#include <algorithm>
#include <sstream>

using namespace fleetfix;
using namespace fleetfix::test_support;

namespace {

/// Config, state and a `code` catalog under one temp root.
StatePaths write_fleet_config(const fs::path& root) {
    StatePaths paths = temp_state_paths(root);
    fs::create_directories(root / "code");
    write_file(paths.config_file(), "github:\n"
                                    "  owner: me\n"
                                    "  remote_url_template: \"" +
                                        (root / "remotes").string() +
                                        "/${owner}/${repo}.git\"\n"
                                        "catalogs:\n"
                                        "  - name: code\n"
                                        "    root: \"" +
                                        (root / "code").string() + "\"\n");
    return paths;
}

Options fix_options(const std::string& project, const std::string& action) {
    Options opts;
    opts.command = Command::Fix;
    opts.project = project;
    opts.action = action;
    opts.refresh = RefreshMode::Always;
    return opts;
}

} // namespace

TEST_CASE("push makes an ahead repository syncable") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScopedEnv id("FLEETFIX_MACHINE_ID", "e2e");
    fs::path root = fresh_dir("e2e_push");
    StatePaths paths = write_fleet_config(root);
    clone_with_remote(root / "remotes" / "me" / "widget.git", root / "code" / "widget");
    commit_file(root / "code" / "widget", "feature.txt", "f\n", "feature");

    FileStateStore store(paths);
    CliGitClient git;
    GhCliGitHubClient github(git, root / "remotes");
    FixEngine engine(git, github, store);
    std::ostringstream out, err;

    REQUIRE(cli::run_fix(fix_options("widget", ""), engine, out, err) == 1);
    REQUIRE(out.str().find("reasons: push_policy_blocked\n") != std::string::npos);
    REQUIRE(out.str().find("actions: push, enable-auto-push\n") != std::string::npos);

    out.str("");
    REQUIRE(cli::run_fix(fix_options("code/widget", "push"), engine, out, err) == 0);
    REQUIRE(out.str().find("[done] push-main: git push\n") != std::string::npos);
    REQUIRE(out.str().find("syncable: true\n") != std::string::npos);
    REQUIRE(err.str().empty());
    REQUIRE(git.ahead_behind(root / "code" / "widget", "origin/main") == std::make_pair(0, 0));

    auto meta = store.load_repo_metadata("code/widget");
    REQUIRE(meta);
    REQUIRE(meta->push_access == PushAccess::ReadWrite);
    REQUIRE(fs::exists(paths.machines_dir() / "e2e.yaml"));
    REQUIRE_FALSE(fs::exists(paths.lock_file()));
    FS_REMOVE_ALL(root);
}

TEST_CASE("create-project publishes a repository without origin") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScopedEnv id("FLEETFIX_MACHINE_ID", "e2e");
    fs::path root = fresh_dir("e2e_create");
    StatePaths paths = write_fleet_config(root);
    fs::path repo = root / "code" / "gadget";
    init_repo(repo);
    commit_file(repo, "main.c", "int main(void) { return 0; }\n", "init");

    FileStateStore store(paths);
    CliGitClient git;
    GhCliGitHubClient github(git, root / "remotes");
    FixEngine engine(git, github, store);
    std::ostringstream out, err;

    Options opts = fix_options(repo.string(), "create-project");
    opts.visibility = "public";
    int rc = cli::run_fix(opts, engine, out, err);
    INFO(out.str() << err.str());
    REQUIRE(rc == 0);

    fs::path remote = root / "remotes" / "me" / "gadget.git";
    REQUIRE(fs::is_directory(remote));
    REQUIRE(git.remote_url(repo, "origin") == remote.string());
    REQUIRE(git.upstream(repo) == "origin/main");
    REQUIRE(git.ref_sha(repo, "refs/remotes/origin/main") == git.head_sha(repo));

    auto meta = store.load_repo_metadata("code/gadget");
    REQUIRE(meta);
    REQUIRE(meta->origin_url == remote.string());
    REQUIRE(meta->visibility == Visibility::Public);
    REQUIRE(meta->auto_push == AutoPushMode::Disabled);
    FS_REMOVE_ALL(root);
}

TEST_CASE("read-only repositories are offered fork instead of push") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScopedEnv id("FLEETFIX_MACHINE_ID", "e2e");
    fs::path root = fresh_dir("e2e_readonly");
    StatePaths paths = write_fleet_config(root);
    fs::path repo = root / "code" / "widget";
    clone_with_remote(root / "remotes" / "acme" / "widget.git", repo);
    commit_file(repo, "local.txt", "l\n", "local");

    FileStateStore store(paths);
    CliGitClient git;
    FakeGitHubClient github;
    github.probe_result = PushAccess::ReadOnly;
    FixEngine engine(git, github, store);

    auto repos = engine.load_fix_repos({}, RefreshMode::Always);
    REQUIRE(repos.size() == 1);
    const auto& state = repos[0];
    REQUIRE(state.metadata);
    REQUIRE(state.metadata->push_access == PushAccess::ReadOnly);
    auto actions = engine.eligible_actions(state);
    REQUIRE(std::find(actions.begin(), actions.end(), FixAction::ForkAndRetarget) !=
            actions.end());
    REQUIRE(std::find(actions.begin(), actions.end(), FixAction::Push) == actions.end());

    std::ostringstream out, err;
    REQUIRE(cli::run_fix(fix_options("widget", "push"), engine, out, err) == 1);
    REQUIRE(err.str() == "action \"push\" is not eligible for widget\n");
    REQUIRE(git.ahead_behind(repo, "origin/main") == std::make_pair(1, 0));
    FS_REMOVE_ALL(root);
}
