#include "test_common.hpp"
#include "fakes.hpp"

using namespace fleetfix;
using namespace fleetfix::test_support;

TEST_CASE("push probe classification") {
    REQUIRE(classify_push_probe(0, "") == PushAccess::ReadWrite);
    REQUIRE(classify_push_probe(128, "ERROR: Permission to acme/widget.git denied to me.\n"
                                     "fatal: Could not read from remote repository.") ==
            PushAccess::ReadOnly);
    REQUIRE(classify_push_probe(128, "remote: Write access to repository not granted.") ==
            PushAccess::ReadOnly);
    REQUIRE(classify_push_probe(128, "The requested URL returned error: 403") ==
            PushAccess::ReadOnly);
    REQUIRE(classify_push_probe(128, "fatal: unable to access: Could not resolve host") ==
            PushAccess::Unknown);
}

TEST_CASE("push access probe uses the effective remote") {
    FakeGitClient git;
    GhCliGitHubClient github(git);

    auto rw = github.probe_push_access("/work/widget", "");
    REQUIRE(rw.access == PushAccess::ReadWrite);
    REQUIRE(rw.remote == "origin");
    REQUIRE(git.calls.back() == "push --dry-run origin HEAD:refs/heads/main");

    git.push_dry_run_exit = 128;
    git.push_dry_run_output = "fatal: unable to connect\nmore";
    auto unknown = github.probe_push_access("/work/widget", "");
    REQUIRE(unknown.access == PushAccess::Unknown);
    REQUIRE(unknown.error == "fatal: unable to connect");

    auto missing = github.probe_push_access("/work/widget", "fork");
    REQUIRE(missing.access == PushAccess::Unknown);
    REQUIRE(missing.error == "preferred remote \"fork\" is not configured");

    git.branch.clear();
    auto detached = github.probe_push_access("/work/widget", "");
    REQUIRE(detached.access == PushAccess::Unknown);
    REQUIRE(detached.error == "cannot probe push access without a checked-out branch");
}

TEST_CASE("test remote root stands in for GitHub") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("github_test_root");
    CliGitClient git;
    GhCliGitHubClient github(git, root);

    github.create_repo("me", "widget", Visibility::Private);
    REQUIRE(fs::is_directory(root / "me" / "widget.git"));
    REQUIRE_THROWS_WITH(github.create_repo("me", "widget", Visibility::Private),
                        "repository me/widget already exists");

    github.fork_repo(RemoteRepoRef{"me", "widget"}, "you");
    REQUIRE(fs::is_directory(root / "you" / "widget.git"));
    REQUIRE_NOTHROW(github.fork_repo(RemoteRepoRef{"me", "widget"}, "you"));
    REQUIRE_THROWS_AS(github.fork_repo(RemoteRepoRef{"nobody", "missing"}, "you"),
                      CommandError);
    FS_REMOVE_ALL(root);
}

TEST_CASE("push access against a local bare remote") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("github_probe_local");
    clone_with_remote(root / "remote.git", root / "work");
    CliGitClient git;
    GhCliGitHubClient github(git, root);
    auto result = github.probe_push_access(root / "work", "");
    REQUIRE(result.access == PushAccess::ReadWrite);
    REQUIRE(result.remote == "origin");
    FS_REMOVE_ALL(root);
}

TEST_CASE("gh fork targets the configured owner") {
    RemoteRepoRef source{"acme", "widget"};
    REQUIRE(gh_fork_command(source, "me", "me") ==
            std::vector<std::string>{"gh", "repo", "fork", "acme/widget", "--remote=false",
                                     "--clone=false"});
    REQUIRE(gh_fork_command(source, "Me", "me").size() == 6);
    REQUIRE(gh_fork_command(source, "tools-org", "me") ==
            std::vector<std::string>{"gh", "repo", "fork", "acme/widget", "--remote=false",
                                     "--clone=false", "--org", "tools-org"});
}

TEST_CASE("gh fork asks for the login once and passes the organisation") {
    fs::path dir = fresh_dir("github_fake_gh");
    fs::path bin = dir / "bin";
    fs::path log = dir / "gh.log";
    fs::create_directories(bin);
    write_file(bin / "gh", "#!/bin/sh\n"
                           "echo \"$*\" >> \"$FLEETFIX_GH_LOG\"\n"
                           "if [ \"$1 $2\" = \"api user\" ]; then echo me; fi\n"
                           "exit 0\n");
    fs::permissions(bin / "gh", fs::perms::owner_all, fs::perm_options::add);
    const char* old_path = std::getenv("PATH");
    std::string saved_path = old_path ? old_path : "";
    setenv("PATH", (bin.string() + ":" + saved_path).c_str(), 1);
    setenv("FLEETFIX_GH_LOG", log.string().c_str(), 1);

    FakeGitClient git;
    GhCliGitHubClient github(git);
    github.fork_repo(RemoteRepoRef{"acme", "widget"}, "tools-org");
    github.fork_repo(RemoteRepoRef{"acme", "gadget"}, "me");

    setenv("PATH", saved_path.c_str(), 1);
    unsetenv("FLEETFIX_GH_LOG");

    std::ifstream in(log);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);
    REQUIRE(lines == std::vector<std::string>{
                         "auth status", "api user --jq .login",
                         "repo fork acme/widget --remote=false --clone=false --org tools-org",
                         "repo fork acme/gadget --remote=false --clone=false"});
    FS_REMOVE_ALL(dir);
}
