#include "test_common.hpp"
#include "fakes.hpp"

using namespace fleetfix;
using namespace fleetfix::test_support;

TEST_CASE("CliGitClient reads repository state") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("git_client_state");
    fs::path remote = root / "remote.git";
    fs::path repo = root / "work";
    clone_with_remote(remote, repo);
    CliGitClient git;

    REQUIRE(git.is_git_repo(repo));
    REQUIRE_FALSE(git.is_git_repo(root));
    REQUIRE(git.remote_names(repo) == std::vector<std::string>{"origin"});
    REQUIRE(git.remote_url(repo, "origin") == remote.string());
    REQUIRE(git.remote_url(repo, "missing").empty());
    REQUIRE(git.current_branch(repo) == "main");
    REQUIRE(git.upstream(repo) == "origin/main");
    REQUIRE(git.head_sha(repo).size() == 40);
    REQUIRE(git.ref_sha(repo, "refs/remotes/origin/main") == git.head_sha(repo));
    REQUIRE(git.default_branch(repo, "origin") == "main");
    REQUIRE(git.operation(repo) == GitOperation::None);

    commit_file(repo, "a.txt", "a\n", "local");
    REQUIRE(git.ahead_behind(repo, "origin/main") == std::make_pair(1, 0));
    REQUIRE(git.ahead_behind(repo, "") == std::make_pair(0, 0));

    auto clean = git.worktree_state(repo);
    REQUIRE_FALSE(clean.dirty_tracked);
    REQUIRE_FALSE(clean.untracked);
    write_file(repo / "a.txt", "changed\n");
    write_file(repo / "new.txt", "n\n");
    auto dirty = git.worktree_state(repo);
    REQUIRE(dirty.dirty_tracked);
    REQUIRE(dirty.untracked);
    std::string status = git.status_porcelain(repo);
    REQUIRE(status.find(" M a.txt") != std::string::npos);
    REQUIRE(status.find("?? new.txt") != std::string::npos);
    REQUIRE(git.diff_numstat(repo, false).find("a.txt") != std::string::npos);
    FS_REMOVE_ALL(root);
}

TEST_CASE("CliGitClient mutations report failures") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("git_client_errors");
    fs::path repo = root / "work";
    init_repo(repo);
    commit_file(repo, "a.txt", "a\n", "init");
    CliGitClient git;

    try {
        git.push(repo);
        FAIL("expected CommandError");
    } catch (const CommandError& e) {
        REQUIRE(e.command() == "git push");
        REQUIRE(e.exit_code() != 0);
    }
    REQUIRE_THROWS_AS(git.abort_merge(repo), CommandError);
    git.add_remote(repo, "origin", "/nowhere.git");
    REQUIRE(git.remote_url(repo, "origin") == "/nowhere.git");
    git.set_remote_url(repo, "origin", "/elsewhere.git");
    REQUIRE(git.remote_url(repo, "origin") == "/elsewhere.git");
    REQUIRE_THROWS_AS(git.add_remote(repo, "origin", "/x.git"), CommandError);
    FS_REMOVE_ALL(root);
}

TEST_CASE("CliGitClient detects operations in progress") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("git_client_operation");
    fs::path repo = root / "work";
    init_repo(repo);
    commit_file(repo, "f.txt", "base\n", "base");
    REQUIRE(git_ok(repo, "checkout -b other"));
    commit_file(repo, "f.txt", "other\n", "other");
    REQUIRE(git_ok(repo, "checkout main"));
    commit_file(repo, "f.txt", "main\n", "main");
    REQUIRE_FALSE(git_ok(repo, "merge other"));

    CliGitClient git;
    REQUIRE(git.operation(repo) == GitOperation::Merge);
    git.abort_merge(repo);
    REQUIRE(git.operation(repo) == GitOperation::None);
    FS_REMOVE_ALL(root);
}

TEST_CASE("sync probes leave the working tree untouched") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("git_client_probe");
    fs::path remote = root / "remote.git";
    fs::path repo = root / "work";
    fs::path other = root / "other";
    clone_with_remote(remote, repo);
    REQUIRE(std::system(("git clone \"" + remote.string() + "\" \"" + other.string() + "\"" REDIR)
                            .c_str()) == 0);
    git_ok(other, "config user.email o@example.com");
    git_ok(other, "config user.name other");

    CliGitClient git;
    SECTION("disjoint changes are clean") {
        commit_file(other, "theirs.txt", "t\n", "theirs");
        REQUIRE(git_ok(other, "push origin main"));
        commit_file(repo, "mine.txt", "m\n", "mine");
        REQUIRE(git_ok(repo, "fetch"));
        std::string head = git.head_sha(repo);
        std::string detail;
        REQUIRE(git.probe_sync(repo, "origin/main", SyncStrategy::Rebase, &detail) ==
                ProbeOutcome::Clean);
        REQUIRE(git.probe_sync(repo, "origin/main", SyncStrategy::Merge, &detail) ==
                ProbeOutcome::Clean);
        REQUIRE(git.head_sha(repo) == head);
        REQUIRE(git.operation(repo) == GitOperation::None);
    }
    SECTION("overlapping edits conflict") {
        commit_file(other, "README.md", "theirs\n", "theirs");
        REQUIRE(git_ok(other, "push origin main"));
        commit_file(repo, "README.md", "mine\n", "mine");
        REQUIRE(git_ok(repo, "fetch"));
        REQUIRE(git.probe_sync(repo, "origin/main", SyncStrategy::Rebase, nullptr) ==
                ProbeOutcome::Conflict);
        REQUIRE(git.probe_sync(repo, "origin/main", SyncStrategy::Merge, nullptr) ==
                ProbeOutcome::Conflict);
        REQUIRE_FALSE(git.worktree_state(repo).dirty_tracked);
    }
    FS_REMOVE_ALL(root);
}

TEST_CASE("effective remote selection") {
    FakeGitClient git;
    git.remotes = {"fork", "origin", "upstream"};
    git.upstream_ref = "upstream/main";
    REQUIRE(effective_remote(git, "/r", "fork") == "fork");
    REQUIRE_THROWS_WITH(effective_remote(git, "/r", "nope"),
                        "preferred remote \"nope\" is not configured");
    REQUIRE(effective_remote(git, "/r", "") == "upstream");
    git.upstream_ref.clear();
    REQUIRE(effective_remote(git, "/r", "") == "origin");
    git.remotes = {"alpha", "zeta"};
    REQUIRE(effective_remote(git, "/r", "") == "alpha");
    git.remotes.clear();
    REQUIRE_THROWS(effective_remote(git, "/r", ""));
}

TEST_CASE("conflict output detection") {
    REQUIRE(output_indicates_conflict("CONFLICT (content): Merge conflict in a.txt"));
    REQUIRE(output_indicates_conflict("error: could not apply 1234abc... mine"));
    REQUIRE_FALSE(output_indicates_conflict("fatal: invalid upstream 'origin/nope'"));
}
