#include "test_common.hpp"
#include "fakes.hpp"

using namespace fleetfix;
using fleetfix::test_support::make_record;

TEST_CASE("ReasonSet keeps first-seen order and ignores duplicates") {
    ReasonSet set;
    REQUIRE(set.add(UnsyncableReason::Diverged));
    REQUIRE(set.add(UnsyncableReason::DirtyTracked));
    REQUIRE_FALSE(set.add(UnsyncableReason::Diverged));
    REQUIRE(set.size() == 2);
    REQUIRE(set.items()[0] == UnsyncableReason::Diverged);
    REQUIRE(set.items()[1] == UnsyncableReason::DirtyTracked);
}

TEST_CASE("append_unsyncable_reason is idempotent") {
    RepositoryRecord once = make_record("alpha");
    RepositoryRecord twice = make_record("alpha");
    append_unsyncable_reason(once, UnsyncableReason::SyncConflict);
    append_unsyncable_reason(twice, UnsyncableReason::SyncConflict);
    append_unsyncable_reason(twice, UnsyncableReason::SyncConflict);
    REQUIRE(once.unsyncable_reasons == twice.unsyncable_reasons);
    REQUIRE_FALSE(twice.syncable);
    REQUIRE(once.state_hash == twice.state_hash);
}

TEST_CASE("evaluate_syncability orders reasons") {
    RepositoryRecord rec = make_record("alpha");
    rec.origin_url.clear();
    rec.upstream.clear();
    rec.has_dirty_tracked = true;
    rec.has_untracked = true;
    rec.operation = GitOperation::Rebase;
    evaluate_syncability(rec, SyncabilityPolicy{});
    std::vector<UnsyncableReason> expected{
        UnsyncableReason::MissingOrigin, UnsyncableReason::OperationInProgress,
        UnsyncableReason::DirtyTracked, UnsyncableReason::DirtyUntracked,
        UnsyncableReason::MissingUpstream};
    REQUIRE(rec.unsyncable_reasons.items() == expected);
    REQUIRE_FALSE(rec.syncable);
    REQUIRE(rec.state_hash.rfind("fnv1a64:", 0) == 0);
    REQUIRE(rec.state_hash.size() == 8 + 16);
}

TEST_CASE("untracked files only count when configured") {
    RepositoryRecord rec = make_record("alpha");
    rec.has_untracked = true;
    SyncabilityPolicy policy;
    policy.include_untracked_as_dirty = false;
    evaluate_syncability(rec, policy);
    REQUIRE(rec.syncable);
}

TEST_CASE("ahead branches respect push access and auto-push policy") {
    RepositoryRecord rec = make_record("alpha");
    rec.ahead = 1;
    SyncabilityPolicy policy;
    policy.default_branch = "main";

    SECTION("read-only access blocks") {
        policy.push_access = PushAccess::ReadOnly;
        policy.auto_push = AutoPushMode::IncludeDefaultBranch;
        evaluate_syncability(rec, policy);
        REQUIRE(rec.unsyncable_reasons.contains(UnsyncableReason::PushAccessBlocked));
        REQUIRE_FALSE(rec.unsyncable_reasons.contains(UnsyncableReason::PushPolicyBlocked));
    }
    SECTION("enabled excludes the default branch") {
        policy.auto_push = AutoPushMode::Enabled;
        evaluate_syncability(rec, policy);
        REQUIRE(rec.unsyncable_reasons.contains(UnsyncableReason::PushPolicyBlocked));
    }
    SECTION("enabled allows feature branches") {
        policy.auto_push = AutoPushMode::Enabled;
        rec.branch = "feature";
        evaluate_syncability(rec, policy);
        REQUIRE(rec.syncable);
    }
    SECTION("include-default-branch allows main") {
        policy.auto_push = AutoPushMode::IncludeDefaultBranch;
        evaluate_syncability(rec, policy);
        REQUIRE(rec.syncable);
    }
}

TEST_CASE("default branch falls back to main and master") {
    REQUIRE(is_default_branch("main", ""));
    REQUIRE(is_default_branch("master", ""));
    REQUIRE_FALSE(is_default_branch("develop", ""));
    REQUIRE(is_default_branch("develop", "develop"));
    REQUIRE_FALSE(is_default_branch("main", "develop"));
    REQUIRE_FALSE(is_default_branch("", "main"));
}

TEST_CASE("state hash changes with observable fields") {
    RepositoryRecord a = make_record("alpha");
    RepositoryRecord b = make_record("alpha");
    REQUIRE(compute_state_hash(a) == compute_state_hash(b));
    b.behind = 3;
    REQUIRE(compute_state_hash(a) != compute_state_hash(b));
}

TEST_CASE("repo keys reject empty and dot segments") {
    auto key = parse_repo_key("code/team/app");
    REQUIRE(key);
    REQUIRE(key->catalog == "code");
    REQUIRE(key->relative_path == "team/app");
    std::string err;
    REQUIRE_FALSE(parse_repo_key("code", &err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(parse_repo_key("code/a//b"));
    REQUIRE_FALSE(parse_repo_key("code/../b"));
    REQUIRE_FALSE(parse_repo_key("code/./b"));
    REQUIRE(make_repo_key("code", fs::path("team") / "app") == "code/team/app");
}

TEST_CASE("select_catalogs filters by name") {
    MachineSnapshot m;
    m.catalogs = {{"code", "/code", 1}, {"work", "/work", 2}};
    REQUIRE(select_catalogs(m, {}).size() == 2);
    auto one = select_catalogs(m, {"work", "work"});
    REQUIRE(one.size() == 1);
    REQUIRE(one[0].repo_path_depth == 2);
    try {
        select_catalogs(m, {"missing"});
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "invalid catalog \"missing\"");
    }
}

TEST_CASE("enum names round trip through their parsers") {
    REQUIRE(parse_sync_strategy("") == SyncStrategy::Rebase);
    REQUIRE(parse_sync_strategy("MERGE") == SyncStrategy::Merge);
    REQUIRE_THROWS_AS(parse_sync_strategy("squash"), std::runtime_error);
    REQUIRE(parse_auto_push_mode("include-default-branch") == AutoPushMode::IncludeDefaultBranch);
    REQUIRE(parse_push_access("read-only") == PushAccess::ReadOnly);
    REQUIRE_FALSE(parse_push_access("sometimes"));
    REQUIRE(parse_unsyncable_reason("sync_probe_failed") == UnsyncableReason::SyncProbeFailed);
    REQUIRE(parse_git_operation("cherry-pick") == GitOperation::CherryPick);
    REQUIRE_FALSE(parse_visibility("internal"));
}
