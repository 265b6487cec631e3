#include "test_common.hpp"
#include "process_utils.hpp"
#include <cstdlib>
#include <thread>
#include <vector>

TEST_CASE("run_command captures output and exit code") {
    auto ok = procutil::run_command({"sh", "-c", "echo out; echo err 1>&2"});
    REQUIRE(ok.ok());
    REQUIRE(ok.output.find("out\n") != std::string::npos);
    REQUIRE(ok.output.find("err\n") != std::string::npos);

    auto failed = procutil::run_command({"sh", "-c", "exit 3"});
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.exit_code == 3);
}

TEST_CASE("run_command honours cwd and environment") {
    fs::path dir = fleetfix::test_support::fresh_dir("process_cwd");
    auto res = procutil::run_command({"sh", "-c", "pwd; printf '%s' \"$FLEETFIX_VALUE\""}, dir,
                                     {{"FLEETFIX_VALUE", "set"}, {"LC_ALL", "C"}});
    REQUIRE(res.ok());
    REQUIRE(res.output.find(fs::canonical(dir).string()) != std::string::npos);
    REQUIRE(res.output.find("set") != std::string::npos);

    auto missing_dir = procutil::run_command({"true"}, dir / "missing");
    REQUIRE(missing_dir.exit_code == 126);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_command environment overrides stay in the child") {
    setenv("FLEETFIX_INHERITED", "parent", 1);
    setenv("FLEETFIX_REPLACED", "parent", 1);
    auto res = procutil::run_command(
        {"sh", "-c", "printf '%s %s' \"$FLEETFIX_INHERITED\" \"$FLEETFIX_REPLACED\"; env | "
                     "grep -c '^FLEETFIX_REPLACED='"},
        {}, {{"FLEETFIX_REPLACED", "child"}});
    REQUIRE(res.ok());
    REQUIRE(res.output == "parent child1\n");
    REQUIRE(std::string(std::getenv("FLEETFIX_REPLACED")) == "parent");
    unsetenv("FLEETFIX_INHERITED");
    unsetenv("FLEETFIX_REPLACED");
}

TEST_CASE("run_command works from several threads at once") {
    std::vector<int> codes(8, -1);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < codes.size(); ++i) {
        threads.emplace_back([&codes, i] {
            codes[i] = procutil::run_command({"sh", "-c", "exit $N"}, {},
                                             {{"N", std::to_string(i)}})
                           .exit_code;
        });
    }
    for (auto& t : threads)
        t.join();
    for (size_t i = 0; i < codes.size(); ++i)
        REQUIRE(codes[i] == static_cast<int>(i));
}

TEST_CASE("run_command never reads the terminal") {
    auto res = procutil::run_command({"sh", "-c", "read line; echo \"got:$line\""});
    REQUIRE(res.output == "got:\n");
}

TEST_CASE("run_command reports missing programs and signals") {
    auto missing = procutil::run_command({"fleetfix-no-such-program"});
    REQUIRE(missing.exit_code == 127);

    auto killed = procutil::run_command({"sh", "-c", "kill -TERM $$"});
    REQUIRE(killed.exit_code == 128 + 15);

    auto empty = procutil::run_command({});
    REQUIRE(empty.exit_code == -1);
    REQUIRE(empty.output == "empty command");
}

TEST_CASE("join_command quotes arguments with spaces") {
    REQUIRE(procutil::join_command({"git", "commit", "-m", "save work"}) ==
            "git commit -m \"save work\"");
    REQUIRE(procutil::join_command({"git", "push"}) == "git push");
    REQUIRE(procutil::join_command({"echo", ""}) == "echo \"\"");
    REQUIRE(procutil::join_command({}).empty());
}
