#include "test_common.hpp"
#include "arg_parser.hpp"
#include "options.hpp"

namespace {

/// Parse a fixed argument list with argv[0] = "fleetfix".
Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "fleetfix");
    std::vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());
    return parse_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional() == std::vector<std::string>{"pos"});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--unknown"});
}

TEST_CASE("ArgParser boolean flags never consume positionals") {
    const char* argv[] = {"prog", "--plan", "widget", "push"};
    ArgParser parser(4, const_cast<char**>(argv), {"--plan"});
    REQUIRE(parser.has_flag("--plan"));
    REQUIRE(parser.get_option("--plan").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"widget", "push"});
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val", "--flag=x"};
    ArgParser parser(3, const_cast<char**>(argv), {"--opt", "--flag"}, {"--opt"});
    REQUIRE(parser.get_option("--opt") == "val");
    REQUIRE(parser.get_option("--flag") == "x");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42", "-o", "7"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--opt"}, {"--opt"},
                     {{'h', "--help"}, {'o', "--opt"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_all_options("--opt") == std::vector<std::string>{"42", "7"});
    REQUIRE(parser.get_option("--opt") == "7");
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-abm", "msg"};
    ArgParser parser(3, const_cast<char**>(argv), {"--flag-a", "--flag-b", "--message"},
                     {"--message"}, {{'a', "--flag-a"}, {'b', "--flag-b"}, {'m', "--message"}});
    REQUIRE(parser.has_flag("--flag-a"));
    REQUIRE(parser.has_flag("--flag-b"));
    REQUIRE(parser.get_option("--message") == "msg");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser unknown and incomplete flags") {
    const char* argv[] = {"prog", "-x", "--foo", "--opt"};
    ArgParser parser(4, const_cast<char**>(argv), {"--bar", "--opt"}, {"--opt"},
                     {{'a', "--bar"}});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"-x", "--foo"});
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--opt"});
    REQUIRE_FALSE(parser.has_flag("--opt"));
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--", "--not-a-flag", "-x"};
    ArgParser parser(4, const_cast<char**>(argv), {"--bar"});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag", "-x"});
}

TEST_CASE("parse_options reads commands and selectors") {
    auto none = parse({});
    REQUIRE(none.command == Command::None);

    auto list = parse({"list", "-c", "code", "--catalog=oss"});
    REQUIRE(list.command == Command::List);
    REQUIRE(list.catalogs == std::vector<std::string>{"code", "oss"});

    auto status = parse({"fix", "code/widget"});
    REQUIRE(status.command == Command::Fix);
    REQUIRE(status.project == "code/widget");
    REQUIRE(status.action.empty());
    REQUIRE(status.refresh == fleetfix::RefreshMode::IfStale);

    auto apply = parse({"fix", "widget", "stage-commit-push", "-m", "save work", "--gitignore",
                        "dist/", "--gitignore", "node_modules/", "--no-refresh"});
    REQUIRE(apply.action == "stage-commit-push");
    REQUIRE(apply.commit_message == "save work");
    REQUIRE(apply.gitignore_patterns == std::vector<std::string>{"dist/", "node_modules/"});
    REQUIRE(apply.refresh == fleetfix::RefreshMode::Never);

    auto plan = parse({"fix", "--plan", "widget", "push", "--refresh"});
    REQUIRE(plan.plan_only);
    REQUIRE(plan.project == "widget");
    REQUIRE(plan.action == "push");
    REQUIRE(plan.refresh == fleetfix::RefreshMode::Always);

    REQUIRE(parse({"help"}).show_help);
    REQUIRE(parse({"-h"}).show_help);
    REQUIRE(parse({"--version"}).print_version);
}

TEST_CASE("parse_options reads logging flags") {
    auto opts = parse({"list", "--log-level", "debug", "--log-file", "/tmp/ff.log", "--json-log",
                       "-v"});
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.log_level_set);
    REQUIRE(opts.logging.log_file == "/tmp/ff.log");
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.verbose);
    REQUIRE_FALSE(parse({"list"}).logging.log_level_set);
}

TEST_CASE("parse_options rejects bad input") {
    REQUIRE_THROWS_WITH(parse({"sync"}), "unknown command \"sync\"");
    REQUIRE_THROWS_WITH(parse({"list", "extra"}), "unexpected argument \"extra\"");
    REQUIRE_THROWS_WITH(parse({"fix", "a", "push", "more"}), "unexpected argument \"more\"");
    REQUIRE_THROWS_WITH(parse({"fix", "--force"}), "unknown option --force");
    REQUIRE_THROWS_WITH(parse({"fix", "widget", "push", "--message"}),
                        "option --message requires a value");
    REQUIRE_THROWS_WITH(parse({"fix", "w", "push", "-m", "a", "-m", "b"}),
                        "--message may only be given once");
    REQUIRE_THROWS_WITH(parse({"fix", "w", "sync-with-upstream", "--sync-strategy", "squash"}),
                        "unsupported sync strategy \"squash\" (expected rebase or merge)");
    REQUIRE_THROWS_WITH(parse({"fix", "w", "create-project", "--visibility", "internal"}),
                        "invalid visibility \"internal\" (expected private or public)");
    REQUIRE_THROWS_WITH(parse({"list", "--refresh", "--no-refresh"}),
                        "--refresh and --no-refresh are mutually exclusive");
    REQUIRE_THROWS_WITH(parse({"list", "--plan"}), "fix options cannot be used with list");
    REQUIRE_THROWS_WITH(parse({"fix", "widget", "--plan"}), "--plan requires an action");
    REQUIRE_THROWS_WITH(parse({"list", "--log-level", "loud"}), "invalid log level \"loud\"");
}

TEST_CASE("CLI options map to non-interactive fix options") {
    auto opts = parse({"fix", "widget", "create-project", "--project-name", "Widget Tool",
                       "--visibility", "PUBLIC"});
    auto fix = to_fix_options(opts);
    REQUIRE_FALSE(fix.interactive);
    REQUIRE(fix.project_name == "Widget Tool");
    REQUIRE(fix.visibility == fleetfix::Visibility::Public);
    REQUIRE_FALSE(fix.sync_strategy);
    REQUIRE_FALSE(fix.generate_gitignore);

    auto sync = to_fix_options(parse({"fix", "w", "sync-with-upstream", "--sync-strategy", "merge"}));
    REQUIRE(sync.sync_strategy == fleetfix::SyncStrategy::Merge);
    REQUIRE_FALSE(sync.visibility);

    auto ignore = to_fix_options(parse({"fix", "w", "stage-commit-push", "--gitignore", "dist/"}));
    REQUIRE(ignore.generate_gitignore);
    REQUIRE(ignore.gitignore_patterns == std::vector<std::string>{"dist/"});
}
