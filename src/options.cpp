#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"

namespace {

void require_single(const ArgParser& parser, const std::string& flag) {
    if (parser.get_all_options(flag).size() > 1)
        throw std::runtime_error(flag + " may only be given once");
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known{"--help",          "--version",      "--catalog",
                                      "--message",       "--sync-strategy", "--project-name",
                                      "--visibility",    "--gitignore",    "--no-refresh",
                                      "--refresh",       "--plan",         "--config",
                                      "--verbose",       "--log-file",     "--log-level",
                                      "--json-log"};
    const std::set<std::string> values{"--catalog",    "--message",      "--sync-strategy",
                                       "--project-name", "--visibility", "--gitignore",
                                       "--config",     "--log-file",     "--log-level"};
    const std::map<char, std::string> shorts{{'h', "--help"},    {'V', "--version"},
                                             {'c', "--catalog"}, {'m', "--message"},
                                             {'v', "--verbose"}};
    ArgParser parser(argc, argv, known, values, shorts);

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("unknown option " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error("option " + parser.missing_values().front() +
                                 " requires a value");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    const auto& pos = parser.positional();
    if (!pos.empty()) {
        if (pos[0] == "fix")
            opts.command = Command::Fix;
        else if (pos[0] == "list")
            opts.command = Command::List;
        else if (pos[0] == "help")
            opts.show_help = true;
        else
            throw std::runtime_error("unknown command \"" + pos[0] + "\"");
    }
    const size_t max_args = opts.command == Command::Fix ? 3 : 1;
    if (pos.size() > max_args)
        throw std::runtime_error("unexpected argument \"" + pos[max_args] + "\"");
    if (opts.command == Command::Fix) {
        if (pos.size() > 1)
            opts.project = pos[1];
        if (pos.size() > 2)
            opts.action = pos[2];
    }

    for (const char* flag : {"--message", "--sync-strategy", "--project-name", "--visibility",
                             "--config", "--log-file", "--log-level"})
        require_single(parser, flag);

    opts.catalogs = parser.get_all_options("--catalog");
    opts.commit_message = parser.get_option("--message");
    opts.sync_strategy = parser.get_option("--sync-strategy");
    if (!opts.sync_strategy.empty())
        fleetfix::parse_sync_strategy(opts.sync_strategy);
    opts.project_name = parser.get_option("--project-name");
    opts.visibility = parser.get_option("--visibility");
    if (!opts.visibility.empty() && !fleetfix::parse_visibility(opts.visibility))
        throw std::runtime_error("invalid visibility \"" + opts.visibility +
                                 "\" (expected private or public)");
    opts.gitignore_patterns = parser.get_all_options("--gitignore");

    if (parser.has_flag("--no-refresh") && parser.has_flag("--refresh"))
        throw std::runtime_error("--refresh and --no-refresh are mutually exclusive");
    if (parser.has_flag("--no-refresh"))
        opts.refresh = fleetfix::RefreshMode::Never;
    else if (parser.has_flag("--refresh"))
        opts.refresh = fleetfix::RefreshMode::Always;
    opts.plan_only = parser.has_flag("--plan");
    opts.config_file = parser.get_option("--config");

    opts.logging.verbose = parser.has_flag("--verbose");
    opts.logging.json_log = parser.has_flag("--json-log");
    opts.logging.log_file = parser.get_option("--log-file");
    if (parser.has_flag("--log-level")) {
        if (!parse_log_level(parser.get_option("--log-level"), opts.logging.log_level))
            throw std::runtime_error("invalid log level \"" + parser.get_option("--log-level") +
                                     "\"");
        opts.logging.log_level_set = true;
    }

    if (opts.command != Command::Fix) {
        const bool fix_only = !opts.commit_message.empty() || !opts.sync_strategy.empty() ||
                              !opts.project_name.empty() || !opts.visibility.empty() ||
                              !opts.gitignore_patterns.empty() || opts.plan_only;
        if (fix_only && opts.command == Command::List)
            throw std::runtime_error("fix options cannot be used with list");
    }
    if (opts.plan_only && opts.action.empty() && opts.command == Command::Fix)
        throw std::runtime_error("--plan requires an action");
    return opts;
}

fleetfix::FixOptions to_fix_options(const Options& opts) {
    fleetfix::FixOptions fix;
    fix.interactive = false;
    fix.commit_message = opts.commit_message;
    if (!opts.sync_strategy.empty())
        fix.sync_strategy = fleetfix::parse_sync_strategy(opts.sync_strategy);
    fix.project_name = opts.project_name;
    if (!opts.visibility.empty())
        fix.visibility = fleetfix::parse_visibility(opts.visibility);
    fix.gitignore_patterns = opts.gitignore_patterns;
    fix.generate_gitignore = !opts.gitignore_patterns.empty();
    return fix;
}
