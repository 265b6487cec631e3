/**
 * @file fleetfix.cpp
 * @brief CLI entry point for inspecting and repairing unsyncable repositories.
 */

#include <filesystem>
#include <iostream>
#include <optional>

#include "cli_commands.hpp"
#include "git_client.hpp"
#include "git_utils.hpp"
#include "github_client.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "state_store.hpp"
#include "system_utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

/**
 * @brief Application entry point.
 *
 * @return Exit code of the command; 2 for usage errors and failures.
 */
#ifndef FLEETFIX_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    int rc = 2;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0], std::cout);
            return 0;
        }
        if (opts.print_version) {
            std::cout << FLEETFIX_VERSION << "\n";
            return 0;
        }
        if (opts.command == Command::None) {
            print_help(argv[0], std::cerr);
            return 2;
        }

        fleetfix::FileStateStore store(fleetfix::StatePaths::from_environment(),
                                       opts.config_file);
        fleetfix::AppConfig cfg = store.load_config();
        cli::setup_logging(opts.logging, cfg.logging);

        std::optional<fs::path> test_root;
        auto remote_root = procutil::safe_getenv("FLEETFIX_TEST_REMOTE_ROOT");
        if (remote_root && !remote_root->empty())
            test_root = fs::path(*remote_root);
        fleetfix::CliGitClient git;
        fleetfix::GhCliGitHubClient github(git, test_root);
        fleetfix::FixEngine engine(git, github, store);

        if (opts.command == Command::Fix)
            rc = cli::run_fix(opts, engine, std::cout, std::cerr);
        else
            rc = cli::run_list(opts, engine, std::cout);
    } catch (const std::exception& e) {
        log_error("command failed", e.what());
        std::cerr << "fleetfix: " << e.what() << "\n";
        rc = 2;
    }
    shutdown_logger();
    return rc;
}
#endif // FLEETFIX_NO_MAIN
