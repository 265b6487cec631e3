#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <string>
#include <vector>
#include "fix_action.hpp"
#include "logger.hpp"
#include "repo_scanner.hpp"

enum class Command { None, Fix, List };

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    bool log_level_set = false; ///< `--log-level` given, overriding the config
    std::string log_file;
    bool json_log = false;
    bool verbose = false;
};

/**
 * @brief Parsed command line.
 */
struct Options {
    Command command = Command::None;
    bool show_help = false;
    bool print_version = false;

    std::string project; ///< Path, repo key or name
    std::string action;  ///< Raw action name, empty shows status
    std::vector<std::string> catalogs;

    std::string commit_message;
    std::string sync_strategy;
    std::string project_name;
    std::string visibility;
    std::vector<std::string> gitignore_patterns;

    fleetfix::RefreshMode refresh = fleetfix::RefreshMode::IfStale;
    bool plan_only = false;
    std::string config_file;
    LoggingOptions logging;
};

/**
 * @brief Parse `argv` into @ref Options.
 *
 * @throws std::runtime_error for unknown commands or flags, missing values,
 *         surplus arguments and malformed enum values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Fix options for a non-interactive CLI run.
 */
fleetfix::FixOptions to_fix_options(const Options& opts);

#endif // OPTIONS_HPP
