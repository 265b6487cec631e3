#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <ostream>
#include <vector>

#include "config_utils.hpp"
#include "fix_engine.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Configure the logger from the config file and command line flags.
 *
 * Flags win over `logging.*` settings.
 */
void setup_logging(const LoggingOptions& flags, const fleetfix::LoggingConfig& cfg);

/**
 * @brief Print the status block for one repository.
 *
 * Reasons are sorted by name. Empty lists print `none`.
 */
void print_status(std::ostream& out, const fleetfix::FixRepoState& state,
                  const std::vector<fleetfix::FixAction>& actions);

/**
 * @brief Print a step event as `[status] id: summary`.
 */
void print_step(std::ostream& out, const fleetfix::StepEvent& event);

/**
 * @brief `fleetfix fix`: show a repository's status, plan or apply an action.
 *
 * @return `0` when the repository ends syncable (or a plan was printed), `1`
 *         when it is still unsyncable or the action is not eligible, `2` for
 *         invalid usage. Other failures propagate as exceptions.
 */
int run_fix(const Options& opts, fleetfix::FixEngine& engine, std::ostream& out,
            std::ostream& err);

/**
 * @brief `fleetfix list`: one line per loaded repository.
 */
int run_list(const Options& opts, fleetfix::FixEngine& engine, std::ostream& out);

} // namespace cli

#endif // CLI_COMMANDS_HPP
