#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Outcome of an external command.
 */
struct CommandResult {
    int exit_code = -1;  ///< Exit status, 128+signal when killed, -1 if never started
    std::string output;  ///< Combined stdout and stderr
    bool ok() const { return exit_code == 0; }
};

/**
 * @brief Run a program and capture its combined output.
 *
 * The program is looked up on `PATH`. Standard input is connected to
 * `/dev/null` so the child can never block on a prompt. The call blocks until
 * the child exits.
 *
 * @param args Program name followed by its arguments.
 * @param cwd  Working directory for the child; empty keeps the current one.
 * @param env  Variables to set (or override) in the child's environment.
 */
CommandResult run_command(const std::vector<std::string>& args,
                          const std::filesystem::path& cwd = {},
                          const std::map<std::string, std::string>& env = {});

/**
 * @brief Render an argument vector as a shell-like string for messages.
 */
std::string join_command(const std::vector<std::string>& args);

} // namespace procutil

#endif // PROCESS_UTILS_HPP
