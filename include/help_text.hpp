#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <ostream>

/**
 * @brief Print usage, options grouped by category and the fix actions.
 */
void print_help(const char* prog, std::ostream& os);

#endif // HELP_TEXT_HPP
