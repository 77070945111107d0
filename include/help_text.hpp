#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <ostream>

/**
 * @brief Print usage information grouped by category.
 */
void print_help(const char* prog, std::ostream& out);

#endif // HELP_TEXT_HPP
