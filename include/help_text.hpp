#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <string>

/** Usage text listing every option grouped by category. */
std::string help_text(const char* prog);

/** Print help_text() to stdout. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
