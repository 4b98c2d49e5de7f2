#ifndef ARGPARS_HELP_TEXT_HPP
#define ARGPARS_HELP_TEXT_HPP

#include <iosfwd>
#include <string>

namespace argpars {

class ArgParser;

/**
 * @brief Write the help screen for @p parser to @p os.
 *
 * Layout: usage, blank line, name, description, the option table with the
 * reserved flags first, help sections and finally the version line.
 */
void print_help(const ArgParser& parser, std::ostream& os);

/** @brief Write `<name> version: <version>` to @p os. */
void print_version(const ArgParser& parser, std::ostream& os);

/** @brief Write the no-such-option message for @p option to @p os. */
void print_unknown_option(const ArgParser& parser, const std::string& option, std::ostream& os);

/** @brief Replace every `{prog}` in @p usage with @p prog. */
std::string expand_usage(const std::string& usage, const std::string& prog);

} // namespace argpars

#endif // ARGPARS_HELP_TEXT_HPP
