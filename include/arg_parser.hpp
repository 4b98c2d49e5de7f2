#ifndef ARGPARS_ARG_PARSER_HPP
#define ARGPARS_ARG_PARSER_HPP
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace argpars {

/// Reserved flags recognized without registration while default arguments are enabled.
constexpr const char* HELP_FLAG = "--help";
constexpr const char* HELP_SHORT_FLAG = "-h";
constexpr const char* VERSION_FLAG = "--version";
constexpr const char* VERSION_SHORT_FLAG = "-v";

/// Exit codes returned by ArgParser::pars().
constexpr int EXIT_OK = 0;
constexpr int EXIT_WRONG_ARGUMENTS = 1;

/** @brief A registered flag and the text shown for it on the help screen. */
struct ArgumentSpec {
    std::string name;
    std::string description;
};

/** @brief Free-text block printed after the option list. */
struct HelpSection {
    std::string title;
    std::string content;
};

/**
 * @brief Help metadata and parser switches supplied at construction.
 *
 * Every text field defaults to empty and renders as an empty line. The
 * placeholder `{prog}` inside @ref usage is replaced with the program name.
 */
struct ParserConfig {
    std::string usage;
    std::string name;
    std::string description;
    std::string version;
    std::vector<HelpSection> sections;
    bool default_arguments = true; ///< Recognize and act on --help/-h and --version/-v
};

/**
 * @brief Flag-presence command line parser.
 *
 * The argument vector is copied once at construction and never changes
 * afterwards, so every query is consistent within a run. Tokens are matched
 * by exact, case-sensitive string comparison against the registered names
 * and the reserved help/version flags. No token takes a value.
 *
 * The parser is not thread-safe. Finish all add_argument() and
 * add_help_section() calls before issuing queries and do not share an
 * instance between threads while it is being modified.
 */
class ArgParser {
    std::vector<std::string> arguments_passed_; ///< Raw argv, index 0 is the program
    std::vector<ArgumentSpec> registry_;        ///< Registered flags in first-added order
    std::map<std::string, size_t> index_;       ///< Flag name to position in registry_
    ParserConfig config_;

  public:
    /**
     * @brief Capture the command line passed to `main`.
     *
     * @param argc   Argument count from `main`.
     * @param argv   Argument vector from `main`.
     * @param config Help metadata and parser switches.
     */
    ArgParser(int argc, char* argv[], ParserConfig config = {});

    /**
     * @brief Capture an already collected argument vector.
     *
     * @param args   Arguments including the program name at index 0.
     * @param config Help metadata and parser switches.
     */
    explicit ArgParser(std::vector<std::string> args, ParserConfig config = {});

    /**
     * @brief Register a flag.
     *
     * Registering a name twice keeps its original position on the help
     * screen and replaces the description.
     *
     * @param name        Exact token, normally starting with `-` or `--`.
     * @param description Text shown next to the flag on the help screen.
     */
    void add_argument(const std::string& name, const std::string& description);

    /** @brief Register every entry of @p table in order. */
    void add_arguments(const std::vector<ArgumentSpec>& table);

    /** @brief Append a titled block to the help screen. */
    void add_help_section(const std::string& title, const std::string& content);

    /** @return `true` if nothing but the program name was passed. */
    bool no_arguments_passed() const;

    /**
     * @brief Check whether a token appears after the program name.
     *
     * @param name Token to look for. It does not need to be registered.
     */
    bool passed(const std::string& name) const;

    /** @return `true` if the help or version flag was passed. */
    bool default_arguments_passed() const;

    /** @return `true` if any token is neither registered nor reserved. */
    bool wrong_arguments_passed() const;

    /** @return `true` if `--help` or `-h` was passed and defaults are enabled. */
    bool help_requested() const;

    /** @return `true` if `--version` or `-v` was passed and defaults are enabled. */
    bool version_requested() const;

    /** @return Unrecognized tokens in the order they were passed. */
    std::vector<std::string> unknown_arguments() const;

    /** @return Whether @p name is registered or a reserved default flag. */
    bool is_known(const std::string& name) const;

    /** @brief Print the usage, description, options, sections and version. */
    void display_help_screen(std::ostream& os = std::cout) const;

    /** @brief Print `<name> version: <version>`. */
    void display_version_screen(std::ostream& os = std::cout) const;

    /**
     * @brief Report the first unrecognized token.
     *
     * Prints nothing when every token is recognized.
     */
    void display_error_message(std::ostream& os = std::cerr) const;

    /**
     * @brief Finish the run and choose the process exit code.
     *
     * Returns EXIT_WRONG_ARGUMENTS when an unrecognized token was passed.
     * Otherwise prints the help and/or version screen when requested and
     * returns EXIT_OK.
     */
    int pars(std::ostream& os = std::cout) const;

    /** @return Program name from index 0, or an empty string. */
    std::string program_name() const;

    /** @return The captured argument vector. */
    const std::vector<std::string>& arguments_passed() const { return arguments_passed_; }

    /** @return Registered flags in registration order. */
    const std::vector<ArgumentSpec>& arguments() const { return registry_; }

    /** @return Help metadata and switches. */
    const ParserConfig& config() const { return config_; }
};

} // namespace argpars

#endif // ARGPARS_ARG_PARSER_HPP
