#include "arg_parser.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include <algorithm>
#include <utility>

namespace argpars {

static bool is_reserved(const std::string& name) {
    return name == HELP_FLAG || name == HELP_SHORT_FLAG || name == VERSION_FLAG ||
           name == VERSION_SHORT_FLAG;
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty())
            out += ' ';
        out += s;
    }
    return out;
}

ArgParser::ArgParser(int argc, char* argv[], ParserConfig config) : config_(std::move(config)) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i])
            arguments_passed_.emplace_back(argv[i]);
    }
}

ArgParser::ArgParser(std::vector<std::string> args, ParserConfig config)
    : arguments_passed_(std::move(args)), config_(std::move(config)) {}

void ArgParser::add_argument(const std::string& name, const std::string& description) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        registry_[it->second].description = description;
        log_debug("Argument re-registered", {{"name", name}});
        return;
    }
    index_[name] = registry_.size();
    registry_.push_back({name, description});
    log_debug("Argument registered", {{"name", name}});
}

void ArgParser::add_arguments(const std::vector<ArgumentSpec>& table) {
    for (const auto& a : table)
        add_argument(a.name, a.description);
}

void ArgParser::add_help_section(const std::string& title, const std::string& content) {
    config_.sections.push_back({title, content});
}

bool ArgParser::no_arguments_passed() const { return arguments_passed_.size() <= 1; }

bool ArgParser::passed(const std::string& name) const {
    if (arguments_passed_.size() <= 1)
        return false;
    return std::find(arguments_passed_.begin() + 1, arguments_passed_.end(), name) !=
           arguments_passed_.end();
}

bool ArgParser::help_requested() const {
    return config_.default_arguments && (passed(HELP_FLAG) || passed(HELP_SHORT_FLAG));
}

bool ArgParser::version_requested() const {
    return config_.default_arguments && (passed(VERSION_FLAG) || passed(VERSION_SHORT_FLAG));
}

bool ArgParser::default_arguments_passed() const { return help_requested() || version_requested(); }

bool ArgParser::is_known(const std::string& name) const {
    if (index_.count(name))
        return true;
    return config_.default_arguments && is_reserved(name);
}

bool ArgParser::wrong_arguments_passed() const {
    for (size_t i = 1; i < arguments_passed_.size(); ++i) {
        if (!is_known(arguments_passed_[i]))
            return true;
    }
    return false;
}

std::vector<std::string> ArgParser::unknown_arguments() const {
    std::vector<std::string> unknown;
    for (size_t i = 1; i < arguments_passed_.size(); ++i) {
        if (!is_known(arguments_passed_[i]))
            unknown.push_back(arguments_passed_[i]);
    }
    return unknown;
}

std::string ArgParser::program_name() const {
    return arguments_passed_.empty() ? std::string() : arguments_passed_[0];
}

void ArgParser::display_help_screen(std::ostream& os) const { print_help(*this, os); }

void ArgParser::display_version_screen(std::ostream& os) const { print_version(*this, os); }

void ArgParser::display_error_message(std::ostream& os) const {
    std::vector<std::string> unknown = unknown_arguments();
    if (unknown.empty())
        return;
    print_unknown_option(*this, unknown.front(), os);
}

int ArgParser::pars(std::ostream& os) const {
    if (no_arguments_passed()) {
        log_debug("No arguments passed");
        return EXIT_OK;
    }
    std::vector<std::string> unknown = unknown_arguments();
    if (!unknown.empty()) {
        log_warning("Unknown arguments passed",
                    {{"program", program_name()}, {"arguments", join(unknown)}});
        return EXIT_WRONG_ARGUMENTS;
    }
    log_debug("Arguments accepted",
              {{"count", std::to_string(arguments_passed_.size() - 1)},
               {"defaults", default_arguments_passed() ? "true" : "false"}});
    if (help_requested())
        display_help_screen(os);
    if (version_requested())
        display_version_screen(os);
    return EXIT_OK;
}

} // namespace argpars
