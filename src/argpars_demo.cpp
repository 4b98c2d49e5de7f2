/**
 * @file argpars_demo.cpp
 * @brief Example program showing the argpars workflow.
 *
 * Registers a couple of flags, handles the no-argument, default-argument and
 * wrong-argument cases and leaves the exit code to ArgParser::pars(). When an
 * `argpars_demo.yaml` or `argpars_demo.json` file exists in the working
 * directory its metadata, flags and logging settings are loaded first.
 */

#include <filesystem>
#include <iostream>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "logger.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

static void print_stuff() { std::cout << "stuff\n"; }

static void print_arguments(const argpars::ArgParser& args) {
    for (size_t i = 1; i < args.arguments_passed().size(); ++i)
        std::cout << args.arguments_passed()[i] << "\n";
}

#ifndef ARGPARS_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        argpars::ParserDefinition def;
        def.config.usage = "Usage: {prog} [OPTION]...";
        def.config.name = "argpars demo";
        def.config.description = "Shows how flags are registered and queried";
        def.config.version = argpars::VERSION;
        for (const char* candidate : {"argpars_demo.yaml", "argpars_demo.json"}) {
            if (!fs::exists(candidate))
                continue;
            std::string err;
            if (!argpars::load_config(candidate, def, err)) {
                std::cerr << "Failed to load " << candidate << ": " << err << "\n";
                return 1;
            }
            break;
        }
        if (!def.logging.file.empty() && !argpars::apply_log_settings(def.logging)) {
            std::cerr << "Failed to start logging to " << def.logging.file << "\n";
            return 1;
        }

        argpars::ArgParser args(argc, argv, def.config);
        args.add_help_section("EXAMPLES:", "\t" + args.program_name() + " --print-stuff\n");
        args.add_argument("--print-stuff", "display \"stuff\"");
        args.add_argument("--print-args", "echo every argument passed");
        args.add_arguments(def.arguments);

        if (args.no_arguments_passed()) {
            args.display_help_screen();
        } else if (args.wrong_arguments_passed()) {
            args.display_error_message();
        } else if (!args.default_arguments_passed()) {
            if (args.passed("--print-stuff"))
                print_stuff();
            if (args.passed("--print-args"))
                print_arguments(args);
        }

        int rc = args.pars();
        argpars::shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // ARGPARS_NO_MAIN
