#include "test_common.hpp"

TEST_CASE("ArgParser program name only") {
    const char* argv[] = {"prog"};
    ArgParser parser(1, const_cast<char**>(argv));
    REQUIRE(parser.no_arguments_passed());
    REQUIRE_FALSE(parser.default_arguments_passed());
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser empty argument vector") {
    ArgParser parser(0, nullptr);
    REQUIRE(parser.no_arguments_passed());
    REQUIRE(parser.program_name().empty());
    REQUIRE_FALSE(parser.passed("--help"));
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
}

TEST_CASE("ArgParser help flag is a default argument") {
    const char* argv[] = {"prog", "--help"};
    ArgParser parser(2, const_cast<char**>(argv), ParserConfig{"Usage: prog", "App", "", "v1"});
    REQUIRE_FALSE(parser.no_arguments_passed());
    REQUIRE(parser.default_arguments_passed());
    REQUIRE(parser.help_requested());
    REQUIRE_FALSE(parser.version_requested());
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    REQUIRE(out.str().rfind("Usage: prog\n", 0) == 0);
}

TEST_CASE("ArgParser short default flags") {
    const char* argv[] = {"prog", "-h", "-v"};
    ArgParser parser(3, const_cast<char**>(argv));
    REQUIRE(parser.help_requested());
    REQUIRE(parser.version_requested());
    REQUIRE(parser.default_arguments_passed());
    REQUIRE_FALSE(parser.wrong_arguments_passed());
}

TEST_CASE("ArgParser version flag prints version screen") {
    const char* argv[] = {"prog", "--version"};
    ParserConfig cfg;
    cfg.name = "Test App";
    cfg.version = "v1.0";
    ArgParser parser(2, const_cast<char**>(argv), cfg);
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    REQUIRE(out.str() == "Test App version: v1.0\n");
}

TEST_CASE("ArgParser registered flag is passed") {
    const char* argv[] = {"prog", "--print-stuff"};
    ArgParser parser(2, const_cast<char**>(argv));
    parser.add_argument("--print-stuff", "display stuff");
    REQUIRE(parser.passed("--print-stuff"));
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    REQUIRE_FALSE(parser.default_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser unknown flag fails") {
    const char* argv[] = {"prog", "--bogus"};
    ArgParser parser(2, const_cast<char**>(argv));
    parser.add_argument("--print-stuff", "display stuff");
    REQUIRE(parser.wrong_arguments_passed());
    REQUIRE_FALSE(parser.passed("--print-stuff"));
    REQUIRE(parser.unknown_arguments() == std::vector<std::string>{"--bogus"});
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_WRONG_ARGUMENTS);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser unknown flag alongside help") {
    const char* argv[] = {"prog", "--help", "--bogus"};
    ArgParser parser(3, const_cast<char**>(argv));
    REQUIRE(parser.default_arguments_passed());
    REQUIRE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_WRONG_ARGUMENTS);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser positional tokens are unknown") {
    const char* argv[] = {"prog", "--a", "file.txt"};
    ArgParser parser(3, const_cast<char**>(argv));
    parser.add_argument("--a", "first");
    REQUIRE(parser.wrong_arguments_passed());
    REQUIRE(parser.unknown_arguments() == std::vector<std::string>{"file.txt"});
}

TEST_CASE("ArgParser matching is exact") {
    const char* argv[] = {"prog", "--Print", "--pri", "--print=1"};
    ArgParser parser(4, const_cast<char**>(argv));
    parser.add_argument("--print", "print");
    REQUIRE_FALSE(parser.passed("--print"));
    REQUIRE(parser.unknown_arguments().size() == 3);
}

TEST_CASE("ArgParser passed does not require registration") {
    const char* argv[] = {"prog", "--anything"};
    ArgParser parser(2, const_cast<char**>(argv));
    REQUIRE(parser.passed("--anything"));
    REQUIRE_FALSE(parser.passed("prog"));
    REQUIRE(parser.wrong_arguments_passed());
}

TEST_CASE("ArgParser input order does not change help order") {
    ArgParser parser(std::vector<std::string>{"prog", "--b", "--a"});
    parser.add_argument("--a", "first");
    parser.add_argument("--b", "second");
    REQUIRE(parser.passed("--a"));
    REQUIRE(parser.passed("--b"));
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    parser.display_help_screen(out);
    std::string text = out.str();
    REQUIRE(text.find("--a") != std::string::npos);
    REQUIRE(text.find("--a") < text.find("--b"));
}

TEST_CASE("ArgParser duplicate registration keeps position") {
    ArgParser parser(std::vector<std::string>{"prog"});
    parser.add_argument("--a", "old");
    parser.add_argument("--b", "second");
    parser.add_argument("--a", "new");
    REQUIRE(parser.arguments().size() == 2);
    REQUIRE(parser.arguments()[0].name == "--a");
    REQUIRE(parser.arguments()[0].description == "new");
    REQUIRE(parser.arguments()[1].name == "--b");
}

TEST_CASE("ArgParser add_arguments registers in order") {
    ArgParser parser(std::vector<std::string>{"prog", "--two"});
    parser.add_arguments({{"--one", "1"}, {"--two", "2"}});
    REQUIRE(parser.arguments().size() == 2);
    REQUIRE(parser.arguments()[1].name == "--two");
    REQUIRE(parser.is_known("--one"));
    REQUIRE_FALSE(parser.wrong_arguments_passed());
}

TEST_CASE("ArgParser disabled default arguments") {
    ParserConfig cfg;
    cfg.default_arguments = false;
    ArgParser parser(std::vector<std::string>{"prog", "--help"}, cfg);
    REQUIRE_FALSE(parser.default_arguments_passed());
    REQUIRE_FALSE(parser.help_requested());
    REQUIRE(parser.passed("--help"));
    REQUIRE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_WRONG_ARGUMENTS);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser disabled defaults allow registering help") {
    ParserConfig cfg;
    cfg.default_arguments = false;
    ArgParser parser(std::vector<std::string>{"prog", "--help"}, cfg);
    parser.add_argument("--help", "custom help");
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    REQUIRE(out.str().empty());
}

TEST_CASE("ArgParser registering help with defaults enabled lists it twice") {
    ArgParser parser(std::vector<std::string>{"prog", "--help"});
    parser.add_argument("--help", "custom");
    REQUIRE(parser.arguments().size() == 1);
    REQUIRE(parser.is_known("--help"));
    REQUIRE(parser.help_requested());
    REQUIRE_FALSE(parser.wrong_arguments_passed());
    std::ostringstream out;
    REQUIRE(parser.pars(out) == EXIT_OK);
    auto lines = test_support::split_lines(out.str());
    // Widest flag is "  -v, --version" (15 chars), descriptions start at column 17.
    auto row = [](const std::string& flag, const std::string& desc) {
        return flag + std::string(17 - flag.size(), ' ') + desc;
    };
    REQUIRE(lines.size() == 11);
    REQUIRE(lines[5] == "Options:");
    REQUIRE(lines[6] == row("  -h, --help", "display this help and exit"));
    REQUIRE(lines[7] == row("  -v, --version", "output version information and exit"));
    REQUIRE(lines[8] == row("      --help", "custom"));
}

TEST_CASE("ArgParser queries are idempotent") {
    ArgParser parser(std::vector<std::string>{"prog", "--x", "--y"});
    parser.add_argument("--x", "x");
    for (int i = 0; i < 2; ++i) {
        REQUIRE_FALSE(parser.no_arguments_passed());
        REQUIRE(parser.passed("--x"));
        REQUIRE(parser.wrong_arguments_passed());
        REQUIRE_FALSE(parser.default_arguments_passed());
        std::ostringstream out;
        REQUIRE(parser.pars(out) == EXIT_WRONG_ARGUMENTS);
    }
    REQUIRE(parser.arguments_passed().size() == 3);
}

TEST_CASE("ArgParser error message names first unknown option") {
    ArgParser parser(std::vector<std::string>{"prog", "--ok", "--bad", "--worse"});
    parser.add_argument("--ok", "fine");
    std::ostringstream err;
    parser.display_error_message(err);
    auto lines = test_support::split_lines(err.str());
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "ERROR: No such option: '--bad'");
    REQUIRE(lines[1] == "Try: 'prog --help' for more information.");
}

TEST_CASE("ArgParser error message omits help hint without defaults") {
    ParserConfig cfg;
    cfg.default_arguments = false;
    ArgParser parser(std::vector<std::string>{"prog", "--bad"}, cfg);
    std::ostringstream err;
    parser.display_error_message(err);
    REQUIRE(err.str() == "ERROR: No such option: '--bad'\n");
}

TEST_CASE("ArgParser error message is silent when all known") {
    ArgParser parser(std::vector<std::string>{"prog", "--help"});
    std::ostringstream err;
    parser.display_error_message(err);
    REQUIRE(err.str().empty());
}
