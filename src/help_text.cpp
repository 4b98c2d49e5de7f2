#include "help_text.hpp"
#include "arg_parser.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <vector>

namespace argpars {

struct OptionRow {
    std::string flag;
    std::string desc;
};

static std::string format_flag(const std::string& short_flag, const std::string& long_flag) {
    std::string flag = "  ";
    if (!short_flag.empty())
        flag += short_flag + ", ";
    else
        flag += "    ";
    flag += long_flag;
    return flag;
}

// Long registered names line up with the long half of the built-in rows.
static std::string format_registered(const std::string& name) {
    if (name.rfind("--", 0) == 0)
        return format_flag("", name);
    return "  " + name;
}

std::string expand_usage(const std::string& usage, const std::string& prog) {
    static const std::string placeholder = "{prog}";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = usage.find(placeholder, pos);
        if (hit == std::string::npos) {
            out += usage.substr(pos);
            break;
        }
        out += usage.substr(pos, hit - pos);
        out += prog;
        pos = hit + placeholder.size();
    }
    return out;
}

void print_help(const ArgParser& parser, std::ostream& os) {
    const ParserConfig& cfg = parser.config();
    std::vector<OptionRow> rows;
    if (cfg.default_arguments) {
        rows.push_back({format_flag(HELP_SHORT_FLAG, HELP_FLAG), "display this help and exit"});
        rows.push_back(
            {format_flag(VERSION_SHORT_FLAG, VERSION_FLAG), "output version information and exit"});
    }
    for (const auto& a : parser.arguments())
        rows.push_back({format_registered(a.name), a.description});
    size_t width = 0;
    for (const auto& r : rows)
        width = std::max(width, r.flag.size());

    std::string usage = expand_usage(cfg.usage, parser.program_name());
    os << usage;
    if (usage.empty() || usage.back() != '\n')
        os << "\n";
    os << "\n";
    os << cfg.name << "\n";
    os << cfg.description << "\n";
    os << "\nOptions:\n";
    for (const auto& r : rows) {
        if (r.desc.empty())
            os << r.flag << "\n";
        else
            os << std::left << std::setw(static_cast<int>(width) + 2) << r.flag << r.desc << "\n";
    }
    for (const auto& s : cfg.sections) {
        os << "\n" << s.title << "\n";
        os << s.content;
        if (s.content.empty() || s.content.back() != '\n')
            os << "\n";
    }
    os << "\n" << cfg.version << "\n";
}

void print_version(const ArgParser& parser, std::ostream& os) {
    os << parser.config().name << " version: " << parser.config().version << "\n";
}

void print_unknown_option(const ArgParser& parser, const std::string& option, std::ostream& os) {
    os << "ERROR: No such option: '" << option << "'\n";
    if (parser.config().default_arguments)
        os << "Try: '" << parser.program_name() << " " << HELP_FLAG
           << "' for more information.\n";
}

} // namespace argpars
