#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace argpars {

static bool parse_bool(const std::string& value, bool& out) {
    std::string v;
    for (char c : value)
        v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_size(const std::string& value, size_t& out) {
    if (value.empty())
        return false;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Apply one scalar top-level key. Unknown keys are accepted and ignored.
static bool assign_field(const std::string& key, const std::string& val, ParserDefinition& def,
                         std::string& error) {
    ParserConfig& cfg = def.config;
    LogSettings& log = def.logging;
    if (key == "usage") {
        cfg.usage = val;
    } else if (key == "name") {
        cfg.name = val;
    } else if (key == "description") {
        cfg.description = val;
    } else if (key == "version") {
        cfg.version = val;
    } else if (key == "default-arguments") {
        if (!parse_bool(val, cfg.default_arguments)) {
            error = "Invalid boolean for default-arguments: " + val;
            return false;
        }
    } else if (key == "log-file") {
        log.file = val;
    } else if (key == "log-level") {
        if (!parse_log_level(val, log.level)) {
            error = "Invalid log-level: " + val;
            return false;
        }
    } else if (key == "log-max-size") {
        if (!parse_size(val, log.max_size)) {
            error = "Invalid log-max-size: " + val;
            return false;
        }
    } else if (key == "log-max-files") {
        if (!parse_size(val, log.max_files)) {
            error = "Invalid log-max-files: " + val;
            return false;
        }
    } else if (key == "log-json") {
        if (!parse_bool(val, log.json)) {
            error = "Invalid boolean for log-json: " + val;
            return false;
        }
    } else if (key == "log-compress") {
        if (!parse_bool(val, log.compress)) {
            error = "Invalid boolean for log-compress: " + val;
            return false;
        }
    }
    return true;
}

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.as<std::string>();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool read_yaml_pair(const YAML::Node& node, const char* first_key, const char* second_key,
                           std::string& first, std::string& second) {
    if (!node.IsMap())
        return false;
    if (!to_string_value(node[first_key], first) || first.empty())
        return false;
    if (node[second_key] && !to_string_value(node[second_key], second))
        return false;
    return true;
}

static bool load_yaml_arguments(const YAML::Node& node, ParserDefinition& def,
                                std::string& error) {
    if (node.IsNull())
        return true;
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string name;
            std::string desc;
            if (!to_string_value(it->first, name) || name.empty() ||
                !to_string_value(it->second, desc)) {
                error = "Invalid entry in arguments";
                return false;
            }
            def.arguments.push_back({name, desc});
        }
        return true;
    }
    if (!node.IsSequence()) {
        error = "'arguments' must be a sequence or map";
        return false;
    }
    for (const auto& entry : node) {
        ArgumentSpec spec;
        if (!read_yaml_pair(entry, "name", "description", spec.name, spec.description)) {
            error = "Each argument needs a name";
            return false;
        }
        def.arguments.push_back(spec);
    }
    return true;
}

static bool load_yaml_sections(const YAML::Node& node, ParserDefinition& def,
                               std::string& error) {
    if (node.IsNull())
        return true;
    if (!node.IsSequence()) {
        error = "'sections' must be a sequence";
        return false;
    }
    for (const auto& entry : node) {
        HelpSection section;
        if (!read_yaml_pair(entry, "title", "content", section.title, section.content)) {
            error = "Each section needs a title";
            return false;
        }
        def.config.sections.push_back(section);
    }
    return true;
}

bool load_yaml_config(const std::string& path, ParserDefinition& def, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (key == "arguments") {
                if (!load_yaml_arguments(node, def, error))
                    return false;
            } else if (key == "sections") {
                if (!load_yaml_sections(node, def, error))
                    return false;
            } else {
                std::string s;
                if (to_string_value(node, s) && !assign_field(key, s, def, error))
                    return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

static bool read_json_pair(const nlohmann::json& node, const char* first_key,
                           const char* second_key, std::string& first, std::string& second) {
    if (!node.is_object() || !node.contains(first_key))
        return false;
    if (!to_string_value(node.at(first_key), first) || first.empty())
        return false;
    if (node.contains(second_key) && !to_string_value(node.at(second_key), second))
        return false;
    return true;
}

bool load_json_config(const std::string& path, ParserDefinition& def, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const std::string key = it.key();
            const auto& val = it.value();
            if (key == "arguments") {
                if (val.is_null())
                    continue;
                if (!val.is_array()) {
                    error = "'arguments' must be an array";
                    return false;
                }
                for (const auto& entry : val) {
                    ArgumentSpec spec;
                    if (!read_json_pair(entry, "name", "description", spec.name,
                                        spec.description)) {
                        error = "Each argument needs a name";
                        return false;
                    }
                    def.arguments.push_back(spec);
                }
            } else if (key == "sections") {
                if (val.is_null())
                    continue;
                if (!val.is_array()) {
                    error = "'sections' must be an array";
                    return false;
                }
                for (const auto& entry : val) {
                    HelpSection section;
                    if (!read_json_pair(entry, "title", "content", section.title,
                                        section.content)) {
                        error = "Each section needs a title";
                        return false;
                    }
                    def.config.sections.push_back(section);
                }
            } else {
                std::string s;
                if (to_string_value(val, s) && !assign_field(key, s, def, error))
                    return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config(const std::string& path, ParserDefinition& def, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "json")
        return load_json_config(path, def, error);
    return load_yaml_config(path, def, error);
}

bool apply_log_settings(const LogSettings& settings) {
    if (settings.file.empty())
        return logger_initialized();
    set_json_logging(settings.json);
    set_log_compression(settings.compress);
    init_logger(settings.file, settings.level, settings.max_size, settings.max_files);
    return logger_initialized();
}

} // namespace argpars
