#ifndef ARGPARS_CONFIG_UTILS_HPP
#define ARGPARS_CONFIG_UTILS_HPP
#include <cstddef>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "logger.hpp"

namespace argpars {

/** @brief Logger settings read from a configuration file. */
struct LogSettings {
    std::string file; ///< Empty leaves logging disabled
    LogLevel level = LogLevel::INFO;
    size_t max_size = 0;
    size_t max_files = 1;
    bool json = false;
    bool compress = false;
};

/** @brief Everything a configuration file can describe. */
struct ParserDefinition {
    ParserConfig config;
    std::vector<ArgumentSpec> arguments;
    LogSettings logging;
};

/**
 * @brief Load a parser definition from a YAML file.
 *
 * Recognized top-level keys are `usage`, `name`, `description`, `version`,
 * `default-arguments`, `arguments`, `sections` and the `log-*` settings.
 * `arguments` may be a sequence of `{name, description}` maps or a map of
 * flag to description; both keep document order. Unknown keys are ignored.
 *
 * @param path  Filesystem path to the YAML file.
 * @param def   Definition populated with the values found.
 * @param error Human-readable error message on failure.
 * @return `true` if the file was loaded successfully; `false` otherwise.
 */
bool load_yaml_config(const std::string& path, ParserDefinition& def, std::string& error);

/**
 * @brief Load a parser definition from a JSON file.
 *
 * Accepts the same keys as load_yaml_config(). `arguments` and `sections`
 * must be arrays so that their order is kept.
 *
 * @param path  Filesystem path to the JSON file.
 * @param def   Definition populated with the values found.
 * @param error Human-readable error message on failure.
 * @return `true` if the file was loaded successfully; `false` otherwise.
 */
bool load_json_config(const std::string& path, ParserDefinition& def, std::string& error);

/**
 * @brief Load a parser definition, choosing the format by file extension.
 *
 * Files ending in `.json` are read as JSON, everything else as YAML.
 */
bool load_config(const std::string& path, ParserDefinition& def, std::string& error);

/**
 * @brief Start the file logger described by @p settings.
 *
 * Does nothing when no log file is configured.
 *
 * @return `true` if logging is active afterwards.
 */
bool apply_log_settings(const LogSettings& settings);

} // namespace argpars

#endif // ARGPARS_CONFIG_UTILS_HPP
