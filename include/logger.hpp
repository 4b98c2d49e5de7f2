#ifndef ARGPARS_LOGGER_HPP
#define ARGPARS_LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

namespace argpars {

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending. Until this succeeds every
 * logging call is a no-op. Calling it again switches to the new file; if the
 * new file cannot be opened the previous one stays active.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files when enabled. */
void set_log_compression(bool enable);

/** @return `true` if the logger has an open file. */
bool logger_initialized();

/** @brief Flush buffered log output to disk. */
void flush_logger();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Parse a level name such as `DEBUG` or `warning`.
 *
 * @param name  Case-insensitive level name. `ERROR` and `ERR` are accepted.
 * @param level Receives the parsed level on success.
 * @return `false` if @p name is not a level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/** @brief Close the log file and reset the logger to its disabled state. */
void shutdown_logger();

} // namespace argpars

#endif // ARGPARS_LOGGER_HPP
