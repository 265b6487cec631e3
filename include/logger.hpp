#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and starts the background writer thread.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a level name such as "debug" or "WARNING".
 *
 * @param name  Level name, case-insensitive. "warn" and "error" are accepted.
 * @param level Receives the parsed level on success.
 * @return `false` for unknown names.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Enable or disable JSON formatted logging.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files with zlib.
 */
void set_log_compression(bool enable);

/**
 * @brief Mirror INFO and higher messages to stderr as `fleetfix: <message>`.
 *
 * Console output is written synchronously from the calling thread and works
 * whether or not a log file was configured.
 */
void set_console_logging(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Block until queued messages have been written to the file.
 */
void flush_logger();

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with an additional serialized payload.
 *
 * The payload is recorded as a `data` field.
 */
void log_event(LogLevel level, const std::string& message, const std::string& data);

/**
 * @brief Log a message with structured key/value fields.
 *
 * Text output renders fields as ` key=value` suffixes; JSON output adds them
 * as extra members of the entry object.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

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
 * @brief Initialize system logging using the specified facility.
 *
 * @param facility Syslog facility identifier to tag messages with. Zero
 *                 selects `LOG_USER`.
 */
void init_syslog(int facility = 0);

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
