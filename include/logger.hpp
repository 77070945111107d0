#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Start the background log writer.
 *
 * Opens the log file at @p path when it is not empty and configures log
 * rotation. The stderr sink works without a file; standard output is never
 * written because it carries the protocol.
 *
 * @param path      Log file to append to, or empty for stderr/syslog only.
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
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`).
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level.
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line.
 */
void set_json_logging(bool enable);

/// Mirror log lines to stderr (enabled by default).
void set_stderr_logging(bool enable);

/// Gzip rotated log files.
void set_log_compression(bool enable);

/**
 * @brief Check whether the background writer is running.
 */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Drain the queue, stop the writer and close all sinks.
 */
void shutdown_logger();

#endif // LOGGER_HPP
