#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Open the log file and start the writer thread.
 *
 * Messages are queued by the calling thread and written by a background
 * thread, so logging never blocks the interface. Calling this again
 * reopens the logger with the new settings. When @p path cannot be opened
 * the previous file, if any, stays in use.
 *
 * @param path      Log file, parent directories are created.
 * @param level     Minimum severity written.
 * @param max_size  Rotate once the file grows past this many bytes, `0`
 *                  disables rotation.
 * @param max_files Number of rotated files kept next to @p path.
 * @return `true` when a log file is open afterwards.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO,
                 std::size_t max_size = 0, std::size_t max_files = 1);

void set_log_level(LogLevel level);
LogLevel log_level();

/** Write one JSON object per line instead of the plain format. */
void set_json_logging(bool enable);

/** gzip rotated files. */
void set_log_compression(bool enable);

bool logger_initialized();

/** Block until every queued message has been written. */
void flush_logger();

/** Stop the writer thread after draining the queue and close the file. */
void shutdown_logger();

/**
 * @brief Parse `debug`, `info`, `warning`/`warn` or `error`, case-insensitive.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const LogFields& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const LogFields& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const LogFields& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const LogFields& fields);

#endif // LOGGER_HPP
