#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <string>
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool quiet = false; ///< Suppress the stderr sink
    bool use_syslog = false;
    int syslog_facility = 0;
};

struct ProtocolOptions {
    /// Largest inbound frame accepted before the stream is declared corrupt.
    size_t max_frame_size = 64u * 1024u * 1024u;
};

struct Options {
    LoggingOptions logging;
    ProtocolOptions protocol;
    std::string config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Build @ref Options from the command line and an optional config file.
 *
 * `--config-yaml`/`--config-json` are read first; command line values take
 * precedence over values from the file.
 *
 * @throws std::runtime_error on unknown flags, unreadable config files or
 *         invalid values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Start the logger according to @p opts.
 */
void apply_logging_options(const LoggingOptions& opts);

#endif // OPTIONS_HPP
