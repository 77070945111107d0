#include "options.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#ifdef __linux__
#include <syslog.h>
#endif
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "parse_utils.hpp"

static const std::set<std::string> kKnownFlags{
    "--help",         "--version",       "--config-yaml",   "--config-json",
    "--log-file",     "--log-level",     "--verbose",       "--quiet",
    "--json-log",     "--max-log-size",  "--max-log-files", "--compress-logs",
    "--syslog",       "--syslog-facility", "--max-frame-size"};

static const std::map<char, std::string> kShortFlags{{'h', "--help"},
                                                     {'V', "--version"},
                                                     {'y', "--config-yaml"},
                                                     {'j', "--config-json"},
                                                     {'l', "--log-file"},
                                                     {'L', "--log-level"},
                                                     {'v', "--verbose"},
                                                     {'q', "--quiet"}};

namespace {

// Looks a key up on the command line first, then in the config file.
class OptionSource {
    const ArgParser& cli_;
    const std::map<std::string, std::string>& cfg_;

  public:
    OptionSource(const ArgParser& cli, const std::map<std::string, std::string>& cfg)
        : cli_(cli), cfg_(cfg) {}

    bool has(const std::string& key) const { return cli_.has_flag(key) || cfg_.count(key) > 0; }

    std::string get(const std::string& key) const {
        if (cli_.has_flag(key))
            return cli_.get_option(key);
        auto it = cfg_.find(key);
        return it != cfg_.end() ? it->second : std::string();
    }

    bool flag(const std::string& key) const {
        if (!has(key))
            return false;
        bool ok = false;
        bool v = parse_bool(get(key), ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + key + ": " + get(key));
        return v;
    }
};

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, kKnownFlags, kShortFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front());

    Options opts;
    std::map<std::string, std::string> cfg;
    std::string err;
    if (parser.has_flag("--config-yaml")) {
        opts.config_file = parser.get_option("--config-yaml");
        if (opts.config_file.empty())
            throw std::runtime_error("--config-yaml requires a file");
        if (!load_yaml_config(opts.config_file, cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
    } else if (parser.has_flag("--config-json")) {
        opts.config_file = parser.get_option("--config-json");
        if (opts.config_file.empty())
            throw std::runtime_error("--config-json requires a file");
        if (!load_json_config(opts.config_file, cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
    }
    for (const auto& [key, value] : cfg) {
        (void)value;
        if (!kKnownFlags.count(key))
            throw std::runtime_error("Unknown option in " + opts.config_file + ": " + key.substr(2));
    }

    OptionSource src(parser, cfg);
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    LoggingOptions& lg = opts.logging;
    if (src.has("--log-level")) {
        if (!parse_log_level(src.get("--log-level"), lg.log_level))
            throw std::runtime_error("Invalid log level: " + src.get("--log-level"));
    }
    if (src.flag("--verbose"))
        lg.log_level = LogLevel::DEBUG;
    lg.log_file = src.get("--log-file");
    lg.quiet = src.flag("--quiet");
    lg.json_log = src.flag("--json-log");
    lg.compress_logs = src.flag("--compress-logs");
    lg.use_syslog = src.flag("--syslog");
    bool ok = true;
    if (src.has("--max-log-size")) {
        lg.max_log_size = parse_bytes(src.get("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (src.has("--max-log-files")) {
        lg.max_log_files = parse_size_t(src.get("--max-log-files"), 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    if (src.has("--syslog-facility")) {
        lg.syslog_facility =
            static_cast<int>(parse_uint(src.get("--syslog-facility"), 0, 1023, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
    }
    if (src.has("--max-frame-size")) {
        opts.protocol.max_frame_size =
            parse_bytes(src.get("--max-frame-size"), 1024, 0xFFFFFFFFu, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-frame-size");
    }
    return opts;
}

void apply_logging_options(const LoggingOptions& opts) {
    set_stderr_logging(!opts.quiet);
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
    init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
    if (opts.use_syslog) {
#ifdef __linux__
        init_syslog(opts.syslog_facility > 0 ? opts.syslog_facility : LOG_USER);
#else
        init_syslog(opts.syslog_facility);
#endif
    }
}
