#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& out) {
    static const std::vector<OptionInfo> opts = {
        {"--help", "-h", "", "Show this message and exit", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--config-yaml", "-y", "<file>", "Load options from a YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from a JSON file", "Config"},
        {"--max-frame-size", "", "<bytes>", "Largest accepted request frame (default 64M)",
         "Protocol"},
        {"--log-file", "-l", "<path>", "Also write log lines to a file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level DEBUG", "Logging"},
        {"--quiet", "-q", "", "Do not log to stderr", "Logging"},
        {"--json-log", "", "", "Emit log lines as JSON objects", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file above this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 1)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Also log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility code (default LOG_USER)", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    out << "gitport - git-backed configuration sidecar\n";
    out << "Serves sync, listing and read requests as length-prefixed msgpack\n";
    out << "frames on stdin/stdout. Logs go to stderr.\n\n";
    out << "Usage: " << prog << " [options]\n\n";
    const std::vector<std::string> order{"Basics", "Config", "Protocol", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        out << cat << ":\n";
        for (const auto* o : groups[cat])
            out << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                << o->desc << "\n";
        out << "\n";
    }
}
