#include "test_common.hpp"
#include <chrono>
#include <sstream>
#include "help_text.hpp"
#include "time_utils.hpp"
#include "version.hpp"

TEST_CASE("format_epoch_utc") {
    REQUIRE(format_epoch_utc(0) == "1970-01-01T00:00:00Z");
    REQUIRE(format_epoch_utc(1700000000) == "2023-11-14T22:13:20Z");
}

TEST_CASE("format_elapsed") {
    using namespace std::chrono;
    REQUIRE(format_elapsed(milliseconds(125)) == "125ms");
    REQUIRE(format_elapsed(milliseconds(3400)) == "3.4s");
}

TEST_CASE("timestamp layout") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 19);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[13] == ':');
}

TEST_CASE("Help text lists every option") {
    std::ostringstream out;
    print_help("gitport", out);
    const std::string text = out.str();
    REQUIRE(text.find("Usage: gitport") != std::string::npos);
    for (const char* flag : {"--help", "--version", "--config-yaml", "--config-json",
                             "--max-frame-size", "--log-file", "--log-level", "--verbose",
                             "--quiet", "--json-log", "--max-log-size", "--max-log-files",
                             "--compress-logs", "--syslog", "--syslog-facility"})
        REQUIRE(text.find(flag) != std::string::npos);
}

TEST_CASE("Version string matches the numeric macros") {
    REQUIRE(std::string(GITPORT_VERSION) ==
            std::to_string(GITPORT_VERSION_MAJOR) + "." + std::to_string(GITPORT_VERSION_MINOR) +
                "." + std::to_string(GITPORT_VERSION_PATCH));
}
