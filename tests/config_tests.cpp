#include "test_common.hpp"
#include <map>
#include "config_utils.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "log-level: DEBUG\n";
        ofs << "json-log: true\n";
        ofs << "max-frame-size: 8M\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--json-log"] == "true");
    REQUIRE(opts["--max-frame-size"] == "8M");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config sections are flattened") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg_sections.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "logging:\n  log-file: /tmp/gitport.log\n  max-log-files: 3\n"
               "protocol:\n  max-frame-size: 1024\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--log-file"] == "/tmp/gitport.log");
    REQUIRE(opts["--max-log-files"] == "3");
    REQUIRE(opts["--max-frame-size"] == "1024");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config rejects a non-map root") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg_list.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "- a\n- b\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(!err.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config reports parse errors") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg_bad.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "log-level: [unterminated\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(!err.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config loading") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"max-log-files\": 4,\n  \"syslog\": true\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--max-log-files"] == "4");
    REQUIRE(opts["--syslog"] == "true");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config sections") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg_sections.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"logging\": {\n    \"log-level\": \"WARNING\",\n    \"quiet\": false\n  },\n"
               "  \"protocol\": {\n    \"max-frame-size\": \"2M\"\n  }\n}";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--log-level"] == "WARNING");
    REQUIRE(opts["--quiet"] == "false");
    REQUIRE(opts["--max-frame-size"] == "2M");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config invalid") {
    fs::path cfg = fs::temp_directory_path() / "gitport_cfg_bad.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{ \"quiet\": ";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(!err.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("Missing config file") {
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/gitport.yaml", opts, err));
    REQUIRE(err == "Failed to open file");
    REQUIRE_FALSE(load_json_config("/nonexistent/gitport.json", opts, err));
}
