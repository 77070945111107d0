#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load startup options from a YAML file.
 *
 * Top-level scalars become `--key` entries. A top-level map is treated as a
 * section (e.g. `logging:`) whose scalar members are flattened the same way,
 * so `logging: {log-level: DEBUG}` yields `--log-level`.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load startup options from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
