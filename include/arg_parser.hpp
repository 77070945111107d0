#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Minimal command line parser for the sidecar's startup flags.
 *
 * Recognizes `--flag`, `--opt value` and `--opt=value`. A token following a
 * long option is taken as its value unless it starts with `-`. Single
 * character aliases (`-h`, `-L DEBUG`, `-LDEBUG`) map to their long form.
 * Flags outside @a known_flags are collected in @ref unknown_flags.
 */
class ArgParser {
    std::set<std::string> flags_;
    std::map<std::string, std::string> options_;
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::set<std::string> known_flags_;
    std::map<char, std::string> short_map_;

    bool accept(const std::string& key);
    void store(const std::string& key, const std::string& value);

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted long flags; empty accepts everything.
     * @param short_map   Single character aliases for long flags.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {});

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /// Value of @p opt, or an empty string if it was not given a value.
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        return it != options_.end() ? it->second : std::string();
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
