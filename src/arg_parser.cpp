#include "arg_parser.hpp"

bool ArgParser::accept(const std::string& key) {
    if (known_flags_.empty() || known_flags_.count(key)) {
        flags_.insert(key);
        return true;
    }
    unknown_flags_.push_back(key);
    return false;
}

void ArgParser::store(const std::string& key, const std::string& value) {
    if (accept(key))
        options_[key] = value;
}

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map)
    : known_flags_(known_flags), short_map_(short_map) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos)
                store(arg.substr(0, eq), arg.substr(eq + 1));
            else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0 &&
                     std::string(argv[i + 1]).rfind('-', 0) != 0)
                store(arg, argv[++i]);
            else
                accept(arg);
        } else if (arg.size() >= 2 && arg[0] == '-') {
            auto it = short_map_.find(arg[1]);
            if (it == short_map_.end()) {
                unknown_flags_.push_back(arg);
                continue;
            }
            std::string rest = arg.substr(2);
            if (!rest.empty() && rest[0] == '=')
                rest.erase(0, 1);
            if (!rest.empty())
                store(it->second, rest);
            else if (i + 1 < argc && std::string(argv[i + 1]).rfind('-', 0) != 0)
                store(it->second, argv[++i]);
            else
                accept(it->second);
        } else {
            positional_.push_back(arg);
        }
    }
}
