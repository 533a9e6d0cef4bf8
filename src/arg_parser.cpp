#include "arg_parser.hpp"

void ArgParser::record(const std::string& flag, const std::string* value) {
    if (!is_known(flag)) {
        unknown_flags_.push_back(flag);
        return;
    }
    flags_.insert(flag);
    if (value)
        options_[flag] = *value;
}

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map,
                     const std::set<std::string>& switches)
    : known_flags_(known_flags), switches_(switches), short_map_(short_map) {
    auto takes_value = [&](const std::string& flag, int i) {
        return !switches_.count(flag) && i + 1 < argc && argv[i + 1][0] != '-';
    };
    bool only_positional = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            std::size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                std::string val = arg.substr(eq + 1);
                record(arg.substr(0, eq), &val);
            } else if (takes_value(arg, i) && is_known(arg)) {
                std::string val = argv[++i];
                record(arg, &val);
            } else {
                record(arg, nullptr);
            }
            continue;
        }
        // Cluster of short options, the last one may take a value.
        std::string letters = arg.substr(1);
        for (std::size_t j = 0; j < letters.size(); ++j) {
            auto it = short_map_.find(letters[j]);
            if (it == short_map_.end()) {
                unknown_flags_.push_back(std::string("-") + letters[j]);
                continue;
            }
            const std::string& flag = it->second;
            bool last = j + 1 == letters.size();
            if (!switches_.count(flag) && !last) {
                std::string val = letters.substr(j + 1);
                if (!val.empty() && val[0] == '=')
                    val.erase(0, 1);
                record(flag, &val);
                break;
            }
            if (last && takes_value(flag, i)) {
                std::string val = argv[++i];
                record(flag, &val);
            } else {
                record(flag, nullptr);
            }
        }
    }
}
