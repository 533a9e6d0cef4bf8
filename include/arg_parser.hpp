#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line parser for `--flag`, `--opt value` and `--opt=value`.
 *
 * Flags listed in @a switches never take a value, so a positional argument
 * may follow them. Any other known flag consumes the next argument unless
 * it starts with `-`. Short options are translated through @a short_map and
 * may be combined (`-hV`). Everything after a bare `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;
    std::set<std::string> switches_;
    std::map<char, std::string> short_map_;

    bool is_known(const std::string& flag) const {
        return known_flags_.empty() || known_flags_.count(flag) > 0;
    }
    void record(const std::string& flag, const std::string* value);

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted long flags. Empty accepts everything.
     * @param short_map   Single character aliases of long flags.
     * @param switches    Long flags that never take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {});

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** Value given for @p opt, empty when absent. */
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
