#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "logger.hpp"
#include "tui.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty selects default_log_path()
    bool json_log = false;
    std::size_t max_log_size = 5 * 1024 * 1024;
    std::size_t max_log_files = 3;
    bool compress_logs = false;
};

struct Options {
    std::filesystem::path flake = ".";
    bool show_help = false;
    bool print_version = false;
    std::filesystem::path config_file; ///< Config actually loaded, if any

    LoggingOptions logging;

    std::size_t concurrency = 10;
    std::chrono::seconds http_timeout{30};
    std::chrono::seconds nix_timeout{120};
    std::chrono::seconds update_timeout{120};
    std::chrono::seconds changelog_timeout{120};
    std::optional<std::string> github_token;
    std::filesystem::path cache_dir;

    bool no_colors = false;
    melt::TuiTheme theme;
};

/**
 * @brief Build the run configuration from the command line and config file.
 *
 * The config file is `--config` when given, else the default location when
 * it exists. Command line values override config values. Unknown options on
 * either side are rejected.
 *
 * @throws std::runtime_error describing the first invalid option.
 */
Options parse_options(int argc, char* argv[]);

/** `$XDG_DATA_HOME/melt/melt.log`, else `~/.local/share/melt/melt.log`. */
std::filesystem::path default_log_path();

#endif // OPTIONS_HPP
