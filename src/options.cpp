#include "options.hpp"
#include <cstdlib>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> CONFIG_KEYS{"--concurrency",     "--http-timeout", "--nix-timeout",
                                        "--update-timeout",  "--changelog-timeout",
                                        "--log-level",       "--log-file",     "--json-log",
                                        "--compress-logs",   "--max-log-size", "--no-colors",
                                        "--github-token",    "--cache-dir"};

const std::set<std::string> SWITCHES{"--help", "--version", "--json-log", "--no-colors",
                                     "--compress-logs"};

const std::map<char, std::string> SHORT_OPTS{{'h', "--help"},        {'V', "--version"},
                                             {'c', "--config"},      {'L', "--log-level"},
                                             {'n', "--concurrency"}, {'C', "--no-colors"}};

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (v && *v)
        return std::string(v);
    return std::nullopt;
}

} // namespace

fs::path default_log_path() {
    if (auto xdg = env_value("XDG_DATA_HOME"))
        return fs::path(*xdg) / "melt" / "melt.log";
    if (auto home = env_value("HOME"))
        return fs::path(*home) / ".local" / "share" / "melt" / "melt.log";
    return fs::temp_directory_path() / "melt.log";
}

Options parse_options(int argc, char* argv[]) {
    std::set<std::string> known = CONFIG_KEYS;
    known.insert({"--help", "--version", "--config"});
    ArgParser parser(argc, argv, known, SHORT_OPTS, SWITCHES);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;
    if (!parser.positional().empty())
        opts.flake = parser.positional().front();

    ConfigMap cfg;
    ConfigMap theme_colors;
    std::string err;
    if (parser.has_flag("--config")) {
        std::string path = parser.get_option("--config");
        if (path.empty())
            throw std::runtime_error("--config requires a file");
        if (!load_config_file(path, cfg, theme_colors, err))
            throw std::runtime_error("Failed to load config " + path + ": " + err);
        opts.config_file = path;
    } else {
        fs::path def = default_config_path();
        std::error_code ec;
        if (!def.empty() && fs::exists(def, ec)) {
            if (!load_config_file(def.string(), cfg, theme_colors, err))
                throw std::runtime_error("Failed to load config " + def.string() + ": " + err);
            opts.config_file = def;
        }
    }
    for (const auto& kv : cfg) {
        if (!CONFIG_KEYS.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first.substr(2));
    }

    // Command line first, then the config file.
    auto value_of = [&](const std::string& key) -> std::optional<std::string> {
        if (parser.has_flag(key))
            return parser.get_option(key);
        auto it = cfg.find(key);
        if (it != cfg.end())
            return it->second;
        return std::nullopt;
    };
    auto flag_of = [&](const std::string& key) {
        if (parser.has_flag(key))
            return true;
        auto it = cfg.find(key);
        if (it == cfg.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + key.substr(2) + ": " + it->second);
        return v;
    };
    auto duration_of = [&](const std::string& key, std::chrono::seconds def) {
        auto v = value_of(key);
        if (!v)
            return def;
        bool ok = false;
        auto d = parse_duration(*v, ok);
        if (!ok || d.count() == 0)
            throw std::runtime_error("Invalid value for " + key + ": " + *v);
        return d;
    };

    if (auto v = value_of("--concurrency")) {
        bool ok = false;
        opts.concurrency = parse_size_t(*v, 1, 256, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --concurrency: " + *v);
    }
    opts.http_timeout = duration_of("--http-timeout", opts.http_timeout);
    opts.nix_timeout = duration_of("--nix-timeout", opts.nix_timeout);
    opts.update_timeout = duration_of("--update-timeout", opts.update_timeout);
    opts.changelog_timeout = duration_of("--changelog-timeout", opts.changelog_timeout);

    std::optional<std::string> level = value_of("--log-level");
    if (!level)
        level = env_value("MELT_LOG");
    if (level) {
        auto parsed = parse_log_level(*level);
        if (!parsed)
            throw std::runtime_error("Invalid log level: " + *level);
        opts.logging.log_level = *parsed;
    }
    if (auto v = value_of("--log-file")) {
        if (v->empty())
            throw std::runtime_error("--log-file requires a path");
        opts.logging.log_file = *v;
    }
    if (auto v = value_of("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_size_t(*v, 0, static_cast<std::size_t>(-1), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size: " + *v);
    }
    opts.logging.json_log = flag_of("--json-log");
    opts.logging.compress_logs = flag_of("--compress-logs");

    if (auto v = value_of("--github-token"); v && !v->empty())
        opts.github_token = *v;
    if (auto v = value_of("--cache-dir"); v && !v->empty())
        opts.cache_dir = *v;

    opts.no_colors = flag_of("--no-colors") || env_value("NO_COLOR").has_value();
    auto rejected = melt::apply_theme_overrides(opts.theme, theme_colors);
    if (!rejected.empty())
        throw std::runtime_error("Invalid theme entry: " + rejected.front());
    return opts;
}
