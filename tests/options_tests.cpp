#include "test_common.hpp"
#include "options.hpp"

#include <optional>
#include <stdexcept>

namespace {

/** Sets or clears an environment variable and restores it on scope exit. */
class ScopedEnv {
    std::string name_;
    std::optional<std::string> saved_;

  public:
    ScopedEnv(std::string name, const char* value) : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str()))
            saved_ = old;
        if (value)
            setenv(name_.c_str(), value, 1);
        else
            unsetenv(name_.c_str());
    }
    ~ScopedEnv() {
        if (saved_)
            setenv(name_.c_str(), saved_->c_str(), 1);
        else
            unsetenv(name_.c_str());
    }
};

/** Isolates option parsing from the user's environment. */
struct CleanEnv {
    fs::path dir = melt::test_support::fresh_dir("options_env");
    ScopedEnv xdg{"XDG_CONFIG_HOME", dir.c_str()};
    ScopedEnv log{"MELT_LOG", nullptr};
    ScopedEnv no_color{"NO_COLOR", nullptr};
    ~CleanEnv() { std::filesystem::remove_all(dir); }
};

template <std::size_t N> Options parse(const char* (&argv)[N]) {
    return parse_options(static_cast<int>(N), const_cast<char**>(argv));
}

} // namespace

TEST_CASE("Defaults without arguments") {
    CleanEnv env;
    const char* argv[] = {"melt"};
    Options opts = parse(argv);
    REQUIRE(opts.flake == fs::path("."));
    REQUIRE(opts.concurrency == 10);
    REQUIRE(opts.http_timeout == std::chrono::seconds(30));
    REQUIRE(opts.nix_timeout == std::chrono::seconds(120));
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE_FALSE(opts.no_colors);
    REQUIRE_FALSE(opts.github_token);
    REQUIRE(opts.config_file.empty());
}

TEST_CASE("Flake path and flags from the command line") {
    CleanEnv env;
    const char* argv[] = {"melt", "--no-colors", "/etc/nixos", "-n", "3", "--http-timeout=1m",
                          "-L", "debug", "--json-log"};
    Options opts = parse(argv);
    REQUIRE(opts.flake == fs::path("/etc/nixos"));
    REQUIRE(opts.no_colors);
    REQUIRE(opts.concurrency == 3);
    REQUIRE(opts.http_timeout == std::chrono::seconds(60));
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.json_log);
}

TEST_CASE("Help and version short-circuit") {
    CleanEnv env;
    const char* help[] = {"melt", "-h", "--config", "/nonexistent/melt.yaml"};
    Options opts = parse(help);
    REQUIRE(opts.show_help);
    REQUIRE(opts.config_file.empty());
    const char* version[] = {"melt", "-V"};
    REQUIRE(parse(version).print_version);
    const char* h2[] = {"melt", "--help"};
    REQUIRE(parse(h2).show_help);
}

TEST_CASE("Invalid command lines are rejected") {
    CleanEnv env;
    const char* unknown[] = {"melt", "--frobnicate"};
    REQUIRE_THROWS_AS(parse(unknown), std::runtime_error);
    const char* two[] = {"melt", "a", "b"};
    REQUIRE_THROWS_AS(parse(two), std::runtime_error);
    const char* zero[] = {"melt", "--concurrency", "0"};
    REQUIRE_THROWS_AS(parse(zero), std::runtime_error);
    const char* huge[] = {"melt", "--concurrency", "1000"};
    REQUIRE_THROWS_AS(parse(huge), std::runtime_error);
    const char* level[] = {"melt", "--log-level", "chatty"};
    REQUIRE_THROWS_AS(parse(level), std::runtime_error);
    const char* timeout[] = {"melt", "--nix-timeout", "0"};
    REQUIRE_THROWS_AS(parse(timeout), std::runtime_error);
}

TEST_CASE("Config file values and command line precedence") {
    CleanEnv env;
    fs::path cfg = env.dir / "custom.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "Network:\n  concurrency: 6\n  github-token: abc\n"
               "Logging:\n  log-level: warning\n  compress-logs: yes\n"
               "theme:\n  accent: red\n";
    }
    std::string cfg_path = cfg.string();
    const char* argv[] = {"melt", "-c", cfg_path.c_str(), "--concurrency", "2"};
    Options opts = parse(argv);
    REQUIRE(opts.config_file == cfg);
    REQUIRE(opts.concurrency == 2);
    REQUIRE(opts.github_token == std::optional<std::string>("abc"));
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.theme.accent == "\033[31m");
}

TEST_CASE("Default config location is read when present") {
    CleanEnv env;
    fs::create_directories(env.dir / "melt");
    std::ofstream(env.dir / "melt" / "config.yaml") << "no-colors: true\n";
    const char* argv[] = {"melt"};
    Options opts = parse(argv);
    REQUIRE(opts.no_colors);
    REQUIRE(opts.config_file == env.dir / "melt" / "config.yaml");
}

TEST_CASE("Bad config entries are rejected") {
    CleanEnv env;
    fs::path cfg = env.dir / "bad.yaml";
    std::string cfg_path = cfg.string();
    const char* argv[] = {"melt", "--config", cfg_path.c_str()};

    std::ofstream(cfg) << "interval: 5\n";
    REQUIRE_THROWS_AS(parse(argv), std::runtime_error);

    std::ofstream(cfg) << "theme:\n  accent: not-a-color\n";
    REQUIRE_THROWS_AS(parse(argv), std::runtime_error);

    std::ofstream(cfg) << "json-log: perhaps\n";
    REQUIRE_THROWS_AS(parse(argv), std::runtime_error);

    const char* missing[] = {"melt", "--config", "/nonexistent/melt.yaml"};
    REQUIRE_THROWS_AS(parse(missing), std::runtime_error);
}

TEST_CASE("Environment supplies log level and disables colors") {
    CleanEnv env;
    ScopedEnv log("MELT_LOG", "debug");
    ScopedEnv no_color("NO_COLOR", "1");
    const char* argv[] = {"melt"};
    Options opts = parse(argv);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.no_colors);

    const char* cli[] = {"melt", "--log-level", "error"};
    REQUIRE(parse(cli).logging.log_level == LogLevel::ERR);
}

TEST_CASE("default_log_path follows XDG_DATA_HOME") {
    ScopedEnv data("XDG_DATA_HOME", "/tmp/melt-data");
    REQUIRE(default_log_path() == fs::path("/tmp/melt-data/melt/melt.log"));
}
