#include "test_common.hpp"
#include "config_utils.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "melt_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "concurrency: 4\n";
        ofs << "no-colors: true\n";
        ofs << "github-token:\n";
    }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, theme, err));
    REQUIRE(opts["--concurrency"] == "4");
    REQUIRE(opts["--no-colors"] == "true");
    REQUIRE(opts.count("--github-token") == 1);
    REQUIRE(opts["--github-token"].empty());
    REQUIRE(theme.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories and theme") {
    fs::path cfg = fs::temp_directory_path() / "melt_cfg_cat.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "Network:\n  http-timeout: 10s\n  concurrency: 2\n"
               "Logging:\n  log-level: DEBUG\n"
               "theme:\n  accent: \"#ff00ff\"\n  dialog-bg: blue\n";
    }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, theme, err));
    REQUIRE(opts["--http-timeout"] == "10s");
    REQUIRE(opts["--concurrency"] == "2");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(theme["accent"] == "#ff00ff");
    REQUIRE(theme["dialog-bg"] == "blue");
    REQUIRE(opts.count("--accent") == 0);
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config errors") {
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/melt.yaml", opts, theme, err));
    REQUIRE(err == "Failed to open file");

    fs::path cfg = fs::temp_directory_path() / "melt_cfg_list.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "- a\n- b\n";
    }
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, theme, err));
    REQUIRE(err == "Root YAML node is not a map");

    {
        std::ofstream ofs(cfg);
        ofs << "key: [unclosed\n";
    }
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, theme, err));
    FS_REMOVE(cfg);
}

TEST_CASE("Empty YAML config is accepted") {
    fs::path cfg = fs::temp_directory_path() / "melt_cfg_empty.yaml";
    { std::ofstream ofs(cfg); }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, theme, err));
    REQUIRE(opts.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config categories") {
    fs::path cfg = fs::temp_directory_path() / "melt_cfg_cat.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"Basics\": {\n    \"concurrency\": 10,\n    \"no-colors\": true\n  },\n  "
               "\"Logging\": {\n    \"log-level\": \"DEBUG\"\n  },\n"
               "  \"theme\": {\"sha\": \"yellow\"}\n}";
    }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, theme, err));
    REQUIRE(opts["--concurrency"] == "10");
    REQUIRE(opts["--no-colors"] == "true");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(theme["sha"] == "yellow");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config rejects non-objects") {
    fs::path cfg = fs::temp_directory_path() / "melt_cfg_bad.json";
    {
        std::ofstream ofs(cfg);
        ofs << "[1, 2]";
    }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, theme, err));
    REQUIRE(err == "Root JSON value is not an object");
    {
        std::ofstream ofs(cfg);
        ofs << "{ nope";
    }
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, theme, err));
    REQUIRE(err == "Invalid JSON");
    FS_REMOVE(cfg);
}

TEST_CASE("load_config_file picks the loader by extension") {
    fs::path json_cfg = fs::temp_directory_path() / "melt_pick.json";
    fs::path yaml_cfg = fs::temp_directory_path() / "melt_pick.yml";
    {
        std::ofstream(json_cfg) << "{\"cache-dir\": \"/var/cache/melt\"}";
        std::ofstream(yaml_cfg) << "cache-dir: /srv/melt\n";
    }
    ConfigMap opts;
    ConfigMap theme;
    std::string err;
    REQUIRE(load_config_file(json_cfg.string(), opts, theme, err));
    REQUIRE(opts["--cache-dir"] == "/var/cache/melt");
    REQUIRE(load_config_file(yaml_cfg.string(), opts, theme, err));
    REQUIRE(opts["--cache-dir"] == "/srv/melt");
    FS_REMOVE(json_cfg);
    FS_REMOVE(yaml_cfg);
}

TEST_CASE("default_config_path honours XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";
    setenv("XDG_CONFIG_HOME", "/tmp/melt-xdg", 1);
    REQUIRE(default_config_path() == fs::path("/tmp/melt-xdg/melt/config.yaml"));
    if (old)
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}
