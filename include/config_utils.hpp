#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <filesystem>
#include <map>
#include <string>

/** Option values keyed by long flag name, e.g. `--concurrency`. */
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Load options from a YAML file.
 *
 * Top level scalars become `--key` entries. Maps group options by category
 * and are flattened into the same namespace, except `theme` whose entries
 * are color overrides and land in @p theme.
 *
 * @param path  YAML file to read.
 * @param opts  Receives option values.
 * @param theme Receives `role -> color` overrides.
 * @param error Human readable reason on failure.
 * @return `true` on success.
 */
bool load_yaml_config(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error);

/**
 * @brief Load options from a JSON file.
 *
 * Same layout rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error);

/** Pick the loader by extension, `.json` for JSON and YAML otherwise. */
bool load_config_file(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error);

/** `$XDG_CONFIG_HOME/melt/config.yaml`, else `~/.config/melt/config.yaml`. */
std::filesystem::path default_config_path();

#endif // CONFIG_UTILS_HPP
