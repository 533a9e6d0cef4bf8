#include "config_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace {

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their source spelling, "true" and "30" included.
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
    } else if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
    } else if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
    } else if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
    } else if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
    } else if (v.is_null()) {
        out.clear();
    } else {
        return false;
    }
    return true;
}

void read_yaml_map(const YAML::Node& node, ConfigMap& opts, ConfigMap& theme, bool nested) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (val.IsMap()) {
            if (key == "theme")
                read_yaml_map(val, theme, theme, true);
            else if (!nested)
                read_yaml_map(val, opts, theme, true);
            continue;
        }
        std::string s;
        if (to_string_value(val, s))
            opts[&opts == &theme ? key : "--" + key] = s;
    }
}

void read_json_object(const nlohmann::json& node, ConfigMap& opts, ConfigMap& theme,
                      bool nested) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& key = it.key();
        const auto& val = it.value();
        if (val.is_object()) {
            if (key == "theme")
                read_json_object(val, theme, theme, true);
            else if (!nested)
                read_json_object(val, opts, theme, true);
            continue;
        }
        std::string s;
        if (to_string_value(val, s))
            opts[&opts == &theme ? key : "--" + key] = s;
    }
}

} // namespace

bool load_yaml_config(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        read_yaml_map(root, opts, theme, false);
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    nlohmann::json root = nlohmann::json::parse(ifs, nullptr, false);
    if (root.is_discarded()) {
        error = "Invalid JSON";
        return false;
    }
    if (!root.is_object()) {
        error = "Root JSON value is not an object";
        return false;
    }
    read_json_object(root, opts, theme, false);
    return true;
}

bool load_config_file(const std::string& path, ConfigMap& opts, ConfigMap& theme,
                      std::string& error) {
    if (std::filesystem::path(path).extension() == ".json")
        return load_json_config(path, opts, theme, error);
    return load_yaml_config(path, opts, theme, error);
}

std::filesystem::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return std::filesystem::path(xdg) / "melt" / "config.yaml";
    const char* home = std::getenv("HOME");
    if (home && *home)
        return std::filesystem::path(home) / ".config" / "melt" / "config.yaml";
    return {};
}
