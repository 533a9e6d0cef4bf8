#include "nix_service.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <nlohmann/json.hpp>
#include "forge.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace melt {

namespace {

std::optional<std::string> opt_string(const json* obj, const char* key) {
    if (!obj || !obj->is_object())
        return std::nullopt;
    auto it = obj->find(key);
    if (it == obj->end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

/** Field from the locked section, falling back to the original section. */
std::optional<std::string> pick(const json* locked, const json* original, const char* key) {
    if (auto v = opt_string(locked, key))
        return v;
    return opt_string(original, key);
}

std::int64_t last_modified_of(const json* locked) {
    if (!locked)
        return 0;
    auto it = locked->find("lastModified");
    if (it == locked->end() || !it->is_number_integer())
        return 0;
    return it->get<std::int64_t>();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string git_display_url(const std::string& type, const GitInput& g,
                            const std::optional<std::string>& raw_url) {
    if (type == "github")
        return "github:" + g.owner + "/" + g.repo;
    if (type == "gitlab") {
        if (g.host && *g.host != "gitlab.com")
            return "gitlab:" + g.owner + "/" + g.repo + " (" + *g.host + ")";
        return "gitlab:" + g.owner + "/" + g.repo;
    }
    if (type == "sourcehut") {
        std::string owner = g.owner.rfind('~', 0) == 0 ? g.owner : "~" + g.owner;
        return "sourcehut:" + owner + "/" + g.repo;
    }
    return raw_url.value_or("git:" + g.owner + "/" + g.repo);
}

std::optional<FlakeInput> parse_input(const std::string& name, const json& node) {
    auto lit = node.find("locked");
    if (lit == node.end() || !lit->is_object())
        return std::nullopt;
    const json* locked = &*lit;
    auto oit = node.find("original");
    const json* original = oit != node.end() && oit->is_object() ? &*oit : nullptr;

    std::string type = pick(locked, original, "type").value_or("other");
    if (type == "github" || type == "gitlab" || type == "sourcehut" || type == "git") {
        auto raw_url = pick(locked, original, "url");
        GitInput g;
        g.name = name;
        g.forge = detect_forge(type, raw_url.value_or(""));
        g.owner = pick(locked, original, "owner").value_or("");
        g.repo = pick(locked, original, "repo").value_or("");
        g.host = pick(locked, original, "host");
        g.reference = opt_string(original, "ref");
        g.rev = opt_string(locked, "rev").value_or("");
        g.last_modified = last_modified_of(locked);
        if ((g.owner.empty() || g.repo.empty()) && raw_url) {
            if (auto loc = parse_remote_url(*raw_url)) {
                g.owner = loc->owner;
                g.repo = loc->repo;
                if (!g.host && !loc->host.empty() && g.forge != ForgeType::GitHub &&
                    g.forge != ForgeType::Codeberg)
                    g.host = loc->host;
            }
        }
        if (g.owner.empty() || g.repo.empty()) {
            return FlakeInput(OtherInput{name, raw_url.value_or("unknown"), g.rev,
                                         g.last_modified});
        }
        g.url = git_display_url(type, g, raw_url);
        return FlakeInput(std::move(g));
    }
    if (type == "path") {
        return FlakeInput(PathInput{name, pick(locked, original, "path").value_or("")});
    }
    return FlakeInput(OtherInput{name, pick(locked, original, "url").value_or("unknown"),
                                 opt_string(locked, "rev").value_or(""),
                                 last_modified_of(locked)});
}

} // namespace

std::optional<fs::path> resolve_flake_path(const fs::path& path, Error* error) {
    std::error_code ec;
    fs::path p = path;
    if (p.empty() || p == ".") {
        p = fs::current_path(ec);
        if (ec) {
            set_error(error, ErrorKind::FlakeNotFound, path.string());
            return std::nullopt;
        }
    }
    if (p.filename() == "flake.nix")
        p = p.parent_path();
    if (p.empty())
        p = ".";
    fs::path canonical = fs::canonical(p, ec);
    if (ec) {
        set_error(error, ErrorKind::FlakeNotFound, p.string());
        return std::nullopt;
    }
    if (!fs::exists(canonical / "flake.nix", ec)) {
        set_error(error, ErrorKind::FlakeNotFound, canonical.string());
        return std::nullopt;
    }
    return canonical;
}

std::optional<FlakeData> parse_metadata(const fs::path& flake_dir, const std::string& json_text,
                                        Error* error) {
    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        set_error(error, ErrorKind::Parse, "flake metadata is not a JSON object");
        return std::nullopt;
    }
    FlakeData data;
    data.path = flake_dir;
    data.description = opt_string(&root, "description");

    auto locks = root.find("locks");
    if (locks == root.end() || !locks->is_object())
        return data;
    auto nodes = locks->find("nodes");
    if (nodes == locks->end() || !nodes->is_object())
        return data;
    std::string root_name = opt_string(&*locks, "root").value_or("root");
    auto root_node = nodes->find(root_name);
    if (root_node == nodes->end() || !root_node->is_object())
        return data;
    auto inputs = root_node->find("inputs");
    if (inputs == root_node->end() || !inputs->is_object())
        return data;

    for (auto it = inputs->begin(); it != inputs->end(); ++it) {
        std::string node_name;
        if (it->is_string())
            node_name = it->get<std::string>();
        else if (it->is_array() && !it->empty() && it->front().is_string())
            node_name = it->front().get<std::string>();
        else
            continue;
        auto node = nodes->find(node_name);
        if (node == nodes->end() || !node->is_object())
            continue;
        if (auto input = parse_input(it.key(), *node))
            data.inputs.push_back(std::move(*input));
    }
    std::stable_sort(data.inputs.begin(), data.inputs.end(),
                     [](const FlakeInput& a, const FlakeInput& b) {
                         return lower(a.name()) < lower(b.name());
                     });
    return data;
}

NixService::NixService(CancellationToken cancel, std::chrono::milliseconds timeout)
    : cancel_(std::move(cancel)), timeout_(timeout) {}

std::optional<std::string> NixService::run_nix(const std::vector<std::string>& args,
                                               Error* error) {
    std::string cmdline = "nix";
    for (const auto& a : args)
        cmdline += " " + a;
    log_debug("Running nix", {{"command", cmdline}});
    if (!procutil::find_in_path("nix")) {
        set_error(error, ErrorKind::Process, "nix not found in PATH");
        return std::nullopt;
    }
    auto result = procutil::run_process("nix", args, timeout_, cancel_, error);
    if (!result)
        return std::nullopt;
    if (!result->success()) {
        std::string err = result->err;
        auto last = err.find_last_not_of(" \t\r\n");
        err = last == std::string::npos ? "nix exited with code " + std::to_string(result->exit_code)
                                        : err.substr(0, last + 1);
        log_warning("nix command failed", {{"command", cmdline}, {"stderr", err}});
        set_error(error, ErrorKind::Process, err);
        return std::nullopt;
    }
    return std::move(result->out);
}

std::optional<FlakeData> NixService::load_metadata(const fs::path& path, Error* error) {
    auto dir = resolve_flake_path(path, error);
    if (!dir)
        return std::nullopt;
    auto out = run_nix({"flake", "metadata", "--json", "--no-update-lock-file", dir->string()},
                       error);
    if (!out)
        return std::nullopt;
    auto data = parse_metadata(*dir, *out, error);
    if (data)
        log_info("Loaded flake", {{"path", dir->string()},
                                  {"inputs", std::to_string(data->inputs.size())}});
    return data;
}

bool NixService::update_inputs(const fs::path& path, const std::vector<std::string>& names,
                               Error* error) {
    if (names.empty())
        return true;
    std::vector<std::string> args{"flake", "update"};
    args.insert(args.end(), names.begin(), names.end());
    args.push_back("--flake");
    args.push_back(path.string());
    return run_nix(args, error).has_value();
}

bool NixService::update_all(const fs::path& path, Error* error) {
    return run_nix({"flake", "update", "--flake", path.string()}, error).has_value();
}

bool NixService::lock_input(const fs::path& path, const std::string& name,
                            const std::string& locator, Error* error) {
    log_info("Locking input", {{"input", name}, {"locator", locator}});
    return run_nix({"flake", "update", name, "--override-input", name, locator, "--flake",
                    path.string()},
                   error)
        .has_value();
}

} // namespace melt
