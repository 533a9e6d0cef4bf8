#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

const std::vector<OptionInfo>& option_table() {
    static const std::vector<OptionInfo> opts = {
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--config", "-c", "<file>", "Load options from a YAML or JSON file", "Config"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--concurrency", "-n", "<n>", "Concurrent repository operations (default 10)",
         "Network"},
        {"--http-timeout", "", "<N[s|m|h]>", "Forge API request timeout (default 30s)",
         "Network"},
        {"--update-timeout", "", "<N[s|m|h]>", "Mirror update check timeout (default 120s)",
         "Network"},
        {"--changelog-timeout", "", "<N[s|m|h]>", "Mirror changelog timeout (default 120s)",
         "Network"},
        {"--nix-timeout", "", "<N[s|m|h]>", "nix command timeout (default 120s)", "Network"},
        {"--github-token", "", "<token>", "GitHub API token (else GITHUB_TOKEN or GH_TOKEN)",
         "Network"},
        {"--cache-dir", "", "<path>", "Directory holding repository mirrors", "Network"},
        {"--log-file", "", "<path>", "Log file (default ~/.local/share/melt/melt.log)",
         "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning or error (or MELT_LOG)",
         "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file when over this size", "Logging"},
        {"--compress-logs", "", "", "gzip rotated log files", "Logging"}};
    return opts;
}

std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    flag += *o.short_flag ? std::string(o.short_flag) + ", " : std::string("    ");
    flag += o.long_flag;
    if (*o.arg)
        flag += std::string(" ") + o.arg;
    return flag;
}

} // namespace

std::string help_text(const char* prog) {
    std::map<std::string, std::vector<const OptionInfo*>> groups;
    std::size_t width = 0;
    for (const auto& o : option_table()) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    std::ostringstream out;
    out << "melt - Nix flake input updater\n";
    out << "Shows the inputs of a flake, checks them for new commits and\n";
    out << "updates or pins them from an interactive terminal UI.\n\n";
    out << "Usage: " << prog << " [FLAKE] [options]\n";
    out << "       FLAKE is a directory or flake.nix path, default \".\"\n\n";
    for (const char* cat : {"Basics", "Display", "Config", "Network", "Logging"}) {
        auto it = groups.find(cat);
        if (it == groups.end())
            continue;
        out << cat << ":\n";
        for (const auto* o : it->second)
            out << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                << o->desc << "\n";
        out << "\n";
    }
    out << "Keys:\n";
    out << "  j/k      move            space  select / pin commit\n";
    out << "  u        update selected U      update all\n";
    out << "  c/enter  changelog       r      refresh\n";
    out << "  q/esc    back or quit\n";
    return out.str();
}

void print_help(const char* prog) { std::cout << help_text(prog); }
