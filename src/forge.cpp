#include "forge.hpp"

#include <cctype>
#include <vector>

namespace melt {

namespace {

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string tilde_owner(const std::string& owner) {
    return starts_with(owner, "~") ? owner : "~" + owner;
}

bool is_scp_like(const std::string& url) {
    auto colon = url.find(':');
    if (colon == std::string::npos || url.find("://") != std::string::npos)
        return false;
    auto slash = url.find('/');
    return slash == std::string::npos || colon < slash;
}

} // namespace

ForgeType detect_forge(const std::string& type, const std::string& url) {
    if (type == "github")
        return ForgeType::GitHub;
    if (type == "gitlab")
        return ForgeType::GitLab;
    if (type == "sourcehut")
        return ForgeType::SourceHut;
    if (contains(url, "github.com"))
        return ForgeType::GitHub;
    if (contains(url, "gitlab"))
        return ForgeType::GitLab;
    if (contains(url, "sr.ht") || contains(url, "sourcehut"))
        return ForgeType::SourceHut;
    if (contains(url, "codeberg.org"))
        return ForgeType::Codeberg;
    if (contains(url, "gitea") || contains(url, "forgejo"))
        return ForgeType::Gitea;
    return ForgeType::Generic;
}

std::string normalize_remote_url(const std::string& url) {
    std::string out = url;
    if (starts_with(out, "git+"))
        out.erase(0, 4);
    auto cut = out.find_first_of("?#");
    if (cut != std::string::npos)
        out.erase(cut);
    return out;
}

std::optional<RemoteLocation> parse_remote_url(const std::string& url) {
    std::string s = normalize_remote_url(url);
    RemoteLocation loc;
    std::string path;
    auto scheme = s.find("://");
    if (scheme != std::string::npos) {
        std::string rest = s.substr(scheme + 3);
        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        path = slash == std::string::npos ? "" : rest.substr(slash + 1);
        auto at = authority.rfind('@');
        if (at != std::string::npos)
            authority.erase(0, at + 1);
        auto port = authority.find(':');
        if (port != std::string::npos)
            authority.erase(port);
        loc.host = authority;
    } else if (is_scp_like(s)) {
        auto colon = s.find(':');
        std::string authority = s.substr(0, colon);
        auto at = authority.rfind('@');
        if (at != std::string::npos)
            authority.erase(0, at + 1);
        loc.host = authority;
        path = s.substr(colon + 1);
    } else {
        path = s;
    }

    while (!path.empty() && path.back() == '/')
        path.pop_back();
    if (path.size() > 4 && path.compare(path.size() - 4, 4, ".git") == 0)
        path.erase(path.size() - 4);

    std::vector<std::string> segments;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty())
                segments.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty())
        segments.push_back(cur);
    if (segments.size() < 2)
        return std::nullopt;

    loc.repo = segments.back();
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (i > 0)
            loc.owner += '/';
        loc.owner += segments[i];
    }
    return loc;
}

std::string clone_url(ForgeType forge, const std::string& owner, const std::string& repo,
                      const std::optional<std::string>& host) {
    switch (forge) {
    case ForgeType::GitHub:
        return "https://github.com/" + owner + "/" + repo + ".git";
    case ForgeType::GitLab:
        return "https://" + host.value_or("gitlab.com") + "/" + owner + "/" + repo + ".git";
    case ForgeType::SourceHut:
        return "https://" + host.value_or("git.sr.ht") + "/" + tilde_owner(owner) + "/" + repo;
    case ForgeType::Codeberg:
        return "https://codeberg.org/" + owner + "/" + repo + ".git";
    case ForgeType::Gitea:
        return "https://" + host.value_or("gitea.com") + "/" + owner + "/" + repo + ".git";
    case ForgeType::Generic:
        break;
    }
    return "";
}

std::string clone_url(const GitInput& input) {
    return clone_url(input.forge, input.owner, input.repo, input.host);
}

std::string lock_url(ForgeType forge, const std::string& owner, const std::string& repo,
                     const std::string& rev, const std::optional<std::string>& host) {
    switch (forge) {
    case ForgeType::GitHub:
        return "github:" + owner + "/" + repo + "/" + rev;
    case ForgeType::GitLab:
        if (!host || *host == "gitlab.com")
            return "gitlab:" + owner + "/" + repo + "/" + rev;
        return "git+https://" + *host + "/" + owner + "/" + repo + "?rev=" + rev;
    case ForgeType::SourceHut:
        return "sourcehut:" + tilde_owner(owner) + "/" + repo + "/" + rev;
    case ForgeType::Codeberg:
        return "git+https://codeberg.org/" + owner + "/" + repo + "?rev=" + rev;
    case ForgeType::Gitea:
        return "git+https://" + host.value_or("gitea.com") + "/" + owner + "/" + repo +
               "?rev=" + rev;
    case ForgeType::Generic:
        break;
    }
    return "";
}

std::string lock_url(const GitInput& input, const std::string& rev) {
    return lock_url(input.forge, input.owner, input.repo, rev, input.host);
}

std::optional<std::string> mirror_url(const GitInput& input) {
    std::string url = clone_url(input);
    if (!url.empty())
        return url;
    std::string raw = normalize_remote_url(input.url);
    static const char* const schemes[] = {"https://", "http://", "ssh://", "git://", "file://"};
    for (const char* scheme : schemes) {
        if (starts_with(raw, scheme))
            return raw;
    }
    if (is_scp_like(raw) && raw.find('@') != std::string::npos)
        return raw;
    return std::nullopt;
}

std::string url_encode(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace melt
