#include "forge_client.hpp"

#include <ctime>
#include <nlohmann/json.hpp>
#include "changelog.hpp"
#include "forge.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

using json = nlohmann::json;

namespace melt {

namespace {

const char* const RATE_LIMIT_MESSAGE =
    "GitHub API rate limit exceeded. Set GITHUB_TOKEN for higher limits.";

std::string first_line(const std::string& s) { return s.substr(0, s.find('\n')); }

std::string string_field(const json& obj, const char* key, const std::string& def = "") {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return def;
    return it->get<std::string>();
}

std::time_t date_field(const json& obj, const char* key) {
    auto parsed = parse_rfc3339(string_field(obj, key));
    return parsed ? *parsed : std::time(nullptr);
}

std::string head_of(const GitInput& input) { return input.reference.value_or("HEAD"); }

} // namespace

std::optional<std::size_t> parse_github_compare(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    auto it = j.find("ahead_by");
    if (it == j.end() || !it->is_number_integer() || it->get<long long>() < 0)
        return std::nullopt;
    return static_cast<std::size_t>(it->get<long long>());
}

std::optional<std::vector<Commit>> parse_github_commits(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        return std::nullopt;
    std::vector<Commit> out;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("sha") || !item["sha"].is_string())
            return std::nullopt;
        auto commit = item.find("commit");
        if (commit == item.end() || !commit->is_object())
            return std::nullopt;
        Commit c;
        c.sha = item["sha"].get<std::string>();
        c.message = first_line(string_field(*commit, "message"));
        c.author = "Unknown";
        c.date = std::time(nullptr);
        auto author = commit->find("author");
        if (author != commit->end() && author->is_object()) {
            c.author = string_field(*author, "name", "Unknown");
            c.date = date_field(*author, "date");
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::optional<std::size_t> parse_gitlab_compare(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    auto it = j.find("commits");
    if (it == j.end() || !it->is_array())
        return std::nullopt;
    return it->size();
}

std::optional<std::vector<Commit>> parse_gitlab_commits(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        return std::nullopt;
    std::vector<Commit> out;
    for (const auto& item : j) {
        if (!item.is_object() || string_field(item, "id").empty())
            return std::nullopt;
        Commit c;
        c.sha = string_field(item, "id");
        c.message = first_line(string_field(item, "title"));
        c.author = string_field(item, "author_name", "Unknown");
        c.date = date_field(item, "created_at");
        out.push_back(std::move(c));
    }
    return out;
}

std::optional<std::vector<Commit>> parse_sourcehut_log(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    auto results = j.find("results");
    if (results == j.end() || !results->is_array())
        return std::nullopt;
    std::vector<Commit> out;
    for (const auto& item : *results) {
        if (!item.is_object() || string_field(item, "id").empty())
            return std::nullopt;
        Commit c;
        c.sha = string_field(item, "id");
        c.message = first_line(string_field(item, "message"));
        c.author = "Unknown";
        auto author = item.find("author");
        if (author != item.end() && author->is_object())
            c.author = string_field(*author, "name", "Unknown");
        c.date = date_field(item, "timestamp");
        out.push_back(std::move(c));
    }
    return out;
}

std::size_t count_ahead_of(const std::vector<Commit>& log, const std::string& rev) {
    std::size_t n = 0;
    for (const auto& c : log) {
        if (sha_matches(c.sha, rev))
            break;
        ++n;
    }
    return n;
}

ForgeClient::ForgeClient(std::shared_ptr<HttpTransport> http, std::shared_ptr<RepoCache> cache,
                         CancellationToken cancel, std::optional<std::string> github_token,
                         GitTimeouts timeouts)
    : http_(std::move(http)), cache_(std::move(cache)), cancel_(std::move(cancel)),
      github_token_(std::move(github_token)), timeouts_(timeouts) {}

std::vector<std::string> ForgeClient::github_headers() const {
    std::vector<std::string> headers{"Accept: application/vnd.github+json"};
    if (github_token_ && !github_token_->empty())
        headers.push_back("Authorization: Bearer " + *github_token_);
    return headers;
}

ForgeClient::ApiOutcome ForgeClient::github_get(const std::string& url, std::string& body,
                                                Error* error) {
    Error transport;
    auto resp = http_->get(url, github_headers(), &transport);
    if (!resp) {
        log_debug("GitHub API unreachable, using mirror", {{"error", transport.message}});
        return ApiOutcome::Fallback;
    }
    if (resp->status == 403 || resp->status == 429) {
        long remaining = 0;
        if (auto hdr = resp->header("x-ratelimit-remaining")) {
            try {
                remaining = std::stol(*hdr);
            } catch (const std::exception&) {
                remaining = 0;
            }
        }
        if (remaining == 0) {
            log_warning("GitHub API rate limit exceeded", {{"url", url}});
            set_error(error, ErrorKind::RateLimited, RATE_LIMIT_MESSAGE);
            return ApiOutcome::Failed;
        }
    }
    if (!resp->ok())
        return ApiOutcome::Fallback;
    body = std::move(resp->body);
    return ApiOutcome::Ok;
}

ForgeClient::ApiOutcome ForgeClient::plain_get(const std::string& url, std::string& body) {
    Error transport;
    auto resp = http_->get(url, {"Accept: application/json"}, &transport);
    if (!resp || !resp->ok())
        return ApiOutcome::Fallback;
    body = std::move(resp->body);
    return ApiOutcome::Ok;
}

std::optional<std::size_t> ForgeClient::commits_ahead(const GitInput& input, Error* error) {
    std::string body;
    switch (input.forge) {
    case ForgeType::GitHub: {
        std::string url = "https://api.github.com/repos/" + input.owner + "/" + input.repo +
                          "/compare/" + input.rev + "..." + head_of(input);
        ApiOutcome outcome = github_get(url, body, error);
        if (outcome == ApiOutcome::Failed)
            return std::nullopt;
        if (outcome == ApiOutcome::Ok) {
            if (auto n = parse_github_compare(body))
                return n;
        }
        break;
    }
    case ForgeType::GitLab: {
        std::string url = "https://" + input.host.value_or("gitlab.com") + "/api/v4/projects/" +
                          url_encode(input.owner + "/" + input.repo) +
                          "/repository/compare?from=" + input.rev + "&to=" + head_of(input);
        if (plain_get(url, body) == ApiOutcome::Ok) {
            if (auto n = parse_gitlab_compare(body))
                return n;
        }
        break;
    }
    case ForgeType::SourceHut: {
        std::string owner = input.owner.rfind('~', 0) == 0 ? input.owner : "~" + input.owner;
        std::string url = "https://" + input.host.value_or("git.sr.ht") + "/api/" + owner + "/" +
                          input.repo + "/log/" + head_of(input);
        if (plain_get(url, body) == ApiOutcome::Ok) {
            if (auto log = parse_sourcehut_log(body))
                return count_ahead_of(*log, input.rev);
        }
        break;
    }
    case ForgeType::Codeberg:
    case ForgeType::Gitea:
    case ForgeType::Generic:
        break;
    }
    return fallback_ahead(input, error);
}

std::optional<ChangelogData> ForgeClient::changelog(const GitInput& input, Error* error) {
    std::string body;
    std::optional<std::vector<Commit>> listing;
    switch (input.forge) {
    case ForgeType::GitHub: {
        std::string url = "https://api.github.com/repos/" + input.owner + "/" + input.repo +
                          "/commits?sha=" + head_of(input) + "&per_page=100";
        ApiOutcome outcome = github_get(url, body, error);
        if (outcome == ApiOutcome::Failed)
            return std::nullopt;
        if (outcome == ApiOutcome::Ok)
            listing = parse_github_commits(body);
        break;
    }
    case ForgeType::GitLab: {
        std::string url = "https://" + input.host.value_or("gitlab.com") + "/api/v4/projects/" +
                          url_encode(input.owner + "/" + input.repo) +
                          "/repository/commits?ref_name=" + head_of(input) + "&per_page=100";
        if (plain_get(url, body) == ApiOutcome::Ok)
            listing = parse_gitlab_commits(body);
        break;
    }
    case ForgeType::SourceHut: {
        std::string owner = input.owner.rfind('~', 0) == 0 ? input.owner : "~" + input.owner;
        std::string url = "https://" + input.host.value_or("git.sr.ht") + "/api/" + owner + "/" +
                          input.repo + "/log/" + head_of(input);
        if (plain_get(url, body) == ApiOutcome::Ok)
            listing = parse_sourcehut_log(body);
        break;
    }
    case ForgeType::Codeberg:
    case ForgeType::Gitea:
    case ForgeType::Generic:
        break;
    }
    if (listing)
        return changelog_from_listing(std::move(*listing), input.rev);
    return fallback_changelog(input, error);
}

std::optional<std::size_t> ForgeClient::fallback_ahead(const GitInput& input, Error* error) {
    auto url = mirror_url(input);
    if (!url) {
        set_error(error, ErrorKind::Unsupported, "cannot determine a clone URL for " + input.name);
        return std::nullopt;
    }
    log_debug("Using mirror fallback", {{"input", input.name}, {"url", *url}});
    auto cache = cache_;
    auto cancel = cancel_;
    auto reference = input.reference;
    auto rev = input.rev;
    return run_with_timeout<std::size_t>(
        [cache, cancel, url = *url, reference, rev](Error* e) -> std::optional<std::size_t> {
            auto path = cache->ensure(url, reference, cancel, e);
            if (!path)
                return std::nullopt;
            auto commits = git::commits_since(*path, rev, reference, e);
            if (!commits)
                return std::nullopt;
            return commits->size();
        },
        timeouts_.update_check, cancel_, error, "checking updates for " + input.name);
}

std::optional<ChangelogData> ForgeClient::fallback_changelog(const GitInput& input,
                                                             Error* error) {
    auto url = mirror_url(input);
    if (!url) {
        set_error(error, ErrorKind::Unsupported, "cannot determine a clone URL for " + input.name);
        return std::nullopt;
    }
    auto cache = cache_;
    auto cancel = cancel_;
    auto reference = input.reference;
    auto rev = input.rev;
    return run_with_timeout<ChangelogData>(
        [cache, cancel, url = *url, reference, rev](Error* e) -> std::optional<ChangelogData> {
            auto path = cache->ensure(url, reference, cancel, e);
            if (!path)
                return std::nullopt;
            auto ahead = git::commits_since(*path, rev, reference, e);
            if (!ahead)
                return std::nullopt;
            auto tail = git::commits_from(*path, rev, CHANGELOG_TAIL_LIMIT, e);
            if (!tail)
                return std::nullopt;
            return assemble_changelog(std::move(*ahead), std::move(*tail));
        },
        timeouts_.changelog, cancel_, error, "loading changelog for " + input.name);
}

} // namespace melt
