#ifndef MELT_FORGE_CLIENT_HPP
#define MELT_FORGE_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "commit.hpp"
#include "errors.hpp"
#include "flake.hpp"
#include "http_client.hpp"
#include "repo_cache.hpp"
#include "thread_utils.hpp"

namespace melt {

/** Deadlines for the blocking mirror walks. */
struct GitTimeouts {
    std::chrono::milliseconds update_check = std::chrono::seconds(120);
    std::chrono::milliseconds changelog = std::chrono::seconds(120);
};

// Decoders for forge API responses. Each returns std::nullopt when the body
// does not have the expected shape.
std::optional<std::size_t> parse_github_compare(const std::string& body);
std::optional<std::vector<Commit>> parse_github_commits(const std::string& body);
std::optional<std::size_t> parse_gitlab_compare(const std::string& body);
std::optional<std::vector<Commit>> parse_gitlab_commits(const std::string& body);
std::optional<std::vector<Commit>> parse_sourcehut_log(const std::string& body);

/**
 * @brief Entries of a SourceHut log listed before the pinned revision.
 *
 * All entries count when @p rev is absent from the listing.
 */
std::size_t count_ahead_of(const std::vector<Commit>& log, const std::string& rev);

/**
 * @brief Answers "how far behind is this input" and "what changed" for one
 *        git input.
 *
 * GitHub, GitLab and SourceHut are asked through their REST APIs first. Any
 * transport failure, non-success status or malformed body drops to the local
 * mirror. A GitHub rate limit is reported as-is. Codeberg, Gitea and generic
 * remotes always use the mirror.
 */
class ForgeClient {
  public:
    ForgeClient(std::shared_ptr<HttpTransport> http, std::shared_ptr<RepoCache> cache,
                CancellationToken cancel, std::optional<std::string> github_token = std::nullopt,
                GitTimeouts timeouts = {});
    virtual ~ForgeClient() = default;

    /** Number of commits on the tracked branch that are newer than the pin. */
    std::optional<std::size_t> commits_ahead(const GitInput& input, Error* error = nullptr);

    /** Newest-first history around the pinned revision. */
    std::optional<ChangelogData> changelog(const GitInput& input, Error* error = nullptr);

  protected:
    virtual std::optional<std::size_t> fallback_ahead(const GitInput& input, Error* error);
    virtual std::optional<ChangelogData> fallback_changelog(const GitInput& input, Error* error);

  private:
    enum class ApiOutcome { Ok, Fallback, Failed };

    std::vector<std::string> github_headers() const;
    ApiOutcome github_get(const std::string& url, std::string& body, Error* error);
    ApiOutcome plain_get(const std::string& url, std::string& body);

    std::shared_ptr<HttpTransport> http_;
    std::shared_ptr<RepoCache> cache_;
    CancellationToken cancel_;
    std::optional<std::string> github_token_;
    GitTimeouts timeouts_;
};

} // namespace melt

#endif // MELT_FORGE_CLIENT_HPP
