#include "git_service.hpp"

#include <algorithm>
#include <cstdlib>
#include "http_client.hpp"
#include "logger.hpp"
#include "repo_cache.hpp"
#include "version.hpp"

namespace melt {

std::optional<std::string> github_token_from_env() {
    for (const char* name : {"GITHUB_TOKEN", "GH_TOKEN"}) {
        const char* v = std::getenv(name);
        if (v && *v)
            return std::string(v);
    }
    return std::nullopt;
}

GitService::GitService(CancellationToken cancel, GitServiceConfig config)
    : cancel_(cancel), permits_(std::make_shared<Semaphore>(std::max<std::size_t>(
                           1, config.concurrency))),
      forge_(std::make_shared<ForgeClient>(
          std::make_shared<HttpClient>(config.http_timeout, MELT_USER_AGENT),
          std::make_shared<RepoCache>(config.cache_dir.empty() ? default_cache_dir()
                                                               : config.cache_dir),
          cancel, config.github_token ? config.github_token : github_token_from_env(),
          config.timeouts)),
      checker_(
          [forge = forge_](const GitInput& in, Error* e) { return forge->commits_ahead(in, e); },
          permits_, cancel, config.concurrency) {}

void GitService::check_updates(const std::vector<FlakeInput>& inputs,
                               const UpdateChecker::StatusCallback& on_status) {
    checker_.check(inputs, on_status);
}

std::optional<ChangelogData> GitService::get_changelog(const GitInput& input, Error* error) {
    log_debug("Loading changelog",
              {{"input", input.name}, {"forge", forge_name(input.forge)}});
    auto permit = permits_->acquire(cancel_);
    if (!permit) {
        set_error(error, ErrorKind::Cancelled, input.name);
        return std::nullopt;
    }
    return forge_->changelog(input, error);
}

} // namespace melt
