#ifndef MELT_GIT_SERVICE_HPP
#define MELT_GIT_SERVICE_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "commit.hpp"
#include "errors.hpp"
#include "flake.hpp"
#include "forge_client.hpp"
#include "thread_utils.hpp"
#include "update_checker.hpp"

namespace melt {

/**
 * @brief Remote queries used by the application.
 */
class GitOperations {
  public:
    virtual ~GitOperations() = default;

    /** Check all git inputs, reporting through @p on_status. Blocks. */
    virtual void check_updates(const std::vector<FlakeInput>& inputs,
                               const UpdateChecker::StatusCallback& on_status) = 0;
    virtual std::optional<ChangelogData> get_changelog(const GitInput& input,
                                                       Error* error = nullptr) = 0;
};

struct GitServiceConfig {
    std::size_t concurrency = 10;
    std::chrono::milliseconds http_timeout = std::chrono::seconds(30);
    GitTimeouts timeouts;
    std::optional<std::string> github_token;
    std::filesystem::path cache_dir; ///< Empty selects default_cache_dir()
};

/** `GITHUB_TOKEN`, else `GH_TOKEN`, when set and non-empty. */
std::optional<std::string> github_token_from_env();

class GitService : public GitOperations {
  public:
    GitService(CancellationToken cancel, GitServiceConfig config = {});

    void check_updates(const std::vector<FlakeInput>& inputs,
                       const UpdateChecker::StatusCallback& on_status) override;
    std::optional<ChangelogData> get_changelog(const GitInput& input,
                                               Error* error = nullptr) override;

  private:
    CancellationToken cancel_;
    std::shared_ptr<Semaphore> permits_;
    std::shared_ptr<ForgeClient> forge_;
    UpdateChecker checker_;
};

} // namespace melt

#endif // MELT_GIT_SERVICE_HPP
