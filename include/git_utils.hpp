#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "commit.hpp"
#include "errors.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference counts initialization, so guards may be nested. Every
 * thread running a libgit2 call holds one for the duration of the call.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> class GitHandle {
    T* h;

  public:
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& o) noexcept : h(std::exchange(o.h, nullptr)) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    T* get() const { return h; }
    explicit operator bool() const { return h != nullptr; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;

/** Upper bound on commits returned by commits_since(). */
constexpr std::size_t MAX_COMMITS_AHEAD = 500;

/**
 * @brief libgit2 credential callback used for every fetch and clone.
 *
 * Tries the SSH agent first (username from the URL, else `git`), then the
 * platform default credentials. Any other request fails.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

/**
 * @brief Make sure a bare mirror of @p url exists at @p path and is current.
 *
 * Opens an existing mirror and fetches every refspec configured for
 * `origin`, or performs a bare clone when nothing exists yet. When
 * @p reference is given the clone checks out that branch.
 *
 * @param path      Mirror location on disk.
 * @param url       Remote URL.
 * @param reference Optional branch to clone.
 * @param error     Receives ErrorKind::Cache, Clone, Network or AuthFailed.
 * @return `true` when the mirror is ready.
 */
bool ensure_repo(const fs::path& path, const std::string& url,
                 const std::optional<std::string>& reference, melt::Error* error = nullptr);

/**
 * @brief Resolve a branch, tag or revision inside a mirror.
 *
 * Tries `refs/remotes/origin/<name>`, then `refs/heads/<name>`, then `HEAD`
 * when @p name is literally `HEAD`, and finally a revision parse.
 */
std::optional<git_oid> resolve_ref(git_repository* repo, const std::string& name);

/**
 * @brief Commits reachable from @p head_ref but not from @p base_rev.
 *
 * @param repo     Path to the mirror.
 * @param base_rev Pinned revision. An unknown revision yields an empty list.
 * @param head_ref Branch to compare against, `HEAD` when absent.
 * @param error    Receives ErrorKind::RevisionNotFound when @p head_ref
 *                 cannot be resolved.
 * @return Newest-first list of at most MAX_COMMITS_AHEAD commits.
 */
std::optional<std::vector<melt::Commit>> commits_since(const fs::path& repo,
                                                       const std::string& base_rev,
                                                       const std::optional<std::string>& head_ref,
                                                       melt::Error* error = nullptr);

/**
 * @brief Walk history backward starting at @p rev.
 *
 * @return At most @p limit commits, newest first. Empty when @p rev is not
 *         present in the mirror.
 */
std::optional<std::vector<melt::Commit>> commits_from(const fs::path& repo, const std::string& rev,
                                                      std::size_t limit,
                                                      melt::Error* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
