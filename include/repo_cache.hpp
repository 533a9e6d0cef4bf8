#ifndef MELT_REPO_CACHE_HPP
#define MELT_REPO_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "errors.hpp"
#include "thread_utils.hpp"

namespace melt {

/**
 * @brief Default mirror directory.
 *
 * `$XDG_CACHE_HOME/melt/git`, else `$HOME/.cache/melt/git`, else
 * `.cache/melt/git` relative to the working directory.
 */
std::filesystem::path default_cache_dir();

/** 64-bit FNV-1a hash, stable across runs and builds. */
std::uint64_t fnv1a64(const std::string& s);

/**
 * @brief Bare mirrors of remote repositories kept on disk.
 *
 * Entries are created lazily and never evicted. Clones and fetches of the
 * same entry are serialized so two workers never write one mirror at once.
 */
class RepoCache {
  public:
    explicit RepoCache(std::filesystem::path dir = default_cache_dir());

    const std::filesystem::path& dir() const { return dir_; }

    /**
     * @brief Deterministic mirror path for @p url.
     *
     * The name is the first 32 characters of @p url that are alphanumeric,
     * `-` or `_`, followed by `_` and the hex FNV-1a hash of the full URL.
     */
    std::filesystem::path path_for(const std::string& url) const;

    /**
     * @brief Clone or refresh the mirror of @p url.
     *
     * @param cancel Checked before any work starts.
     * @return Mirror path when ready, `std::nullopt` with @p error set
     *         otherwise.
     */
    std::optional<std::filesystem::path> ensure(const std::string& url,
                                                const std::optional<std::string>& reference,
                                                const CancellationToken& cancel,
                                                Error* error = nullptr);

  private:
    std::shared_ptr<std::mutex> lock_for(const std::filesystem::path& path);

    std::filesystem::path dir_;
    std::mutex locks_mtx_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace melt

#endif // MELT_REPO_CACHE_HPP
