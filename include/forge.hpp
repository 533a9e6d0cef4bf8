#ifndef MELT_FORGE_HPP
#define MELT_FORGE_HPP

#include <optional>
#include <string>
#include "flake.hpp"

namespace melt {

/**
 * @brief Owner, repository and host parsed out of a remote URL.
 */
struct RemoteLocation {
    std::string host;
    std::string owner; ///< May contain slashes for nested groups
    std::string repo;
};

/**
 * @brief Resolve the forge family of an input.
 *
 * The declared lock types `github`, `gitlab` and `sourcehut` map directly.
 * For plain `git` inputs the URL is sniffed for well known hosts.
 *
 * @param type Lock type as written by nix (`github`, `git`, ...).
 * @param url  Remote URL, used only when @p type is not a forge type.
 */
ForgeType detect_forge(const std::string& type, const std::string& url);

/**
 * @brief Drop a `git+` prefix, query string and fragment from a nix locator.
 */
std::string normalize_remote_url(const std::string& url);

/**
 * @brief Split a remote URL into host, owner and repository.
 *
 * Accepts `https://`, `http://`, `ssh://` and `git://` URLs as well as the
 * SCP form `user@host:owner/repo`. A trailing `.git` is removed and every path
 * segment before the last one is kept as the owner.
 *
 * @return Parsed location or `std::nullopt` when fewer than two path
 *         segments are present.
 */
std::optional<RemoteLocation> parse_remote_url(const std::string& url);

/**
 * @brief HTTPS clone URL for a repository on a known forge.
 *
 * @return Empty string for ForgeType::Generic.
 */
std::string clone_url(ForgeType forge, const std::string& owner, const std::string& repo,
                      const std::optional<std::string>& host = std::nullopt);
std::string clone_url(const GitInput& input);

/**
 * @brief Nix flake reference pinning a repository to @p rev.
 *
 * @return Empty string when the forge has no lockable form.
 */
std::string lock_url(ForgeType forge, const std::string& owner, const std::string& repo,
                     const std::string& rev,
                     const std::optional<std::string>& host = std::nullopt);
std::string lock_url(const GitInput& input, const std::string& rev);

/**
 * @brief URL used by the local mirror path.
 *
 * Same as clone_url() for known forges. Generic inputs use their own remote
 * URL when it is fetchable; otherwise `std::nullopt`.
 */
std::optional<std::string> mirror_url(const GitInput& input);

/** Percent-encode everything except unreserved characters. */
std::string url_encode(const std::string& s);

} // namespace melt

#endif // MELT_FORGE_HPP
