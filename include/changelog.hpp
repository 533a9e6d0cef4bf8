#ifndef MELT_CHANGELOG_HPP
#define MELT_CHANGELOG_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "commit.hpp"

namespace melt {

/** Number of commits shown from the pinned revision backward. */
constexpr std::size_t CHANGELOG_TAIL_LIMIT = 50;

/**
 * @brief Whether commit @p sha is the pinned revision @p rev.
 *
 * Matches the full hash or an abbreviated prefix. An empty @p rev never
 * matches.
 */
bool sha_matches(const std::string& sha, const std::string& rev);

/**
 * @brief Merge commits ahead of the pin with the history below it.
 *
 * When @p tail is non-empty its first entry is marked as the locked commit
 * and `locked_idx` equals the size of @p ahead. Otherwise only @p ahead is
 * returned and `locked_idx` stays empty.
 */
ChangelogData assemble_changelog(std::vector<Commit> ahead, std::vector<Commit> tail);

/**
 * @brief Build changelog data from a newest-first listing returned by a
 *        forge API.
 *
 * The first commit matching @p rev becomes the locked entry. History after
 * it is cut so that at most @p tail_limit commits, the locked one included,
 * remain.
 */
ChangelogData changelog_from_listing(std::vector<Commit> commits, const std::string& rev,
                                     std::size_t tail_limit = CHANGELOG_TAIL_LIMIT);

} // namespace melt

#endif // MELT_CHANGELOG_HPP
