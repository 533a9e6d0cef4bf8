#ifndef MELT_COMMIT_HPP
#define MELT_COMMIT_HPP

#include <cstddef>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace melt {

struct Commit {
    std::string sha;
    std::string message; ///< First line only
    std::string author;
    std::time_t date = 0;
    bool is_locked = false;

    std::string short_sha() const { return sha.substr(0, 7); }
};

/**
 * @brief Ordered commit history of one input, newest first.
 *
 * Entries before @c locked_idx are ahead of the pinned revision. The entry at
 * @c locked_idx is the pinned commit and everything after it is older history.
 */
struct ChangelogData {
    std::vector<Commit> commits;
    std::optional<std::size_t> locked_idx;

    std::size_t commits_ahead() const { return locked_idx.value_or(commits.size()); }

    std::size_t commits_behind() const {
        if (!locked_idx || commits.size() <= *locked_idx + 1)
            return 0;
        return commits.size() - (*locked_idx + 1);
    }
};

} // namespace melt

#endif // MELT_COMMIT_HPP
