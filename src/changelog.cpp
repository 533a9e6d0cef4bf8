#include "changelog.hpp"

#include <iterator>

namespace melt {

bool sha_matches(const std::string& sha, const std::string& rev) {
    return !rev.empty() && sha.rfind(rev, 0) == 0;
}

ChangelogData assemble_changelog(std::vector<Commit> ahead, std::vector<Commit> tail) {
    ChangelogData data;
    data.commits = std::move(ahead);
    for (auto& c : data.commits)
        c.is_locked = false;
    if (tail.empty())
        return data;
    for (auto& c : tail)
        c.is_locked = false;
    tail.front().is_locked = true;
    data.locked_idx = data.commits.size();
    data.commits.insert(data.commits.end(), std::make_move_iterator(tail.begin()),
                        std::make_move_iterator(tail.end()));
    return data;
}

ChangelogData changelog_from_listing(std::vector<Commit> commits, const std::string& rev,
                                     std::size_t tail_limit) {
    ChangelogData data;
    data.commits = std::move(commits);
    for (std::size_t i = 0; i < data.commits.size(); ++i) {
        auto& c = data.commits[i];
        c.is_locked = !data.locked_idx && sha_matches(c.sha, rev);
        if (c.is_locked)
            data.locked_idx = i;
    }
    if (data.locked_idx && tail_limit > 0 && data.commits.size() > *data.locked_idx + tail_limit)
        data.commits.resize(*data.locked_idx + tail_limit);
    return data;
}

} // namespace melt
