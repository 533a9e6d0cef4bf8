#include "test_common.hpp"
#include "forge_client.hpp"
#include "git_utils.hpp"

using namespace melt;
using namespace melt::test_support;

TEST_CASE("Mirror walk counts commits ahead of the pin") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    fs::path root = fresh_dir("git_fallback_ahead");
    fs::path upstream = root / "upstream";
    init_repo(upstream);
    std::string pinned = commit_file(upstream, "first");
    commit_file(upstream, "second");
    std::string head = commit_file(upstream, "third");

    RepoCache cache(root / "cache");
    CancellationToken cancel;
    std::string url = "file://" + upstream.string();
    Error err;
    auto mirror = cache.ensure(url, std::nullopt, cancel, &err);
    REQUIRE(mirror);
    REQUIRE(fs::exists(*mirror));

    auto ahead = git::commits_since(*mirror, pinned, std::nullopt, &err);
    REQUIRE(ahead);
    REQUIRE(ahead->size() == 2);
    REQUIRE(ahead->front().sha == head);
    REQUIRE(ahead->front().message == "third");
    REQUIRE(ahead->front().author == "tester");

    auto none = git::commits_since(*mirror, head, std::string("main"), &err);
    REQUIRE(none);
    REQUIRE(none->empty());

    auto tail = git::commits_from(*mirror, pinned, 50, &err);
    REQUIRE(tail);
    REQUIRE(tail->size() == 1);
    REQUIRE(tail->front().sha == pinned);

    FS_REMOVE_ALL(root);
}

TEST_CASE("Mirror refresh picks up new upstream commits") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    fs::path root = fresh_dir("git_fallback_refresh");
    fs::path upstream = root / "upstream";
    init_repo(upstream);
    std::string pinned = commit_file(upstream, "base");

    RepoCache cache(root / "cache");
    CancellationToken cancel;
    std::string url = "file://" + upstream.string();
    auto mirror = cache.ensure(url, std::nullopt, cancel);
    REQUIRE(mirror);
    auto before = git::commits_since(*mirror, pinned, std::string("main"));
    REQUIRE(before);
    REQUIRE(before->empty());

    commit_file(upstream, "later");
    REQUIRE(cache.ensure(url, std::nullopt, cancel));
    auto after = git::commits_since(*mirror, pinned, std::string("main"));
    REQUIRE(after);
    REQUIRE(after->size() == 1);

    FS_REMOVE_ALL(root);
}

TEST_CASE("Unreadable mirror is replaced by a fresh clone") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    fs::path root = fresh_dir("git_fallback_corrupt");
    fs::path upstream = root / "upstream";
    init_repo(upstream);
    commit_file(upstream, "only");

    RepoCache cache(root / "cache");
    std::string url = "file://" + upstream.string();
    fs::path target = cache.path_for(url);
    fs::create_directories(target);
    std::ofstream(target / "garbage") << "x";

    Error err;
    auto mirror = cache.ensure(url, std::nullopt, CancellationToken{}, &err);
    REQUIRE(mirror);
    REQUIRE_FALSE(fs::exists(target / "garbage"));

    FS_REMOVE_ALL(root);
}

TEST_CASE("Unknown head reference is reported") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    fs::path root = fresh_dir("git_fallback_badref");
    fs::path upstream = root / "upstream";
    init_repo(upstream);
    std::string pinned = commit_file(upstream, "only");

    RepoCache cache(root / "cache");
    auto mirror = cache.ensure("file://" + upstream.string(), std::nullopt, CancellationToken{});
    REQUIRE(mirror);
    Error err;
    auto r = git::commits_since(*mirror, pinned, std::string("no-such-branch"), &err);
    REQUIRE_FALSE(r);
    REQUIRE(err.kind == ErrorKind::RevisionNotFound);

    FS_REMOVE_ALL(root);
}

TEST_CASE("Generic input changelog through the mirror") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    fs::path root = fresh_dir("git_fallback_changelog");
    fs::path upstream = root / "upstream";
    init_repo(upstream);
    commit_file(upstream, "one");
    std::string pinned = commit_file(upstream, "two");
    commit_file(upstream, "three");

    GitInput in;
    in.name = "local";
    in.forge = ForgeType::Generic;
    in.url = "git+file://" + upstream.string();
    in.rev = pinned;

    struct NoHttp : HttpTransport {
        std::optional<HttpResponse> get(const std::string&, const std::vector<std::string>&,
                                        Error* error) override {
            set_error(error, ErrorKind::Network, "unused");
            return std::nullopt;
        }
    };
    ForgeClient client(std::make_shared<NoHttp>(), std::make_shared<RepoCache>(root / "cache"),
                       CancellationToken{});
    Error err;
    auto ahead = client.commits_ahead(in, &err);
    REQUIRE(ahead == std::optional<std::size_t>(1));

    auto data = client.changelog(in, &err);
    REQUIRE(data);
    REQUIRE(data->commits.size() == 3);
    REQUIRE(data->locked_idx == std::optional<std::size_t>(1));
    REQUIRE(data->commits[1].sha == pinned);
    REQUIRE(data->commits[1].is_locked);
    REQUIRE(data->commits[2].message == "one");

    FS_REMOVE_ALL(root);
}
