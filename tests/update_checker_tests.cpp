#include "test_common.hpp"
#include "fakes.hpp"
#include "forge_client.hpp"
#include "update_checker.hpp"

#include <atomic>
#include <map>
#include <mutex>

using namespace melt;

namespace {

FlakeInput git_input(const std::string& name) {
    GitInput g;
    g.name = name;
    g.forge = ForgeType::GitHub;
    g.owner = "o";
    g.repo = name;
    g.rev = "abc";
    return FlakeInput(g);
}

struct Recorder {
    std::vector<std::pair<std::string, UpdateStatus>> events;
    UpdateChecker::StatusCallback callback() {
        return [this](const std::string& name, const UpdateStatus& s) {
            events.emplace_back(name, s);
        };
    }
    std::map<std::string, UpdateStatus> last() const {
        std::map<std::string, UpdateStatus> out;
        for (const auto& e : events)
            out[e.first] = e.second;
        return out;
    }
};

} // namespace

TEST_CASE("Every git input is marked checking before any remote call") {
    std::atomic<int> calls{0};
    std::atomic<bool> checking_seen_first{true};
    Recorder rec;
    std::size_t checking_count = 0;
    UpdateChecker checker(
        [&](const GitInput&, Error*) -> std::optional<std::size_t> {
            if (checking_count != 2)
                checking_seen_first = false;
            ++calls;
            return 0;
        },
        std::make_shared<Semaphore>(4), CancellationToken{}, 2);
    std::vector<FlakeInput> inputs{git_input("a"), FlakeInput(PathInput{"p", "./p"}),
                                   git_input("b")};
    checker.check(inputs, [&](const std::string& n, const UpdateStatus& s) {
        if (s.kind == UpdateStatus::Kind::Checking)
            ++checking_count;
        rec.events.emplace_back(n, s);
    });
    REQUIRE(calls == 2);
    REQUIRE(checking_seen_first);
    REQUIRE(rec.events.size() == 4);
    REQUIRE(rec.last().count("p") == 0);
}

TEST_CASE("Ahead counts become statuses and failures become errors") {
    Recorder rec;
    UpdateChecker checker(
        [](const GitInput& in, Error* err) -> std::optional<std::size_t> {
            if (in.name == "behind")
                return 3;
            if (in.name == "current")
                return 0;
            set_error(err, ErrorKind::NotFound, "gone");
            return std::nullopt;
        },
        std::make_shared<Semaphore>(2), CancellationToken{});
    checker.check({git_input("behind"), git_input("current"), git_input("broken")},
                  rec.callback());
    auto last = rec.last();
    REQUIRE(last["behind"] == UpdateStatus::behind_by(3));
    REQUIRE(last["current"] == UpdateStatus::up_to_date());
    REQUIRE(last["broken"].kind == UpdateStatus::Kind::Error);
    REQUIRE(last["broken"].error.find("gone") != std::string::npos);
}

TEST_CASE("Exceptions from the ahead function are reported as errors") {
    Recorder rec;
    UpdateChecker checker(
        [](const GitInput&, Error*) -> std::optional<std::size_t> {
            throw std::runtime_error("exploded");
        },
        std::make_shared<Semaphore>(1), CancellationToken{});
    checker.check({git_input("x")}, rec.callback());
    REQUIRE(rec.last()["x"].kind == UpdateStatus::Kind::Error);
}

TEST_CASE("Concurrency never exceeds the semaphore") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    UpdateChecker checker(
        [&](const GitInput&, Error*) -> std::optional<std::size_t> {
            int now = ++active;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
            return 1;
        },
        std::make_shared<Semaphore>(2), CancellationToken{}, 8);
    std::vector<FlakeInput> inputs;
    for (int i = 0; i < 12; ++i)
        inputs.push_back(git_input("in" + std::to_string(i)));
    Recorder rec;
    checker.check(inputs, rec.callback());
    REQUIRE(peak <= 2);
    REQUIRE(rec.events.size() == 24);
}

TEST_CASE("Cancellation stops the pass without terminal reports") {
    CancellationToken cancel;
    Recorder rec;
    UpdateChecker checker(
        [&](const GitInput&, Error*) -> std::optional<std::size_t> {
            cancel.cancel();
            return 1;
        },
        std::make_shared<Semaphore>(1), cancel, 1);
    checker.check({git_input("a"), git_input("b"), git_input("c")}, rec.callback());
    for (const auto& e : rec.events)
        REQUIRE(e.second.kind == UpdateStatus::Kind::Checking);
}

TEST_CASE("No git inputs means no remote calls") {
    bool called = false;
    UpdateChecker checker(
        [&](const GitInput&, Error*) -> std::optional<std::size_t> {
            called = true;
            return 0;
        },
        std::make_shared<Semaphore>(1), CancellationToken{});
    Recorder rec;
    checker.check({FlakeInput(PathInput{"p", "."})}, rec.callback());
    REQUIRE_FALSE(called);
    REQUIRE(rec.events.empty());
}

TEST_CASE("One pass over a mixed flake settles every git input") {
    fs::path root = melt::test_support::fresh_dir("update_pass");
    auto http = std::make_shared<melt::test_support::FakeTransport>();
    http->route("/repos/NixOS/nixpkgs/compare/abc1234...nixos-unstable", 200,
                R"({"ahead_by": 3, "behind_by": 0})");
    CancellationToken cancel;
    auto client = std::make_shared<ForgeClient>(
        http, std::make_shared<RepoCache>(root / "cache"), cancel, std::nullopt,
        GitTimeouts{std::chrono::seconds(20), std::chrono::seconds(20)});

    GitInput nixpkgs;
    nixpkgs.name = "nixpkgs";
    nixpkgs.owner = "NixOS";
    nixpkgs.repo = "nixpkgs";
    nixpkgs.forge = ForgeType::GitHub;
    nixpkgs.reference = "nixos-unstable";
    nixpkgs.rev = "abc1234";

    GitInput custom;
    custom.name = "custom-git";
    custom.owner = "me";
    custom.repo = "gone";
    custom.forge = ForgeType::Generic;
    custom.rev = "def5678";
    custom.url = "git+file://" + (root / "no-such-upstream").string();

    std::vector<FlakeInput> inputs{FlakeInput(nixpkgs), FlakeInput(PathInput{"local", "./local"}),
                                   FlakeInput(custom)};
    UpdateChecker checker(
        [client](const GitInput& in, Error* e) { return client->commits_ahead(in, e); },
        std::make_shared<Semaphore>(10), cancel, 10);
    Recorder rec;
    checker.check(inputs, rec.callback());

    auto last = rec.last();
    REQUIRE(last.size() == 2);
    REQUIRE(last.count("local") == 0);
    REQUIRE(last["nixpkgs"] == UpdateStatus::behind_by(3));
    const UpdateStatus& generic = last["custom-git"];
    REQUIRE((generic.kind == UpdateStatus::Kind::Error ||
             generic.kind == UpdateStatus::Kind::UpToDate));
    for (const auto& kv : last)
        REQUIRE(kv.second.is_terminal());
    REQUIRE(http->requested.size() == 1);
    FS_REMOVE_ALL(root);
}
