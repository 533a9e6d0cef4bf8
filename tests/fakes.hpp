#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "git_service.hpp"
#include "http_client.hpp"
#include "nix_service.hpp"

namespace melt::test_support {

inline GitInput github_input(const std::string& name, const std::string& rev = "0123456789abc") {
    GitInput g;
    g.name = name;
    g.owner = "owner";
    g.repo = name;
    g.forge = ForgeType::GitHub;
    g.rev = rev;
    g.last_modified = 1700000000;
    g.url = "github:owner/" + name;
    return g;
}

/** Flake with two GitHub inputs, one path input and one generic git input. */
inline FlakeData sample_flake() {
    FlakeData data;
    data.path = "/tmp/melt-flake";
    data.inputs.emplace_back(github_input("home-manager"));
    data.inputs.emplace_back(PathInput{"local", "./local"});
    data.inputs.emplace_back(github_input("nixpkgs"));
    GitInput generic;
    generic.name = "self-hosted";
    generic.owner = "me";
    generic.repo = "thing";
    generic.forge = ForgeType::Generic;
    generic.rev = "fedcba9876543";
    generic.url = "git+https://example.org/me/thing";
    data.inputs.emplace_back(generic);
    return data;
}

inline ChangelogData sample_changelog() {
    ChangelogData d;
    d.commits.push_back(Commit{"aaaaaaa1111", "feat: new thing", "Ann", 1700000300, false});
    d.commits.push_back(Commit{"bbbbbbb2222", "fix: bug", "Bob", 1700000200, false});
    d.commits.push_back(Commit{"0123456789abc", "pinned commit", "Cy", 1700000100, true});
    d.commits.push_back(Commit{"ccccccc3333", "old stuff", "Dee", 1700000000, false});
    d.locked_idx = 2;
    return d;
}

/** Records every call and answers from fields set by the test. */
class FakeNix : public NixOperations {
  public:
    std::mutex mtx;
    std::optional<FlakeData> metadata = sample_flake();
    bool update_ok = true;
    bool lock_ok = true;
    std::atomic<int> loads{0};
    std::vector<std::vector<std::string>> updated;
    std::atomic<int> update_all_calls{0};
    std::vector<std::pair<std::string, std::string>> locks;

    std::optional<FlakeData> load_metadata(const std::filesystem::path&, Error* error) override {
        std::lock_guard<std::mutex> lk(mtx);
        ++loads;
        if (!metadata)
            set_error(error, ErrorKind::FlakeNotFound, "/nowhere");
        return metadata;
    }
    bool update_inputs(const std::filesystem::path&, const std::vector<std::string>& names,
                       Error* error) override {
        std::lock_guard<std::mutex> lk(mtx);
        updated.push_back(names);
        if (!update_ok)
            set_error(error, ErrorKind::Process, "nix said no");
        return update_ok;
    }
    bool update_all(const std::filesystem::path&, Error* error) override {
        std::lock_guard<std::mutex> lk(mtx);
        ++update_all_calls;
        if (!update_ok)
            set_error(error, ErrorKind::Process, "nix said no");
        return update_ok;
    }
    bool lock_input(const std::filesystem::path&, const std::string& name,
                    const std::string& locator, Error* error) override {
        std::lock_guard<std::mutex> lk(mtx);
        locks.emplace_back(name, locator);
        if (!lock_ok)
            set_error(error, ErrorKind::Process, "lock refused");
        return lock_ok;
    }
};

class FakeGit : public GitOperations {
  public:
    std::mutex mtx;
    std::optional<ChangelogData> changelog = sample_changelog();
    std::size_t behind = 2;
    std::atomic<int> checks{0};

    void check_updates(const std::vector<FlakeInput>& inputs,
                       const UpdateChecker::StatusCallback& on_status) override {
        ++checks;
        for (const auto& in : inputs) {
            if (in.is_git())
                on_status(in.name(), UpdateStatus::behind_by(behind));
        }
    }
    std::optional<ChangelogData> get_changelog(const GitInput&, Error* error) override {
        std::lock_guard<std::mutex> lk(mtx);
        if (!changelog)
            set_error(error, ErrorKind::Network, "unreachable");
        return changelog;
    }
};

/**
 * @brief Serves canned responses keyed by URL substring and records every
 *        request. Unrouted URLs answer 404.
 */
class FakeTransport : public HttpTransport {
  public:
    std::vector<std::pair<std::string, HttpResponse>> routes;
    std::vector<std::string> requested;
    std::vector<std::vector<std::string>> sent_headers;
    bool offline = false;

    void route(const std::string& needle, long status, const std::string& body,
               std::map<std::string, std::string> headers = {}) {
        HttpResponse r;
        r.status = status;
        r.body = body;
        r.headers = std::move(headers);
        routes.emplace_back(needle, r);
    }

    std::optional<HttpResponse> get(const std::string& url,
                                    const std::vector<std::string>& headers,
                                    Error* error) override {
        std::lock_guard<std::mutex> lk(mtx_);
        requested.push_back(url);
        sent_headers.push_back(headers);
        if (offline) {
            set_error(error, ErrorKind::Network, "offline");
            return std::nullopt;
        }
        for (const auto& r : routes) {
            if (url.find(r.first) != std::string::npos)
                return r.second;
        }
        HttpResponse nf;
        nf.status = 404;
        return nf;
    }

  private:
    std::mutex mtx_;
};

} // namespace melt::test_support
