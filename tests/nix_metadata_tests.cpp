#include "test_common.hpp"
#include "nix_service.hpp"

using namespace melt;

namespace {

const char* const METADATA = R"({
  "description": "demo flake",
  "locks": {
    "root": "root",
    "version": 7,
    "nodes": {
      "root": {
        "inputs": {
          "nixpkgs": "nixpkgs",
          "Home-Manager": "home-manager",
          "lib": ["home-manager", "nixpkgs"],
          "srht": "srht",
          "gnome": "gnome",
          "plain": "plain",
          "local": "local",
          "tarball": "tarball"
        }
      },
      "nixpkgs": {
        "locked": {"type": "github", "owner": "NixOS", "repo": "nixpkgs",
                   "rev": "0123456789abcdef0123456789abcdef01234567", "lastModified": 1700000000},
        "original": {"type": "github", "owner": "NixOS", "repo": "nixpkgs", "ref": "nixos-unstable"}
      },
      "home-manager": {
        "inputs": {"nixpkgs": ["nixpkgs"]},
        "locked": {"type": "github", "owner": "nix-community", "repo": "home-manager",
                   "rev": "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa", "lastModified": 1690000000},
        "original": {"type": "github", "owner": "nix-community", "repo": "home-manager"}
      },
      "srht": {
        "locked": {"type": "sourcehut", "owner": "~sircmpwn", "repo": "hare", "rev": "bbbbbbb"},
        "original": {"type": "sourcehut", "owner": "~sircmpwn", "repo": "hare"}
      },
      "gnome": {
        "locked": {"type": "gitlab", "host": "gitlab.gnome.org", "owner": "GNOME", "repo": "gtk", "rev": "ccccccc"},
        "original": {"type": "gitlab", "host": "gitlab.gnome.org", "owner": "GNOME", "repo": "gtk"}
      },
      "plain": {
        "locked": {"type": "git", "url": "https://codeberg.org/forgejo/forgejo", "rev": "ddddddd", "lastModified": 5},
        "original": {"type": "git", "url": "https://codeberg.org/forgejo/forgejo", "ref": "main"}
      },
      "local": {
        "locked": {"type": "path", "path": "/home/me/src/thing"},
        "original": {"type": "path", "path": "./thing"}
      },
      "tarball": {
        "locked": {"type": "tarball", "url": "https://example.org/x.tar.gz", "lastModified": 7},
        "original": {"type": "tarball", "url": "https://example.org/x.tar.gz"}
      }
    }
  }
})";

const FlakeInput* find(const FlakeData& data, const std::string& name) {
    for (const auto& in : data.inputs) {
        if (in.name() == name)
            return &in;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Metadata lists direct inputs sorted case-insensitively") {
    Error err;
    auto data = parse_metadata("/flake", METADATA, &err);
    REQUIRE(data);
    REQUIRE(data->description == std::optional<std::string>("demo flake"));
    REQUIRE(data->inputs.size() == 8);
    std::vector<std::string> names;
    for (const auto& in : data->inputs)
        names.push_back(in.name());
    REQUIRE(names == std::vector<std::string>{"gnome", "Home-Manager", "lib", "local", "nixpkgs",
                                              "plain", "srht", "tarball"});
}

TEST_CASE("GitHub inputs carry owner, repo and reference") {
    auto data = parse_metadata("/flake", METADATA);
    REQUIRE(data);
    const auto* in = find(*data, "nixpkgs");
    REQUIRE(in);
    const auto* g = in->as_git();
    REQUIRE(g);
    REQUIRE(g->forge == ForgeType::GitHub);
    REQUIRE(g->owner == "NixOS");
    REQUIRE(g->repo == "nixpkgs");
    REQUIRE(g->reference == std::optional<std::string>("nixos-unstable"));
    REQUIRE(g->last_modified == 1700000000);
    REQUIRE(g->url == "github:NixOS/nixpkgs");
}

TEST_CASE("Follows paths resolve through the first node") {
    auto data = parse_metadata("/flake", METADATA);
    REQUIRE(data);
    const auto* lib = find(*data, "lib");
    REQUIRE(lib);
    REQUIRE(lib->as_git());
    REQUIRE(lib->as_git()->repo == "home-manager");
}

TEST_CASE("SourceHut, GitLab and plain git inputs") {
    auto data = parse_metadata("/flake", METADATA);
    REQUIRE(data);

    const auto* srht = find(*data, "srht")->as_git();
    REQUIRE(srht);
    REQUIRE(srht->forge == ForgeType::SourceHut);
    REQUIRE(srht->url == "sourcehut:~sircmpwn/hare");

    const auto* gnome = find(*data, "gnome")->as_git();
    REQUIRE(gnome);
    REQUIRE(gnome->forge == ForgeType::GitLab);
    REQUIRE(gnome->host == std::optional<std::string>("gitlab.gnome.org"));
    REQUIRE(gnome->url == "gitlab:GNOME/gtk (gitlab.gnome.org)");

    const auto* plain = find(*data, "plain")->as_git();
    REQUIRE(plain);
    REQUIRE(plain->forge == ForgeType::Codeberg);
    REQUIRE(plain->owner == "forgejo");
    REQUIRE(plain->repo == "forgejo");
    REQUIRE_FALSE(plain->host);
    REQUIRE(plain->reference == std::optional<std::string>("main"));
    REQUIRE(plain->url == "https://codeberg.org/forgejo/forgejo");
}

TEST_CASE("Path and tarball inputs") {
    auto data = parse_metadata("/flake", METADATA);
    REQUIRE(data);
    const auto* local = find(*data, "local");
    REQUIRE(std::string(local->type_display()) == "path");
    REQUIRE(local->url_display() == "path:/home/me/src/thing");

    const auto* tarball = find(*data, "tarball");
    REQUIRE(std::string(tarball->type_display()) == "other");
    REQUIRE(tarball->url_display() == "https://example.org/x.tar.gz");
    REQUIRE(tarball->last_modified() == std::optional<std::int64_t>(7));
}

TEST_CASE("Metadata without locks has no inputs") {
    auto data = parse_metadata("/flake", R"({"description": "bare"})");
    REQUIRE(data);
    REQUIRE(data->inputs.empty());
}

TEST_CASE("Malformed metadata is a parse error") {
    Error err;
    REQUIRE_FALSE(parse_metadata("/flake", "{nope", &err));
    REQUIRE(err.kind == ErrorKind::Parse);
}

TEST_CASE("resolve_flake_path requires flake.nix") {
    fs::path dir = melt::test_support::fresh_dir("resolve_flake");
    Error err;
    REQUIRE_FALSE(resolve_flake_path(dir, &err));
    REQUIRE(err.kind == ErrorKind::FlakeNotFound);

    std::ofstream(dir / "flake.nix") << "{ }";
    auto resolved = resolve_flake_path(dir / "flake.nix");
    REQUIRE(resolved);
    REQUIRE(*resolved == fs::canonical(dir));

    REQUIRE_FALSE(resolve_flake_path(dir / "missing"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Locking an input runs flake update with an override") {
    fs::path dir = melt::test_support::fresh_dir("nix_lock_args");
    fs::path args_file = dir / "args.txt";
    fs::create_directories(dir / "bin");
    {
        std::ofstream script(dir / "bin" / "nix");
        script << "#!/bin/sh\nprintf '%s\\n' \"$@\" > '" << args_file.string() << "'\n";
    }
    fs::permissions(dir / "bin" / "nix", fs::perms::owner_all);

    const char* old_path = std::getenv("PATH");
    std::string saved = old_path ? old_path : "";
    std::string path = (dir / "bin").string() + ":" + saved;
    setenv("PATH", path.c_str(), 1);

    NixService nix(CancellationToken{}, std::chrono::seconds(10));
    Error err;
    bool ok = nix.lock_input("/srv/flake", "nixpkgs", "github:NixOS/nixpkgs/abc1234", &err);
    setenv("PATH", saved.c_str(), 1);
    REQUIRE(ok);

    std::ifstream in(args_file);
    std::vector<std::string> args;
    for (std::string line; std::getline(in, line);)
        args.push_back(line);
    REQUIRE(args == std::vector<std::string>{"flake", "update", "nixpkgs", "--override-input",
                                             "nixpkgs", "github:NixOS/nixpkgs/abc1234",
                                             "--flake", "/srv/flake"});
    FS_REMOVE_ALL(dir);
}
