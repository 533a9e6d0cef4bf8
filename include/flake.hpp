#ifndef MELT_FLAKE_HPP
#define MELT_FLAKE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace melt {

/** Hosting provider family of a git input. */
enum class ForgeType { GitHub, GitLab, SourceHut, Codeberg, Gitea, Generic };

const char* forge_name(ForgeType forge);

/**
 * @brief Input pinned to a git remote.
 *
 * @c reference holds the branch or tag named in the flake, when any.
 */
struct GitInput {
    std::string name;
    std::string owner;
    std::string repo;
    ForgeType forge = ForgeType::Generic;
    std::optional<std::string> host;
    std::optional<std::string> reference;
    std::string rev;
    std::int64_t last_modified = 0;
    std::string url;
};

struct PathInput {
    std::string name;
    std::string path;
};

/** Tarballs, plain files and anything else without a git history. */
struct OtherInput {
    std::string name;
    std::string url;
    std::string rev;
    std::int64_t last_modified = 0;
};

/**
 * @brief Immutable snapshot of one flake input.
 */
class FlakeInput {
  public:
    using Variant = std::variant<GitInput, PathInput, OtherInput>;

    FlakeInput(GitInput g) : v_(std::move(g)) {}
    FlakeInput(PathInput p) : v_(std::move(p)) {}
    FlakeInput(OtherInput o) : v_(std::move(o)) {}

    const std::string& name() const;
    /** First 7 characters of the pinned revision, empty for path inputs. */
    std::string short_rev() const;
    std::optional<std::int64_t> last_modified() const;
    /** "git", "path" or "other". */
    const char* type_display() const;
    /** Human readable source locator such as `github:NixOS/nixpkgs`. */
    std::string url_display() const;

    bool is_git() const { return std::holds_alternative<GitInput>(v_); }
    const GitInput* as_git() const { return std::get_if<GitInput>(&v_); }
    const Variant& variant() const { return v_; }

  private:
    Variant v_;
};

/** Metadata of a loaded flake. Inputs are sorted case-insensitively by name. */
struct FlakeData {
    std::filesystem::path path;
    std::optional<std::string> description;
    std::vector<FlakeInput> inputs;
};

} // namespace melt

#endif // MELT_FLAKE_HPP
