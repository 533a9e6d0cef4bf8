#include "flake.hpp"

namespace melt {

const char* forge_name(ForgeType forge) {
    switch (forge) {
    case ForgeType::GitHub:
        return "github";
    case ForgeType::GitLab:
        return "gitlab";
    case ForgeType::SourceHut:
        return "sourcehut";
    case ForgeType::Codeberg:
        return "codeberg";
    case ForgeType::Gitea:
        return "gitea";
    case ForgeType::Generic:
        return "git";
    }
    return "git";
}

const std::string& FlakeInput::name() const {
    return std::visit([](const auto& in) -> const std::string& { return in.name; }, v_);
}

std::string FlakeInput::short_rev() const {
    if (const auto* g = std::get_if<GitInput>(&v_))
        return g->rev.substr(0, 7);
    if (const auto* o = std::get_if<OtherInput>(&v_))
        return o->rev.substr(0, 7);
    return "";
}

std::optional<std::int64_t> FlakeInput::last_modified() const {
    if (const auto* g = std::get_if<GitInput>(&v_))
        return g->last_modified;
    if (const auto* o = std::get_if<OtherInput>(&v_))
        return o->last_modified;
    return std::nullopt;
}

const char* FlakeInput::type_display() const {
    switch (v_.index()) {
    case 0:
        return "git";
    case 1:
        return "path";
    default:
        return "other";
    }
}

std::string FlakeInput::url_display() const {
    if (const auto* g = std::get_if<GitInput>(&v_))
        return g->url;
    if (const auto* p = std::get_if<PathInput>(&v_))
        return p->path.empty() ? "path" : "path:" + p->path;
    return std::get<OtherInput>(v_).url;
}

} // namespace melt
