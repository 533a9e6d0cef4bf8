#include "repo_cache.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace melt {

fs::path default_cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg)
        return fs::path(xdg) / "melt" / "git";
    const char* home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home) / ".cache" / "melt" / "git";
    return fs::path(".cache") / "melt" / "git";
}

std::uint64_t fnv1a64(const std::string& s) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

RepoCache::RepoCache(fs::path dir) : dir_(std::move(dir)) {}

fs::path RepoCache::path_for(const std::string& url) const {
    std::string safe;
    for (unsigned char c : url) {
        if (safe.size() == 32)
            break;
        if (std::isalnum(c) || c == '-' || c == '_')
            safe += static_cast<char>(c);
    }
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%llx", static_cast<unsigned long long>(fnv1a64(url)));
    return dir_ / (safe + "_" + hex);
}

std::shared_ptr<std::mutex> RepoCache::lock_for(const fs::path& path) {
    std::lock_guard<std::mutex> lk(locks_mtx_);
    auto& m = locks_[path.string()];
    if (!m)
        m = std::make_shared<std::mutex>();
    return m;
}

std::optional<fs::path> RepoCache::ensure(const std::string& url,
                                          const std::optional<std::string>& reference,
                                          const CancellationToken& cancel, Error* error) {
    if (cancel.is_cancelled()) {
        set_error(error, ErrorKind::Cancelled, url);
        return std::nullopt;
    }
    fs::path path = path_for(url);
    auto mtx = lock_for(path);
    std::lock_guard<std::mutex> lk(*mtx);
    if (cancel.is_cancelled()) {
        set_error(error, ErrorKind::Cancelled, url);
        return std::nullopt;
    }
    if (!git::ensure_repo(path, url, reference, error)) {
        log_warning("Mirror update failed", {{"url", url}, {"path", path.string()}});
        return std::nullopt;
    }
    return path;
}

} // namespace melt
