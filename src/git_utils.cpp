#include "git_utils.hpp"
#include <system_error>
#include "logger.hpp"

using melt::Commit;
using melt::Error;
using melt::ErrorKind;

namespace git {

namespace {

struct CredentialState {
    int attempts = 0;
};

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

/**
 * @brief Translate a failed network operation into an engine error.
 *
 * Authentication problems are reported separately so the user learns that an
 * SSH agent is needed.
 */
void set_network_error(Error* error, int code, ErrorKind fallback) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    std::string msg = last_error_message();
    bool auth = code == GIT_EAUTH || (e && e->klass == GIT_ERROR_SSH) ||
                msg.find("auth") != std::string::npos;
    if (auth) {
        melt::set_error(error, ErrorKind::AuthFailed,
                        msg + " (SSH agent or default credentials required)");
        return;
    }
    melt::set_error(error, fallback, msg);
}

std::string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

git_fetch_options make_fetch_options(CredentialState* state) {
    git_fetch_options opts = GIT_FETCH_OPTIONS_INIT;
    opts.callbacks.credentials = credential_cb;
    opts.callbacks.payload = state;
    return opts;
}

bool fetch_origin(git_repository* repo, Error* error) {
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, repo, "origin") != 0) {
        melt::set_error(error, ErrorKind::Cache, "mirror has no origin: " + last_error_message());
        return false;
    }
    remote_ptr remote(raw_remote);
    git_strarray refspecs{nullptr, 0};
    if (git_remote_get_fetch_refspecs(&refspecs, remote.get()) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return false;
    }
    CredentialState state;
    git_fetch_options opts = make_fetch_options(&state);
    int err = git_remote_fetch(remote.get(), &refspecs, &opts, nullptr);
    git_strarray_dispose(&refspecs);
    if (err != 0) {
        set_network_error(error, err, ErrorKind::Network);
        return false;
    }
    return true;
}

bool clone_bare(const fs::path& path, const std::string& url,
                const std::optional<std::string>& reference, Error* error) {
    log_debug("Cloning repository", {{"url", url}, {"path", path.string()}});
    CredentialState state;
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    opts.bare = 1;
    opts.fetch_opts = make_fetch_options(&state);
    if (reference)
        opts.checkout_branch = reference->c_str();
    git_repository* raw = nullptr;
    int err = git_clone(&raw, url.c_str(), path.string().c_str(), &opts);
    if (err != 0) {
        set_network_error(error, err, ErrorKind::Clone);
        std::error_code ec;
        fs::remove_all(path, ec);
        return false;
    }
    repo_ptr repo(raw);
    return true;
}

std::optional<git_oid> peel_to_commit(git_repository* repo, const std::string& spec) {
    git_object* raw = nullptr;
    if (git_revparse_single(&raw, repo, spec.c_str()) != 0)
        return std::nullopt;
    object_ptr obj(raw);
    git_object* peeled = nullptr;
    if (git_object_peel(&peeled, obj.get(), GIT_OBJECT_COMMIT) != 0)
        return std::nullopt;
    object_ptr commit(peeled);
    return *git_object_id(commit.get());
}

Commit to_commit(git_commit* c) {
    Commit out;
    out.sha = oid_to_hex(*git_commit_id(c));
    const char* summary = git_commit_summary(c);
    out.message = summary ? summary : "";
    const git_signature* author = git_commit_author(c);
    out.author = author && author->name && *author->name ? author->name : "Unknown";
    out.date = static_cast<std::time_t>(git_commit_time(c));
    return out;
}

/**
 * @brief Collect up to @p limit commits from a prepared revision walk.
 */
std::optional<std::vector<Commit>> drain_walk(git_repository* repo, git_revwalk* walk,
                                              std::size_t limit, Error* error) {
    std::vector<Commit> commits;
    git_oid oid;
    while (commits.size() < limit) {
        int rc = git_revwalk_next(&oid, walk);
        if (rc == GIT_ITEROVER)
            break;
        if (rc != 0) {
            melt::set_error(error, ErrorKind::Cache, last_error_message());
            return std::nullopt;
        }
        git_commit* raw = nullptr;
        if (git_commit_lookup(&raw, repo, &oid) != 0)
            continue;
        commit_ptr c(raw);
        commits.push_back(to_commit(c.get()));
    }
    return commits;
}

std::optional<repo_ptr> open_mirror(const fs::path& path, Error* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_bare(&raw, path.string().c_str()) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return std::nullopt;
    }
    return repo_ptr(raw);
}

} // namespace

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    auto* state = static_cast<CredentialState*>(payload);
    // libgit2 keeps asking while credentials are rejected
    if (state && ++state->attempts > 3)
        return GIT_EAUTH;
    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        const char* user = username_from_url ? username_from_url : "git";
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_DEFAULT)
        return git_credential_default_new(out);
    return GIT_EAUTH;
}

bool ensure_repo(const fs::path& path, const std::string& url,
                 const std::optional<std::string>& reference, Error* error) {
    GitInitGuard guard;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        melt::set_error(error, ErrorKind::Cache, ec.message());
        return false;
    }
    if (fs::exists(path, ec)) {
        git_repository* raw = nullptr;
        if (git_repository_open_bare(&raw, path.string().c_str()) == 0) {
            repo_ptr repo(raw);
            return fetch_origin(repo.get(), error);
        }
        // Leftover of an interrupted clone
        log_warning("Discarding unreadable mirror", {{"path", path.string()}});
        fs::remove_all(path, ec);
        if (ec) {
            melt::set_error(error, ErrorKind::Cache, ec.message());
            return false;
        }
    }
    return clone_bare(path, url, reference, error);
}

std::optional<git_oid> resolve_ref(git_repository* repo, const std::string& name) {
    git_oid oid;
    std::string remote_ref = "refs/remotes/origin/" + name;
    if (git_reference_name_to_id(&oid, repo, remote_ref.c_str()) == 0)
        return oid;
    std::string local_ref = "refs/heads/" + name;
    if (git_reference_name_to_id(&oid, repo, local_ref.c_str()) == 0)
        return oid;
    if (name == "HEAD" && git_reference_name_to_id(&oid, repo, "HEAD") == 0)
        return oid;
    return peel_to_commit(repo, name);
}

std::optional<std::vector<Commit>> commits_since(const fs::path& repo, const std::string& base_rev,
                                                 const std::optional<std::string>& head_ref,
                                                 Error* error) {
    GitInitGuard guard;
    auto r = open_mirror(repo, error);
    if (!r)
        return std::nullopt;
    const std::string head_name = head_ref.value_or("HEAD");
    auto head = resolve_ref(r->get(), head_name);
    if (!head) {
        melt::set_error(error, ErrorKind::RevisionNotFound, head_name);
        return std::nullopt;
    }
    auto base = peel_to_commit(r->get(), base_rev);
    if (!base || git_oid_equal(&*head, &*base))
        return std::vector<Commit>{};

    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, r->get()) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return std::nullopt;
    }
    revwalk_ptr walk(raw_walk);
    git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME);
    if (git_revwalk_push(walk.get(), &*head) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return std::nullopt;
    }
    git_revwalk_hide(walk.get(), &*base);
    return drain_walk(r->get(), walk.get(), MAX_COMMITS_AHEAD, error);
}

std::optional<std::vector<Commit>> commits_from(const fs::path& repo, const std::string& rev,
                                                std::size_t limit, Error* error) {
    GitInitGuard guard;
    auto r = open_mirror(repo, error);
    if (!r)
        return std::nullopt;
    auto start = peel_to_commit(r->get(), rev);
    if (!start)
        return std::vector<Commit>{};
    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, r->get()) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return std::nullopt;
    }
    revwalk_ptr walk(raw_walk);
    git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME);
    if (git_revwalk_push(walk.get(), &*start) != 0) {
        melt::set_error(error, ErrorKind::Cache, last_error_message());
        return std::nullopt;
    }
    return drain_walk(r->get(), walk.get(), limit, error);
}

} // namespace git
