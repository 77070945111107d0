#include "git_utils.hpp"
#include <string>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

using namespace std;
using gitport::Error;

namespace git {

static constexpr const char* kOrigin = "origin";
// Credential callback invocations allowed per connection before giving up.
static constexpr unsigned int kMaxCredentialAttempts = 3;

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_MAX_HEXSIZE + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

static string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

static int last_error_class() {
    const git_error* e = git_error_last();
    return e ? e->klass : GIT_ERROR_NONE;
}

// Per-connection credential state; lives on the caller's stack for exactly one
// remote operation.
struct CredentialState {
    unsigned int attempts = 0;
};

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    auto* state = static_cast<CredentialState*>(payload);
    if (state && ++state->attempts > kMaxCredentialAttempts)
        return GIT_EAUTH;
    if (username_from_url && *username_from_url) {
        if (allowed_types & GIT_CREDENTIAL_USERNAME)
            return git_credential_username_new(out, username_from_url);
        return git_credential_ssh_key_from_agent(out, username_from_url);
    }
    return git_credential_default_new(out);
}

static void set_credentials(git_remote_callbacks& callbacks, CredentialState& state) {
    callbacks.credentials = credential_cb;
    callbacks.payload = &state;
}

WorkingTreeState detect_working_tree(const fs::path& p) {
    return is_git_repo(p) ? WorkingTreeState::Present : WorkingTreeState::Absent;
}

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

bool is_local_url(const std::string& url) {
    if (url.rfind("file://", 0) == 0 || url.rfind('/', 0) == 0 || url.rfind("./", 0) == 0 ||
        url.rfind("../", 0) == 0)
        return true;
    if (url.find("://") != std::string::npos)
        return false;
    std::error_code ec;
    return fs::exists(url, ec);
}

static git_repository* open_repo(const fs::path& repo) {
    git_repository* raw = nullptr;
    int rc = git_repository_open(&raw, repo.string().c_str());
    if (rc == GIT_ENOTFOUND)
        throw Error::repo_not_found(repo.string());
    if (rc != 0)
        throw Error::vcs(last_error_message());
    return raw;
}

void clone_repo(const std::string& url, const std::string& branch, const fs::path& dest,
                int depth) {
    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec)
            throw Error::io("cannot create " + dest.parent_path().string() + ": " + ec.message());
    }

    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    CredentialState creds;
    set_credentials(opts.fetch_opts.callbacks, creds);
    opts.checkout_branch = branch.c_str();
    if (depth > 0 && !is_local_url(url))
        opts.fetch_opts.depth = depth;

    log_debug("Cloning repository", {{"url", url},
                                     {"branch", branch},
                                     {"path", dest.string()},
                                     {"depth", std::to_string(opts.fetch_opts.depth)}});
    git_repository* raw_repo = nullptr;
    int err = git_clone(&raw_repo, url.c_str(), dest.string().c_str(), &opts);
    repo_ptr repo(raw_repo);
    if (err == GIT_ENOTFOUND) {
        if (last_error_class() == GIT_ERROR_REFERENCE)
            throw Error::branch_not_found(branch);
        throw Error::repo_not_found(url);
    }
    if (err != 0)
        throw Error::vcs(last_error_message());
}

std::string fetch_branch(const fs::path& repo, const std::string& branch, int depth) {
    repo_ptr r(open_repo(repo));
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), kOrigin) != 0)
        throw Error::vcs(last_error_message());
    remote_ptr remote(raw_remote);

    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    CredentialState creds;
    set_credentials(fetch_opts.callbacks, creds);
    const char* url = git_remote_url(remote.get());
    if (depth > 0 && !(url && is_local_url(url)))
        fetch_opts.depth = depth;

    if (git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &fetch_opts.callbacks,
                           &fetch_opts.proxy_opts, nullptr) != 0)
        throw Error::vcs(last_error_message());

    // Refuse to reset onto a stale tracking ref when the branch is gone.
    const std::string source = "refs/heads/" + branch;
    const git_remote_head** heads = nullptr;
    size_t count = 0;
    if (git_remote_ls(&heads, &count, remote.get()) != 0)
        throw Error::vcs(last_error_message());
    bool advertised = false;
    for (size_t i = 0; i < count; ++i) {
        if (source == heads[i]->name) {
            advertised = true;
            break;
        }
    }
    if (!advertised)
        throw Error::branch_not_found(branch);

    std::string refspec = "+" + source + ":refs/remotes/" + kOrigin + "/" + branch;
    char* specs[] = {refspec.data()};
    git_strarray refspecs = {specs, 1};
    if (git_remote_download(remote.get(), &refspecs, &fetch_opts) != 0)
        throw Error::vcs(last_error_message());
    if (git_remote_update_tips(remote.get(), &fetch_opts.callbacks, 1,
                               GIT_REMOTE_DOWNLOAD_TAGS_AUTO, "gitport: fetch") != 0)
        throw Error::vcs(last_error_message());
    git_remote_disconnect(remote.get());

    git_oid oid;
    std::string tracking = std::string("refs/remotes/") + kOrigin + "/" + branch;
    if (git_reference_name_to_id(&oid, r.get(), tracking.c_str()) != 0)
        throw Error::branch_not_found(branch);
    return oid_to_hex(oid);
}

void hard_reset(const fs::path& repo, const std::string& sha) {
    repo_ptr r(open_repo(repo));
    git_oid oid;
    if (sha.size() != GIT_OID_SHA1_HEXSIZE || git_oid_fromstr(&oid, sha.c_str()) != 0)
        throw Error::commit_not_found(sha);
    git_object* raw_target = nullptr;
    int rc = git_object_lookup(&raw_target, r.get(), &oid, GIT_OBJECT_COMMIT);
    if (rc == GIT_ENOTFOUND)
        throw Error::commit_not_found(sha);
    if (rc != 0)
        throw Error::vcs(last_error_message());
    object_ptr target(raw_target);
    if (git_reset(r.get(), target.get(), GIT_RESET_HARD, nullptr) != 0)
        throw Error::vcs(last_error_message());
}

CommitInfo head_commit(const fs::path& repo) {
    repo_ptr r(open_repo(repo));
    git_reference* raw_head = nullptr;
    int rc = git_repository_head(&raw_head, r.get());
    if (rc == GIT_EUNBORNBRANCH || rc == GIT_ENOTFOUND)
        throw Error::repo_not_found(repo.string());
    if (rc != 0)
        throw Error::vcs(last_error_message());
    reference_ptr head(raw_head);

    git_object* raw_obj = nullptr;
    if (git_reference_peel(&raw_obj, head.get(), GIT_OBJECT_COMMIT) != 0)
        throw Error::vcs(last_error_message());
    object_ptr obj(raw_obj);
    const auto* commit = reinterpret_cast<const git_commit*>(obj.get());

    CommitInfo info;
    info.sha = oid_to_hex(*git_commit_id(commit));
    if (const git_signature* sig = git_commit_author(commit)) {
        info.author_name = sig->name ? sig->name : "";
        info.author_email = sig->email ? sig->email : "";
    }
    const char* msg = git_commit_message(commit);
    info.message = msg ? msg : "";
    info.timestamp = static_cast<std::int64_t>(git_commit_time(commit));
    return info;
}

bool commit_exists(const fs::path& repo, const std::string& sha) {
    repo_ptr r(open_repo(repo));
    git_oid oid;
    // The object store is SHA-1; longer ids cannot name one of its commits.
    if (sha.size() != GIT_OID_SHA1_HEXSIZE || git_oid_fromstr(&oid, sha.c_str()) != 0)
        return false;
    git_object* raw = nullptr;
    int rc = git_object_lookup(&raw, r.get(), &oid, GIT_OBJECT_COMMIT);
    object_ptr obj(raw);
    if (rc == GIT_ENOTFOUND)
        return false;
    if (rc != 0)
        throw Error::vcs(last_error_message());
    return true;
}

std::string remote_branch_tip(const std::string& url, const std::string& branch) {
    git_remote* raw_remote = nullptr;
    if (git_remote_create_detached(&raw_remote, url.c_str()) != 0)
        throw Error::vcs(last_error_message());
    remote_ptr remote(raw_remote);

    git_remote_callbacks callbacks = GIT_REMOTE_CALLBACKS_INIT;
    CredentialState creds;
    set_credentials(callbacks, creds);
    int rc = git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &callbacks, nullptr, nullptr);
    if (rc == GIT_ENOTFOUND)
        throw Error::repo_not_found(url);
    if (rc != 0)
        throw Error::vcs(last_error_message());

    const git_remote_head** heads = nullptr;
    size_t count = 0;
    if (git_remote_ls(&heads, &count, remote.get()) != 0)
        throw Error::vcs(last_error_message());
    const std::string wanted = "refs/heads/" + branch;
    for (size_t i = 0; i < count; ++i) {
        if (wanted == heads[i]->name) {
            std::string tip = oid_to_hex(heads[i]->oid);
            git_remote_disconnect(remote.get());
            return tip;
        }
    }
    git_remote_disconnect(remote.get());
    throw Error::branch_not_found(branch);
}

/**
 * @brief Retrieve the configured URL for a remote.
 */
optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        if (error)
            *error = last_error_message();
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        if (error)
            *error = last_error_message();
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        if (error)
            *error = "remote has no url";
        return nullopt;
    }
    return string(url);
}

} // namespace git
