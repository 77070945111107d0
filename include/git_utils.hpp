#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;

/// Whether a path holds repository metadata; the sole input to clone-vs-update.
enum class WorkingTreeState { Absent, Present };

/// Metadata of one commit, read fresh from the object store on every query.
struct CommitInfo {
    std::string sha;
    std::string author_name;
    std::string author_email;
    std::string message;
    std::int64_t timestamp = 0; ///< Committer time, seconds since the epoch
};

// Every operation below is blocking, assumes libgit2 is initialized and
// throws gitport::Error on failure.

/**
 * @brief Report whether @p p contains a `.git` directory.
 */
WorkingTreeState detect_working_tree(const fs::path& p);

/**
 * @brief Determine whether the given path is a Git repository.
 *
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief `true` for URLs served by libgit2's local transport (plain paths and
 *        `file://`), which cannot negotiate shallow fetches.
 */
bool is_local_url(const std::string& url);

/**
 * @brief Clone @p url into @p dest with @p branch checked out.
 *
 * Parent directories of @p dest are created as needed. A positive @p depth
 * limits history to that many commits; `0` or less fetches everything.
 *
 * @throws gitport::Error BranchNotFound if the branch is absent on the remote,
 *         RepoNotFound if the remote does not exist, VcsOperation otherwise.
 */
void clone_repo(const std::string& url, const std::string& branch, const fs::path& dest,
                int depth);

/**
 * @brief Update `refs/remotes/origin/<branch>` from the `origin` remote.
 *
 * Only the named branch is fetched; the working tree and other refs are left
 * alone.
 *
 * @return Hex id of the updated remote-tracking ref.
 * @throws gitport::Error BranchNotFound if `origin` does not advertise the
 *         branch.
 */
std::string fetch_branch(const fs::path& repo, const std::string& branch, int depth);

/**
 * @brief Hard reset HEAD, index and tracked files to commit @p sha.
 *
 * @throws gitport::Error CommitNotFound if the commit is not in the local
 *         object store.
 */
void hard_reset(const fs::path& repo, const std::string& sha);

/**
 * @brief Resolve HEAD and read its commit metadata.
 *
 * @throws gitport::Error RepoNotFound if @p repo is not a repository or HEAD
 *         is unborn.
 */
CommitInfo head_commit(const fs::path& repo);

/**
 * @brief Check that @p sha names a commit present in @p repo.
 */
bool commit_exists(const fs::path& repo, const std::string& sha);

/**
 * @brief List refs of @p url over a transient connection and return the tip
 *        of `refs/heads/<branch>`. No local state is created.
 *
 * @throws gitport::Error BranchNotFound if the ref is not advertised.
 */
std::string remote_branch_tip(const std::string& url, const std::string& branch);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Remote URL as a string or `std::nullopt` on failure.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief libgit2 credential callback.
 *
 * A username embedded in the URL selects SSH agent authentication; otherwise
 * the default (ambient) credentials are offered. Nothing is cached between
 * connections.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

} // namespace git

#endif // GIT_UTILS_HPP
