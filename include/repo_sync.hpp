#ifndef GITPORT_REPO_SYNC_HPP
#define GITPORT_REPO_SYNC_HPP

#include <filesystem>
#include <string>
#include "git_utils.hpp"

namespace gitport {
namespace fs = std::filesystem;

/// History depth used when a request does not specify one.
constexpr int kDefaultDepth = 1;

/**
 * @brief Make @p path hold the current tip of @p branch.
 *
 * Clones when no repository is present at @p path; otherwise fetches the
 * branch from `origin` and hard resets onto it, discarding local changes to
 * tracked files. Repeated calls converge to the remote tip regardless of
 * prior local state.
 *
 * @return Hex id of HEAD after the operation.
 */
std::string sync_repo(const std::string& url, const std::string& branch, const fs::path& path,
                      int depth = kDefaultDepth);

/**
 * @brief Read HEAD commit metadata. No side effects.
 */
git::CommitInfo head(const fs::path& path);

/**
 * @brief Hard reset @p path to an existing local commit.
 *
 * Never fetches: the commit must already be in the object store.
 *
 * @return The normalized (lowercase) @p sha.
 */
std::string checkout(const fs::path& path, const std::string& sha);

/**
 * @brief Tip of @p branch on @p url, without creating or touching local state.
 */
std::string ls_remote(const std::string& url, const std::string& branch);

} // namespace gitport

#endif // GITPORT_REPO_SYNC_HPP
