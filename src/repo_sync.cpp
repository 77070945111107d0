#include "repo_sync.hpp"
#include "commit_sha.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace gitport {

std::string sync_repo(const std::string& url, const std::string& branch, const fs::path& path,
                      int depth) {
    switch (git::detect_working_tree(path)) {
    case git::WorkingTreeState::Absent:
        log_info("Cloning", {{"url", url}, {"branch", branch}, {"path", path.string()}});
        git::clone_repo(url, branch, path, depth);
        break;
    case git::WorkingTreeState::Present: {
        std::string err;
        auto origin = git::get_remote_url(path, "origin", &err);
        if (!origin)
            log_warning("Cannot read origin url", {{"path", path.string()}, {"error", err}});
        else if (*origin != url)
            log_warning("Origin url differs from requested url; syncing against origin",
                        {{"path", path.string()}, {"origin", *origin}, {"url", url}});
        std::string tip = git::fetch_branch(path, branch, depth);
        log_debug("Resetting to fetched tip", {{"path", path.string()}, {"sha", tip}});
        git::hard_reset(path, tip);
        break;
    }
    }
    git::CommitInfo info = git::head_commit(path);
    log_info("Repository synced", {{"path", path.string()},
                                   {"sha", info.sha.substr(0, CommitSha::kShortLength)},
                                   {"committed", format_epoch_utc(info.timestamp)}});
    return info.sha;
}

git::CommitInfo head(const fs::path& path) { return git::head_commit(path); }

std::string checkout(const fs::path& path, const std::string& sha) {
    CommitSha target = CommitSha::parse(sha);
    if (!git::commit_exists(path, target.str()))
        throw Error::commit_not_found(target.str());
    git::hard_reset(path, target.str());
    log_info("Checked out commit", {{"path", path.string()}, {"sha", target.short_form()}});
    return target.str();
}

std::string ls_remote(const std::string& url, const std::string& branch) {
    return git::remote_branch_tip(url, branch);
}

} // namespace gitport
