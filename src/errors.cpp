#include "errors.hpp"

namespace gitport {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::VcsOperation:
        return "vcs";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::RepoNotFound:
        return "repo_not_found";
    case ErrorKind::BranchNotFound:
        return "branch_not_found";
    case ErrorKind::FileNotFound:
        return "file_not_found";
    case ErrorKind::CommitNotFound:
        return "commit_not_found";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown";
}

} // namespace gitport
