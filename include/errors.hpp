#ifndef GITPORT_ERRORS_HPP
#define GITPORT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gitport {

/**
 * @brief Failure categories reported by repository and file operations.
 *
 * The category only affects the message prefix; on the wire every failure
 * is a flat string.
 */
enum class ErrorKind {
    VcsOperation,   ///< libgit2 failure (network, auth, corrupt repository)
    Io,             ///< Filesystem access failure
    RepoNotFound,   ///< No repository or no resolvable HEAD
    BranchNotFound, ///< Branch absent on the remote
    FileNotFound,   ///< Requested file or directory absent
    CommitNotFound, ///< Commit absent from the local object store
    InvalidArgument ///< Malformed operation argument (e.g. a bad SHA)
};

/**
 * @brief Operation-level error.
 *
 * Thrown by the VCS engine, the sync orchestrator and the file utilities.
 * Caught once per request by the dispatcher and reported as `{"err": what()}`.
 */
class Error : public std::runtime_error {
    ErrorKind kind_;

  public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    static Error vcs(const std::string& detail) {
        return Error(ErrorKind::VcsOperation, "git error: " + detail);
    }
    static Error io(const std::string& detail) {
        return Error(ErrorKind::Io, "io error: " + detail);
    }
    static Error repo_not_found(const std::string& path) {
        return Error(ErrorKind::RepoNotFound, "repository not found at " + path);
    }
    static Error branch_not_found(const std::string& branch) {
        return Error(ErrorKind::BranchNotFound, "branch '" + branch + "' not found");
    }
    static Error file_not_found(const std::string& path) {
        return Error(ErrorKind::FileNotFound, "file not found: " + path);
    }
    static Error commit_not_found(const std::string& sha) {
        return Error(ErrorKind::CommitNotFound, "commit " + sha + " not found");
    }
    static Error invalid_argument(const std::string& detail) {
        return Error(ErrorKind::InvalidArgument, "invalid argument: " + detail);
    }
};

/**
 * @brief Framing-level error.
 *
 * Raised for a bad length prefix, a truncated stream or an undecodable
 * request payload. Never turned into a response: it ends the protocol loop.
 */
class ProtocolError : public std::runtime_error {
  public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

/// Human readable name of an @ref ErrorKind, used in log fields.
const char* error_kind_name(ErrorKind kind);

} // namespace gitport

#endif // GITPORT_ERRORS_HPP
