#ifndef GITPORT_PROTOCOL_HPP
#define GITPORT_PROTOCOL_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "git_utils.hpp"
#include "repo_sync.hpp"

namespace gitport {

struct SyncRequest {
    std::string url;
    std::string branch;
    std::string path;
    int depth = kDefaultDepth;
};

struct FilesRequest {
    std::string path;
    std::optional<std::string> subpath;
};

struct ReadRequest {
    std::string path;
    std::string file;
};

struct HeadRequest {
    std::string path;
};

struct CheckoutRequest {
    std::string path;
    std::string sha;
};

struct LsRemoteRequest {
    std::string url;
    std::string branch;
};

/// One decoded request; the alternative is selected by the `op` field.
using Request = std::variant<SyncRequest, FilesRequest, ReadRequest, HeadRequest,
                             CheckoutRequest, LsRemoteRequest>;

/// Wire name of the operation held by @p req.
const char* op_name(const Request& req);

/**
 * @brief Decode a msgpack request payload.
 *
 * The payload must be a map with a string `op` and the fields that operation
 * requires. Strings may arrive as msgpack `str` or `bin`; unknown keys are
 * ignored.
 *
 * @throws gitport::ProtocolError for undecodable payloads, unknown operations
 *         and missing or mistyped fields.
 */
Request decode_request(const std::vector<std::uint8_t>& payload);

/// Same as @ref decode_request for an already parsed document.
Request request_from_json(const nlohmann::json& doc);

/**
 * @brief Response envelope: a single-key map, `{"ok": value}` or
 *        `{"err": message}`.
 */
class Response {
    nlohmann::json body_;

    explicit Response(nlohmann::json body) : body_(std::move(body)) {}

  public:
    static Response ok(const std::string& value);
    static Response ok(const std::vector<std::string>& values);
    static Response ok(const git::CommitInfo& info);
    static Response err(const std::string& message);

    bool is_error() const;
    const nlohmann::json& body() const { return body_; }

    /// msgpack encoding of the envelope.
    std::vector<std::uint8_t> encode() const;
};

/// msgpack map with keys `sha`, `author`, `email`, `message`, `timestamp`.
nlohmann::json commit_info_to_json(const git::CommitInfo& info);

} // namespace gitport

#endif // GITPORT_PROTOCOL_HPP
