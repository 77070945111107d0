#include "protocol.hpp"
#include <limits>
#include <type_traits>
#include "errors.hpp"

using json = nlohmann::json;

namespace gitport {

namespace {

const json* find_field(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end())
        return nullptr;
    return &*it;
}

// msgpack producers disagree on str vs bin for byte strings; accept both.
std::string as_string(const json& value, const char* key) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        return std::string(bin.begin(), bin.end());
    }
    throw ProtocolError(std::string("field '") + key + "' must be a string");
}

std::string required_string(const json& doc, const char* key) {
    const json* value = find_field(doc, key);
    if (!value)
        throw ProtocolError(std::string("missing field '") + key + "'");
    return as_string(*value, key);
}

std::optional<std::string> optional_string(const json& doc, const char* key) {
    const json* value = find_field(doc, key);
    if (!value || value->is_null())
        return std::nullopt;
    return as_string(*value, key);
}

// msgpack encoders may use the signed int families for positive values, so
// both integer kinds are accepted.
int depth_field(const json& doc) {
    const json* value = find_field(doc, "depth");
    if (!value || value->is_null())
        return kDefaultDepth;
    std::uint64_t depth = 0;
    if (value->is_number_unsigned()) {
        depth = value->get<std::uint64_t>();
    } else if (value->is_number_integer()) {
        auto signed_depth = value->get<std::int64_t>();
        if (signed_depth < 0)
            throw ProtocolError("field 'depth' must not be negative");
        depth = static_cast<std::uint64_t>(signed_depth);
    } else {
        throw ProtocolError("field 'depth' must be an integer");
    }
    if (depth > std::numeric_limits<std::uint32_t>::max())
        throw ProtocolError("field 'depth' out of range");
    // libgit2 takes an int; anything beyond that is a full history anyway.
    if (depth > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        return std::numeric_limits<int>::max();
    return static_cast<int>(depth);
}

} // namespace

const char* op_name(const Request& req) {
    return std::visit(
        [](const auto& r) -> const char* {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SyncRequest>)
                return "sync";
            else if constexpr (std::is_same_v<T, FilesRequest>)
                return "files";
            else if constexpr (std::is_same_v<T, ReadRequest>)
                return "read";
            else if constexpr (std::is_same_v<T, HeadRequest>)
                return "head";
            else if constexpr (std::is_same_v<T, CheckoutRequest>)
                return "checkout";
            else
                return "lsremote";
        },
        req);
}

Request request_from_json(const json& doc) {
    if (!doc.is_object())
        throw ProtocolError("request must be a map");
    const std::string op = required_string(doc, "op");
    if (op == "sync")
        return SyncRequest{required_string(doc, "url"), required_string(doc, "branch"),
                           required_string(doc, "path"), depth_field(doc)};
    if (op == "files")
        return FilesRequest{required_string(doc, "path"), optional_string(doc, "subpath")};
    if (op == "read")
        return ReadRequest{required_string(doc, "path"), required_string(doc, "file")};
    if (op == "head")
        return HeadRequest{required_string(doc, "path")};
    if (op == "checkout")
        return CheckoutRequest{required_string(doc, "path"), required_string(doc, "sha")};
    if (op == "lsremote")
        return LsRemoteRequest{required_string(doc, "url"), required_string(doc, "branch")};
    throw ProtocolError("unknown op '" + op + "'");
}

Request decode_request(const std::vector<std::uint8_t>& payload) {
    json doc;
    try {
        doc = json::from_msgpack(payload);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("undecodable request: ") + e.what());
    }
    return request_from_json(doc);
}

json commit_info_to_json(const git::CommitInfo& info) {
    json j = json::object();
    j["sha"] = info.sha;
    j["author"] = info.author_name;
    j["email"] = info.author_email;
    j["message"] = info.message;
    j["timestamp"] = info.timestamp;
    return j;
}

Response Response::ok(const std::string& value) { return Response(json{{"ok", value}}); }

Response Response::ok(const std::vector<std::string>& values) {
    return Response(json{{"ok", values}});
}

Response Response::ok(const git::CommitInfo& info) {
    return Response(json{{"ok", commit_info_to_json(info)}});
}

Response Response::err(const std::string& message) { return Response(json{{"err", message}}); }

bool Response::is_error() const { return body_.contains("err"); }

std::vector<std::uint8_t> Response::encode() const { return json::to_msgpack(body_); }

} // namespace gitport
