#include "test_common.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"

using json = nlohmann::json;
using gitport::ProtocolError;

namespace {
gitport::Request decode(const json& doc) { return gitport::decode_request(json::to_msgpack(doc)); }
} // namespace

TEST_CASE("Decode sync request with default depth") {
    auto req = decode({{"op", "sync"}, {"url", "https://example.com/r.git"},
                       {"branch", "main"}, {"path", "/tmp/r"}});
    REQUIRE(std::string(gitport::op_name(req)) == "sync");
    const auto& sync = std::get<gitport::SyncRequest>(req);
    REQUIRE(sync.url == "https://example.com/r.git");
    REQUIRE(sync.branch == "main");
    REQUIRE(sync.path == "/tmp/r");
    REQUIRE(sync.depth == 1);
}

TEST_CASE("Decode sync request with explicit depth") {
    auto req = decode({{"op", "sync"}, {"url", "u"}, {"branch", "b"}, {"path", "p"},
                       {"depth", 0}});
    REQUIRE(std::get<gitport::SyncRequest>(req).depth == 0);
    req = decode({{"op", "sync"}, {"url", "u"}, {"branch", "b"}, {"path", "p"}, {"depth", 50}});
    REQUIRE(std::get<gitport::SyncRequest>(req).depth == 50);
    REQUIRE_THROWS_AS(
        decode({{"op", "sync"}, {"url", "u"}, {"branch", "b"}, {"path", "p"}, {"depth", -1}}),
        ProtocolError);
    REQUIRE_THROWS_AS(decode({{"op", "sync"},
                              {"url", "u"},
                              {"branch", "b"},
                              {"path", "p"},
                              {"depth", 1ull << 33}}),
                      ProtocolError);
    REQUIRE_THROWS_AS(
        decode({{"op", "sync"}, {"url", "u"}, {"branch", "b"}, {"path", "p"}, {"depth", "1"}}),
        ProtocolError);
}

namespace {
// fixmap{op: "sync", url: "u", branch: "b", path: "p", depth: <tail>}
std::vector<std::uint8_t> sync_with_depth(std::initializer_list<std::uint8_t> depth) {
    std::vector<std::uint8_t> out{0x85, 0xa2, 'o', 'p', 0xa4, 's', 'y', 'n', 'c',
                                  0xa3, 'u', 'r', 'l', 0xa1, 'u',
                                  0xa6, 'b', 'r', 'a', 'n', 'c', 'h', 0xa1, 'b',
                                  0xa4, 'p', 'a', 't', 'h', 0xa1, 'p',
                                  0xa5, 'd', 'e', 'p', 't', 'h'};
    out.insert(out.end(), depth.begin(), depth.end());
    return out;
}
} // namespace

TEST_CASE("Decode depth sent with signed msgpack integers") {
    auto int8 = gitport::decode_request(sync_with_depth({0xd0, 0x05}));
    REQUIRE(std::get<gitport::SyncRequest>(int8).depth == 5);
    auto int32 = gitport::decode_request(sync_with_depth({0xd2, 0x00, 0x01, 0x00, 0x00}));
    REQUIRE(std::get<gitport::SyncRequest>(int32).depth == 65536);
    auto int64 =
        gitport::decode_request(sync_with_depth({0xd3, 0, 0, 0, 0, 0xff, 0xff, 0xff, 0xff}));
    REQUIRE(std::get<gitport::SyncRequest>(int64).depth == std::numeric_limits<int>::max());
    REQUIRE_THROWS_AS(gitport::decode_request(sync_with_depth({0xd0, 0xfb})), ProtocolError);
    REQUIRE_THROWS_AS(gitport::decode_request(sync_with_depth({0xff})), ProtocolError);
    REQUIRE_THROWS_AS(
        gitport::decode_request(sync_with_depth({0xd3, 0, 0, 0, 1, 0, 0, 0, 0})), ProtocolError);
}

TEST_CASE("Decode files request subpath variants") {
    auto plain = decode({{"op", "files"}, {"path", "/r"}});
    REQUIRE_FALSE(std::get<gitport::FilesRequest>(plain).subpath);
    auto nil = decode({{"op", "files"}, {"path", "/r"}, {"subpath", nullptr}});
    REQUIRE_FALSE(std::get<gitport::FilesRequest>(nil).subpath);
    auto sub = decode({{"op", "files"}, {"path", "/r"}, {"subpath", "apps"}});
    REQUIRE(std::get<gitport::FilesRequest>(sub).subpath.value() == "apps");
}

TEST_CASE("Decode remaining operations") {
    auto read = decode({{"op", "read"}, {"path", "/r"}, {"file", "a.yaml"}});
    REQUIRE(std::get<gitport::ReadRequest>(read).file == "a.yaml");
    auto head = decode({{"op", "head"}, {"path", "/r"}});
    REQUIRE(std::get<gitport::HeadRequest>(head).path == "/r");
    auto co = decode({{"op", "checkout"}, {"path", "/r"}, {"sha", std::string(40, 'a')}});
    REQUIRE(std::get<gitport::CheckoutRequest>(co).sha == std::string(40, 'a'));
    auto ls = decode({{"op", "lsremote"}, {"url", "u"}, {"branch", "main"}});
    REQUIRE(std::string(gitport::op_name(ls)) == "lsremote");
    REQUIRE(std::get<gitport::LsRemoteRequest>(ls).branch == "main");
}

TEST_CASE("Decode ignores unknown keys") {
    auto req = decode({{"op", "head"}, {"path", "/r"}, {"trace_id", 17}});
    REQUIRE(std::holds_alternative<gitport::HeadRequest>(req));
}

TEST_CASE("Decode accepts binary strings") {
    json doc = {{"op", "head"}};
    doc["path"] = json::binary({'/', 'r'});
    auto req = decode(doc);
    REQUIRE(std::get<gitport::HeadRequest>(req).path == "/r");
}

TEST_CASE("Malformed requests are protocol errors") {
    REQUIRE_THROWS_AS(decode({{"op", "explode"}, {"path", "/r"}}), ProtocolError);
    REQUIRE_THROWS_AS(decode({{"op", "read"}, {"path", "/r"}}), ProtocolError);
    REQUIRE_THROWS_AS(decode({{"path", "/r"}}), ProtocolError);
    REQUIRE_THROWS_AS(decode({{"op", 3}, {"path", "/r"}}), ProtocolError);
    REQUIRE_THROWS_AS(decode({{"op", "head"}, {"path", 42}}), ProtocolError);
    REQUIRE_THROWS_AS(decode(json::array({"head", "/r"})), ProtocolError);
    REQUIRE_THROWS_AS(gitport::decode_request({0xc1}), ProtocolError);
    REQUIRE_THROWS_AS(gitport::decode_request({}), ProtocolError);
}

TEST_CASE("Responses encode as single-key maps") {
    json ok = json::from_msgpack(gitport::Response::ok("abc").encode());
    REQUIRE(ok == json{{"ok", "abc"}});

    json list = json::from_msgpack(
        gitport::Response::ok(std::vector<std::string>{"a.yaml", "b.yml"}).encode());
    REQUIRE(list["ok"] == json::array({"a.yaml", "b.yml"}));

    json empty = json::from_msgpack(gitport::Response::ok(std::vector<std::string>{}).encode());
    REQUIRE(empty["ok"].is_array());
    REQUIRE(empty["ok"].empty());

    auto err = gitport::Response::err("file not found: /r/x.yaml");
    REQUIRE(err.is_error());
    REQUIRE(json::from_msgpack(err.encode()) == json{{"err", "file not found: /r/x.yaml"}});
}

TEST_CASE("Commit info response fields") {
    git::CommitInfo info;
    info.sha = std::string(40, 'b');
    info.author_name = "tester";
    info.author_email = "tester@example.com";
    info.message = "init\n";
    info.timestamp = 1700000000;
    auto resp = gitport::Response::ok(info);
    REQUIRE_FALSE(resp.is_error());
    json body = json::from_msgpack(resp.encode());
    const json& commit = body["ok"];
    REQUIRE(commit.size() == 5);
    REQUIRE(commit["sha"] == info.sha);
    REQUIRE(commit["author"] == "tester");
    REQUIRE(commit["email"] == "tester@example.com");
    REQUIRE(commit["message"] == "init\n");
    REQUIRE(commit["timestamp"] == 1700000000);
}
