#include "test_common.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>
#include "framing.hpp"
#include "gitport_app.hpp"
#include "version.hpp"

using json = nlohmann::json;
using gitport::test_support::scratch_dir;
using gitport::test_support::write_text;

namespace {
int run(std::vector<const char*> args, std::istream& in, std::ostream& out) {
    args.insert(args.begin(), "gitport");
    return gitport::run_app(static_cast<int>(args.size()), const_cast<char**>(args.data()), in,
                            out);
}
} // namespace

TEST_CASE("run_app prints the version") {
    std::istringstream in;
    std::ostringstream out;
    REQUIRE(run({"--version"}, in, out) == 0);
    REQUIRE(out.str() == std::string(GITPORT_VERSION) + "\n");
}

TEST_CASE("run_app prints help") {
    std::istringstream in;
    std::ostringstream out;
    REQUIRE(run({"-h"}, in, out) == 0);
    REQUIRE(out.str().find("Usage: gitport") != std::string::npos);
}

TEST_CASE("run_app rejects unknown options without touching the output") {
    std::istringstream in;
    std::ostringstream out;
    REQUIRE(run({"--bogus"}, in, out) == 1);
    REQUIRE(out.str().empty());
}

TEST_CASE("run_app serves requests until end of input") {
    fs::path dir = scratch_dir("app_serve");
    write_text(dir / "app.yaml", "a: 1\n");

    std::stringstream in;
    gitport::write_frame(in, json::to_msgpack(json{{"op", "files"}, {"path", dir.string()}}));
    std::stringstream out;
    REQUIRE(run({"--quiet"}, in, out) == 0);

    std::vector<std::uint8_t> payload;
    REQUIRE(gitport::read_frame(out, payload));
    REQUIRE(json::from_msgpack(payload)["ok"] == json::array({"app.yaml"}));
    REQUIRE_FALSE(gitport::read_frame(out, payload));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_app exits with failure on a framing error") {
    std::istringstream in(std::string("\x00\x00", 2));
    std::ostringstream out;
    REQUIRE(run({"--quiet"}, in, out) == 1);
    REQUIRE(out.str().empty());
}
