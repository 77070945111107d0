#include "test_common.hpp"
#include "commit_sha.hpp"
#include "errors.hpp"

using gitport::CommitSha;

TEST_CASE("CommitSha accepts full hex ids") {
    const std::string sha1(40, 'a');
    const std::string sha256(64, '0');
    REQUIRE(CommitSha::is_valid(sha1));
    REQUIRE(CommitSha::is_valid(sha256));
    REQUIRE(CommitSha::parse(sha1).str() == sha1);
}

TEST_CASE("CommitSha normalizes case") {
    CommitSha sha = CommitSha::parse("ABCDEF0123456789ABCDEF0123456789ABCDEF01");
    REQUIRE(sha.str() == "abcdef0123456789abcdef0123456789abcdef01");
    REQUIRE(sha.short_form() == "abcdef0");
    REQUIRE(sha == CommitSha::parse("abcdef0123456789abcdef0123456789abcdef01"));
}

TEST_CASE("CommitSha rejects malformed ids") {
    REQUIRE_FALSE(CommitSha::is_valid(""));
    REQUIRE_FALSE(CommitSha::is_valid("abc123"));
    REQUIRE_FALSE(CommitSha::is_valid(std::string(39, 'a') + "g"));
    REQUIRE_FALSE(CommitSha::is_valid(std::string(41, 'a')));
    try {
        CommitSha::parse("HEAD");
        FAIL("expected an exception");
    } catch (const gitport::Error& e) {
        REQUIRE(e.kind() == gitport::ErrorKind::InvalidArgument);
        REQUIRE(std::string(e.what()).find("HEAD") != std::string::npos);
    }
}

TEST_CASE("Error messages carry their kind prefix") {
    using gitport::Error;
    REQUIRE(std::string(Error::vcs("boom").what()) == "git error: boom");
    REQUIRE(std::string(Error::io("denied").what()) == "io error: denied");
    REQUIRE(std::string(Error::repo_not_found("/x").what()) == "repository not found at /x");
    REQUIRE(std::string(Error::branch_not_found("dev").what()) == "branch 'dev' not found");
    REQUIRE(std::string(Error::file_not_found("/x/a.yaml").what()) ==
            "file not found: /x/a.yaml");
    REQUIRE(std::string(gitport::error_kind_name(gitport::ErrorKind::CommitNotFound)) ==
            "commit_not_found");
}
