#include <catch2/catch.hpp>
#include <workon/branch_name.hpp>

using namespace workon;

TEST_CASE("BranchName parses plain and namespaced names", "[branch_name]") {
    auto plain = BranchName::parse("feature-a");
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().str() == "feature-a");
    REQUIRE(plain.value().segments().size() == 1);

    auto ns = BranchName::parse("team/alice/feature");
    REQUIRE(ns.is_ok());
    REQUIRE(ns.value().segments() == std::vector<std::string>{"team", "alice", "feature"});
    REQUIRE(ns.value().relative_path() == std::filesystem::path("team/alice/feature"));
}

TEST_CASE("BranchName equality", "[branch_name]") {
    auto a = BranchName::parse("release/1.0").value();
    auto b = BranchName::parse("release/1.0").value();
    auto c = BranchName::parse("release/2.0").value();
    REQUIRE(a == b);
    REQUIRE(a != c);
}

TEST_CASE("BranchName accepts what git accepts", "[branch_name]") {
    for (const char* ok : {"a", "v1.2.3", "fix_123", "user@host", "a.b/c-d", "pr-42", "x.lockfile"}) {
        INFO(ok);
        REQUIRE(BranchName::parse(ok).is_ok());
    }
}

TEST_CASE("BranchName rejects invalid names", "[branch_name]") {
    const char* bad[] = {
        "", "@", "-leading", "a..b", "a@{1}", "trailing.", "with space",
        "tilde~", "caret^", "colon:", "quest?", "star*", "brack[", "back\\slash",
        "/leading", "trailing/", "double//slash", ".hidden", "ns/.hidden",
        "name.lock", "ns/name.lock", "tab\there",
    };
    for (const char* b : bad) {
        INFO(b);
        auto r = BranchName::parse(b);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == WorkonError::InvalidArg);
    }
}

TEST_CASE("BranchName error names the rule", "[branch_name]") {
    auto r = BranchName::parse("a..b");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "invalid branch name 'a..b': must not contain '..'");
}
