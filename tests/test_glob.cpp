#include <catch2/catch.hpp>
#include <workon/glob.hpp>
#include "fakes.hpp"

using namespace workon;
using workon::testing::TempDir;

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(glob_match(".env", ".env"));
    REQUIRE(glob_match("config/local.yml", "config/local.yml"));
}

TEST_CASE("glob literal no match", "[glob]") {
    REQUIRE_FALSE(glob_match("config/local.yml", "config/prod.yml"));
}

TEST_CASE("glob literal case sensitivity", "[glob]") {
    REQUIRE_FALSE(glob_match(".ENV", ".env"));
}

TEST_CASE("glob path normalization", "[glob]") {
    REQUIRE(glob_match("./config/*.yml", "config/a.yml"));
    REQUIRE(glob_match("config//*.yml", "config/a.yml"));
    REQUIRE(glob_match("config\\*.yml", "config/a.yml"));
}

// ---- Wildcards ----

TEST_CASE("glob star stays within a segment", "[glob]") {
    REQUIRE(glob_match("*.local", "app.local"));
    REQUIRE_FALSE(glob_match("*.local", "sub/app.local"));
}

TEST_CASE("glob star in middle of name", "[glob]") {
    REQUIRE(glob_match(".env.*.local", ".env.dev.local"));
    REQUIRE_FALSE(glob_match(".env.*.local", ".env.dev"));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(glob_match("file?.txt", "file1.txt"));
    REQUIRE_FALSE(glob_match("file?.txt", "file12.txt"));
    REQUIRE_FALSE(glob_match("a?b", "a/b"));
}

TEST_CASE("glob star matches empty string", "[glob]") {
    REQUIRE(glob_match("src/*.txt", "src/.txt"));
}

// ---- Double-star ----

TEST_CASE("glob doublestar deep path", "[glob]") {
    REQUIRE(glob_match("**/*.json", "a/b/c/d.json"));
    REQUIRE(glob_match("**/*", "top.txt"));
}

TEST_CASE("glob doublestar at start", "[glob]") {
    REQUIRE(glob_match("**/.env", ".env"));
    REQUIRE(glob_match("**/.env", "services/api/.env"));
}

TEST_CASE("glob doublestar in middle", "[glob]") {
    REQUIRE(glob_match("node_modules/**/package.json", "node_modules/package.json"));
    REQUIRE(glob_match("node_modules/**/package.json", "node_modules/a/b/package.json"));
}

TEST_CASE("glob doublestar at end", "[glob]") {
    REQUIRE(glob_match("build/**", "build/out.o"));
    REQUIRE(glob_match("build/**", "build/a/b/c.o"));
    REQUIRE_FALSE(glob_match("build/**", "src/build.o"));
}

// ---- Character classes ----

TEST_CASE("glob char class set and range", "[glob]") {
    REQUIRE(glob_match("[abc].txt", "a.txt"));
    REQUIRE_FALSE(glob_match("[abc].txt", "d.txt"));
    REQUIRE(glob_match("[a-z].txt", "m.txt"));
    REQUIRE_FALSE(glob_match("[a-z].txt", "M.txt"));
}

TEST_CASE("glob char class negation", "[glob]") {
    REQUIRE(glob_match("[!0-9].txt", "a.txt"));
    REQUIRE_FALSE(glob_match("[!0-9].txt", "5.txt"));
    REQUIRE(glob_match("[^0-9].txt", "a.txt"));
}

// ---- Filesystem ----

TEST_CASE("glob_expand returns sorted relative paths", "[glob]") {
    TempDir td;
    td.write_file("b.txt", "b");
    td.write_file("a.txt", "a");
    td.write_file("sub/c.txt", "c");
    td.write_file("sub/d.md", "d");

    auto res = glob_expand("**/*.txt", td.path);
    REQUIRE(res.is_ok());
    REQUIRE(res.value() == std::vector<std::string>{"a.txt", "b.txt", "sub/c.txt"});
}

TEST_CASE("glob_expand never descends into .git", "[glob]") {
    TempDir td;
    td.write_file(".git/config", "[core]");
    td.write_file("sub/.git", "gitdir: elsewhere");
    td.write_file("keep.txt", "k");

    auto res = glob_expand("**/*", td.path);
    REQUIRE(res.is_ok());
    REQUIRE(res.value() == std::vector<std::string>{"keep.txt"});
}

TEST_CASE("glob_expand on missing directory", "[glob]") {
    auto res = glob_expand("*", "/nonexistent/workon/dir");
    REQUIRE(res.is_err());
    REQUIRE(res.error().code == WorkonError::IO);
}
