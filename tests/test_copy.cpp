#include <catch2/catch.hpp>
#include <workon/copy.hpp>
#include "fakes.hpp"

using namespace workon;
using workon::testing::TempDir;

namespace fs = std::filesystem;

namespace {

// src/ holds a checked-out tree with untracked extras, dst/ is a fresh sibling.
struct CopyFixture {
    TempDir td{"workon_copy_"};
    fs::path src;
    fs::path dst;

    CopyFixture() {
        src = td.path / "src";
        dst = td.path / "dst";
        td.write_file("src/.env", "SECRET=1");
        td.write_file("src/.env.local", "LOCAL=1");
        td.write_file("src/config/dev.yml", "dev");
        td.write_file("src/config/prod.yml", "prod");
        td.write_file("src/node_modules/pkg/index.js", "js");
        td.write_file("src/.git", "gitdir: /elsewhere");
        fs::create_directories(dst);
    }
};

} // namespace

TEST_CASE("copy selected files into the new worktree", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {".env*", "config/*.yml"}, {}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{
        ".env", ".env.local", "config/dev.yml", "config/prod.yml"});
    REQUIRE(f.td.read_file("dst/config/dev.yml") == "dev");
    REQUIRE(f.td.read_file("dst/.env") == "SECRET=1");
}

TEST_CASE("excludes win over includes", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {"**/*"}, {"node_modules/", "config/prod.yml"}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{".env", ".env.local", "config/dev.yml"});
    REQUIRE_FALSE(fs::exists(f.dst / "node_modules"));
    REQUIRE_FALSE(fs::exists(f.dst / "config/prod.yml"));
}

TEST_CASE("directory include pattern copies the subtree", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {"node_modules/"}, {}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"node_modules/pkg/index.js"});
    REQUIRE(f.td.read_file("dst/node_modules/pkg/index.js") == "js");
}

TEST_CASE("the .git file is never copied", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {"**/*", ".git"}, {}, false);
    REQUIRE(r.is_ok());
    for (const auto& rel : r.value()) REQUIRE(rel != ".git");
    REQUIRE_FALSE(fs::exists(f.dst / ".git"));
}

TEST_CASE("existing destination files are kept unless overwriting", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;
    f.td.write_file("dst/.env", "MINE=1");

    SECTION("keep") {
        auto r = engine.copy_matching(f.src, f.dst, {".env"}, {}, false);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().empty());
        REQUIRE(f.td.read_file("dst/.env") == "MINE=1");
    }

    SECTION("overwrite") {
        auto r = engine.copy_matching(f.src, f.dst, {".env"}, {}, true);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == std::vector<std::string>{".env"});
        REQUIRE(f.td.read_file("dst/.env") == "SECRET=1");
    }
}

TEST_CASE("overlapping patterns copy each file once", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {".env", ".env*", "**/.env"}, {}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{".env", ".env.local"});
}

TEST_CASE("patterns matching nothing copy nothing", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.src, f.dst, {"*.nothing"}, {}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("missing source directory is an IO error", "[copy]") {
    CopyFixture f;
    FileCopyEngine engine;

    auto r = engine.copy_matching(f.td.path / "gone", f.dst, {"**/*"}, {}, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WorkonError::IO);
}
