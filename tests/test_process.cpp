#include <catch2/catch.hpp>
#include <workon/process.hpp>

using namespace workon;

TEST_CASE("run_command echo", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr", "[process]") {
    auto r = run_command({"sh", "-c", "echo err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stderr_str.find("err") != std::string::npos);
}

TEST_CASE("run_command empty args error", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WorkonError::InvalidArg);
}

TEST_CASE("run_command with working dir", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.find("/tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary", "[process]") {
    auto r = run_command({"__workon_nonexistent_binary_xyz__"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command adds environment variables", "[process]") {
    auto r = run_command({"sh", "-c", "printf %s \"$WORKON_TEST_VAR\""}, "", 10,
                         {{"WORKON_TEST_VAR", "forty two"}});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "forty two");
}

TEST_CASE("run_command large output does not deadlock", "[process]") {
    auto r = run_command({"sh", "-c", "yes x | head -n 100000"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.size() == 200000);
}

TEST_CASE("run_command timeout", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WorkonError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("trim_output strips trailing newlines only", "[process]") {
    REQUIRE(trim_output("main\n") == "main");
    REQUIRE(trim_output("a b\r\n\n") == "a b");
    REQUIRE(trim_output("  x") == "  x");
    REQUIRE(trim_output("") == "");
}
