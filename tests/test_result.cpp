#include <catch2/catch.hpp>
#include <workon/result.hpp>
#include <memory>
#include <string>

using namespace workon;

// Helper function that uses WORKON_TRY
static Result<int> try_double(Result<int> input) {
    WORKON_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(WorkonError{WorkonError::Parse, "first failed"})
        : Result<int>::ok(10);
    WORKON_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    WORKON_TRY(second);
    return Result<int>::ok(second.value());
}

static Status check_positive(int x) {
    if (x <= 0) return WorkonError{WorkonError::InvalidArg, "not positive"};
    return ok_status();
}

static Result<std::string> describe(int x) {
    WORKON_TRY(check_positive(x));
    return Result<std::string>::ok("ok " + std::to_string(x));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(WorkonError{WorkonError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == WorkonError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Implicit conversion from WorkonError", "[result]") {
    Result<int> r = WorkonError{WorkonError::IO, "fail"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WorkonError::IO);
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(WorkonError{WorkonError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(WorkonError{WorkonError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(WorkonError{WorkonError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("WORKON_TRY propagates errors", "[result]") {
    auto input = Result<int>::err(WorkonError{WorkonError::Parse, "syntax error"});
    auto output = try_double(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == WorkonError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("WORKON_TRY passes through Ok", "[result]") {
    auto output = try_double(Result<int>::ok(7));
    REQUIRE(output.is_ok());
    REQUIRE(output.value() == 14);
}

TEST_CASE("WORKON_TRY chained", "[result]") {
    REQUIRE(try_chain(false).value() == 15);
    auto r = try_chain(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "first failed");
}

TEST_CASE("WORKON_TRY forwards a Status error into another Result type", "[result]") {
    auto bad = describe(-1);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == WorkonError::InvalidArg);
    REQUIRE(describe(4).value() == "ok 4");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(WorkonError{WorkonError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == WorkonError::Config);
}

TEST_CASE("WorkonError format() output", "[error]") {
    WorkonError e{WorkonError::Resolution, "name already in use", "pick another name"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Resolution]: name already in use") != std::string::npos);
    REQUIRE(formatted.find("\n  hint: pick another name") != std::string::npos);
}

TEST_CASE("WorkonError format() without hint", "[error]") {
    WorkonError e{WorkonError::Parse, "unexpected line"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected line");
}

TEST_CASE("WorkonError code_name() for all codes", "[error]") {
    REQUIRE(std::string(WorkonError::code_name(WorkonError::IO)) == "IO");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::Parse)) == "Parse");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::Config)) == "Config");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::Resolution)) == "Resolution");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::GitBackend)) == "GitBackend");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::NotFound)) == "NotFound");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(WorkonError::code_name(WorkonError::Unsafe)) == "Unsafe");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto r2 = Result<std::unique_ptr<int>>::err(WorkonError{WorkonError::IO, "fail"});
    REQUIRE(r2.is_err());
}
