#include <catch2/catch.hpp>
#include <fillin/result.hpp>
#include <memory>
#include <string>

using namespace fillin;

// Helper function that uses FILLIN_TRY
static Result<std::string> try_quote(Result<std::string> input) {
    FILLIN_TRY(input);
    return Result<std::string>::ok("\"" + input.value() + "\"");
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(FillinError{FillinError::Parse, "first failed"})
        : Result<int>::ok(10);
    FILLIN_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    FILLIN_TRY(second);
    return Result<int>::ok(second.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<std::string>::ok("text");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == "text");
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<std::string>::err(FillinError{FillinError::UnknownTag, "no hook for '#'"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == FillinError::UnknownTag);
    REQUIRE(r.error().message == "no hook for '#'");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(FillinError{FillinError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(FillinError{FillinError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("FILLIN_TRY propagates errors", "[result]") {
    auto input = Result<std::string>::err(FillinError{FillinError::NotFound, "no such function"});
    auto output = try_quote(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == FillinError::NotFound);
    REQUIRE(output.error().message == "no such function");
}

TEST_CASE("FILLIN_TRY passes through Ok", "[result]") {
    auto output = try_quote(Result<std::string>::ok("x"));
    REQUIRE(output.is_ok());
    REQUIRE(output.value() == "\"x\"");
}

TEST_CASE("FILLIN_TRY chained - all Ok", "[result]") {
    auto r = try_chain(false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 15);
}

TEST_CASE("FILLIN_TRY chained - first fails", "[result]") {
    auto r = try_chain(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "first failed");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(FillinError{FillinError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == FillinError::Config);
}

TEST_CASE("FillinError format() output", "[error]") {
    FillinError e{FillinError::IO, "can't open page.tmpl", "check file permissions"};
    e.file = "site.toml";
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("can't open page.tmpl") != std::string::npos);
    REQUIRE(formatted.find("hint: check file permissions") != std::string::npos);
    REQUIRE(formatted.find("--> site.toml") != std::string::npos);
}

TEST_CASE("FillinError format() without hint or file", "[error]") {
    FillinError e{FillinError::UnknownTag, "no interpret hook defined for type '#'"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[UnknownTag]") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("FillinError code_name() for all codes", "[error]") {
    REQUIRE(std::string(FillinError::code_name(FillinError::IO)) == "IO");
    REQUIRE(std::string(FillinError::code_name(FillinError::Parse)) == "Parse");
    REQUIRE(std::string(FillinError::code_name(FillinError::Config)) == "Config");
    REQUIRE(std::string(FillinError::code_name(FillinError::NotFound)) == "NotFound");
    REQUIRE(std::string(FillinError::code_name(FillinError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(FillinError::code_name(FillinError::MalformedSpan)) == "MalformedSpan");
    REQUIRE(std::string(FillinError::code_name(FillinError::UnknownTag)) == "UnknownTag");
    REQUIRE(std::string(FillinError::code_name(FillinError::Hook)) == "Hook");
}

TEST_CASE("only malformed spans are recoverable", "[error]") {
    REQUIRE(FillinError{FillinError::MalformedSpan, ""}.is_recoverable());
    REQUIRE_FALSE(FillinError{FillinError::UnknownTag, ""}.is_recoverable());
    REQUIRE_FALSE(FillinError{FillinError::Hook, ""}.is_recoverable());
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto r2 = Result<std::unique_ptr<int>>::err(FillinError{FillinError::IO, "fail"});
    REQUIRE(r2.is_err());
}
