#include <catch2/catch.hpp>
#include <modsrc/result.hpp>
#include <memory>
#include <string>

using namespace modsrc;

static Result<int> try_double(Result<int> input) {
    MODSRC_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<std::string> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<std::string>::err(ModsrcError{ModsrcError::Parse, "first failed"})
        : Result<std::string>::ok("github.com");
    MODSRC_TRY(first);
    auto second = Result<std::string>::ok(first.value() + "/org/repo");
    MODSRC_TRY(second);
    return second;
}

TEST_CASE("Ok result holds value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds error", "[result]") {
    auto r = Result<int>::err(ModsrcError{ModsrcError::InvalidSource, "bad source"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == ModsrcError::InvalidSource);
    REQUIRE(r.error().message == "bad source");
}

TEST_CASE("is_err with code", "[result]") {
    auto r = Result<int>::err(ModsrcError{ModsrcError::UnsupportedSource, "nope"});
    REQUIRE(r.is_err(ModsrcError::UnsupportedSource));
    REQUIRE_FALSE(r.is_err(ModsrcError::InvalidSource));
    REQUIRE_FALSE(Result<int>::ok(1).is_err(ModsrcError::UnsupportedSource));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(ModsrcError{ModsrcError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(ok.value() == 10);

    bool called = false;
    auto err = Result<int>::err(ModsrcError{ModsrcError::Parse, "bad input"});
    auto mapped = err.map([&](int x) { called = true; return x; });
    REQUIRE(mapped.is_err(ModsrcError::Parse));
    REQUIRE_FALSE(called);
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(ModsrcError{ModsrcError::Manifest, "broken"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err(ModsrcError::Manifest));
    REQUIRE_FALSE(called);

    auto ok = Result<int>::ok(5).and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(ok.value() == 15);
}

TEST_CASE("or_else() recovers from Err", "[result]") {
    auto r = Result<int>::err(ModsrcError{ModsrcError::IO, "disk full"});
    auto recovered = r.or_else([](ModsrcError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("MODSRC_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(ModsrcError{ModsrcError::Parse, "syntax error"}));
    REQUIRE(output.is_err(ModsrcError::Parse));
    REQUIRE(output.error().message == "syntax error");
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("MODSRC_TRY chained", "[result]") {
    REQUIRE(try_chain(false).value() == "github.com/org/repo");
    REQUIRE(try_chain(true).error().message == "first failed");
}

TEST_CASE("Status", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(ModsrcError{ModsrcError::Config, "bad config"});
    REQUIRE(s.is_err(ModsrcError::Config));
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

// ===== ModsrcError =====

TEST_CASE("format() with input, cause and hint", "[error]") {
    auto e = ModsrcError::source(ModsrcError::InvalidSource,
        "'github.com/x%zz' is not a URL", "github.com/x%zz",
        "invalid URL escape \"%zz\"");
    e.hint = "check the escapes";
    auto formatted = e.format();
    REQUIRE(formatted.find("error[InvalidSource]: 'github.com/x%zz' is not a URL") == 0);
    REQUIRE(formatted.find("\n  input: github.com/x%zz") != std::string::npos);
    REQUIRE(formatted.find("\n  caused by: invalid URL escape") != std::string::npos);
    REQUIRE(formatted.find("\n  hint: check the escapes") != std::string::npos);
}

TEST_CASE("format() without extras", "[error]") {
    ModsrcError e{ModsrcError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected token");
}

TEST_CASE("source() keeps raw input and cause", "[error]") {
    auto e = ModsrcError::source(ModsrcError::UnsupportedSource, "unsupported", "./x");
    REQUIRE(e.code == ModsrcError::UnsupportedSource);
    REQUIRE(e.input == "./x");
    REQUIRE(e.cause.empty());
}

TEST_CASE("code_name() for all codes", "[error]") {
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::UnsupportedSource)) == "UnsupportedSource");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::InvalidSource)) == "InvalidSource");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::IO)) == "IO");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::Parse)) == "Parse");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::Config)) == "Config");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::Manifest)) == "Manifest");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::Duplicate)) == "Duplicate");
    REQUIRE(std::string(ModsrcError::code_name(ModsrcError::InvalidArg)) == "InvalidArg");
}
