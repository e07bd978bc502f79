#include <catch2/catch.hpp>
#include <plume/result.hpp>
#include <memory>
#include <string>

using namespace plume;

// Helper function that uses PLUME_TRY
static Result<int> try_double(Result<int> input) {
    PLUME_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<std::string> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<std::string>::err(PlumeError::unknown_key("paper.title"))
        : Result<std::string>::ok("Hello");
    PLUME_TRY(first);
    auto second = Result<std::string>::ok(first.value() + " World");
    PLUME_TRY(second);
    return Result<std::string>::ok(second.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(PlumeError::unknown_key("missing"));
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == PlumeError::UnknownKey);
    REQUIRE(r.error().path == "missing");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(PlumeError{PlumeError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(PlumeError{PlumeError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    auto ok = Result<std::string>::ok("rendered");
    auto err = Result<std::string>::err(PlumeError::timeout(10));
    REQUIRE(ok.value_or("fallback") == "rendered");
    REQUIRE(err.value_or("fallback") == "fallback");
}

TEST_CASE("map() transforms Ok value and passes through Err", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");

    auto e = Result<int>::err(PlumeError{PlumeError::InvalidSyntax, "bad tag"});
    bool called = false;
    auto mapped_err = e.map([&](int x) { called = true; return x * 2; });
    REQUIRE(mapped_err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped_err.error().code == PlumeError::InvalidSyntax);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto r = Result<int>::ok(5);
    auto chained = r.and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(chained.value() == 15);

    auto e = Result<int>::err(PlumeError{PlumeError::Timeout, "slow"});
    bool called = false;
    auto skipped = e.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x);
    });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(skipped.error().code == PlumeError::Timeout);
}

TEST_CASE("or_else() recovers from Err only", "[result]") {
    auto ok = Result<int>::ok(5);
    auto kept = ok.or_else([](PlumeError&) { return Result<int>::ok(99); });
    REQUIRE(kept.value() == 5);

    auto err = Result<int>::err(PlumeError{PlumeError::IO, "disk full"});
    auto recovered = err.or_else([](PlumeError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("PLUME_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(PlumeError{PlumeError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == PlumeError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("PLUME_TRY passes through Ok", "[result]") {
    auto output = try_double(Result<int>::ok(7));
    REQUIRE(output.value() == 14);
}

TEST_CASE("PLUME_TRY across result types", "[result]") {
    REQUIRE(try_chain(false).value() == "Hello World");

    auto r = try_chain(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PlumeError::UnknownKey);
    REQUIRE(r.error().path == "paper.title");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());

    auto s = Status::err(PlumeError{PlumeError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PlumeError::Config);
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);

    auto moved = std::move(r).value();
    REQUIRE(*moved == 99);
}
