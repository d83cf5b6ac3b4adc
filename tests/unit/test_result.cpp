#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace sparkle;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err keeps the error kind", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::NotFound, "Theme not found: x"});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is(ErrorKind::NotFound));
    REQUIRE(result.unwrap_err().message == "Theme not found: x");
    REQUIRE_FALSE(result.unwrap_err().validation.has_value());
}

TEST_CASE("Plain errors default to Storage", "[result]") {
    Error error{"disk I/O error", 10};
    REQUIRE(error.kind == ErrorKind::Storage);
    REQUIRE(error.code == 10);
}

TEST_CASE("Name validation errors carry the precise outcome", "[result]") {
    Error error{ErrorKind::InvalidName, "too long", NameValidation::TooLong};
    REQUIRE(error.is(ErrorKind::InvalidName));
    REQUIRE(error.validation == NameValidation::TooLong);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto result = Result<int>::err(Error{ErrorKind::Cancelled, "stop"})
        .and_then([&](int x) -> Result<int> {
            called = true;
            return Result<int>::ok(x);
        });

    REQUIRE_FALSE(called);
    REQUIRE(result.unwrap_err().is(ErrorKind::Cancelled));
}

TEST_CASE("Result works when value and error types coincide", "[result]") {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("problem");

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err() == "problem");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Error kinds have stable names", "[result]") {
    REQUIRE(to_string(ErrorKind::ProtectedTheme) == "ProtectedTheme");
    REQUIRE(to_string(ErrorKind::AggregateRefreshFailure) == "AggregateRefreshFailure");
    REQUIRE(to_string(NameValidation::Empty) == "Empty");
}
