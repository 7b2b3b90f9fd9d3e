#include <catch2/catch_test_macros.hpp>
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <string>
using namespace keyward;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Unwrap on Err throws logic_error") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("FromOptional") {
        auto some = Result<int, std::string>::FromOptional(7, "none");
        auto none = Result<int, std::string>::FromOptional(std::nullopt, "none");
        REQUIRE(some.Unwrap() == 7);
        REQUIRE(none.UnwrapErr() == "none");
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("PropagateErr re-types the error") {
        auto result = Result<int, std::string>::Err("boom");
        auto propagated = std::move(result).PropagateErr<std::string>();
        REQUIRE(propagated.IsErr());
        REQUIRE(propagated.UnwrapErr() == "boom");
    }
}
TEST_CASE("Result<T, E> - UnwrapOr", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
}
TEST_CASE("KeywardFailure - Taxonomy", "[result][core]") {
    SECTION("Network-class failures are retryable") {
        REQUIRE(KeywardFailure::ServerKeyUnavailable("x").IsRetryable());
        REQUIRE(KeywardFailure::FetchTimeout("x").IsRetryable());
        REQUIRE(KeywardFailure::Network("x").IsRetryable());
        REQUIRE_FALSE(KeywardFailure::KeyFormat("modulus", "x").IsRetryable());
        REQUIRE_FALSE(KeywardFailure::AuthenticationFailed("x").IsRetryable());
        REQUIRE_FALSE(KeywardFailure::KeysUnavailable("x").IsRetryable());
    }
    SECTION("KeyFormat carries the field name") {
        const auto failure = KeywardFailure::KeyFormat("publicExponent", "bad exponent");
        REQUIRE(failure.type == FailureType::KeyFormat);
        REQUIRE(failure.field == "publicExponent");
        REQUIRE(failure.ToString() == "KeyFormat(publicExponent): bad exponent");
    }
    SECTION("Sodium failures map to Generic") {
        const auto failure = KeywardFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(failure.type == FailureType::Generic);
        REQUIRE(failure.message == "oom");
    }
}
