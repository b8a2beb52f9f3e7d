#include <catch2/catch_test_macros.hpp>
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <string>

using namespace uabridge;

namespace {

Result<int, std::string> Half(const int value) {
    if (value % 2 != 0) {
        return Result<int, std::string>::Err("odd");
    }
    return Result<int, std::string>::Ok(value / 2);
}

Result<int, std::string> Quarter(const int value) {
    auto half = Half(value);
    UABRIDGE_TRY(half);
    auto quarter = Half(half.Unwrap());
    UABRIDGE_TRY(quarter);
    return quarter;
}

}

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
    SECTION("Unwrap on the wrong variant throws") {
        auto ok = Result<int, std::string>::Ok(1);
        auto err = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::logic_error);
        REQUIRE_THROWS_AS(err.Unwrap(), std::logic_error);
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
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts the error type") {
        auto mapped = Result<int, std::string>::Err("boom").MapErr([](std::string s) {
            return BridgeFailure::Crypto(std::move(s));
        });
        REQUIRE(mapped.UnwrapErr().Is(BridgeFailureType::Crypto));
        REQUIRE(mapped.UnwrapErr().message == "boom");
    }
    SECTION("Bind chains fallible steps") {
        REQUIRE(Result<int, std::string>::Ok(8).Bind(Half).Unwrap() == 4);
        REQUIRE(Result<int, std::string>::Ok(3).Bind(Half).UnwrapErr() == "odd");
    }
    SECTION("UnwrapOr") {
        REQUIRE(Result<int, std::string>::Ok(42).UnwrapOr(0) == 42);
        REQUIRE(Result<int, std::string>::Err("error").UnwrapOr(0) == 0);
    }
    SECTION("InspectErr sees only errors") {
        int seen = 0;
        auto ok = Result<int, std::string>::Ok(1);
        ok.InspectErr([&seen](const std::string&) { ++seen; });
        auto err = Result<int, std::string>::Err("error");
        err.InspectErr([&seen](const std::string&) { ++seen; });
        REQUIRE(seen == 1);
    }
}

TEST_CASE("Result<T, E> - Early return", "[result][core]") {
    SECTION("Success runs every step") {
        REQUIRE(Quarter(12).Unwrap() == 3);
    }
    SECTION("First failure is returned") {
        REQUIRE(Quarter(7).UnwrapErr() == "odd");
    }
    SECTION("Failure in a later step is returned") {
        REQUIRE(Quarter(6).UnwrapErr() == "odd");
    }
}

TEST_CASE("BridgeFailure - Taxonomy", "[result][core]") {
    REQUIRE(BridgeFailure::Persistence("disk").Is(BridgeFailureType::Persistence));
    REQUIRE_FALSE(BridgeFailure::Persistence("disk").Is(BridgeFailureType::Crypto));
    REQUIRE(BridgeFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom")).Is(BridgeFailureType::Crypto));
    REQUIRE(ToString(BridgeFailureType::Decoding) == "decoding");
    REQUIRE(ToString(BridgeFailureType::InvalidState) == "invalid_state");
}
