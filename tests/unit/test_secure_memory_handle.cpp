#include <catch2/catch_test_macros.hpp>
#include "uabridge/crypto/sodium_secure_memory_handle.hpp"
#include "uabridge/crypto/sodium_interop.hpp"

#include <algorithm>
#include <vector>

using namespace uabridge;
using namespace uabridge::crypto;

TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("FromBytes copies the input") {
        const std::vector<uint8_t> key(32, 0x17);
        auto handle = SecureMemoryHandle::FromBytes(key).Unwrap();
        REQUIRE(handle.ReadBytes(32).Unwrap() == key);
    }
}

TEST_CASE("SecureMemoryHandle - Ownership", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move leaves the source disposed") {
        auto first = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle second(std::move(first));
        REQUIRE(first.IsInvalid());
        REQUIRE(second.Size() == 32);
    }
    SECTION("Disposed handle refuses access") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto moved = std::move(handle);
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
        REQUIRE(handle.ReadBytes(32).IsErr());
        REQUIRE(handle.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
    }
    SECTION("Clone is independent") {
        auto original = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(16, 0x01)).Unwrap();
        auto copy = original.Clone().Unwrap();
        REQUIRE(original.Write(std::vector<uint8_t>(16, 0x02)).IsOk());
        REQUIRE(copy.ReadBytes(16).Unwrap() == std::vector<uint8_t>(16, 0x01));
    }
}

TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
    SECTION("Write larger than buffer fails") {
        REQUIRE(handle.Write(std::vector<uint8_t>(33, 0x42)).IsErr());
    }
    SECTION("Read into too-small buffer fails") {
        std::vector<uint8_t> buffer(16);
        REQUIRE(handle.Read(buffer).IsErr());
    }
    SECTION("ReadBytes beyond the allocation fails") {
        REQUIRE(handle.ReadBytes(64).IsErr());
    }
    SECTION("WithWriteAccess then WithReadAccess") {
        REQUIRE(handle.WithWriteAccess([](std::span<uint8_t> span) {
            std::fill(span.begin(), span.end(), 0xFF);
            return unit;
        }).IsOk());
        auto all_set = handle.WithReadAccess([](std::span<const uint8_t> span) {
            return std::all_of(span.begin(), span.end(), [](uint8_t b) { return b == 0xFF; });
        });
        REQUIRE(all_set.IsOk());
        REQUIRE(all_set.Unwrap());
    }
}
