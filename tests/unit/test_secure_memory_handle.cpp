#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/crypto/sodium_interop.hpp"
using namespace keyward;
using namespace keyward::crypto;
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
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("FromBytes copies the data") {
        std::vector<uint8_t> data = {9, 8, 7};
        auto handle = SecureMemoryHandle::FromBytes(data).Unwrap();
        auto copy = handle.ReadBytes(3);
        REQUIRE(copy.IsOk());
        REQUIRE(copy.Unwrap() == data);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto original = SecureMemoryHandle::Allocate(16).Unwrap();
        SecureMemoryHandle moved(std::move(original));
        REQUIRE(original.IsInvalid());
        REQUIRE_FALSE(moved.IsInvalid());
        REQUIRE(moved.Size() == 16);
    }
    SECTION("Move assignment transfers ownership") {
        auto a = SecureMemoryHandle::Allocate(16).Unwrap();
        auto b = SecureMemoryHandle::Allocate(8).Unwrap();
        b = std::move(a);
        REQUIRE(a.IsInvalid());
        REQUIRE(b.Size() == 16);
    }
}
TEST_CASE("SecureMemoryHandle - Write and Read", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
    SECTION("Write then read back") {
        std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
        REQUIRE(handle.Write(data).IsOk());
        std::vector<uint8_t> out(8);
        REQUIRE(handle.Read(out).IsOk());
        REQUIRE(out == data);
    }
    SECTION("Short write zero-fills the remainder") {
        std::vector<uint8_t> data = {0xAA, 0xBB};
        REQUIRE(handle.Write(data).IsOk());
        auto out = handle.ReadBytes(8);
        REQUIRE(out.IsOk());
        REQUIRE(out.Unwrap() == std::vector<uint8_t>{0xAA, 0xBB, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Write larger than buffer fails") {
        std::vector<uint8_t> data(9, 0x01);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into too-small buffer fails") {
        std::vector<uint8_t> out(4);
        REQUIRE(handle.Read(out).IsErr());
    }
    SECTION("Disposed handle rejects access") {
        SecureMemoryHandle sink(std::move(handle));
        std::vector<uint8_t> data = {1};
        REQUIRE(handle.Write(data).IsErr());
        REQUIRE(handle.ReadBytes(1).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t> bytes) { return bytes.size(); });
        REQUIRE(access.IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - WithReadAccess", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> data = {10, 20, 30, 40};
    auto handle = SecureMemoryHandle::FromBytes(data).Unwrap();
    auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
        int total = 0;
        for (auto b : bytes) {
            total += b;
        }
        return total;
    });
    REQUIRE(sum.IsOk());
    REQUIRE(sum.Unwrap() == 100);
}
