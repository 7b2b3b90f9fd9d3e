#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include <string>
using namespace keyward;
using namespace keyward::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
    }
    SECTION("Wipe small buffer zeroes it") {
        std::vector<uint8_t> buffer(100, 0xFF);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0x00));
    }
    SECTION("Wipe large buffer zeroes it") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(10000, 0x00));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
}

TEST_CASE("SodiumInterop - Hex encoding", "[sodium][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("ToHex is lowercase") {
        std::vector<uint8_t> data = {0x00, 0xAB, 0xFF, 0x10};
        REQUIRE(SodiumInterop::ToHex(data) == "00abff10");
    }
    SECTION("FromHex accepts either case") {
        auto lower = SodiumInterop::FromHex("00abff10");
        auto upper = SodiumInterop::FromHex("00ABFF10");
        REQUIRE(lower.IsOk());
        REQUIRE(upper.IsOk());
        REQUIRE(lower.Unwrap() == std::vector<uint8_t>{0x00, 0xAB, 0xFF, 0x10});
        REQUIRE(upper.Unwrap() == lower.Unwrap());
    }
    SECTION("FromHex rejects odd length and non-hex digits") {
        auto odd = SodiumInterop::FromHex("abc");
        auto junk = SodiumInterop::FromHex("zz");
        REQUIRE(odd.IsErr());
        REQUIRE(odd.UnwrapErr().type == FailureType::Decode);
        REQUIRE(junk.IsErr());
        REQUIRE(junk.UnwrapErr().type == FailureType::Decode);
    }
}

TEST_CASE("SodiumInterop - Base64 encoding", "[sodium][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("RFC 4648 vectors") {
        const std::string text = "foobar";
        std::vector<uint8_t> data(text.begin(), text.end());
        REQUIRE(SodiumInterop::ToBase64(data) == "Zm9vYmFy");
        std::vector<uint8_t> partial(text.begin(), text.begin() + 4);
        REQUIRE(SodiumInterop::ToBase64(partial) == "Zm9vYg==");
    }
    SECTION("FromBase64 ignores embedded newlines") {
        auto decoded = SodiumInterop::FromBase64("Zm9v\nYmFy\n");
        REQUIRE(decoded.IsOk());
        REQUIRE(std::string(decoded.Unwrap().begin(), decoded.Unwrap().end()) == "foobar");
    }
    SECTION("FromBase64 rejects garbage") {
        auto decoded = SodiumInterop::FromBase64("not*base64!");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == FailureType::Decode);
    }
}

TEST_CASE("SodiumInterop - Hashing", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SHA-256 of abc") {
        const std::string text = "abc";
        std::vector<uint8_t> data(text.begin(), text.end());
        REQUIRE(SodiumInterop::ToHex(SodiumInterop::Sha256(data))
            == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
    SECTION("HMAC-SHA256 RFC 4231 case 2") {
        const std::string key = "Jefe";
        const std::string message = "what do ya want for nothing?";
        auto mac = SodiumInterop::HmacSha256(
            std::vector<uint8_t>(key.begin(), key.end()),
            std::vector<uint8_t>(message.begin(), message.end()));
        REQUIRE(SodiumInterop::ToHex(mac)
            == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }
    SECTION("Random bytes have requested size and differ") {
        auto a = SodiumInterop::GetRandomBytes(32);
        auto b = SodiumInterop::GetRandomBytes(32);
        REQUIRE(a.size() == 32);
        REQUIRE(a != b);
    }
}
