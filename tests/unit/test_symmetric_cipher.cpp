#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/symmetric_cipher.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/models/encrypted_envelope.hpp"
#include "keyward/core/constants.hpp"
#include <string>
using namespace keyward;
using namespace keyward::crypto;
using keyward::models::EncryptedEnvelope;
TEST_CASE("SymmetricCipher - Text round trip", "[crypto][symmetric]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SymmetricCipher::GenerateKey();
    REQUIRE(key.size() == Constants::AES_KEY_SIZE);
    SECTION("ASCII and multi-byte UTF-8 survive") {
        const std::string message = "hello \xC3\xA9t\xC3\xA9 \xF0\x9F\x94\x91";
        auto sealed = SymmetricCipher::EncryptText(message, key);
        REQUIRE(sealed.IsOk());
        REQUIRE_FALSE(sealed.Unwrap().HasEncryptedKey());
        auto opened = SymmetricCipher::DecryptText(sealed.Unwrap(), key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == message);
    }
    SECTION("Empty text") {
        auto sealed = SymmetricCipher::EncryptText("", key);
        REQUIRE(sealed.IsOk());
        auto opened = SymmetricCipher::DecryptText(sealed.Unwrap(), key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
    SECTION("Invalid UTF-8 is a decode failure after authentication") {
        const std::vector<uint8_t> bytes = {'o', 'k', 0xC3};
        auto sealed = SymmetricCipher::Encrypt(bytes, key);
        REQUIRE(sealed.IsOk());
        REQUIRE(SymmetricCipher::Decrypt(sealed.Unwrap(), key).IsOk());
        auto opened = SymmetricCipher::DecryptText(sealed.Unwrap(), key);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == FailureType::Decode);
    }
    SECTION("Surrogate code points are rejected") {
        const std::vector<uint8_t> bytes = {0xED, 0xA0, 0x80};
        auto sealed = SymmetricCipher::Encrypt(bytes, key);
        REQUIRE(sealed.IsOk());
        REQUIRE(SymmetricCipher::DecryptText(sealed.Unwrap(), key).IsErr());
    }
    SECTION("Same plaintext encrypts differently each time") {
        auto a = SymmetricCipher::EncryptText("repeat", key).Unwrap();
        auto b = SymmetricCipher::EncryptText("repeat", key).Unwrap();
        REQUIRE(a.nonce != b.nonce);
        REQUIRE(a.ciphertext != b.ciphertext);
    }
}
TEST_CASE("SymmetricCipher - Key validation", "[crypto][symmetric]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> short_key(16, 0x01);
    auto sealed = SymmetricCipher::EncryptText("x", short_key);
    REQUIRE(sealed.IsErr());
    REQUIRE(sealed.UnwrapErr().type == FailureType::InvalidInput);
}
TEST_CASE("SymmetricCipher - Malformed envelope fields", "[crypto][symmetric]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SymmetricCipher::GenerateKey();
    const EncryptedEnvelope envelope = SymmetricCipher::EncryptText("meet at noon", key).Unwrap();
    SECTION("Truncated tag fails authentication") {
        EncryptedEnvelope tampered = envelope;
        tampered.tag.resize(8);
        auto opened = SymmetricCipher::DecryptText(tampered, key);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == FailureType::AuthenticationFailed);
    }
    SECTION("Truncated nonce fails authentication") {
        EncryptedEnvelope tampered = envelope;
        tampered.nonce.pop_back();
        auto opened = SymmetricCipher::Decrypt(tampered, key);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == FailureType::AuthenticationFailed);
    }
    SECTION("Extended nonce fails authentication") {
        EncryptedEnvelope tampered = envelope;
        tampered.nonce.push_back(0x00);
        REQUIRE(SymmetricCipher::Decrypt(tampered, key).UnwrapErr().type == FailureType::AuthenticationFailed);
    }
    SECTION("Short tag from the wire fails authentication") {
        auto json = envelope.ToJson();
        auto parsed = EncryptedEnvelope::FromJson(json);
        REQUIRE(parsed.IsOk());
        EncryptedEnvelope wire = parsed.Unwrap();
        wire.tag.resize(12);
        auto reparsed = EncryptedEnvelope::FromJson(wire.ToJson());
        REQUIRE(reparsed.IsOk());
        REQUIRE(SymmetricCipher::Decrypt(reparsed.Unwrap(), key).UnwrapErr().type
            == FailureType::AuthenticationFailed);
    }
}
TEST_CASE("EncryptedEnvelope - JSON form", "[models][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SymmetricCipher::GenerateKey();
    auto envelope = SymmetricCipher::EncryptText("wire format", key).Unwrap();
    SECTION("Symmetric envelope omits encrypted_key") {
        const std::string json = envelope.ToJson();
        REQUIRE(json.find("\"encrypted_content\"") != std::string::npos);
        REQUIRE(json.find("\"iv\"") != std::string::npos);
        REQUIRE(json.find("\"tag\"") != std::string::npos);
        REQUIRE(json.find("encrypted_key") == std::string::npos);
        auto parsed = EncryptedEnvelope::FromJson(json);
        REQUIRE(parsed.IsOk());
        REQUIRE_FALSE(parsed.Unwrap().HasEncryptedKey());
        auto opened = SymmetricCipher::DecryptText(parsed.Unwrap(), key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == "wire format");
    }
    SECTION("Wrapped key survives serialization") {
        envelope.encrypted_key = std::vector<uint8_t>{1, 2, 3, 4};
        auto parsed = EncryptedEnvelope::FromJson(envelope.ToJson());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().HasEncryptedKey());
        REQUIRE(*parsed.Unwrap().encrypted_key == std::vector<uint8_t>{1, 2, 3, 4});
    }
    SECTION("Explicit null encrypted_key is treated as absent") {
        auto parsed = EncryptedEnvelope::FromJson(
            R"({"encrypted_content":"AAE=","iv":"AAAAAAAAAAAAAAAA","tag":"AAAAAAAAAAAAAAAAAAAAAA==","encrypted_key":null})");
        REQUIRE(parsed.IsOk());
        REQUIRE_FALSE(parsed.Unwrap().HasEncryptedKey());
        REQUIRE(parsed.Unwrap().ciphertext == std::vector<uint8_t>{0x00, 0x01});
    }
    SECTION("Malformed documents are decode failures") {
        REQUIRE(EncryptedEnvelope::FromJson("not json").UnwrapErr().type == FailureType::Decode);
        REQUIRE(EncryptedEnvelope::FromJson("[1,2]").UnwrapErr().type == FailureType::Decode);
        REQUIRE(EncryptedEnvelope::FromJson(R"({"iv":"AA==","tag":"AA=="})").UnwrapErr().type == FailureType::Decode);
        REQUIRE(EncryptedEnvelope::FromJson(
            R"({"encrypted_content":"***","iv":"AA==","tag":"AA=="})").UnwrapErr().type == FailureType::Decode);
        REQUIRE(EncryptedEnvelope::FromJson(
            R"({"encrypted_content":1,"iv":"AA==","tag":"AA=="})").IsErr());
    }
}
