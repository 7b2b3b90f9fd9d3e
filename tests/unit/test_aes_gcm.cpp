#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
using namespace keyward;
using namespace keyward::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0xAA);
        std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0xBB);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        std::vector<uint8_t> ad = {'a', 'd'};
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext, ad);
        REQUIRE(encrypt_result.IsOk());
        const auto& sealed = encrypt_result.Unwrap();
        REQUIRE(sealed.ciphertext.size() == plaintext.size());
        REQUIRE(sealed.tag.size() == Constants::AES_GCM_TAG_SIZE);
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag, ad);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext") {
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x11);
        std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x22);
        std::vector<uint8_t> plaintext = {};
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        const auto& sealed = encrypt_result.Unwrap();
        REQUIRE(sealed.ciphertext.empty());
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap().empty());
    }
    SECTION("Large plaintext") {
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x33);
        std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x44);
        std::vector<uint8_t> plaintext(10000, 0x55);
        auto encrypt_result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        const auto& sealed = encrypt_result.Unwrap();
        auto decrypt_result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("NIST test case 13 (zero key, zero nonce, empty input)") {
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x00);
        std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x00);
        auto encrypt_result = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(encrypt_result.IsOk());
        REQUIRE(SodiumInterop::ToHex(encrypt_result.Unwrap().tag) == "530f8afbc74536b9a963b4f1c4cb738b");
    }
}
TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x01);
    std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x02);
    std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Short key") {
        std::vector<uint8_t> short_key(16, 0x01);
        auto result = AesGcm::Encrypt(short_key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }
    SECTION("Wrong nonce size") {
        std::vector<uint8_t> long_nonce(16, 0x02);
        auto result = AesGcm::Encrypt(key, long_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }
    SECTION("Wrong tag size fails authentication") {
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();
        std::vector<uint8_t> short_tag(sealed.tag.begin(), sealed.tag.begin() + 8);
        auto result = AesGcm::Decrypt(key, nonce, sealed.ciphertext, short_tag);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::AuthenticationFailed);
        std::vector<uint8_t> long_tag = sealed.tag;
        long_tag.push_back(0x00);
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed.ciphertext, long_tag).UnwrapErr().type
            == FailureType::AuthenticationFailed);
    }
    SECTION("Wrong nonce size on decrypt fails authentication") {
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();
        std::vector<uint8_t> short_nonce(nonce.begin(), nonce.begin() + 8);
        auto result = AesGcm::Decrypt(key, short_nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::AuthenticationFailed);
    }
    SECTION("Short key on decrypt is still invalid input") {
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();
        std::vector<uint8_t> short_key(16, 0x01);
        auto result = AesGcm::Decrypt(short_key, nonce, sealed.ciphertext, sealed.tag);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }
}
