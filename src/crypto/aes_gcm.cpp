#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "openssl_support.hpp"

namespace keyward::crypto {

using OpenSSL = OpenSSLConstants;
using detail::EvpCipherCtxPtr;
using detail::GetOpenSSLError;

namespace {
    Result<Unit, KeywardFailure> ValidateKey(std::span<const uint8_t> key) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    void WipeQuietly(std::vector<uint8_t>& buffer) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

Result<AesGcmSealed, KeywardFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKey(key); check.IsErr()) {
        return std::move(check).PropagateErr<AesGcmSealed>();
    }
    if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("AES-GCM nonce must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size())));
    }
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<AesGcmSealed, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    AesGcmSealed sealed;
    sealed.ciphertext.resize(plaintext.size());
    int ciphertext_len = 0;
    if (!plaintext.empty()
        && EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &ciphertext_len,
                             plaintext.data(),
                             static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(sealed.ciphertext);
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(sealed.ciphertext);
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    sealed.ciphertext.resize(static_cast<size_t>(ciphertext_len + final_len));
    sealed.tag.resize(Constants::AES_GCM_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            sealed.tag.data()) != OpenSSL::SUCCESS) {
        WipeQuietly(sealed.ciphertext);
        return Result<AesGcmSealed, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    return Result<AesGcmSealed, KeywardFailure>::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, KeywardFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKey(key); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    // Nonce and tag arrive from the wire; a bad size fails authentication.
    if (nonce.size() != Constants::AES_GCM_NONCE_SIZE || tag.size() != Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::AuthenticationFailed(
                std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext.size());
    int plaintext_len = 0;
    if (!ciphertext.empty()
        && EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                             ciphertext.data(),
                             static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag_copy.size()),
                            tag_copy.data()) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::AuthenticationFailed(
                std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(output));
}

} // namespace keyward::crypto
