#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/models/encrypted_envelope.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::crypto {

/**
 * @brief Message-level AES-256-GCM
 *
 * Every Encrypt call draws a fresh random 96-bit nonce, so callers never
 * manage nonces. The returned envelope has no encrypted_key.
 */
class SymmetricCipher {
public:
    static Result<models::EncryptedEnvelope, KeywardFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> associated_data = {});

    static Result<std::vector<uint8_t>, KeywardFailure> Decrypt(
        const models::EncryptedEnvelope& envelope,
        std::span<const uint8_t> key,
        std::span<const uint8_t> associated_data = {});

    static Result<models::EncryptedEnvelope, KeywardFailure> EncryptText(
        std::string_view plaintext,
        std::span<const uint8_t> key);

    /// Fails with Decode when the authenticated plaintext is not valid UTF-8.
    static Result<std::string, KeywardFailure> DecryptText(
        const models::EncryptedEnvelope& envelope,
        std::span<const uint8_t> key,
        std::span<const uint8_t> associated_data = {});

    /// Fresh random 256-bit key.
    [[nodiscard]] static std::vector<uint8_t> GenerateKey();

private:
    SymmetricCipher() = delete;
};

} // namespace keyward::crypto
