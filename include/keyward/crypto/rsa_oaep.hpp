#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/models/rsa_key_material.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace keyward::crypto {

/**
 * @brief RSA key generation and RSA-OAEP (SHA-256, MGF1-SHA-256)
 *
 * Keys travel as component structs (models::RsaPublicKey / RsaPrivateKey)
 * and are turned into OpenSSL EVP_PKEY objects per operation.
 */
class RsaOaep {
public:
    static Result<models::RsaPrivateKey, KeywardFailure> GenerateKeyPair(int modulus_bits);

    /// Largest plaintext a key of `modulus_bits` can wrap.
    [[nodiscard]] static size_t MaxPlaintextSize(int modulus_bits) noexcept;

    static Result<std::vector<uint8_t>, KeywardFailure> Encrypt(
        const models::RsaPublicKey& key,
        std::span<const uint8_t> plaintext);

    static Result<std::vector<uint8_t>, KeywardFailure> Decrypt(
        const models::RsaPrivateKey& key,
        std::span<const uint8_t> ciphertext);

private:
    RsaOaep() = delete;
};

} // namespace keyward::crypto
