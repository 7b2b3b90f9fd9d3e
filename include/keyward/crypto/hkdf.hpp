#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace keyward::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL EVP_KDF
 *
 * Used to turn X25519 shared secrets into per-conversation AES keys.
 */
class Hkdf {
public:
    /**
     * @param ikm Input key material (must not be empty)
     * @param output Buffer filled with the derived key
     * @param salt Optional salt
     * @param info Optional context info
     */
    static Result<Unit, KeywardFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, KeywardFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace keyward::crypto
