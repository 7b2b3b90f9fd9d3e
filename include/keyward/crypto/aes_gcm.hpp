#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace keyward::crypto {

struct AesGcmSealed {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
};

/**
 * AES-256-GCM with a detached 128-bit tag.
 *
 * Stateless primitive: the caller supplies a 96-bit nonce that must never
 * repeat under the same key. SymmetricCipher draws a fresh random nonce per
 * call; use it unless the nonce is managed elsewhere.
 *
 * Decrypt never returns partial plaintext. A tag mismatch for any reason
 * (wrong key, nonce, associated data, tampered ciphertext or tag) yields
 * AuthenticationFailed, as does a nonce or tag of the wrong length. Only a
 * malformed key, or a malformed nonce passed to Encrypt, is InvalidInput.
 */
class AesGcm {
public:
    static Result<AesGcmSealed, KeywardFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    static Result<std::vector<uint8_t>, KeywardFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data = {});

private:
    AesGcm() = delete;
};

} // namespace keyward::crypto
