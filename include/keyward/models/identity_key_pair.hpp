#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace keyward::models {

/// Ed25519 identity derived from the 32-byte seed. The seed stays in sodium
/// secure memory; the 64-byte signing key is re-expanded per use.
class IdentityKeyPair {
public:
    [[nodiscard]] static Result<IdentityKeyPair, KeywardFailure> FromSeed(std::span<const uint8_t> seed);

    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSeedHandle() const noexcept {
        return seed_handle_;
    }
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> GetSeedCopy() const;

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Sign(std::span<const uint8_t> message) const;

private:
    IdentityKeyPair(crypto::SecureMemoryHandle seed_handle, std::vector<uint8_t> public_key);

    crypto::SecureMemoryHandle seed_handle_;
    std::vector<uint8_t> public_key_;
};

} // namespace keyward::models
