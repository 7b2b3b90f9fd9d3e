#include "keyward/models/identity_key_pair.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <array>

namespace keyward::models {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

IdentityKeyPair::IdentityKeyPair(SecureMemoryHandle seed_handle, std::vector<uint8_t> public_key)
    : seed_handle_(std::move(seed_handle))
      , public_key_(std::move(public_key)) {
}

Result<IdentityKeyPair, KeywardFailure> IdentityKeyPair::FromSeed(const std::span<const uint8_t> seed) {
    if (seed.size() != Constants::IDENTITY_SEED_SIZE) {
        return Result<IdentityKeyPair, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Identity seed must be {} bytes, got {}", Constants::IDENTITY_SEED_SIZE, seed.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<IdentityKeyPair, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::vector<uint8_t> public_key(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::array<uint8_t, Constants::ED_25519_SECRET_KEY_SIZE> secret_key{};
    const int rc = crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data());
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    if (rc != 0) {
        return Result<IdentityKeyPair, KeywardFailure>::Err(
            KeywardFailure::KeyGeneration("Ed25519 keypair derivation from seed failed"));
    }

    auto handle = SecureMemoryHandle::FromBytes(seed);
    if (handle.IsErr()) {
        return Result<IdentityKeyPair, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<IdentityKeyPair, KeywardFailure>::Ok(
        IdentityKeyPair(std::move(handle).Unwrap(), std::move(public_key)));
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyPair::GetSeedCopy() const {
    auto read_result = seed_handle_.ReadBytes(Constants::IDENTITY_SEED_SIZE);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(read_result).Unwrap());
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyPair::Sign(const std::span<const uint8_t> message) const {
    auto signed_result = seed_handle_.WithReadAccess([&](const std::span<const uint8_t> seed) {
        std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE> pk{};
        std::array<uint8_t, Constants::ED_25519_SECRET_KEY_SIZE> sk{};
        std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
        bool ok = crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) == 0;
        ok = ok && crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(), sk.data()) == 0;
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(sk));
        if (!ok) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::Generic("Ed25519 signing failed"));
        }
        return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(signature));
    });
    if (signed_result.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(signed_result.UnwrapErr()));
    }
    return std::move(signed_result).Unwrap();
}

} // namespace keyward::models
