#include "keyward/identity/key_agreement.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/hkdf.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/debug/logger.hpp"
#include <sodium.h>
#include <array>

namespace keyward::identity {

using crypto::Hkdf;
using crypto::SodiumInterop;

namespace {
    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<std::vector<uint8_t>, KeywardFailure> KeyAgreement::DeriveSharedSecret(
    const std::span<const uint8_t> local_seed,
    const std::span<const uint8_t> remote_ed25519_public) {
    if (local_seed.size() != Constants::IDENTITY_SEED_SIZE) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Local seed must be {} bytes", Constants::IDENTITY_SEED_SIZE)));
    }
    if (remote_ed25519_public.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Remote Ed25519 public key must be {} bytes, got {}",
                           Constants::ED_25519_PUBLIC_KEY_SIZE, remote_ed25519_public.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE> local_ed_pk{};
    std::array<uint8_t, Constants::ED_25519_SECRET_KEY_SIZE> local_ed_sk{};
    std::array<uint8_t, Constants::X_25519_PRIVATE_KEY_SIZE> local_x_sk{};
    std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE> remote_x_pk{};
    std::vector<uint8_t> shared(Constants::SHARED_SECRET_SIZE);

    auto wipe_locals = [&] {
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(local_ed_sk));
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(local_x_sk));
    };

    if (crypto_sign_seed_keypair(local_ed_pk.data(), local_ed_sk.data(), local_seed.data()) != 0
        || crypto_sign_ed25519_sk_to_curve25519(local_x_sk.data(), local_ed_sk.data()) != 0) {
        wipe_locals();
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("Failed to convert local identity to X25519"));
    }
    if (crypto_sign_ed25519_pk_to_curve25519(remote_x_pk.data(), remote_ed25519_public.data()) != 0) {
        wipe_locals();
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("Remote Ed25519 public key is not a valid curve point"));
    }
    const int rc = crypto_scalarmult(shared.data(), local_x_sk.data(), remote_x_pk.data());
    wipe_locals();
    if (rc != 0 || sodium_is_zero(shared.data(), shared.size())) {
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("X25519 agreement produced a low-order result"));
    }
    KEYWARD_LOG_KEY("agreement", "shared secret", shared);
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, KeywardFailure> KeyAgreement::DeriveConversationKey(
    const std::span<const uint8_t> shared_secret,
    const std::string_view conversation_id) {
    if (shared_secret.size() != Constants::SHARED_SECRET_SIZE) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Shared secret must be {} bytes", Constants::SHARED_SECRET_SIZE)));
    }
    if (conversation_id.empty()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Conversation id must not be empty"));
    }
    return Hkdf::DeriveKeyBytes(
        shared_secret,
        Constants::AES_KEY_SIZE,
        AsBytes(conversation_id),
        AsBytes(Constants::CONVERSATION_KEY_INFO));
}

} // namespace keyward::identity
