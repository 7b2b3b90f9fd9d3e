#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keyward::identity {

/**
 * @brief X25519 agreement between Ed25519 identities
 *
 * Both sides map their Ed25519 keys onto Curve25519 (the birational map of
 * RFC 7748 section 4.1, as implemented by libsodium's
 * crypto_sign_ed25519_{sk,pk}_to_curve25519) and run X25519. The result is
 * the same for (A seed, B public) and (B seed, A public).
 *
 * The raw shared secret is never used as a key directly; DeriveConversationKey
 * runs HKDF-SHA256 over it with the conversation id as salt.
 */
class KeyAgreement {
public:
    /// DeriveKey failure when the remote key is not a valid point or the
    /// agreement output is all zeros.
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> DeriveSharedSecret(
        std::span<const uint8_t> local_seed,
        std::span<const uint8_t> remote_ed25519_public);

    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> DeriveConversationKey(
        std::span<const uint8_t> shared_secret,
        std::string_view conversation_id);

private:
    KeyAgreement() = delete;
};

} // namespace keyward::identity
