#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/channel/hybrid_server_channel.hpp"
#include "keyward/identity/identity_key_manager.hpp"
#include "keyward/models/encrypted_envelope.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::utilities {

/**
 * @brief Message payload sealing on top of the identity and server channel
 *
 * Server path: a fresh AES-256 key seals the payload and is wrapped with
 * RSA-OAEP under the server key (encrypted_key present).
 * Conversation path: the cached per-conversation key is used directly
 * (encrypted_key absent).
 *
 * Both paths require an initialized identity and refuse with
 * KeysUnavailable otherwise.
 */
class MessageEncryptor {
public:
    MessageEncryptor(identity::IdentityKeyManager& identity, channel::HybridServerChannel& server_channel);

    [[nodiscard]] Result<models::EncryptedEnvelope, KeywardFailure> EncryptForServer(std::span<const uint8_t> plaintext);
    [[nodiscard]] Result<models::EncryptedEnvelope, KeywardFailure> EncryptTextForServer(std::string_view plaintext);

    [[nodiscard]] Result<models::EncryptedEnvelope, KeywardFailure> EncryptForConversation(
        std::string_view conversation_id,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> DecryptForConversation(
        std::string_view conversation_id,
        const models::EncryptedEnvelope& envelope);

    /// Fails with Decode when the plaintext is not valid UTF-8.
    [[nodiscard]] Result<std::string, KeywardFailure> DecryptTextForConversation(
        std::string_view conversation_id,
        const models::EncryptedEnvelope& envelope);

private:
    [[nodiscard]] Result<Unit, KeywardFailure> RequireIdentity();
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> ConversationKeyFor(
        std::string_view conversation_id,
        const models::EncryptedEnvelope& envelope);

    identity::IdentityKeyManager& identity_;
    channel::HybridServerChannel& server_channel_;
};

} // namespace keyward::utilities
