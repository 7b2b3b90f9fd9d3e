#include "keyward/utilities/message_encryptor.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/symmetric_cipher.hpp"
#include "keyward/debug/logger.hpp"

namespace keyward::utilities {

using crypto::SodiumInterop;
using crypto::SymmetricCipher;
using models::EncryptedEnvelope;

namespace {
    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    // Conversation id is authenticated as associated data.
    std::span<const uint8_t> ConversationAd(const std::string_view conversation_id) {
        return AsBytes(conversation_id);
    }
}

MessageEncryptor::MessageEncryptor(
    identity::IdentityKeyManager& identity,
    channel::HybridServerChannel& server_channel)
    : identity_(identity)
      , server_channel_(server_channel) {
}

Result<Unit, KeywardFailure> MessageEncryptor::RequireIdentity() {
    if (identity_.State() == identity::IdentityState::Initialized) {
        return Result<Unit, KeywardFailure>::Ok(unit);
    }
    auto init = identity_.InitializeKeys();
    if (init.IsErr()) {
        KEYWARD_LOG_ERROR("encryptor", "refusing to encrypt: {}", init.UnwrapErr().ToString());
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::KeysUnavailable(
            compat::format("{}: {}", ErrorMessages::IDENTITY_NOT_INITIALIZED, init.UnwrapErr().message)));
    }
    return init;
}

Result<EncryptedEnvelope, KeywardFailure> MessageEncryptor::EncryptForServer(const std::span<const uint8_t> plaintext) {
    if (auto ready = RequireIdentity(); ready.IsErr()) {
        return std::move(ready).PropagateErr<EncryptedEnvelope>();
    }
    std::vector<uint8_t> key = SymmetricCipher::GenerateKey();
    auto sealed = SymmetricCipher::Encrypt(plaintext, key);
    if (sealed.IsErr()) {
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return sealed;
    }
    auto wrapped = server_channel_.EncryptForServer(key);
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (wrapped.IsErr()) {
        return std::move(wrapped).PropagateErr<EncryptedEnvelope>();
    }
    EncryptedEnvelope envelope = std::move(sealed).Unwrap();
    envelope.encrypted_key = std::move(wrapped).Unwrap();
    return Result<EncryptedEnvelope, KeywardFailure>::Ok(std::move(envelope));
}

Result<EncryptedEnvelope, KeywardFailure> MessageEncryptor::EncryptTextForServer(const std::string_view plaintext) {
    return EncryptForServer(AsBytes(plaintext));
}

Result<EncryptedEnvelope, KeywardFailure> MessageEncryptor::EncryptForConversation(
    const std::string_view conversation_id,
    const std::span<const uint8_t> plaintext) {
    if (auto ready = RequireIdentity(); ready.IsErr()) {
        return std::move(ready).PropagateErr<EncryptedEnvelope>();
    }
    auto key = identity_.GetOrCreateConversationKey(conversation_id);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<EncryptedEnvelope>();
    }
    return SymmetricCipher::Encrypt(plaintext, key.Unwrap(), ConversationAd(conversation_id));
}

Result<std::vector<uint8_t>, KeywardFailure> MessageEncryptor::ConversationKeyFor(
    const std::string_view conversation_id,
    const EncryptedEnvelope& envelope) {
    if (envelope.HasEncryptedKey()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Envelope carries a wrapped key; it is not a conversation envelope"));
    }
    if (auto ready = RequireIdentity(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    return identity_.GetOrCreateConversationKey(conversation_id);
}

Result<std::vector<uint8_t>, KeywardFailure> MessageEncryptor::DecryptForConversation(
    const std::string_view conversation_id,
    const EncryptedEnvelope& envelope) {
    auto key = ConversationKeyFor(conversation_id, envelope);
    if (key.IsErr()) {
        return key;
    }
    return SymmetricCipher::Decrypt(envelope, key.Unwrap(), ConversationAd(conversation_id));
}

Result<std::string, KeywardFailure> MessageEncryptor::DecryptTextForConversation(
    const std::string_view conversation_id,
    const EncryptedEnvelope& envelope) {
    auto key = ConversationKeyFor(conversation_id, envelope);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<std::string>();
    }
    return SymmetricCipher::DecryptText(envelope, key.Unwrap(), ConversationAd(conversation_id));
}

} // namespace keyward::utilities
