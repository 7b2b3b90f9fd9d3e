#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/configuration/client_config.hpp"
#include "keyward/identity/conversation_key_cache.hpp"
#include "keyward/models/identity_key_pair.hpp"
#include "keyward/models/stored_identity.hpp"
#include "keyward/storage/secure_key_store.hpp"
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity {

enum class IdentityState {
    Uninitialized,
    Initialized,
    Degraded
};

[[nodiscard]] constexpr std::string_view IdentityStateName(const IdentityState state) noexcept {
    switch (state) {
        case IdentityState::Uninitialized: return "Uninitialized";
        case IdentityState::Initialized: return "Initialized";
        case IdentityState::Degraded: return "Degraded";
    }
    return "Unknown";
}

/**
 * @brief Lifecycle of the device identity seed and everything derived from it
 *
 * One instance per installation, constructed once and shared by reference.
 * The store must outlive the manager.
 *
 * InitializeKeys() loads the seed from `device_identity_seed_hex` or creates
 * a fresh one when it is absent or malformed. Concurrent callers share a
 * single in-flight initialization, so a first run writes the seed once.
 * Operations that need keys initialize lazily; if that fails they return
 * KeysUnavailable.
 */
class IdentityKeyManager {
public:
    explicit IdentityKeyManager(
        storage::SecureKeyStore& store,
        configuration::ClientConfig config = configuration::ClientConfig::Default());

    IdentityKeyManager(const IdentityKeyManager&) = delete;
    IdentityKeyManager& operator=(const IdentityKeyManager&) = delete;

    [[nodiscard]] Result<Unit, KeywardFailure> InitializeKeys();

    [[nodiscard]] IdentityState State() const;

    /// True when the last initialization created a new seed.
    [[nodiscard]] bool KeysWereJustGenerated() const;

    /// True once the store has fallen back to memory; keys will not survive a restart.
    [[nodiscard]] bool IsEphemeral() const;

    /// Replaces the stored seed (32 bytes) and drops all cached conversation keys.
    [[nodiscard]] Result<Unit, KeywardFailure> ImportIdentitySeed(std::span<const uint8_t> seed);

    [[nodiscard]] static Result<std::string, KeywardFailure> MnemonicFromSeed(std::span<const uint8_t> seed);
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> SeedFromMnemonic(std::string_view phrase);

    [[nodiscard]] Result<std::string, KeywardFailure> ExportMnemonic();
    [[nodiscard]] Result<Unit, KeywardFailure> ImportMnemonic(std::string_view phrase);

    [[nodiscard]] Result<std::vector<std::string>, KeywardFailure> ExportQrFrames();
    [[nodiscard]] Result<Unit, KeywardFailure> ImportQrFrames(std::span<const std::string> frames);

    [[nodiscard]] Result<std::string, KeywardFailure> ExportSeedBackup(std::string_view passphrase);
    [[nodiscard]] Result<Unit, KeywardFailure> ImportSeedBackup(std::string_view backup_json, std::string_view passphrase);

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Sign(std::span<const uint8_t> data);

    [[nodiscard]] static Result<bool, KeywardFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> data,
        std::span<const uint8_t> signature);

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> GetPublicKey();
    [[nodiscard]] Result<std::string, KeywardFailure> GetPublicKeyBase64();

    /// Random 256-bit key, created once per conversation id.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> GetOrCreateConversationKey(std::string_view conversation_id);

    /// Key agreed with the peer's Ed25519 identity; cached per (conversation, peer).
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> DeriveConversationKey(
        std::string_view conversation_id,
        std::span<const uint8_t> remote_public_key);

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> DeriveSharedSecret(
        std::span<const uint8_t> remote_public_key);

    [[nodiscard]] Result<std::vector<models::StoredIdentity>, KeywardFailure> LoadStoredIdentities();
    [[nodiscard]] Result<models::StoredScheme, KeywardFailure> DetectStoredScheme();

    /// Ensures a seed identity exists, then deletes the legacy PEM entries.
    [[nodiscard]] Result<Unit, KeywardFailure> MigrateLegacyIdentity();

    [[nodiscard]] Result<models::LegacyRsaIdentity, KeywardFailure> GenerateLegacyIdentity();
    [[nodiscard]] Result<std::string, KeywardFailure> ExportLegacyIdentity();
    [[nodiscard]] Result<Unit, KeywardFailure> ImportLegacyIdentity(std::string_view export_json);

    /// Deletes the stored seed and returns to Uninitialized.
    [[nodiscard]] Result<Unit, KeywardFailure> ResetIdentity();

private:
    using InitResult = Result<Unit, KeywardFailure>;

    [[nodiscard]] InitResult RunInitialization();
    [[nodiscard]] Result<Unit, KeywardFailure> EnsureInitialized();
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, KeywardFailure> LoadStoredSeed();
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> CopySeed();
    [[nodiscard]] Result<std::optional<models::LegacyRsaIdentity>, KeywardFailure> LoadLegacyIdentity();
    void ClearConversationKeys();

    storage::SecureKeyStore& store_;
    configuration::ClientConfig config_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex state_mutex_;
    IdentityState state_ = IdentityState::Uninitialized;
    bool keys_just_generated_ = false;
    std::optional<models::IdentityKeyPair> keys_;
    std::optional<std::shared_future<InitResult>> pending_init_;

    ConversationKeyCache random_keys_;
    ConversationKeyCache agreed_keys_;
};

} // namespace keyward::identity
