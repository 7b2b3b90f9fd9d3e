#include "keyward/identity/identity_key_manager.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/mnemonic.hpp"
#include "keyward/crypto/passphrase_backup.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/symmetric_cipher.hpp"
#include "keyward/debug/logger.hpp"
#include "keyward/identity/key_agreement.hpp"
#include "keyward/identity/legacy_identity.hpp"
#include "keyward/identity/seed_export.hpp"
#include <sodium.h>
#include <exception>

namespace keyward::identity {

using crypto::Mnemonic;
using crypto::PassphraseBackup;
using crypto::SodiumInterop;
using crypto::SymmetricCipher;
using models::IdentityKeyPair;
using models::LegacyRsaIdentity;
using models::SeedIdentity;
using models::StoredIdentity;
using models::StoredScheme;

namespace {
    constexpr std::string_view kComponent = "identity";

    void Wipe(std::vector<uint8_t>& bytes) {
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
    }

    Result<std::optional<std::vector<uint8_t>>, KeywardFailure> ParseSeedHex(const std::string& hex) {
        if (hex.size() != Constants::IDENTITY_SEED_HEX_LENGTH) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::nullopt);
        }
        auto decoded = SodiumInterop::FromHex(hex);
        if (decoded.IsErr() || decoded.Unwrap().size() != Constants::IDENTITY_SEED_SIZE) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::move(decoded).Unwrap());
    }
}

IdentityKeyManager::IdentityKeyManager(storage::SecureKeyStore& store, configuration::ClientConfig config)
    : store_(store)
      , config_(std::move(config)) {
}

Result<Unit, KeywardFailure> IdentityKeyManager::InitializeKeys() {
    std::promise<InitResult> promise;
    std::shared_future<InitResult> shared;
    bool owner = false;
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == IdentityState::Initialized) {
            return InitResult::Ok(unit);
        }
        if (pending_init_.has_value()) {
            shared = *pending_init_;
        } else {
            shared = promise.get_future().share();
            pending_init_ = shared;
            owner = true;
        }
    }
    if (!owner) {
        return shared.get();
    }

    std::optional<InitResult> result;
    try {
        result.emplace(RunInitialization());
    } catch (...) {
        {
            std::lock_guard lock(state_mutex_);
            pending_init_.reset();
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    {
        std::lock_guard lock(state_mutex_);
        pending_init_.reset();
    }
    promise.set_value(*result);
    return std::move(*result);
}

IdentityKeyManager::InitResult IdentityKeyManager::RunInitialization() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == IdentityState::Initialized) {
            return InitResult::Ok(unit);
        }
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        std::lock_guard lock(state_mutex_);
        state_ = IdentityState::Degraded;
        return InitResult::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto stored = LoadStoredSeed();
    if (stored.IsErr()) {
        std::lock_guard lock(state_mutex_);
        state_ = IdentityState::Degraded;
        return std::move(stored).PropagateErr<Unit>();
    }
    std::optional<std::vector<uint8_t>> seed = std::move(stored).Unwrap();
    const bool generated = !seed.has_value();
    if (generated) {
        seed = SodiumInterop::GetRandomBytes(Constants::IDENTITY_SEED_SIZE);
    }

    auto pair = IdentityKeyPair::FromSeed(*seed);
    if (pair.IsErr()) {
        Wipe(*seed);
        KEYWARD_LOG_ERROR(kComponent, "identity derivation failed: {}", pair.UnwrapErr().ToString());
        std::lock_guard lock(state_mutex_);
        state_ = IdentityState::Degraded;
        return std::move(pair).PropagateErr<Unit>();
    }
    if (generated) {
        std::string hex = SodiumInterop::ToHex(*seed);
        auto written = store_.WriteString(StorageKeys::IDENTITY_SEED_HEX, hex);
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(hex.data()), hex.size()));
        if (written.IsErr()) {
            Wipe(*seed);
            std::lock_guard lock(state_mutex_);
            state_ = IdentityState::Degraded;
            return written;
        }
        KEYWARD_LOG_INFO(kComponent, "generated new identity seed");
    }
    Wipe(*seed);

    std::lock_guard lock(state_mutex_);
    keys_.emplace(std::move(pair).Unwrap());
    keys_just_generated_ = generated;
    state_ = IdentityState::Initialized;
    KEYWARD_LOG_DEBUG(kComponent, "identity initialized (generated: {}, ephemeral: {})", generated, store_.IsEphemeral());
    return InitResult::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, KeywardFailure> IdentityKeyManager::LoadStoredSeed() {
    auto stored = store_.ReadString(StorageKeys::IDENTITY_SEED_HEX);
    if (stored.IsErr()) {
        return std::move(stored).PropagateErr<std::optional<std::vector<uint8_t>>>();
    }
    auto& hex = stored.Unwrap();
    if (!hex.has_value()) {
        return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::nullopt);
    }
    auto parsed = ParseSeedHex(*hex);
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(hex->data()), hex->size()));
    if (parsed.IsOk() && !parsed.Unwrap().has_value()) {
        KEYWARD_LOG_WARN(kComponent, "stored identity seed is malformed, discarding it");
        if (auto deleted = store_.Delete(StorageKeys::IDENTITY_SEED_HEX); deleted.IsErr()) {
            return std::move(deleted).PropagateErr<std::optional<std::vector<uint8_t>>>();
        }
    }
    return parsed;
}

Result<Unit, KeywardFailure> IdentityKeyManager::EnsureInitialized() {
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == IdentityState::Initialized) {
            return Result<Unit, KeywardFailure>::Ok(unit);
        }
    }
    auto init = InitializeKeys();
    if (init.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::KeysUnavailable(
            compat::format("{}: {}", ErrorMessages::IDENTITY_NOT_INITIALIZED, init.UnwrapErr().ToString())));
    }
    return init;
}

IdentityState IdentityKeyManager::State() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

bool IdentityKeyManager::KeysWereJustGenerated() const {
    std::lock_guard lock(state_mutex_);
    return keys_just_generated_;
}

bool IdentityKeyManager::IsEphemeral() const {
    return store_.IsEphemeral();
}

void IdentityKeyManager::ClearConversationKeys() {
    random_keys_.Clear();
    agreed_keys_.Clear();
}

Result<Unit, KeywardFailure> IdentityKeyManager::ImportIdentitySeed(const std::span<const uint8_t> seed) {
    if (seed.size() != Constants::IDENTITY_SEED_SIZE) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Identity seed must be {} bytes, got {}", Constants::IDENTITY_SEED_SIZE, seed.size())));
    }
    std::lock_guard lifecycle(lifecycle_mutex_);
    auto pair = IdentityKeyPair::FromSeed(seed);
    if (pair.IsErr()) {
        return std::move(pair).PropagateErr<Unit>();
    }
    std::string hex = SodiumInterop::ToHex(seed);
    auto written = store_.WriteString(StorageKeys::IDENTITY_SEED_HEX, hex);
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(hex.data()), hex.size()));
    if (written.IsErr()) {
        return written;
    }
    {
        std::lock_guard lock(state_mutex_);
        keys_.emplace(std::move(pair).Unwrap());
        keys_just_generated_ = false;
        state_ = IdentityState::Initialized;
    }
    ClearConversationKeys();
    KEYWARD_LOG_INFO(kComponent, "identity seed imported, conversation keys cleared");
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::string, KeywardFailure> IdentityKeyManager::MnemonicFromSeed(const std::span<const uint8_t> seed) {
    if (seed.size() != Constants::IDENTITY_SEED_SIZE) {
        return Result<std::string, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Identity seed must be {} bytes, got {}", Constants::IDENTITY_SEED_SIZE, seed.size())));
    }
    return Mnemonic::FromEntropy(seed);
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::SeedFromMnemonic(const std::string_view phrase) {
    const auto words = Mnemonic::SplitWords(phrase);
    if (words.size() != MnemonicConstants::SEED_WORD_COUNT) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidMnemonic(
            compat::format("Identity mnemonic must have {} words, got {}", MnemonicConstants::SEED_WORD_COUNT, words.size())));
    }
    return Mnemonic::ToEntropy(phrase);
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::CopySeed() {
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    std::lock_guard lock(state_mutex_);
    if (!keys_.has_value()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::KeysUnavailable(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    return keys_->GetSeedCopy();
}

Result<std::string, KeywardFailure> IdentityKeyManager::ExportMnemonic() {
    auto seed = CopySeed();
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<std::string>();
    }
    auto phrase = MnemonicFromSeed(seed.Unwrap());
    Wipe(seed.Unwrap());
    return phrase;
}

Result<Unit, KeywardFailure> IdentityKeyManager::ImportMnemonic(const std::string_view phrase) {
    auto seed = SeedFromMnemonic(phrase);
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<Unit>();
    }
    auto imported = ImportIdentitySeed(seed.Unwrap());
    Wipe(seed.Unwrap());
    return imported;
}

Result<std::vector<std::string>, KeywardFailure> IdentityKeyManager::ExportQrFrames() {
    auto seed = CopySeed();
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<std::vector<std::string>>();
    }
    auto frames = SeedExport::ToQrFrames(seed.Unwrap());
    Wipe(seed.Unwrap());
    return frames;
}

Result<Unit, KeywardFailure> IdentityKeyManager::ImportQrFrames(const std::span<const std::string> frames) {
    auto seed = SeedExport::FromQrFrames(frames);
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<Unit>();
    }
    auto imported = ImportIdentitySeed(seed.Unwrap());
    Wipe(seed.Unwrap());
    return imported;
}

Result<std::string, KeywardFailure> IdentityKeyManager::ExportSeedBackup(const std::string_view passphrase) {
    auto seed = CopySeed();
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<std::string>();
    }
    auto backup = PassphraseBackup::Seal(seed.Unwrap(), passphrase, config_.backup_kdf);
    Wipe(seed.Unwrap());
    return backup;
}

Result<Unit, KeywardFailure> IdentityKeyManager::ImportSeedBackup(
    const std::string_view backup_json,
    const std::string_view passphrase) {
    auto seed = PassphraseBackup::Open(backup_json, passphrase);
    if (seed.IsErr()) {
        return std::move(seed).PropagateErr<Unit>();
    }
    auto imported = ImportIdentitySeed(seed.Unwrap());
    Wipe(seed.Unwrap());
    return imported;
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::Sign(const std::span<const uint8_t> data) {
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    std::lock_guard lock(state_mutex_);
    if (!keys_.has_value()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::KeysUnavailable(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    return keys_->Sign(data);
}

Result<bool, KeywardFailure> IdentityKeyManager::Verify(
    const std::span<const uint8_t> public_key,
    const std::span<const uint8_t> data,
    const std::span<const uint8_t> signature) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<bool, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Ed25519 public key must be {} bytes", Constants::ED_25519_PUBLIC_KEY_SIZE)));
    }
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<bool, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Ed25519 signature must be {} bytes", Constants::ED_25519_SIGNATURE_SIZE)));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<bool, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    const bool valid = crypto_sign_verify_detached(
        signature.data(), data.data(), data.size(), public_key.data()) == 0;
    return Result<bool, KeywardFailure>::Ok(valid);
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::GetPublicKey() {
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    std::lock_guard lock(state_mutex_);
    if (!keys_.has_value()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::KeysUnavailable(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(keys_->GetPublicKey());
}

Result<std::string, KeywardFailure> IdentityKeyManager::GetPublicKeyBase64() {
    return GetPublicKey().Map([](std::vector<uint8_t> key) {
        return SodiumInterop::ToBase64(key);
    });
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::GetOrCreateConversationKey(
    const std::string_view conversation_id) {
    if (conversation_id.empty()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Conversation id must not be empty"));
    }
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    return random_keys_.GetOrCreate(conversation_id, [conversation_id] {
        KEYWARD_LOG_DEBUG(kComponent, "created conversation key for {}", conversation_id);
        return ConversationKeyCache::KeyResult::Ok(SymmetricCipher::GenerateKey());
    });
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::DeriveSharedSecret(
    const std::span<const uint8_t> remote_public_key) {
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    std::lock_guard lock(state_mutex_);
    if (!keys_.has_value()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::KeysUnavailable(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    auto agreed = keys_->GetSeedHandle().WithReadAccess([&](const std::span<const uint8_t> seed) {
        return KeyAgreement::DeriveSharedSecret(seed, remote_public_key);
    });
    if (agreed.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(agreed.UnwrapErr()));
    }
    return std::move(agreed).Unwrap();
}

Result<std::vector<uint8_t>, KeywardFailure> IdentityKeyManager::DeriveConversationKey(
    const std::string_view conversation_id,
    const std::span<const uint8_t> remote_public_key) {
    if (conversation_id.empty()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Conversation id must not be empty"));
    }
    const std::string cache_key = compat::format("{}|{}", conversation_id, SodiumInterop::ToHex(remote_public_key));
    return agreed_keys_.GetOrCreate(cache_key, [this, conversation_id, remote_public_key] {
        auto shared = DeriveSharedSecret(remote_public_key);
        if (shared.IsErr()) {
            return shared;
        }
        auto key = KeyAgreement::DeriveConversationKey(shared.Unwrap(), conversation_id);
        Wipe(shared.Unwrap());
        return key;
    });
}

Result<std::optional<LegacyRsaIdentity>, KeywardFailure> IdentityKeyManager::LoadLegacyIdentity() {
    auto private_pem = store_.ReadString(StorageKeys::LEGACY_PRIVATE_KEY_PEM);
    if (private_pem.IsErr()) {
        return std::move(private_pem).PropagateErr<std::optional<LegacyRsaIdentity>>();
    }
    auto public_pem = store_.ReadString(StorageKeys::LEGACY_PUBLIC_KEY_PEM);
    if (public_pem.IsErr()) {
        return std::move(public_pem).PropagateErr<std::optional<LegacyRsaIdentity>>();
    }
    if (!private_pem.Unwrap().has_value() || !public_pem.Unwrap().has_value()) {
        return Result<std::optional<LegacyRsaIdentity>, KeywardFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<LegacyRsaIdentity>, KeywardFailure>::Ok(
        LegacyRsaIdentity{std::move(*private_pem.Unwrap()), std::move(*public_pem.Unwrap())});
}

Result<std::vector<StoredIdentity>, KeywardFailure> IdentityKeyManager::LoadStoredIdentities() {
    std::vector<StoredIdentity> identities;
    auto legacy = LoadLegacyIdentity();
    if (legacy.IsErr()) {
        return std::move(legacy).PropagateErr<std::vector<StoredIdentity>>();
    }
    if (legacy.Unwrap().has_value()) {
        identities.emplace_back(std::move(*legacy.Unwrap()));
    }
    auto seed_hex = store_.ReadString(StorageKeys::IDENTITY_SEED_HEX);
    if (seed_hex.IsErr()) {
        return std::move(seed_hex).PropagateErr<std::vector<StoredIdentity>>();
    }
    if (auto& hex = seed_hex.Unwrap(); hex.has_value()) {
        auto parsed = ParseSeedHex(*hex);
        if (parsed.IsOk() && parsed.Unwrap().has_value()) {
            Wipe(*parsed.Unwrap());
            identities.emplace_back(SeedIdentity{std::move(*hex)});
        }
    }
    return Result<std::vector<StoredIdentity>, KeywardFailure>::Ok(std::move(identities));
}

Result<StoredScheme, KeywardFailure> IdentityKeyManager::DetectStoredScheme() {
    auto identities = LoadStoredIdentities();
    if (identities.IsErr()) {
        return std::move(identities).PropagateErr<StoredScheme>();
    }
    bool has_legacy = false;
    bool has_seed = false;
    for (const auto& identity : identities.Unwrap()) {
        if (std::holds_alternative<LegacyRsaIdentity>(identity)) {
            has_legacy = true;
        } else if (std::holds_alternative<SeedIdentity>(identity)) {
            has_seed = true;
        }
    }
    StoredScheme scheme = StoredScheme::None;
    if (has_legacy && has_seed) {
        scheme = StoredScheme::Both;
    } else if (has_legacy) {
        scheme = StoredScheme::LegacyOnly;
    } else if (has_seed) {
        scheme = StoredScheme::SeedOnly;
    }
    return Result<StoredScheme, KeywardFailure>::Ok(scheme);
}

Result<Unit, KeywardFailure> IdentityKeyManager::MigrateLegacyIdentity() {
    auto scheme = DetectStoredScheme();
    if (scheme.IsErr()) {
        return std::move(scheme).PropagateErr<Unit>();
    }
    if (auto ready = EnsureInitialized(); ready.IsErr()) {
        return ready;
    }
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (auto deleted = store_.Delete(StorageKeys::LEGACY_PRIVATE_KEY_PEM); deleted.IsErr()) {
        return deleted;
    }
    if (auto deleted = store_.Delete(StorageKeys::LEGACY_PUBLIC_KEY_PEM); deleted.IsErr()) {
        return deleted;
    }
    KEYWARD_LOG_INFO(kComponent, "migrated from stored scheme {} to seed identity",
                     models::StoredSchemeName(scheme.Unwrap()));
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<LegacyRsaIdentity, KeywardFailure> IdentityKeyManager::GenerateLegacyIdentity() {
    auto generated = LegacyIdentity::Generate(config_.rsa_key_bits);
    if (generated.IsErr()) {
        return generated;
    }
    const auto& identity = generated.Unwrap();
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (auto written = store_.WriteString(StorageKeys::LEGACY_PRIVATE_KEY_PEM, identity.private_key_pem);
        written.IsErr()) {
        return std::move(written).PropagateErr<LegacyRsaIdentity>();
    }
    if (auto written = store_.WriteString(StorageKeys::LEGACY_PUBLIC_KEY_PEM, identity.public_key_pem);
        written.IsErr()) {
        return std::move(written).PropagateErr<LegacyRsaIdentity>();
    }
    return generated;
}

Result<std::string, KeywardFailure> IdentityKeyManager::ExportLegacyIdentity() {
    auto legacy = LoadLegacyIdentity();
    if (legacy.IsErr()) {
        return std::move(legacy).PropagateErr<std::string>();
    }
    if (!legacy.Unwrap().has_value()) {
        return Result<std::string, KeywardFailure>::Err(
            KeywardFailure::KeysUnavailable("No legacy RSA identity is stored"));
    }
    return LegacyIdentity::ExportJson(*legacy.Unwrap());
}

Result<Unit, KeywardFailure> IdentityKeyManager::ImportLegacyIdentity(const std::string_view export_json) {
    auto imported = LegacyIdentity::ImportJson(export_json);
    if (imported.IsErr()) {
        return std::move(imported).PropagateErr<Unit>();
    }
    const auto& identity = imported.Unwrap();
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (auto written = store_.WriteString(StorageKeys::LEGACY_PRIVATE_KEY_PEM, identity.private_key_pem);
        written.IsErr()) {
        return written;
    }
    return store_.WriteString(StorageKeys::LEGACY_PUBLIC_KEY_PEM, identity.public_key_pem);
}

Result<Unit, KeywardFailure> IdentityKeyManager::ResetIdentity() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (auto deleted = store_.Delete(StorageKeys::IDENTITY_SEED_HEX); deleted.IsErr()) {
        return deleted;
    }
    {
        std::lock_guard lock(state_mutex_);
        keys_.reset();
        keys_just_generated_ = false;
        state_ = IdentityState::Uninitialized;
    }
    ClearConversationKeys();
    KEYWARD_LOG_INFO(kComponent, "identity reset");
    return Result<Unit, KeywardFailure>::Ok(unit);
}

} // namespace keyward::identity
