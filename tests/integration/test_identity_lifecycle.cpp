#include <catch2/catch_test_macros.hpp>
#include "keyward/identity/identity_key_manager.hpp"
#include "keyward/channel/hybrid_server_channel.hpp"
#include "keyward/utilities/message_encryptor.hpp"
#include "keyward/storage/file_secure_backend.hpp"
#include "keyward/storage/secure_key_store.hpp"
#include "keyward/codec/key_codec.hpp"
#include "keyward/crypto/rsa_oaep.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "helpers/mock_http_transport.hpp"
#include "helpers/temp_directory.hpp"
#include <memory>
#include <string>

using namespace keyward;
using keyward::channel::HybridServerChannel;
using keyward::channel::ServerKeySource;
using keyward::codec::KeyCodec;
using keyward::configuration::ClientConfig;
using keyward::crypto::RsaOaep;
using keyward::crypto::SodiumInterop;
using keyward::identity::IdentityKeyManager;
using keyward::models::StoredScheme;
using keyward::storage::FileSecureBackend;
using keyward::storage::SecureKeyStore;
using keyward::test_helpers::MockHttpTransport;
using keyward::test_helpers::TempDirectory;
using keyward::utilities::MessageEncryptor;

namespace {
    std::unique_ptr<SecureKeyStore> OpenStore(const TempDirectory& dir) {
        auto backend = FileSecureBackend::Open(dir.Path());
        REQUIRE(backend.IsOk());
        return std::make_unique<SecureKeyStore>(std::move(backend).Unwrap());
    }

    ClientConfig IntegrationConfig(const TempDirectory& dir) {
        auto config = ClientConfig::Default();
        config.base_url = "https://api.example.org";
        config.store_directory = dir.Path();
        config.backup_kdf = configuration::BackupKdfParams::Minimal();
        return config;
    }
}

TEST_CASE("Identity Lifecycle - Seed persists across restarts", "[integration][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    std::vector<uint8_t> first_public;
    std::vector<uint8_t> conversation_secret;
    {
        auto store = OpenStore(dir);
        IdentityKeyManager manager(*store, IntegrationConfig(dir));
        REQUIRE(manager.InitializeKeys().IsOk());
        REQUIRE(manager.KeysWereJustGenerated());
        REQUIRE_FALSE(manager.IsEphemeral());
        first_public = manager.GetPublicKey().Unwrap();
    }
    {
        auto store = OpenStore(dir);
        IdentityKeyManager manager(*store, IntegrationConfig(dir));
        REQUIRE(manager.InitializeKeys().IsOk());
        REQUIRE_FALSE(manager.KeysWereJustGenerated());
        REQUIRE(manager.GetPublicKey().Unwrap() == first_public);
        REQUIRE(manager.DetectStoredScheme().Unwrap() == StoredScheme::SeedOnly);
    }
}

TEST_CASE("Identity Lifecycle - Corrupted seed is replaced", "[integration][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = OpenStore(dir);
    REQUIRE(store->WriteString(StorageKeys::IDENTITY_SEED_HEX, "not-a-hex-seed").IsOk());
    IdentityKeyManager manager(*store, IntegrationConfig(dir));
    REQUIRE(manager.InitializeKeys().IsOk());
    REQUIRE(manager.KeysWereJustGenerated());
    auto stored = store->ReadString(StorageKeys::IDENTITY_SEED_HEX);
    REQUIRE(stored.IsOk());
    REQUIRE(stored.Unwrap().has_value());
    REQUIRE(stored.Unwrap()->size() == Constants::IDENTITY_SEED_HEX_LENGTH);
    REQUIRE(SodiumInterop::FromHex(*stored.Unwrap()).IsOk());
}

TEST_CASE("Identity Lifecycle - Short hex seed is replaced", "[integration][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const std::string short_seed(30, 'a');
    {
        auto store = OpenStore(dir);
        REQUIRE(store->WriteString(StorageKeys::IDENTITY_SEED_HEX, short_seed).IsOk());
    }
    auto store = OpenStore(dir);
    IdentityKeyManager manager(*store, IntegrationConfig(dir));
    REQUIRE(manager.InitializeKeys().IsOk());
    REQUIRE(manager.KeysWereJustGenerated());
    auto stored = store->ReadString(StorageKeys::IDENTITY_SEED_HEX);
    REQUIRE(stored.IsOk());
    REQUIRE(stored.Unwrap().has_value());
    REQUIRE(*stored.Unwrap() != short_seed);
    REQUIRE(stored.Unwrap()->size() == Constants::IDENTITY_SEED_HEX_LENGTH);
    auto seed = SodiumInterop::FromHex(*stored.Unwrap());
    REQUIRE(seed.IsOk());
    REQUIRE(seed.Unwrap().size() == Constants::IDENTITY_SEED_SIZE);
    REQUIRE(manager.DetectStoredScheme().Unwrap() == StoredScheme::SeedOnly);
}

TEST_CASE("Identity Lifecycle - Restoring on a new device", "[integration][identity][backup]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory old_device;
    TempDirectory new_device;
    auto old_store = OpenStore(old_device);
    IdentityKeyManager original(*old_store, IntegrationConfig(old_device));
    const auto public_key = original.GetPublicKey().Unwrap();
    const auto backup = original.ExportSeedBackup("correct horse").Unwrap();
    const auto frames = original.ExportQrFrames().Unwrap();

    SECTION("From passphrase backup") {
        auto store = OpenStore(new_device);
        IdentityKeyManager restored(*store, IntegrationConfig(new_device));
        REQUIRE(restored.ImportSeedBackup(backup, "correct horse").IsOk());
        REQUIRE(restored.GetPublicKey().Unwrap() == public_key);
    }
    SECTION("From QR frames, after a restart") {
        {
            auto store = OpenStore(new_device);
            IdentityKeyManager restored(*store, IntegrationConfig(new_device));
            REQUIRE(restored.ImportQrFrames(frames).IsOk());
        }
        auto store = OpenStore(new_device);
        IdentityKeyManager reopened(*store, IntegrationConfig(new_device));
        REQUIRE(reopened.GetPublicKey().Unwrap() == public_key);
        REQUIRE_FALSE(reopened.KeysWereJustGenerated());
    }
}

TEST_CASE("Identity Lifecycle - Legacy identity migration", "[integration][legacy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = OpenStore(dir);
    IdentityKeyManager manager(*store, IntegrationConfig(dir));
    REQUIRE(manager.GenerateLegacyIdentity().IsOk());
    REQUIRE(manager.DetectStoredScheme().Unwrap() == StoredScheme::LegacyOnly);
    REQUIRE(manager.MigrateLegacyIdentity().IsOk());
    REQUIRE(manager.DetectStoredScheme().Unwrap() == StoredScheme::SeedOnly);
    REQUIRE_FALSE(store->ReadString(StorageKeys::LEGACY_PRIVATE_KEY_PEM).Unwrap().has_value());
    REQUIRE_FALSE(store->ReadString(StorageKeys::LEGACY_PUBLIC_KEY_PEM).Unwrap().has_value());
}

TEST_CASE("Identity Lifecycle - Server key survives going offline", "[integration][channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto server_key = RsaOaep::GenerateKeyPair(RsaConstants::DEFAULT_KEY_BITS).Unwrap();
    const auto server_pem = KeyCodec::EncodePublicKeyPem(server_key.PublicKey().Unwrap()).Unwrap();
    {
        auto store = OpenStore(dir);
        auto transport = std::make_shared<MockHttpTransport>();
        transport->RespondWithPublicKey(server_pem);
        HybridServerChannel channel(*store, transport, IntegrationConfig(dir));
        REQUIRE(channel.FetchServerPublicKey().Unwrap() == ServerKeySource::Network);
    }
    SECTION("Cached key is used when the fetch times out") {
        auto store = OpenStore(dir);
        auto transport = std::make_shared<MockHttpTransport>();
        transport->FailWith(KeywardFailure::FetchTimeout("timed out"));
        HybridServerChannel channel(*store, transport, IntegrationConfig(dir));
        IdentityKeyManager identity(*store, IntegrationConfig(dir));
        MessageEncryptor encryptor(identity, channel);
        REQUIRE(channel.FetchServerPublicKey().Unwrap() == ServerKeySource::Cache);
        auto sealed = encryptor.EncryptTextForServer("offline payload");
        REQUIRE(sealed.IsOk());
        auto key = RsaOaep::Decrypt(server_key, *sealed.Unwrap().encrypted_key);
        REQUIRE(key.IsOk());
    }
    SECTION("Without the cache the timeout is surfaced") {
        {
            auto store = OpenStore(dir);
            HybridServerChannel channel(*store, nullptr, IntegrationConfig(dir));
            REQUIRE(channel.InvalidateServerKey().IsOk());
        }
        auto store = OpenStore(dir);
        auto transport = std::make_shared<MockHttpTransport>();
        transport->FailWith(KeywardFailure::FetchTimeout("timed out"));
        HybridServerChannel channel(*store, transport, IntegrationConfig(dir));
        auto fetched = channel.FetchServerPublicKey();
        REQUIRE(fetched.IsErr());
        REQUIRE(fetched.UnwrapErr().type == FailureType::FetchTimeout);
    }
}
