#include <catch2/catch_test_macros.hpp>
#include "keyward/channel/hybrid_server_channel.hpp"
#include "keyward/codec/key_codec.hpp"
#include "keyward/crypto/rsa_oaep.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/storage/secure_key_store.hpp"
#include "helpers/mock_http_transport.hpp"
#include "helpers/mock_secure_backend.hpp"
#include <chrono>
#include <memory>
#include <string>

using namespace keyward;
using namespace keyward::channel;
using keyward::codec::KeyCodec;
using keyward::configuration::ClientConfig;
using keyward::crypto::RsaOaep;
using keyward::crypto::SodiumInterop;
using keyward::models::RsaPrivateKey;
using keyward::storage::SecureKeyStore;
using keyward::test_helpers::MockHttpTransport;
using keyward::test_helpers::MockSecureBackend;

namespace {
    const RsaPrivateKey& ServerPrivateKey() {
        static const RsaPrivateKey key = RsaOaep::GenerateKeyPair(RsaConstants::DEFAULT_KEY_BITS).Unwrap();
        return key;
    }

    std::string ServerPublicPem() {
        return KeyCodec::EncodePublicKeyPem(ServerPrivateKey().PublicKey().Unwrap()).Unwrap();
    }

    ClientConfig ChannelConfig() {
        auto config = ClientConfig::Default();
        config.base_url = "https://api.example.org/";
        config.fetch_timeout = std::chrono::milliseconds(2500);
        return config;
    }
}

TEST_CASE("HybridServerChannel - Fetching the server key", "[channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backend = std::make_shared<MockSecureBackend>();
    SecureKeyStore store(backend);
    auto transport = std::make_shared<MockHttpTransport>();
    HybridServerChannel channel(store, transport, ChannelConfig());
    REQUIRE(channel.State() == ServerKeyState::NoServerKey);

    SECTION("Successful fetch caches the key") {
        transport->RespondWithPublicKey(ServerPublicPem());
        auto fetched = channel.FetchServerPublicKey();
        REQUIRE(fetched.IsOk());
        REQUIRE(fetched.Unwrap() == ServerKeySource::Network);
        REQUIRE(channel.State() == ServerKeyState::HasServerKey);
        REQUIRE(transport->RequestedUrls().front() == "https://api.example.org/users/server-public-key");
        REQUIRE(transport->LastTimeout() == std::chrono::milliseconds(2500));
        REQUIRE(backend->Peek(std::string(StorageKeys::SERVER_PUBLIC_KEY_PEM)) == ServerPublicPem());
    }
    SECTION("Explicit base URL overrides the configured one") {
        transport->RespondWithPublicKey(ServerPublicPem());
        REQUIRE(channel.FetchServerPublicKey("http://localhost:8080").IsOk());
        REQUIRE(transport->RequestedUrls().front() == "http://localhost:8080/users/server-public-key");
        REQUIRE(channel.FetchServerPublicKey("").UnwrapErr().type == FailureType::InvalidInput);
    }
    SECTION("Fingerprint is SHA-256 of the SubjectPublicKeyInfo") {
        transport->RespondWithPublicKey(ServerPublicPem());
        REQUIRE(channel.FetchServerPublicKey().IsOk());
        auto fingerprint = channel.ServerKeyFingerprint();
        REQUIRE(fingerprint.IsOk());
        const auto der = KeyCodec::EncodePublicKeyDer(ServerPrivateKey().PublicKey().Unwrap()).Unwrap();
        REQUIRE(fingerprint.Unwrap() == SodiumInterop::ToHex(SodiumInterop::Sha256(der)));
        REQUIRE(fingerprint.Unwrap().size() == 64);
        REQUIRE(channel.ServerPublicKeyPem().Unwrap() == ServerPublicPem());
    }
    SECTION("Timeout without a cache is reported as FetchTimeout") {
        transport->FailWith(KeywardFailure::FetchTimeout("timed out"));
        auto fetched = channel.FetchServerPublicKey();
        REQUIRE(fetched.IsErr());
        REQUIRE(fetched.UnwrapErr().type == FailureType::FetchTimeout);
        REQUIRE(channel.State() == ServerKeyState::NoServerKey);
    }
    SECTION("Network errors and bad responses are ServerKeyUnavailable") {
        transport->FailWith(KeywardFailure::Network("connection refused"));
        REQUIRE(channel.FetchServerPublicKey().UnwrapErr().type == FailureType::ServerKeyUnavailable);
        transport->RespondWith(503, "");
        REQUIRE(channel.FetchServerPublicKey().UnwrapErr().type == FailureType::ServerKeyUnavailable);
        transport->RespondWith(200, "{\"key\":\"nope\"}");
        REQUIRE(channel.FetchServerPublicKey().UnwrapErr().type == FailureType::ServerKeyUnavailable);
        transport->RespondWith(200, "{\"public_key\":\"-----BEGIN PUBLIC KEY-----\\nAAAA\\n-----END PUBLIC KEY-----\"}");
        REQUIRE(channel.FetchServerPublicKey().UnwrapErr().type == FailureType::ServerKeyUnavailable);
        REQUIRE_FALSE(backend->Peek(std::string(StorageKeys::SERVER_PUBLIC_KEY_PEM)).has_value());
    }
    SECTION("Failed fetch falls back to the cached key") {
        backend->Seed(std::string(StorageKeys::SERVER_PUBLIC_KEY_PEM), ServerPublicPem());
        transport->FailWith(KeywardFailure::FetchTimeout("timed out"));
        auto fetched = channel.FetchServerPublicKey();
        REQUIRE(fetched.IsOk());
        REQUIRE(fetched.Unwrap() == ServerKeySource::Cache);
        REQUIRE(channel.State() == ServerKeyState::HasServerKey);
    }
}

TEST_CASE("HybridServerChannel - Key in memory outlives a degraded store", "[channel][storage]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backend = std::make_shared<MockSecureBackend>();
    SecureKeyStore store(backend);
    auto transport = std::make_shared<MockHttpTransport>();
    HybridServerChannel channel(store, transport, ChannelConfig());
    transport->RespondWithPublicKey(ServerPublicPem());
    REQUIRE(channel.FetchServerPublicKey().Unwrap() == ServerKeySource::Network);

    backend->SetFailureMode(MockSecureBackend::FailureMode::ReturnError);
    transport->FailWith(KeywardFailure::FetchTimeout("timed out"));

    auto refetched = channel.FetchServerPublicKey();
    REQUIRE(refetched.IsOk());
    REQUIRE(refetched.Unwrap() == ServerKeySource::Cache);
    REQUIRE(store.IsEphemeral());
    REQUIRE(channel.State() == ServerKeyState::HasServerKey);

    const std::vector<uint8_t> secret = SodiumInterop::GetRandomBytes(32);
    auto ciphertext = channel.EncryptForServer(secret);
    REQUIRE(ciphertext.IsOk());
    REQUIRE(RsaOaep::Decrypt(ServerPrivateKey(), ciphertext.Unwrap()).Unwrap() == secret);
    REQUIRE(channel.LoadCachedServerKey().UnwrapErr().type == FailureType::ServerKeyUnavailable);
    REQUIRE(channel.State() == ServerKeyState::HasServerKey);
}

TEST_CASE("HybridServerChannel - Cached key handling", "[channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backend = std::make_shared<MockSecureBackend>();
    SecureKeyStore store(backend);
    auto transport = std::make_shared<MockHttpTransport>();
    HybridServerChannel channel(store, transport, ChannelConfig());
    const std::string cache_key(StorageKeys::SERVER_PUBLIC_KEY_PEM);

    SECTION("Nothing cached") {
        auto loaded = channel.LoadCachedServerKey();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::ServerKeyUnavailable);
    }
    SECTION("Corrupt cache is deleted") {
        backend->Seed(cache_key, "-----BEGIN PUBLIC KEY-----\ngarbage\n-----END PUBLIC KEY-----\n");
        auto loaded = channel.LoadCachedServerKey();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == FailureType::KeyFormat);
        REQUIRE_FALSE(backend->Peek(cache_key).has_value());
        REQUIRE(channel.State() == ServerKeyState::NoServerKey);
    }
    SECTION("Valid cache loads without network access") {
        backend->Seed(cache_key, ServerPublicPem());
        REQUIRE(channel.LoadCachedServerKey().IsOk());
        REQUIRE(channel.ServerKeyFingerprint().IsOk());
        REQUIRE(transport->RequestCount() == 0);
    }
    SECTION("Invalidate forgets the key") {
        backend->Seed(cache_key, ServerPublicPem());
        REQUIRE(channel.LoadCachedServerKey().IsOk());
        REQUIRE(channel.InvalidateServerKey().IsOk());
        REQUIRE(channel.State() == ServerKeyState::NoServerKey);
        REQUIRE_FALSE(backend->Peek(cache_key).has_value());
    }
}

TEST_CASE("HybridServerChannel - Encrypting for the server", "[channel][rsa]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto store = SecureKeyStore::InMemory();
    auto transport = std::make_shared<MockHttpTransport>();
    HybridServerChannel channel(*store, transport, ChannelConfig());
    const std::vector<uint8_t> secret = SodiumInterop::GetRandomBytes(32);

    SECTION("Key is fetched on demand and the server can decrypt") {
        transport->RespondWithPublicKey(ServerPublicPem());
        auto ciphertext = channel.EncryptForServer(secret);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == 256);
        REQUIRE(transport->RequestCount() == 1);
        auto opened = RsaOaep::Decrypt(ServerPrivateKey(), ciphertext.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == secret);
        REQUIRE(channel.EncryptForServer(secret).IsOk());
        REQUIRE(transport->RequestCount() == 1);
    }
    SECTION("No key obtainable") {
        transport->FailWith(KeywardFailure::Network("offline"));
        auto ciphertext = channel.EncryptForServer(secret);
        REQUIRE(ciphertext.IsErr());
        REQUIRE(ciphertext.UnwrapErr().type == FailureType::ServerKeyUnavailable);
    }
    SECTION("No base URL and no cache") {
        HybridServerChannel offline(*store, transport, ClientConfig::Default());
        auto ciphertext = offline.EncryptForServer(secret);
        REQUIRE(ciphertext.IsErr());
        REQUIRE(ciphertext.UnwrapErr().type == FailureType::ServerKeyUnavailable);
        REQUIRE(transport->RequestCount() == 0);
    }
    SECTION("Oversized payload is rejected") {
        transport->RespondWithPublicKey(ServerPublicPem());
        const std::vector<uint8_t> large(RsaOaep::MaxPlaintextSize(RsaConstants::DEFAULT_KEY_BITS) + 1, 0x01);
        auto ciphertext = channel.EncryptForServer(large);
        REQUIRE(ciphertext.IsErr());
        REQUIRE(ciphertext.UnwrapErr().type == FailureType::InvalidInput);
    }
}
