/**
 * @file identity_example.cpp
 * @brief Identity lifecycle walk-through: seed, mnemonic, signing and conversation encryption
 *
 * Uses a FileSecureBackend in KEYWARD_STORE_DIR (or the default data
 * directory). Set KEYWARD_BASE_URL to also try the server-key fetch.
 */

#include "keyward/channel/curl_http_transport.hpp"
#include "keyward/channel/hybrid_server_channel.hpp"
#include "keyward/configuration/client_config.hpp"
#include "keyward/identity/identity_key_manager.hpp"
#include "keyward/storage/file_secure_backend.hpp"
#include "keyward/storage/secure_key_store.hpp"
#include "keyward/utilities/message_encryptor.hpp"

#include <iostream>
#include <memory>

using namespace keyward;

int main() {
    std::cout << "=== keyward - Identity Example ===" << std::endl;
    std::cout << std::endl;

    auto config_result = configuration::ClientConfig::FromEnvironment();
    if (config_result.IsErr()) {
        std::cerr << "Invalid configuration: " << config_result.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    auto config = std::move(config_result).Unwrap();
    debug::Logger::SetLevel(config.log_level);

    // Open the sealed-file store
    std::cout << "1. Opening secure store in " << config.store_directory << "..." << std::endl;
    std::shared_ptr<interfaces::ISecureBackend> backend;
    if (auto opened = storage::FileSecureBackend::Open(config.store_directory); opened.IsOk()) {
        backend = std::move(opened).Unwrap();
    } else {
        std::cerr << "   Store unavailable (" << opened.UnwrapErr().ToString()
                  << "), keys will be ephemeral" << std::endl;
    }
    std::unique_ptr<storage::SecureKeyStore> store = backend
        ? std::make_unique<storage::SecureKeyStore>(backend)
        : storage::SecureKeyStore::InMemory();
    std::cout << std::endl;

    // Load or create the identity
    std::cout << "2. Initializing identity..." << std::endl;
    identity::IdentityKeyManager identity(*store, config);
    if (auto init = identity.InitializeKeys(); init.IsErr()) {
        std::cerr << "Failed to initialize identity: " << init.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "   ✓ " << (identity.KeysWereJustGenerated() ? "Generated new" : "Loaded existing")
              << " identity" << (identity.IsEphemeral() ? " (ephemeral)" : "") << std::endl;
    std::cout << "   Public key: " << identity.GetPublicKeyBase64().UnwrapOr("<unavailable>") << std::endl;
    std::cout << std::endl;

    std::cout << "3. Recovery phrase..." << std::endl;
    auto mnemonic = identity.ExportMnemonic();
    if (mnemonic.IsErr()) {
        std::cerr << "Failed to export mnemonic: " << mnemonic.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "   " << mnemonic.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "4. Signing..." << std::endl;
    const std::string message = "hello from keyward";
    const std::span<const uint8_t> message_bytes(
        reinterpret_cast<const uint8_t*>(message.data()), message.size());
    auto signature = identity.Sign(message_bytes);
    auto public_key = identity.GetPublicKey();
    if (signature.IsErr() || public_key.IsErr()) {
        std::cerr << "Failed to sign" << std::endl;
        return 1;
    }
    auto verified = identity::IdentityKeyManager::Verify(public_key.Unwrap(), message_bytes, signature.Unwrap());
    std::cout << "   ✓ Signature verifies: " << (verified.IsOk() && verified.Unwrap() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    std::cout << "5. Conversation round trip..." << std::endl;
    auto transport = std::make_shared<channel::CurlHttpTransport>();
    channel::HybridServerChannel server_channel(*store, transport, config);
    utilities::MessageEncryptor encryptor(identity, server_channel);
    auto envelope = encryptor.EncryptForConversation("example-conversation", message_bytes);
    if (envelope.IsErr()) {
        std::cerr << "Failed to encrypt: " << envelope.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "   Envelope: " << envelope.Unwrap().ToJson() << std::endl;
    auto decrypted = encryptor.DecryptTextForConversation("example-conversation", envelope.Unwrap());
    if (decrypted.IsErr()) {
        std::cerr << "Failed to decrypt: " << decrypted.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "   ✓ Decrypted: " << decrypted.Unwrap() << std::endl;
    std::cout << std::endl;

    if (!config.base_url.empty()) {
        std::cout << "6. Fetching server key from " << config.ServerPublicKeyUrl() << "..." << std::endl;
        auto fetched = server_channel.FetchServerPublicKey();
        if (fetched.IsErr()) {
            std::cerr << "   Server key unavailable: " << fetched.UnwrapErr().ToString() << std::endl;
        } else {
            std::cout << "   ✓ Fingerprint: " << server_channel.ServerKeyFingerprint().UnwrapOr("<none>") << std::endl;
        }
        std::cout << std::endl;
    }

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
