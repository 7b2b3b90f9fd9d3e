#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/configuration/client_config.hpp"
#include "keyward/interfaces/i_http_transport.hpp"
#include "keyward/models/rsa_key_material.hpp"
#include "keyward/storage/secure_key_store.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::channel {

enum class ServerKeyState {
    NoServerKey,
    HasServerKey
};

enum class ServerKeySource {
    Network,
    Cache
};

/**
 * @brief Encrypt-to-server with the backend's RSA public key
 *
 * The key is fetched from GET {base_url}/users/server-public-key, validated
 * (PEM markers, modulus, exponent) and only then cached as PEM under
 * `server_public_key_pem` with an in-memory mirror. A cached PEM that no
 * longer decodes is deleted and the channel drops back to NoServerKey.
 *
 * All operations are serialized; a fetch blocks other callers for at most
 * the configured fetch timeout.
 */
class HybridServerChannel {
public:
    HybridServerChannel(
        storage::SecureKeyStore& store,
        std::shared_ptr<interfaces::IHttpTransport> transport,
        configuration::ClientConfig config);

    HybridServerChannel(const HybridServerChannel&) = delete;
    HybridServerChannel& operator=(const HybridServerChannel&) = delete;

    /// Fetches and caches the server key. When the fetch fails the persisted
    /// cache is used instead, or the key already held in memory (source Cache);
    /// with neither the fetch failure is returned: FetchTimeout on time-out,
    /// else ServerKeyUnavailable.
    [[nodiscard]] Result<ServerKeySource, KeywardFailure> FetchServerPublicKey(std::string_view base_url);
    [[nodiscard]] Result<ServerKeySource, KeywardFailure> FetchServerPublicKey();

    /// Loads the persisted key into memory. KeyFormat if it was corrupt (and
    /// has been deleted), ServerKeyUnavailable if nothing is cached.
    [[nodiscard]] Result<Unit, KeywardFailure> LoadCachedServerKey();

    /// RSA-OAEP(SHA-256) under the server key; loads or fetches it first.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> EncryptForServer(std::span<const uint8_t> data);

    /// Lowercase hex SHA-256 of the key's SubjectPublicKeyInfo DER.
    [[nodiscard]] Result<std::string, KeywardFailure> ServerKeyFingerprint();

    [[nodiscard]] Result<std::string, KeywardFailure> ServerPublicKeyPem();

    [[nodiscard]] Result<Unit, KeywardFailure> InvalidateServerKey();

    [[nodiscard]] ServerKeyState State() const;

private:
    [[nodiscard]] Result<ServerKeySource, KeywardFailure> FetchLocked(const std::string& url);
    [[nodiscard]] Result<models::RsaPublicKey, KeywardFailure> DownloadKey(const std::string& url);
    [[nodiscard]] Result<Unit, KeywardFailure> LoadCachedLocked();
    [[nodiscard]] Result<Unit, KeywardFailure> EnsureKeyLocked();

    storage::SecureKeyStore& store_;
    std::shared_ptr<interfaces::IHttpTransport> transport_;
    configuration::ClientConfig config_;

    mutable std::mutex mutex_;
    std::optional<models::RsaPublicKey> server_key_;
};

} // namespace keyward::channel
