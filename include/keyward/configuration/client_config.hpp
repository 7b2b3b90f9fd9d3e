#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/debug/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace keyward::configuration {

/// Argon2id cost parameters for passphrase-protected seed backups.
struct BackupKdfParams {
    uint64_t ops_limit = BackupConstants::DEFAULT_OPS_LIMIT;
    size_t mem_limit_bytes = BackupConstants::DEFAULT_MEM_LIMIT;

    /// Cheapest parameters libsodium accepts; suitable for tests only.
    [[nodiscard]] static constexpr BackupKdfParams Minimal() noexcept {
        return BackupKdfParams{1, 8 * 1024 * 1024};
    }
};

/// Client-side settings for the identity and messaging-key services
///
/// Value type with named factories:
/// ```cpp
/// auto config = ClientConfig::Default();
/// config.base_url = "https://api.example.org";
///
/// // Or pick everything up from KEYWARD_* environment variables
/// auto env_result = ClientConfig::FromEnvironment();
/// ```
class ClientConfig {
public:
    std::string base_url;
    std::chrono::milliseconds fetch_timeout = ServerApiConstants::DEFAULT_FETCH_TIMEOUT;
    std::filesystem::path store_directory;
    debug::LogLevel log_level = debug::LogLevel::Warn;
    int rsa_key_bits = RsaConstants::DEFAULT_KEY_BITS;
    BackupKdfParams backup_kdf{};

    [[nodiscard]] static ClientConfig Default();

    /// Reads KEYWARD_BASE_URL, KEYWARD_FETCH_TIMEOUT_MS, KEYWARD_STORE_DIR and
    /// KEYWARD_LOG_LEVEL on top of Default(). Malformed values are an error.
    [[nodiscard]] static Result<ClientConfig, KeywardFailure> FromEnvironment();

    [[nodiscard]] Result<Unit, KeywardFailure> Validate() const;

    /// Endpoint serving the server RSA key, derived from base_url.
    [[nodiscard]] std::string ServerPublicKeyUrl() const;
};

} // namespace keyward::configuration
