#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/configuration/client_config.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::crypto {

/**
 * @brief Passphrase-protected backup of the identity seed
 *
 * Argon2id (libsodium crypto_pwhash, 16-byte salt, 32-byte key) followed by
 * AES-256-GCM. The result is a self-describing JSON document:
 *
 *   {"type":"argon2id","salt":<b64>,"iterations":2,"memory":65536,
 *    "parallelism":1,"hashLength":32,"nonceLength":12,"macLength":16,
 *    "ciphertext":<b64 of nonce || ciphertext || tag>}
 *
 * "memory" is in KiB.
 */
class PassphraseBackup {
public:
    static Result<std::string, KeywardFailure> Seal(
        std::span<const uint8_t> secret,
        std::string_view passphrase,
        const configuration::BackupKdfParams& params);

    /// AuthenticationFailed for a wrong passphrase or a tampered document.
    static Result<std::vector<uint8_t>, KeywardFailure> Open(
        std::string_view backup_json,
        std::string_view passphrase);

private:
    PassphraseBackup() = delete;
};

} // namespace keyward::crypto
