#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::models {

/**
 * AES-GCM sealed payload as it crosses the network.
 *
 * encrypted_key carries the RSA-OAEP wrapped AES key on the server path and
 * is absent on the symmetric-only conversation path.
 *
 * JSON form (all binary fields base64):
 *   {"encrypted_content": .., "iv": .., "tag": .., "encrypted_key": ..}
 */
struct EncryptedEnvelope {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> tag;
    std::optional<std::vector<uint8_t>> encrypted_key;

    [[nodiscard]] bool HasEncryptedKey() const noexcept { return encrypted_key.has_value(); }

    [[nodiscard]] std::string ToJson() const;

    static Result<EncryptedEnvelope, KeywardFailure> FromJson(std::string_view json);
};

} // namespace keyward::models
