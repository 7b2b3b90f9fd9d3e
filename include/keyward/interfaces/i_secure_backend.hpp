#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace keyward::interfaces {

/// Platform secure storage (keychain, keystore, sealed files).
/// Implementations may fail with an error result or by throwing; the
/// SecureKeyStore treats both the same way.
class ISecureBackend {
public:
    virtual ~ISecureBackend() = default;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, KeywardFailure> Read(std::string_view key) = 0;
    [[nodiscard]] virtual Result<Unit, KeywardFailure> Write(std::string_view key, std::span<const uint8_t> value) = 0;
    [[nodiscard]] virtual Result<Unit, KeywardFailure> Delete(std::string_view key) = 0;
};

}
