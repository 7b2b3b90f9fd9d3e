#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyward::models {

enum class StoredScheme {
    None,
    LegacyOnly,
    SeedOnly,
    Both
};

[[nodiscard]] constexpr std::string_view StoredSchemeName(const StoredScheme scheme) noexcept {
    switch (scheme) {
        case StoredScheme::None: return "None";
        case StoredScheme::LegacyOnly: return "LegacyOnly";
        case StoredScheme::SeedOnly: return "SeedOnly";
        case StoredScheme::Both: return "Both";
    }
    return "Unknown";
}

/// RSA-2048 identity persisted as PEM by older clients.
struct LegacyRsaIdentity {
    std::string private_key_pem;
    std::string public_key_pem;
};

/// Current identity: the 32-byte seed as persisted (64 lowercase hex chars).
struct SeedIdentity {
    std::string seed_hex;
};

using StoredIdentity = std::variant<LegacyRsaIdentity, SeedIdentity>;

}
