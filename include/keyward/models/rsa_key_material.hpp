#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/big_num.hpp"

#include <optional>

namespace keyward::models {

using crypto::BigNum;

struct RsaPublicKey {
    BigNum modulus;
    BigNum public_exponent;

    [[nodiscard]] int ModulusBits() const noexcept { return modulus.BitCount(); }

    [[nodiscard]] Result<RsaPublicKey, KeywardFailure> Clone() const;
};

/**
 * RSA private key in PKCS1 component form.
 *
 * The CRT parameters are optional so keys assembled from (n, e, d, p, q)
 * alone can still be encoded; WithCrtParameters() fills them in as
 * dP = d mod (p-1), dQ = d mod (q-1), qInv = q^-1 mod p.
 */
struct RsaPrivateKey {
    BigNum modulus;
    BigNum public_exponent;
    BigNum private_exponent;
    BigNum prime1;
    BigNum prime2;
    std::optional<BigNum> exponent1;
    std::optional<BigNum> exponent2;
    std::optional<BigNum> coefficient;

    [[nodiscard]] bool HasCrtParameters() const noexcept {
        return exponent1.has_value() && exponent2.has_value() && coefficient.has_value();
    }

    /// Computes any missing CRT parameter in place.
    Result<Unit, KeywardFailure> WithCrtParameters();

    [[nodiscard]] Result<RsaPublicKey, KeywardFailure> PublicKey() const;

    [[nodiscard]] Result<RsaPrivateKey, KeywardFailure> Clone() const;
};

/// Legacy RSA identity as persisted under the device_*_key_pem entries.
struct LegacyRsaKeyPair {
    RsaPrivateKey private_key;
    RsaPublicKey public_key;
};

} // namespace keyward::models
