#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/models/rsa_key_material.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::codec {

/**
 * @brief RSA keys to and from PEM
 *
 * Public keys are written as SubjectPublicKeyInfo ("PUBLIC KEY"):
 *   SEQUENCE { SEQUENCE { OID rsaEncryption, NULL },
 *              BIT STRING { SEQUENCE { INTEGER n, INTEGER e } } }
 *
 * Private keys are written as PKCS8 ("PRIVATE KEY") wrapping the PKCS1
 * RSAPrivateKey SEQUENCE { 0, n, e, d, p, q, dP, dQ, qInv }. Missing CRT
 * parameters are computed before encoding.
 *
 * Decoding additionally accepts the PKCS1 forms ("RSA PUBLIC KEY",
 * "RSA PRIVATE KEY"). Every decode failure is a KeyFormat failure whose
 * field names the offending component (modulus, publicExponent, pemHeader...).
 */
class KeyCodec {
public:
    static Result<std::string, KeywardFailure> EncodePublicKeyPem(const models::RsaPublicKey& key);
    static Result<models::RsaPublicKey, KeywardFailure> DecodePublicKeyPem(std::string_view pem);

    static Result<std::string, KeywardFailure> EncodePrivateKeyPem(const models::RsaPrivateKey& key);
    static Result<models::RsaPrivateKey, KeywardFailure> DecodePrivateKeyPem(std::string_view pem);

    /// SubjectPublicKeyInfo DER.
    static Result<std::vector<uint8_t>, KeywardFailure> EncodePublicKeyDer(const models::RsaPublicKey& key);

    /// PKCS1 RSAPublicKey DER.
    static Result<std::vector<uint8_t>, KeywardFailure> EncodeRsaPublicKeyDer(const models::RsaPublicKey& key);

    static Result<models::RsaPublicKey, KeywardFailure> DecodeSubjectPublicKeyInfo(std::span<const uint8_t> der);
    static Result<models::RsaPublicKey, KeywardFailure> DecodeRsaPublicKey(std::span<const uint8_t> der);
    static Result<models::RsaPrivateKey, KeywardFailure> DecodePkcs8(std::span<const uint8_t> der);
    static Result<models::RsaPrivateKey, KeywardFailure> DecodeRsaPrivateKey(std::span<const uint8_t> der);

private:
    KeyCodec() = delete;
};

} // namespace keyward::codec
