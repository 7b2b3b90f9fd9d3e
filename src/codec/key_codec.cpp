#include "keyward/codec/key_codec.hpp"
#include "keyward/codec/der.hpp"
#include "keyward/codec/pem.hpp"
#include "keyward/core/format.hpp"

#include <algorithm>
#include <iterator>
#include <sodium.h>

namespace keyward::codec {

using crypto::BigNum;
using models::RsaPrivateKey;
using models::RsaPublicKey;

namespace {
    using Bytes = std::vector<uint8_t>;

    class WipeOnExit {
    public:
        explicit WipeOnExit(Bytes& buffer) noexcept : buffer_(buffer) {}
        ~WipeOnExit() { sodium_memzero(buffer_.data(), buffer_.size()); }
        WipeOnExit(const WipeOnExit&) = delete;
        WipeOnExit& operator=(const WipeOnExit&) = delete;
    private:
        Bytes& buffer_;
    };

    Result<Unit, KeywardFailure> ValidatePublicComponents(const BigNum& modulus, const BigNum& exponent) {
        if (modulus.IsNegative() || modulus.IsZero()) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::KeyFormat("modulus", "RSA modulus must be positive"));
        }
        if (exponent.IsNegative() || exponent.IsZero() || exponent.IsOne()) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::KeyFormat("publicExponent", "RSA public exponent must be greater than one"));
        }
        if (exponent.Compare(modulus) >= 0) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::KeyFormat("publicExponent", "RSA public exponent must be smaller than the modulus"));
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Result<Unit, KeywardFailure> ExpectRsaAlgorithm(DerReader& outer) {
        auto algorithm = outer.ExpectSequence("algorithm");
        if (algorithm.IsErr()) {
            return std::move(algorithm).PropagateErr<Unit>();
        }
        DerReader& alg = algorithm.Unwrap();
        auto oid = alg.Expect(DerTag::OBJECT_IDENTIFIER, "algorithm");
        if (oid.IsErr()) {
            return std::move(oid).PropagateErr<Unit>();
        }
        const auto oid_bytes = oid.Unwrap();
        if (!std::equal(oid_bytes.begin(), oid_bytes.end(),
                        std::begin(RSA_ENCRYPTION_OID), std::end(RSA_ENCRYPTION_OID))) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::KeyFormat("algorithm", "Key algorithm is not rsaEncryption"));
        }
        if (!alg.AtEnd()) {
            auto params = alg.Expect(DerTag::NULL_VALUE, "algorithm");
            if (params.IsErr()) {
                return std::move(params).PropagateErr<Unit>();
            }
        }
        return alg.ExpectEnd("algorithm");
    }

    Result<Bytes, KeywardFailure> EncodeRsaPrivateKeyDer(const RsaPrivateKey& key) {
        const BigNum* components[] = {
            &key.modulus, &key.public_exponent, &key.private_exponent,
            &key.prime1, &key.prime2,
            &*key.exponent1, &*key.exponent2, &*key.coefficient};
        Bytes content = DerWriter::SmallInteger(0);
        for (const BigNum* component : components) {
            auto encoded = DerWriter::Integer(*component);
            if (encoded.IsErr()) {
                sodium_memzero(content.data(), content.size());
                return encoded;
            }
            Bytes& bytes = encoded.Unwrap();
            content.insert(content.end(), bytes.begin(), bytes.end());
            sodium_memzero(bytes.data(), bytes.size());
        }
        WipeOnExit wipe(content);
        return Result<Bytes, KeywardFailure>::Ok(DerWriter::Element(DerTag::SEQUENCE, content));
    }
}

Result<Bytes, KeywardFailure> KeyCodec::EncodeRsaPublicKeyDer(const RsaPublicKey& key) {
    if (auto valid = ValidatePublicComponents(key.modulus, key.public_exponent); valid.IsErr()) {
        return std::move(valid).PropagateErr<Bytes>();
    }
    auto n = DerWriter::Integer(key.modulus);
    if (n.IsErr()) {
        return n;
    }
    auto e = DerWriter::Integer(key.public_exponent);
    if (e.IsErr()) {
        return e;
    }
    return Result<Bytes, KeywardFailure>::Ok(DerWriter::Sequence({n.Unwrap(), e.Unwrap()}));
}

Result<Bytes, KeywardFailure> KeyCodec::EncodePublicKeyDer(const RsaPublicKey& key) {
    auto rsa_public = EncodeRsaPublicKeyDer(key);
    if (rsa_public.IsErr()) {
        return rsa_public;
    }
    const Bytes algorithm = DerWriter::Sequence({
        DerWriter::ObjectIdentifier(RSA_ENCRYPTION_OID),
        DerWriter::Null()});
    return Result<Bytes, KeywardFailure>::Ok(DerWriter::Sequence({
        algorithm,
        DerWriter::BitString(rsa_public.Unwrap())}));
}

Result<std::string, KeywardFailure> KeyCodec::EncodePublicKeyPem(const RsaPublicKey& key) {
    auto der = EncodePublicKeyDer(key);
    if (der.IsErr()) {
        return std::move(der).PropagateErr<std::string>();
    }
    return Result<std::string, KeywardFailure>::Ok(Pem::Encode(PemLabel::PUBLIC_KEY, der.Unwrap()));
}

Result<std::string, KeywardFailure> KeyCodec::EncodePrivateKeyPem(const RsaPrivateKey& key) {
    if (auto valid = ValidatePublicComponents(key.modulus, key.public_exponent); valid.IsErr()) {
        return std::move(valid).PropagateErr<std::string>();
    }
    if (key.private_exponent.IsNegative() || key.private_exponent.IsZero()) {
        return Result<std::string, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("privateExponent", "RSA private exponent must be positive"));
    }

    Result<Bytes, KeywardFailure> rsa_private = Result<Bytes, KeywardFailure>::Ok({});
    if (key.HasCrtParameters()) {
        rsa_private = EncodeRsaPrivateKeyDer(key);
    } else {
        auto completed = key.Clone();
        if (completed.IsErr()) {
            return std::move(completed).PropagateErr<std::string>();
        }
        RsaPrivateKey& full = completed.Unwrap();
        if (auto crt = full.WithCrtParameters(); crt.IsErr()) {
            return Result<std::string, KeywardFailure>::Err(
                KeywardFailure::KeyFormat("coefficient", crt.UnwrapErr().message));
        }
        rsa_private = EncodeRsaPrivateKeyDer(full);
    }
    if (rsa_private.IsErr()) {
        return std::move(rsa_private).PropagateErr<std::string>();
    }
    Bytes& inner = rsa_private.Unwrap();
    WipeOnExit wipe_inner(inner);

    const Bytes algorithm = DerWriter::Sequence({
        DerWriter::ObjectIdentifier(RSA_ENCRYPTION_OID),
        DerWriter::Null()});
    Bytes octets = DerWriter::OctetString(inner);
    WipeOnExit wipe_octets(octets);
    Bytes pkcs8 = DerWriter::Sequence({DerWriter::SmallInteger(0), algorithm, octets});
    WipeOnExit wipe_pkcs8(pkcs8);
    return Result<std::string, KeywardFailure>::Ok(Pem::Encode(PemLabel::PRIVATE_KEY, pkcs8));
}

Result<RsaPublicKey, KeywardFailure> KeyCodec::DecodeRsaPublicKey(std::span<const uint8_t> der) {
    DerReader top(der);
    auto sequence = top.ExpectSequence("rsaPublicKey");
    if (sequence.IsErr()) {
        return std::move(sequence).PropagateErr<RsaPublicKey>();
    }
    DerReader& reader = sequence.Unwrap();
    auto modulus = reader.ExpectInteger("modulus");
    if (modulus.IsErr()) {
        return std::move(modulus).PropagateErr<RsaPublicKey>();
    }
    auto exponent = reader.ExpectInteger("publicExponent");
    if (exponent.IsErr()) {
        return std::move(exponent).PropagateErr<RsaPublicKey>();
    }
    if (auto end = reader.ExpectEnd("rsaPublicKey"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPublicKey>();
    }
    if (auto end = top.ExpectEnd("rsaPublicKey"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPublicKey>();
    }
    if (auto valid = ValidatePublicComponents(modulus.Unwrap(), exponent.Unwrap()); valid.IsErr()) {
        return std::move(valid).PropagateErr<RsaPublicKey>();
    }
    return Result<RsaPublicKey, KeywardFailure>::Ok(
        RsaPublicKey{std::move(modulus).Unwrap(), std::move(exponent).Unwrap()});
}

Result<RsaPublicKey, KeywardFailure> KeyCodec::DecodeSubjectPublicKeyInfo(std::span<const uint8_t> der) {
    DerReader top(der);
    auto sequence = top.ExpectSequence("subjectPublicKeyInfo");
    if (sequence.IsErr()) {
        return std::move(sequence).PropagateErr<RsaPublicKey>();
    }
    DerReader& reader = sequence.Unwrap();
    if (auto algorithm = ExpectRsaAlgorithm(reader); algorithm.IsErr()) {
        return std::move(algorithm).PropagateErr<RsaPublicKey>();
    }
    auto bit_string = reader.Expect(DerTag::BIT_STRING, "subjectPublicKey");
    if (bit_string.IsErr()) {
        return std::move(bit_string).PropagateErr<RsaPublicKey>();
    }
    const auto bits = bit_string.Unwrap();
    if (bits.empty() || bits[0] != 0x00) {
        return Result<RsaPublicKey, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("subjectPublicKey", "BIT STRING must have zero unused bits"));
    }
    if (auto end = reader.ExpectEnd("subjectPublicKeyInfo"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPublicKey>();
    }
    if (auto end = top.ExpectEnd("subjectPublicKeyInfo"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPublicKey>();
    }
    return DecodeRsaPublicKey(bits.subspan(1));
}

Result<RsaPublicKey, KeywardFailure> KeyCodec::DecodePublicKeyPem(std::string_view pem) {
    auto block = Pem::Decode(pem);
    if (block.IsErr()) {
        return std::move(block).PropagateErr<RsaPublicKey>();
    }
    const PemBlock& decoded = block.Unwrap();
    if (decoded.label == PemLabel::PUBLIC_KEY) {
        return DecodeSubjectPublicKeyInfo(decoded.der);
    }
    if (decoded.label == PemLabel::RSA_PUBLIC_KEY) {
        return DecodeRsaPublicKey(decoded.der);
    }
    return Result<RsaPublicKey, KeywardFailure>::Err(
        KeywardFailure::KeyFormat("pemHeader",
            compat::format("Unexpected PEM label '{}' for a public key", decoded.label)));
}

Result<RsaPrivateKey, KeywardFailure> KeyCodec::DecodeRsaPrivateKey(std::span<const uint8_t> der) {
    DerReader top(der);
    auto sequence = top.ExpectSequence("rsaPrivateKey");
    if (sequence.IsErr()) {
        return std::move(sequence).PropagateErr<RsaPrivateKey>();
    }
    DerReader& reader = sequence.Unwrap();
    auto version = reader.ExpectInteger("version");
    if (version.IsErr()) {
        return std::move(version).PropagateErr<RsaPrivateKey>();
    }
    if (!version.Unwrap().IsZero()) {
        return Result<RsaPrivateKey, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("version", "Only two-prime RSAPrivateKey (version 0) is supported"));
    }

    constexpr const char* names[] = {
        "modulus", "publicExponent", "privateExponent", "prime1", "prime2",
        "exponent1", "exponent2", "coefficient"};
    std::vector<BigNum> values;
    values.reserve(std::size(names));
    for (const char* name : names) {
        auto value = reader.ExpectInteger(name);
        if (value.IsErr()) {
            return std::move(value).PropagateErr<RsaPrivateKey>();
        }
        values.push_back(std::move(value).Unwrap());
    }
    if (auto end = reader.ExpectEnd("rsaPrivateKey"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPrivateKey>();
    }
    if (auto end = top.ExpectEnd("rsaPrivateKey"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPrivateKey>();
    }
    if (auto valid = ValidatePublicComponents(values[0], values[1]); valid.IsErr()) {
        return std::move(valid).PropagateErr<RsaPrivateKey>();
    }
    for (size_t i = 2; i < values.size(); ++i) {
        if (values[i].IsNegative() || values[i].IsZero()) {
            return Result<RsaPrivateKey, KeywardFailure>::Err(
                KeywardFailure::KeyFormat(names[i], "RSA private component must be positive"));
        }
    }
    return Result<RsaPrivateKey, KeywardFailure>::Ok(RsaPrivateKey{
        std::move(values[0]), std::move(values[1]), std::move(values[2]),
        std::move(values[3]), std::move(values[4]),
        std::move(values[5]), std::move(values[6]), std::move(values[7])});
}

Result<RsaPrivateKey, KeywardFailure> KeyCodec::DecodePkcs8(std::span<const uint8_t> der) {
    DerReader top(der);
    auto sequence = top.ExpectSequence("privateKeyInfo");
    if (sequence.IsErr()) {
        return std::move(sequence).PropagateErr<RsaPrivateKey>();
    }
    DerReader& reader = sequence.Unwrap();
    auto version = reader.ExpectInteger("version");
    if (version.IsErr()) {
        return std::move(version).PropagateErr<RsaPrivateKey>();
    }
    if (!version.Unwrap().IsZero()) {
        return Result<RsaPrivateKey, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("version", "Unsupported PKCS8 version"));
    }
    if (auto algorithm = ExpectRsaAlgorithm(reader); algorithm.IsErr()) {
        return std::move(algorithm).PropagateErr<RsaPrivateKey>();
    }
    auto octets = reader.Expect(DerTag::OCTET_STRING, "privateKey");
    if (octets.IsErr()) {
        return std::move(octets).PropagateErr<RsaPrivateKey>();
    }
    if (auto end = top.ExpectEnd("privateKeyInfo"); end.IsErr()) {
        return std::move(end).PropagateErr<RsaPrivateKey>();
    }
    return DecodeRsaPrivateKey(octets.Unwrap());
}

Result<RsaPrivateKey, KeywardFailure> KeyCodec::DecodePrivateKeyPem(std::string_view pem) {
    auto block = Pem::Decode(pem);
    if (block.IsErr()) {
        return std::move(block).PropagateErr<RsaPrivateKey>();
    }
    PemBlock& decoded = block.Unwrap();
    WipeOnExit wipe(decoded.der);
    if (decoded.label == PemLabel::PRIVATE_KEY) {
        return DecodePkcs8(decoded.der);
    }
    if (decoded.label == PemLabel::RSA_PRIVATE_KEY) {
        return DecodeRsaPrivateKey(decoded.der);
    }
    return Result<RsaPrivateKey, KeywardFailure>::Err(
        KeywardFailure::KeyFormat("pemHeader",
            compat::format("Unexpected PEM label '{}' for a private key", decoded.label)));
}

} // namespace keyward::codec
