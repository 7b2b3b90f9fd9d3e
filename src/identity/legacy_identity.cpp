#include "keyward/identity/legacy_identity.hpp"
#include "keyward/codec/key_codec.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/rsa_oaep.hpp"
#include "keyward/debug/logger.hpp"
#include <nlohmann/json.hpp>

namespace keyward::identity {

using codec::KeyCodec;
using crypto::RsaOaep;
using models::LegacyRsaIdentity;
using models::LegacyRsaKeyPair;
using json = nlohmann::json;

namespace {
    constexpr std::string_view kComponent = "legacy-identity";
    constexpr const char* kVersionField = "version";
    constexpr const char* kTypeField = "type";
    constexpr const char* kPrivateField = "private_key_pem";
    constexpr const char* kPublicField = "public_key_pem";

    Result<std::string, KeywardFailure> RequireString(const json& doc, const char* name) {
        const auto it = doc.find(name);
        if (it == doc.end() || !it->is_string()) {
            return Result<std::string, KeywardFailure>::Err(KeywardFailure::Decode(
                compat::format("Legacy export field '{}' is missing or not a string", name)));
        }
        return Result<std::string, KeywardFailure>::Ok(it->get<std::string>());
    }
}

Result<LegacyRsaIdentity, KeywardFailure> LegacyIdentity::Generate(const int modulus_bits) {
    auto private_result = RsaOaep::GenerateKeyPair(modulus_bits);
    if (private_result.IsErr()) {
        return std::move(private_result).PropagateErr<LegacyRsaIdentity>();
    }
    const auto& private_key = private_result.Unwrap();
    auto public_result = private_key.PublicKey();
    if (public_result.IsErr()) {
        return std::move(public_result).PropagateErr<LegacyRsaIdentity>();
    }

    auto private_pem = KeyCodec::EncodePrivateKeyPem(private_key);
    if (private_pem.IsErr()) {
        return std::move(private_pem).PropagateErr<LegacyRsaIdentity>();
    }
    auto public_pem = KeyCodec::EncodePublicKeyPem(public_result.Unwrap());
    if (public_pem.IsErr()) {
        return std::move(public_pem).PropagateErr<LegacyRsaIdentity>();
    }
    KEYWARD_LOG_INFO(kComponent, "generated RSA-{} legacy identity", modulus_bits);
    return Result<LegacyRsaIdentity, KeywardFailure>::Ok(
        LegacyRsaIdentity{std::move(private_pem).Unwrap(), std::move(public_pem).Unwrap()});
}

Result<LegacyRsaKeyPair, KeywardFailure> LegacyIdentity::Decode(const LegacyRsaIdentity& identity) {
    auto private_key = KeyCodec::DecodePrivateKeyPem(identity.private_key_pem);
    if (private_key.IsErr()) {
        return std::move(private_key).PropagateErr<LegacyRsaKeyPair>();
    }
    auto public_key = KeyCodec::DecodePublicKeyPem(identity.public_key_pem);
    if (public_key.IsErr()) {
        return std::move(public_key).PropagateErr<LegacyRsaKeyPair>();
    }
    const auto& priv = private_key.Unwrap();
    const auto& pub = public_key.Unwrap();
    if (priv.modulus.Compare(pub.modulus) != 0) {
        return Result<LegacyRsaKeyPair, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("modulus", "Legacy public key does not match the private key"));
    }
    if (priv.public_exponent.Compare(pub.public_exponent) != 0) {
        return Result<LegacyRsaKeyPair, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("publicExponent", "Legacy public key does not match the private key"));
    }
    return Result<LegacyRsaKeyPair, KeywardFailure>::Ok(
        LegacyRsaKeyPair{std::move(private_key).Unwrap(), std::move(public_key).Unwrap()});
}

Result<std::string, KeywardFailure> LegacyIdentity::ExportJson(const LegacyRsaIdentity& identity) {
    if (auto decoded = Decode(identity); decoded.IsErr()) {
        return std::move(decoded).PropagateErr<std::string>();
    }
    json doc;
    doc[kVersionField] = LegacyExportConstants::VERSION;
    doc[kTypeField] = std::string(LegacyExportConstants::TYPE);
    doc[kPrivateField] = identity.private_key_pem;
    doc[kPublicField] = identity.public_key_pem;
    return Result<std::string, KeywardFailure>::Ok(doc.dump());
}

Result<LegacyRsaIdentity, KeywardFailure> LegacyIdentity::ImportJson(const std::string_view text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<LegacyRsaIdentity, KeywardFailure>::Err(
            KeywardFailure::Decode("Legacy export is not a JSON object"));
    }
    const auto version = doc.find(kVersionField);
    if (version == doc.end() || !version->is_number_integer()
        || version->get<int>() != LegacyExportConstants::VERSION) {
        return Result<LegacyRsaIdentity, KeywardFailure>::Err(KeywardFailure::Decode(
            compat::format("Unsupported legacy export version (expected {})", LegacyExportConstants::VERSION)));
    }
    auto type = RequireString(doc, kTypeField);
    if (type.IsErr()) {
        return std::move(type).PropagateErr<LegacyRsaIdentity>();
    }
    if (type.Unwrap() != LegacyExportConstants::TYPE) {
        return Result<LegacyRsaIdentity, KeywardFailure>::Err(KeywardFailure::Decode(
            compat::format("Unexpected legacy export type '{}'", type.Unwrap())));
    }
    auto private_pem = RequireString(doc, kPrivateField);
    if (private_pem.IsErr()) {
        return std::move(private_pem).PropagateErr<LegacyRsaIdentity>();
    }
    auto public_pem = RequireString(doc, kPublicField);
    if (public_pem.IsErr()) {
        return std::move(public_pem).PropagateErr<LegacyRsaIdentity>();
    }

    LegacyRsaIdentity identity{std::move(private_pem).Unwrap(), std::move(public_pem).Unwrap()};
    if (auto decoded = Decode(identity); decoded.IsErr()) {
        return std::move(decoded).PropagateErr<LegacyRsaIdentity>();
    }
    return Result<LegacyRsaIdentity, KeywardFailure>::Ok(std::move(identity));
}

} // namespace keyward::identity
