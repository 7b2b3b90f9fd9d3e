#include "keyward/models/encrypted_envelope.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/format.hpp"

#include <nlohmann/json.hpp>

namespace keyward::models {

using crypto::SodiumInterop;
using json = nlohmann::json;

namespace {
    constexpr const char* kContentField = "encrypted_content";
    constexpr const char* kKeyField = "encrypted_key";
    constexpr const char* kNonceField = "iv";
    constexpr const char* kTagField = "tag";

    Result<std::vector<uint8_t>, KeywardFailure> ReadBase64Field(const json& doc, const char* name) {
        const auto it = doc.find(name);
        if (it == doc.end() || !it->is_string()) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::Decode(
                    compat::format("Envelope field '{}' is missing or not a string", name)));
        }
        auto decoded = SodiumInterop::FromBase64(it->get<std::string>());
        if (decoded.IsErr()) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::Decode(
                    compat::format("Envelope field '{}' is not valid base64", name)));
        }
        return decoded;
    }
}

std::string EncryptedEnvelope::ToJson() const {
    json doc;
    doc[kContentField] = SodiumInterop::ToBase64(ciphertext);
    doc[kNonceField] = SodiumInterop::ToBase64(nonce);
    doc[kTagField] = SodiumInterop::ToBase64(tag);
    if (encrypted_key.has_value()) {
        doc[kKeyField] = SodiumInterop::ToBase64(*encrypted_key);
    }
    return doc.dump();
}

Result<EncryptedEnvelope, KeywardFailure> EncryptedEnvelope::FromJson(std::string_view text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<EncryptedEnvelope, KeywardFailure>::Err(
            KeywardFailure::Decode("Envelope is not a JSON object"));
    }

    EncryptedEnvelope envelope;
    auto ciphertext = ReadBase64Field(doc, kContentField);
    if (ciphertext.IsErr()) {
        return std::move(ciphertext).PropagateErr<EncryptedEnvelope>();
    }
    envelope.ciphertext = std::move(ciphertext).Unwrap();

    auto nonce = ReadBase64Field(doc, kNonceField);
    if (nonce.IsErr()) {
        return std::move(nonce).PropagateErr<EncryptedEnvelope>();
    }
    envelope.nonce = std::move(nonce).Unwrap();

    auto tag = ReadBase64Field(doc, kTagField);
    if (tag.IsErr()) {
        return std::move(tag).PropagateErr<EncryptedEnvelope>();
    }
    envelope.tag = std::move(tag).Unwrap();

    if (doc.contains(kKeyField) && !doc[kKeyField].is_null()) {
        auto key = ReadBase64Field(doc, kKeyField);
        if (key.IsErr()) {
            return std::move(key).PropagateErr<EncryptedEnvelope>();
        }
        envelope.encrypted_key = std::move(key).Unwrap();
    }
    return Result<EncryptedEnvelope, KeywardFailure>::Ok(std::move(envelope));
}

} // namespace keyward::models
