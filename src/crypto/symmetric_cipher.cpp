#include "keyward/crypto/symmetric_cipher.hpp"
#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"

namespace keyward::crypto {

using models::EncryptedEnvelope;

namespace {
    bool IsValidUtf8(std::span<const uint8_t> bytes) {
        size_t i = 0;
        while (i < bytes.size()) {
            const uint8_t lead = bytes[i];
            size_t extra = 0;
            uint32_t code_point = 0;
            if (lead < 0x80) {
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                code_point = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                code_point = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                code_point = lead & 0x07;
            } else {
                return false;
            }
            if (i + extra >= bytes.size()) {
                return false;
            }
            for (size_t k = 1; k <= extra; ++k) {
                if ((bytes[i + k] & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (bytes[i + k] & 0x3F);
            }
            const bool overlong = (extra == 1 && code_point < 0x80)
                || (extra == 2 && code_point < 0x800)
                || (extra == 3 && code_point < 0x10000);
            if (overlong || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }
}

Result<EncryptedEnvelope, KeywardFailure> SymmetricCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> associated_data) {
    std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = AesGcm::Encrypt(key, nonce, plaintext, associated_data);
    if (sealed.IsErr()) {
        return std::move(sealed).PropagateErr<EncryptedEnvelope>();
    }
    auto [ciphertext, tag] = std::move(sealed).Unwrap();
    EncryptedEnvelope envelope;
    envelope.ciphertext = std::move(ciphertext);
    envelope.nonce = std::move(nonce);
    envelope.tag = std::move(tag);
    return Result<EncryptedEnvelope, KeywardFailure>::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, KeywardFailure> SymmetricCipher::Decrypt(
    const EncryptedEnvelope& envelope,
    std::span<const uint8_t> key,
    std::span<const uint8_t> associated_data) {
    return AesGcm::Decrypt(key, envelope.nonce, envelope.ciphertext, envelope.tag, associated_data);
}

Result<EncryptedEnvelope, KeywardFailure> SymmetricCipher::EncryptText(
    std::string_view plaintext,
    std::span<const uint8_t> key) {
    return Encrypt(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()),
        key);
}

Result<std::string, KeywardFailure> SymmetricCipher::DecryptText(
    const EncryptedEnvelope& envelope,
    std::span<const uint8_t> key,
    std::span<const uint8_t> associated_data) {
    auto opened = Decrypt(envelope, key, associated_data);
    if (opened.IsErr()) {
        return std::move(opened).PropagateErr<std::string>();
    }
    std::vector<uint8_t> bytes = std::move(opened).Unwrap();
    if (!IsValidUtf8(bytes)) {
        sodium_memzero(bytes.data(), bytes.size());
        return Result<std::string, KeywardFailure>::Err(
            KeywardFailure::Decode("Decrypted payload is not valid UTF-8"));
    }
    std::string text(bytes.begin(), bytes.end());
    sodium_memzero(bytes.data(), bytes.size());
    return Result<std::string, KeywardFailure>::Ok(std::move(text));
}

std::vector<uint8_t> SymmetricCipher::GenerateKey() {
    return SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
}

} // namespace keyward::crypto
