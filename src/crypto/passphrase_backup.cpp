#include "keyward/crypto/passphrase_backup.hpp"
#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/logger.hpp"

#include <nlohmann/json.hpp>

namespace keyward::crypto {

using json = nlohmann::json;

namespace {
    constexpr size_t kKibibyte = 1024;

    Result<std::vector<uint8_t>, KeywardFailure> DeriveBackupKey(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const uint64_t ops_limit,
        const size_t mem_limit_bytes) {
        if (salt.size() != crypto_pwhash_SALTBYTES) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("Argon2id salt must be {} bytes, got {}", crypto_pwhash_SALTBYTES, salt.size())));
        }
        if (ops_limit < crypto_pwhash_OPSLIMIT_MIN || ops_limit > crypto_pwhash_OPSLIMIT_MAX
            || mem_limit_bytes < crypto_pwhash_MEMLIMIT_MIN || mem_limit_bytes > crypto_pwhash_MEMLIMIT_MAX) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("Argon2id limits out of range (ops {}, memory {} bytes)", ops_limit, mem_limit_bytes)));
        }
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE);
        if (crypto_pwhash(key.data(), key.size(),
                          passphrase.data(), passphrase.size(),
                          salt.data(),
                          ops_limit, mem_limit_bytes,
                          crypto_pwhash_ALG_ARGON2ID13) != 0) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::DeriveKey("Argon2id derivation failed (insufficient memory?)"));
        }
        return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(key));
    }

    template<typename T>
    Result<T, KeywardFailure> RequireField(const json& doc, const char* name) {
        const auto it = doc.find(name);
        if (it == doc.end()) {
            return Result<T, KeywardFailure>::Err(
                KeywardFailure::Decode(compat::format("Backup field '{}' is missing", name)));
        }
        try {
            return Result<T, KeywardFailure>::Ok(it->get<T>());
        } catch (const json::exception& ex) {
            return Result<T, KeywardFailure>::Err(
                KeywardFailure::Decode(compat::format("Backup field '{}' has the wrong type: {}", name, ex.what())));
        }
    }
}

Result<std::string, KeywardFailure> PassphraseBackup::Seal(
    std::span<const uint8_t> secret,
    std::string_view passphrase,
    const configuration::BackupKdfParams& params) {
    if (passphrase.empty()) {
        return Result<std::string, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Backup passphrase must not be empty"));
    }
    const std::vector<uint8_t> salt = SodiumInterop::GetRandomBytes(BackupConstants::SALT_SIZE);
    auto key_result = DeriveBackupKey(passphrase, salt, params.ops_limit, params.mem_limit_bytes);
    if (key_result.IsErr()) {
        return std::move(key_result).PropagateErr<std::string>();
    }
    std::vector<uint8_t> key = std::move(key_result).Unwrap();

    const std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = AesGcm::Encrypt(key, nonce, secret);
    sodium_memzero(key.data(), key.size());
    if (sealed.IsErr()) {
        return std::move(sealed).PropagateErr<std::string>();
    }
    const auto& box = sealed.Unwrap();

    std::vector<uint8_t> concatenated;
    concatenated.reserve(nonce.size() + box.ciphertext.size() + box.tag.size());
    concatenated.insert(concatenated.end(), nonce.begin(), nonce.end());
    concatenated.insert(concatenated.end(), box.ciphertext.begin(), box.ciphertext.end());
    concatenated.insert(concatenated.end(), box.tag.begin(), box.tag.end());

    json doc;
    doc["type"] = std::string(BackupConstants::KDF_TYPE);
    doc["salt"] = SodiumInterop::ToBase64(salt);
    doc["iterations"] = params.ops_limit;
    doc["memory"] = params.mem_limit_bytes / kKibibyte;
    doc["parallelism"] = BackupConstants::PARALLELISM;
    doc["hashLength"] = Constants::AES_KEY_SIZE;
    doc["nonceLength"] = Constants::AES_GCM_NONCE_SIZE;
    doc["macLength"] = Constants::AES_GCM_TAG_SIZE;
    doc["ciphertext"] = SodiumInterop::ToBase64(concatenated);
    return Result<std::string, KeywardFailure>::Ok(doc.dump());
}

Result<std::vector<uint8_t>, KeywardFailure> PassphraseBackup::Open(
    std::string_view backup_json,
    std::string_view passphrase) {
    using Bytes = std::vector<uint8_t>;
    const json doc = json::parse(backup_json, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<Bytes, KeywardFailure>::Err(
            KeywardFailure::Decode("Backup is not a JSON object"));
    }

    auto type = RequireField<std::string>(doc, "type");
    if (type.IsErr()) {
        return std::move(type).PropagateErr<Bytes>();
    }
    if (type.Unwrap() != BackupConstants::KDF_TYPE) {
        return Result<Bytes, KeywardFailure>::Err(
            KeywardFailure::Decode(compat::format("Unsupported backup KDF '{}'", type.Unwrap())));
    }

    auto iterations = RequireField<uint64_t>(doc, "iterations");
    auto memory_kib = RequireField<uint64_t>(doc, "memory");
    auto parallelism = RequireField<uint32_t>(doc, "parallelism");
    auto hash_length = RequireField<size_t>(doc, "hashLength");
    auto nonce_length = RequireField<size_t>(doc, "nonceLength");
    auto mac_length = RequireField<size_t>(doc, "macLength");
    auto salt_b64 = RequireField<std::string>(doc, "salt");
    auto ciphertext_b64 = RequireField<std::string>(doc, "ciphertext");
    if (iterations.IsErr()) return std::move(iterations).PropagateErr<Bytes>();
    if (memory_kib.IsErr()) return std::move(memory_kib).PropagateErr<Bytes>();
    if (parallelism.IsErr()) return std::move(parallelism).PropagateErr<Bytes>();
    if (hash_length.IsErr()) return std::move(hash_length).PropagateErr<Bytes>();
    if (nonce_length.IsErr()) return std::move(nonce_length).PropagateErr<Bytes>();
    if (mac_length.IsErr()) return std::move(mac_length).PropagateErr<Bytes>();
    if (salt_b64.IsErr()) return std::move(salt_b64).PropagateErr<Bytes>();
    if (ciphertext_b64.IsErr()) return std::move(ciphertext_b64).PropagateErr<Bytes>();

    if (parallelism.Unwrap() != BackupConstants::PARALLELISM
        || hash_length.Unwrap() != Constants::AES_KEY_SIZE
        || nonce_length.Unwrap() != Constants::AES_GCM_NONCE_SIZE
        || mac_length.Unwrap() != Constants::AES_GCM_TAG_SIZE) {
        return Result<Bytes, KeywardFailure>::Err(
            KeywardFailure::Decode("Backup parameters are not supported by this client"));
    }

    auto salt = SodiumInterop::FromBase64(salt_b64.Unwrap());
    if (salt.IsErr()) {
        return std::move(salt).PropagateErr<Bytes>();
    }
    auto blob = SodiumInterop::FromBase64(ciphertext_b64.Unwrap());
    if (blob.IsErr()) {
        return std::move(blob).PropagateErr<Bytes>();
    }
    const Bytes& payload = blob.Unwrap();
    if (payload.size() < Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return Result<Bytes, KeywardFailure>::Err(
            KeywardFailure::Decode("Backup ciphertext is truncated"));
    }

    auto key_result = DeriveBackupKey(passphrase, salt.Unwrap(),
        iterations.Unwrap(), static_cast<size_t>(memory_kib.Unwrap() * kKibibyte));
    if (key_result.IsErr()) {
        return std::move(key_result).PropagateErr<Bytes>();
    }
    Bytes key = std::move(key_result).Unwrap();

    const std::span<const uint8_t> all(payload);
    const auto nonce = all.first(Constants::AES_GCM_NONCE_SIZE);
    const auto tag = all.last(Constants::AES_GCM_TAG_SIZE);
    const auto ciphertext = all.subspan(
        Constants::AES_GCM_NONCE_SIZE,
        all.size() - Constants::AES_GCM_NONCE_SIZE - Constants::AES_GCM_TAG_SIZE);
    auto opened = AesGcm::Decrypt(key, nonce, ciphertext, tag);
    sodium_memzero(key.data(), key.size());
    if (opened.IsErr()) {
        KEYWARD_LOG_DEBUG("backup", "Seed backup rejected: {}", opened.UnwrapErr().message);
    }
    return opened;
}

} // namespace keyward::crypto
