#include "keyward/crypto/rsa_oaep.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "openssl_support.hpp"

#include <openssl/core_names.h>
#include <openssl/rsa.h>
#include <iterator>

namespace keyward::crypto {

using OpenSSL = OpenSSLConstants;
using models::RsaPrivateKey;
using models::RsaPublicKey;
using detail::EvpPkeyCtxPtr;
using detail::EvpPkeyPtr;
using detail::GetOpenSSLError;
using detail::OsslParamBldPtr;
using detail::OsslParamPtr;

namespace {
    Result<EvpPkeyPtr, KeywardFailure> FromData(OSSL_PARAM_BLD* bld, const int selection) {
        OsslParamPtr params(OSSL_PARAM_BLD_to_param(bld));
        if (!params) {
            return Result<EvpPkeyPtr, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to build RSA parameters: {}", GetOpenSSLError())));
        }
        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
        EVP_PKEY* raw = nullptr;
        if (!ctx
            || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSL::SUCCESS
            || EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) != OpenSSL::SUCCESS) {
            return Result<EvpPkeyPtr, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("RSA key components were rejected: {}", GetOpenSSLError())));
        }
        return Result<EvpPkeyPtr, KeywardFailure>::Ok(EvpPkeyPtr(raw));
    }

    Result<EvpPkeyPtr, KeywardFailure> ToPublicPkey(const RsaPublicKey& key) {
        OsslParamBldPtr bld(OSSL_PARAM_BLD_new());
        if (!bld
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, key.modulus.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, key.public_exponent.Get()) != OpenSSL::SUCCESS) {
            return Result<EvpPkeyPtr, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to stage RSA public key: {}", GetOpenSSLError())));
        }
        return FromData(bld.get(), EVP_PKEY_PUBLIC_KEY);
    }

    Result<EvpPkeyPtr, KeywardFailure> ToPrivatePkey(const RsaPrivateKey& key) {
        if (!key.HasCrtParameters()) {
            auto completed = key.Clone();
            if (completed.IsErr()) {
                return std::move(completed).PropagateErr<EvpPkeyPtr>();
            }
            auto& full = completed.Unwrap();
            if (auto crt = full.WithCrtParameters(); crt.IsErr()) {
                return std::move(crt).PropagateErr<EvpPkeyPtr>();
            }
            return ToPrivatePkey(full);
        }
        OsslParamBldPtr bld(OSSL_PARAM_BLD_new());
        if (!bld
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, key.modulus.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, key.public_exponent.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_D, key.private_exponent.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR1, key.prime1.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR2, key.prime2.Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT1, key.exponent1->Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT2, key.exponent2->Get()) != OpenSSL::SUCCESS
            || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_COEFFICIENT1, key.coefficient->Get()) != OpenSSL::SUCCESS) {
            return Result<EvpPkeyPtr, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to stage RSA private key: {}", GetOpenSSLError())));
        }
        return FromData(bld.get(), EVP_PKEY_KEYPAIR);
    }

    Result<BigNum, KeywardFailure> ExtractComponent(const EVP_PKEY* pkey, const char* name) {
        BIGNUM* raw = nullptr;
        if (EVP_PKEY_get_bn_param(pkey, name, &raw) != OpenSSL::SUCCESS || raw == nullptr) {
            return Result<BigNum, KeywardFailure>::Err(
                KeywardFailure::KeyGeneration(
                    compat::format("Generated RSA key lacks component '{}'", name)));
        }
        return Result<BigNum, KeywardFailure>::Ok(BigNum::Adopt(raw));
    }

    Result<Unit, KeywardFailure> ConfigureOaep(EVP_PKEY_CTX* ctx) {
        if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0
            || EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0
            || EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::Generic(
                    compat::format("Failed to configure RSA-OAEP SHA-256: {}", GetOpenSSLError())));
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }
}

Result<RsaPrivateKey, KeywardFailure> RsaOaep::GenerateKeyPair(const int modulus_bits) {
    if (modulus_bits < RsaConstants::MIN_KEY_BITS) {
        return Result<RsaPrivateKey, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("RSA modulus must be at least {} bits, got {}",
                    RsaConstants::MIN_KEY_BITS, modulus_bits)));
    }
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    EVP_PKEY* raw = nullptr;
    if (!ctx
        || EVP_PKEY_keygen_init(ctx.get()) != OpenSSL::SUCCESS
        || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), modulus_bits) <= 0
        || EVP_PKEY_generate(ctx.get(), &raw) != OpenSSL::SUCCESS) {
        return Result<RsaPrivateKey, KeywardFailure>::Err(
            KeywardFailure::KeyGeneration(
                compat::format("RSA-{} key generation failed: {}", modulus_bits, GetOpenSSLError())));
    }
    EvpPkeyPtr pkey(raw);

    const char* names[] = {
        OSSL_PKEY_PARAM_RSA_N, OSSL_PKEY_PARAM_RSA_E, OSSL_PKEY_PARAM_RSA_D,
        OSSL_PKEY_PARAM_RSA_FACTOR1, OSSL_PKEY_PARAM_RSA_FACTOR2,
        OSSL_PKEY_PARAM_RSA_EXPONENT1, OSSL_PKEY_PARAM_RSA_EXPONENT2,
        OSSL_PKEY_PARAM_RSA_COEFFICIENT1};
    std::vector<BigNum> components;
    components.reserve(std::size(names));
    for (const char* name : names) {
        auto component = ExtractComponent(pkey.get(), name);
        if (component.IsErr()) {
            return std::move(component).PropagateErr<RsaPrivateKey>();
        }
        components.push_back(std::move(component).Unwrap());
    }
    return Result<RsaPrivateKey, KeywardFailure>::Ok(RsaPrivateKey{
        std::move(components[0]), std::move(components[1]), std::move(components[2]),
        std::move(components[3]), std::move(components[4]),
        std::move(components[5]), std::move(components[6]), std::move(components[7])});
}

size_t RsaOaep::MaxPlaintextSize(const int modulus_bits) noexcept {
    const size_t modulus_bytes = static_cast<size_t>((modulus_bits + 7) / 8);
    if (modulus_bytes <= RsaConstants::OAEP_SHA256_OVERHEAD) {
        return 0;
    }
    return modulus_bytes - RsaConstants::OAEP_SHA256_OVERHEAD;
}

Result<std::vector<uint8_t>, KeywardFailure> RsaOaep::Encrypt(
    const RsaPublicKey& key,
    std::span<const uint8_t> plaintext) {
    if (plaintext.size() > MaxPlaintextSize(key.ModulusBits())) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Plaintext of {} bytes exceeds RSA-OAEP capacity of {} bytes",
                    plaintext.size(), MaxPlaintextSize(key.ModulusBits()))));
    }
    auto pkey_result = ToPublicPkey(key);
    if (pkey_result.IsErr()) {
        return std::move(pkey_result).PropagateErr<std::vector<uint8_t>>();
    }
    EvpPkeyPtr pkey = std::move(pkey_result).Unwrap();
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to initialize RSA encryption: {}", GetOpenSSLError())));
    }
    if (auto oaep = ConfigureOaep(ctx.get()); oaep.IsErr()) {
        return std::move(oaep).PropagateErr<std::vector<uint8_t>>();
    }
    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> ciphertext(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len, plaintext.data(), plaintext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("RSA-OAEP encryption failed: {}", GetOpenSSLError())));
    }
    ciphertext.resize(out_len);
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, KeywardFailure> RsaOaep::Decrypt(
    const RsaPrivateKey& key,
    std::span<const uint8_t> ciphertext) {
    auto pkey_result = ToPrivatePkey(key);
    if (pkey_result.IsErr()) {
        return std::move(pkey_result).PropagateErr<std::vector<uint8_t>>();
    }
    EvpPkeyPtr pkey = std::move(pkey_result).Unwrap();
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("Failed to initialize RSA decryption: {}", GetOpenSSLError())));
    }
    if (auto oaep = ConfigureOaep(ctx.get()); oaep.IsErr()) {
        return std::move(oaep).PropagateErr<std::vector<uint8_t>>();
    }
    size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Decode(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len, ciphertext.data(), ciphertext.size()) != OpenSSL::SUCCESS) {
        ERR_clear_error();
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::AuthenticationFailed("RSA-OAEP decryption failed"));
    }
    plaintext.resize(out_len);
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(plaintext));
}

} // namespace keyward::crypto
