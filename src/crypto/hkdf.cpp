#include "keyward/crypto/hkdf.hpp"
#include "keyward/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <sodium.h>

namespace keyward::crypto {

namespace {
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;
}

Result<Unit, KeywardFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("HKDF output size must be in 1..{}, got {}", MAX_OUTPUT_LEN, output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }
    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        sodium_memzero(output.data(), output.size());
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::DeriveKey("HKDF key derivation failed"));
    }

    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, KeywardFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    if (auto result = DeriveKey(ikm, output, salt, info); result.IsErr()) {
        return std::move(result).PropagateErr<std::vector<uint8_t>>();
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(output));
}

} // namespace keyward::crypto
