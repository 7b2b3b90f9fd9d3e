#pragma once

#include "keyward/core/constants.hpp"

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <memory>
#include <string>

namespace keyward::crypto::detail {

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};
struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const {
        if (ctx) {
            EVP_PKEY_CTX_free(ctx);
        }
    }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const {
        if (ctx) {
            BN_CTX_free(ctx);
        }
    }
};
struct OsslParamBldDeleter {
    void operator()(OSSL_PARAM_BLD* bld) const {
        if (bld) {
            OSSL_PARAM_BLD_free(bld);
        }
    }
};
struct OsslParamDeleter {
    void operator()(OSSL_PARAM* params) const {
        if (params) {
            OSSL_PARAM_free(params);
        }
    }
};

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using OsslParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, OsslParamBldDeleter>;
using OsslParamPtr = std::unique_ptr<OSSL_PARAM, OsslParamDeleter>;

inline std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}

} // namespace keyward::crypto::detail
