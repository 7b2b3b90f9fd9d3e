#include "keyward/crypto/big_num.hpp"
#include "keyward/core/format.hpp"
#include "openssl_support.hpp"

namespace keyward::crypto {

using detail::BnCtxPtr;
using detail::GetOpenSSLError;

namespace {
    Result<BigNum, KeywardFailure> AllocationFailure(std::string_view what) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::Generic(
                compat::format("BIGNUM {} failed: {}", what, GetOpenSSLError())));
    }
}

BigNum::BigNum() : bn_(BN_new()) {}

BigNum BigNum::Adopt(BIGNUM* raw) {
    return BigNum(raw);
}

Result<BigNum, KeywardFailure> BigNum::FromUnsignedBytes(std::span<const uint8_t> bytes) {
    BIGNUM* raw = BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr);
    if (raw == nullptr) {
        return AllocationFailure("decode");
    }
    return Result<BigNum, KeywardFailure>::Ok(BigNum(raw));
}

Result<BigNum, KeywardFailure> BigNum::FromTwosComplement(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::Decode("Integer content must not be empty"));
    }
    auto magnitude = FromUnsignedBytes(bytes);
    if (magnitude.IsErr() || (bytes.front() & 0x80) == 0) {
        return magnitude;
    }
    BigNum value = std::move(magnitude).Unwrap();
    BigNum modulus;
    if (modulus.bn_ == nullptr
        || BN_set_bit(modulus.bn_.get(), static_cast<int>(bytes.size() * 8)) != 1) {
        return AllocationFailure("shift");
    }
    BigNum negative;
    if (negative.bn_ == nullptr
        || BN_sub(negative.bn_.get(), value.bn_.get(), modulus.bn_.get()) != 1) {
        return AllocationFailure("subtract");
    }
    return Result<BigNum, KeywardFailure>::Ok(std::move(negative));
}

Result<BigNum, KeywardFailure> BigNum::FromWord(const uint64_t value) {
    BigNum result;
    if (result.bn_ == nullptr || BN_set_word(result.bn_.get(), static_cast<BN_ULONG>(value)) != 1) {
        return AllocationFailure("set_word");
    }
    return Result<BigNum, KeywardFailure>::Ok(std::move(result));
}

Result<BigNum, KeywardFailure> BigNum::Clone() const {
    BIGNUM* copy = BN_dup(bn_.get());
    if (copy == nullptr) {
        return AllocationFailure("dup");
    }
    return Result<BigNum, KeywardFailure>::Ok(BigNum(copy));
}

std::vector<uint8_t> BigNum::ToUnsignedBytes() const {
    std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(bn_.get())));
    if (!bytes.empty()) {
        BN_bn2bin(bn_.get(), bytes.data());
    }
    return bytes;
}

Result<std::vector<uint8_t>, KeywardFailure> BigNum::ToUnsignedBytesPadded(const size_t width) const {
    std::vector<uint8_t> bytes(width);
    if (BN_bn2binpad(bn_.get(), bytes.data(), static_cast<int>(width)) < 0) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Encode(
                compat::format("Integer of {} bits does not fit in {} bytes", BitCount(), width)));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(bytes));
}

Result<std::vector<uint8_t>, KeywardFailure> BigNum::ToTwosComplement() const {
    if (!IsNegative()) {
        std::vector<uint8_t> bytes = ToUnsignedBytes();
        if (bytes.empty() || (bytes.front() & 0x80) != 0) {
            bytes.insert(bytes.begin(), 0x00);
        }
        return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(bytes));
    }

    // -m is stored as 2^(8n) - m, with n the smallest width keeping the sign bit set.
    size_t width = static_cast<size_t>(BN_num_bytes(bn_.get()));
    BigNum magnitude;
    if (magnitude.bn_ == nullptr || BN_copy(magnitude.bn_.get(), bn_.get()) == nullptr) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Encode("Failed to copy integer"));
    }
    BN_set_negative(magnitude.bn_.get(), 0);
    for (int attempt = 0; attempt < 2; ++attempt, ++width) {
        BigNum power;
        BigNum encoded;
        if (power.bn_ == nullptr || encoded.bn_ == nullptr
            || BN_set_bit(power.bn_.get(), static_cast<int>(width * 8)) != 1
            || BN_sub(encoded.bn_.get(), power.bn_.get(), magnitude.bn_.get()) != 1) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::Encode(
                    compat::format("Two's complement conversion failed: {}", GetOpenSSLError())));
        }
        if (static_cast<size_t>(encoded.BitCount()) == width * 8) {
            return encoded.ToUnsignedBytesPadded(width);
        }
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Err(
        KeywardFailure::Encode("Two's complement width search did not converge"));
}

bool BigNum::IsNegative() const noexcept {
    return BN_is_negative(bn_.get()) != 0;
}

bool BigNum::IsZero() const noexcept {
    return BN_is_zero(bn_.get()) != 0;
}

bool BigNum::IsOne() const noexcept {
    return BN_is_one(bn_.get()) != 0;
}

int BigNum::BitCount() const noexcept {
    return BN_num_bits(bn_.get());
}

int BigNum::Compare(const BigNum& other) const noexcept {
    return BN_cmp(bn_.get(), other.bn_.get());
}

Result<BigNum, KeywardFailure> BigNum::SubWord(const uint64_t word) const {
    auto copy = Clone();
    if (copy.IsErr()) {
        return copy;
    }
    BigNum result = std::move(copy).Unwrap();
    if (BN_sub_word(result.bn_.get(), static_cast<BN_ULONG>(word)) != 1) {
        return AllocationFailure("sub_word");
    }
    return Result<BigNum, KeywardFailure>::Ok(std::move(result));
}

Result<BigNum, KeywardFailure> BigNum::Mod(const BigNum& modulus) const {
    if (modulus.IsZero()) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Modulus must not be zero"));
    }
    BnCtxPtr ctx(BN_CTX_new());
    BigNum result;
    if (!ctx || result.bn_ == nullptr
        || BN_nnmod(result.bn_.get(), bn_.get(), modulus.bn_.get(), ctx.get()) != 1) {
        return AllocationFailure("nnmod");
    }
    return Result<BigNum, KeywardFailure>::Ok(std::move(result));
}

Result<BigNum, KeywardFailure> BigNum::ModInverse(const BigNum& modulus) const {
    if (modulus.IsZero()) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Modulus must not be zero"));
    }
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return AllocationFailure("context");
    }
    BIGNUM* inverse = BN_mod_inverse(nullptr, bn_.get(), modulus.bn_.get(), ctx.get());
    if (inverse == nullptr) {
        ERR_clear_error();
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Value has no inverse for the given modulus"));
    }
    return Result<BigNum, KeywardFailure>::Ok(BigNum(inverse));
}

} // namespace keyward::crypto
