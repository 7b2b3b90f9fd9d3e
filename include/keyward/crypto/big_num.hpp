#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"

#include <openssl/bn.h>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace keyward::crypto {

/**
 * @brief Move-only owner of an OpenSSL BIGNUM
 *
 * Provides the arbitrary-precision operations the RSA codec needs: unsigned
 * and two's complement byte conversion plus the arithmetic used to
 * reconstruct CRT parameters. Values holding private exponents are freed with
 * BN_clear_free.
 */
class BigNum {
public:
    BigNum();

    BigNum(BigNum&&) noexcept = default;
    BigNum& operator=(BigNum&&) noexcept = default;
    BigNum(const BigNum&) = delete;
    BigNum& operator=(const BigNum&) = delete;

    /// Unsigned big-endian magnitude.
    static Result<BigNum, KeywardFailure> FromUnsignedBytes(std::span<const uint8_t> bytes);

    /// Two's complement big-endian, as carried in DER INTEGER content.
    static Result<BigNum, KeywardFailure> FromTwosComplement(std::span<const uint8_t> bytes);

    static Result<BigNum, KeywardFailure> FromWord(uint64_t value);

    /// Takes ownership of a BIGNUM returned by OpenSSL.
    static BigNum Adopt(BIGNUM* raw);

    [[nodiscard]] Result<BigNum, KeywardFailure> Clone() const;

    /// Minimal unsigned big-endian bytes; zero yields an empty vector.
    [[nodiscard]] std::vector<uint8_t> ToUnsignedBytes() const;

    /// Left-pads the unsigned magnitude to `width` bytes.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> ToUnsignedBytesPadded(size_t width) const;

    /// Minimal two's complement: a positive value whose top byte has the high
    /// bit set gets a leading 0x00, negative values are sign-extended.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> ToTwosComplement() const;

    [[nodiscard]] bool IsNegative() const noexcept;
    [[nodiscard]] bool IsZero() const noexcept;
    [[nodiscard]] bool IsOne() const noexcept;
    [[nodiscard]] int BitCount() const noexcept;
    [[nodiscard]] int Compare(const BigNum& other) const noexcept;

    [[nodiscard]] Result<BigNum, KeywardFailure> SubWord(uint64_t word) const;

    /// Non-negative remainder of this modulo `modulus`.
    [[nodiscard]] Result<BigNum, KeywardFailure> Mod(const BigNum& modulus) const;

    [[nodiscard]] Result<BigNum, KeywardFailure> ModInverse(const BigNum& modulus) const;

    [[nodiscard]] const BIGNUM* Get() const noexcept { return bn_.get(); }

private:
    struct Deleter {
        void operator()(BIGNUM* bn) const {
            if (bn) {
                BN_clear_free(bn);
            }
        }
    };

    explicit BigNum(BIGNUM* raw) noexcept : bn_(raw) {}

    std::unique_ptr<BIGNUM, Deleter> bn_;
};

} // namespace keyward::crypto
