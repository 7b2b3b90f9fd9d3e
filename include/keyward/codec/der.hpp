#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/big_num.hpp"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace keyward::codec {

struct DerTag {
    static constexpr uint8_t INTEGER = 0x02;
    static constexpr uint8_t BIT_STRING = 0x03;
    static constexpr uint8_t OCTET_STRING = 0x04;
    static constexpr uint8_t NULL_VALUE = 0x05;
    static constexpr uint8_t OBJECT_IDENTIFIER = 0x06;
    static constexpr uint8_t SEQUENCE = 0x30;
};

/// DER encoding of OID 1.2.840.113549.1.1.1 (rsaEncryption), content bytes only.
inline constexpr uint8_t RSA_ENCRYPTION_OID[] = {0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x01};

/**
 * @brief Minimal DER writer for the RSA key structures
 *
 * Every function returns a complete TLV. INTEGER content is minimal two's
 * complement as produced by BigNum::ToTwosComplement.
 */
class DerWriter {
public:
    static std::vector<uint8_t> Element(uint8_t tag, std::span<const uint8_t> content);
    static Result<std::vector<uint8_t>, KeywardFailure> Integer(const crypto::BigNum& value);
    static std::vector<uint8_t> SmallInteger(uint8_t value);
    static std::vector<uint8_t> Sequence(std::initializer_list<std::span<const uint8_t>> children);
    static std::vector<uint8_t> Null();
    static std::vector<uint8_t> ObjectIdentifier(std::span<const uint8_t> encoded_oid);
    /// BIT STRING with zero unused bits.
    static std::vector<uint8_t> BitString(std::span<const uint8_t> bytes);
    static std::vector<uint8_t> OctetString(std::span<const uint8_t> bytes);

private:
    static void AppendLength(std::vector<uint8_t>& out, size_t length);
    DerWriter() = delete;
};

struct DerElement {
    uint8_t tag;
    std::span<const uint8_t> content;
};

/**
 * @brief Forward-only DER reader over a borrowed buffer
 *
 * Expect() failures are KeyFormat failures naming the field being read, so
 * callers can report exactly which part of a key was malformed.
 */
class DerReader {
public:
    explicit DerReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool AtEnd() const noexcept { return offset_ >= data_.size(); }

    Result<DerElement, KeywardFailure> Next(std::string_view field);

    Result<std::span<const uint8_t>, KeywardFailure> Expect(uint8_t tag, std::string_view field);

    /// Reads a SEQUENCE and returns a reader over its content.
    Result<DerReader, KeywardFailure> ExpectSequence(std::string_view field);

    Result<crypto::BigNum, KeywardFailure> ExpectInteger(std::string_view field);

    /// Fails unless every byte has been consumed.
    Result<Unit, KeywardFailure> ExpectEnd(std::string_view field) const;

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

} // namespace keyward::codec
