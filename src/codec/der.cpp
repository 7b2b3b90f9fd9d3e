#include "keyward/codec/der.hpp"
#include "keyward/core/format.hpp"

namespace keyward::codec {

using crypto::BigNum;

void DerWriter::AppendLength(std::vector<uint8_t>& out, const size_t length) {
    if (length < 0x80) {
        out.push_back(static_cast<uint8_t>(length));
        return;
    }
    uint8_t length_bytes[sizeof(size_t)];
    size_t count = 0;
    for (size_t remaining = length; remaining > 0; remaining >>= 8) {
        length_bytes[count++] = static_cast<uint8_t>(remaining & 0xFF);
    }
    out.push_back(static_cast<uint8_t>(0x80 | count));
    while (count > 0) {
        out.push_back(length_bytes[--count]);
    }
}

std::vector<uint8_t> DerWriter::Element(const uint8_t tag, std::span<const uint8_t> content) {
    std::vector<uint8_t> out;
    out.reserve(content.size() + 6);
    out.push_back(tag);
    AppendLength(out, content.size());
    out.insert(out.end(), content.begin(), content.end());
    return out;
}

Result<std::vector<uint8_t>, KeywardFailure> DerWriter::Integer(const BigNum& value) {
    auto content = value.ToTwosComplement();
    if (content.IsErr()) {
        return content;
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(
        Element(DerTag::INTEGER, content.Unwrap()));
}

std::vector<uint8_t> DerWriter::SmallInteger(const uint8_t value) {
    if (value & 0x80) {
        const uint8_t content[] = {0x00, value};
        return Element(DerTag::INTEGER, content);
    }
    const uint8_t content[] = {value};
    return Element(DerTag::INTEGER, content);
}

std::vector<uint8_t> DerWriter::Sequence(std::initializer_list<std::span<const uint8_t>> children) {
    std::vector<uint8_t> content;
    for (const auto& child : children) {
        content.insert(content.end(), child.begin(), child.end());
    }
    return Element(DerTag::SEQUENCE, content);
}

std::vector<uint8_t> DerWriter::Null() {
    return {DerTag::NULL_VALUE, 0x00};
}

std::vector<uint8_t> DerWriter::ObjectIdentifier(std::span<const uint8_t> encoded_oid) {
    return Element(DerTag::OBJECT_IDENTIFIER, encoded_oid);
}

std::vector<uint8_t> DerWriter::BitString(std::span<const uint8_t> bytes) {
    std::vector<uint8_t> content;
    content.reserve(bytes.size() + 1);
    content.push_back(0x00);
    content.insert(content.end(), bytes.begin(), bytes.end());
    return Element(DerTag::BIT_STRING, content);
}

std::vector<uint8_t> DerWriter::OctetString(std::span<const uint8_t> bytes) {
    return Element(DerTag::OCTET_STRING, bytes);
}

Result<DerElement, KeywardFailure> DerReader::Next(std::string_view field) {
    const auto fail = [field](std::string message) {
        return Result<DerElement, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field), std::move(message)));
    };
    if (offset_ + 2 > data_.size()) {
        return fail("Truncated DER element header");
    }
    const uint8_t tag = data_[offset_++];
    const uint8_t first = data_[offset_++];
    size_t length = 0;
    if ((first & 0x80) == 0) {
        length = first;
    } else {
        const size_t count = first & 0x7F;
        if (count == 0) {
            return fail("Indefinite DER length is not allowed");
        }
        if (count > 4 || offset_ + count > data_.size()) {
            return fail("Unsupported or truncated DER length");
        }
        for (size_t i = 0; i < count; ++i) {
            length = (length << 8) | data_[offset_++];
        }
        if (length < 0x80) {
            return fail("Non-minimal DER length encoding");
        }
    }
    if (length > data_.size() - offset_) {
        return fail(compat::format("DER element claims {} bytes, {} remain", length, data_.size() - offset_));
    }
    DerElement element{tag, data_.subspan(offset_, length)};
    offset_ += length;
    return Result<DerElement, KeywardFailure>::Ok(element);
}

Result<std::span<const uint8_t>, KeywardFailure> DerReader::Expect(const uint8_t tag, std::string_view field) {
    auto element = Next(field);
    if (element.IsErr()) {
        return std::move(element).PropagateErr<std::span<const uint8_t>>();
    }
    const DerElement& el = element.Unwrap();
    if (el.tag != tag) {
        return Result<std::span<const uint8_t>, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field),
                compat::format("Expected DER tag 0x{:02x}, found 0x{:02x}", tag, el.tag)));
    }
    return Result<std::span<const uint8_t>, KeywardFailure>::Ok(el.content);
}

Result<DerReader, KeywardFailure> DerReader::ExpectSequence(std::string_view field) {
    auto content = Expect(DerTag::SEQUENCE, field);
    if (content.IsErr()) {
        return std::move(content).PropagateErr<DerReader>();
    }
    return Result<DerReader, KeywardFailure>::Ok(DerReader(content.Unwrap()));
}

Result<BigNum, KeywardFailure> DerReader::ExpectInteger(std::string_view field) {
    auto content = Expect(DerTag::INTEGER, field);
    if (content.IsErr()) {
        return std::move(content).PropagateErr<BigNum>();
    }
    const auto bytes = content.Unwrap();
    if (bytes.empty()) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field), "INTEGER has no content"));
    }
    if (bytes.size() > 1
        && ((bytes[0] == 0x00 && (bytes[1] & 0x80) == 0)
            || (bytes[0] == 0xFF && (bytes[1] & 0x80) != 0))) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field), "INTEGER is not minimally encoded"));
    }
    auto value = BigNum::FromTwosComplement(bytes);
    if (value.IsErr()) {
        return Result<BigNum, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field), value.UnwrapErr().message));
    }
    return value;
}

Result<Unit, KeywardFailure> DerReader::ExpectEnd(std::string_view field) const {
    if (!AtEnd()) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::KeyFormat(std::string(field),
                compat::format("{} unexpected trailing bytes", data_.size() - offset_)));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

} // namespace keyward::codec
