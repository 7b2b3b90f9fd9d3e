#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::crypto {

/**
 * @brief BIP-39 English mnemonic encoding of raw entropy
 *
 * Entropy of 16..32 bytes (a multiple of 4) maps to 12..24 words; the
 * trailing ENT/32 bits are the leading bits of SHA-256(entropy). A 32-byte
 * identity seed becomes 24 words.
 *
 * Decoding is case-insensitive and tolerates any run of whitespace between
 * words. Unknown words, wrong word counts and checksum mismatches yield
 * InvalidMnemonic.
 */
class Mnemonic {
public:
    static Result<std::string, KeywardFailure> FromEntropy(std::span<const uint8_t> entropy);

    static Result<std::vector<uint8_t>, KeywardFailure> ToEntropy(std::string_view phrase);

    /// Lowercased words of `phrase`, split on whitespace.
    [[nodiscard]] static std::vector<std::string> SplitWords(std::string_view phrase);

    [[nodiscard]] static std::optional<uint16_t> IndexOf(std::string_view word) noexcept;

    [[nodiscard]] static const std::array<std::string_view, MnemonicConstants::WORDLIST_SIZE>& EnglishWordlist() noexcept;

private:
    Mnemonic() = delete;
};

} // namespace keyward::crypto
