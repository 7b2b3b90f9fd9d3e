#include "keyward/crypto/mnemonic.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/format.hpp"

#include <algorithm>
#include <cctype>

namespace keyward::crypto {

namespace {
    bool GetBit(std::span<const uint8_t> bytes, const size_t bit_index) {
        return (bytes[bit_index / 8] >> (7 - bit_index % 8)) & 1;
    }

    void SetBit(std::span<uint8_t> bytes, const size_t bit_index) {
        bytes[bit_index / 8] |= static_cast<uint8_t>(1 << (7 - bit_index % 8));
    }

    bool IsValidEntropySize(const size_t size) {
        return size >= 16 && size <= 32 && size % 4 == 0;
    }
}

Result<std::string, KeywardFailure> Mnemonic::FromEntropy(std::span<const uint8_t> entropy) {
    if (!IsValidEntropySize(entropy.size())) {
        return Result<std::string, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Mnemonic entropy must be 16..32 bytes in steps of 4, got {}", entropy.size())));
    }
    const std::vector<uint8_t> checksum = SodiumInterop::Sha256(entropy);
    const size_t entropy_bits = entropy.size() * 8;
    const size_t checksum_bits = entropy_bits / 32;
    const size_t word_count = (entropy_bits + checksum_bits) / MnemonicConstants::BITS_PER_WORD;

    const auto& words = EnglishWordlist();
    std::string phrase;
    for (size_t w = 0; w < word_count; ++w) {
        uint16_t index = 0;
        for (size_t b = 0; b < MnemonicConstants::BITS_PER_WORD; ++b) {
            const size_t bit = w * MnemonicConstants::BITS_PER_WORD + b;
            const bool set = bit < entropy_bits
                ? GetBit(entropy, bit)
                : GetBit(checksum, bit - entropy_bits);
            index = static_cast<uint16_t>((index << 1) | (set ? 1 : 0));
        }
        if (!phrase.empty()) {
            phrase.push_back(' ');
        }
        phrase.append(words[index]);
    }
    return Result<std::string, KeywardFailure>::Ok(std::move(phrase));
}

Result<std::vector<uint8_t>, KeywardFailure> Mnemonic::ToEntropy(std::string_view phrase) {
    const std::vector<std::string> words = SplitWords(phrase);
    const size_t word_count = words.size();
    if (word_count < 12 || word_count > 24 || word_count % 3 != 0) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidMnemonic(
                compat::format("Mnemonic must have 12, 15, 18, 21 or 24 words, got {}", word_count)));
    }

    const size_t total_bits = word_count * MnemonicConstants::BITS_PER_WORD;
    const size_t checksum_bits = total_bits / 33;
    const size_t entropy_bits = total_bits - checksum_bits;
    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);

    for (size_t w = 0; w < word_count; ++w) {
        const auto index = IndexOf(words[w]);
        if (!index.has_value()) {
            sodium_memzero(bits.data(), bits.size());
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::InvalidMnemonic(
                    compat::format("Word {} is not in the BIP-39 English wordlist", w + 1)));
        }
        for (size_t b = 0; b < MnemonicConstants::BITS_PER_WORD; ++b) {
            if ((*index >> (MnemonicConstants::BITS_PER_WORD - 1 - b)) & 1) {
                SetBit(bits, w * MnemonicConstants::BITS_PER_WORD + b);
            }
        }
    }

    std::vector<uint8_t> entropy(bits.begin(), bits.begin() + static_cast<std::ptrdiff_t>(entropy_bits / 8));
    const std::vector<uint8_t> expected = SodiumInterop::Sha256(entropy);
    bool checksum_ok = true;
    for (size_t b = 0; b < checksum_bits; ++b) {
        if (GetBit(bits, entropy_bits + b) != GetBit(expected, b)) {
            checksum_ok = false;
        }
    }
    sodium_memzero(bits.data(), bits.size());
    if (!checksum_ok) {
        sodium_memzero(entropy.data(), entropy.size());
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidMnemonic("Mnemonic checksum mismatch"));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(entropy));
}

std::vector<std::string> Mnemonic::SplitWords(std::string_view phrase) {
    std::vector<std::string> words;
    std::string current;
    for (const char c : phrase) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::optional<uint16_t> Mnemonic::IndexOf(std::string_view word) noexcept {
    const auto& words = EnglishWordlist();
    const auto it = std::lower_bound(words.begin(), words.end(), word);
    if (it == words.end() || *it != word) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(it - words.begin());
}

} // namespace keyward::crypto
