#include "keyward/identity/seed_export.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/mnemonic.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include <charconv>

namespace keyward::identity {

using crypto::Mnemonic;
using crypto::SodiumInterop;

namespace {
    constexpr size_t kWordsPerFrame = MnemonicConstants::SEED_WORD_COUNT / 2;
    constexpr size_t kChecksumFrame = 3;

    std::string JoinWords(const std::vector<std::string>& words, const size_t from, const size_t to) {
        std::string out;
        for (size_t i = from; i < to; ++i) {
            if (i != from) {
                out.push_back(' ');
            }
            out += words[i];
        }
        return out;
    }

    std::optional<size_t> ParseNumber(const std::string_view text) {
        size_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::vector<uint8_t> QrChecksum(const std::span<const uint8_t> seed) {
        auto mac = SodiumInterop::HmacSha256(seed, seed);
        mac.resize(MnemonicConstants::QR_CHECK_BYTES);
        return mac;
    }
}

std::string SeedExport::QrChecksumHex(const std::span<const uint8_t> seed) {
    return SodiumInterop::ToHex(QrChecksum(seed));
}

Result<std::vector<std::string>, KeywardFailure> SeedExport::ToQrFrames(const std::span<const uint8_t> seed) {
    if (seed.size() != Constants::IDENTITY_SEED_SIZE) {
        return Result<std::vector<std::string>, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Identity seed must be {} bytes, got {}", Constants::IDENTITY_SEED_SIZE, seed.size())));
    }
    auto phrase = Mnemonic::FromEntropy(seed);
    if (phrase.IsErr()) {
        return std::move(phrase).PropagateErr<std::vector<std::string>>();
    }
    const auto words = Mnemonic::SplitWords(phrase.Unwrap());
    const std::string_view prefix = MnemonicConstants::QR_FRAME_PREFIX;
    std::vector<std::string> frames;
    frames.reserve(MnemonicConstants::QR_FRAME_COUNT);
    frames.push_back(compat::format("{}1/3:{}", prefix, JoinWords(words, 0, kWordsPerFrame)));
    frames.push_back(compat::format("{}2/3:{}", prefix, JoinWords(words, kWordsPerFrame, words.size())));
    frames.push_back(compat::format("{}3/3:{}{}", prefix, MnemonicConstants::QR_CHECK_MARKER, QrChecksumHex(seed)));
    return Result<std::vector<std::string>, KeywardFailure>::Ok(std::move(frames));
}

Result<std::vector<uint8_t>, KeywardFailure> SeedExport::FromQrFrames(const std::span<const std::string> frames) {
    QrFrameAssembler assembler;
    for (const auto& frame : frames) {
        if (auto accepted = assembler.Accept(frame); accepted.IsErr()) {
            return std::move(accepted).PropagateErr<std::vector<uint8_t>>();
        }
    }
    return assembler.Assemble();
}

Result<Unit, KeywardFailure> QrFrameAssembler::Accept(const std::string_view frame) {
    const std::string_view prefix = MnemonicConstants::QR_FRAME_PREFIX;
    if (!frame.starts_with(prefix)) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("QR frame does not carry the seed prefix"));
    }
    const std::string_view rest = frame.substr(prefix.size());
    const size_t colon = rest.find(':');
    const size_t slash = rest.find('/');
    if (colon == std::string_view::npos || slash == std::string_view::npos || slash > colon) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("QR frame header is malformed"));
    }
    const auto number = ParseNumber(rest.substr(0, slash));
    const auto total = ParseNumber(rest.substr(slash + 1, colon - slash - 1));
    if (!number || !total || *total != MnemonicConstants::QR_FRAME_COUNT
        || *number < 1 || *number > MnemonicConstants::QR_FRAME_COUNT) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("QR frame number is out of range"));
    }

    std::string_view data = rest.substr(colon + 1);
    if (*number == kChecksumFrame) {
        if (!data.starts_with(MnemonicConstants::QR_CHECK_MARKER)) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::InvalidInput("QR checksum frame lacks the check marker"));
        }
        data.remove_prefix(MnemonicConstants::QR_CHECK_MARKER.size());
    }
    auto& slot = frames_[*number - 1];
    if (!slot.has_value()) {
        slot = std::string(data);
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

bool QrFrameAssembler::IsComplete() const noexcept {
    return ReceivedCount() == frames_.size();
}

size_t QrFrameAssembler::ReceivedCount() const noexcept {
    size_t count = 0;
    for (const auto& frame : frames_) {
        if (frame.has_value()) {
            ++count;
        }
    }
    return count;
}

Result<std::vector<uint8_t>, KeywardFailure> QrFrameAssembler::Assemble() const {
    if (!IsComplete()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidInput(
            compat::format("Only {} of {} QR frames received", ReceivedCount(), frames_.size())));
    }
    const std::string phrase = *frames_[0] + " " + *frames_[1];
    if (Mnemonic::SplitWords(phrase).size() != MnemonicConstants::SEED_WORD_COUNT) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(KeywardFailure::InvalidMnemonic(
            compat::format("QR frames must carry {} words", MnemonicConstants::SEED_WORD_COUNT)));
    }
    auto seed_result = Mnemonic::ToEntropy(phrase);
    if (seed_result.IsErr()) {
        return seed_result;
    }
    auto expected = SodiumInterop::FromHex(*frames_[2]);
    if (expected.IsErr() || expected.Unwrap().size() != MnemonicConstants::QR_CHECK_BYTES) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidMnemonic("QR checksum is not valid hex"));
    }
    auto& seed = seed_result.Unwrap();
    if (!SodiumInterop::ConstantTimeEquals(QrChecksum(seed), expected.Unwrap())) {
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(seed));
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidMnemonic("QR checksum does not match the scanned words"));
    }
    return seed_result;
}

void QrFrameAssembler::Reset() noexcept {
    for (auto& frame : frames_) {
        frame.reset();
    }
}

} // namespace keyward::identity
