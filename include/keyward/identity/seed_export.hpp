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

namespace keyward::identity {

/**
 * @brief Animated-QR transfer of the identity seed
 *
 * Three frames:
 *   otp-e2ee-seed:1/3:<words 1-12>
 *   otp-e2ee-seed:2/3:<words 13-24>
 *   otp-e2ee-seed:3/3:check:<hex(HMAC-SHA256(key=seed, msg=seed)[0..8])>
 */
class SeedExport {
public:
    [[nodiscard]] static Result<std::vector<std::string>, KeywardFailure> ToQrFrames(std::span<const uint8_t> seed);

    /// Frames may arrive in any order; duplicates are ignored.
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> FromQrFrames(
        std::span<const std::string> frames);

    [[nodiscard]] static std::string QrChecksumHex(std::span<const uint8_t> seed);

private:
    SeedExport() = delete;
};

/// Incremental reassembly of scanned frames.
class QrFrameAssembler {
public:
    /// InvalidInput for a frame that is not a seed frame.
    [[nodiscard]] Result<Unit, KeywardFailure> Accept(std::string_view frame);

    [[nodiscard]] bool IsComplete() const noexcept;
    [[nodiscard]] size_t ReceivedCount() const noexcept;

    /// InvalidMnemonic when the words or the checksum do not validate.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Assemble() const;

    void Reset() noexcept;

private:
    std::array<std::optional<std::string>, MnemonicConstants::QR_FRAME_COUNT> frames_;
};

} // namespace keyward::identity
