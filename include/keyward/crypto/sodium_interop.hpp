#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Initialization, secure wiping, constant-time comparison, randomness and the
 * hex/base64/hash primitives used by the codecs and stores.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Wipes caller-owned temporaries that are only reachable through a const view.
    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /// Constant-time comparison; buffers of different length are never equal.
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Encoding
    // ========================================================================

    /// Lowercase hex.
    static std::string ToHex(std::span<const uint8_t> data);

    /// Strict hex decoding: even length, hex digits only, either case.
    static Result<std::vector<uint8_t>, KeywardFailure> FromHex(std::string_view hex);

    /// Standard (RFC 4648, padded) base64.
    static std::string ToBase64(std::span<const uint8_t> data);

    /// Decodes standard padded base64. Whitespace is ignored.
    static Result<std::vector<uint8_t>, KeywardFailure> FromBase64(std::string_view text);

    // ========================================================================
    // Hashing
    // ========================================================================

    static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    static std::vector<uint8_t> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> message);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace keyward::crypto
