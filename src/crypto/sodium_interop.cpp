#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/format.hpp"

namespace keyward::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), bytes.size());
    }
    return bytes;
}

// ============================================================================
// Encoding
// ============================================================================

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

Result<std::vector<uint8_t>, KeywardFailure> SodiumInterop::FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Decode(
                compat::format("Hex string has odd length {}", hex.size())));
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t bin_len = 0;
    const char* hex_end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &hex_end) != 0
        || bin_len != bytes.size()
        || hex_end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Decode("Hex string contains non-hex characters"));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(bytes));
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(encoded.size() - 1);
    return encoded;
}

Result<std::vector<uint8_t>, KeywardFailure> SodiumInterop::FromBase64(std::string_view text) {
    std::vector<uint8_t> bytes(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* b64_end = nullptr;
    if (sodium_base642bin(bytes.data(), bytes.size(), text.data(), text.size(),
                          " \t\r\n", &bin_len, &b64_end,
                          sodium_base64_VARIANT_ORIGINAL) != 0
        || b64_end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Decode("Invalid base64 encoding"));
    }
    bytes.resize(bin_len);
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(bytes));
}

// ============================================================================
// Hashing
// ============================================================================

std::vector<uint8_t> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, message.data(), message.size());
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

} // namespace keyward::crypto
