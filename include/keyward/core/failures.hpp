#pragma once
#include <string>
#include <string_view>
#include <optional>

namespace keyward {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class FailureType {
    Generic,
    InvalidInput,
    KeyGeneration,
    DeriveKey,
    Encode,
    Decode,
    InvalidState,
    KeyFormat,
    KeysUnavailable,
    InvalidMnemonic,
    AuthenticationFailed,
    ServerKeyUnavailable,
    FetchTimeout,
    Network,
    Storage
};

[[nodiscard]] constexpr std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::Generic: return "Generic";
        case FailureType::InvalidInput: return "InvalidInput";
        case FailureType::KeyGeneration: return "KeyGeneration";
        case FailureType::DeriveKey: return "DeriveKey";
        case FailureType::Encode: return "Encode";
        case FailureType::Decode: return "Decode";
        case FailureType::InvalidState: return "InvalidState";
        case FailureType::KeyFormat: return "KeyFormat";
        case FailureType::KeysUnavailable: return "KeysUnavailable";
        case FailureType::InvalidMnemonic: return "InvalidMnemonic";
        case FailureType::AuthenticationFailed: return "AuthenticationFailed";
        case FailureType::ServerKeyUnavailable: return "ServerKeyUnavailable";
        case FailureType::FetchTimeout: return "FetchTimeout";
        case FailureType::Network: return "Network";
        case FailureType::Storage: return "Storage";
    }
    return "Unknown";
}

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure value returned by every fallible keyward operation
 *
 * KeyFormat failures name the offending field (e.g. "modulus", "pemHeader").
 * Network-class failures report IsRetryable() so callers can decide on a retry
 * policy of their own.
 */
class KeywardFailure {
public:
    FailureType type;
    std::string message;
    std::optional<std::string> field;

    KeywardFailure(const FailureType t, std::string msg, std::optional<std::string> f = std::nullopt)
        : type(t), message(std::move(msg)), field(std::move(f)) {}

    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == FailureType::ServerKeyUnavailable
            || type == FailureType::FetchTimeout
            || type == FailureType::Network;
    }

    [[nodiscard]] std::string ToString() const {
        std::string out(FailureTypeName(type));
        if (field.has_value()) {
            out += "(" + *field + ")";
        }
        out += ": " + message;
        return out;
    }

    static KeywardFailure Generic(std::string msg) {
        return {FailureType::Generic, std::move(msg)};
    }
    static KeywardFailure InvalidInput(std::string msg) {
        return {FailureType::InvalidInput, std::move(msg)};
    }
    static KeywardFailure KeyGeneration(std::string msg) {
        return {FailureType::KeyGeneration, std::move(msg)};
    }
    static KeywardFailure DeriveKey(std::string msg) {
        return {FailureType::DeriveKey, std::move(msg)};
    }
    static KeywardFailure Encode(std::string msg) {
        return {FailureType::Encode, std::move(msg)};
    }
    static KeywardFailure Decode(std::string msg) {
        return {FailureType::Decode, std::move(msg)};
    }
    static KeywardFailure InvalidState(std::string msg) {
        return {FailureType::InvalidState, std::move(msg)};
    }
    static KeywardFailure KeyFormat(std::string field_name, std::string msg) {
        return {FailureType::KeyFormat, std::move(msg), std::move(field_name)};
    }
    static KeywardFailure KeysUnavailable(std::string msg) {
        return {FailureType::KeysUnavailable, std::move(msg)};
    }
    static KeywardFailure InvalidMnemonic(std::string msg) {
        return {FailureType::InvalidMnemonic, std::move(msg)};
    }
    static KeywardFailure AuthenticationFailed(std::string msg) {
        return {FailureType::AuthenticationFailed, std::move(msg)};
    }
    static KeywardFailure ServerKeyUnavailable(std::string msg) {
        return {FailureType::ServerKeyUnavailable, std::move(msg)};
    }
    static KeywardFailure FetchTimeout(std::string msg) {
        return {FailureType::FetchTimeout, std::move(msg)};
    }
    static KeywardFailure Network(std::string msg) {
        return {FailureType::Network, std::move(msg)};
    }
    static KeywardFailure Storage(std::string msg) {
        return {FailureType::Storage, std::move(msg)};
    }
    static KeywardFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
}
