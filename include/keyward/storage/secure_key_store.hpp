#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/interfaces/i_secure_backend.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyward::storage {

class SecureBackendStrategy {
public:
    explicit SecureBackendStrategy(std::shared_ptr<interfaces::ISecureBackend> backend);
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, KeywardFailure> Read(std::string_view key);
    [[nodiscard]] Result<Unit, KeywardFailure> Write(std::string_view key, std::span<const uint8_t> value);
    [[nodiscard]] Result<Unit, KeywardFailure> Delete(std::string_view key);
private:
    std::shared_ptr<interfaces::ISecureBackend> backend_;
};

class MemoryFallbackStrategy {
public:
    explicit MemoryFallbackStrategy(std::string reason);
    [[nodiscard]] std::optional<std::vector<uint8_t>> Read(std::string_view key) const;
    void Write(std::string_view key, std::span<const uint8_t> value);
    void Delete(std::string_view key);
    [[nodiscard]] const std::string& Reason() const noexcept { return reason_; }
private:
    std::map<std::string, std::vector<uint8_t>, std::less<>> entries_;
    std::string reason_;
};

/**
 * @brief Key/value byte store over a secure backend with one-way memory fallback
 *
 * The first backend failure, reported either as an error result or as a
 * thrown std::exception, permanently replaces the backend strategy with an
 * in-memory map for the lifetime of this object. The failing operation is
 * then replayed against memory, so callers never see backend errors. After
 * the switch IsEphemeral() is true and nothing written survives a restart.
 *
 * All operations are serialized on one mutex.
 */
class SecureKeyStore {
public:
    explicit SecureKeyStore(std::shared_ptr<interfaces::ISecureBackend> backend);

    /// Store that starts (and stays) ephemeral.
    [[nodiscard]] static std::unique_ptr<SecureKeyStore> InMemory();

    SecureKeyStore(const SecureKeyStore&) = delete;
    SecureKeyStore& operator=(const SecureKeyStore&) = delete;

    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, KeywardFailure> Read(std::string_view key);
    [[nodiscard]] Result<Unit, KeywardFailure> Write(std::string_view key, std::span<const uint8_t> value);
    [[nodiscard]] Result<Unit, KeywardFailure> Delete(std::string_view key);

    [[nodiscard]] Result<std::optional<std::string>, KeywardFailure> ReadString(std::string_view key);
    [[nodiscard]] Result<Unit, KeywardFailure> WriteString(std::string_view key, std::string_view value);

    [[nodiscard]] bool IsEphemeral() const;

    /// Why the store degraded, when it has.
    [[nodiscard]] std::optional<std::string> DegradationReason() const;

private:
    explicit SecureKeyStore(MemoryFallbackStrategy memory);

    void Degrade(std::string_view operation, std::string_view key, const std::string& reason);

    mutable std::mutex mutex_;
    std::variant<SecureBackendStrategy, MemoryFallbackStrategy> strategy_;
};

} // namespace keyward::storage
