#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/interfaces/i_secure_backend.hpp"
#include <filesystem>
#include <memory>

namespace keyward::storage {

/**
 * @brief Sealed-file secure backend for desktop and CLI hosts
 *
 * One 0600 file per entry under the store directory. Each value is sealed
 * with AES-256-GCM under a random store key held in a 0600 key file next to
 * the entries; the entry name is bound as associated data, so renaming a
 * file invalidates it.
 *
 *   blob = "KEYWARD_STORE_V1" | nonce(12) | tag(16) | ciphertext
 *
 * Entry names are limited to [A-Za-z0-9_.-]. A blob that fails to
 * authenticate is reported as a Storage failure.
 */
class FileSecureBackend final : public interfaces::ISecureBackend {
public:
    /// Creates the directory if needed and loads or creates the store key.
    [[nodiscard]] static Result<std::shared_ptr<FileSecureBackend>, KeywardFailure> Open(
        const std::filesystem::path& directory);

    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, KeywardFailure> Read(std::string_view key) override;
    [[nodiscard]] Result<Unit, KeywardFailure> Write(std::string_view key, std::span<const uint8_t> value) override;
    [[nodiscard]] Result<Unit, KeywardFailure> Delete(std::string_view key) override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

private:
    FileSecureBackend(std::filesystem::path directory, crypto::SecureMemoryHandle store_key);

    [[nodiscard]] Result<std::filesystem::path, KeywardFailure> EntryPath(std::string_view key) const;

    std::filesystem::path directory_;
    crypto::SecureMemoryHandle store_key_;
};

} // namespace keyward::storage
