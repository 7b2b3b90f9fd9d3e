#include "keyward/storage/file_secure_backend.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/debug/logger.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace keyward::storage {

using crypto::AesGcm;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {
    constexpr std::string_view kComponent = "file-store";
    constexpr mode_t kPrivateFileMode = S_IRUSR | S_IWUSR;
    constexpr size_t kHeaderSize = StoreFileConstants::MAGIC.size()
        + Constants::AES_GCM_NONCE_SIZE
        + Constants::AES_GCM_TAG_SIZE;

    std::string ErrnoText() {
        return std::string(std::strerror(errno));
    }

    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    bool IsValidEntryName(const std::string_view key) {
        if (key.empty() || key == "." || key == "..") {
            return false;
        }
        return std::all_of(key.begin(), key.end(), [](const char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                || c == '_' || c == '-' || c == '.';
        });
    }

    Result<Unit, KeywardFailure> WriteAll(const int fd, const std::span<const uint8_t> data) {
        size_t written = 0;
        while (written < data.size()) {
            const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result<Unit, KeywardFailure>::Err(
                    KeywardFailure::Storage(compat::format("write failed: {}", ErrnoText())));
            }
            written += static_cast<size_t>(n);
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Result<Unit, KeywardFailure> WriteFileAtomically(
        const std::filesystem::path& path,
        const std::span<const uint8_t> data) {
        std::filesystem::path tmp_path = path;
        tmp_path += ".tmp";
        const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kPrivateFileMode);
        if (fd < 0) {
            return Result<Unit, KeywardFailure>::Err(KeywardFailure::Storage(
                compat::format("Cannot create '{}': {}", tmp_path.string(), ErrnoText())));
        }
        auto write_result = WriteAll(fd, data);
        if (write_result.IsOk() && ::fchmod(fd, kPrivateFileMode) != 0) {
            write_result = Result<Unit, KeywardFailure>::Err(
                KeywardFailure::Storage(compat::format("fchmod failed: {}", ErrnoText())));
        }
        if (write_result.IsOk() && ::fsync(fd) != 0) {
            write_result = Result<Unit, KeywardFailure>::Err(
                KeywardFailure::Storage(compat::format("fsync failed: {}", ErrnoText())));
        }
        ::close(fd);
        std::error_code ec;
        if (write_result.IsErr()) {
            std::filesystem::remove(tmp_path, ec);
            return write_result;
        }
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code cleanup_ec;
            std::filesystem::remove(tmp_path, cleanup_ec);
            return Result<Unit, KeywardFailure>::Err(KeywardFailure::Storage(
                compat::format("Cannot replace '{}': {}", path.string(), ec.message())));
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Result<std::optional<std::vector<uint8_t>>, KeywardFailure> ReadFile(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Err(KeywardFailure::Storage(
                    compat::format("Cannot stat '{}': {}", path.string(), ec.message())));
            }
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::nullopt);
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Err(
                KeywardFailure::Storage(compat::format("Cannot open '{}'", path.string())));
        }
        std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Err(
                KeywardFailure::Storage(compat::format("Cannot read '{}'", path.string())));
        }
        return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::move(bytes));
    }

    Result<SecureMemoryHandle, KeywardFailure> LoadOrCreateStoreKey(const std::filesystem::path& key_path) {
        auto existing = ReadFile(key_path);
        if (existing.IsErr()) {
            return std::move(existing).PropagateErr<SecureMemoryHandle>();
        }
        auto& key_bytes = existing.Unwrap();
        if (key_bytes.has_value()) {
            if (key_bytes->size() != Constants::AES_KEY_SIZE) {
                return Result<SecureMemoryHandle, KeywardFailure>::Err(KeywardFailure::Storage(
                    compat::format("Store key file '{}' has {} bytes, expected {}",
                                   key_path.string(), key_bytes->size(), Constants::AES_KEY_SIZE)));
            }
            auto handle = SecureMemoryHandle::FromBytes(*key_bytes);
            (void) SodiumInterop::SecureWipe(std::span<uint8_t>(*key_bytes));
            if (handle.IsErr()) {
                return Result<SecureMemoryHandle, KeywardFailure>::Err(
                    KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
            }
            return Result<SecureMemoryHandle, KeywardFailure>::Ok(std::move(handle).Unwrap());
        }

        auto fresh_key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
        const int fd = ::open(key_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, kPrivateFileMode);
        if (fd < 0) {
            (void) SodiumInterop::SecureWipe(std::span<uint8_t>(fresh_key));
            if (errno == EEXIST) {
                return LoadOrCreateStoreKey(key_path);
            }
            return Result<SecureMemoryHandle, KeywardFailure>::Err(KeywardFailure::Storage(
                compat::format("Cannot create store key '{}': {}", key_path.string(), ErrnoText())));
        }
        auto write_result = WriteAll(fd, fresh_key);
        if (write_result.IsOk() && ::fsync(fd) != 0) {
            write_result = Result<Unit, KeywardFailure>::Err(
                KeywardFailure::Storage(compat::format("fsync failed: {}", ErrnoText())));
        }
        ::close(fd);
        if (write_result.IsErr()) {
            (void) SodiumInterop::SecureWipe(std::span<uint8_t>(fresh_key));
            std::error_code ec;
            std::filesystem::remove(key_path, ec);
            return std::move(write_result).PropagateErr<SecureMemoryHandle>();
        }
        KEYWARD_LOG_INFO(kComponent, "created store key at {}", key_path.string());
        auto handle = SecureMemoryHandle::FromBytes(fresh_key);
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(fresh_key));
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, KeywardFailure>::Err(
                KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, KeywardFailure>::Ok(std::move(handle).Unwrap());
    }
}

FileSecureBackend::FileSecureBackend(std::filesystem::path directory, SecureMemoryHandle store_key)
    : directory_(std::move(directory))
      , store_key_(std::move(store_key)) {
}

Result<std::shared_ptr<FileSecureBackend>, KeywardFailure> FileSecureBackend::Open(
    const std::filesystem::path& directory) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::shared_ptr<FileSecureBackend>, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (directory.empty()) {
        return Result<std::shared_ptr<FileSecureBackend>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Store directory must not be empty"));
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return Result<std::shared_ptr<FileSecureBackend>, KeywardFailure>::Err(KeywardFailure::Storage(
            compat::format("Cannot create store directory '{}': {}", directory.string(), ec.message())));
    }
    std::filesystem::permissions(directory, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        KEYWARD_LOG_WARN(kComponent, "cannot restrict permissions of {}: {}", directory.string(), ec.message());
    }

    auto key_result = LoadOrCreateStoreKey(directory / StoreFileConstants::KEY_FILE_NAME);
    if (key_result.IsErr()) {
        return std::move(key_result).PropagateErr<std::shared_ptr<FileSecureBackend>>();
    }
    return Result<std::shared_ptr<FileSecureBackend>, KeywardFailure>::Ok(
        std::shared_ptr<FileSecureBackend>(new FileSecureBackend(directory, std::move(key_result).Unwrap())));
}

Result<std::filesystem::path, KeywardFailure> FileSecureBackend::EntryPath(const std::string_view key) const {
    if (!IsValidEntryName(key)) {
        return Result<std::filesystem::path, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(compat::format("Invalid store entry name '{}'", key)));
    }
    std::string file_name(key);
    file_name += StoreFileConstants::ENTRY_SUFFIX;
    return Result<std::filesystem::path, KeywardFailure>::Ok(directory_ / file_name);
}

Result<std::optional<std::vector<uint8_t>>, KeywardFailure> FileSecureBackend::Read(const std::string_view key) {
    using ReadResult = Result<std::optional<std::vector<uint8_t>>, KeywardFailure>;
    auto path_result = EntryPath(key);
    if (path_result.IsErr()) {
        return std::move(path_result).PropagateErr<std::optional<std::vector<uint8_t>>>();
    }
    auto file_result = ReadFile(path_result.Unwrap());
    if (file_result.IsErr() || !file_result.Unwrap().has_value()) {
        return file_result;
    }
    const std::vector<uint8_t>& blob = *file_result.Unwrap();
    const auto magic = AsBytes(StoreFileConstants::MAGIC);
    if (blob.size() < kHeaderSize
        || !std::equal(magic.begin(), magic.end(), blob.begin())) {
        return ReadResult::Err(KeywardFailure::Storage(
            compat::format("Store entry '{}' has an invalid header", key)));
    }
    const std::span<const uint8_t> blob_view(blob);
    const auto nonce = blob_view.subspan(magic.size(), Constants::AES_GCM_NONCE_SIZE);
    const auto tag = blob_view.subspan(magic.size() + Constants::AES_GCM_NONCE_SIZE, Constants::AES_GCM_TAG_SIZE);
    const auto ciphertext = blob_view.subspan(kHeaderSize);

    auto opened = store_key_.WithReadAccess([&](const std::span<const uint8_t> store_key) {
        return AesGcm::Decrypt(store_key, nonce, ciphertext, tag, AsBytes(key));
    });
    if (opened.IsErr()) {
        return ReadResult::Err(KeywardFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    auto plaintext = std::move(opened).Unwrap();
    if (plaintext.IsErr()) {
        KEYWARD_LOG_ERROR(kComponent, "entry '{}' failed authentication", key);
        return ReadResult::Err(KeywardFailure::Storage(
            compat::format("Store entry '{}' failed authentication", key)));
    }
    return ReadResult::Ok(std::move(plaintext).Unwrap());
}

Result<Unit, KeywardFailure> FileSecureBackend::Write(
    const std::string_view key,
    const std::span<const uint8_t> value) {
    auto path_result = EntryPath(key);
    if (path_result.IsErr()) {
        return std::move(path_result).PropagateErr<Unit>();
    }
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed_result = store_key_.WithReadAccess([&](const std::span<const uint8_t> store_key) {
        return AesGcm::Encrypt(store_key, nonce, value, AsBytes(key));
    });
    if (sealed_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(sealed_result.UnwrapErr()));
    }
    auto sealed = std::move(sealed_result).Unwrap();
    if (sealed.IsErr()) {
        return std::move(sealed).PropagateErr<Unit>();
    }
    const auto& payload = sealed.Unwrap();

    std::vector<uint8_t> blob;
    blob.reserve(kHeaderSize + payload.ciphertext.size());
    const auto magic = AsBytes(StoreFileConstants::MAGIC);
    blob.insert(blob.end(), magic.begin(), magic.end());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), payload.tag.begin(), payload.tag.end());
    blob.insert(blob.end(), payload.ciphertext.begin(), payload.ciphertext.end());
    return WriteFileAtomically(path_result.Unwrap(), blob);
}

Result<Unit, KeywardFailure> FileSecureBackend::Delete(const std::string_view key) {
    auto path_result = EntryPath(key);
    if (path_result.IsErr()) {
        return std::move(path_result).PropagateErr<Unit>();
    }
    std::error_code ec;
    std::filesystem::remove(path_result.Unwrap(), ec);
    if (ec) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::Storage(
            compat::format("Cannot delete store entry '{}': {}", key, ec.message())));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

} // namespace keyward::storage
