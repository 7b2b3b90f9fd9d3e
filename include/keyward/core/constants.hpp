#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>

namespace keyward {
struct Constants {
    static constexpr size_t IDENTITY_SEED_SIZE = 32;
    static constexpr size_t IDENTITY_SEED_HEX_LENGTH = IDENTITY_SEED_SIZE * 2;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SHARED_SECRET_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view CONVERSATION_KEY_INFO = "keyward-conversation-v1";
};
struct RsaConstants {
    static constexpr int DEFAULT_KEY_BITS = 2048;
    static constexpr int MIN_KEY_BITS = 2048;
    static constexpr unsigned long PUBLIC_EXPONENT = 65537;
    static constexpr size_t OAEP_SHA256_OVERHEAD = 2 * 32 + 2;
    static constexpr size_t PEM_LINE_WIDTH = 64;
};
struct MnemonicConstants {
    static constexpr size_t WORDLIST_SIZE = 2048;
    static constexpr size_t BITS_PER_WORD = 11;
    static constexpr size_t SEED_WORD_COUNT = 24;
    static constexpr size_t QR_FRAME_COUNT = 3;
    static constexpr size_t QR_CHECK_BYTES = 8;
    static constexpr std::string_view QR_FRAME_PREFIX = "otp-e2ee-seed:";
    static constexpr std::string_view QR_CHECK_MARKER = "check:";
};
struct BackupConstants {
    static constexpr std::string_view KDF_TYPE = "argon2id";
    static constexpr uint64_t DEFAULT_OPS_LIMIT = 2;
    static constexpr size_t DEFAULT_MEM_LIMIT = 64 * 1024 * 1024;
    static constexpr uint32_t PARALLELISM = 1;
    static constexpr size_t SALT_SIZE = 16;
};
struct StorageKeys {
    static constexpr std::string_view IDENTITY_SEED_HEX = "device_identity_seed_hex";
    static constexpr std::string_view LEGACY_PRIVATE_KEY_PEM = "device_private_key_pem";
    static constexpr std::string_view LEGACY_PUBLIC_KEY_PEM = "device_public_key_pem";
    static constexpr std::string_view SERVER_PUBLIC_KEY_PEM = "server_public_key_pem";
};
struct StoreFileConstants {
    static constexpr std::string_view MAGIC = "KEYWARD_STORE_V1";
    static constexpr std::string_view KEY_FILE_NAME = ".store_key";
    static constexpr std::string_view ENTRY_SUFFIX = ".entry";
};
struct ServerApiConstants {
    static constexpr std::string_view SERVER_PUBLIC_KEY_PATH = "/users/server-public-key";
    static constexpr std::string_view PUBLIC_KEY_FIELD = "public_key";
    static constexpr std::chrono::milliseconds DEFAULT_FETCH_TIMEOUT{10'000};
};
struct LegacyExportConstants {
    static constexpr int VERSION = 1;
    static constexpr std::string_view TYPE = "otto_e2ee_keypair";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
    static constexpr std::string_view IDENTITY_NOT_INITIALIZED = "Identity keys are not initialized";
    static constexpr std::string_view SERVER_KEY_MISSING = "Server public key is not available";
};
}
