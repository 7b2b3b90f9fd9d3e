#include "keyward/configuration/client_config.hpp"
#include "keyward/core/format.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace keyward::configuration {

namespace {
    std::optional<std::string> ReadEnv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::filesystem::path DefaultStoreDirectory() {
        if (auto xdg = ReadEnv("XDG_DATA_HOME")) {
            return std::filesystem::path(*xdg) / "keyward";
        }
        if (auto home = ReadEnv("HOME")) {
            return std::filesystem::path(*home) / ".local" / "share" / "keyward";
        }
        return std::filesystem::temp_directory_path() / "keyward";
    }
}

ClientConfig ClientConfig::Default() {
    ClientConfig config;
    config.store_directory = DefaultStoreDirectory();
    return config;
}

Result<ClientConfig, KeywardFailure> ClientConfig::FromEnvironment() {
    ClientConfig config = Default();

    if (auto base_url = ReadEnv("KEYWARD_BASE_URL")) {
        config.base_url = std::move(*base_url);
    }
    if (auto timeout = ReadEnv("KEYWARD_FETCH_TIMEOUT_MS")) {
        int64_t millis = 0;
        const auto* begin = timeout->data();
        const auto* end = timeout->data() + timeout->size();
        const auto [ptr, ec] = std::from_chars(begin, end, millis);
        if (ec != std::errc() || ptr != end) {
            return Result<ClientConfig, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("KEYWARD_FETCH_TIMEOUT_MS is not an integer: '{}'", *timeout)));
        }
        config.fetch_timeout = std::chrono::milliseconds(millis);
    }
    if (auto store_dir = ReadEnv("KEYWARD_STORE_DIR")) {
        config.store_directory = *store_dir;
    }
    if (auto level = ReadEnv("KEYWARD_LOG_LEVEL")) {
        const auto parsed = debug::ParseLogLevel(*level);
        if (!parsed.has_value()) {
            return Result<ClientConfig, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("KEYWARD_LOG_LEVEL is not a known level: '{}'", *level)));
        }
        config.log_level = *parsed;
    }

    if (auto validation = config.Validate(); validation.IsErr()) {
        return std::move(validation).PropagateErr<ClientConfig>();
    }
    return Result<ClientConfig, KeywardFailure>::Ok(std::move(config));
}

Result<Unit, KeywardFailure> ClientConfig::Validate() const {
    if (fetch_timeout.count() <= 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("fetch_timeout must be positive"));
    }
    if (rsa_key_bits < RsaConstants::MIN_KEY_BITS || rsa_key_bits % 8 != 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("rsa_key_bits must be a multiple of 8 and at least {}, got {}",
                    RsaConstants::MIN_KEY_BITS, rsa_key_bits)));
    }
    if (backup_kdf.ops_limit == 0 || backup_kdf.mem_limit_bytes == 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("backup_kdf limits must be non-zero"));
    }
    if (!base_url.empty()) {
        const std::string_view url(base_url);
        if (!url.starts_with("http://") && !url.starts_with("https://")) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("base_url must use http or https: '{}'", base_url)));
        }
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

std::string ClientConfig::ServerPublicKeyUrl() const {
    std::string_view base(base_url);
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    return std::string(base) + std::string(ServerApiConstants::SERVER_PUBLIC_KEY_PATH);
}

} // namespace keyward::configuration
