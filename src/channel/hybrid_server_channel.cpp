#include "keyward/channel/hybrid_server_channel.hpp"
#include "keyward/codec/key_codec.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/rsa_oaep.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/debug/logger.hpp"
#include <nlohmann/json.hpp>

namespace keyward::channel {

using codec::KeyCodec;
using crypto::RsaOaep;
using crypto::SodiumInterop;
using models::RsaPublicKey;
using json = nlohmann::json;

namespace {
    constexpr std::string_view kComponent = "server-channel";

    bool IsSuccessStatus(const long status) {
        return status >= 200 && status < 300;
    }

    KeywardFailure ToFetchFailure(const KeywardFailure& failure) {
        if (failure.type == FailureType::FetchTimeout || failure.type == FailureType::ServerKeyUnavailable) {
            return failure;
        }
        return KeywardFailure::ServerKeyUnavailable(
            compat::format("Server public key could not be fetched: {}", failure.ToString()));
    }
}

HybridServerChannel::HybridServerChannel(
    storage::SecureKeyStore& store,
    std::shared_ptr<interfaces::IHttpTransport> transport,
    configuration::ClientConfig config)
    : store_(store)
      , transport_(std::move(transport))
      , config_(std::move(config)) {
}

ServerKeyState HybridServerChannel::State() const {
    std::lock_guard lock(mutex_);
    return server_key_.has_value() ? ServerKeyState::HasServerKey : ServerKeyState::NoServerKey;
}

Result<ServerKeySource, KeywardFailure> HybridServerChannel::FetchServerPublicKey(const std::string_view base_url) {
    if (base_url.empty()) {
        return Result<ServerKeySource, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Base URL must not be empty"));
    }
    configuration::ClientConfig target = config_;
    target.base_url = std::string(base_url);
    std::lock_guard lock(mutex_);
    return FetchLocked(target.ServerPublicKeyUrl());
}

Result<ServerKeySource, KeywardFailure> HybridServerChannel::FetchServerPublicKey() {
    return FetchServerPublicKey(config_.base_url);
}

Result<RsaPublicKey, KeywardFailure> HybridServerChannel::DownloadKey(const std::string& url) {
    if (!transport_) {
        return Result<RsaPublicKey, KeywardFailure>::Err(
            KeywardFailure::ServerKeyUnavailable("No HTTP transport configured"));
    }
    auto response = transport_->Get(url, config_.fetch_timeout);
    if (response.IsErr()) {
        return std::move(response).PropagateErr<RsaPublicKey>();
    }
    const auto& http = response.Unwrap();
    if (!IsSuccessStatus(http.status_code)) {
        return Result<RsaPublicKey, KeywardFailure>::Err(KeywardFailure::ServerKeyUnavailable(
            compat::format("Server public key endpoint returned HTTP {}", http.status_code)));
    }
    const json doc = json::parse(http.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<RsaPublicKey, KeywardFailure>::Err(
            KeywardFailure::Decode("Server public key response is not a JSON object"));
    }
    const auto field = doc.find(std::string(ServerApiConstants::PUBLIC_KEY_FIELD));
    if (field == doc.end() || !field->is_string()) {
        return Result<RsaPublicKey, KeywardFailure>::Err(KeywardFailure::Decode(
            compat::format("Server public key response lacks a '{}' string", ServerApiConstants::PUBLIC_KEY_FIELD)));
    }
    return KeyCodec::DecodePublicKeyPem(field->get<std::string>());
}

Result<ServerKeySource, KeywardFailure> HybridServerChannel::FetchLocked(const std::string& url) {
    auto downloaded = DownloadKey(url);
    if (downloaded.IsOk()) {
        auto pem = KeyCodec::EncodePublicKeyPem(downloaded.Unwrap());
        if (pem.IsErr()) {
            return std::move(pem).PropagateErr<ServerKeySource>();
        }
        if (auto written = store_.WriteString(StorageKeys::SERVER_PUBLIC_KEY_PEM, pem.Unwrap()); written.IsErr()) {
            return std::move(written).PropagateErr<ServerKeySource>();
        }
        server_key_.emplace(std::move(downloaded).Unwrap());
        KEYWARD_LOG_INFO(kComponent, "server public key fetched ({} bits)", server_key_->ModulusBits());
        return Result<ServerKeySource, KeywardFailure>::Ok(ServerKeySource::Network);
    }

    const KeywardFailure fetch_failure = ToFetchFailure(downloaded.UnwrapErr());
    KEYWARD_LOG_WARN(kComponent, "server key fetch from {} failed: {}", url, downloaded.UnwrapErr().ToString());
    if (auto cached = LoadCachedLocked(); cached.IsOk()) {
        KEYWARD_LOG_INFO(kComponent, "using cached server public key");
        return Result<ServerKeySource, KeywardFailure>::Ok(ServerKeySource::Cache);
    }
    if (server_key_.has_value()) {
        KEYWARD_LOG_INFO(kComponent, "keeping the server public key already in memory");
        return Result<ServerKeySource, KeywardFailure>::Ok(ServerKeySource::Cache);
    }
    return Result<ServerKeySource, KeywardFailure>::Err(fetch_failure);
}

Result<Unit, KeywardFailure> HybridServerChannel::LoadCachedServerKey() {
    std::lock_guard lock(mutex_);
    return LoadCachedLocked();
}

Result<Unit, KeywardFailure> HybridServerChannel::LoadCachedLocked() {
    auto stored = store_.ReadString(StorageKeys::SERVER_PUBLIC_KEY_PEM);
    if (stored.IsErr()) {
        return std::move(stored).PropagateErr<Unit>();
    }
    if (!stored.Unwrap().has_value()) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::ServerKeyUnavailable(std::string(ErrorMessages::SERVER_KEY_MISSING)));
    }
    auto decoded = KeyCodec::DecodePublicKeyPem(*stored.Unwrap());
    if (decoded.IsErr()) {
        KEYWARD_LOG_WARN(kComponent, "cached server key is invalid, deleting it: {}", decoded.UnwrapErr().ToString());
        server_key_.reset();
        if (auto deleted = store_.Delete(StorageKeys::SERVER_PUBLIC_KEY_PEM); deleted.IsErr()) {
            return deleted;
        }
        return std::move(decoded).PropagateErr<Unit>();
    }
    server_key_.emplace(std::move(decoded).Unwrap());
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<Unit, KeywardFailure> HybridServerChannel::EnsureKeyLocked() {
    if (server_key_.has_value()) {
        return Result<Unit, KeywardFailure>::Ok(unit);
    }
    if (LoadCachedLocked().IsOk()) {
        return Result<Unit, KeywardFailure>::Ok(unit);
    }
    if (config_.base_url.empty()) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::ServerKeyUnavailable(
            "No cached server key and no base URL to fetch one from"));
    }
    auto fetched = FetchLocked(config_.ServerPublicKeyUrl());
    if (fetched.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(KeywardFailure::ServerKeyUnavailable(
            compat::format("{}: {}", ErrorMessages::SERVER_KEY_MISSING, fetched.UnwrapErr().ToString())));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, KeywardFailure> HybridServerChannel::EncryptForServer(const std::span<const uint8_t> data) {
    std::lock_guard lock(mutex_);
    if (auto ready = EnsureKeyLocked(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::vector<uint8_t>>();
    }
    return RsaOaep::Encrypt(*server_key_, data);
}

Result<std::string, KeywardFailure> HybridServerChannel::ServerKeyFingerprint() {
    std::lock_guard lock(mutex_);
    if (auto ready = EnsureKeyLocked(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::string>();
    }
    auto der = KeyCodec::EncodePublicKeyDer(*server_key_);
    if (der.IsErr()) {
        return std::move(der).PropagateErr<std::string>();
    }
    return Result<std::string, KeywardFailure>::Ok(SodiumInterop::ToHex(SodiumInterop::Sha256(der.Unwrap())));
}

Result<std::string, KeywardFailure> HybridServerChannel::ServerPublicKeyPem() {
    std::lock_guard lock(mutex_);
    if (auto ready = EnsureKeyLocked(); ready.IsErr()) {
        return std::move(ready).PropagateErr<std::string>();
    }
    return KeyCodec::EncodePublicKeyPem(*server_key_);
}

Result<Unit, KeywardFailure> HybridServerChannel::InvalidateServerKey() {
    std::lock_guard lock(mutex_);
    server_key_.reset();
    return store_.Delete(StorageKeys::SERVER_PUBLIC_KEY_PEM);
}

} // namespace keyward::channel
