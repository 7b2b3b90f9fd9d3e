#include "keyward/storage/secure_key_store.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/logger.hpp"
#include <exception>

namespace keyward::storage {

namespace {
    constexpr std::string_view kComponent = "storage";

    template<typename T, typename F>
    Result<T, KeywardFailure> GuardBackendCall(std::string_view operation, F&& call) {
        try {
            return std::forward<F>(call)();
        } catch (const std::exception& ex) {
            return Result<T, KeywardFailure>::Err(KeywardFailure::Storage(
                compat::format("Secure backend threw during {}: {}", operation, ex.what())));
        }
    }
}

SecureBackendStrategy::SecureBackendStrategy(std::shared_ptr<interfaces::ISecureBackend> backend)
    : backend_(std::move(backend)) {
}

Result<std::optional<std::vector<uint8_t>>, KeywardFailure>
SecureBackendStrategy::Read(const std::string_view key) {
    return GuardBackendCall<std::optional<std::vector<uint8_t>>>("read", [&] {
        return backend_->Read(key);
    });
}

Result<Unit, KeywardFailure> SecureBackendStrategy::Write(
    const std::string_view key,
    const std::span<const uint8_t> value) {
    return GuardBackendCall<Unit>("write", [&] {
        return backend_->Write(key, value);
    });
}

Result<Unit, KeywardFailure> SecureBackendStrategy::Delete(const std::string_view key) {
    return GuardBackendCall<Unit>("delete", [&] {
        return backend_->Delete(key);
    });
}

MemoryFallbackStrategy::MemoryFallbackStrategy(std::string reason)
    : reason_(std::move(reason)) {
}

std::optional<std::vector<uint8_t>> MemoryFallbackStrategy::Read(const std::string_view key) const {
    if (const auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void MemoryFallbackStrategy::Write(const std::string_view key, const std::span<const uint8_t> value) {
    entries_.insert_or_assign(std::string(key), std::vector<uint8_t>(value.begin(), value.end()));
}

void MemoryFallbackStrategy::Delete(const std::string_view key) {
    if (const auto it = entries_.find(key); it != entries_.end()) {
        entries_.erase(it);
    }
}

SecureKeyStore::SecureKeyStore(std::shared_ptr<interfaces::ISecureBackend> backend)
    : strategy_(std::in_place_type<SecureBackendStrategy>, std::move(backend)) {
}

SecureKeyStore::SecureKeyStore(MemoryFallbackStrategy memory)
    : strategy_(std::in_place_type<MemoryFallbackStrategy>, std::move(memory)) {
}

std::unique_ptr<SecureKeyStore> SecureKeyStore::InMemory() {
    return std::unique_ptr<SecureKeyStore>(
        new SecureKeyStore(MemoryFallbackStrategy("No secure backend configured")));
}

void SecureKeyStore::Degrade(
    const std::string_view operation,
    const std::string_view key,
    const std::string& reason) {
    KEYWARD_LOG_WARN(kComponent,
        "secure backend failed during {} of '{}', switching to in-memory storage: {}",
        operation, key, reason);
    strategy_.emplace<MemoryFallbackStrategy>(reason);
}

Result<std::optional<std::vector<uint8_t>>, KeywardFailure> SecureKeyStore::Read(const std::string_view key) {
    std::lock_guard lock(mutex_);
    if (auto* backend = std::get_if<SecureBackendStrategy>(&strategy_)) {
        auto result = backend->Read(key);
        if (result.IsOk()) {
            return result;
        }
        Degrade("read", key, result.UnwrapErr().ToString());
    }
    return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(
        std::get<MemoryFallbackStrategy>(strategy_).Read(key));
}

Result<Unit, KeywardFailure> SecureKeyStore::Write(
    const std::string_view key,
    const std::span<const uint8_t> value) {
    std::lock_guard lock(mutex_);
    if (auto* backend = std::get_if<SecureBackendStrategy>(&strategy_)) {
        auto result = backend->Write(key, value);
        if (result.IsOk()) {
            return result;
        }
        Degrade("write", key, result.UnwrapErr().ToString());
    }
    std::get<MemoryFallbackStrategy>(strategy_).Write(key, value);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<Unit, KeywardFailure> SecureKeyStore::Delete(const std::string_view key) {
    std::lock_guard lock(mutex_);
    if (auto* backend = std::get_if<SecureBackendStrategy>(&strategy_)) {
        auto result = backend->Delete(key);
        if (result.IsOk()) {
            return result;
        }
        Degrade("delete", key, result.UnwrapErr().ToString());
    }
    std::get<MemoryFallbackStrategy>(strategy_).Delete(key);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::optional<std::string>, KeywardFailure> SecureKeyStore::ReadString(const std::string_view key) {
    auto read_result = Read(key);
    if (read_result.IsErr()) {
        return std::move(read_result).PropagateErr<std::optional<std::string>>();
    }
    const auto& bytes = read_result.Unwrap();
    if (!bytes.has_value()) {
        return Result<std::optional<std::string>, KeywardFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::string>, KeywardFailure>::Ok(
        std::string(bytes->begin(), bytes->end()));
}

Result<Unit, KeywardFailure> SecureKeyStore::WriteString(const std::string_view key, const std::string_view value) {
    const std::span<const uint8_t> bytes(
        reinterpret_cast<const uint8_t*>(value.data()), value.size());
    return Write(key, bytes);
}

bool SecureKeyStore::IsEphemeral() const {
    std::lock_guard lock(mutex_);
    return std::holds_alternative<MemoryFallbackStrategy>(strategy_);
}

std::optional<std::string> SecureKeyStore::DegradationReason() const {
    std::lock_guard lock(mutex_);
    if (const auto* memory = std::get_if<MemoryFallbackStrategy>(&strategy_)) {
        return memory->Reason();
    }
    return std::nullopt;
}

} // namespace keyward::storage
