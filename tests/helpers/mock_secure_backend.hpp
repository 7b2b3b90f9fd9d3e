#pragma once
#include "keyward/interfaces/i_secure_backend.hpp"
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace keyward::test_helpers {

using interfaces::ISecureBackend;

class MockSecureBackend : public ISecureBackend {
public:
    enum class FailureMode {
        None,
        ReturnError,
        Throw
    };

    MockSecureBackend() = default;

    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, KeywardFailure> Read(std::string_view key) override {
        ++read_count_;
        if (auto failure = InjectedFailure("read"); failure.has_value()) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Err(*failure);
        }
        std::lock_guard lock(mutex_);
        if (const auto it = entries_.find(std::string(key)); it != entries_.end()) {
            return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(it->second);
        }
        return Result<std::optional<std::vector<uint8_t>>, KeywardFailure>::Ok(std::nullopt);
    }

    [[nodiscard]] Result<Unit, KeywardFailure> Write(std::string_view key, std::span<const uint8_t> value) override {
        ++write_count_;
        if (write_delay_.count() > 0) {
            std::this_thread::sleep_for(write_delay_);
        }
        if (auto failure = InjectedFailure("write"); failure.has_value()) {
            return Result<Unit, KeywardFailure>::Err(*failure);
        }
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = std::vector<uint8_t>(value.begin(), value.end());
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, KeywardFailure> Delete(std::string_view key) override {
        ++delete_count_;
        if (auto failure = InjectedFailure("delete"); failure.has_value()) {
            return Result<Unit, KeywardFailure>::Err(*failure);
        }
        std::lock_guard lock(mutex_);
        entries_.erase(std::string(key));
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    void SetFailureMode(const FailureMode mode) noexcept {
        failure_mode_ = mode;
    }

    void SetWriteDelay(const std::chrono::milliseconds delay) noexcept {
        write_delay_ = delay;
    }

    void Seed(const std::string& key, const std::string& value) {
        std::lock_guard lock(mutex_);
        entries_[key] = std::vector<uint8_t>(value.begin(), value.end());
    }

    [[nodiscard]] std::optional<std::string> Peek(const std::string& key) const {
        std::lock_guard lock(mutex_);
        if (const auto it = entries_.find(key); it != entries_.end()) {
            return std::string(it->second.begin(), it->second.end());
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t EntryCount() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] size_t ReadCount() const noexcept { return read_count_; }
    [[nodiscard]] size_t WriteCount() const noexcept { return write_count_; }
    [[nodiscard]] size_t DeleteCount() const noexcept { return delete_count_; }

private:
    std::optional<KeywardFailure> InjectedFailure(const std::string& operation) const {
        switch (failure_mode_.load()) {
            case FailureMode::None:
                return std::nullopt;
            case FailureMode::ReturnError:
                return KeywardFailure::Storage("Mock backend: injected " + operation + " failure");
            case FailureMode::Throw:
                throw std::runtime_error("Mock backend: keychain unavailable during " + operation);
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> entries_;
    std::atomic<FailureMode> failure_mode_{FailureMode::None};
    std::chrono::milliseconds write_delay_{0};
    std::atomic<size_t> read_count_{0};
    std::atomic<size_t> write_count_{0};
    std::atomic<size_t> delete_count_{0};
};

} // namespace keyward::test_helpers
