#include "keyward/identity/conversation_key_cache.hpp"
#include <chrono>

namespace keyward::identity {

ConversationKeyCache::KeyResult ConversationKeyCache::GetOrCreate(
    const std::string_view conversation_id,
    const KeyFactory& factory) {
    std::promise<KeyResult> promise;
    uint64_t serial = 0;
    {
        std::unique_lock lock(mutex_);
        if (const auto it = entries_.find(conversation_id); it != entries_.end()) {
            std::shared_future<KeyResult> pending = it->second.future;
            lock.unlock();
            return pending.get();
        }
        serial = next_serial_++;
        entries_.emplace(std::string(conversation_id), Entry{promise.get_future().share(), serial});
    }

    KeyResult created = factory();
    if (created.IsErr()) {
        std::lock_guard lock(mutex_);
        if (const auto it = entries_.find(conversation_id);
            it != entries_.end() && it->second.serial == serial) {
            entries_.erase(it);
        }
    }
    promise.set_value(created);
    return created;
}

std::optional<std::vector<uint8_t>> ConversationKeyCache::Find(const std::string_view conversation_id) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(conversation_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto& future = it->second.future;
    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    const KeyResult& result = future.get();
    if (result.IsErr()) {
        return std::nullopt;
    }
    return result.Unwrap();
}

void ConversationKeyCache::Clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t ConversationKeyCache::Size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace keyward::identity
