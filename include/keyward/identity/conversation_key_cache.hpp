#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::identity {

/**
 * @brief Process-lifetime cache of per-conversation AES keys
 *
 * GetOrCreate memoizes one in-flight future per conversation id: concurrent
 * callers for the same id run the factory once and all observe its result.
 * A failed creation is not cached, so the next call retries.
 */
class ConversationKeyCache {
public:
    using KeyResult = Result<std::vector<uint8_t>, KeywardFailure>;
    using KeyFactory = std::function<KeyResult()>;

    ConversationKeyCache() = default;
    ConversationKeyCache(const ConversationKeyCache&) = delete;
    ConversationKeyCache& operator=(const ConversationKeyCache&) = delete;

    [[nodiscard]] KeyResult GetOrCreate(std::string_view conversation_id, const KeyFactory& factory);

    /// Completed key for `conversation_id`, if any.
    [[nodiscard]] std::optional<std::vector<uint8_t>> Find(std::string_view conversation_id) const;

    void Clear();

    [[nodiscard]] size_t Size() const;

private:
    struct Entry {
        std::shared_future<KeyResult> future;
        uint64_t serial;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
    uint64_t next_serial_ = 0;
};

} // namespace keyward::identity
