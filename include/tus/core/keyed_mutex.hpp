#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tus {

/**
 * @brief A table of mutexes addressed by string key
 *
 * lock(key) blocks until no other holder owns the same key. Holders of
 * different keys never contend beyond the short table lookup. Entries are
 * reference counted and dropped once the last waiter releases them, so the
 * table only ever holds keys that are currently locked or awaited.
 *
 * EXAMPLE:
 * KeyedMutex locks;
 * {
 *     auto guard = locks.lock(resource_id);
 *     // read offset, write chunk, increment offset
 * }   // released here
 */
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        std::size_t refs = 0;
    };

public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

        const std::string& key() const noexcept { return key_; }

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key, Entry* entry);

        KeyedMutex* owner_;
        std::string key_;
        Entry* entry_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    [[nodiscard]] Guard lock(const std::string& key);

    // Number of keys currently held or awaited
    std::size_t size() const;

private:
    void release(const std::string& key, Entry* entry);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace tus
