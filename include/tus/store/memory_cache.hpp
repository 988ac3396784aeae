#pragma once

/**
 * @file memory_cache.hpp
 * @brief Thread-safe in-memory Cache with per-key expiry
 *
 * INTERNAL DATA STRUCTURE:
 * std::unordered_map<std::string, Entry>
 *   Key:   cache key (e.g. "tus-uploads/<id>/offset")
 *   Value: stored string + absolute expiry on a steady clock
 *
 * CONCURRENCY MODEL:
 * Uses a reader-writer lock (std::shared_mutex):
 * - get(): shared_lock (concurrent readers)
 * - add(), incr(), touch(), remove_many(), sweep_expired(): unique_lock
 *
 * Because incr() runs entirely under the exclusive lock, two concurrent
 * increments on the same key are linearized and neither update is lost.
 *
 * EXPIRY:
 * Expired entries behave exactly like absent ones. They are physically
 * dropped lazily (when a writer touches the key) or in bulk by
 * sweep_expired(), which the server calls periodically.
 *
 * EXAMPLE USAGE:
 * MemoryCache cache;
 * cache.add("counter", "0", std::chrono::seconds{60});
 * auto next = cache.incr("counter", 5);   // next.value() == 5
 */

#include "tus/store/cache.hpp"

#include <chrono>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tus {
namespace store {

class MemoryCache : public Cache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * @param clock Time source; tests inject a controllable one
     */
    explicit MemoryCache(ClockFn clock = [] { return Clock::now(); });

    UploadResult<bool> add(const std::string& key,
                           const std::string& value,
                           std::chrono::seconds ttl) override;

    UploadResult<std::optional<std::string>> get(const std::string& key) const override;

    UploadResult<std::int64_t> incr(const std::string& key, std::int64_t delta) override;

    UploadResult<bool> touch(const std::string& key, std::chrono::seconds ttl) override;

    UploadResult<void> remove_many(const std::vector<std::string>& keys) override;

    /**
     * Drop every expired entry
     *
     * @return number of entries removed
     */
    std::size_t sweep_expired();

    /**
     * Number of stored entries, expired ones included until swept
     */
    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        Clock::time_point expires_at;
    };

    bool is_live(const Entry& entry, Clock::time_point now) const {
        return now < entry.expires_at;
    }

    ClockFn clock_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace store
} // namespace tus
