#include "tus/store/memory_cache.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <mutex>

namespace tus {
namespace store {

namespace {

bool parse_int64(const std::string& text, std::int64_t& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last && !text.empty();
}

} // namespace

MemoryCache::MemoryCache(ClockFn clock)
    : clock_(std::move(clock)) {
}

UploadResult<bool> MemoryCache::add(const std::string& key,
                                    const std::string& value,
                                    std::chrono::seconds ttl) {
    std::unique_lock lock(mutex_);
    const auto now = clock_();

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (is_live(it->second, now)) {
            return Ok<bool, Error>(false);
        }
        // Stale entry occupies the slot, replace it
        entries_.erase(it);
    }

    entries_.emplace(key, Entry{value, now + ttl});
    return Ok<bool, Error>(true);
}

UploadResult<std::optional<std::string>> MemoryCache::get(const std::string& key) const {
    std::shared_lock lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || !is_live(it->second, clock_())) {
        return Ok<std::optional<std::string>, Error>(std::nullopt);
    }
    return Ok<std::optional<std::string>, Error>(it->second.value);
}

UploadResult<std::int64_t> MemoryCache::incr(const std::string& key, std::int64_t delta) {
    std::unique_lock lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || !is_live(it->second, clock_())) {
        return fail<std::int64_t>(ErrorCode::Gone, "Key not found: " + key);
    }

    std::int64_t current = 0;
    if (!parse_int64(it->second.value, current)) {
        return fail<std::int64_t>(ErrorCode::InternalError, "Value is not an integer: " + key);
    }

    const std::int64_t next = current + delta;
    it->second.value = std::to_string(next);
    return Ok<std::int64_t, Error>(next);
}

UploadResult<bool> MemoryCache::touch(const std::string& key, std::chrono::seconds ttl) {
    std::unique_lock lock(mutex_);
    const auto now = clock_();

    auto it = entries_.find(key);
    if (it == entries_.end() || !is_live(it->second, now)) {
        return Ok<bool, Error>(false);
    }
    it->second.expires_at = now + ttl;
    return Ok<bool, Error>(true);
}

UploadResult<void> MemoryCache::remove_many(const std::vector<std::string>& keys) {
    std::unique_lock lock(mutex_);
    for (const auto& key : keys) {
        entries_.erase(key);
    }
    return Ok<Error>();
}

std::size_t MemoryCache::sweep_expired() {
    std::unique_lock lock(mutex_);
    const auto now = clock_();

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!is_live(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("Cache sweep dropped {} expired entries", removed);
    }
    return removed;
}

std::size_t MemoryCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace store
} // namespace tus
