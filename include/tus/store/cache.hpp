#pragma once

/**
 * @file cache.hpp
 * @brief Key/value cache contract used to hold upload session records
 *
 * WHAT IT PROVIDES:
 * A small subset of what memcached or a Django cache offers, and exactly
 * what the session store needs:
 * - add():          write only if the key is absent (never overwrites)
 * - get():          read a live (non-expired) value
 * - incr():         atomic integer add, returns the post-increment value
 * - touch():        push a key's expiry out by a new TTL
 * - remove_many():  delete a batch of keys, missing keys are ignored
 *
 * HOW IT INTEGRATES:
 * - SessionStore (store/session_store.hpp) maps one upload onto four keys
 * - MemoryCache (store/memory_cache.hpp) is the in-process backend
 * - A networked backend only has to implement this interface
 *
 * ERROR MODEL:
 * Every call returns a Result. An error means the backend itself failed
 * (unreachable, corrupted); "key not found" is a normal outcome and is
 * reported through the value (false / std::nullopt), except for incr()
 * where a missing key is an error with ErrorCode::Gone.
 */

#include "tus/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tus {
namespace store {

class Cache {
public:
    virtual ~Cache() = default;

    /**
     * Store value under key unless a live entry already exists
     *
     * @return true when the value was written, false when the key was taken
     */
    virtual UploadResult<bool> add(const std::string& key,
                                   const std::string& value,
                                   std::chrono::seconds ttl) = 0;

    /**
     * @return the value, or std::nullopt when absent or expired
     */
    virtual UploadResult<std::optional<std::string>> get(const std::string& key) const = 0;

    /**
     * Atomically add delta to an integer value
     *
     * Fails with ErrorCode::Gone when the key is absent or expired, and with
     * ErrorCode::InternalError when the stored value is not an integer.
     * The entry keeps its current expiry.
     */
    virtual UploadResult<std::int64_t> incr(const std::string& key, std::int64_t delta) = 0;

    /**
     * Reset the expiry of a live key to now + ttl
     *
     * @return false when the key is absent or expired
     */
    virtual UploadResult<bool> touch(const std::string& key, std::chrono::seconds ttl) = 0;

    virtual UploadResult<void> remove_many(const std::vector<std::string>& keys) = 0;
};

} // namespace store
} // namespace tus
