#pragma once

/**
 * @file session_store.hpp
 * @brief Upload session records on top of a key/value Cache
 *
 * PERSISTED LAYOUT:
 * One session occupies four independently expiring entries:
 *   tus-uploads/<resource_id>/filename    client-declared name
 *   tus-uploads/<resource_id>/file_size   declared total length (decimal)
 *   tus-uploads/<resource_id>/offset      bytes written so far (decimal)
 *   tus-uploads/<resource_id>/metadata    JSON object, values base64 encoded
 *
 * A session exists only while all four entries are live. Losing any one of
 * them (expiry, partial eviction) makes the whole session not-found.
 *
 * OFFSET MUTATION:
 * increment_offset() is the only way the offset changes after creation.
 * It goes through Cache::incr(), which is atomic per key, and then renews
 * the TTL of all four entries so they expire together after a period of
 * inactivity.
 */

#include "tus/core/error.hpp"
#include "tus/store/cache.hpp"
#include "tus/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tus {
namespace store {

class SessionStore {
public:
    static constexpr const char* kKeyPrefix = "tus-uploads/";

    SessionStore(Cache& cache, std::chrono::seconds ttl);

    /**
     * Write a fresh session record (offset 0)
     *
     * Each field is written add-if-absent, so a concurrent session that
     * happens to use the same id is never overwritten.
     *
     * @return true on success, false if any field already existed
     */
    UploadResult<bool> create(const std::string& resource_id,
                              const std::string& filename,
                              std::uint64_t total_size,
                              const upload::Metadata& metadata);

    /**
     * @return consistent snapshot, or std::nullopt when any field is missing
     */
    UploadResult<std::optional<upload::UploadSession>> get(const std::string& resource_id) const;

    /**
     * Atomically add delta to the stored offset and refresh the session TTL
     *
     * @return post-increment offset; ErrorCode::Gone if the record vanished
     */
    UploadResult<std::uint64_t> increment_offset(const std::string& resource_id, std::uint64_t delta);

    /**
     * Remove every field of the session. Idempotent.
     */
    UploadResult<void> delete_session(const std::string& resource_id);

    static std::string key(const std::string& resource_id, const char* field);

private:
    std::vector<std::string> all_keys(const std::string& resource_id) const;

    Cache& cache_;
    std::chrono::seconds ttl_;
};

} // namespace store
} // namespace tus
