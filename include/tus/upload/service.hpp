#pragma once

#include "tus/core/error.hpp"
#include "tus/core/keyed_mutex.hpp"
#include "tus/events/event_bus.hpp"
#include "tus/store/session_store.hpp"
#include "tus/upload/chunk_writer.hpp"
#include "tus/upload/types.hpp"

#include <boost/uuid/random_generator.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tus::upload {

/**
 * @brief Resumable upload state machine
 *
 * Created -> InProgress -> Completed. An id whose record is gone (never
 * existed, expired, finished, terminated) answers ErrorCode::Gone for
 * every operation.
 *
 * Append, terminate and the orphan sweep run inside a per-resource
 * exclusive section, so the read-offset / compare / write / increment
 * sequence of one upload is never interleaved with another request for
 * the same upload. Requests for different uploads proceed in parallel.
 */
class UploadService {
public:
    UploadService(UploadConfig config,
                  store::SessionStore& sessions,
                  ChunkWriter& writer,
                  events::EventBus& bus);

    /**
     * @return the new resource id
     */
    UploadResult<std::string> create_upload(const std::string& filename,
                                            std::uint64_t total_size,
                                            const Metadata& metadata);

    UploadResult<UploadStatus> status(const std::string& resource_id) const;

    /**
     * Write bytes at request_offset, which must equal the stored offset
     *
     * @return offset after the write
     */
    UploadResult<std::uint64_t> append(const std::string& resource_id,
                                       std::uint64_t request_offset,
                                       const std::vector<std::uint8_t>& bytes);

    /**
     * Advisory check for a finished file named filename (case-insensitive)
     *
     * Looks at the destination directory only and can race with concurrent
     * uploads finishing; a negative answer is no guarantee.
     */
    ProbeResult probe_existence(const std::string& filename) const;

    UploadResult<void> terminate(const std::string& resource_id);

    /**
     * Delete temporary files older than min_age that no longer have a
     * session record
     *
     * @return number of files removed
     */
    UploadResult<std::size_t> reap_orphans(std::chrono::seconds min_age);

    const UploadConfig& config() const noexcept { return config_; }

    static bool is_valid_resource_id(const std::string& resource_id);

    /**
     * Strip directories and unusable names from a client-supplied filename
     */
    static std::string sanitize_filename(const std::string& filename);

private:
    UploadResult<std::filesystem::path> complete(const UploadSession& session);

    bool destination_has(const std::string& filename) const;

    std::string generate_id();

    UploadConfig config_;
    store::SessionStore& sessions_;
    ChunkWriter& writer_;
    events::EventBus& event_bus_;

    KeyedMutex locks_;

    std::mutex generator_mutex_;
    boost::uuids::random_generator generator_;
};

} // namespace tus::upload
