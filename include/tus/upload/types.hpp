#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace tus::upload {

/**
 * @brief Decoded Upload-Metadata pairs (key -> raw decoded bytes)
 */
using Metadata = std::map<std::string, std::string>;

enum class UploadState {
    Created,     ///< File preallocated, nothing written yet
    InProgress,  ///< 0 < offset < total_size
    Completed    ///< Terminal: record deleted, file moved
};

/**
 * @brief Snapshot of one upload session as held by the session store
 */
struct UploadSession {
    std::string resource_id;
    std::string filename;        ///< Client-declared, untrusted
    std::uint64_t total_size = 0;
    std::uint64_t offset = 0;
    Metadata metadata;

    [[nodiscard]] UploadState state() const noexcept {
        if (offset == 0 && total_size > 0) {
            return UploadState::Created;
        }
        return offset < total_size ? UploadState::InProgress : UploadState::Completed;
    }
};

/**
 * @brief Reply to a status query
 */
struct UploadStatus {
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    Metadata metadata;
};

/**
 * @brief Reply to an existence probe
 */
struct ProbeResult {
    bool exists = false;
    std::string filename;        ///< Echo of the probed name
};

/**
 * @brief Immutable settings handed to the upload service at construction
 */
struct UploadConfig {
    std::filesystem::path upload_dir;         ///< Working area for temporary files
    std::filesystem::path destination_dir;    ///< Where finished files land
    std::string upload_url = "/files/";       ///< Base path of the upload endpoint
    std::uint64_t max_file_size = 4294967296ULL;
    bool allow_overwrite = true;
    std::chrono::seconds session_ttl{3600};
};

} // namespace tus::upload
