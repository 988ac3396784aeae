#pragma once

#include "tus/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tus::upload {

/**
 * @brief A temporary file found in the working area
 */
struct TemporaryFile {
    std::string resource_id;
    std::filesystem::path path;
    std::filesystem::file_time_type last_write{};
};

class ChunkWriter {
public:
    explicit ChunkWriter(std::filesystem::path upload_dir);

    UploadResult<void> preallocate(const std::string& resource_id, std::uint64_t total_size) const;

    UploadResult<void> write_at(const std::string& resource_id,
                                std::uint64_t position,
                                const std::vector<std::uint8_t>& bytes) const;

    /**
     * Move the temporary file to destination_dir / final_name
     *
     * Same-volume moves are a single rename. Across volumes the file is
     * copied, the copy's size verified, and only then is the source removed.
     *
     * @return path of the finalized file
     */
    UploadResult<std::filesystem::path> finalize(const std::string& resource_id,
                                                 const std::filesystem::path& destination_dir,
                                                 const std::string& final_name) const;

    [[nodiscard]] bool exists(const std::string& resource_id) const;

    UploadResult<void> remove(const std::string& resource_id) const;

    UploadResult<std::vector<TemporaryFile>> list_temporary_files() const;

    [[nodiscard]] std::filesystem::path path_for(const std::string& resource_id) const;

private:
    static UploadResult<void> ensure_directory(const std::filesystem::path& dir);

    std::filesystem::path upload_dir_;
};

} // namespace tus::upload
