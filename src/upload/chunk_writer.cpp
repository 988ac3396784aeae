#include "tus/upload/chunk_writer.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace tus::upload {
namespace fs = std::filesystem;

ChunkWriter::ChunkWriter(fs::path upload_dir)
    : upload_dir_(std::move(upload_dir)) {
}

fs::path ChunkWriter::path_for(const std::string& resource_id) const {
    return upload_dir_ / resource_id;
}

bool ChunkWriter::exists(const std::string& resource_id) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(resource_id), ec);
}

UploadResult<void> ChunkWriter::preallocate(const std::string& resource_id, std::uint64_t total_size) const {
    if (auto res = ensure_directory(upload_dir_); res.is_error()) {
        return res;
    }

    const auto path = path_for(resource_id);
    {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return fail<void>(ErrorCode::InternalError, "Failed to create upload file: " + path.string());
        }
    }

    // Sparse extension to the declared size; later writes never grow the file
    std::error_code ec;
    fs::resize_file(path, total_size, ec);
    if (ec) {
        fs::remove(path, ec);
        return fail<void>(ErrorCode::InternalError,
                          "Failed to allocate " + std::to_string(total_size) + " bytes for " + path.string());
    }

    spdlog::debug("Preallocated {} ({} bytes)", path.string(), total_size);
    return Ok<Error>();
}

UploadResult<void> ChunkWriter::write_at(const std::string& resource_id,
                                         std::uint64_t position,
                                         const std::vector<std::uint8_t>& bytes) const {
    const auto path = path_for(resource_id);
    if (!exists(resource_id)) {
        return fail<void>(ErrorCode::Gone, "Upload file missing: " + path.string());
    }

    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return fail<void>(ErrorCode::InternalError, "Failed to open upload file: " + path.string());
    }

    file.seekp(static_cast<std::streamoff>(position));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        return fail<void>(ErrorCode::InternalError,
                          "Failed to write " + std::to_string(bytes.size()) + " bytes at " +
                          std::to_string(position) + " in " + path.string());
    }

    return Ok<Error>();
}

UploadResult<fs::path> ChunkWriter::finalize(const std::string& resource_id,
                                             const fs::path& destination_dir,
                                             const std::string& final_name) const {
    const auto source = path_for(resource_id);
    if (!exists(resource_id)) {
        return fail<fs::path>(ErrorCode::Gone, "Upload file missing: " + source.string());
    }

    if (auto res = ensure_directory(destination_dir); res.is_error()) {
        return Err<fs::path, Error>(res.error());
    }

    const fs::path destination = destination_dir / final_name;

    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return Ok<fs::path, Error>(destination);
    }

    if (ec != std::errc::cross_device_link) {
        return fail<fs::path>(ErrorCode::InternalError,
                              "Failed to move " + source.string() + " to " + destination.string() + ": " + ec.message());
    }

    spdlog::debug("Cross-device finalize of {}, copying", source.string());

    const auto expected = fs::file_size(source, ec);
    if (ec) {
        return fail<fs::path>(ErrorCode::InternalError, "Failed to stat " + source.string());
    }

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(destination, ec);
        return fail<fs::path>(ErrorCode::InternalError, "Failed to copy " + source.string() + " to " + destination.string());
    }

    const auto copied = fs::file_size(destination, ec);
    if (ec || copied != expected) {
        fs::remove(destination, ec);
        return fail<fs::path>(ErrorCode::InternalError, "Copy verification failed for " + destination.string());
    }

    fs::remove(source, ec);
    if (ec) {
        spdlog::warn("Finalized {} but could not remove {}: {}", destination.string(), source.string(), ec.message());
    }
    return Ok<fs::path, Error>(destination);
}

UploadResult<void> ChunkWriter::remove(const std::string& resource_id) const {
    std::error_code ec;
    fs::remove(path_for(resource_id), ec);
    if (ec) {
        return fail<void>(ErrorCode::InternalError, "Failed to remove upload file for " + resource_id + ": " + ec.message());
    }
    return Ok<Error>();
}

UploadResult<std::vector<TemporaryFile>> ChunkWriter::list_temporary_files() const {
    std::vector<TemporaryFile> files;

    std::error_code ec;
    if (!fs::exists(upload_dir_, ec)) {
        return Ok<std::vector<TemporaryFile>, Error>(std::move(files));
    }

    fs::directory_iterator it(upload_dir_, ec);
    if (ec) {
        return fail<std::vector<TemporaryFile>>(ErrorCode::InternalError,
                                                "Failed to list " + upload_dir_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto last_write = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        files.push_back(TemporaryFile{entry.path().filename().string(), entry.path(), last_write});
    }

    return Ok<std::vector<TemporaryFile>, Error>(std::move(files));
}

UploadResult<void> ChunkWriter::ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!fs::is_directory(dir, ec)) {
        return fail<void>(ErrorCode::InternalError, "Failed to create directory: " + dir.string());
    }
    return Ok<Error>();
}

} // namespace tus::upload
