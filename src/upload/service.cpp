#include "tus/upload/service.hpp"
#include "tus/events/events.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace tus::upload {
namespace fs = std::filesystem;
namespace {

constexpr std::size_t kTokenLength = 32;

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// Finished files are stored as "<32 hex>_<name>"; recover <name>
std::string strip_final_prefix(const std::string& stored) {
    if (stored.size() > kTokenLength + 1 && stored[kTokenLength] == '_' &&
        std::all_of(stored.begin(), stored.begin() + kTokenLength, is_hex)) {
        return stored.substr(kTokenLength + 1);
    }
    return stored;
}

} // namespace

UploadService::UploadService(UploadConfig config,
                             store::SessionStore& sessions,
                             ChunkWriter& writer,
                             events::EventBus& bus)
    : config_(std::move(config)),
      sessions_(sessions),
      writer_(writer),
      event_bus_(bus) {
}

bool UploadService::is_valid_resource_id(const std::string& resource_id) {
    if (resource_id.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < resource_id.size(); ++i) {
        const char c = resource_id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
        } else if (!is_hex(c)) {
            return false;
        }
    }
    return true;
}

std::string UploadService::sanitize_filename(const std::string& filename) {
    std::string name = filename;
    std::replace(name.begin(), name.end(), '\\', '/');
    name = fs::path(name).filename().string();

    name.erase(std::remove_if(name.begin(), name.end(),
                              [](char c) { return static_cast<unsigned char>(c) < 0x20; }),
               name.end());

    if (name.empty() || name == "." || name == "..") {
        return "upload";
    }
    return name;
}

std::string UploadService::generate_id() {
    std::lock_guard lock(generator_mutex_);
    return boost::uuids::to_string(generator_());
}

UploadResult<std::string> UploadService::create_upload(const std::string& filename,
                                                       std::uint64_t total_size,
                                                       const Metadata& metadata) {
    if (total_size > config_.max_file_size) {
        return fail<std::string>(ErrorCode::TooLarge,
                                 "Upload-Length " + std::to_string(total_size) + " exceeds maximum of " +
                                 std::to_string(config_.max_file_size));
    }

    if (!config_.allow_overwrite && !filename.empty() && destination_has(filename)) {
        return fail<std::string>(ErrorCode::Conflict, "File already exists: " + filename);
    }

    const auto resource_id = generate_id();

    auto stored = sessions_.create(resource_id, filename, total_size, metadata);
    if (stored.is_error()) {
        return Err<std::string, Error>(stored.error());
    }
    if (!stored.value()) {
        return fail<std::string>(ErrorCode::InternalError, "Session id collision: " + resource_id);
    }

    // The record is left behind on failure; the missing file makes it Gone
    auto allocated = writer_.preallocate(resource_id, total_size);
    if (allocated.is_error()) {
        spdlog::error("Preallocation failed for {}: {}", resource_id, allocated.error().message);
        return Err<std::string, Error>(allocated.error());
    }

    event_bus_.emit(events::UploadCreatedEvent{resource_id, filename, total_size});

    if (total_size == 0) {
        auto guard = locks_.lock(resource_id);
        UploadSession session{resource_id, filename, 0, 0, metadata};
        auto completed = complete(session);
        if (completed.is_error()) {
            return Err<std::string, Error>(completed.error());
        }
    }

    return Ok<std::string, Error>(resource_id);
}

UploadResult<UploadStatus> UploadService::status(const std::string& resource_id) const {
    if (!is_valid_resource_id(resource_id)) {
        return fail<UploadStatus>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }

    auto snapshot = sessions_.get(resource_id);
    if (snapshot.is_error()) {
        return Err<UploadStatus, Error>(snapshot.error());
    }
    if (!snapshot.value() || !writer_.exists(resource_id)) {
        return fail<UploadStatus>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }

    const auto& session = *snapshot.value();
    return Ok<UploadStatus, Error>(UploadStatus{session.offset, session.total_size, session.metadata});
}

UploadResult<std::uint64_t> UploadService::append(const std::string& resource_id,
                                                  std::uint64_t request_offset,
                                                  const std::vector<std::uint8_t>& bytes) {
    if (!is_valid_resource_id(resource_id)) {
        return fail<std::uint64_t>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }

    auto guard = locks_.lock(resource_id);

    auto snapshot = sessions_.get(resource_id);
    if (snapshot.is_error()) {
        return Err<std::uint64_t, Error>(snapshot.error());
    }
    if (!snapshot.value() || !writer_.exists(resource_id)) {
        return fail<std::uint64_t>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }
    const UploadSession session = std::move(*snapshot.value());

    if (request_offset != session.offset) {
        spdlog::debug("Offset mismatch for {}: client={} server={}", resource_id, request_offset, session.offset);
        return fail<std::uint64_t>(ErrorCode::Conflict,
                                   "Upload-Offset " + std::to_string(request_offset) +
                                   " does not match current offset " + std::to_string(session.offset));
    }

    if (bytes.size() > session.total_size - session.offset) {
        return fail<std::uint64_t>(ErrorCode::Conflict,
                                   "Chunk of " + std::to_string(bytes.size()) + " bytes at offset " +
                                   std::to_string(session.offset) + " exceeds Upload-Length " +
                                   std::to_string(session.total_size));
    }

    if (bytes.empty()) {
        return Ok<std::uint64_t, Error>(session.offset);
    }

    auto written = writer_.write_at(resource_id, request_offset, bytes);
    if (written.is_error()) {
        return Err<std::uint64_t, Error>(written.error());
    }

    auto incremented = sessions_.increment_offset(resource_id, bytes.size());
    if (incremented.is_error()) {
        return Err<std::uint64_t, Error>(incremented.error());
    }

    const std::uint64_t new_offset = incremented.value();
    const std::uint64_t expected = session.offset + bytes.size();
    if (new_offset != expected) {
        // Offset was changed outside this service; the file no longer matches the record
        spdlog::error("Offset accounting diverged for {}: expected {} got {}", resource_id, expected, new_offset);
        auto dropped = sessions_.delete_session(resource_id);
        if (dropped.is_error()) {
            spdlog::error("Failed to drop session {}: {}", resource_id, dropped.error().message);
        }
        auto removed = writer_.remove(resource_id);
        if (removed.is_error()) {
            spdlog::error("Failed to remove file of {}: {}", resource_id, removed.error().message);
        }
        return fail<std::uint64_t>(ErrorCode::InternalError, "Upload " + resource_id + " is no longer consistent");
    }

    event_bus_.emit(events::UploadChunkAppendedEvent{resource_id, request_offset, bytes.size(),
                                                     new_offset, session.total_size});

    if (new_offset == session.total_size) {
        auto completed = complete(session);
        if (completed.is_error()) {
            return Err<std::uint64_t, Error>(completed.error());
        }
    }

    return Ok<std::uint64_t, Error>(new_offset);
}

UploadResult<fs::path> UploadService::complete(const UploadSession& session) {
    std::string token = generate_id();
    token.erase(std::remove(token.begin(), token.end(), '-'), token.end());

    const std::string base = session.filename.empty() ? session.resource_id : sanitize_filename(session.filename);
    const std::string final_name = token + "_" + base;

    auto finalized = writer_.finalize(session.resource_id, config_.destination_dir, final_name);
    if (finalized.is_error()) {
        spdlog::error("Finalize failed for {}: {}", session.resource_id, finalized.error().message);
        return finalized;
    }

    auto dropped = sessions_.delete_session(session.resource_id);
    if (dropped.is_error()) {
        return Err<fs::path, Error>(dropped.error());
    }

    events::UploadFinishedEvent finished;
    finished.resource_id = session.resource_id;
    finished.metadata = session.metadata;
    finished.final_filename = final_name;
    finished.final_path = finalized.value();
    finished.total_size = session.total_size;
    finished.destination_dir = config_.destination_dir;
    finished.upload_url = config_.upload_url;
    event_bus_.emit(finished);

    return finalized;
}

bool UploadService::destination_has(const std::string& filename) const {
    // Compare against the name complete() would store
    const auto wanted = sanitize_filename(filename);

    std::error_code ec;
    fs::directory_iterator it(config_.destination_dir, ec);
    if (ec) {
        return false;
    }

    for (const auto& entry : it) {
        const auto stored = entry.path().filename().string();
        if (boost::algorithm::iequals(stored, wanted) ||
            boost::algorithm::iequals(strip_final_prefix(stored), wanted)) {
            return true;
        }
    }
    return false;
}

ProbeResult UploadService::probe_existence(const std::string& filename) const {
    ProbeResult result;
    result.filename = filename;
    result.exists = !filename.empty() && destination_has(filename);
    return result;
}

UploadResult<void> UploadService::terminate(const std::string& resource_id) {
    if (!is_valid_resource_id(resource_id)) {
        return fail<void>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }

    auto guard = locks_.lock(resource_id);

    auto snapshot = sessions_.get(resource_id);
    if (snapshot.is_error()) {
        return Err<void, Error>(snapshot.error());
    }
    if (!snapshot.value()) {
        return fail<void>(ErrorCode::Gone, "Unknown upload: " + resource_id);
    }

    if (auto dropped = sessions_.delete_session(resource_id); dropped.is_error()) {
        return dropped;
    }
    if (auto removed = writer_.remove(resource_id); removed.is_error()) {
        return removed;
    }

    const auto& session = *snapshot.value();
    event_bus_.emit(events::UploadTerminatedEvent{resource_id, session.offset, session.total_size});
    return Ok<Error>();
}

UploadResult<std::size_t> UploadService::reap_orphans(std::chrono::seconds min_age) {
    auto listed = writer_.list_temporary_files();
    if (listed.is_error()) {
        return Err<std::size_t, Error>(listed.error());
    }

    const auto now = fs::file_time_type::clock::now();
    std::size_t reaped = 0;

    for (const auto& file : listed.value()) {
        if (!is_valid_resource_id(file.resource_id) || now - file.last_write < min_age) {
            continue;
        }

        auto guard = locks_.lock(file.resource_id);

        auto snapshot = sessions_.get(file.resource_id);
        if (snapshot.is_error()) {
            return Err<std::size_t, Error>(snapshot.error());
        }
        if (snapshot.value()) {
            continue;
        }

        auto removed = writer_.remove(file.resource_id);
        if (removed.is_error()) {
            return Err<std::size_t, Error>(removed.error());
        }

        event_bus_.emit(events::OrphanReapedEvent{file.resource_id, file.path});
        ++reaped;
    }

    return Ok<std::size_t, Error>(reaped);
}

} // namespace tus::upload
