/**
 * @file events.hpp
 * @brief Event types published by the upload server
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: UploadCreatedEvent, UploadFinishedEvent.
 */

#pragma once

#include "tus/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace tus::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A session record and its preallocated file now exist
 *
 * WHO EMITS: UploadService::create_upload
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct UploadCreatedEvent {
    std::string resource_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp;

    UploadCreatedEvent(std::string id, std::string name, std::uint64_t size)
        : resource_id(std::move(id)),
          filename(std::move(name)),
          total_size(size),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief One chunk was written and accounted for
 */
struct UploadChunkAppendedEvent {
    std::string resource_id;
    std::uint64_t chunk_offset = 0;
    std::uint64_t chunk_bytes = 0;
    std::uint64_t new_offset = 0;
    std::uint64_t total_size = 0;
};

/**
 * @brief Completion handoff, published exactly once per finished upload
 *
 * Carries everything a downstream consumer needs to pick the file up:
 * the creation metadata, the final name and location, the declared size
 * and the destination area.
 *
 * WHO EMITS: UploadService (append reaching total_size, or a zero-length create)
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent, application listeners
 */
struct UploadFinishedEvent {
    std::string resource_id;
    upload::Metadata metadata;
    std::string final_filename;
    std::filesystem::path final_path;
    std::uint64_t total_size = 0;
    std::filesystem::path destination_dir;
    std::string upload_url;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief A client cancelled an upload through the termination extension
 */
struct UploadTerminatedEvent {
    std::string resource_id;
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
};

/**
 * @brief The sweep removed a temporary file whose session had expired
 */
struct OrphanReapedEvent {
    std::string resource_id;
    std::filesystem::path path;
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::string address;
    uint16_t port;
    std::size_t worker_threads;
};

struct ServerShuttingDownEvent {
    std::string reason;
};

} // namespace tus::events
