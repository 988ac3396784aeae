/**
 * @file components.hpp
 * @brief Event-driven components wired up by the server
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both now react to every upload event published on bus
 */

#pragma once

#include "tus/events/event_bus.hpp"
#include "tus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace tus::events {

/**
 * @brief Logs upload lifecycle events through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent& e) {
            spdlog::info("[UploadCreated] id={} filename='{}' size={}", e.resource_id, e.filename, e.total_size);
        });

        bus.subscribe<UploadChunkAppendedEvent>([](const UploadChunkAppendedEvent& e) {
            spdlog::debug("[ChunkAppended] id={} at={} bytes={} offset={}/{}",
                          e.resource_id, e.chunk_offset, e.chunk_bytes, e.new_offset, e.total_size);
        });

        bus.subscribe<UploadFinishedEvent>([](const UploadFinishedEvent& e) {
            spdlog::info("[UploadFinished] id={} file={} size={}",
                         e.resource_id, e.final_path.string(), e.total_size);
        });

        bus.subscribe<UploadTerminatedEvent>([](const UploadTerminatedEvent& e) {
            spdlog::info("[UploadTerminated] id={} at={}/{}", e.resource_id, e.offset, e.total_size);
        });

        bus.subscribe<OrphanReapedEvent>([](const OrphanReapedEvent& e) {
            spdlog::info("[OrphanReaped] id={} path={}", e.resource_id, e.path.string());
        });

        bus.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("tus server listening on {}:{} ({} workers)", e.address, e.port, e.worker_threads);
            spdlog::info("════════════════════════════════════════════");
        });

        bus.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Server shutting down: {}", e.reason);
        });
    }
};

/**
 * @brief Counts uploads and bytes for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_created{0};
        std::atomic<uint64_t> uploads_finished{0};
        std::atomic<uint64_t> uploads_terminated{0};
        std::atomic<uint64_t> chunks_appended{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> bytes_finished{0};
        std::atomic<uint64_t> orphans_reaped{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent&) {
            stats_.uploads_created++;
        });

        bus.subscribe<UploadChunkAppendedEvent>([this](const UploadChunkAppendedEvent& e) {
            stats_.chunks_appended++;
            stats_.bytes_received += e.chunk_bytes;
        });

        bus.subscribe<UploadFinishedEvent>([this](const UploadFinishedEvent& e) {
            stats_.uploads_finished++;
            stats_.bytes_finished += e.total_size;
        });

        bus.subscribe<UploadTerminatedEvent>([this](const UploadTerminatedEvent&) {
            stats_.uploads_terminated++;
        });

        bus.subscribe<OrphanReapedEvent>([this](const OrphanReapedEvent&) {
            stats_.orphans_reaped++;
        });
    }

    // Subscriptions capture this
    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads created:    {}", stats_.uploads_created.load());
        spdlog::info("  Uploads finished:   {}", stats_.uploads_finished.load());
        spdlog::info("  Uploads terminated: {}", stats_.uploads_terminated.load());
        spdlog::info("  Chunks appended:    {}", stats_.chunks_appended.load());
        spdlog::info("  Bytes received:     {}", stats_.bytes_received.load());
        spdlog::info("  Bytes finished:     {}", stats_.bytes_finished.load());
        spdlog::info("  Orphans reaped:     {}", stats_.orphans_reaped.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace tus::events
