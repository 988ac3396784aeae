#include "tus/config/config.hpp"
#include "tus/events/components.hpp"
#include "tus/events/event_bus.hpp"
#include "tus/events/events.hpp"
#include "tus/network/http_server_asio.hpp"
#include "tus/server/tus_handler.hpp"
#include "tus/store/memory_cache.hpp"
#include "tus/store/session_store.hpp"
#include "tus/upload/chunk_writer.hpp"
#include "tus/upload/service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>       JSON configuration file\n"
              << "  -p, --port <port>         listen port\n"
              << "  -d, --destination <dir>   directory for finished uploads\n"
              << "  -u, --uploads <dir>       directory for in-progress uploads\n"
              << "  -t, --threads <n>         worker threads\n"
              << "  -h, --help                show this help\n";
}

struct Overrides {
    std::optional<fs::path> config_file;
    std::optional<uint16_t> port;
    std::optional<fs::path> destination_dir;
    std::optional<fs::path> upload_dir;
    std::optional<std::size_t> worker_threads;
};

bool ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    Overrides overrides;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                overrides.config_file = fs::path(argv[++i]);
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                overrides.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if ((arg == "-d" || arg == "--destination") && i + 1 < argc) {
                overrides.destination_dir = fs::path(argv[++i]);
            } else if ((arg == "-u" || arg == "--uploads") && i + 1 < argc) {
                overrides.upload_dir = fs::path(argv[++i]);
            } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
                overrides.worker_threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    tus::config::ServerConfig config;
    if (overrides.config_file) {
        auto loaded = tus::config::load_config(*overrides.config_file);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (overrides.port) config.port = *overrides.port;
    if (overrides.destination_dir) config.upload.destination_dir = *overrides.destination_dir;
    if (overrides.upload_dir) config.upload.upload_dir = *overrides.upload_dir;
    if (overrides.worker_threads) config.worker_threads = *overrides.worker_threads;

    auto valid = tus::config::validate(config);
    if (valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (!ensure_directory(config.upload.upload_dir) || !ensure_directory(config.upload.destination_dir)) {
        return 1;
    }

    tus::events::EventBus event_bus;
    tus::events::LoggerComponent logger(event_bus);
    tus::events::MetricsComponent metrics(event_bus);

    event_bus.subscribe<tus::events::UploadFinishedEvent>([](const tus::events::UploadFinishedEvent& e) {
        auto name = e.metadata.find("filename");
        spdlog::info("Upload ready for processing: {} (client name '{}', {} bytes)",
                     e.final_path.string(),
                     name == e.metadata.end() ? "" : name->second,
                     e.total_size);
    });

    tus::store::MemoryCache cache;
    tus::store::SessionStore sessions(cache, config.upload.session_ttl);
    tus::upload::ChunkWriter writer(config.upload.upload_dir);
    tus::upload::UploadService service(config.upload, sessions, writer, event_bus);
    tus::server::TusHandler handler(service);

    for (const auto& route : handler.router().list_routes()) {
        spdlog::debug("  {}", route);
    }

    asio::io_context io_context;

    std::optional<tus::network::HttpServerAsio> server;
    try {
        server.emplace(io_context, config.address, config.port, config.max_request_body);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Cannot listen on {}:{}: {}", config.address, config.port, e.what());
        return 1;
    }
    server->set_handler([&handler](const tus::network::HttpRequest& request) {
        return handler.dispatch(request);
    });

    // Periodic maintenance: drop expired cache entries, then reclaim temp files they leave behind
    asio::steady_timer sweep_timer(io_context);
    std::function<void()> schedule_sweep = [&]() {
        sweep_timer.expires_after(config.sweep_interval);
        sweep_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            const auto expired = cache.sweep_expired();
            auto reaped = service.reap_orphans(config.upload.session_ttl);
            if (reaped.is_error()) {
                spdlog::warn("Orphan sweep failed: {}", reaped.error().message);
            } else if (expired > 0 || reaped.value() > 0) {
                spdlog::info("Sweep: {} expired cache entries, {} orphaned files", expired, reaped.value());
            }
            schedule_sweep();
        });
    };
    schedule_sweep();

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(tus::events::ServerShuttingDownEvent{"signal " + std::to_string(signal_number)});
        server->stop();
        sweep_timer.cancel();
        io_context.stop();
    });

    event_bus.emit(tus::events::ServerStartedEvent{config.address, server->get_port(), config.worker_threads});

    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads - 1);
    for (std::size_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();

    for (auto& worker : workers) {
        worker.join();
    }

    metrics.print_stats();
    return 0;
}
