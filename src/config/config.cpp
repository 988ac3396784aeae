#include "tus/config/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>

namespace tus {
namespace config {

using json = nlohmann::json;

Result<void> apply_json(const json& j, ServerConfig& config) {
    if (!j.is_object()) {
        return Err<void, std::string>("Configuration root must be a JSON object");
    }

    try {
        config.address = j.value("address", config.address);

        const auto port = j.value("port", static_cast<int64_t>(config.port));
        if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
            return Err<void, std::string>("port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);

        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.log_level = j.value("log_level", config.log_level);
        config.sweep_interval = std::chrono::seconds(
            j.value("sweep_interval_seconds", static_cast<int64_t>(config.sweep_interval.count())));
        config.max_request_body = j.value("max_request_body", config.max_request_body);

        if (j.contains("upload")) {
            const auto& u = j.at("upload");
            if (!u.is_object()) {
                return Err<void, std::string>("'upload' must be a JSON object");
            }
            auto& upload = config.upload;
            upload.upload_dir = u.value("upload_dir", upload.upload_dir.string());
            upload.destination_dir = u.value("destination_dir", upload.destination_dir.string());
            upload.upload_url = u.value("upload_url", upload.upload_url);
            upload.max_file_size = u.value("max_file_size", upload.max_file_size);
            upload.allow_overwrite = u.value("allow_overwrite", upload.allow_overwrite);
            upload.session_ttl = std::chrono::seconds(
                u.value("session_ttl_seconds", static_cast<int64_t>(upload.session_ttl.count())));
        }
    } catch (const json::exception& e) {
        return Err<void, std::string>(std::string("Invalid configuration value: ") + e.what());
    }

    return Ok();
}

Result<ServerConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<ServerConfig, std::string>("Cannot open config file " + path.string());
    }

    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Err<ServerConfig, std::string>("Config file " + path.string() + " is not valid JSON");
    }

    ServerConfig config;
    auto applied = apply_json(j, config);
    if (applied.is_error()) {
        return Err<ServerConfig, std::string>(path.string() + ": " + applied.error());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return Ok(std::move(config));
}

Result<void> validate(const ServerConfig& config) {
    const auto& upload = config.upload;

    if (upload.upload_dir.empty()) {
        return Err<void, std::string>("upload_dir must not be empty");
    }
    if (upload.destination_dir.empty()) {
        return Err<void, std::string>("destination_dir must not be empty");
    }
    if (upload.upload_url.empty() || upload.upload_url.front() != '/' || upload.upload_url.back() != '/') {
        return Err<void, std::string>("upload_url must start and end with '/': " + upload.upload_url);
    }
    if (upload.session_ttl.count() <= 0) {
        return Err<void, std::string>("session_ttl_seconds must be positive");
    }
    if (config.worker_threads == 0) {
        return Err<void, std::string>("worker_threads must be at least 1");
    }
    if (config.sweep_interval.count() <= 0) {
        return Err<void, std::string>("sweep_interval_seconds must be positive");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<void, std::string>("Unknown log_level: " + config.log_level);
    }

    return Ok();
}

} // namespace config
} // namespace tus
