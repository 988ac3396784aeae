#pragma once

/**
 * @file config.hpp
 * @brief Server configuration loaded from JSON
 *
 * EXAMPLE FILE:
 * {
 *   "address": "0.0.0.0",
 *   "port": 1080,
 *   "worker_threads": 4,
 *   "log_level": "info",
 *   "sweep_interval_seconds": 300,
 *   "max_request_body": 67108864,
 *   "upload": {
 *     "upload_dir": "data/tmp",
 *     "destination_dir": "data/files",
 *     "upload_url": "/files/",
 *     "max_file_size": 4294967296,
 *     "allow_overwrite": true,
 *     "session_ttl_seconds": 3600
 *   }
 * }
 *
 * Every key is optional; missing keys keep the defaults below.
 */

#include "tus/core/result.hpp"
#include "tus/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace tus {
namespace config {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 1080;
    std::size_t worker_threads = 4;
    std::string log_level = "info";
    std::chrono::seconds sweep_interval{300};
    std::size_t max_request_body = 64 * 1024 * 1024;

    upload::UploadConfig upload{
        "data/tmp",
        "data/files",
    };
};

/**
 * @brief Overlay the keys present in j onto config
 */
Result<void> apply_json(const nlohmann::json& j, ServerConfig& config);

Result<ServerConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Reject settings the server cannot run with
 */
Result<void> validate(const ServerConfig& config);

} // namespace config
} // namespace tus
