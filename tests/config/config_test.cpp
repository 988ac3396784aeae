#include "tus/config/config.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using tus::config::ServerConfig;
using tus::config::apply_json;
using tus::config::load_config;
using tus::config::validate;
using tus::testing::create_temp_dir;
using tus::testing::write_file;

TEST(ConfigTest, DefaultsAreValid) {
    ServerConfig config;
    EXPECT_TRUE(validate(config).is_ok());
    EXPECT_EQ(config.port, 1080);
    EXPECT_EQ(config.upload.upload_url, "/files/");
}

TEST(ConfigTest, LoadsFileOverDefaults) {
    const auto dir = create_temp_dir("tus_config");
    const auto path = dir / "server.json";
    write_file(path, R"({
        "port": 8080,
        "log_level": "debug",
        "sweep_interval_seconds": 30,
        "upload": {
            "upload_dir": "/srv/tmp",
            "upload_url": "/uploads/",
            "max_file_size": 1048576,
            "allow_overwrite": false,
            "session_ttl_seconds": 120
        }
    })");

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();

    const auto& config = loaded.value();
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.sweep_interval, 30s);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.upload.upload_dir.string(), "/srv/tmp");
    EXPECT_EQ(config.upload.destination_dir.string(), "data/files");
    EXPECT_EQ(config.upload.upload_url, "/uploads/");
    EXPECT_EQ(config.upload.max_file_size, 1048576u);
    EXPECT_FALSE(config.upload.allow_overwrite);
    EXPECT_EQ(config.upload.session_ttl, 120s);
    EXPECT_TRUE(validate(config).is_ok());
}

TEST(ConfigTest, MissingFileIsError) {
    const auto dir = create_temp_dir("tus_config");
    EXPECT_TRUE(load_config(dir / "absent.json").is_error());
}

TEST(ConfigTest, InvalidJsonIsError) {
    const auto dir = create_temp_dir("tus_config");
    write_file(dir / "bad.json", "{ \"port\": ");

    auto loaded = load_config(dir / "bad.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("not valid JSON"), std::string::npos);
}

TEST(ConfigTest, WrongValueTypeIsError) {
    ServerConfig config;
    auto applied = apply_json(nlohmann::json{{"worker_threads", "many"}}, config);
    EXPECT_TRUE(applied.is_error());
}

TEST(ConfigTest, RootMustBeObject) {
    ServerConfig config;
    EXPECT_TRUE(apply_json(nlohmann::json::array({1, 2}), config).is_error());
}

TEST(ConfigTest, PortOutOfRangeIsError) {
    ServerConfig config;
    EXPECT_TRUE(apply_json(nlohmann::json{{"port", 70000}}, config).is_error());
    EXPECT_EQ(config.port, 1080);
}

TEST(ConfigTest, ValidateRejectsBadUploadUrl) {
    ServerConfig config;
    config.upload.upload_url = "files";
    EXPECT_TRUE(validate(config).is_error());

    config.upload.upload_url = "/files";
    EXPECT_TRUE(validate(config).is_error());
}

TEST(ConfigTest, ValidateRejectsNonPositiveTtl) {
    ServerConfig config;
    config.upload.session_ttl = 0s;
    EXPECT_TRUE(validate(config).is_error());
}

TEST(ConfigTest, ValidateRejectsZeroWorkers) {
    ServerConfig config;
    config.worker_threads = 0;
    EXPECT_TRUE(validate(config).is_error());
}

TEST(ConfigTest, ValidateRejectsEmptyDirectories) {
    ServerConfig config;
    config.upload.destination_dir.clear();
    EXPECT_TRUE(validate(config).is_error());
}

TEST(ConfigTest, ValidateRejectsUnknownLogLevel) {
    ServerConfig config;
    config.log_level = "chatty";
    EXPECT_TRUE(validate(config).is_error());

    config.log_level = "off";
    EXPECT_TRUE(validate(config).is_ok());
}
