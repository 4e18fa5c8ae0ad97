#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "ServerConfig.hpp"

namespace fs = std::filesystem;

class ServerConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path_ = fs::temp_directory_path() / ("tracker_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                                              ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string &text)
    {
        std::ofstream out(path_);
        out << text;
    }

    fs::path path_;
};

TEST_F(ServerConfigTest, MissingFileYieldsDefaults)
{
    // A config path that does not exist loads the built-in defaults.
    auto cfg = ServerConfig::load(path_.string());
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.worker_threads, 0u);
    EXPECT_EQ(cfg.max_frame_size, DEFAULT_MAX_FRAME_SIZE);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
    EXPECT_DOUBLE_EQ(cfg.window.min_hours, 0.1);
    EXPECT_DOUBLE_EQ(cfg.window.max_hours, 168.0);
    EXPECT_DOUBLE_EQ(cfg.window.default_hours, 1.0);
}

TEST_F(ServerConfigTest, FileOverridesSelectedFields)
{
    // Present keys override defaults and absent keys keep them.
    write(R"({"port": 9443, "worker_threads": 3, "log_level": "debug",
              "window": {"max_hours": 24, "default_hours": 2}})");
    auto cfg = ServerConfig::load(path_.string());
    EXPECT_EQ(cfg.port, 9443);
    EXPECT_EQ(cfg.worker_threads, 3u);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_DOUBLE_EQ(cfg.window.max_hours, 24.0);
    EXPECT_DOUBLE_EQ(cfg.window.default_hours, 2.0);
    EXPECT_DOUBLE_EQ(cfg.window.min_hours, 0.1);
    EXPECT_EQ(cfg.cert_path, "config/cert.pem");
}

TEST_F(ServerConfigTest, MalformedFileThrows)
{
    // Broken JSON is a configuration error, not a silent default.
    write("{\"port\": ");
    EXPECT_THROW(ServerConfig::load(path_.string()), std::runtime_error);
}

TEST(ServerConfigJsonTest, RejectsInvalidValues)
{
    // Out-of-range and mistyped fields are refused.
    using json = nlohmann::json;
    EXPECT_THROW(ServerConfig::from_json(json::array()), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"port", 70000}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"port", "eighty"}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"max_frame_size", 0}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"metrics_interval_seconds", 0}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"log_level", "loud"}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"window", {{"min_hours", 10}, {"max_hours", 5}}}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"window", {{"default_hours", 500}}}}), std::runtime_error);
}

TEST(ServerConfigJsonTest, WorkerThreadsMustBeNonNegative)
{
    // Negative or absurd worker counts are refused instead of wrapping to a huge pool size.
    EXPECT_THROW(ServerConfig::from_json({{"worker_threads", -1}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"worker_threads", 100000}}), std::runtime_error);
    EXPECT_THROW(ServerConfig::from_json({{"worker_threads", "four"}}), std::runtime_error);
    EXPECT_EQ(ServerConfig::from_json({{"worker_threads", 0}}).worker_threads, 0u);
    EXPECT_EQ(ServerConfig::from_json({{"worker_threads", 6}}).worker_threads, 6u);
}

TEST(ServerConfigJsonTest, ToJsonReloadsToSameValues)
{
    // Serialized configuration parses back to the same settings.
    ServerConfig cfg;
    cfg.port = 9000;
    cfg.log_level = LogLevel::Warn;
    cfg.window.default_hours = 3.0;
    auto reloaded = ServerConfig::from_json(cfg.to_json());
    EXPECT_EQ(reloaded.port, 9000);
    EXPECT_EQ(reloaded.log_level, LogLevel::Warn);
    EXPECT_DOUBLE_EQ(reloaded.window.default_hours, 3.0);
}

TEST(ParsePortTest, AcceptsOnlyValidPorts)
{
    // Ports must be whole numbers in 1..65535.
    EXPECT_EQ(parse_port("8080"), 8080);
    EXPECT_THROW(parse_port("0"), std::runtime_error);
    EXPECT_THROW(parse_port("65536"), std::runtime_error);
    EXPECT_THROW(parse_port("80a"), std::runtime_error);
    EXPECT_THROW(parse_port(""), std::runtime_error);
}
