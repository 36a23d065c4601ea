/**
 * @file test_router_config.cpp
 * @brief RouterConfig: defaults, JSON parsing, file loading, env overrides, validation.
 */
#include "kv/router_config.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

using namespace rangekv::kv;
using namespace rangekv::tests;
using namespace std::chrono_literals;
using rangekv::utils::Logger;

class RouterConfigTest : public PureApiTest
{
  protected:
    void TearDown() override
    {
        for (const char *name : {"RANGEKV_SEND_NEXT_TIMEOUT_MS", "RANGEKV_RPC_TIMEOUT_MS",
                                 "RANGEKV_RETRY_BACKOFF_MS", "RANGEKV_MAX_RETRY_BACKOFF_MS",
                                 "RANGEKV_RANGE_CACHE_SIZE", "RANGEKV_LOG_LEVEL"})
        {
            ::unsetenv(name);
        }
        for (const auto &p : files_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path write_file(const std::string &text)
    {
        auto path = helper::unique_temp_path("rangekv_router_config");
        std::ofstream(path) << text;
        files_.push_back(path);
        return path;
    }

    std::vector<fs::path> files_;
};

TEST_F(RouterConfigTest, Defaults)
{
    RouterConfig cfg;
    EXPECT_EQ(cfg.send_next_timeout, 1000ms);
    EXPECT_EQ(cfg.rpc_timeout, 15000ms);
    EXPECT_EQ(cfg.retry_backoff, 1000ms);
    EXPECT_EQ(cfg.max_retry_backoff, 30000ms);
    EXPECT_DOUBLE_EQ(cfg.backoff_multiplier, 2.0);
    EXPECT_EQ(cfg.range_cache_size, 1000000u);
    EXPECT_EQ(cfg.log_level, Logger::Level::L_INFO);
    EXPECT_NO_THROW(cfg.validate());

    const auto rpc = cfg.rpc_options();
    EXPECT_EQ(rpc.send_next_timeout, 1000ms);
    EXPECT_EQ(rpc.timeout, 15000ms);
    EXPECT_EQ(cfg.backoff().delay(10), 30000ms);
}

TEST_F(RouterConfigTest, FromJsonOverridesGivenFields)
{
    const auto cfg = RouterConfig::from_json(nlohmann::json::parse(R"({
        "router": {
            "rpc_timeout_ms": 2500,
            "retry_backoff_ms": 10,
            "max_retry_backoff_ms": 80,
            "backoff_multiplier": 1.5,
            "range_cache_size": 64,
            "log_level": "debug"
        }
    })"));
    EXPECT_EQ(cfg.rpc_timeout, 2500ms);
    EXPECT_EQ(cfg.send_next_timeout, 1000ms); // untouched
    EXPECT_EQ(cfg.retry_backoff, 10ms);
    EXPECT_EQ(cfg.max_retry_backoff, 80ms);
    EXPECT_DOUBLE_EQ(cfg.backoff_multiplier, 1.5);
    EXPECT_EQ(cfg.range_cache_size, 64u);
    EXPECT_EQ(cfg.log_level, Logger::Level::L_DEBUG);
}

TEST_F(RouterConfigTest, FromJsonRejectsInvalidValues)
{
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":{"rpc_timeout_ms":"fast"}})")),
                 std::runtime_error);
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":{"rpc_timeout_ms":0}})")),
                 std::runtime_error);
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":{"range_cache_size":0}})")),
                 std::runtime_error);
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":{"backoff_multiplier":0.5}})")),
                 std::runtime_error);
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":{"log_level":"loud"}})")),
                 std::runtime_error);
    EXPECT_THROW(RouterConfig::from_json(nlohmann::json::parse(R"({"router":[1,2]})")), std::runtime_error);
}

TEST_F(RouterConfigTest, MaxBackoffBelowInitialRejected)
{
    try
    {
        (void)RouterConfig::from_json(
            nlohmann::json::parse(R"({"router":{"retry_backoff_ms":500,"max_retry_backoff_ms":100}})"));
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("max_retry_backoff_ms"), std::string::npos);
    }
}

TEST_F(RouterConfigTest, FromJsonFile)
{
    const auto path = write_file(R"({"router": {"send_next_timeout_ms": 250}})");
    const auto cfg = RouterConfig::from_json_file(path.string());
    EXPECT_EQ(cfg.send_next_timeout, 250ms);
}

TEST_F(RouterConfigTest, FromJsonFileErrors)
{
    EXPECT_THROW(RouterConfig::from_json_file("/nonexistent/rangekv/router.json"), std::runtime_error);
    const auto path = write_file("{ not json");
    EXPECT_THROW(RouterConfig::from_json_file(path.string()), std::runtime_error);
}

TEST_F(RouterConfigTest, EnvironmentOverridesFile)
{
    const auto path = write_file(R"({"router": {"rpc_timeout_ms": 2000, "log_level": "error"}})");
    ::setenv("RANGEKV_RPC_TIMEOUT_MS", "4000", 1);
    ::setenv("RANGEKV_RANGE_CACHE_SIZE", "128", 1);
    ::setenv("RANGEKV_LOG_LEVEL", "trace", 1);

    const auto cfg = RouterConfig::from_json_file(path.string());
    EXPECT_EQ(cfg.rpc_timeout, 4000ms);
    EXPECT_EQ(cfg.range_cache_size, 128u);
    EXPECT_EQ(cfg.log_level, Logger::Level::L_TRACE);
}

TEST_F(RouterConfigTest, EnvironmentOnly)
{
    ::setenv("RANGEKV_RETRY_BACKOFF_MS", "20", 1);
    ::setenv("RANGEKV_MAX_RETRY_BACKOFF_MS", "200", 1);
    const auto cfg = RouterConfig::from_env();
    EXPECT_EQ(cfg.retry_backoff, 20ms);
    EXPECT_EQ(cfg.max_retry_backoff, 200ms);
}

TEST_F(RouterConfigTest, MalformedEnvironmentRejected)
{
    ::setenv("RANGEKV_SEND_NEXT_TIMEOUT_MS", "12abc", 1);
    EXPECT_THROW(RouterConfig::from_env(), std::runtime_error);
    ::setenv("RANGEKV_SEND_NEXT_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW(RouterConfig::from_env(), std::runtime_error);
}

/**
 * A file value that is invalid only against the defaults is accepted when the
 * environment supplies the other half; the merged result is what counts.
 */
TEST_F(RouterConfigTest, EnvironmentCompletesFileBeforeValidation)
{
    const auto path = write_file(R"({"router": {"max_retry_backoff_ms": 100}})");
    EXPECT_THROW(RouterConfig::from_json_file(path.string()), std::runtime_error);

    ::setenv("RANGEKV_RETRY_BACKOFF_MS", "50", 1);
    const auto cfg = RouterConfig::from_json_file(path.string());
    EXPECT_EQ(cfg.retry_backoff, 50ms);
    EXPECT_EQ(cfg.max_retry_backoff, 100ms);
}
