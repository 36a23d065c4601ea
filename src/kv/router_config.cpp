#include "kv/router_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace rangekv::kv
{

using utils::Logger;

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

std::chrono::milliseconds read_ms(const nlohmann::json &j, const char *key,
                                  std::chrono::milliseconds fallback)
{
    if (!j.contains(key))
        return fallback;
    const auto &v = j[key];
    if (!v.is_number_integer())
        throw std::runtime_error(std::string("Router config: '") + key +
                                 "' must be an integer number of milliseconds");
    return std::chrono::milliseconds(v.get<int64_t>());
}

Logger::Level parse_level_or_throw(const std::string &s, const std::string &key)
{
    if (auto lvl = utils::parse_log_level(s))
        return *lvl;
    throw std::runtime_error("Router config: invalid '" + key + "' = '" + s +
                             "' (must be trace, debug, info, warn, error or system)");
}

/// Parses an environment variable as a signed 64-bit integer.
int64_t env_int(const char *name, const char *value)
{
    const std::string s(value);
    size_t pos = 0;
    int64_t parsed = 0;
    try
    {
        parsed = std::stoll(s, &pos);
    }
    catch (const std::exception &)
    {
        pos = 0;
    }
    if (pos == 0 || pos != s.size())
        throw std::runtime_error(std::string("Router config: environment variable ") + name +
                                 " = '" + s + "' is not an integer");
    return parsed;
}

/// Reads the fields present in @p root over the defaults without validating
/// the combination.
RouterConfig parse_fields(const nlohmann::json &root)
{
    RouterConfig cfg;
    const nlohmann::json &j = (root.is_object() && root.contains("router")) ? root["router"] : root;
    if (j.is_null())
        return cfg;
    if (!j.is_object())
        throw std::runtime_error("Router config: 'router' must be a JSON object");

    cfg.send_next_timeout = read_ms(j, "send_next_timeout_ms", cfg.send_next_timeout);
    cfg.rpc_timeout = read_ms(j, "rpc_timeout_ms", cfg.rpc_timeout);
    cfg.retry_backoff = read_ms(j, "retry_backoff_ms", cfg.retry_backoff);
    cfg.max_retry_backoff = read_ms(j, "max_retry_backoff_ms", cfg.max_retry_backoff);

    if (j.contains("backoff_multiplier"))
    {
        if (!j["backoff_multiplier"].is_number())
            throw std::runtime_error("Router config: 'backoff_multiplier' must be a number");
        cfg.backoff_multiplier = j["backoff_multiplier"].get<double>();
    }

    if (j.contains("range_cache_size"))
    {
        const auto &v = j["range_cache_size"];
        if (!v.is_number_integer() || v.get<int64_t>() <= 0)
            throw std::runtime_error("Router config: 'range_cache_size' must be a positive integer");
        cfg.range_cache_size = v.get<size_t>();
    }

    if (j.contains("log_level"))
    {
        if (!j["log_level"].is_string())
            throw std::runtime_error("Router config: 'log_level' must be a string");
        cfg.log_level = parse_level_or_throw(j["log_level"].get<std::string>(), "log_level");
    }

    return cfg;
}

} // anonymous namespace

// ============================================================================
// RouterConfig
// ============================================================================

RouterConfig RouterConfig::from_json(const nlohmann::json &root)
{
    RouterConfig cfg = parse_fields(root);
    cfg.validate();
    return cfg;
}

RouterConfig RouterConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Router config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Router config: JSON parse error in '" + path + "': " + e.what());
    }

    // Validated once, after the environment overrides.
    RouterConfig cfg = parse_fields(j);
    cfg.apply_env_overrides();
    return cfg;
}

RouterConfig RouterConfig::from_env()
{
    RouterConfig cfg;
    cfg.apply_env_overrides();
    return cfg;
}

void RouterConfig::apply_env_overrides()
{
    if (const char *env = std::getenv("RANGEKV_SEND_NEXT_TIMEOUT_MS"))
        send_next_timeout = std::chrono::milliseconds(env_int("RANGEKV_SEND_NEXT_TIMEOUT_MS", env));
    if (const char *env = std::getenv("RANGEKV_RPC_TIMEOUT_MS"))
        rpc_timeout = std::chrono::milliseconds(env_int("RANGEKV_RPC_TIMEOUT_MS", env));
    if (const char *env = std::getenv("RANGEKV_RETRY_BACKOFF_MS"))
        retry_backoff = std::chrono::milliseconds(env_int("RANGEKV_RETRY_BACKOFF_MS", env));
    if (const char *env = std::getenv("RANGEKV_MAX_RETRY_BACKOFF_MS"))
        max_retry_backoff = std::chrono::milliseconds(env_int("RANGEKV_MAX_RETRY_BACKOFF_MS", env));
    if (const char *env = std::getenv("RANGEKV_RANGE_CACHE_SIZE"))
    {
        const int64_t n = env_int("RANGEKV_RANGE_CACHE_SIZE", env);
        if (n <= 0)
            throw std::runtime_error("Router config: RANGEKV_RANGE_CACHE_SIZE must be positive");
        range_cache_size = static_cast<size_t>(n);
    }
    if (const char *env = std::getenv("RANGEKV_LOG_LEVEL"))
        log_level = parse_level_or_throw(env, "RANGEKV_LOG_LEVEL");

    validate();
}

void RouterConfig::validate() const
{
    if (send_next_timeout.count() <= 0)
        throw std::runtime_error("Router config: 'send_next_timeout_ms' must be positive");
    if (rpc_timeout.count() <= 0)
        throw std::runtime_error("Router config: 'rpc_timeout_ms' must be positive");
    if (retry_backoff.count() <= 0)
        throw std::runtime_error("Router config: 'retry_backoff_ms' must be positive");
    if (max_retry_backoff < retry_backoff)
        throw std::runtime_error(
            "Router config: 'max_retry_backoff_ms' must not be less than 'retry_backoff_ms'");
    if (!(backoff_multiplier >= 1.0))
        throw std::runtime_error("Router config: 'backoff_multiplier' must be >= 1.0");
    if (range_cache_size == 0)
        throw std::runtime_error("Router config: 'range_cache_size' must be positive");
}

} // namespace rangekv::kv
