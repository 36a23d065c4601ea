#pragma once
/**
 * @file router_config.hpp
 * @brief Router tunables: built-in defaults, JSON file, environment overrides.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "router": {
 *     "send_next_timeout_ms":  1000,
 *     "rpc_timeout_ms":        15000,
 *     "retry_backoff_ms":      1000,
 *     "max_retry_backoff_ms":  30000,
 *     "backoff_multiplier":    2.0,
 *     "range_cache_size":      1000000,
 *     "log_level":             "info"
 *   }
 * }
 * @endcode
 *
 * Every field is optional. Environment variables take precedence over the file:
 *
 *   RANGEKV_SEND_NEXT_TIMEOUT_MS, RANGEKV_RPC_TIMEOUT_MS,
 *   RANGEKV_RETRY_BACKOFF_MS, RANGEKV_MAX_RETRY_BACKOFF_MS,
 *   RANGEKV_RANGE_CACHE_SIZE, RANGEKV_LOG_LEVEL
 *
 * Invalid values throw std::runtime_error naming the offending key.
 */

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "kv/transport.hpp"
#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

struct RANGEKV_CORE_EXPORT RouterConfig
{
    std::chrono::milliseconds send_next_timeout{1000};
    std::chrono::milliseconds rpc_timeout{15000};
    std::chrono::milliseconds retry_backoff{1000};
    std::chrono::milliseconds max_retry_backoff{30000};
    double backoff_multiplier{2.0};
    size_t range_cache_size{1000000};
    utils::Logger::Level log_level{utils::Logger::Level::L_INFO};

    /**
     * @brief Parses the "router" object of @p j (or @p j itself if it has no
     *        "router" key) over the defaults, then validates.
     * @throws std::runtime_error on a wrongly typed or invalid value.
     */
    static RouterConfig from_json(const nlohmann::json &j);

    /**
     * @brief Loads @p path, applies RANGEKV_* environment overrides, then
     *        validates the merged result.
     * @throws std::runtime_error if the file cannot be opened or parsed, or a
     *         value is invalid.
     */
    static RouterConfig from_json_file(const std::string &path);

    /**
     * @brief Defaults with RANGEKV_* environment overrides applied.
     */
    static RouterConfig from_env();

    /// Applies RANGEKV_* environment variables that are set, then validates.
    void apply_env_overrides();

    /// @throws std::runtime_error naming the first invalid field.
    void validate() const;

    [[nodiscard]] RpcOptions rpc_options() const { return RpcOptions{send_next_timeout, rpc_timeout}; }

    [[nodiscard]] utils::ExponentialBackoff backoff() const
    {
        return utils::ExponentialBackoff{retry_backoff, max_retry_backoff, backoff_multiplier};
    }
};

} // namespace rangekv::kv
