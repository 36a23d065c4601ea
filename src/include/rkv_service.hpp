#pragma once
/**
 * @file rkv_service.hpp
 * @brief Layer 2: Service modules shared by the routing layer.
 *
 * Provides logging, Result-based error handling, exponential backoff and
 * the retry loop. Include this when you need the Logger, Result<T, E>,
 * or retry_with_backoff.
 */
#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
#include "utils/retry.hpp"
