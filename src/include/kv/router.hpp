#pragma once
/**
 * @file router.hpp
 * @brief Asynchronous key-routed dispatch with indefinite retry.
 *
 * `route(key, request)` returns a future immediately. A background thread
 * owned by the Router then loops:
 *
 *   RESOLVING   key → RangeLocations (cache, then two metadata lookups)
 *   DISPATCHING request → replicas of that range
 *   RETRYING    on a retryable failure: evict the cached range, back off
 *               (ExponentialBackoff from RouterConfig), resolve again
 *
 * until the operation succeeds or fails in a non-retryable way. The outcome
 * is delivered exactly once, as the response value: a failure travels in
 * `response.header.error`, never as a future exception.
 *
 * ## Shutdown
 *
 * Destroying the Router (or calling shutdown()) wakes every backoff wait.
 * Operations still retrying resolve to an ErrorCode::Shutdown response;
 * an attempt already on the wire finishes first (bounded by rpc_timeout).
 * Futures handed out earlier stay valid after the Router is gone.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <fmt/format.h>

#include "kv/api.hpp"
#include "kv/error.hpp"
#include "kv/gossip.hpp"
#include "kv/node_resolver.hpp"
#include "kv/range_cache.hpp"
#include "kv/range_resolver.hpp"
#include "kv/replica_sender.hpp"
#include "kv/router_config.hpp"
#include "kv/transport.hpp"
#include "kv/types.hpp"
#include "utils/logger.hpp"
#include "utils/retry.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT Router
{
  public:
    /**
     * @param gossip    Source of node addresses and the first range; must
     *                  outlive the Router.
     * @param transport RPC layer; must outlive the Router.
     * @param config    Validated tunables.
     */
    Router(const GossipClient &gossip, RpcTransport &transport, RouterConfig config = {});
    ~Router();

    Router(const Router &) = delete;
    Router &operator=(const Router &) = delete;

    /**
     * @brief Routes @p request to the range holding @p key.
     * @return Future of the response; its header carries the error, if any.
     */
    template <typename Request>
    [[nodiscard]] std::future<ResponseOf<Request>> route(Key key, Request request);

    /**
     * @brief Stops retrying and joins every routing thread. Idempotent.
     *        Routes issued afterwards resolve to ErrorCode::Shutdown at once.
     */
    void shutdown();

    [[nodiscard]] bool is_shutting_down() const;

    /// Total resolve+dispatch attempts made by this Router.
    [[nodiscard]] uint64_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }

    [[nodiscard]] RangeLocationCache &range_cache() noexcept { return cache_; }
    [[nodiscard]] const RouterConfig &config() const noexcept { return config_; }

  private:
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    template <typename Request>
    ResponseOf<Request> run(const Key &key, const Request &request);

    // Starts @p task on its own thread, joining workers that already finished.
    // False (task not started) once shutdown was requested. Throws
    // std::system_error if no thread can be created; the task is then not run.
    bool spawn(std::function<void()> task);

    // Backoff wait; false if shutdown was requested before or during it.
    bool wait_for_retry(std::chrono::milliseconds wait);

    RouterConfig config_;
    NodeAddressResolver node_resolver_;
    ReplicaSender sender_;
    RangeLocationCache cache_;
    RangeMetadataResolver range_resolver_;

    mutable std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_{false};

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::atomic<uint64_t> attempts_{0};
};

// ----------------- Template implementation (must be in header) -----------------

template <typename Request>
std::future<ResponseOf<Request>> Router::route(Key key, Request request)
{
    using Response = ResponseOf<Request>;

    auto promise = std::make_shared<std::promise<Response>>();
    auto future = promise->get_future();

    bool started = false;
    try
    {
        started = spawn(
            [this, promise, key = std::move(key), request = std::move(request)]()
            {
                try
                {
                    promise->set_value(run(key, request));
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("{}: routing thread failed: {}", MethodTraits<Request>::name, e.what());
                    promise->set_value(make_error_response<Response>(KvError{ErrorCode::Internal, e.what()}));
                }
                catch (...)
                {
                    LOGGER_ERROR("{}: routing thread failed with a non-standard exception",
                                 MethodTraits<Request>::name);
                    promise->set_value(make_error_response<Response>(
                        KvError{ErrorCode::Internal, "routing thread failed with a non-standard exception"}));
                }
            });
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("{}: could not start routing thread: {}", MethodTraits<Request>::name, e.what());
        promise->set_value(make_error_response<Response>(KvError{
            ErrorCode::Internal, fmt::format("could not start routing thread: {}", e.what())}));
        return future;
    }
    if (!started)
    {
        promise->set_value(make_error_response<Response>(
            KvError{ErrorCode::Shutdown, fmt::format("{}: router is shutting down", MethodTraits<Request>::name)}));
    }
    return future;
}

template <typename Request>
ResponseOf<Request> Router::run(const Key &key, const Request &request)
{
    using Response = ResponseOf<Request>;
    const std::string_view method = MethodTraits<Request>::name;

    std::optional<Response> outcome;
    utils::RetryOptions opts{fmt::format("{} '{}'", method, key_to_debug_string(key)),
                             config_.backoff(), 0};

    const auto settle = [&](Response response)
    {
        if (response.header.error)
        {
            LOGGER_ERROR("{}: {}", opts.tag, response.header.error->to_string());
        }
        outcome = std::move(response);
        return utils::RetryStatus::Break;
    };

    const auto retry_status = utils::retry_with_backoff(
        opts,
        [&](int) -> utils::RetryStatus
        {
            attempts_.fetch_add(1, std::memory_order_relaxed);

            auto range = range_resolver_.resolve(key);
            if (range.is_error())
            {
                if (!range.error().retryable())
                {
                    return settle(make_error_response<Response>(range.error()));
                }
                LOGGER_WARN("{}: range lookup failed: {}", opts.tag, range.error().to_string());
                return utils::RetryStatus::Continue;
            }

            auto reply = sender_.send(range.content().replicas, request);
            if (reply.is_error())
            {
                if (!reply.error().retryable())
                {
                    return settle(make_error_response<Response>(reply.error()));
                }
                LOGGER_WARN("{}: dispatch failed: {}", opts.tag, reply.error().to_string());
                range_resolver_.invalidate(key);
                return utils::RetryStatus::Continue;
            }

            auto &response = reply.content();
            if (response.header.error && response.header.error->retryable())
            {
                LOGGER_WARN("{}: replica replied {}", opts.tag, response.header.error->to_string());
                range_resolver_.invalidate(key);
                return utils::RetryStatus::Continue;
            }
            return settle(std::move(response));
        },
        [this](std::chrono::milliseconds wait) { return wait_for_retry(wait); });

    if (!outcome)
    {
        LOGGER_WARN("{}: abandoned ({})", opts.tag, utils::to_string(retry_status));
        outcome = make_error_response<Response>(
            KvError{ErrorCode::Shutdown, fmt::format("{}: router shut down while retrying", method)});
    }
    return std::move(*outcome);
}

} // namespace rangekv::kv
