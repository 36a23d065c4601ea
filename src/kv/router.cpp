#include "kv/router.hpp"

#include <system_error>

namespace rangekv::kv
{

namespace
{
RouterConfig validated(RouterConfig config)
{
    config.validate();
    return config;
}
} // namespace

Router::Router(const GossipClient &gossip, RpcTransport &transport, RouterConfig config)
    : config_(validated(std::move(config))), node_resolver_(gossip),
      sender_(node_resolver_, transport, config_.rpc_options()), cache_(config_.range_cache_size),
      range_resolver_(gossip, sender_, cache_)
{
}

Router::~Router()
{
    shutdown();
}

void Router::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto &w : workers)
    {
        if (w.thread.joinable())
        {
            w.thread.join();
        }
    }
}

bool Router::is_shutting_down() const
{
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stopping_;
}

bool Router::wait_for_retry(std::chrono::milliseconds wait)
{
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, wait, [this] { return stopping_; });
}

bool Router::spawn(std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(workers_mutex_);
    // shutdown() raises the flag before it takes over workers_, so a worker
    // added after this check is always joined.
    if (is_shutting_down())
    {
        return false;
    }

    for (auto it = workers_.begin(); it != workers_.end();)
    {
        if (it->done->load(std::memory_order_acquire))
        {
            it->thread.join();
            it = workers_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{std::thread(), done});
    try
    {
        workers_.back().thread = std::thread(
            [task = std::move(task), done]()
            {
                task();
                done->store(true, std::memory_order_release);
            });
    }
    catch (const std::system_error &)
    {
        workers_.pop_back();
        throw;
    }
    return true;
}

} // namespace rangekv::kv
