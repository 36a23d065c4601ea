#include "kv/gossip.hpp"

#include <fmt/format.h>

namespace rangekv::kv
{

std::string make_node_id_gossip_key(int32_t node_id)
{
    return fmt::format("node:{}", node_id);
}

std::optional<nlohmann::json> InMemoryGossip::get_info(std::string_view key) const
{
    std::shared_lock lock(mutex_);
    auto it = infos_.find(std::string(key));
    if (it == infos_.end())
        return std::nullopt;
    return it->second;
}

void InMemoryGossip::add_info(std::string key, nlohmann::json value)
{
    std::unique_lock lock(mutex_);
    infos_[std::move(key)] = std::move(value);
}

void InMemoryGossip::remove_info(std::string_view key)
{
    std::unique_lock lock(mutex_);
    infos_.erase(std::string(key));
}

} // namespace rangekv::kv
