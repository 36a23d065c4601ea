#pragma once
/**
 * @file gossip.hpp
 * @brief Read-only view of gossip-published cluster facts.
 *
 * The router consumes two kinds of gossip info:
 *
 * - `node:<id>` → the node's RPC endpoint (JSON string, e.g. "tcp://10.0.0.7:5570")
 * - `first-range` → RangeLocations of the first range (holds level-1 metadata)
 *
 * Dissemination itself (peer selection, anti-entropy) lives outside this
 * library; it only has to implement GossipClient. InMemoryGossip is the
 * static implementation used for fixed deployments and in tests.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "rangekv_core_export.h"

namespace rangekv::kv
{

/// Gossip key of the first range's locations.
inline constexpr std::string_view kGossipFirstRangeKey = "first-range";

/// Gossip key under which node @p node_id publishes its address.
RANGEKV_CORE_EXPORT std::string make_node_id_gossip_key(int32_t node_id);

/**
 * @class GossipClient
 * @brief Thread-safe lookup of gossip infos.
 */
class RANGEKV_CORE_EXPORT GossipClient
{
  public:
    virtual ~GossipClient() = default;

    /**
     * @brief Current value of @p key.
     * @return std::nullopt if the info is absent or has not reached this node yet.
     */
    [[nodiscard]] virtual std::optional<nlohmann::json> get_info(std::string_view key) const = 0;
};

/**
 * @class InMemoryGossip
 * @brief GossipClient backed by a local map.
 */
class RANGEKV_CORE_EXPORT InMemoryGossip : public GossipClient
{
  public:
    [[nodiscard]] std::optional<nlohmann::json> get_info(std::string_view key) const override;

    void add_info(std::string key, nlohmann::json value);
    void remove_info(std::string_view key);

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> infos_;
};

} // namespace rangekv::kv
