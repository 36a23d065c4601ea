#pragma once
/**
 * @file node_resolver.hpp
 * @brief Node id → RPC address, straight from live gossip state.
 */

#include <cstdint>
#include <string>

#include "kv/error.hpp"
#include "kv/gossip.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT NodeAddressResolver
{
  public:
    explicit NodeAddressResolver(const GossipClient &gossip) : gossip_(gossip) {}

    /**
     * @brief Looks up the address node @p node_id gossips.
     *
     * No caching: every call reads current gossip state. Fails with
     * ErrorCode::NodeAddressNotFound if the info is absent (node not yet
     * joined, or not yet propagated here) or is not an address string.
     */
    [[nodiscard]] KvResult<std::string> resolve(int32_t node_id) const;

  private:
    const GossipClient &gossip_;
};

} // namespace rangekv::kv
