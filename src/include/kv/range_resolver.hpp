#pragma once
/**
 * @file range_resolver.hpp
 * @brief Key → replicas of the range holding it.
 *
 * Resolution order:
 *  1. Range location cache.
 *  2. First range locations from gossip (`first-range`); absent means this
 *     node has not converged yet: ErrorCode::FirstRangeMissing (retryable).
 *  3. Level-1 lookup of KeyMeta1Prefix+KeyMeta2Prefix+key against the first
 *     range's replicas: it finds the level-2 range holding KeyMeta2Prefix+key.
 *  4. Level-2 lookup of KeyMeta2Prefix+key against the replicas from step 3.
 *  5. Cache and return the step 4 result.
 *
 * The resolver never retries; every failure goes back to the router as is.
 */

#include <string_view>

#include "kv/error.hpp"
#include "kv/gossip.hpp"
#include "kv/range_cache.hpp"
#include "kv/replica_sender.hpp"
#include "kv/types.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT RangeMetadataResolver
{
  public:
    RangeMetadataResolver(const GossipClient &gossip, ReplicaSender &sender, RangeLocationCache &cache)
        : gossip_(gossip), sender_(sender), cache_(cache)
    {
    }

    [[nodiscard]] KvResult<RangeLocations> resolve(std::string_view key);

    /**
     * @brief Forgets the cached range holding @p key so the next resolve
     *        goes back to the metadata ranges.
     */
    void invalidate(std::string_view key);

  private:
    KvResult<RangeLocations> first_range_locations() const;
    KvResult<RangeLocations> lookup(const RangeLocations &holder, std::string_view prefix,
                                    std::string_view key);

    const GossipClient &gossip_;
    ReplicaSender &sender_;
    RangeLocationCache &cache_;
};

} // namespace rangekv::kv
