#include "kv/range_resolver.hpp"

#include "kv/codec.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace rangekv::kv
{

KvResult<RangeLocations> RangeMetadataResolver::first_range_locations() const
{
    const auto info = gossip_.get_info(kGossipFirstRangeKey);
    if (!info)
    {
        return KvResult<RangeLocations>::error(
            KvError{ErrorCode::FirstRangeMissing, "first range locations not yet gossiped"});
    }
    auto locations = decode_json<RangeLocations>(*info);
    if (locations.is_error())
    {
        return KvResult<RangeLocations>::error(
            KvError{ErrorCode::Codec, "malformed first range gossip info: " + locations.error().message()});
    }
    return locations;
}

KvResult<RangeLocations> RangeMetadataResolver::lookup(const RangeLocations &holder,
                                                       std::string_view prefix, std::string_view key)
{
    InternalRangeLookupRequest request;
    request.key = make_key(prefix, key);

    auto reply = sender_.send(holder.replicas, request);
    if (reply.is_error())
    {
        return KvResult<RangeLocations>::error(reply.error());
    }
    auto &response = reply.content();
    if (response.header.error)
    {
        return KvResult<RangeLocations>::error(*response.header.error);
    }
    return KvResult<RangeLocations>::ok(std::move(response.locations));
}

KvResult<RangeLocations> RangeMetadataResolver::resolve(std::string_view key)
{
    if (auto cached = cache_.lookup(key))
    {
        return KvResult<RangeLocations>::ok(std::move(*cached));
    }

    auto first = first_range_locations();
    if (first.is_error())
    {
        return first;
    }

    // Level-1 records are keyed by level-2 keys, so level 1 is asked for the
    // range holding the key's level-2 record.
    const Key meta2_key = make_key(KeyMeta2Prefix, key);
    auto meta2_range = lookup(first.content(), KeyMeta1Prefix, meta2_key);
    if (meta2_range.is_error())
    {
        return meta2_range;
    }

    auto range = lookup(meta2_range.content(), KeyMeta2Prefix, key);
    if (range.is_error())
    {
        return range;
    }

    if (!range.content().contains(key))
    {
        // A metadata record that does not cover the key it was found for
        // would be cached under the wrong boundaries.
        LOGGER_WARN("range lookup for '{}' returned non-covering range [{}, {})",
                    key_to_debug_string(key), key_to_debug_string(range.content().start_key),
                    range.content().end_key ? key_to_debug_string(*range.content().end_key) : "<end>");
        return range;
    }
    cache_.insert(range.content());
    return range;
}

void RangeMetadataResolver::invalidate(std::string_view key)
{
    if (cache_.invalidate(key))
    {
        LOGGER_DEBUG("evicted cached range for '{}'", key_to_debug_string(key));
    }
}

} // namespace rangekv::kv
