#include "kv/typed_access.hpp"

#include "utils/logger.hpp"

namespace rangekv::kv
{

int64_t wall_time_nanos()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

KvResult<bool> bootstrap_range_locations(DB &db, const Replica &replica)
{
    RangeLocations locations;
    locations.start_key = KeyMin;
    locations.replicas = {replica};

    for (const auto &prefix : {KeyMeta1Prefix, KeyMeta2Prefix})
    {
        const Key key = make_key(prefix, KeyMax);
        auto put = put_value(db, key, locations);
        if (put.is_error())
        {
            LOGGER_ERROR("bootstrap: writing {} failed: {}", key_to_debug_string(key),
                         put.error().to_string());
            return KvResult<bool>::error(put.error());
        }
    }
    LOGGER_INFO("bootstrap: range locations point at node {}", replica.node_id);
    return KvResult<bool>::ok(true);
}

KvResult<bool> update_range_locations(DB &db, const RangeMetadata &meta,
                                      const RangeLocations &locations)
{
    auto meta2 = put_value(db, make_key(KeyMeta2Prefix, meta.end_key), locations);
    if (meta2.is_error())
    {
        return KvResult<bool>::error(meta2.error());
    }

    if (is_meta2_key(meta.end_key))
    {
        auto meta1 = put_value(db, make_key(KeyMeta1Prefix, meta.end_key), locations);
        if (meta1.is_error())
        {
            return KvResult<bool>::error(meta1.error());
        }
    }
    return KvResult<bool>::ok(true);
}

} // namespace rangekv::kv
