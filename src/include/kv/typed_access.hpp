#pragma once
/**
 * @file typed_access.hpp
 * @brief Blocking typed reads/writes over a DB, and range-location records.
 *
 * Values are stored as their nlohmann::json serialization (UTF-8 text), so
 * any T with to_json/from_json overloads works:
 *
 * @code
 * auto put = put_value(db, "user/42", std::string("ada"));
 * auto read = get_value<std::string>(db, "user/42");
 * if (read.is_ok() && read.content().found) { use(read.content().value); }
 * @endcode
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "kv/api.hpp"
#include "kv/codec.hpp"
#include "kv/dist_db.hpp"
#include "kv/error.hpp"
#include "kv/types.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

template <typename T>
struct TypedRead
{
    bool found{false};    ///< False if the key holds no value.
    int64_t timestamp{0}; ///< Write timestamp (ns); 0 when not found.
    std::optional<T> value;
};

/// Current wall time in nanoseconds since the epoch.
RANGEKV_CORE_EXPORT int64_t wall_time_nanos();

/**
 * @brief Reads @p key and decodes it as T.
 *
 * A successful read of an absent key is `found == false`. A value that does
 * not decode as T fails with ErrorCode::Codec.
 */
template <typename T>
[[nodiscard]] KvResult<TypedRead<T>> get_value(DB &db, const Key &key)
{
    GetRequest request;
    request.key = key;
    GetResponse response = db.get(request).get();
    if (response.header.error)
    {
        return KvResult<TypedRead<T>>::error(*response.header.error);
    }

    TypedRead<T> read;
    if (response.value.bytes.empty())
    {
        return KvResult<TypedRead<T>>::ok(std::move(read));
    }
    read.found = true;
    read.timestamp = response.value.timestamp;

    const auto parsed = nlohmann::json::parse(response.value.bytes, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded())
    {
        return KvResult<TypedRead<T>>::error(
            KvError{ErrorCode::Codec, "value at '" + key_to_debug_string(key) + "' is not JSON"});
    }
    auto decoded = decode_json<T>(parsed);
    if (decoded.is_error())
    {
        return KvResult<TypedRead<T>>::error(decoded.error());
    }
    read.value = std::move(decoded).content();
    return KvResult<TypedRead<T>>::ok(std::move(read));
}

/**
 * @brief Writes @p value at @p key, stamped with the current wall time.
 */
template <typename T>
[[nodiscard]] KvResult<int64_t> put_value(DB &db, const Key &key, const T &value)
{
    PutRequest request;
    request.key = key;
    try
    {
        request.value.bytes = nlohmann::json(value).dump();
    }
    catch (const nlohmann::json::exception &e)
    {
        return KvResult<int64_t>::error(KvError{ErrorCode::Codec, e.what()});
    }
    request.value.timestamp = wall_time_nanos();

    PutResponse response = db.put(request).get();
    if (response.header.error)
    {
        return KvResult<int64_t>::error(*response.header.error);
    }
    return KvResult<int64_t>::ok(request.value.timestamp);
}

/**
 * @brief Seeds a fresh cluster whose single range lives on @p replica.
 *
 * Writes RangeLocations{KeyMin, unbounded, {replica}} at both
 * KeyMeta1Prefix+KeyMax and KeyMeta2Prefix+KeyMax.
 */
RANGEKV_CORE_EXPORT KvResult<bool> bootstrap_range_locations(DB &db, const Replica &replica);

/**
 * @brief Publishes new @p locations for the range described by @p meta.
 *
 * Always writes the level-2 record KeyMeta2Prefix+meta.end_key. When the
 * range itself holds level-2 metadata (meta.end_key is a meta2 key), also
 * writes the level-1 record KeyMeta1Prefix+meta.end_key.
 */
RANGEKV_CORE_EXPORT KvResult<bool> update_range_locations(DB &db, const RangeMetadata &meta,
                                                          const RangeLocations &locations);

} // namespace rangekv::kv
