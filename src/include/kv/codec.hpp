#pragma once
/**
 * @file codec.hpp
 * @brief JSON codec for the data model and every RPC request/response.
 *
 * Keys and value bytes are arbitrary binary, which JSON strings cannot carry
 * (nlohmann::json rejects invalid UTF-8 on dump), so they travel as lowercase
 * hex strings. Everything else maps onto plain JSON fields.
 *
 * The to_json/from_json overloads live in rangekv::kv so nlohmann finds them
 * by ADL: `nlohmann::json j = request;` and `j.get<GetResponse>()` work for
 * every type declared in api.hpp.
 */

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "kv/api.hpp"
#include "kv/error.hpp"
#include "kv/types.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

RANGEKV_CORE_EXPORT std::string hex_encode(std::string_view raw);

/// @return std::nullopt on odd length or a non-hex digit.
RANGEKV_CORE_EXPORT std::optional<std::string> hex_decode(std::string_view hex);

#define RANGEKV_DECLARE_JSON(TYPE)                                                                 \
    RANGEKV_CORE_EXPORT void to_json(nlohmann::json &j, const TYPE &v);                            \
    RANGEKV_CORE_EXPORT void from_json(const nlohmann::json &j, TYPE &v)

RANGEKV_DECLARE_JSON(Replica);
RANGEKV_DECLARE_JSON(RangeLocations);
RANGEKV_DECLARE_JSON(Value);
RANGEKV_DECLARE_JSON(KeyValue);
RANGEKV_DECLARE_JSON(KvError);
RANGEKV_DECLARE_JSON(RequestHeader);
RANGEKV_DECLARE_JSON(ResponseHeader);

RANGEKV_DECLARE_JSON(ContainsRequest);
RANGEKV_DECLARE_JSON(ContainsResponse);
RANGEKV_DECLARE_JSON(GetRequest);
RANGEKV_DECLARE_JSON(GetResponse);
RANGEKV_DECLARE_JSON(PutRequest);
RANGEKV_DECLARE_JSON(PutResponse);
RANGEKV_DECLARE_JSON(IncrementRequest);
RANGEKV_DECLARE_JSON(IncrementResponse);
RANGEKV_DECLARE_JSON(DeleteRequest);
RANGEKV_DECLARE_JSON(DeleteResponse);
RANGEKV_DECLARE_JSON(DeleteRangeRequest);
RANGEKV_DECLARE_JSON(DeleteRangeResponse);
RANGEKV_DECLARE_JSON(ScanRequest);
RANGEKV_DECLARE_JSON(ScanResponse);
RANGEKV_DECLARE_JSON(EndTransactionRequest);
RANGEKV_DECLARE_JSON(EndTransactionResponse);
RANGEKV_DECLARE_JSON(AccumulateTSRequest);
RANGEKV_DECLARE_JSON(AccumulateTSResponse);
RANGEKV_DECLARE_JSON(ReapQueueRequest);
RANGEKV_DECLARE_JSON(ReapQueueResponse);
RANGEKV_DECLARE_JSON(EnqueueUpdateRequest);
RANGEKV_DECLARE_JSON(EnqueueUpdateResponse);
RANGEKV_DECLARE_JSON(EnqueueMessageRequest);
RANGEKV_DECLARE_JSON(EnqueueMessageResponse);
RANGEKV_DECLARE_JSON(InternalRangeLookupRequest);
RANGEKV_DECLARE_JSON(InternalRangeLookupResponse);

#undef RANGEKV_DECLARE_JSON

/**
 * @brief Decodes @p j as T, mapping any parse failure to ErrorCode::Codec.
 */
template <typename T>
[[nodiscard]] KvResult<T> decode_json(const nlohmann::json &j)
{
    try
    {
        return KvResult<T>::ok(j.get<T>());
    }
    catch (const std::exception &e)
    {
        return KvResult<T>::error(KvError{ErrorCode::Codec, e.what()});
    }
}

} // namespace rangekv::kv
