#pragma once
/**
 * @file api.hpp
 * @brief Request/response pairs of the storage-node RPC surface.
 *
 * Every request starts with a RequestHeader and every response with a
 * ResponseHeader. The router works on these through three compile-time
 * hooks instead of inspecting types at runtime:
 *
 * - `MethodTraits<Request>`: response type and RPC method name.
 * - `with_replica(request, replica)`: per-replica copy for fan-out.
 * - `make_error_response<Response>(error)`: terminal failure reply.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kv/error.hpp"
#include "kv/types.hpp"

namespace rangekv::kv
{

struct RequestHeader
{
    /// Stamped by the replica sender so the node can check it hosts this replica.
    Replica replica;
    /// Client wall time (ns); 0 lets the node pick.
    int64_t timestamp{0};
    /// Set for requests issued inside a transaction.
    std::optional<std::string> txn_id;
};

struct ResponseHeader
{
    std::optional<KvError> error;
    int64_t timestamp{0};

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// ============================================================================
// Point operations
// ============================================================================

struct ContainsRequest
{
    RequestHeader header;
    Key key;
};
struct ContainsResponse
{
    ResponseHeader header;
    bool exists{false};
};

struct GetRequest
{
    RequestHeader header;
    Key key;
};
struct GetResponse
{
    ResponseHeader header;
    Value value; ///< Empty bytes when the key does not exist.
};

struct PutRequest
{
    RequestHeader header;
    Key key;
    Value value;
};
struct PutResponse
{
    ResponseHeader header;
};

struct IncrementRequest
{
    RequestHeader header;
    Key key;
    int64_t increment{0};
};
struct IncrementResponse
{
    ResponseHeader header;
    int64_t new_value{0};
};

struct DeleteRequest
{
    RequestHeader header;
    Key key;
};
struct DeleteResponse
{
    ResponseHeader header;
};

// ============================================================================
// Range operations
// ============================================================================

struct DeleteRangeRequest
{
    RequestHeader header;
    Key start_key;
    Key end_key;
    int64_t max_entries_to_delete{0}; ///< 0 = unbounded
};
struct DeleteRangeResponse
{
    ResponseHeader header;
    int64_t num_deleted{0};
};

struct ScanRequest
{
    RequestHeader header;
    Key start_key;
    Key end_key;
    int64_t max_results{0};
};
struct ScanResponse
{
    ResponseHeader header;
    std::vector<KeyValue> rows;
};

// ============================================================================
// Transactions, time series and queues
// ============================================================================

struct EndTransactionRequest
{
    RequestHeader header;
    std::vector<Key> keys; ///< Keys written by the transaction; keys[0] routes.
    bool commit{false};
};
struct EndTransactionResponse
{
    ResponseHeader header;
    int64_t commit_timestamp{0};
};

/**
 * Accumulates a time series of int64 counts. For example a key holding one
 * minute of data carries 60 counts, one per second.
 */
struct AccumulateTSRequest
{
    RequestHeader header;
    Key key;
    std::vector<int64_t> counts;
};
struct AccumulateTSResponse
{
    ResponseHeader header;
};

/**
 * Scans and deletes up to max_results messages from an inbox. Must be issued
 * inside a transaction; fewer than max_results returned means the inbox is
 * now empty.
 */
struct ReapQueueRequest
{
    RequestHeader header;
    Key inbox;
    int64_t max_results{0};
};
struct ReapQueueResponse
{
    ResponseHeader header;
    std::vector<Value> messages;
};

struct EnqueueUpdateRequest
{
    RequestHeader header;
    Key key;
    Value update;
};
struct EnqueueUpdateResponse
{
    ResponseHeader header;
};

struct EnqueueMessageRequest
{
    RequestHeader header;
    Key inbox;
    Value message;
};
struct EnqueueMessageResponse
{
    ResponseHeader header;
};

// ============================================================================
// Internal
// ============================================================================

/// Finds the range-metadata record covering a (meta-prefixed) key.
struct InternalRangeLookupRequest
{
    RequestHeader header;
    Key key;
};
struct InternalRangeLookupResponse
{
    ResponseHeader header;
    RangeLocations locations;
};

// ============================================================================
// Compile-time method binding
// ============================================================================

template <typename Request>
struct MethodTraits; // Specialized once per RPC below.

#define RANGEKV_DECLARE_METHOD(REQ, RESP, NAME)                                                    \
    template <>                                                                                    \
    struct MethodTraits<REQ>                                                                       \
    {                                                                                              \
        using Response = RESP;                                                                     \
        static constexpr std::string_view name = NAME;                                             \
    }

RANGEKV_DECLARE_METHOD(ContainsRequest, ContainsResponse, "Node.Contains");
RANGEKV_DECLARE_METHOD(GetRequest, GetResponse, "Node.Get");
RANGEKV_DECLARE_METHOD(PutRequest, PutResponse, "Node.Put");
RANGEKV_DECLARE_METHOD(IncrementRequest, IncrementResponse, "Node.Increment");
RANGEKV_DECLARE_METHOD(DeleteRequest, DeleteResponse, "Node.Delete");
RANGEKV_DECLARE_METHOD(DeleteRangeRequest, DeleteRangeResponse, "Node.DeleteRange");
RANGEKV_DECLARE_METHOD(ScanRequest, ScanResponse, "Node.Scan");
RANGEKV_DECLARE_METHOD(EndTransactionRequest, EndTransactionResponse, "Node.EndTransaction");
RANGEKV_DECLARE_METHOD(AccumulateTSRequest, AccumulateTSResponse, "Node.AccumulateTS");
RANGEKV_DECLARE_METHOD(ReapQueueRequest, ReapQueueResponse, "Node.ReapQueue");
RANGEKV_DECLARE_METHOD(EnqueueUpdateRequest, EnqueueUpdateResponse, "Node.EnqueueUpdate");
RANGEKV_DECLARE_METHOD(EnqueueMessageRequest, EnqueueMessageResponse, "Node.EnqueueMessage");
RANGEKV_DECLARE_METHOD(InternalRangeLookupRequest, InternalRangeLookupResponse,
                       "Node.InternalRangeLookup");

#undef RANGEKV_DECLARE_METHOD

template <typename Request>
using ResponseOf = typename MethodTraits<Request>::Response;

/**
 * @brief Copy of @p request addressed to @p replica.
 */
template <typename Request>
[[nodiscard]] Request with_replica(const Request &request, const Replica &replica)
{
    Request copy = request;
    copy.header.replica = replica;
    return copy;
}

/**
 * @brief A default response whose error slot holds @p error.
 */
template <typename Response>
[[nodiscard]] Response make_error_response(KvError error)
{
    Response response{};
    response.header.error = std::move(error);
    return response;
}

} // namespace rangekv::kv
