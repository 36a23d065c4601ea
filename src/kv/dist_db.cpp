#include "kv/dist_db.hpp"

#include "utils/logger.hpp"

namespace rangekv::kv
{

namespace
{

/// A future that is already satisfied with an error response.
template <typename Response>
std::future<Response> ready_error(ErrorCode code, std::string message)
{
    std::promise<Response> promise;
    promise.set_value(make_error_response<Response>(KvError{code, std::move(message)}));
    return promise.get_future();
}

} // anonymous namespace

DistDB::DistDB(const GossipClient &gossip, RpcTransport &transport, RouterConfig config)
    : router_(gossip, transport, std::move(config))
{
}

std::future<ContainsResponse> DistDB::contains(const ContainsRequest &request)
{
    return router_.route(request.key, request);
}

std::future<GetResponse> DistDB::get(const GetRequest &request)
{
    return router_.route(request.key, request);
}

std::future<PutResponse> DistDB::put(const PutRequest &request)
{
    return router_.route(request.key, request);
}

std::future<IncrementResponse> DistDB::increment(const IncrementRequest &request)
{
    return router_.route(request.key, request);
}

std::future<DeleteResponse> DistDB::delete_key(const DeleteRequest &request)
{
    return router_.route(request.key, request);
}

// TODO: split at range boundaries and send one request per covered range;
// today only the range holding start_key is reached.
std::future<DeleteRangeResponse> DistDB::delete_range(const DeleteRangeRequest &request)
{
    return router_.route(request.start_key, request);
}

std::future<ScanResponse> DistDB::scan(const ScanRequest &)
{
    return ready_error<ScanResponse>(ErrorCode::NotImplemented, "Node.Scan is not implemented");
}

std::future<EndTransactionResponse> DistDB::end_transaction(const EndTransactionRequest &request)
{
    if (request.keys.empty())
    {
        LOGGER_WARN("EndTransaction rejected: transaction has no keys");
        return ready_error<EndTransactionResponse>(ErrorCode::InvalidArgument,
                                                   "end transaction requires at least one key");
    }
    return router_.route(request.keys.front(), request);
}

std::future<AccumulateTSResponse> DistDB::accumulate_ts(const AccumulateTSRequest &request)
{
    return router_.route(request.key, request);
}

std::future<ReapQueueResponse> DistDB::reap_queue(const ReapQueueRequest &request)
{
    return router_.route(request.inbox, request);
}

std::future<EnqueueUpdateResponse> DistDB::enqueue_update(const EnqueueUpdateRequest &)
{
    return ready_error<EnqueueUpdateResponse>(ErrorCode::NotImplemented,
                                              "Node.EnqueueUpdate is not implemented");
}

std::future<EnqueueMessageResponse> DistDB::enqueue_message(const EnqueueMessageRequest &request)
{
    return router_.route(request.inbox, request);
}

} // namespace rangekv::kv
