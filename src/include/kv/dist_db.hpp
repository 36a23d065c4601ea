#pragma once
/**
 * @file dist_db.hpp
 * @brief Asynchronous access to the range-partitioned key-value store.
 *
 * `DB` is the client-facing interface: one method per storage operation,
 * each returning a future of the operation's response. Errors are carried
 * in `response.header.error`; the future itself never holds an exception.
 *
 * `DistDB` implements it over a Router. Routing keys:
 *
 * | Operation          | Routed by        |
 * |--------------------|------------------|
 * | point operations   | `key`            |
 * | delete_range       | `start_key`      |
 * | end_transaction    | `keys[0]`        |
 * | reap_queue         | `inbox`          |
 * | enqueue_message    | `inbox`          |
 *
 * Multi-key operations reach only the range holding their routing key.
 * `scan` and `enqueue_update` are not supported yet and resolve at once to
 * ErrorCode::NotImplemented.
 */

#include <future>

#include "kv/api.hpp"
#include "kv/gossip.hpp"
#include "kv/router.hpp"
#include "kv/router_config.hpp"
#include "kv/transport.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT DB
{
  public:
    virtual ~DB() = default;

    virtual std::future<ContainsResponse> contains(const ContainsRequest &request) = 0;
    virtual std::future<GetResponse> get(const GetRequest &request) = 0;
    virtual std::future<PutResponse> put(const PutRequest &request) = 0;
    virtual std::future<IncrementResponse> increment(const IncrementRequest &request) = 0;
    virtual std::future<DeleteResponse> delete_key(const DeleteRequest &request) = 0;
    virtual std::future<DeleteRangeResponse> delete_range(const DeleteRangeRequest &request) = 0;
    virtual std::future<ScanResponse> scan(const ScanRequest &request) = 0;
    virtual std::future<EndTransactionResponse> end_transaction(const EndTransactionRequest &request) = 0;
    virtual std::future<AccumulateTSResponse> accumulate_ts(const AccumulateTSRequest &request) = 0;
    virtual std::future<ReapQueueResponse> reap_queue(const ReapQueueRequest &request) = 0;
    virtual std::future<EnqueueUpdateResponse> enqueue_update(const EnqueueUpdateRequest &request) = 0;
    virtual std::future<EnqueueMessageResponse> enqueue_message(const EnqueueMessageRequest &request) = 0;
};

/**
 * @class DistDB
 * @brief DB whose every call is resolved to a range and sent to its replicas.
 *
 * Destroying a DistDB shuts its Router down (see router.hpp).
 */
class RANGEKV_CORE_EXPORT DistDB : public DB
{
  public:
    DistDB(const GossipClient &gossip, RpcTransport &transport, RouterConfig config = {});
    ~DistDB() override = default;

    std::future<ContainsResponse> contains(const ContainsRequest &request) override;
    std::future<GetResponse> get(const GetRequest &request) override;
    std::future<PutResponse> put(const PutRequest &request) override;
    std::future<IncrementResponse> increment(const IncrementRequest &request) override;
    std::future<DeleteResponse> delete_key(const DeleteRequest &request) override;
    std::future<DeleteRangeResponse> delete_range(const DeleteRangeRequest &request) override;
    std::future<ScanResponse> scan(const ScanRequest &request) override;
    std::future<EndTransactionResponse> end_transaction(const EndTransactionRequest &request) override;
    std::future<AccumulateTSResponse> accumulate_ts(const AccumulateTSRequest &request) override;
    std::future<ReapQueueResponse> reap_queue(const ReapQueueRequest &request) override;
    std::future<EnqueueUpdateResponse> enqueue_update(const EnqueueUpdateRequest &request) override;
    std::future<EnqueueMessageResponse> enqueue_message(const EnqueueMessageRequest &request) override;

    [[nodiscard]] Router &router() noexcept { return router_; }

  private:
    Router router_;
};

} // namespace rangekv::kv
