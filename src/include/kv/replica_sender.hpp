#pragma once
/**
 * @file replica_sender.hpp
 * @brief Fan-out of one request to the replicas of a range.
 *
 * - An empty replica set fails immediately with ErrorCode::EmptyReplicaSet
 *   (fatal: metadata or cache corruption, retrying cannot help).
 * - Replicas whose node address is not gossiped are skipped.
 * - If no replica is left, fails with ErrorCode::NoNodeAddrsAvailable
 *   (retryable: gossip may converge).
 * - Otherwise each remaining replica gets its own copy of the request,
 *   stamped with that replica, and the transport returns the first reply.
 */

#include <functional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "kv/api.hpp"
#include "kv/codec.hpp"
#include "kv/error.hpp"
#include "kv/node_resolver.hpp"
#include "kv/transport.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT ReplicaSender
{
  public:
    ReplicaSender(const NodeAddressResolver &resolver, RpcTransport &transport, RpcOptions options)
        : resolver_(resolver), transport_(transport), options_(options)
    {
    }

    /**
     * @brief Sends @p request to @p replicas; requires one reply.
     *
     * A reply whose header carries an error is still a successful send; the
     * caller inspects `response.header.error`.
     */
    template <typename Request>
    [[nodiscard]] KvResult<ResponseOf<Request>> send(const std::vector<Replica> &replicas,
                                                     const Request &request)
    {
        using Response = ResponseOf<Request>;
        auto reply = send_encoded(replicas, MethodTraits<Request>::name,
                                  [&request](const Replica &replica) -> nlohmann::json
                                  { return with_replica(request, replica); });
        if (reply.is_error())
        {
            return KvResult<Response>::error(reply.error());
        }
        return decode_json<Response>(reply.content());
    }

    [[nodiscard]] const RpcOptions &options() const noexcept { return options_; }

  private:
    using Encoder = std::function<nlohmann::json(const Replica &)>;

    KvResult<nlohmann::json> send_encoded(const std::vector<Replica> &replicas,
                                          std::string_view method, const Encoder &encode);

    const NodeAddressResolver &resolver_;
    RpcTransport &transport_;
    RpcOptions options_;
};

} // namespace rangekv::kv
