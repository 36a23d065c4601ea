#include "kv/replica_sender.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>

namespace rangekv::kv
{

KvResult<nlohmann::json> ReplicaSender::send_encoded(const std::vector<Replica> &replicas,
                                                     std::string_view method, const Encoder &encode)
{
    if (replicas.empty())
    {
        return KvResult<nlohmann::json>::error(
            KvError{ErrorCode::EmptyReplicaSet, fmt::format("{}: replica set is empty", method)});
    }

    std::vector<AddressedRequest> requests;
    requests.reserve(replicas.size());
    for (const auto &replica : replicas)
    {
        auto addr = resolver_.resolve(replica.node_id);
        if (addr.is_error())
        {
            LOGGER_DEBUG("{}: node {} address is not gossiped; skipping replica", method,
                         replica.node_id);
            continue;
        }
        try
        {
            requests.push_back(AddressedRequest{std::move(addr).content(), encode(replica)});
        }
        catch (const std::exception &e)
        {
            return KvResult<nlohmann::json>::error(
                KvError{ErrorCode::Codec, fmt::format("{}: cannot encode request: {}", method, e.what())});
        }
    }

    if (requests.empty())
    {
        return KvResult<nlohmann::json>::error(
            KvError{ErrorCode::NoNodeAddrsAvailable,
                    fmt::format("{}: no replica node addresses available via gossip", method)});
    }

    return transport_.send(requests, method, options_);
}

} // namespace rangekv::kv
